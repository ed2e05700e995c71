#include "switchyard/internal/router/text_normalizer.h"

#include <utility>

namespace switchyard::internal::router {

namespace {

bool isTokenByte(unsigned char ch) {
  if (ch >= 0x80) {
    return true;
  }
  return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') ||
         (ch >= '0' && ch <= '9') || ch == '_' || ch == '+' || ch == '#';
}

char toLowerAscii(unsigned char ch) {
  if (ch >= 'A' && ch <= 'Z') {
    return static_cast<char>(ch - 'A' + 'a');
  }
  return static_cast<char>(ch);
}

} // namespace

std::string sanitizeInput(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (const char raw : text) {
    const auto ch = static_cast<unsigned char>(raw);
    if (ch == '\t' || ch == '\n' || ch == '\r') {
      out.push_back(' ');
      continue;
    }
    if (ch < 0x20 || ch == 0x7f) {
      continue;
    }
    out.push_back(raw);
  }
  return out;
}

std::vector<std::string> tokenize(std::string_view text) {
  std::vector<std::string> tokens;
  std::string current;
  for (const char raw : text) {
    const auto ch = static_cast<unsigned char>(raw);
    if (isTokenByte(ch)) {
      current.push_back(toLowerAscii(ch));
    } else if (!current.empty()) {
      tokens.push_back(std::move(current));
      current.clear();
    }
  }
  if (!current.empty()) {
    tokens.push_back(std::move(current));
  }
  return tokens;
}

std::string joinTokens(const std::vector<std::string> &tokens) {
  std::string out;
  for (const auto &token : tokens) {
    if (!out.empty()) {
      out.push_back(' ');
    }
    out.append(token);
  }
  return out;
}

std::string normalize(std::string_view text) {
  return joinTokens(tokenize(sanitizeInput(text)));
}

} // namespace switchyard::internal::router
