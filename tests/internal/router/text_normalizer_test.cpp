#include "switchyard/internal/router/text_normalizer.h"

#include <gtest/gtest.h>

#include <string>
#include <string_view>
#include <vector>

namespace router = switchyard::internal::router;

TEST(TextNormalizer, SanitizeDropsControlBytes) {
  const char bytes[] = "audit\0the\x07 system";
  const std::string raw(bytes, sizeof(bytes) - 1);
  EXPECT_EQ(router::sanitizeInput(raw), "auditthe system");
}

TEST(TextNormalizer, SanitizeTurnsWhitespaceControlsIntoSpaces) {
  EXPECT_EQ(router::sanitizeInput("a\tb\nc\rd"), "a b c d");
}

TEST(TextNormalizer, SanitizeKeepsNonAsciiBytes) {
  const std::string text = "caf\xc3\xa9 latte";
  EXPECT_EQ(router::sanitizeInput(text), text);
}

TEST(TextNormalizer, TokenizeLowercasesAndSplitsOnPunctuation) {
  const auto tokens = router::tokenize("Fix the Real-Time bug, NOW!");
  const std::vector<std::string> expected{"fix", "the", "real", "time", "bug", "now"};
  EXPECT_EQ(tokens, expected);
}

TEST(TextNormalizer, TokenizeKeepsLanguageNames) {
  const auto tokens = router::tokenize("port c++ and c# to rust_lang");
  const std::vector<std::string> expected{"port", "c++", "and", "c#", "to", "rust_lang"};
  EXPECT_EQ(tokens, expected);
}

TEST(TextNormalizer, TokenizeEmptyAndSeparatorOnly) {
  EXPECT_TRUE(router::tokenize("").empty());
  EXPECT_TRUE(router::tokenize("  -- ,, !! ").empty());
}

TEST(TextNormalizer, NormalizeCollapsesWhitespace) {
  EXPECT_EQ(router::normalize("  Optimize   DATABASE\tperformance  "),
            "optimize database performance");
  EXPECT_EQ(router::normalize("real-time"), router::normalize("real time"));
  EXPECT_EQ(router::normalize(""), "");
}

TEST(TextNormalizer, JoinTokens) {
  EXPECT_EQ(router::joinTokens({}), "");
  EXPECT_EQ(router::joinTokens({"a"}), "a");
  EXPECT_EQ(router::joinTokens({"a", "b", "c"}), "a b c");
}
