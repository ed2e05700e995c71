#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace switchyard::internal::router {

/**
 * @brief Remove NUL and control characters.
 *
 * Tabs and line breaks become spaces; other control bytes are dropped.
 * Non-ASCII bytes are kept unchanged.
 */
std::string sanitizeInput(std::string_view text);

/**
 * @brief Split sanitized text into lowercase tokens.
 *
 * Tokens are runs of ASCII letters, digits, `_`, `+`, `#` and non-ASCII bytes.
 * Everything else separates tokens. Keywords go through the same function, so
 * `"real-time"` and `"real time"` index identically.
 */
std::vector<std::string> tokenize(std::string_view text);

/// Tokens joined with single spaces; the canonical form used for cache keys.
std::string normalize(std::string_view text);

/// Join tokens with single spaces.
std::string joinTokens(const std::vector<std::string> &tokens);

} // namespace switchyard::internal::router
