#pragma once

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "switchyard/internal/handler/category.h"

namespace switchyard::internal::handler {

/**
 * @brief How the dispatcher may execute a handler.
 */
enum class ExecutionMode : std::uint8_t {
  Intelligent,  ///< Fast path when healthy, fallback otherwise
  FallbackOnly, ///< Never attempt the fast path
};

constexpr std::string_view toString(ExecutionMode mode) {
  switch (mode) {
  case ExecutionMode::FallbackOnly:
    return "fallback_only";
  case ExecutionMode::Intelligent:
  default:
    return "intelligent";
  }
}

constexpr std::optional<ExecutionMode> parseExecutionMode(std::string_view text) {
  if (text == "intelligent") {
    return ExecutionMode::Intelligent;
  }
  if (text == "fallback_only") {
    return ExecutionMode::FallbackOnly;
  }
  return std::nullopt;
}

/// Priority for descriptors that do not declare one (lower = more urgent).
inline constexpr int kDefaultPriority = 50;

/**
 * @brief Declarative description of one handler.
 *
 * Built by the descriptor loader and never modified afterwards; a reload
 * publishes a new set of descriptors instead of editing these.
 */
struct HandlerDescriptor {
  std::string name;
  Category category{kDefaultCategory};
  std::vector<std::string> trigger_keywords;
  int priority{kDefaultPriority};
  std::set<std::string> tags;
  std::string description;
  ExecutionMode execution_mode{ExecutionMode::Intelligent};
  /// Where the descriptor was read from, for diagnostics.
  std::string source;
};

/**
 * @brief Named group of handlers selected together when any trigger matches.
 */
struct WorkflowRule {
  std::string name;
  std::vector<std::string> trigger_keywords;
  std::vector<std::string> handlers;
};

} // namespace switchyard::internal::handler
