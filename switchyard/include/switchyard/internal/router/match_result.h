#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "switchyard/internal/handler/category.h"

namespace switchyard::internal::router {

/**
 * @brief One ranked handler.
 */
struct Candidate {
  std::string name;
  double score{0.0};
  int priority{0};
  handler::Category category{handler::kDefaultCategory};
};

/**
 * @brief Output of KeywordTrie::match.
 *
 * `candidates` is ordered by score (highest first), then declared priority,
 * then name. `categories` is in enum order without duplicates.
 */
struct MatchResult {
  std::vector<std::string> matched_keywords;
  std::vector<Candidate> candidates;
  std::vector<handler::Category> categories;
  bool suggests_parallel{false};
  std::optional<std::string> workflow;
  bool coordinator_added{false};

  [[nodiscard]] bool empty() const noexcept { return candidates.empty(); }

  [[nodiscard]] const Candidate *find(std::string_view name) const {
    for (const auto &candidate : candidates) {
      if (candidate.name == name) {
        return &candidate;
      }
    }
    return nullptr;
  }
};

} // namespace switchyard::internal::router
