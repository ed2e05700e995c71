#pragma once

#include <cstddef>
#include <string>

namespace switchyard::internal::router {

/**
 * @brief Scoring and limits for KeywordTrie::match.
 */
struct RouterConfig {
  /// Inputs longer than this (in bytes, before sanitizing) are rejected.
  std::size_t max_input_length{50000};

  /// Multiplier applied to matched keywords made of more than one word.
  double phrase_bonus{1.5};

  /// Score contributed by each matched capability tag.
  double tag_weight{0.5};

  /// Score given to workflow members that no keyword selected.
  double workflow_weight{0.5};

  /// Minimum score for a candidate to count toward suggests_parallel.
  double parallel_threshold{1.0};

  /// Handler placed first when many candidates match; empty disables it.
  std::string coordinator;

  /// The coordinator is added once the candidate count exceeds this value.
  std::size_t coordinator_threshold{3};
};

} // namespace switchyard::internal::router
