#include "switchyard/internal/router/keyword_trie.h"

#include <algorithm>
#include <array>
#include <set>
#include <utility>

#include "switchyard/internal/diagnostics/error/error_macros.h"
#include "switchyard/internal/diagnostics/log/log.h"
#include "switchyard/internal/router/text_normalizer.h"

namespace switchyard::internal::router {

namespace {

void appendUnique(std::vector<std::size_t> &list, std::size_t value) {
  if (std::find(list.begin(), list.end(), value) == list.end()) {
    list.push_back(value);
  }
}

} // namespace

KeywordTrie::KeywordTrie() : root_(std::make_unique<TrieNode>()) {}

KeywordTrie::~KeywordTrie() = default;

KeywordTrie::KeywordTrie(KeywordTrie &&) noexcept = default;

KeywordTrie &KeywordTrie::operator=(KeywordTrie &&) noexcept = default;

TrieTerminal *KeywordTrie::insert(std::string_view phrase) {
  TrieNode *node = root_.get();
  std::size_t words = 1;
  for (const char ch : phrase) {
    if (ch == ' ') {
      ++words;
    }
    auto &slot = node->children[ch];
    if (!slot) {
      slot = std::make_unique<TrieNode>();
      ++node_count_;
    }
    node = slot.get();
  }
  if (!node->terminal) {
    node->terminal = std::make_unique<TrieTerminal>();
    node->terminal->keyword = std::string(phrase);
    node->terminal->word_count = words;
    ++phrase_count_;
  }
  return node->terminal.get();
}

KeywordTrie KeywordTrie::build(const std::vector<handler::HandlerDescriptor> &descriptors,
                               const std::vector<handler::WorkflowRule> &workflows,
                               RouterConfig config) {
  KeywordTrie trie;
  trie.config_ = std::move(config);
  trie.handlers_.reserve(descriptors.size());

  for (const auto &descriptor : descriptors) {
    const std::size_t index = trie.handlers_.size();
    if (!trie.handler_index_.emplace(descriptor.name, index).second) {
      SWITCHYARD_LOG_WARN(Router, "duplicate handler '" + descriptor.name +
                                      "' ignored while building trie");
      continue;
    }
    trie.handlers_.push_back(
        HandlerInfo{descriptor.name, descriptor.priority, descriptor.category});

    for (const auto &keyword : descriptor.trigger_keywords) {
      const std::string phrase = normalize(keyword);
      if (phrase.empty()) {
        continue;
      }
      appendUnique(trie.insert(phrase)->keyword_handlers, index);
    }
    for (const auto &tag : descriptor.tags) {
      const std::string phrase = normalize(tag);
      if (phrase.empty()) {
        continue;
      }
      appendUnique(trie.insert(phrase)->tag_handlers, index);
    }
  }

  for (const auto &rule : workflows) {
    WorkflowInfo info;
    info.name = rule.name;
    for (const auto &member : rule.handlers) {
      const auto it = trie.handler_index_.find(member);
      if (it == trie.handler_index_.end()) {
        SWITCHYARD_LOG_WARN(Router, "workflow '" + rule.name +
                                        "' names unknown handler '" + member + "'");
        continue;
      }
      appendUnique(info.members, it->second);
    }
    const std::size_t workflow_index = trie.workflows_.size();
    trie.workflows_.push_back(std::move(info));
    for (const auto &keyword : rule.trigger_keywords) {
      const std::string phrase = normalize(keyword);
      if (phrase.empty()) {
        continue;
      }
      appendUnique(trie.insert(phrase)->workflows, workflow_index);
    }
  }

  SWITCHYARD_LOG_DEBUG(Router, "trie built: " + std::to_string(trie.handlers_.size()) +
                                   " handlers, " + std::to_string(trie.phrase_count_) +
                                   " phrases, " + std::to_string(trie.node_count_) +
                                   " nodes");
  return trie;
}

MatchResult KeywordTrie::match(std::string_view text) const {
  SWITCHYARD_THROW_IF(text.size() > config_.max_input_length, InputTooLarge,
                      "input of " + std::to_string(text.size()) +
                          " bytes exceeds limit of " +
                          std::to_string(config_.max_input_length));

  MatchResult result;
  const std::vector<std::string> tokens = tokenize(sanitizeInput(text));
  if (tokens.empty() || handlers_.empty()) {
    return result;
  }

  // Collect each distinct phrase once, in order of first occurrence.
  std::vector<const TrieTerminal *> hits;
  std::set<const TrieTerminal *> seen;
  for (std::size_t start = 0; start < tokens.size(); ++start) {
    const TrieNode *node = root_.get();
    for (std::size_t pos = start; pos < tokens.size() && node != nullptr; ++pos) {
      if (pos > start) {
        node = node->child(' ');
      }
      for (std::size_t c = 0; c < tokens[pos].size() && node != nullptr; ++c) {
        node = node->child(tokens[pos][c]);
      }
      if (node != nullptr && node->terminal && seen.insert(node->terminal.get()).second) {
        hits.push_back(node->terminal.get());
      }
    }
  }

  std::vector<double> scores(handlers_.size(), 0.0);
  std::vector<bool> selected(handlers_.size(), false);
  std::size_t workflow_hit = workflows_.size();

  for (const TrieTerminal *hit : hits) {
    if (!hit->keyword_handlers.empty() || !hit->tag_handlers.empty()) {
      result.matched_keywords.push_back(hit->keyword);
    }
    const double weight =
        hit->word_count > 1
            ? static_cast<double>(hit->word_count) * config_.phrase_bonus
            : 1.0;
    for (const std::size_t index : hit->keyword_handlers) {
      scores[index] += weight;
      selected[index] = true;
    }
    for (const std::size_t index : hit->tag_handlers) {
      scores[index] += config_.tag_weight;
      selected[index] = true;
    }
    for (const std::size_t workflow : hit->workflows) {
      workflow_hit = std::min(workflow_hit, workflow);
    }
  }

  if (workflow_hit < workflows_.size()) {
    const auto &workflow = workflows_[workflow_hit];
    result.workflow = workflow.name;
    for (const std::size_t index : workflow.members) {
      if (!selected[index]) {
        scores[index] = config_.workflow_weight;
        selected[index] = true;
      }
    }
  }

  for (std::size_t index = 0; index < handlers_.size(); ++index) {
    if (!selected[index]) {
      continue;
    }
    const auto &info = handlers_[index];
    result.candidates.push_back(Candidate{info.name, scores[index], info.priority, info.category});
  }

  std::sort(result.candidates.begin(), result.candidates.end(),
            [](const Candidate &lhs, const Candidate &rhs) {
              if (lhs.score != rhs.score) {
                return lhs.score > rhs.score;
              }
              if (lhs.priority != rhs.priority) {
                return lhs.priority < rhs.priority;
              }
              return lhs.name < rhs.name;
            });

  if (!config_.coordinator.empty() &&
      result.candidates.size() > config_.coordinator_threshold &&
      result.find(config_.coordinator) == nullptr) {
    const auto it = handler_index_.find(config_.coordinator);
    if (it != handler_index_.end()) {
      const auto &info = handlers_[it->second];
      result.candidates.insert(
          result.candidates.begin(),
          Candidate{info.name, result.candidates.front().score, info.priority, info.category});
      result.coordinator_added = true;
    }
  }

  summarizeCategories(result, config_.parallel_threshold);

  SWITCHYARD_LOG_TRACE(Router, "matched " + std::to_string(result.matched_keywords.size()) +
                                   " phrases, " + std::to_string(result.candidates.size()) +
                                   " candidates");
  return result;
}

void summarizeCategories(MatchResult &result, double parallel_threshold) {
  std::array<bool, handler::kCategoryCount> present{};
  std::array<bool, handler::kCategoryCount> confident{};
  for (const auto &candidate : result.candidates) {
    const std::size_t slot = handler::toIndex(candidate.category);
    present[slot] = true;
    if (candidate.score >= parallel_threshold) {
      confident[slot] = true;
    }
  }
  result.categories.clear();
  std::size_t confident_categories = 0;
  for (std::size_t slot = 0; slot < handler::kCategoryCount; ++slot) {
    if (present[slot]) {
      result.categories.push_back(handler::fromIndex(slot));
    }
    if (confident[slot]) {
      ++confident_categories;
    }
  }
  result.suggests_parallel = confident_categories >= 2;
}

} // namespace switchyard::internal::router
