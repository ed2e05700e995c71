#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "switchyard/internal/handler/handler_descriptor.h"
#include "switchyard/internal/router/match_result.h"
#include "switchyard/internal/router/router_config.h"

namespace switchyard::internal::router {

/**
 * @brief Payload of a node where at least one indexed phrase ends.
 *
 * The same phrase may be a trigger keyword for some handlers, a tag for
 * others and a workflow trigger, so all three lists live on one terminal.
 */
struct TrieTerminal {
  /// Normalized phrase (tokens joined by single spaces).
  std::string keyword;
  std::size_t word_count{1};
  std::vector<std::size_t> keyword_handlers;
  std::vector<std::size_t> tag_handlers;
  std::vector<std::size_t> workflows;
};

/**
 * @brief Trie node, owned by its parent.
 *
 * Multi-word phrases continue through a `' '` edge into the next token.
 */
struct TrieNode {
  std::unordered_map<char, std::unique_ptr<TrieNode>> children;
  std::unique_ptr<TrieTerminal> terminal;

  [[nodiscard]] const TrieNode *child(char ch) const {
    const auto it = children.find(ch);
    return it == children.end() ? nullptr : it->second.get();
  }
};

/**
 * @brief Immutable keyword index mapping free text to ranked handlers.
 *
 * A trie is built once from a full descriptor set and never modified;
 * HandlerRegistry publishes a new trie on reload. match() is const and
 * keeps no state, so any number of threads may call it concurrently.
 */
class KeywordTrie {
public:
  /// Empty trie; match() always returns an empty result.
  KeywordTrie();
  ~KeywordTrie();

  KeywordTrie(const KeywordTrie &) = delete;
  KeywordTrie &operator=(const KeywordTrie &) = delete;
  KeywordTrie(KeywordTrie &&) noexcept;
  KeywordTrie &operator=(KeywordTrie &&) noexcept;

  /**
   * @brief Build a trie from descriptors and optional workflow rules.
   *
   * Keywords and tags are normalized with router::normalize. Workflow members
   * that name no descriptor are skipped with a warning.
   */
  static KeywordTrie build(const std::vector<handler::HandlerDescriptor> &descriptors,
                           const std::vector<handler::WorkflowRule> &workflows = {},
                           RouterConfig config = {});

  /**
   * @brief Match free text against the index.
   *
   * @throws SwitchyardException InputTooLarge when `text` exceeds
   *         RouterConfig::max_input_length.
   */
  [[nodiscard]] MatchResult match(std::string_view text) const;

  [[nodiscard]] std::size_t nodeCount() const noexcept { return node_count_; }
  [[nodiscard]] std::size_t phraseCount() const noexcept { return phrase_count_; }
  [[nodiscard]] std::size_t handlerCount() const noexcept { return handlers_.size(); }
  [[nodiscard]] const RouterConfig &config() const noexcept { return config_; }

private:
  struct HandlerInfo {
    std::string name;
    int priority{0};
    handler::Category category{handler::kDefaultCategory};
  };

  struct WorkflowInfo {
    std::string name;
    std::vector<std::size_t> members;
  };

  TrieTerminal *insert(std::string_view phrase);

  std::unique_ptr<TrieNode> root_;
  std::vector<HandlerInfo> handlers_;
  std::map<std::string, std::size_t, std::less<>> handler_index_;
  std::vector<WorkflowInfo> workflows_;
  RouterConfig config_{};
  std::size_t node_count_{1};
  std::size_t phrase_count_{0};
};

/**
 * @brief Rebuild `categories` and `suggests_parallel` from `candidates`.
 *
 * Categories are listed in enum order. Parallel coordination is suggested
 * when at least two categories have a candidate scoring `parallel_threshold`
 * or more.
 */
void summarizeCategories(MatchResult &result, double parallel_threshold);

} // namespace switchyard::internal::router
