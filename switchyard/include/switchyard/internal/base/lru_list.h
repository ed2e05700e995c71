#pragma once

#include <cstddef>
#include <utility>

namespace switchyard::internal::base {

/**
 * @brief Link embedded in an LRU-tracked entry.
 *
 * The node carries a copy of the owning entry's key so that the entry can be
 * located again after it has been selected for eviction.
 *
 * @tparam Key Lookup key of the owning entry
 */
template <typename Key> struct LruNode {
  Key key{};
  LruNode *prev{nullptr};
  LruNode *next{nullptr};

  LruNode() = default;
  explicit LruNode(Key k) : key(std::move(k)) {}

  LruNode(const LruNode &) = delete;
  LruNode &operator=(const LruNode &) = delete;
  LruNode(LruNode &&) = delete;
  LruNode &operator=(LruNode &&) = delete;

  [[nodiscard]] bool linked() const noexcept { return prev != nullptr; }
};

/**
 * @brief Recency list over externally owned nodes.
 *
 * Front is most recently used, back is the eviction candidate. All operations
 * are O(1). The list never allocates or frees nodes; the owner keeps them
 * alive for as long as they are linked.
 *
 * @tparam Key Key type stored in each node
 */
template <typename Key> class LruList {
public:
  using Node = LruNode<Key>;

  LruList() noexcept {
    head_.prev = &head_;
    head_.next = &head_;
  }

  LruList(const LruList &) = delete;
  LruList &operator=(const LruList &) = delete;
  LruList(LruList &&) = delete;
  LruList &operator=(LruList &&) = delete;

  [[nodiscard]] bool empty() const noexcept { return head_.next == &head_; }

  [[nodiscard]] std::size_t size() const noexcept { return size_; }

  /// Link a node that is not yet in any list as most recently used.
  void pushFront(Node *node) noexcept {
    if (node == nullptr || node->linked()) {
      return;
    }
    insertAfterHead(node);
    ++size_;
  }

  /// Mark a linked node as most recently used.
  void moveToFront(Node *node) noexcept {
    if (node == nullptr || !node->linked() || head_.next == node) {
      return;
    }
    detach(node);
    insertAfterHead(node);
  }

  /// Unlink a node; no-op if it is not linked.
  void erase(Node *node) noexcept {
    if (node == nullptr || !node->linked()) {
      return;
    }
    detach(node);
    --size_;
  }

  /// Unlink and return the least recently used node, or nullptr.
  Node *popLeastRecent() noexcept {
    if (empty()) {
      return nullptr;
    }
    Node *victim = head_.prev;
    detach(victim);
    --size_;
    return victim;
  }

  [[nodiscard]] Node *leastRecent() const noexcept {
    return empty() ? nullptr : head_.prev;
  }

  [[nodiscard]] Node *mostRecent() const noexcept {
    return empty() ? nullptr : head_.next;
  }

  /// Unlink every node without touching the owners.
  void reset() noexcept {
    Node *cursor = head_.next;
    while (cursor != &head_) {
      Node *next = cursor->next;
      cursor->prev = nullptr;
      cursor->next = nullptr;
      cursor = next;
    }
    head_.prev = &head_;
    head_.next = &head_;
    size_ = 0;
  }

private:
  void insertAfterHead(Node *node) noexcept {
    node->prev = &head_;
    node->next = head_.next;
    head_.next->prev = node;
    head_.next = node;
  }

  static void detach(Node *node) noexcept {
    node->prev->next = node->next;
    node->next->prev = node->prev;
    node->prev = nullptr;
    node->next = nullptr;
  }

  mutable Node head_{};
  std::size_t size_{0};
};

} // namespace switchyard::internal::base
