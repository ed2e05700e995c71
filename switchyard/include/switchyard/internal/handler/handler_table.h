#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "switchyard/internal/handler/handler_call.h"

namespace switchyard::internal::handler {

/**
 * @brief Implementations registered for one handler name.
 */
struct HandlerImplementation {
  /// Resilient implementation; always present.
  HandlerFn fallback;
  /// High-performance implementation; empty if the handler has none.
  HandlerFn fast;

  [[nodiscard]] bool hasFastPath() const noexcept {
    return static_cast<bool>(fast);
  }
};

/**
 * @brief Explicit name to implementation table.
 *
 * Populated once at startup, then shared read-only by the dispatcher.
 * Descriptors and implementations are joined by name at dispatch time, so a
 * reload may add descriptors whose implementation is missing; those are
 * reported as HandlerNotFound.
 */
class HandlerTable {
public:
  HandlerTable() = default;

  HandlerTable(const HandlerTable &) = delete;
  HandlerTable &operator=(const HandlerTable &) = delete;
  HandlerTable(HandlerTable &&) = default;
  HandlerTable &operator=(HandlerTable &&) = default;

  /**
   * @brief Register a handler.
   *
   * @throws SwitchyardException InvalidArgument on an empty name, a missing
   *         fallback, or a name that is already registered.
   */
  void registerHandler(std::string name, HandlerFn fallback, HandlerFn fast = {});

  /// @return nullptr if no implementation is registered for `name`.
  [[nodiscard]] const HandlerImplementation *find(std::string_view name) const;

  [[nodiscard]] bool contains(std::string_view name) const {
    return find(name) != nullptr;
  }

  [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }

  /// True if at least one handler has a fast implementation.
  [[nodiscard]] bool hasAnyFastPath() const noexcept;

  [[nodiscard]] std::vector<std::string> names() const;

private:
  std::map<std::string, HandlerImplementation, std::less<>> entries_;
};

} // namespace switchyard::internal::handler
