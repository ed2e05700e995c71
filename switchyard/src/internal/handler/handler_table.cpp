#include "switchyard/internal/handler/handler_table.h"

#include <utility>

#include "switchyard/internal/diagnostics/error/error_macros.h"
#include "switchyard/internal/diagnostics/log/log.h"

namespace switchyard::internal::handler {

void HandlerTable::registerHandler(std::string name, HandlerFn fallback,
                                   HandlerFn fast) {
  SWITCHYARD_THROW_IF(name.empty(), InvalidArgument,
                      "handler name must not be empty");
  SWITCHYARD_THROW_UNLESS(static_cast<bool>(fallback), InvalidArgument,
                          "handler '" + name + "' has no fallback implementation");
  SWITCHYARD_THROW_IF(entries_.count(name) != 0, InvalidArgument,
                      "handler '" + name + "' is already registered");

  SWITCHYARD_LOG_DEBUG(Registry, "registered implementation for '" + name + "'" +
                                     (fast ? " (fast path)" : ""));
  HandlerImplementation impl{std::move(fallback), std::move(fast)};
  entries_.emplace(std::move(name), std::move(impl));
}

const HandlerImplementation *HandlerTable::find(std::string_view name) const {
  const auto it = entries_.find(name);
  return it == entries_.end() ? nullptr : &it->second;
}

bool HandlerTable::hasAnyFastPath() const noexcept {
  for (const auto &[name, impl] : entries_) {
    if (impl.hasFastPath()) {
      return true;
    }
  }
  return false;
}

std::vector<std::string> HandlerTable::names() const {
  std::vector<std::string> out;
  out.reserve(entries_.size());
  for (const auto &[name, impl] : entries_) {
    out.push_back(name);
  }
  return out;
}

} // namespace switchyard::internal::handler
