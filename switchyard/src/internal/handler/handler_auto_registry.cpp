#include "switchyard/internal/handler/handler_auto_registry.h"

#include <vector>

namespace switchyard::internal::handler {

namespace {

std::vector<RegisterFn> &registrars() {
  static std::vector<RegisterFn> registry;
  return registry;
}

} // namespace

bool addHandlerRegistrar(RegisterFn fn) {
  if (!fn) {
    return false;
  }
  auto &registry = registrars();
  for (auto existing : registry) {
    if (existing == fn) {
      return false;
    }
  }
  registry.push_back(fn);
  return true;
}

void registerAllHandlers(HandlerTable &table) {
  for (auto fn : registrars()) {
    fn(table);
  }
}

std::size_t registeredRegistrarCount() { return registrars().size(); }

} // namespace switchyard::internal::handler
