#pragma once

#include <cstddef>

#include "switchyard/internal/handler/handler_table.h"

namespace switchyard::internal::handler {

using RegisterFn = void (*)(HandlerTable &);

/// @return false if `fn` is null or already queued.
bool addHandlerRegistrar(RegisterFn fn);

/// Run every queued registrar against `table`, in registration order.
void registerAllHandlers(HandlerTable &table);

std::size_t registeredRegistrarCount();

} // namespace switchyard::internal::handler

#define SWITCHYARD_INTERNAL_CONCAT_IMPL(a, b) a##b
#define SWITCHYARD_INTERNAL_CONCAT(a, b) SWITCHYARD_INTERNAL_CONCAT_IMPL(a, b)

#ifdef __COUNTER__
#define SWITCHYARD_INTERNAL_UNIQUE_ID(base) SWITCHYARD_INTERNAL_CONCAT(base, __COUNTER__)
#else
#define SWITCHYARD_INTERNAL_UNIQUE_ID(base) SWITCHYARD_INTERNAL_CONCAT(base, __LINE__)
#endif

#define SWITCHYARD_REGISTER_HANDLERS(fn)                                       \
  namespace {                                                                  \
  const bool SWITCHYARD_INTERNAL_UNIQUE_ID(_switchyard_handler_reg_) =         \
      ::switchyard::internal::handler::addHandlerRegistrar(fn);                \
  }
