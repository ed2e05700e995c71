#pragma once

/**
 * @file error_macros.h
 * @brief Shorthand macros around throwError.
 */

#include "switchyard/internal/diagnostics/error/error.h"

namespace switchyard::internal::diagnostics::error {

/// @brief Internal helper so the macros do not need full qualification at the call site.
template <typename... Args>
[[noreturn]] inline void throwErrorHelper(SwitchyardErrc errc, Args&&... args) {
    throwError(errc, std::forward<Args>(args)...);
}

}  // namespace switchyard::internal::diagnostics::error

/**
 * @brief Throw with the given code and message.
 * @param code SwitchyardErrc member name (e.g. InvalidArgument)
 * @param msg message (literal or std::string)
 */
#define SWITCHYARD_THROW(code, msg) \
    ::switchyard::internal::diagnostics::error::throwErrorHelper( \
        ::switchyard::internal::diagnostics::error::SwitchyardErrc::code, msg)

/**
 * @brief Throw when the condition holds.
 */
#define SWITCHYARD_THROW_IF(cond, code, msg) \
    do { \
        if (cond) { \
            SWITCHYARD_THROW(code, msg); \
        } \
    } while (false)

/**
 * @brief Throw when the condition does not hold.
 */
#define SWITCHYARD_THROW_UNLESS(cond, code, msg) \
    SWITCHYARD_THROW_IF(!(cond), code, msg)
