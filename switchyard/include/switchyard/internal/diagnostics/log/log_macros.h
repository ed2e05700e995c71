#pragma once

/**
 * @file log_macros.h
 * @brief Logging macros and SWITCHYARD_ASSERT.
 */

#include <string>

#include "switchyard/internal/diagnostics/log/log_sink.h"
#include "switchyard/internal/diagnostics/error/error_macros.h"

// ============================================================================
// Basic log macros
// ============================================================================

/**
 * @def SWITCHYARD_LOG_INTERNAL(category, level, expr)
 * @brief Wraps `expr` in a lambda so it is only evaluated when enabled.
 *
 * @param category Log category (e.g. `Router`, `Engine`).
 * @param level Log level (e.g. `Debug`, `Info`).
 * @param expr Expression convertible to std::string.
 */
#define SWITCHYARD_LOG_INTERNAL(category, level, expr)                            \
    ::switchyard::internal::diagnostics::log::detail::logLazy<                    \
        ::switchyard::internal::diagnostics::log::LogCategory::category,          \
        ::switchyard::internal::diagnostics::log::LogLevel::level>(               \
        [&]() -> std::string { return std::string(expr); })

#define SWITCHYARD_LOG_TRACE(category, expr) SWITCHYARD_LOG_INTERNAL(category, Trace, expr)
#define SWITCHYARD_LOG_DEBUG(category, expr) SWITCHYARD_LOG_INTERNAL(category, Debug, expr)
#define SWITCHYARD_LOG_INFO(category, expr) SWITCHYARD_LOG_INTERNAL(category, Info, expr)
#define SWITCHYARD_LOG_WARN(category, expr) SWITCHYARD_LOG_INTERNAL(category, Warn, expr)
#define SWITCHYARD_LOG_ERROR(category, expr) SWITCHYARD_LOG_INTERNAL(category, Error, expr)
#define SWITCHYARD_LOG_CRITICAL(category, expr) SWITCHYARD_LOG_INTERNAL(category, Critical, expr)

// ============================================================================
// Conditional log macros
// ============================================================================

/**
 * @def SWITCHYARD_LOG_INTERNAL_IF(category, level, condition, expr)
 * @brief The condition is only evaluated if the level is enabled.
 */
#define SWITCHYARD_LOG_INTERNAL_IF(category, level, condition, expr)              \
    ::switchyard::internal::diagnostics::log::detail::logLazyIf<                  \
        ::switchyard::internal::diagnostics::log::LogCategory::category,          \
        ::switchyard::internal::diagnostics::log::LogLevel::level>(               \
        [&]() -> bool { return (condition); },                                    \
        [&]() -> std::string { return std::string(expr); })

#define SWITCHYARD_LOG_DEBUG_IF(category, condition, expr) \
    SWITCHYARD_LOG_INTERNAL_IF(category, Debug, condition, expr)
#define SWITCHYARD_LOG_INFO_IF(category, condition, expr) \
    SWITCHYARD_LOG_INTERNAL_IF(category, Info, condition, expr)
#define SWITCHYARD_LOG_WARN_IF(category, condition, expr) \
    SWITCHYARD_LOG_INTERNAL_IF(category, Warn, condition, expr)
#define SWITCHYARD_LOG_ERROR_IF(category, condition, expr) \
    SWITCHYARD_LOG_INTERNAL_IF(category, Error, condition, expr)

// ============================================================================
// Assertion
// ============================================================================

/**
 * @def SWITCHYARD_ASSERT(expr, message)
 * @brief Logs a CRITICAL Core message and calls fatalError() when `expr` is false.
 *
 * Reserved for broken internal invariants; caller mistakes are reported with
 * SWITCHYARD_THROW instead.
 */
#define SWITCHYARD_ASSERT(expr, message)                                          \
    do {                                                                          \
        if (!(expr)) {                                                            \
            const std::string _switchyard_assert_message = std::string(message);  \
            SWITCHYARD_LOG_CRITICAL(Core, _switchyard_assert_message);            \
            ::switchyard::internal::diagnostics::error::fatalError(               \
                ::switchyard::internal::diagnostics::error::makeError(            \
                    ::switchyard::internal::diagnostics::error::SwitchyardErrc::InvalidState, \
                    _switchyard_assert_message));                                 \
        }                                                                         \
    } while (0)
