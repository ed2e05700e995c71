#pragma once

/**
 * @file log_types.h
 * @brief Log level and category types plus constexpr helpers.
 */

#include "switchyard/internal/diagnostics/log/log_config.h"

namespace switchyard::internal::diagnostics::log {

/**
 * @brief Log severity levels.
 *
 * Ordered from most verbose (Trace) to least verbose (Off).
 */
enum class LogLevel : int {
    Trace = SWITCHYARD_LOG_LEVEL_TRACE_VAL,       ///< Detailed tracing.
    Debug = SWITCHYARD_LOG_LEVEL_DEBUG_VAL,       ///< Development diagnostics.
    Info = SWITCHYARD_LOG_LEVEL_INFO_VAL,         ///< Normal operation.
    Warn = SWITCHYARD_LOG_LEVEL_WARN_VAL,         ///< Potential problems.
    Error = SWITCHYARD_LOG_LEVEL_ERROR_VAL,       ///< Error conditions.
    Critical = SWITCHYARD_LOG_LEVEL_CRITICAL_VAL, ///< Requires immediate attention.
    Off = SWITCHYARD_LOG_LEVEL_OFF_VAL            ///< Disables output.
};

/**
 * @brief Log message categories, one per subsystem.
 */
enum class LogCategory : int {
    Core,     ///< Library setup and configuration.
    Router,   ///< Keyword matching.
    Registry, ///< Descriptor loading and reload.
    Engine,   ///< Task execution and the worker pool.
    Dispatch  ///< Fast/fallback path selection, retries and the breaker.
};

// ============================================================================
// Compile-time thresholds
// ============================================================================

namespace detail {

inline constexpr int kLogLevelGlobal =
#ifdef SWITCHYARD_LOG_LEVEL_GLOBAL_VALUE
    SWITCHYARD_LOG_LEVEL_GLOBAL_VALUE;
#else
    static_cast<int>(LogLevel::Off);
#endif

inline constexpr int kLogLevelCore =
#ifdef SWITCHYARD_LOG_LEVEL_CORE_VALUE
    SWITCHYARD_LOG_LEVEL_CORE_VALUE;
#else
    kLogLevelGlobal;
#endif

inline constexpr int kLogLevelRouter =
#ifdef SWITCHYARD_LOG_LEVEL_ROUTER_VALUE
    SWITCHYARD_LOG_LEVEL_ROUTER_VALUE;
#else
    kLogLevelGlobal;
#endif

inline constexpr int kLogLevelRegistry =
#ifdef SWITCHYARD_LOG_LEVEL_REGISTRY_VALUE
    SWITCHYARD_LOG_LEVEL_REGISTRY_VALUE;
#else
    kLogLevelGlobal;
#endif

inline constexpr int kLogLevelEngine =
#ifdef SWITCHYARD_LOG_LEVEL_ENGINE_VALUE
    SWITCHYARD_LOG_LEVEL_ENGINE_VALUE;
#else
    kLogLevelGlobal;
#endif

inline constexpr int kLogLevelDispatch =
#ifdef SWITCHYARD_LOG_LEVEL_DISPATCH_VALUE
    SWITCHYARD_LOG_LEVEL_DISPATCH_VALUE;
#else
    kLogLevelGlobal;
#endif

}  // namespace detail

// ============================================================================
// constexpr helpers
// ============================================================================

constexpr int levelToInt(LogLevel level) {
    return static_cast<int>(level);
}

/**
 * @brief Threshold for a given category.
 */
template <LogCategory Category>
constexpr int categoryThreshold() {
    if constexpr (Category == LogCategory::Core) {
        return detail::kLogLevelCore;
    } else if constexpr (Category == LogCategory::Router) {
        return detail::kLogLevelRouter;
    } else if constexpr (Category == LogCategory::Registry) {
        return detail::kLogLevelRegistry;
    } else if constexpr (Category == LogCategory::Engine) {
        return detail::kLogLevelEngine;
    } else {
        return detail::kLogLevelDispatch;
    }
}

/**
 * @brief Compile-time check whether a category permits a given level.
 */
template <LogCategory Category, LogLevel Level>
constexpr bool isLevelEnabled() {
    return levelToInt(Level) >= categoryThreshold<Category>();
}

// ============================================================================
// String conversion
// ============================================================================

constexpr const char* levelToString(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return "TRACE";
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warn:     return "WARN";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        case LogLevel::Off:
        default:                 return "OFF";
    }
}

constexpr const char* categoryToString(LogCategory category) {
    switch (category) {
        case LogCategory::Core:     return "core";
        case LogCategory::Router:   return "router";
        case LogCategory::Registry: return "registry";
        case LogCategory::Engine:   return "engine";
        case LogCategory::Dispatch:
        default:                    return "dispatch";
    }
}

}  // namespace switchyard::internal::diagnostics::log
