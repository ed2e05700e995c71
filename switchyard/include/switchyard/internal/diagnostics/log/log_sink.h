#pragma once

/**
 * @file log_sink.h
 * @brief Log sink installation and the internal logging entry points.
 */

#include <string>
#include <string_view>
#include <utility>

#include "switchyard/internal/diagnostics/log/log_types.h"

namespace switchyard::internal::diagnostics::log {

/**
 * @brief Function pointer type for custom log sinks.
 *
 * Sinks are called from worker threads as well as the caller thread, so a
 * sink must be thread-safe.
 *
 * @param category The category of the log message.
 * @param level The severity level of the log message.
 * @param message The log message content.
 * @param context User-provided context pointer passed to setLogSink().
 */
using LogSink = void (*)(LogCategory category, LogLevel level, std::string_view message, void* context);

/**
 * @brief Install a custom log sink. `nullptr` restores the stderr sink.
 */
void setLogSink(LogSink sink, void* context = nullptr);

/**
 * @brief Equivalent to `setLogSink(nullptr, nullptr)`.
 */
void resetLogSink();

namespace detail {

/**
 * @brief Route a message to the configured sink or the default sink.
 */
void logMessage(LogCategory category, LogLevel level, std::string message);

/**
 * @brief Build and emit the message only if the level passes the category threshold.
 */
template <LogCategory Category, LogLevel Level, typename MessageBuilder>
inline void logLazy(MessageBuilder&& builder) {
    if constexpr (levelToInt(Level) >= categoryThreshold<Category>()) {
        logMessage(Category, Level, std::forward<MessageBuilder>(builder)());
    }
}

/**
 * @brief As logLazy, with a lazily evaluated condition.
 */
template <LogCategory Category, LogLevel Level, typename ConditionBuilder, typename MessageBuilder>
inline void logLazyIf(ConditionBuilder&& condition_builder, MessageBuilder&& message_builder) {
    if constexpr (levelToInt(Level) >= categoryThreshold<Category>()) {
        if (std::forward<ConditionBuilder>(condition_builder)()) {
            logMessage(Category, Level, std::forward<MessageBuilder>(message_builder)());
        }
    }
}

}  // namespace detail

}  // namespace switchyard::internal::diagnostics::log
