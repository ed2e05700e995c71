#include "switchyard/internal/diagnostics/log/log.h"

#include <atomic>
#include <cstdio>
#include <string>
#include <string_view>

namespace switchyard::internal::diagnostics::log {

namespace {

/// User sink; nullptr selects defaultSink.
std::atomic<LogSink> g_sink{nullptr};

/// Context pointer handed back to the user sink.
std::atomic<void*> g_context{nullptr};

/**
 * @brief Writes `[SWITCHYARD][category][level] message` to stderr.
 */
void defaultSink(LogCategory category, LogLevel level, std::string_view message) {
    std::fprintf(stderr, "[SWITCHYARD][%s][%s] %.*s\n",
                 categoryToString(category),
                 levelToString(level),
                 static_cast<int>(message.size()),
                 message.data());
}

}  // namespace

void setLogSink(LogSink sink, void* context) {
    g_context.store(context, std::memory_order_release);
    g_sink.store(sink, std::memory_order_release);
}

void resetLogSink() {
    setLogSink(nullptr, nullptr);
}

namespace detail {

void logMessage(LogCategory category, LogLevel level, std::string message) {
    if (auto sink = g_sink.load(std::memory_order_acquire)) {
        sink(category, level, message, g_context.load(std::memory_order_acquire));
        return;
    }
    defaultSink(category, level, message);
}

}  // namespace detail

}  // namespace switchyard::internal::diagnostics::log
