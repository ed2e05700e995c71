#include "switchyard/internal/diagnostics/log/log.h"

#include <gtest/gtest.h>

#include <string>
#include <string_view>
#include <vector>

using namespace switchyard::internal::diagnostics;

namespace {

struct SinkCapture {
    std::vector<std::string> messages;
    std::vector<log::LogCategory> categories;
};

void test_sink(log::LogCategory category, log::LogLevel, std::string_view message, void* context) {
    auto* capture = static_cast<SinkCapture*>(context);
    capture->messages.emplace_back(message);
    capture->categories.push_back(category);
}

}  // namespace

TEST(DiagnosticsLog, InfoEmitsWhenEnabled) {
    SinkCapture capture;
    log::setLogSink(&test_sink, &capture);

    SWITCHYARD_LOG_INFO(Router, "info message");

    log::resetLogSink();

    ASSERT_EQ(capture.messages.size(), 1u);
    EXPECT_EQ(capture.messages[0], "info message");
    EXPECT_EQ(capture.categories[0], log::LogCategory::Router);
}

TEST(DiagnosticsLog, TraceIsCompiledOutWhenDisabled) {
    SinkCapture capture;
    log::setLogSink(&test_sink, &capture);

    SWITCHYARD_LOG_TRACE(Core, "trace message");

    log::resetLogSink();

    EXPECT_TRUE(capture.messages.empty());
}

TEST(DiagnosticsLog, MessageIsNotBuiltWhenDisabled) {
    SinkCapture capture;
    log::setLogSink(&test_sink, &capture);

    int evaluations = 0;
    auto build = [&] {
        ++evaluations;
        return std::string("expensive");
    };
    SWITCHYARD_LOG_TRACE(Engine, build());

    log::resetLogSink();

    EXPECT_EQ(evaluations, 0);
}

TEST(DiagnosticsLog, ConditionalLogHonoursCondition) {
    SinkCapture capture;
    log::setLogSink(&test_sink, &capture);

    SWITCHYARD_LOG_WARN_IF(Dispatch, false, "skipped");
    SWITCHYARD_LOG_WARN_IF(Dispatch, true, "emitted");

    log::resetLogSink();

    ASSERT_EQ(capture.messages.size(), 1u);
    EXPECT_EQ(capture.messages[0], "emitted");
}

#if GTEST_HAS_DEATH_TEST
TEST(DiagnosticsLog, AssertTriggersFatal) {
    auto trigger = [] { SWITCHYARD_ASSERT(false, "assert failure"); };
    EXPECT_DEATH(trigger(), "assert failure");
}
#endif
