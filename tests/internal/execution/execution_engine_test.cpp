#include "switchyard/internal/execution/execution_engine.h"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "tests/internal/testing/error_assert.h"
#include "tests/internal/testing/manual_clock.h"

namespace execution = switchyard::internal::execution;
namespace registry = switchyard::internal::registry;
namespace handler = switchyard::internal::handler;
namespace cache = switchyard::internal::cache;
namespace breaker = switchyard::internal::breaker;
namespace dispatch = switchyard::internal::dispatch;
namespace diag = switchyard::internal::diagnostics::error;
using namespace std::chrono_literals;

namespace {

constexpr const char *kDescriptors = R"(
handlers:
  - name: SECURITY
    category: security
    trigger_keywords: [audit, vulnerability]
    priority: 1
  - name: OPTIMIZER
    category: performance
    trigger_keywords: [optimize]
    priority: 2
  - name: FLAKY
    category: development
    trigger_keywords: [flaky]
  - name: STALL
    category: development
    trigger_keywords: [stall]
  - name: PHANTOM
    category: specialized
    trigger_keywords: [phantom]
  - name: RECOVER
    category: infrastructure
    trigger_keywords: [recover]
  - name: HOLD
    category: data
    trigger_keywords: [hold]
  - name: WIDE1
    trigger_keywords: [broad]
    priority: 1
  - name: WIDE2
    trigger_keywords: [broad]
    priority: 2
  - name: WIDE3
    trigger_keywords: [broad]
    priority: 3
  - name: WIDE4
    trigger_keywords: [broad]
    priority: 4
)";

class ExecutionEngineTest : public ::testing::Test {
protected:
  void SetUp() override {
    auto table = std::make_shared<handler::HandlerTable>();
    table->registerHandler("SECURITY", [this](const handler::HandlerCall &call) {
      security_calls_.fetch_add(1);
      {
        std::lock_guard<std::mutex> lock(mutex_);
        last_payload_ = call.payload;
      }
      return handler::HandlerOutput::success("security report");
    });
    table->registerHandler("OPTIMIZER", [](const handler::HandlerCall &) {
      return handler::HandlerOutput::success("optimizer report");
    });
    table->registerHandler("FLAKY", [this](const handler::HandlerCall &) {
      flaky_calls_.fetch_add(1);
      return handler::HandlerOutput::failure(diag::SwitchyardErrc::HandlerFatal, "broken");
    });
    table->registerHandler("STALL", [](const handler::HandlerCall &call) {
      (void)call.cancel.waitFor(10s);
      return handler::HandlerOutput::failure(diag::SwitchyardErrc::TransientFailure, "late");
    });
    // Fails until recover_healthy_ is set; once healthy it waits for the gate.
    table->registerHandler("RECOVER", [this](const handler::HandlerCall &) {
      recover_calls_.fetch_add(1);
      if (!recover_healthy_.load()) {
        return handler::HandlerOutput::failure(diag::SwitchyardErrc::HandlerFatal, "down");
      }
      (void)gate_open_.wait_for(10s);
      return handler::HandlerOutput::success("recovered");
    });
    table->registerHandler("HOLD", [this](const handler::HandlerCall &) {
      hold_entered_.store(true);
      (void)gate_open_.wait_for(10s);
      return handler::HandlerOutput::success("released");
    });
    for (const char *name : {"WIDE1", "WIDE2", "WIDE3", "WIDE4"}) {
      table->registerHandler(name, [](const handler::HandlerCall &call) {
        return handler::HandlerOutput::success(std::string(call.handler_name));
      });
    }

    breaker::CircuitBreakerConfig breaker_config;
    breaker_config.failure_threshold = 2;
    breaker_config.cool_down = 60s;
    breaker_ = std::make_unique<breaker::CircuitBreaker>(breaker_config, clock_.fn());

    dispatch::DispatchConfig dispatch_config;
    dispatch_config.base_backoff = 1ms;
    dispatch_config.max_backoff = 2ms;
    dispatcher_ = std::make_unique<dispatch::TandemDispatcher>(
        std::move(table), dispatch::Capabilities{true, "test"}, dispatch_config);

    cache_ = std::make_unique<cache::ResultCache>();
  }

  execution::ExecutionEngine &engine(execution::ExecutionConfig config = defaultConfig()) {
    if (!engine_) {
      engine_ = std::make_unique<execution::ExecutionEngine>(registry_, *cache_, *breaker_,
                                                             *dispatcher_, config);
    }
    return *engine_;
  }

  void loadDescriptors() {
    registry_.load({registry::DescriptorSource::inlineYaml("engine-test", kDescriptors)});
  }

  static execution::ExecutionConfig defaultConfig() {
    execution::ExecutionConfig config;
    config.worker_count = 4;
    config.max_fan_out = 3;
    config.call_timeout = 5000ms;
    return config;
  }

  static void waitFor(const std::atomic<bool> &flag) {
    const auto until = std::chrono::steady_clock::now() + 5s;
    while (!flag.load() && std::chrono::steady_clock::now() < until) {
      std::this_thread::sleep_for(1ms);
    }
  }

  switchyard::tests::ManualClock clock_;
  std::promise<void> gate_;
  std::shared_future<void> gate_open_{gate_.get_future().share()};

  std::atomic<int> security_calls_{0};
  std::atomic<int> flaky_calls_{0};
  std::atomic<int> recover_calls_{0};
  std::atomic<bool> recover_healthy_{false};
  std::atomic<bool> hold_entered_{false};
  std::mutex mutex_;
  handler::HandlerPayload last_payload_;

  registry::HandlerRegistry registry_;
  std::unique_ptr<cache::ResultCache> cache_;
  std::unique_ptr<breaker::CircuitBreaker> breaker_;
  std::unique_ptr<dispatch::TandemDispatcher> dispatcher_;
  std::unique_ptr<execution::ExecutionEngine> engine_;
};

} // namespace

// =============================================================================
// Routing
// =============================================================================

TEST_F(ExecutionEngineTest, RequiresLoadedRegistry) {
  switchyard::tests::ExpectError(diag::SwitchyardErrc::RegistryNotLoaded,
                                 [&] { (void)engine().process("audit"); });
}

TEST_F(ExecutionEngineTest, OversizedInputIsRejected) {
  loadDescriptors();
  switchyard::tests::ExpectError(diag::SwitchyardErrc::InputTooLarge,
                                 [&] { (void)engine().process(std::string(60000, 'a')); });
}

TEST_F(ExecutionEngineTest, NoMatchSchedulesNothing) {
  loadDescriptors();
  const auto response = engine().process("bake a cake");
  EXPECT_TRUE(response.candidates.empty());
  EXPECT_TRUE(response.outcomes.empty());
  EXPECT_TRUE(response.categories.empty());
  EXPECT_EQ(response.generation, 1u);
  EXPECT_EQ(engine().getStatus().pool.completed, 0u);
}

TEST_F(ExecutionEngineTest, DispatchesMatchedHandler) {
  loadDescriptors();
  const auto response = engine().process("Audit the system for vulnerability issues");

  ASSERT_EQ(response.outcomes.size(), 1u);
  const auto &outcome = response.outcomes[0];
  EXPECT_EQ(outcome.handler, "SECURITY");
  EXPECT_EQ(outcome.status, execution::OutcomeStatus::Success);
  EXPECT_TRUE(outcome.ok());
  EXPECT_EQ(outcome.value, "security report");
  EXPECT_EQ(outcome.path, dispatch::ExecutionPath::Fallback);
  EXPECT_EQ(outcome.attempts, 1u);

  const std::vector<handler::Category> categories{handler::Category::Security};
  EXPECT_EQ(response.categories, categories);

  std::lock_guard<std::mutex> lock(mutex_);
  EXPECT_EQ(last_payload_.input, "Audit the system for vulnerability issues");
  EXPECT_EQ(last_payload_.normalized_input, "audit the system for vulnerability issues");
  const std::vector<std::string> keywords{"audit", "vulnerability"};
  EXPECT_EQ(last_payload_.matched_keywords, keywords);
}

TEST_F(ExecutionEngineTest, FanOutIsBounded) {
  loadDescriptors();
  const auto response = engine().process("broad request");
  EXPECT_EQ(response.candidates.size(), 4u);
  ASSERT_EQ(response.outcomes.size(), 3u);
  EXPECT_EQ(response.outcomes[0].handler, "WIDE1");
  EXPECT_EQ(response.outcomes[1].handler, "WIDE2");
  EXPECT_EQ(response.outcomes[2].handler, "WIDE3");
  EXPECT_EQ(response.outcomeFor("WIDE4"), nullptr);
  for (const auto &outcome : response.outcomes) {
    EXPECT_EQ(outcome.value, outcome.handler);
  }
}

TEST_F(ExecutionEngineTest, RequestIdsIncrease) {
  loadDescriptors();
  const auto first = engine().process("bake");
  const auto second = engine().process("bake");
  EXPECT_LT(first.request_id, second.request_id);
}

// =============================================================================
// Cache and breaker
// =============================================================================

TEST_F(ExecutionEngineTest, RepeatedRequestIsServedFromCache) {
  loadDescriptors();
  (void)engine().process("audit the system");
  const auto response = engine().process("AUDIT   the system!");

  ASSERT_EQ(response.outcomes.size(), 1u);
  EXPECT_EQ(response.outcomes[0].status, execution::OutcomeStatus::Cached);
  EXPECT_EQ(response.outcomes[0].value, "security report");
  EXPECT_EQ(security_calls_.load(), 1);
  EXPECT_EQ(engine().getStatus().cache.hits, 1u);
}

TEST_F(ExecutionEngineTest, FailuresOpenTheCircuit) {
  loadDescriptors();
  for (int i = 0; i < 2; ++i) {
    const auto response = engine().process("flaky job");
    ASSERT_EQ(response.outcomes.size(), 1u);
    EXPECT_EQ(response.outcomes[0].status, execution::OutcomeStatus::Error);
    EXPECT_EQ(response.outcomes[0].error_kind, diag::SwitchyardErrc::HandlerFatal);
  }

  const auto response = engine().process("flaky job");
  ASSERT_EQ(response.outcomes.size(), 1u);
  EXPECT_EQ(response.outcomes[0].status, execution::OutcomeStatus::CircuitOpen);
  EXPECT_EQ(response.outcomes[0].error_kind, diag::SwitchyardErrc::CircuitOpen);
  EXPECT_EQ(flaky_calls_.load(), 2);
  EXPECT_EQ(breaker_->inspect("FLAKY").status, breaker::CircuitStatus::Open);
  EXPECT_EQ(engine().getStatus().cache.size, 0u);
}

TEST_F(ExecutionEngineTest, MissingImplementationIsNotABreakerFailure) {
  loadDescriptors();
  for (int i = 0; i < 3; ++i) {
    const auto response = engine().process("phantom menace");
    ASSERT_EQ(response.outcomes.size(), 1u);
    EXPECT_EQ(response.outcomes[0].status, execution::OutcomeStatus::Error);
    EXPECT_EQ(response.outcomes[0].error_kind, diag::SwitchyardErrc::HandlerNotFound);
  }
  EXPECT_EQ(breaker_->inspect("PHANTOM").status, breaker::CircuitStatus::Closed);
}

TEST_F(ExecutionEngineTest, OneFailureDoesNotAffectOthers) {
  loadDescriptors();
  const auto response = engine().process("audit the flaky code");
  ASSERT_EQ(response.outcomes.size(), 2u);
  ASSERT_NE(response.outcomeFor("SECURITY"), nullptr);
  ASSERT_NE(response.outcomeFor("FLAKY"), nullptr);
  EXPECT_TRUE(response.outcomeFor("SECURITY")->ok());
  EXPECT_FALSE(response.outcomeFor("FLAKY")->ok());
}

TEST_F(ExecutionEngineTest, CoolDownAdmitsOneTrialThatClosesTheCircuit) {
  loadDescriptors();
  for (int i = 0; i < 2; ++i) {
    EXPECT_EQ(engine().process("recover attempt " + std::to_string(i)).outcomes[0].status,
              execution::OutcomeStatus::Error);
  }
  EXPECT_EQ(engine().process("recover early").outcomes[0].status,
            execution::OutcomeStatus::CircuitOpen);
  EXPECT_EQ(recover_calls_.load(), 2);

  clock_.advance(61s);
  recover_healthy_.store(true);

  // The trial blocks inside the handler until the gate opens.
  execution::AggregatedResponse trial;
  std::thread trial_thread([&] {
    trial = engine().process("recover trial");
  });
  const auto until = std::chrono::steady_clock::now() + 5s;
  while (recover_calls_.load() < 3 && std::chrono::steady_clock::now() < until) {
    std::this_thread::sleep_for(1ms);
  }
  ASSERT_EQ(recover_calls_.load(), 3);
  EXPECT_EQ(breaker_->inspect("RECOVER").status, breaker::CircuitStatus::HalfOpen);

  for (int i = 0; i < 3; ++i) {
    const auto rejected = engine().process("recover concurrent " + std::to_string(i));
    ASSERT_EQ(rejected.outcomes.size(), 1u);
    EXPECT_EQ(rejected.outcomes[0].status, execution::OutcomeStatus::CircuitOpen);
  }
  EXPECT_EQ(recover_calls_.load(), 3);

  gate_.set_value();
  trial_thread.join();
  ASSERT_EQ(trial.outcomes.size(), 1u);
  EXPECT_EQ(trial.outcomes[0].status, execution::OutcomeStatus::Success);
  EXPECT_EQ(trial.outcomes[0].value, "recovered");

  const auto circuit = breaker_->inspect("RECOVER");
  EXPECT_EQ(circuit.status, breaker::CircuitStatus::Closed);
  EXPECT_EQ(circuit.consecutive_failures, 0u);

  EXPECT_EQ(engine().process("recover afterwards").outcomes[0].status,
            execution::OutcomeStatus::Success);
  EXPECT_EQ(recover_calls_.load(), 4);
}

// =============================================================================
// Deadline
// =============================================================================

TEST_F(ExecutionEngineTest, SlowHandlerTimesOut) {
  loadDescriptors();
  auto config = defaultConfig();
  config.call_timeout = 50ms;
  auto &eng = engine(config);

  const auto start = std::chrono::steady_clock::now();
  const auto response = eng.process("audit this stall");
  const auto waited = std::chrono::steady_clock::now() - start;

  ASSERT_EQ(response.outcomes.size(), 2u);
  EXPECT_EQ(response.outcomeFor("SECURITY")->status, execution::OutcomeStatus::Success);
  const auto *stall = response.outcomeFor("STALL");
  ASSERT_NE(stall, nullptr);
  EXPECT_EQ(stall->status, execution::OutcomeStatus::TimedOut);
  EXPECT_EQ(stall->error_kind, diag::SwitchyardErrc::TimedOut);
  EXPECT_LT(waited, 5s);
  EXPECT_EQ(breaker_->inspect("STALL").status, breaker::CircuitStatus::Closed);
}

// =============================================================================
// Concurrent callers
// =============================================================================

TEST_F(ExecutionEngineTest, BlockedRequestDoesNotDelayOthers) {
  loadDescriptors();
  auto &eng = engine();
  std::thread held([&eng] {
    const auto response = eng.process("hold the line");
    ASSERT_EQ(response.outcomes.size(), 1u);
    EXPECT_EQ(response.outcomes[0].value, "released");
  });
  waitFor(hold_entered_);
  ASSERT_TRUE(hold_entered_.load());

  const auto response = eng.process("audit the system");
  ASSERT_EQ(response.outcomes.size(), 1u);
  EXPECT_EQ(response.outcomes[0].value, "security report");

  gate_.set_value();
  held.join();
}

TEST_F(ExecutionEngineTest, ConcurrentProcessCallsAreIndependent) {
  loadDescriptors();
  auto &eng = engine();

  struct Query {
    const char *text;
    std::size_t outcomes;
  };
  const std::vector<Query> queries{
      {"audit the system", 1}, {"optimize the loop", 1}, {"broad request", 3}, {"bake bread", 0}};

  constexpr int kThreads = 8;
  constexpr int kRounds = 25;
  std::atomic<int> mismatches{0};
  std::atomic<std::uint64_t> dispatched{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&, t] {
      for (int i = 0; i < kRounds; ++i) {
        const Query &query = queries[static_cast<std::size_t>(t + i) % queries.size()];
        const auto response = eng.process(query.text);
        dispatched.fetch_add(response.outcomes.size());
        bool good = response.outcomes.size() == query.outcomes;
        for (const auto &outcome : response.outcomes) {
          good = good && outcome.ok();
        }
        if (!good) {
          mismatches.fetch_add(1);
        }
      }
    });
  }
  for (auto &thread : threads) {
    thread.join();
  }

  EXPECT_EQ(mismatches.load(), 0);
  const auto status = eng.getStatus();
  EXPECT_EQ(status.requests, static_cast<std::uint64_t>(kThreads * kRounds));
  EXPECT_LE(status.pool.peak_running, eng.config().worker_count);
  // Every dispatched task consulted the cache exactly once.
  EXPECT_EQ(status.cache.hits + status.cache.misses, dispatched.load());
}

// =============================================================================
// Hints and status
// =============================================================================

TEST_F(ExecutionEngineTest, HintsRunFirst) {
  loadDescriptors();
  const auto response = engine().process("audit the system", {"OPTIMIZER"});
  ASSERT_GE(response.candidates.size(), 2u);
  EXPECT_EQ(response.candidates[0].name, "OPTIMIZER");
  EXPECT_DOUBLE_EQ(response.candidates[0].score, response.candidates[1].score);
  ASSERT_EQ(response.outcomes.size(), 2u);
  EXPECT_EQ(response.outcomes[0].handler, "OPTIMIZER");
  EXPECT_EQ(response.outcomes[0].value, "optimizer report");

  const std::vector<handler::Category> categories{handler::Category::Security,
                                                  handler::Category::Performance};
  EXPECT_EQ(response.categories, categories);
}

TEST_F(ExecutionEngineTest, HintsRefreshParallelSuggestion) {
  loadDescriptors();
  EXPECT_FALSE(engine().process("audit the system").suggests_parallel);

  // The hinted optimizer adds a second confident category.
  const auto response = engine().process("audit the system", {"OPTIMIZER"});
  EXPECT_TRUE(response.suggests_parallel);

  const auto same_category = engine().process("audit the system", {"SECURITY"});
  EXPECT_FALSE(same_category.suggests_parallel);
}

TEST_F(ExecutionEngineTest, UnknownHintIsReported) {
  loadDescriptors();
  const auto response = engine().process("bake a cake", {"GHOST", "OPTIMIZER"});
  ASSERT_EQ(response.outcomes.size(), 2u);
  EXPECT_EQ(response.outcomes[0].handler, "OPTIMIZER");
  EXPECT_TRUE(response.outcomes[0].ok());
  EXPECT_EQ(response.outcomes[1].handler, "GHOST");
  EXPECT_EQ(response.outcomes[1].error_kind, diag::SwitchyardErrc::HandlerNotFound);
}

TEST_F(ExecutionEngineTest, StatusReportsComponents) {
  auto status = engine().getStatus();
  EXPECT_EQ(status.generation, 0u);
  EXPECT_EQ(status.handler_count, 0u);
  EXPECT_TRUE(status.fast_path_available);
  EXPECT_EQ(status.pool.slots, 4u);

  loadDescriptors();
  (void)engine().process("audit and optimize");
  status = engine().getStatus();
  EXPECT_EQ(status.generation, 1u);
  EXPECT_EQ(status.handler_count, 11u);
  EXPECT_EQ(status.requests, 1u);
  EXPECT_EQ(status.latency.samples, 2u);
  EXPECT_EQ(status.latency.successes, 2u);
  EXPECT_EQ(status.circuits.size(), 2u);
  EXPECT_EQ(status.cache.insertions, 2u);
}
