#include "switchyard/internal/config/engine_config.h"

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

#include "tests/internal/testing/error_assert.h"

namespace config = switchyard::internal::config;
namespace registry = switchyard::internal::registry;
namespace diag = switchyard::internal::diagnostics::error;
namespace fs = std::filesystem;
using namespace std::chrono_literals;

TEST(EngineConfig, EmptyDocumentYieldsDefaults) {
  const auto parsed = config::parseEngineConfig("", "empty.yml");
  EXPECT_EQ(parsed.router.max_input_length, 50000u);
  EXPECT_DOUBLE_EQ(parsed.router.phrase_bonus, 1.5);
  EXPECT_EQ(parsed.cache.capacity, 100u);
  EXPECT_EQ(parsed.breaker.failure_threshold, 5u);
  EXPECT_EQ(parsed.dispatch.max_attempts, 3u);
  EXPECT_EQ(parsed.execution.max_fan_out, 5u);
  EXPECT_TRUE(parsed.sources.empty());
}

TEST(EngineConfig, ParsesEverySection) {
  const auto parsed = config::parseEngineConfig(R"(
router:
  max_input_length: 1000
  phrase_bonus: 2.0
  tag_weight: 0.25
  coordinator: DIRECTOR
  coordinator_threshold: 2
cache:
  capacity: 10
  shard_count: 2
  default_ttl_ms: 500
breaker:
  failure_threshold: 3
  cool_down_ms: 1500
  backoff_multiplier: 3
  max_cool_down_ms: 9000
dispatch:
  fast_path_enabled: false
  max_attempts: 5
  base_backoff_ms: 10
  max_fast_latency_ms: 250
  max_failure_rate: 0.25
execution:
  worker_count: 6
  max_fan_out: 2
  call_timeout_ms: 750
)",
                                                "full.yml");

  EXPECT_EQ(parsed.router.max_input_length, 1000u);
  EXPECT_DOUBLE_EQ(parsed.router.phrase_bonus, 2.0);
  EXPECT_DOUBLE_EQ(parsed.router.tag_weight, 0.25);
  EXPECT_DOUBLE_EQ(parsed.router.workflow_weight, 0.5);
  EXPECT_EQ(parsed.router.coordinator, "DIRECTOR");
  EXPECT_EQ(parsed.router.coordinator_threshold, 2u);

  EXPECT_EQ(parsed.cache.capacity, 10u);
  EXPECT_EQ(parsed.cache.shard_count, 2u);
  EXPECT_EQ(parsed.cache.default_ttl, 500ms);

  EXPECT_EQ(parsed.breaker.failure_threshold, 3u);
  EXPECT_EQ(parsed.breaker.cool_down, 1500ms);
  EXPECT_DOUBLE_EQ(parsed.breaker.backoff_multiplier, 3.0);
  EXPECT_EQ(parsed.breaker.max_cool_down, 9000ms);

  EXPECT_FALSE(parsed.dispatch.fast_path_enabled);
  EXPECT_EQ(parsed.dispatch.max_attempts, 5u);
  EXPECT_EQ(parsed.dispatch.base_backoff, 10ms);
  EXPECT_EQ(parsed.dispatch.max_fast_latency, 250ms);
  EXPECT_DOUBLE_EQ(parsed.dispatch.max_failure_rate, 0.25);

  EXPECT_EQ(parsed.execution.worker_count, 6u);
  EXPECT_EQ(parsed.execution.max_fan_out, 2u);
  EXPECT_EQ(parsed.execution.call_timeout, 750ms);
}

TEST(EngineConfig, RelativeSourcesResolveAgainstBaseDir) {
  const auto parsed = config::parseEngineConfig(R"(
registry:
  sources:
    - handlers.yml
    - /etc/switchyard/extra.yml
)",
                                                "sources.yml", fs::path("/opt/switchyard"));
  ASSERT_EQ(parsed.sources.size(), 2u);
  EXPECT_EQ(parsed.sources[0].kind, registry::DescriptorSource::Kind::File);
  EXPECT_EQ(fs::path(parsed.sources[0].location), fs::path("/opt/switchyard/handlers.yml"));
  EXPECT_EQ(parsed.sources[1].location, "/etc/switchyard/extra.yml");
}

TEST(EngineConfig, RejectsInvalidDocuments) {
  const std::vector<std::string> documents{
      "router: [1, 2\n",
      "- a\n- b\n",
      "routing: {}\n",
      "router:\n  max_input_lenght: 10\n",
      "router: 12\n",
      "cache:\n  capacity: lots\n",
      "cache:\n  capacity: -1\n",
      "cache:\n  default_ttl_ms: [1]\n",
      "breaker:\n  failure_threshold: 0\n",
      "breaker:\n  backoff_multiplier: 0\n",
      "dispatch:\n  max_attempts: 0\n",
      "dispatch:\n  max_failure_rate: 1.5\n",
      "dispatch:\n  fast_path_enabled: maybe\n",
      "router:\n  phrase_bonus: -1\n",
      "execution:\n  call_timeout_ms: -5\n",
      "registry:\n  sources: handlers.yml\n",
      "registry:\n  sources: ['']\n",
  };
  for (const auto &document : documents) {
    SCOPED_TRACE(document);
    switchyard::tests::ExpectError(diag::SwitchyardErrc::ConfigInvalid,
                                   [&] { (void)config::parseEngineConfig(document, "bad.yml"); });
  }
}

TEST(EngineConfig, ErrorNamesTheSection) {
  switchyard::tests::ExpectErrorMessage(
      diag::SwitchyardErrc::ConfigInvalid, {"bad.yml.cache", "unknown key 'size'"},
      [] { (void)config::parseEngineConfig("cache:\n  size: 3\n", "bad.yml"); });
}

TEST(EngineConfig, CountsMustFitTheirField) {
  // 2^32 + 5 would wrap to 5 in the 32-bit threshold.
  switchyard::tests::ExpectErrorMessage(
      diag::SwitchyardErrc::ConfigInvalid, {"bad.yml.breaker", "failure_threshold", "4294967295"},
      [] { (void)config::parseEngineConfig("breaker:\n  failure_threshold: 4294967301\n", "bad.yml"); });

  const auto parsed =
      config::parseEngineConfig("breaker:\n  failure_threshold: 4294967295\n", "ok.yml");
  EXPECT_EQ(parsed.breaker.failure_threshold, 4294967295u);
}

TEST(EngineConfig, MissingFileIsConfigInvalid) {
  switchyard::tests::ExpectError(diag::SwitchyardErrc::ConfigInvalid, [] {
    (void)config::loadEngineConfig("/nonexistent/switchyard/engine.yml");
  });
}

TEST(EngineConfig, SampleConfigurationLoads) {
  const fs::path path = fs::path(SWITCHYARD_SOURCE_DIR) / "configs" / "switchyard.yml";
  const auto parsed = config::loadEngineConfig(path);
  EXPECT_EQ(parsed.router.coordinator, "DIRECTOR");
  ASSERT_EQ(parsed.sources.size(), 2u);
  EXPECT_EQ(parsed.sources[0].kind, registry::DescriptorSource::Kind::File);
  EXPECT_EQ(parsed.sources[1].kind, registry::DescriptorSource::Kind::Directory);
  EXPECT_TRUE(fs::exists(parsed.sources[0].location));
}
