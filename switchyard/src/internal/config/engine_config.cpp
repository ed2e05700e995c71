#include "switchyard/internal/config/engine_config.h"

#include <yaml-cpp/yaml.h>

#include <chrono>
#include <cstdint>
#include <fstream>
#include <initializer_list>
#include <limits>
#include <sstream>
#include <string>
#include <unordered_set>
#include <utility>

#include "switchyard/internal/diagnostics/error/error.h"
#include "switchyard/internal/diagnostics/log/log.h"

namespace switchyard::internal::config {

namespace fs = std::filesystem;
namespace diag = ::switchyard::internal::diagnostics::error;

namespace {

[[noreturn]] void fail(std::string_view context, const std::string &message) {
  std::ostringstream oss;
  oss << context << ": " << message;
  diag::throwError(diag::SwitchyardErrc::ConfigInvalid, oss.str());
}

void expectKeys(const YAML::Node &node, const std::string &context,
                std::initializer_list<std::string_view> allowed) {
  if (!node.IsMap()) {
    fail(context, "expected a mapping");
  }
  std::unordered_set<std::string_view> allowed_set(allowed.begin(), allowed.end());
  for (const auto &kv : node) {
    if (!kv.first.IsScalar()) {
      fail(context, "non-scalar key");
    }
    const std::string key = kv.first.as<std::string>();
    if (!allowed_set.count(key)) {
      fail(context, "unknown key '" + key + "'");
    }
  }
}

template <typename T>
void readScalar(const YAML::Node &node, const std::string &key, const std::string &context,
                T &out) {
  const YAML::Node value = node[key];
  if (!value || value.IsNull()) {
    return;
  }
  if (!value.IsScalar()) {
    fail(context, "key '" + key + "' must be a scalar");
  }
  try {
    out = value.as<T>();
  } catch (const YAML::Exception &) {
    fail(context, "key '" + key + "' has the wrong type: '" + value.Scalar() + "'");
  }
}

template <typename T>
void readCount(const YAML::Node &node, const std::string &key, const std::string &context,
               T &out) {
  std::int64_t value = static_cast<std::int64_t>(out);
  readScalar(node, key, context, value);
  if (value < 0) {
    fail(context, "key '" + key + "' must not be negative");
  }
  if (std::cmp_greater(value, std::numeric_limits<T>::max())) {
    fail(context, "key '" + key + "' must not exceed " +
                      std::to_string(std::numeric_limits<T>::max()));
  }
  out = static_cast<T>(value);
}

void readMillis(const YAML::Node &node, const std::string &key, const std::string &context,
                std::chrono::milliseconds &out) {
  std::int64_t value = out.count();
  readScalar(node, key, context, value);
  if (value < 0) {
    fail(context, "key '" + key + "' must not be negative");
  }
  out = std::chrono::milliseconds(value);
}

void readPositive(const YAML::Node &node, const std::string &key, const std::string &context,
                  double &out) {
  readScalar(node, key, context, out);
  if (!(out > 0.0)) {
    fail(context, "key '" + key + "' must be positive");
  }
}

void parseRouter(const YAML::Node &node, const std::string &context,
                 router::RouterConfig &out) {
  expectKeys(node, context,
             {"max_input_length", "phrase_bonus", "tag_weight", "workflow_weight",
              "parallel_threshold", "coordinator", "coordinator_threshold"});
  readCount(node, "max_input_length", context, out.max_input_length);
  readPositive(node, "phrase_bonus", context, out.phrase_bonus);
  readScalar(node, "tag_weight", context, out.tag_weight);
  readScalar(node, "workflow_weight", context, out.workflow_weight);
  readScalar(node, "parallel_threshold", context, out.parallel_threshold);
  readScalar(node, "coordinator", context, out.coordinator);
  readCount(node, "coordinator_threshold", context, out.coordinator_threshold);
}

void parseCache(const YAML::Node &node, const std::string &context,
                cache::ResultCacheConfig &out) {
  expectKeys(node, context, {"capacity", "shard_count", "default_ttl_ms"});
  readCount(node, "capacity", context, out.capacity);
  readCount(node, "shard_count", context, out.shard_count);
  readMillis(node, "default_ttl_ms", context, out.default_ttl);
}

void parseBreaker(const YAML::Node &node, const std::string &context,
                  breaker::CircuitBreakerConfig &out) {
  expectKeys(node, context,
             {"failure_threshold", "failure_window_ms", "cool_down_ms", "backoff_multiplier",
              "max_cool_down_ms"});
  readCount(node, "failure_threshold", context, out.failure_threshold);
  if (out.failure_threshold == 0) {
    fail(context, "key 'failure_threshold' must be at least 1");
  }
  readMillis(node, "failure_window_ms", context, out.failure_window);
  readMillis(node, "cool_down_ms", context, out.cool_down);
  readPositive(node, "backoff_multiplier", context, out.backoff_multiplier);
  readMillis(node, "max_cool_down_ms", context, out.max_cool_down);
}

void parseDispatch(const YAML::Node &node, const std::string &context,
                   dispatch::DispatchConfig &out) {
  expectKeys(node, context,
             {"fast_path_enabled", "max_attempts", "base_backoff_ms", "max_backoff_ms",
              "health_window", "health_min_samples", "max_failure_rate",
              "max_fast_latency_ms", "health_probe_interval_ms"});
  readScalar(node, "fast_path_enabled", context, out.fast_path_enabled);
  readCount(node, "max_attempts", context, out.max_attempts);
  if (out.max_attempts == 0) {
    fail(context, "key 'max_attempts' must be at least 1");
  }
  readMillis(node, "base_backoff_ms", context, out.base_backoff);
  readMillis(node, "max_backoff_ms", context, out.max_backoff);
  readCount(node, "health_window", context, out.health_window);
  readCount(node, "health_min_samples", context, out.health_min_samples);
  readScalar(node, "max_failure_rate", context, out.max_failure_rate);
  if (out.max_failure_rate < 0.0 || out.max_failure_rate > 1.0) {
    fail(context, "key 'max_failure_rate' must be within [0, 1]");
  }
  readMillis(node, "max_fast_latency_ms", context, out.max_fast_latency);
  readMillis(node, "health_probe_interval_ms", context, out.health_probe_interval);
}

void parseExecution(const YAML::Node &node, const std::string &context,
                    execution::ExecutionConfig &out) {
  expectKeys(node, context, {"worker_count", "max_fan_out", "call_timeout_ms", "latency_window"});
  readCount(node, "worker_count", context, out.worker_count);
  readCount(node, "max_fan_out", context, out.max_fan_out);
  readMillis(node, "call_timeout_ms", context, out.call_timeout);
  readCount(node, "latency_window", context, out.latency_window);
}

void parseRegistry(const YAML::Node &node, const std::string &context,
                   const fs::path &base_dir, std::vector<registry::DescriptorSource> &out) {
  expectKeys(node, context, {"sources"});
  const YAML::Node sources = node["sources"];
  if (!sources || sources.IsNull()) {
    return;
  }
  if (!sources.IsSequence()) {
    fail(context, "key 'sources' must be a list of paths");
  }
  for (std::size_t i = 0; i < sources.size(); ++i) {
    const YAML::Node entry = sources[i];
    if (!entry.IsScalar() || entry.Scalar().empty()) {
      fail(context, "sources[" + std::to_string(i) + "] must be a non-empty path");
    }
    fs::path path(entry.Scalar());
    if (path.is_relative() && !base_dir.empty()) {
      path = base_dir / path;
    }
    std::error_code ec;
    if (fs::is_directory(path, ec)) {
      out.push_back(registry::DescriptorSource::directory(path.string()));
    } else {
      out.push_back(registry::DescriptorSource::file(path.string()));
    }
  }
}

} // namespace

EngineConfig parseEngineConfig(std::string_view yaml, std::string_view origin,
                               const fs::path &base_dir) {
  YAML::Node document;
  try {
    document = YAML::Load(std::string(yaml));
  } catch (const YAML::Exception &ex) {
    fail(origin, std::string("YAML parse error: ") + ex.what());
  }

  EngineConfig config;
  const YAML::Node root = document;
  if (!root || root.IsNull()) {
    return config;
  }
  const std::string context(origin);
  expectKeys(root, context, {"router", "registry", "cache", "breaker", "dispatch", "execution"});

  if (const YAML::Node node = root["router"]; node && !node.IsNull()) {
    parseRouter(node, context + ".router", config.router);
  }
  if (const YAML::Node node = root["registry"]; node && !node.IsNull()) {
    parseRegistry(node, context + ".registry", base_dir, config.sources);
  }
  if (const YAML::Node node = root["cache"]; node && !node.IsNull()) {
    parseCache(node, context + ".cache", config.cache);
  }
  if (const YAML::Node node = root["breaker"]; node && !node.IsNull()) {
    parseBreaker(node, context + ".breaker", config.breaker);
  }
  if (const YAML::Node node = root["dispatch"]; node && !node.IsNull()) {
    parseDispatch(node, context + ".dispatch", config.dispatch);
  }
  if (const YAML::Node node = root["execution"]; node && !node.IsNull()) {
    parseExecution(node, context + ".execution", config.execution);
  }
  return config;
}

EngineConfig loadEngineConfig(const fs::path &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    fail(path.string(), "cannot open configuration file");
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  SWITCHYARD_LOG_INFO(Core, "loading engine configuration from " + path.string());
  return parseEngineConfig(buffer.str(), path.string(), path.parent_path());
}

} // namespace switchyard::internal::config
