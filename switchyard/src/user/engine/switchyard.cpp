#include "switchyard/user/engine/switchyard.h"

#include <utility>

#include "switchyard/internal/diagnostics/log/log.h"
#include "switchyard/internal/dispatch/capability.h"

namespace switchyard::user::engine {

namespace internal = ::switchyard::internal;

Switchyard::Switchyard(internal::config::EngineConfig config, internal::handler::HandlerTable table,
                       internal::base::ClockFn clock)
    : config_(std::move(config)),
      table_(std::make_shared<const internal::handler::HandlerTable>(std::move(table))),
      registry_(config_.router), cache_(config_.cache, clock), breaker_(config_.breaker, clock),
      dispatcher_(table_, internal::dispatch::detectCapabilities(config_.dispatch, *table_),
                  config_.dispatch, clock),
      engine_(registry_, cache_, breaker_, dispatcher_, config_.execution) {
  if (!config_.sources.empty()) {
    const auto snapshot = registry_.load(config_.sources);
    SWITCHYARD_LOG_INFO(Core, "switchyard ready with " + std::to_string(snapshot->size()) +
                                  " handlers, " + std::to_string(table_->size()) +
                                  " implementations");
  }
}

std::unique_ptr<Switchyard> Switchyard::fromConfigFile(const std::filesystem::path &path,
                                                       internal::handler::HandlerTable table) {
  return std::make_unique<Switchyard>(internal::config::loadEngineConfig(path), std::move(table));
}

internal::execution::AggregatedResponse Switchyard::process(std::string_view input,
                                                            const std::vector<std::string> &hints) {
  return engine_.process(input, hints);
}

void Switchyard::load(std::vector<internal::registry::DescriptorSource> sources) {
  registry_.load(sources);
  config_.sources = std::move(sources);
}

internal::registry::ReloadReport Switchyard::reload() { return registry_.reload(); }

internal::execution::EngineStatus Switchyard::getStatus() const { return engine_.getStatus(); }

} // namespace switchyard::user::engine
