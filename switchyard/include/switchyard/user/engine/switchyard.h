#pragma once

/**
 * @file switchyard.h
 * @brief Assembled routing and dispatch engine.
 */

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "switchyard/internal/base/clock.h"
#include "switchyard/internal/breaker/circuit_breaker.h"
#include "switchyard/internal/cache/result_cache.h"
#include "switchyard/internal/config/engine_config.h"
#include "switchyard/internal/dispatch/tandem_dispatcher.h"
#include "switchyard/internal/execution/execution_engine.h"
#include "switchyard/internal/handler/handler_table.h"
#include "switchyard/internal/registry/handler_registry.h"

namespace switchyard::user::engine {

/**
 * @brief Owns one registry, cache, breaker, dispatcher and execution engine.
 *
 * Nothing is process-global: two Switchyard instances share no state.
 *
 * @par Usage
 * @code
 * #include <switchyard/user/engine/switchyard.h>
 *
 * namespace handler = ::switchyard::internal::handler;
 *
 * handler::HandlerTable table;
 * handler::registerAllHandlers(table);
 * auto yard = ::switchyard::user::engine::Switchyard::fromConfigFile(
 *     "configs/switchyard.yml", std::move(table));
 * auto response = yard->process("audit the login flow for vulnerabilities");
 * @endcode
 */
class Switchyard {
public:
  /**
   * @brief Build every component from `config`.
   *
   * Capabilities are detected here, once. When `config.sources` is not
   * empty the registry is loaded immediately.
   *
   * @throws SwitchyardException MalformedDescriptor if the initial load fails.
   */
  Switchyard(::switchyard::internal::config::EngineConfig config,
             ::switchyard::internal::handler::HandlerTable table,
             ::switchyard::internal::base::ClockFn clock =
                 ::switchyard::internal::base::steadyClock());

  /// @throws SwitchyardException ConfigInvalid or MalformedDescriptor.
  static std::unique_ptr<Switchyard>
  fromConfigFile(const std::filesystem::path &path,
                 ::switchyard::internal::handler::HandlerTable table);

  Switchyard(const Switchyard &) = delete;
  Switchyard &operator=(const Switchyard &) = delete;

  /// @copydoc ::switchyard::internal::execution::ExecutionEngine::process
  ::switchyard::internal::execution::AggregatedResponse
  process(std::string_view input, const std::vector<std::string> &hints = {});

  /**
   * @brief Replace the descriptor sources and load them.
   *
   * @throws SwitchyardException MalformedDescriptor; the active registry is kept.
   */
  void load(std::vector<::switchyard::internal::registry::DescriptorSource> sources);

  /// Re-read the current sources; never throws for descriptor problems.
  ::switchyard::internal::registry::ReloadReport reload();

  [[nodiscard]] ::switchyard::internal::execution::EngineStatus getStatus() const;

  [[nodiscard]] const ::switchyard::internal::config::EngineConfig &config() const noexcept {
    return config_;
  }
  [[nodiscard]] ::switchyard::internal::registry::HandlerRegistry &registry() noexcept {
    return registry_;
  }
  [[nodiscard]] ::switchyard::internal::breaker::CircuitBreaker &breaker() noexcept {
    return breaker_;
  }
  [[nodiscard]] ::switchyard::internal::cache::ResultCache &cache() noexcept { return cache_; }

private:
  ::switchyard::internal::config::EngineConfig config_;
  std::shared_ptr<const ::switchyard::internal::handler::HandlerTable> table_;
  ::switchyard::internal::registry::HandlerRegistry registry_;
  ::switchyard::internal::cache::ResultCache cache_;
  ::switchyard::internal::breaker::CircuitBreaker breaker_;
  ::switchyard::internal::dispatch::TandemDispatcher dispatcher_;
  ::switchyard::internal::execution::ExecutionEngine engine_;
};

} // namespace switchyard::user::engine
