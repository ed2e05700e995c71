#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "switchyard/internal/diagnostics/error/error.h"
#include "switchyard/internal/handler/handler_descriptor.h"
#include "switchyard/internal/registry/descriptor_loader.h"
#include "switchyard/internal/router/keyword_trie.h"

namespace switchyard::internal::registry {

/**
 * @brief Immutable result of one successful load.
 *
 * The descriptor table and the trie built from it always travel together, so
 * a reader holding a snapshot can never see a trie that does not match its
 * descriptors.
 */
struct RegistrySnapshot {
  std::uint64_t generation{0};
  std::vector<handler::HandlerDescriptor> descriptors;
  std::vector<handler::WorkflowRule> workflows;
  router::KeywordTrie trie;

  [[nodiscard]] const handler::HandlerDescriptor *find(std::string_view name) const;

  [[nodiscard]] std::size_t size() const noexcept { return descriptors.size(); }

private:
  friend class HandlerRegistry;
  std::map<std::string, std::size_t, std::less<>> index_;
};

/**
 * @brief Outcome of HandlerRegistry::reload.
 */
struct ReloadReport {
  bool success{false};
  /// Generation active after the call (unchanged on failure).
  std::uint64_t generation{0};
  std::size_t handler_count{0};
  std::optional<diagnostics::error::SwitchyardError> error;
};

/**
 * @brief Owns the active descriptor snapshot and rebuilds it on request.
 *
 * Readers call snapshot() and keep the returned pointer for as long as they
 * need a consistent view. Writers (load/reload) are serialized and publish a
 * new snapshot with a single atomic store; a failed load never replaces the
 * active snapshot.
 */
class HandlerRegistry {
public:
  explicit HandlerRegistry(router::RouterConfig router_config = {});

  HandlerRegistry(const HandlerRegistry &) = delete;
  HandlerRegistry &operator=(const HandlerRegistry &) = delete;

  /**
   * @brief Load `sources`, publish the result and remember the sources.
   *
   * @throws SwitchyardException MalformedDescriptor; the previously active
   *         snapshot and sources stay in place.
   */
  std::shared_ptr<const RegistrySnapshot> load(std::vector<DescriptorSource> sources);

  /**
   * @brief Re-read the remembered sources.
   *
   * Never throws for descriptor problems; they are returned in the report.
   */
  ReloadReport reload();

  /// Active snapshot, or nullptr before the first successful load.
  [[nodiscard]] std::shared_ptr<const RegistrySnapshot> snapshot() const noexcept;

  /**
   * @brief Active snapshot.
   *
   * @throws SwitchyardException RegistryNotLoaded before the first load.
   */
  [[nodiscard]] std::shared_ptr<const RegistrySnapshot> current() const;

  [[nodiscard]] bool loaded() const noexcept { return snapshot() != nullptr; }

  [[nodiscard]] std::uint64_t generation() const noexcept;

  [[nodiscard]] const router::RouterConfig &routerConfig() const noexcept {
    return router_config_;
  }

private:
  std::shared_ptr<const RegistrySnapshot> publish(DescriptorCatalog catalog);

  router::RouterConfig router_config_;
  std::mutex writer_mutex_;
  std::vector<DescriptorSource> sources_;
  std::uint64_t next_generation_{1};
  std::atomic<std::shared_ptr<const RegistrySnapshot>> snapshot_;
};

} // namespace switchyard::internal::registry
