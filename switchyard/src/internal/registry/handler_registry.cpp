#include "switchyard/internal/registry/handler_registry.h"

#include <utility>

#include "switchyard/internal/diagnostics/error/error_macros.h"
#include "switchyard/internal/diagnostics/log/log.h"

namespace switchyard::internal::registry {

namespace diag = ::switchyard::internal::diagnostics::error;

const handler::HandlerDescriptor *RegistrySnapshot::find(std::string_view name) const {
  const auto it = index_.find(name);
  return it == index_.end() ? nullptr : &descriptors[it->second];
}

HandlerRegistry::HandlerRegistry(router::RouterConfig router_config)
    : router_config_(std::move(router_config)) {}

std::shared_ptr<const RegistrySnapshot>
HandlerRegistry::publish(DescriptorCatalog catalog) {
  auto snapshot = std::make_shared<RegistrySnapshot>();
  snapshot->trie = router::KeywordTrie::build(catalog.descriptors, catalog.workflows,
                                              router_config_);
  snapshot->descriptors = std::move(catalog.descriptors);
  snapshot->workflows = std::move(catalog.workflows);
  for (std::size_t i = 0; i < snapshot->descriptors.size(); ++i) {
    snapshot->index_.emplace(snapshot->descriptors[i].name, i);
  }
  snapshot->generation = next_generation_++;

  std::shared_ptr<const RegistrySnapshot> published = std::move(snapshot);
  snapshot_.store(published, std::memory_order_release);
  SWITCHYARD_LOG_INFO(Registry, "published generation " +
                                    std::to_string(published->generation) + " with " +
                                    std::to_string(published->size()) + " handlers");
  return published;
}

std::shared_ptr<const RegistrySnapshot>
HandlerRegistry::load(std::vector<DescriptorSource> sources) {
  std::lock_guard<std::mutex> lock(writer_mutex_);
  DescriptorCatalog catalog = loadDescriptors(sources);
  auto published = publish(std::move(catalog));
  sources_ = std::move(sources);
  return published;
}

ReloadReport HandlerRegistry::reload() {
  std::lock_guard<std::mutex> lock(writer_mutex_);
  ReloadReport report;

  auto catalog = diag::captureResult([this] { return loadDescriptors(sources_); });
  if (catalog.has_error()) {
    const auto active = snapshot_.load(std::memory_order_acquire);
    report.error = catalog.error();
    report.generation = active ? active->generation : 0;
    report.handler_count = active ? active->size() : 0;
    SWITCHYARD_LOG_ERROR(Registry, "reload rejected, keeping generation " +
                                       std::to_string(report.generation) + ": " +
                                       report.error->describe());
    return report;
  }

  const auto published = publish(std::move(catalog).value());
  report.success = true;
  report.generation = published->generation;
  report.handler_count = published->size();
  return report;
}

std::shared_ptr<const RegistrySnapshot> HandlerRegistry::snapshot() const noexcept {
  return snapshot_.load(std::memory_order_acquire);
}

std::shared_ptr<const RegistrySnapshot> HandlerRegistry::current() const {
  auto active = snapshot();
  SWITCHYARD_THROW_IF(active == nullptr, RegistryNotLoaded,
                      "no handler descriptors have been loaded");
  return active;
}

std::uint64_t HandlerRegistry::generation() const noexcept {
  const auto active = snapshot();
  return active ? active->generation : 0;
}

} // namespace switchyard::internal::registry
