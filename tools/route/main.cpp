// switchyard_route: route free text through a configured engine.
//
// Usage: switchyard_route [--config <switchyard.yml>] [--hint <HANDLER>]...
//                         [--status] [text...]
// Without text arguments each non-empty stdin line is routed.

#include <chrono>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "switchyard/internal/diagnostics/error/error.h"
#include "switchyard/internal/handler/category.h"
#include "switchyard/internal/handler/handler_auto_registry.h"
#include "switchyard/internal/handler/handler_table.h"
#include "switchyard/user/engine/switchyard.h"

namespace {

namespace fs = std::filesystem;
namespace internal = ::switchyard::internal;
using ::switchyard::user::engine::Switchyard;

constexpr std::string_view kDefaultConfig = "configs/switchyard.yml";

struct Options {
  fs::path config{std::string(kDefaultConfig)};
  std::vector<std::string> hints;
  std::vector<std::string> texts;
  bool status{false};
};

void printUsage(std::ostream &os) {
  os << "Usage: switchyard_route [--config <switchyard.yml>] [--hint <HANDLER>]... "
        "[--status] [text...]\n";
}

bool parseArgs(int argc, char **argv, Options &options) {
  for (int i = 1; i < argc; ++i) {
    const std::string_view arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      printUsage(std::cout);
      std::exit(0);
    }
    if (arg == "--status") {
      options.status = true;
    } else if (arg == "--config" || arg == "--hint") {
      if (i + 1 >= argc) {
        std::cerr << "missing value for " << arg << "\n";
        return false;
      }
      if (arg == "--config") {
        options.config = argv[++i];
      } else {
        options.hints.emplace_back(argv[++i]);
      }
    } else if (arg.size() > 1 && arg.front() == '-') {
      std::cerr << "unknown option " << arg << "\n";
      return false;
    } else {
      options.texts.emplace_back(arg);
    }
  }
  return true;
}

std::string formatMillis(std::chrono::microseconds us) {
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(2) << static_cast<double>(us.count()) / 1000.0 << "ms";
  return oss.str();
}

void printResponse(const internal::execution::AggregatedResponse &response) {
  std::cout << "request " << response.request_id.value << " (generation "
            << response.generation << ", " << formatMillis(response.elapsed) << ")\n";
  std::cout << "  keywords:";
  for (const auto &keyword : response.matched_keywords) {
    std::cout << " [" << keyword << "]";
  }
  std::cout << "\n  categories:";
  for (const auto category : response.categories) {
    std::cout << ' ' << internal::handler::keyOf(category);
  }
  std::cout << "\n";
  if (response.workflow) {
    std::cout << "  workflow: " << *response.workflow << "\n";
  }
  if (response.suggests_parallel) {
    std::cout << "  parallel coordination recommended\n";
  }
  for (const auto &candidate : response.candidates) {
    std::cout << "  candidate " << std::left << std::setw(16) << candidate.name
              << " score " << std::fixed << std::setprecision(2) << candidate.score
              << " priority " << candidate.priority << "\n";
  }
  for (const auto &outcome : response.outcomes) {
    std::cout << "  -> " << outcome.handler << " " << internal::execution::toString(outcome.status);
    if (outcome.path != internal::dispatch::ExecutionPath::None) {
      std::cout << " via " << internal::dispatch::toString(outcome.path) << " ("
                << outcome.attempts << " attempt" << (outcome.attempts == 1 ? "" : "s") << ", "
                << formatMillis(outcome.latency) << (outcome.degraded ? ", degraded" : "")
                << ")";
    }
    std::cout << "\n     " << (outcome.ok() ? outcome.value : outcome.message) << "\n";
  }
}

void printStatus(const internal::execution::EngineStatus &status) {
  std::cout << "generation:      " << status.generation << "\n"
            << "handlers:        " << status.handler_count << "\n"
            << "fast path:       " << (status.fast_path_available ? "available" : "unavailable")
            << " (" << status.fast_path_detail << ")\n"
            << "requests:        " << status.requests << "\n"
            << "cache:           " << status.cache.size << " entries, hit rate " << std::fixed
            << std::setprecision(2) << status.cache.hitRate() * 100.0 << "%\n"
            << "pool:            " << status.pool.slots << " slots, " << status.pool.queued
            << " queued, " << status.pool.running << " running, peak "
            << status.pool.peak_running << "\n"
            << "latency:         p50 " << formatMillis(status.latency.p50) << ", p95 "
            << formatMillis(status.latency.p95) << ", p99 " << formatMillis(status.latency.p99)
            << " (" << status.latency.successes << " ok, " << status.latency.errors
            << " failed)\n";
  for (const auto &circuit : status.circuits) {
    std::cout << "circuit " << std::left << std::setw(16) << circuit.handler << " "
              << internal::breaker::toString(circuit.status) << " failures "
              << circuit.consecutive_failures << "\n";
  }
}

} // namespace

int main(int argc, char **argv) try {
  Options options;
  if (!parseArgs(argc, argv, options)) {
    printUsage(std::cerr);
    return 2;
  }

  internal::handler::HandlerTable table;
  internal::handler::registerAllHandlers(table);
  std::unique_ptr<Switchyard> yard = Switchyard::fromConfigFile(options.config, std::move(table));

  const auto route = [&](const std::string &text) {
    printResponse(yard->process(text, options.hints));
  };
  if (!options.texts.empty()) {
    for (const auto &text : options.texts) {
      route(text);
    }
  } else if (!options.status) {
    std::string line;
    while (std::getline(std::cin, line)) {
      if (!line.empty()) {
        route(line);
      }
    }
  }

  if (options.status) {
    printStatus(yard->getStatus());
  }
  return 0;
} catch (const internal::diagnostics::error::SwitchyardException &e) {
  std::cerr << "switchyard_route error: " << e.error().describe() << "\n";
  return 1;
} catch (const std::exception &e) {
  std::cerr << "switchyard_route error: " << e.what() << "\n";
  return 1;
}
