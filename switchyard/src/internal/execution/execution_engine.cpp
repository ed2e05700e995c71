#include "switchyard/internal/execution/execution_engine.h"

#include <algorithm>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

#include "switchyard/internal/diagnostics/log/log.h"
#include "switchyard/internal/router/text_normalizer.h"

namespace switchyard::internal::execution {

namespace errs = ::switchyard::internal::diagnostics::error;

namespace {

/// Completion state shared between process() and the tasks it submitted.
struct CallState {
  explicit CallState(std::size_t count) : outcomes(count), remaining(count) {}

  void complete(std::size_t index, HandlerOutcome outcome) {
    SWITCHYARD_ASSERT(index < outcomes.size(), "task index outside its request");
    {
      std::lock_guard<std::mutex> lock(mutex);
      if (closed || outcomes[index]) {
        return;
      }
      outcomes[index] = std::move(outcome);
      --remaining;
    }
    cv.notify_all();
  }

  std::mutex mutex;
  std::condition_variable cv;
  std::vector<std::optional<HandlerOutcome>> outcomes;
  std::size_t remaining;
  /// Set once process() stops waiting; later completions are dropped.
  bool closed{false};
  base::CancellationSource cancel;
};

HandlerOutcome timedOutOutcome(const std::string &handler) {
  HandlerOutcome outcome;
  outcome.handler = handler;
  outcome.status = OutcomeStatus::TimedOut;
  outcome.error_kind = errs::SwitchyardErrc::TimedOut;
  outcome.message = "'" + handler + "' did not finish before the call deadline";
  return outcome;
}

/// Put hinted handlers at the front of the ranking and refresh the category summary.
void applyHints(router::MatchResult &match, const registry::RegistrySnapshot &snapshot,
                const std::vector<std::string> &hints, std::vector<HandlerOutcome> &unknown) {
  double top = match.candidates.empty() ? 1.0 : match.candidates.front().score;
  std::vector<router::Candidate> hinted;
  for (const std::string &hint : hints) {
    const handler::HandlerDescriptor *descriptor = snapshot.find(hint);
    if (descriptor == nullptr) {
      HandlerOutcome outcome;
      outcome.handler = hint;
      outcome.error_kind = errs::SwitchyardErrc::HandlerNotFound;
      outcome.message = "hinted handler '" + hint + "' is not registered";
      unknown.push_back(std::move(outcome));
      continue;
    }
    const bool seen = std::any_of(hinted.begin(), hinted.end(),
                                  [&](const router::Candidate &c) { return c.name == hint; });
    if (seen) {
      continue;
    }
    const auto it = std::find_if(match.candidates.begin(), match.candidates.end(),
                                 [&](const router::Candidate &c) { return c.name == hint; });
    if (it != match.candidates.end()) {
      top = std::max(top, it->score);
      match.candidates.erase(it);
    }
    hinted.push_back(router::Candidate{descriptor->name, 0.0, descriptor->priority,
                                       descriptor->category});
  }
  for (auto &candidate : hinted) {
    candidate.score = top;
  }
  match.candidates.insert(match.candidates.begin(), hinted.begin(), hinted.end());
  router::summarizeCategories(match, snapshot.trie.config().parallel_threshold);
}

} // namespace

ExecutionEngine::ExecutionEngine(registry::HandlerRegistry &registry, cache::ResultCache &cache,
                                 breaker::CircuitBreaker &breaker,
                                 dispatch::TandemDispatcher &dispatcher, ExecutionConfig config)
    : registry_(registry), cache_(cache), breaker_(breaker), dispatcher_(dispatcher),
      config_(config), profiler_(config.latency_window), pool_(config.worker_count) {}

ExecutionEngine::~ExecutionEngine() { pool_.shutdown(); }

AggregatedResponse ExecutionEngine::process(std::string_view input,
                                            const std::vector<std::string> &hints) {
  const auto started = base::Clock::now();
  const std::shared_ptr<const registry::RegistrySnapshot> snapshot = registry_.current();
  router::MatchResult match = snapshot->trie.match(input);

  AggregatedResponse response;
  response.request_id = base::RequestId{next_request_id_.fetch_add(1, std::memory_order_relaxed)};
  response.generation = snapshot->generation;
  requests_.fetch_add(1, std::memory_order_relaxed);

  std::vector<HandlerOutcome> unknown_hints;
  if (!hints.empty()) {
    applyHints(match, *snapshot, hints, unknown_hints);
  }

  response.matched_keywords = std::move(match.matched_keywords);
  response.candidates = std::move(match.candidates);
  response.categories = std::move(match.categories);
  response.suggests_parallel = match.suggests_parallel;
  response.workflow = std::move(match.workflow);
  response.coordinator_added = match.coordinator_added;

  const std::size_t fan_out = std::min(response.candidates.size(), config_.max_fan_out);
  if (fan_out == 0) {
    response.outcomes = std::move(unknown_hints);
    response.elapsed =
        std::chrono::duration_cast<std::chrono::microseconds>(base::Clock::now() - started);
    SWITCHYARD_LOG_DEBUG(Engine, "request " + std::to_string(response.request_id.value) +
                                     " matched no handlers");
    return response;
  }

  auto payload = std::make_shared<handler::HandlerPayload>();
  payload->input = std::string(input);
  payload->normalized_input = router::normalize(input);
  payload->matched_keywords = response.matched_keywords;
  payload->workflow = response.workflow.value_or(std::string());

  auto state = std::make_shared<CallState>(fan_out);
  const base::CancellationToken token = state->cancel.token();
  for (std::size_t i = 0; i < fan_out; ++i) {
    const router::Candidate &candidate = response.candidates[i];
    const handler::HandlerDescriptor *descriptor = snapshot->find(candidate.name);
    const handler::ExecutionMode mode =
        descriptor != nullptr ? descriptor->execution_mode : handler::ExecutionMode::Intelligent;

    Task task;
    task.id = base::TaskId{next_task_id_.fetch_add(1, std::memory_order_relaxed)};
    task.handler_name = candidate.name;
    task.payload = payload;
    task.priority = candidate.priority;
    task.submitted_at = base::Clock::now();

    pool_.submit(std::move(task), token,
                 [this, state, i, mode](const Task &t, const base::CancellationToken &cancel) {
                   state->complete(i, runTask(t, mode, cancel));
                 });
  }

  const auto deadline = started + config_.call_timeout;
  bool timed_out = false;
  {
    std::unique_lock<std::mutex> lock(state->mutex);
    state->cv.wait_until(lock, deadline, [&] { return state->remaining == 0; });
    timed_out = state->remaining != 0;
    state->closed = true;
    for (std::size_t i = 0; i < fan_out; ++i) {
      if (state->outcomes[i]) {
        response.outcomes.push_back(std::move(*state->outcomes[i]));
      } else {
        response.outcomes.push_back(timedOutOutcome(response.candidates[i].name));
      }
    }
  }
  if (timed_out) {
    state->cancel.cancel();
    SWITCHYARD_LOG_WARN(Engine, "request " + std::to_string(response.request_id.value) +
                                    " hit its deadline; outstanding tasks cancelled");
  }

  for (auto &outcome : unknown_hints) {
    response.outcomes.push_back(std::move(outcome));
  }
  response.elapsed =
      std::chrono::duration_cast<std::chrono::microseconds>(base::Clock::now() - started);
  return response;
}

HandlerOutcome ExecutionEngine::runTask(const Task &task, handler::ExecutionMode mode,
                                        const base::CancellationToken &cancel) {
  HandlerOutcome outcome;
  outcome.handler = task.handler_name;
  if (cancel.cancelled()) {
    return timedOutOutcome(task.handler_name);
  }

  const breaker::Admission admission = breaker_.acquire(task.handler_name);
  if (admission == breaker::Admission::Rejected) {
    outcome.status = OutcomeStatus::CircuitOpen;
    outcome.error_kind = errs::SwitchyardErrc::CircuitOpen;
    outcome.message = "circuit for '" + task.handler_name + "' is open";
    return outcome;
  }

  const cache::CacheKey key{task.payload->normalized_input, task.handler_name};
  if (auto cached = cache_.get(key)) {
    if (admission == breaker::Admission::Trial) {
      breaker_.releaseTrial(task.handler_name);
    }
    outcome.status = OutcomeStatus::Cached;
    outcome.value = std::move(*cached);
    return outcome;
  }

  dispatch::DispatchOutcome result =
      dispatcher_.invoke(task.handler_name, *task.payload, cancel, mode);
  outcome.path = result.path;
  outcome.attempts = result.attempts;
  outcome.latency = result.latency;
  outcome.degraded = result.degraded;

  const errs::SwitchyardErrc kind = result.errorKind();
  if (kind != errs::SwitchyardErrc::Cancelled && kind != errs::SwitchyardErrc::HandlerNotFound) {
    profiler_.record(result.latency, result.success);
  }

  if (result.success) {
    breaker_.recordSuccess(task.handler_name);
    cache_.put(key, result.value);
    outcome.status = OutcomeStatus::Success;
    outcome.value = std::move(result.value);
    return outcome;
  }

  if (kind == errs::SwitchyardErrc::Cancelled) {
    if (admission == breaker::Admission::Trial) {
      breaker_.releaseTrial(task.handler_name);
    }
    outcome.status = OutcomeStatus::TimedOut;
    outcome.error_kind = errs::SwitchyardErrc::TimedOut;
    outcome.message = result.error->describe();
    return outcome;
  }

  if (kind == errs::SwitchyardErrc::HandlerNotFound) {
    if (admission == breaker::Admission::Trial) {
      breaker_.releaseTrial(task.handler_name);
    }
  } else {
    breaker_.recordFailure(task.handler_name);
  }
  outcome.status = OutcomeStatus::Error;
  outcome.error_kind = kind;
  outcome.message = result.error ? result.error->describe() : std::string();
  SWITCHYARD_LOG_WARN(Engine, "'" + task.handler_name + "' failed: " + outcome.message);
  return outcome;
}

EngineStatus ExecutionEngine::getStatus() const {
  EngineStatus status;
  if (const auto snapshot = registry_.snapshot()) {
    status.generation = snapshot->generation;
    status.handler_count = snapshot->size();
  }
  status.fast_path_available = dispatcher_.capabilities().fast_path;
  status.fast_path_detail = dispatcher_.capabilities().detail;
  status.cache = cache_.stats();
  status.circuits = breaker_.inspectAll();
  status.pool = pool_.stats();
  status.latency = profiler_.summary();
  status.requests = requests_.load(std::memory_order_relaxed);
  return status;
}

} // namespace switchyard::internal::execution
