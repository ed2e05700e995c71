#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stop_token>
#include <utility>

namespace switchyard::internal::base {

/**
 * @brief Read side of a cancellation signal.
 *
 * A default-constructed token can never be cancelled.
 */
class CancellationToken {
public:
  CancellationToken() = default;
  explicit CancellationToken(std::stop_token token) : token_(std::move(token)) {}

  [[nodiscard]] bool cancelled() const noexcept {
    return token_.stop_requested();
  }

  [[nodiscard]] const std::stop_token &stopToken() const noexcept {
    return token_;
  }

  /**
   * @brief Sleep for `duration` unless cancelled first.
   *
   * @return true if the full duration elapsed, false if cancelled.
   */
  template <typename Rep, typename Period>
  bool waitFor(std::chrono::duration<Rep, Period> duration) const {
    if (cancelled()) {
      return false;
    }
    std::mutex mutex;
    std::condition_variable_any cv;
    std::unique_lock<std::mutex> lock(mutex);
    cv.wait_for(lock, token_, duration, [] { return false; });
    return !cancelled();
  }

private:
  std::stop_token token_{};
};

/**
 * @brief Write side of a cancellation signal.
 */
class CancellationSource {
public:
  CancellationSource() = default;

  CancellationSource(const CancellationSource &) = delete;
  CancellationSource &operator=(const CancellationSource &) = delete;

  [[nodiscard]] CancellationToken token() const {
    return CancellationToken(source_.get_token());
  }

  /// @return true if this call performed the cancellation.
  bool cancel() noexcept { return source_.request_stop(); }

  [[nodiscard]] bool cancelled() const noexcept {
    return source_.stop_requested();
  }

private:
  std::stop_source source_{};
};

} // namespace switchyard::internal::base
