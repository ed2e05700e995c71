#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>

namespace switchyard::internal::diagnostics::error {

/**
 * @brief switchyard error codes.
 *
 * The first block covers generic library failures. The second block is the
 * routing and dispatch taxonomy reported per handler inside a response.
 */
enum class SwitchyardErrc {
    Success = 0,              ///< Success
    Unknown = 1,              ///< Unclassified failure
    InvalidArgument = 2,      ///< Caller passed an invalid argument
    InvalidState = 3,         ///< Object is in an invalid state

    // Routing and dispatch
    MalformedDescriptor = 4,  ///< Handler descriptor is missing fields or collides
    InputTooLarge = 5,        ///< Input text exceeds the configured limit
    CircuitOpen = 6,          ///< Handler circuit is open; call was not attempted
    TimedOut = 7,             ///< Deadline elapsed before the handler finished
    RetryExhausted = 8,       ///< Fallback path ran out of attempts
    HandlerFatal = 9,         ///< Handler declared a non-retryable condition
    TransientFailure = 10,    ///< Retryable failure (transient I/O etc.)
    MalformedPayload = 11,    ///< Handler rejected the payload
    HandlerNotFound = 12,     ///< Name has no descriptor or implementation
    Cancelled = 13,           ///< Cancelled through the task token
    RegistryNotLoaded = 14,   ///< No descriptor snapshot has been published
    ConfigInvalid = 15,       ///< Engine configuration is invalid
};

/**
 * @brief error_category for switchyard.
 */
class SwitchyardErrorCategory : public std::error_category {
public:
    /// Category name.
    const char* name() const noexcept override;

    /// Message for a given code.
    std::string message(int condition) const override;
};

/// @brief Return the category singleton.
const std::error_category& switchyardErrorCategory();

/// @brief Build a std::error_code in the switchyard category.
std::error_code makeErrorCode(SwitchyardErrc errc);

/// @brief ADL hook required by std::is_error_code_enum.
std::error_code make_error_code(SwitchyardErrc errc);

/**
 * @brief switchyard error value.
 *
 * Holds a `std::error_code` (SwitchyardErrc + category) and an optional
 * detail message. Both thrown errors and returned results go through it.
 */
class SwitchyardError {
public:
    SwitchyardError();
    SwitchyardError(std::error_code ec, std::string message = {});
    SwitchyardError(SwitchyardErrc errc, std::string message = {});

    /// Error kind.
    SwitchyardErrc errc() const noexcept;

    /// Detail message (may be empty).
    std::string_view detail() const noexcept;

    /// Category message joined with the detail.
    std::string describe() const;

    const std::error_code& code() const noexcept;

    const std::string& message() const noexcept;

    void setCode(std::error_code ec);
    void setCode(SwitchyardErrc errc);
    void setMessage(std::string message);

private:
    std::error_code code_;
    std::string message_;
};

/**
 * @brief Exception type thrown by throwError.
 *
 * Derives from std::system_error so callers can catch the standard type and
 * still read `code()`. The original SwitchyardError is kept intact.
 */
class SwitchyardException : public std::system_error {
public:
    explicit SwitchyardException(SwitchyardError error);

    const SwitchyardError& error() const noexcept { return error_; }

private:
    SwitchyardError error_;
};

/// @brief Error construction helpers.
SwitchyardError makeError(SwitchyardErrc errc, std::string message = {});
SwitchyardError makeError(std::error_code ec, std::string message = {});

/// @brief Throw helpers. Always throw SwitchyardException.
[[noreturn]] void throwError(const SwitchyardError& error);
[[noreturn]] void throwError(SwitchyardErrc errc, std::string message = {});
[[noreturn]] void throwError(std::error_code ec, std::string message = {});

/// @brief Fatal error. Writes the description to stderr and aborts.
[[noreturn]] void fatalError(const SwitchyardError& error);
[[noreturn]] void fatalError(SwitchyardErrc errc, std::string message = {});

/**
 * @brief Value-or-error result type.
 */
template <typename T>
class SwitchyardResult {
public:
    using value_type = T;

    static SwitchyardResult success(T value);
    static SwitchyardResult failure(SwitchyardErrc errc, std::string message = {});
    static SwitchyardResult failure(SwitchyardError error);

    bool has_value() const noexcept;
    bool has_error() const noexcept;
    explicit operator bool() const noexcept { return has_value(); }

    T& value() &;
    const T& value() const&;
    T&& value() &&;

    template <typename U>
    T value_or(U&& default_value) const&;

    SwitchyardError error() const;

private:
    SwitchyardResult() = default;

    std::optional<T> value_;
    std::optional<SwitchyardError> error_;
};

template <>
class SwitchyardResult<void> {
public:
    using value_type = void;

    static SwitchyardResult success();
    static SwitchyardResult failure(SwitchyardErrc errc, std::string message = {});
    static SwitchyardResult failure(SwitchyardError error);

    bool has_value() const noexcept;
    bool has_error() const noexcept;
    explicit operator bool() const noexcept { return has_value(); }

    void value() const;

    SwitchyardError error() const;

private:
    SwitchyardResult() = default;

    std::optional<SwitchyardError> error_;
};

/**
 * @brief Run a callable and convert any exception into a result.
 *
 * SwitchyardException keeps its error, other std::system_error keep their
 * code, and anything else becomes SwitchyardErrc::Unknown.
 */
template <typename Fn>
auto captureResult(Fn&& fn) -> SwitchyardResult<std::invoke_result_t<Fn>>;

/**
 * @brief Extract the value or throw the held error.
 */
template <typename T>
T unwrapOrThrow(SwitchyardResult<T>&& result);

/// @copydoc unwrapOrThrow(SwitchyardResult<T>&&)
void unwrapOrThrow(SwitchyardResult<void>&& result);

}  // namespace switchyard::internal::diagnostics::error

namespace std {

template <>
struct is_error_code_enum<switchyard::internal::diagnostics::error::SwitchyardErrc> : true_type {};

}  // namespace std

#include "switchyard/internal/diagnostics/error/error_impl.h"
