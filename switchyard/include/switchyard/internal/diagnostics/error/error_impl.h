#pragma once

#include <cstdio>
#include <cstdlib>
#include <exception>
#include <functional>
#include <utility>

namespace switchyard::internal::diagnostics::error {

inline const char* SwitchyardErrorCategory::name() const noexcept { return "switchyard"; }

inline std::string SwitchyardErrorCategory::message(int condition) const {
    switch (static_cast<SwitchyardErrc>(condition)) {
        case SwitchyardErrc::Success:
            return "success";
        case SwitchyardErrc::Unknown:
            return "unknown error";
        case SwitchyardErrc::InvalidArgument:
            return "invalid argument";
        case SwitchyardErrc::InvalidState:
            return "invalid state";
        case SwitchyardErrc::MalformedDescriptor:
            return "malformed descriptor";
        case SwitchyardErrc::InputTooLarge:
            return "input too large";
        case SwitchyardErrc::CircuitOpen:
            return "circuit open";
        case SwitchyardErrc::TimedOut:
            return "timed out";
        case SwitchyardErrc::RetryExhausted:
            return "retry exhausted";
        case SwitchyardErrc::HandlerFatal:
            return "handler fatal";
        case SwitchyardErrc::TransientFailure:
            return "transient failure";
        case SwitchyardErrc::MalformedPayload:
            return "malformed payload";
        case SwitchyardErrc::HandlerNotFound:
            return "handler not found";
        case SwitchyardErrc::Cancelled:
            return "cancelled";
        case SwitchyardErrc::RegistryNotLoaded:
            return "registry not loaded";
        case SwitchyardErrc::ConfigInvalid:
            return "invalid configuration";
        default:
            return "unrecognized switchyard error";
    }
}

inline const std::error_category& switchyardErrorCategory() {
    static SwitchyardErrorCategory category;
    return category;
}

inline std::error_code makeErrorCode(SwitchyardErrc errc) {
    return {static_cast<int>(errc), switchyardErrorCategory()};
}

inline std::error_code make_error_code(SwitchyardErrc errc) {
    return makeErrorCode(errc);
}

inline SwitchyardError::SwitchyardError()
    : code_(makeErrorCode(SwitchyardErrc::Unknown)) {}

inline SwitchyardError::SwitchyardError(std::error_code ec, std::string message)
    : code_(std::move(ec)), message_(std::move(message)) {}

inline SwitchyardError::SwitchyardError(SwitchyardErrc errc, std::string message)
    : SwitchyardError(makeErrorCode(errc), std::move(message)) {}

inline SwitchyardErrc SwitchyardError::errc() const noexcept {
    if (code_.category() != switchyardErrorCategory()) {
        return SwitchyardErrc::Unknown;
    }
    return static_cast<SwitchyardErrc>(code_.value());
}

inline std::string_view SwitchyardError::detail() const noexcept {
    return message_;
}

inline std::string SwitchyardError::describe() const {
    const auto base = code_.message();
    if (message_.empty()) {
        return base;
    }
    std::string out;
    out.reserve(base.size() + 2 + message_.size());
    out.append(base);
    out.append(": ");
    out.append(message_);
    return out;
}

inline const std::error_code& SwitchyardError::code() const noexcept {
    return code_;
}

inline const std::string& SwitchyardError::message() const noexcept {
    return message_;
}

inline void SwitchyardError::setCode(std::error_code ec) {
    code_ = std::move(ec);
}

inline void SwitchyardError::setCode(SwitchyardErrc errc) {
    code_ = makeErrorCode(errc);
}

inline void SwitchyardError::setMessage(std::string message) {
    message_ = std::move(message);
}

inline SwitchyardException::SwitchyardException(SwitchyardError error)
    : std::system_error(error.code(), error.message()), error_(std::move(error)) {}

inline SwitchyardError makeError(SwitchyardErrc errc, std::string message) {
    return SwitchyardError(errc, std::move(message));
}

inline SwitchyardError makeError(std::error_code ec, std::string message) {
    return SwitchyardError(std::move(ec), std::move(message));
}

inline void throwError(const SwitchyardError& error) {
    throw SwitchyardException(error);
}

inline void throwError(SwitchyardErrc errc, std::string message) {
    throwError(makeError(errc, std::move(message)));
}

inline void throwError(std::error_code ec, std::string message) {
    throwError(makeError(std::move(ec), std::move(message)));
}

inline void fatalError(const SwitchyardError& error) {
    const auto text = error.describe();
    std::fprintf(stderr, "[SWITCHYARD][fatal] %s\n", text.c_str());
    std::fflush(stderr);
    std::abort();
}

inline void fatalError(SwitchyardErrc errc, std::string message) {
    fatalError(makeError(errc, std::move(message)));
}

// ============================================================================
// SwitchyardResult<T>
// ============================================================================

template <typename T>
SwitchyardResult<T> SwitchyardResult<T>::success(T value) {
    SwitchyardResult result;
    result.value_.emplace(std::move(value));
    return result;
}

template <typename T>
SwitchyardResult<T> SwitchyardResult<T>::failure(SwitchyardErrc errc, std::string message) {
    return failure(makeError(errc, std::move(message)));
}

template <typename T>
SwitchyardResult<T> SwitchyardResult<T>::failure(SwitchyardError error) {
    SwitchyardResult result;
    result.error_.emplace(std::move(error));
    return result;
}

template <typename T>
bool SwitchyardResult<T>::has_value() const noexcept {
    return value_.has_value();
}

template <typename T>
bool SwitchyardResult<T>::has_error() const noexcept {
    return error_.has_value();
}

template <typename T>
T& SwitchyardResult<T>::value() & {
    if (!value_) {
        throwError(error());
    }
    return *value_;
}

template <typename T>
const T& SwitchyardResult<T>::value() const& {
    if (!value_) {
        throwError(error());
    }
    return *value_;
}

template <typename T>
T&& SwitchyardResult<T>::value() && {
    if (!value_) {
        throwError(error());
    }
    return std::move(*value_);
}

template <typename T>
template <typename U>
T SwitchyardResult<T>::value_or(U&& default_value) const& {
    if (value_) {
        return *value_;
    }
    return static_cast<T>(std::forward<U>(default_value));
}

template <typename T>
SwitchyardError SwitchyardResult<T>::error() const {
    if (error_) {
        return *error_;
    }
    return makeError(SwitchyardErrc::InvalidState, "result holds a value");
}

// ============================================================================
// SwitchyardResult<void>
// ============================================================================

inline SwitchyardResult<void> SwitchyardResult<void>::success() {
    return SwitchyardResult{};
}

inline SwitchyardResult<void> SwitchyardResult<void>::failure(SwitchyardErrc errc,
                                                              std::string message) {
    return failure(makeError(errc, std::move(message)));
}

inline SwitchyardResult<void> SwitchyardResult<void>::failure(SwitchyardError error) {
    SwitchyardResult result;
    result.error_.emplace(std::move(error));
    return result;
}

inline bool SwitchyardResult<void>::has_value() const noexcept {
    return !error_.has_value();
}

inline bool SwitchyardResult<void>::has_error() const noexcept {
    return error_.has_value();
}

inline void SwitchyardResult<void>::value() const {
    if (error_) {
        throwError(*error_);
    }
}

inline SwitchyardError SwitchyardResult<void>::error() const {
    if (error_) {
        return *error_;
    }
    return makeError(SwitchyardErrc::InvalidState, "result holds a value");
}

// ============================================================================
// captureResult / unwrapOrThrow
// ============================================================================

template <typename Fn>
auto captureResult(Fn&& fn) -> SwitchyardResult<std::invoke_result_t<Fn>> {
    using R = std::invoke_result_t<Fn>;
    try {
        if constexpr (std::is_void_v<R>) {
            std::invoke(std::forward<Fn>(fn));
            return SwitchyardResult<void>::success();
        } else {
            return SwitchyardResult<R>::success(std::invoke(std::forward<Fn>(fn)));
        }
    } catch (const SwitchyardException& ex) {
        return SwitchyardResult<R>::failure(ex.error());
    } catch (const std::system_error& ex) {
        return SwitchyardResult<R>::failure(makeError(ex.code(), ex.what()));
    } catch (const std::exception& ex) {
        return SwitchyardResult<R>::failure(SwitchyardErrc::Unknown, ex.what());
    } catch (...) {
        return SwitchyardResult<R>::failure(SwitchyardErrc::Unknown, "non-standard exception");
    }
}

template <typename T>
T unwrapOrThrow(SwitchyardResult<T>&& result) {
    if (result.has_error()) {
        throwError(result.error());
    }
    return std::move(result).value();
}

inline void unwrapOrThrow(SwitchyardResult<void>&& result) {
    result.value();
}

}  // namespace switchyard::internal::diagnostics::error
