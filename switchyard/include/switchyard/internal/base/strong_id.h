#pragma once

#include <compare>
#include <cstdint>
#include <type_traits>

namespace switchyard::internal::base {

template <class Tag, class T = std::uint64_t>
struct StrongId {
    using underlying_type = T;

    T value{};

    constexpr StrongId() = default;
    explicit constexpr StrongId(T v) noexcept : value(v) {}

    constexpr auto operator<=>(const StrongId&) const = default;
    explicit constexpr operator T() const noexcept { return value; }

    static constexpr StrongId invalid() noexcept { return StrongId{static_cast<T>(~T{})}; }
    constexpr bool isValid() const noexcept { return value != static_cast<T>(~T{}); }
};

struct TaskTag {};
struct RequestTag {};

/// Identifies one Task (one handler invocation scheduled by a request).
using TaskId = StrongId<TaskTag, std::uint64_t>;
/// Identifies one ExecutionEngine::process call.
using RequestId = StrongId<RequestTag, std::uint64_t>;

static_assert(sizeof(TaskId) == sizeof(std::uint64_t));
static_assert(sizeof(RequestId) == sizeof(std::uint64_t));
static_assert(std::is_trivially_copyable_v<TaskId>);

} // namespace switchyard::internal::base
