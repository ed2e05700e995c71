#include "switchyard/internal/base/strong_id.h"

#include <gtest/gtest.h>

#include <cstdint>
#include <type_traits>

namespace base = switchyard::internal::base;

TEST(StrongId, BasicComparisonAndConversion) {
    base::TaskId task1{3};
    base::TaskId task2{3};
    base::TaskId task3{4};

    EXPECT_EQ(task1, task2);
    EXPECT_NE(task1, task3);
    EXPECT_EQ(static_cast<std::uint64_t>(task1), 3u);
    EXPECT_LT(task1, task3);
    EXPECT_TRUE(task1.isValid());
}

TEST(StrongId, InvalidHelper) {
    constexpr auto bad = base::RequestId::invalid();
    EXPECT_FALSE(bad.isValid());
    EXPECT_EQ(static_cast<std::uint64_t>(bad), ~std::uint64_t{0});
}

TEST(StrongId, TagsAreIndependent) {
    base::TaskId task{0};
    base::RequestId request{0};
    static_assert(!std::is_convertible_v<base::TaskId, base::RequestId>);
    static_assert(!std::is_convertible_v<base::RequestId, base::TaskId>);
    static_assert(!std::is_convertible_v<std::uint64_t, base::TaskId>);
    EXPECT_EQ(static_cast<std::uint64_t>(task), 0u);
    EXPECT_EQ(static_cast<std::uint64_t>(request), 0u);
}
