#include "switchyard/internal/handler/category.h"

#include <gtest/gtest.h>

#include <set>
#include <string_view>

namespace handler = switchyard::internal::handler;

TEST(CategoryBasic, EnumOrderMatchesYaml) {
    EXPECT_EQ(handler::toIndex(handler::Category::Security), 0u);
    EXPECT_EQ(handler::toIndex(handler::Category::Performance), 1u);
    EXPECT_EQ(handler::toIndex(handler::Category::Specialized), handler::kCategoryCount - 1);
    EXPECT_EQ(handler::kCategoryCount, 8u);
}

TEST(CategoryBasic, AllCategoriesCoversEveryIndex) {
    const auto all = handler::allCategories();
    ASSERT_EQ(all.size(), handler::kCategoryCount);
    for (std::size_t i = 0; i < all.size(); ++i) {
        EXPECT_EQ(handler::toIndex(all[i]), i);
        EXPECT_TRUE(handler::isValidIndex(i));
    }
    EXPECT_FALSE(handler::isValidIndex(handler::kCategoryCount));
}

TEST(CategoryMetadata, KeysAreLowercaseAndUnique) {
    std::set<std::string_view> keys;
    for (const auto category : handler::allCategories()) {
        const auto key = handler::keyOf(category);
        ASSERT_FALSE(key.empty());
        for (char ch : key) {
            EXPECT_FALSE(ch >= 'A' && ch <= 'Z') << key;
        }
        EXPECT_TRUE(keys.insert(key).second) << key;
    }
}

TEST(CategoryMetadata, DisplayNameAndDescriptionMatchYaml) {
    EXPECT_EQ(handler::keyOf(handler::Category::Hardware), "hardware");
    EXPECT_EQ(handler::displayNameOf(handler::Category::Infrastructure), "Infrastructure");
    EXPECT_EQ(handler::descriptionOf(handler::Category::Security),
              "Audits, vulnerability scanning, hardening");
}

TEST(CategoryParse, AcceptsKeysCaseInsensitively) {
    EXPECT_EQ(handler::parseCategory("security"), handler::Category::Security);
    EXPECT_EQ(handler::parseCategory("DATA"), handler::Category::Data);
    EXPECT_EQ(handler::parseCategory("Platform"), handler::Category::Platform);
}

TEST(CategoryParse, RejectsUnknownKeys) {
    EXPECT_FALSE(handler::parseCategory("").has_value());
    EXPECT_FALSE(handler::parseCategory("securit").has_value());
    EXPECT_FALSE(handler::parseCategory("quantum").has_value());
}

TEST(CategoryParse, DefaultCategoryIsSpecialized) {
    EXPECT_EQ(handler::kDefaultCategory, handler::Category::Specialized);
}
