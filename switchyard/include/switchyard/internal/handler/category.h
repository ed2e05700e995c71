#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

namespace switchyard::internal::handler {

/// @brief Handler categories.
///
/// The ordering matches `configs/handler/categories.yml`, so these values can
/// be used as direct indices into the generated metadata tables.
enum class Category : std::uint8_t {
#define HANDLER_CATEGORY(ID, KEY, DISPLAY_NAME, DESCRIPTION) ID,
#include <switchyard/handler/category.def>
#undef HANDLER_CATEGORY
    Count,
};

constexpr std::size_t toIndex(Category category) {
    return static_cast<std::size_t>(category);
}

inline constexpr std::size_t kCategoryCount = static_cast<std::size_t>(Category::Count);

}  // namespace switchyard::internal::handler

#include <switchyard/handler/category_tables.h>

namespace switchyard::internal::handler {

namespace tables = ::switchyard::generated::category_tables;

static_assert(kCategoryCount == tables::kCategoryCount,
              "Category enum size must match generated table size");

inline constexpr std::array<Category, kCategoryCount> kAllCategories = {
#define HANDLER_CATEGORY(ID, KEY, DISPLAY_NAME, DESCRIPTION) Category::ID,
#include <switchyard/handler/category.def>
#undef HANDLER_CATEGORY
};

constexpr bool isValidIndex(std::size_t index) {
    return index < kCategoryCount;
}

constexpr Category fromIndex(std::size_t index) {
    return static_cast<Category>(index);
}

/// Category assigned to descriptors that do not name one (`default:` in the YAML).
inline constexpr Category kDefaultCategory = fromIndex(tables::kDefaultCategoryIndex);
static_assert(isValidIndex(tables::kDefaultCategoryIndex));

/// @brief Lowercase key used in descriptors and responses (e.g. `"security"`).
constexpr std::string_view keyOf(Category category) {
    return tables::kCategoryKeys[toIndex(category)];
}

inline constexpr std::string_view displayNameOf(Category category) {
    return tables::kCategoryDisplayNames[toIndex(category)];
}

inline constexpr std::string_view descriptionOf(Category category) {
    return tables::kCategoryDescriptions[toIndex(category)];
}

inline constexpr std::span<const Category> allCategories() {
    return std::span<const Category>(kAllCategories.data(), kAllCategories.size());
}

/// @brief Case-insensitive lookup by key. Returns nullopt for unknown keys.
constexpr std::optional<Category> parseCategory(std::string_view text) {
    for (std::size_t i = 0; i < kCategoryCount; ++i) {
        const std::string_view key = tables::kCategoryKeys[i];
        if (key.size() != text.size()) {
            continue;
        }
        bool equal = true;
        for (std::size_t c = 0; c < key.size(); ++c) {
            char ch = text[c];
            if (ch >= 'A' && ch <= 'Z') {
                ch = static_cast<char>(ch - 'A' + 'a');
            }
            if (ch != key[c]) {
                equal = false;
                break;
            }
        }
        if (equal) {
            return fromIndex(i);
        }
    }
    return std::nullopt;
}

}  // namespace switchyard::internal::handler
