/**
 * @file identifier.h
 * @brief Value Object for a category-qualified identifier
 */

#pragma once

#include "tradeid/domain/valid_string.h"
#include "tradeid/domain/validation_policy.h"
#include <cstddef>
#include <functional>
#include <string>

namespace tradeid::domain {

/**
 * @brief Identifier tagged with the category it belongs to
 *
 * The category (e.g. "OrderId", "AccountId") partitions the identifier
 * space: identifiers from different categories never compare equal, even
 * when their values coincide.
 *
 * The category GUID_CATEGORY is reserved. An Identifier in that category
 * always holds a value matching the policy's GUID format.
 */
class Identifier {
private:
    ValidString value_;
    std::string category_;

    Identifier(ValidString value, std::string category)
        : value_(std::move(value)), category_(std::move(category)) {}

public:
    static constexpr const char* GUID_CATEGORY = "GUID";

    /**
     * @brief Create an identifier using the default policy
     * @param raw Identifier value
     * @param category Category tag
     * @throws exception::InvalidValueError if raw is invalid
     * @throws exception::InvalidCategoryError if category is empty or malformed
     */
    static Identifier of(const std::string& raw, const std::string& category);

    /**
     * @brief Create an identifier using an explicit policy
     *
     * The value is checked before the category.
     */
    static Identifier of(const std::string& raw, const std::string& category,
                         const ValidationPolicy& policy);

    [[nodiscard]] const std::string& getValue() const noexcept {
        return value_.getValue();
    }

    [[nodiscard]] const ValidString& getValidString() const noexcept {
        return value_;
    }

    [[nodiscard]] const std::string& getCategory() const noexcept {
        return category_;
    }

    [[nodiscard]] bool isGuid() const noexcept {
        return category_ == GUID_CATEGORY;
    }

    /**
     * @brief Category-qualified equality
     * @return true iff both category and value match exactly
     */
    [[nodiscard]] bool equals(const Identifier& other) const noexcept {
        return category_ == other.category_ && value_ == other.value_;
    }

    bool operator==(const Identifier& other) const noexcept {
        return equals(other);
    }

    bool operator!=(const Identifier& other) const noexcept {
        return !equals(other);
    }

    /**
     * @brief Order by category, then value
     */
    bool operator<(const Identifier& other) const noexcept {
        if (category_ != other.category_) {
            return category_ < other.category_;
        }
        return value_ < other.value_;
    }

    /**
     * @brief The bare value, without the category
     */
    [[nodiscard]] std::string toString() const {
        return value_.toString();
    }
};

} // namespace tradeid::domain

namespace std {
    template<>
    struct hash<tradeid::domain::Identifier> {
        size_t operator()(const tradeid::domain::Identifier& id) const {
            size_t seed = hash<string>()(id.getCategory());
            seed ^= hash<string>()(id.getValue()) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
            return seed;
        }
    };
}
