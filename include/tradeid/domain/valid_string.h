/**
 * @file valid_string.h
 * @brief Value Object for a validated, immutable string
 */

#pragma once

#include "tradeid/domain/validation_policy.h"
#include <cstddef>
#include <functional>
#include <string>

namespace tradeid::domain {

/**
 * @brief Immutable string guaranteed to satisfy a ValidationPolicy
 *
 * Instances only come into existence through of(), which validates the raw
 * input. Equality, ordering and hashing use the wrapped characters only.
 */
class ValidString {
private:
    std::string value_;

    explicit ValidString(std::string value) : value_(std::move(value)) {}

public:
    /**
     * @brief Create from a raw string using the default policy
     * @throws exception::InvalidValueError if raw fails the predicate
     */
    static ValidString of(const std::string& raw);

    /**
     * @brief Create from a raw string using an explicit policy
     * @throws exception::InvalidValueError if raw fails the predicate
     */
    static ValidString of(const std::string& raw, const ValidationPolicy& policy);

    [[nodiscard]] const std::string& getValue() const noexcept {
        return value_;
    }

    [[nodiscard]] size_t length() const noexcept {
        return value_.length();
    }

    bool operator==(const ValidString& other) const noexcept {
        return value_ == other.value_;
    }

    bool operator!=(const ValidString& other) const noexcept {
        return !(*this == other);
    }

    bool operator<(const ValidString& other) const noexcept {
        return value_ < other.value_;
    }

    [[nodiscard]] std::string toString() const {
        return value_;
    }
};

} // namespace tradeid::domain

namespace std {
    template<>
    struct hash<tradeid::domain::ValidString> {
        size_t operator()(const tradeid::domain::ValidString& vs) const {
            return hash<string>()(vs.getValue());
        }
    };
}
