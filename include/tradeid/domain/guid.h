/**
 * @file guid.h
 * @brief Value Object for a globally-unique identifier
 */

#pragma once

#include "tradeid/domain/identifier.h"
#include "tradeid/domain/validation_policy.h"
#include <cstddef>
#include <functional>
#include <optional>
#include <string>

namespace tradeid::domain {

/**
 * @brief GUID Value Object
 *
 * An Identifier whose category is fixed to CATEGORY and whose value matches
 * the GUID format of the policy it was created with (canonical: lowercase
 * 8-4-4-4-12 hexadecimal groups separated by '-').
 */
class Guid {
private:
    Identifier identifier_;

    explicit Guid(Identifier identifier) : identifier_(std::move(identifier)) {}

public:
    static constexpr const char* CATEGORY = Identifier::GUID_CATEGORY;

    /**
     * @brief Create from an existing GUID string
     * @throws exception::InvalidValueError if raw is not a valid GUID
     */
    static Guid of(const std::string& raw);

    /**
     * @brief Create from an existing GUID string using an explicit policy
     */
    static Guid of(const std::string& raw, const ValidationPolicy& policy);

    /**
     * @brief Generate a new random (version 4) GUID in canonical form
     */
    static Guid generate();

    /**
     * @brief Narrow a stored identifier back to a GUID
     * @return The GUID, or std::nullopt if id is not in the GUID category
     */
    static std::optional<Guid> fromIdentifier(const Identifier& id);

    [[nodiscard]] const std::string& getValue() const noexcept {
        return identifier_.getValue();
    }

    [[nodiscard]] const std::string& getCategory() const noexcept {
        return identifier_.getCategory();
    }

    [[nodiscard]] const Identifier& asIdentifier() const noexcept {
        return identifier_;
    }

    [[nodiscard]] bool equals(const Guid& other) const noexcept {
        return identifier_.equals(other.identifier_);
    }

    bool operator==(const Guid& other) const noexcept {
        return equals(other);
    }

    bool operator!=(const Guid& other) const noexcept {
        return !equals(other);
    }

    bool operator<(const Guid& other) const noexcept {
        return identifier_ < other.identifier_;
    }

    [[nodiscard]] std::string toString() const {
        return identifier_.toString();
    }
};

} // namespace tradeid::domain

namespace std {
    template<>
    struct hash<tradeid::domain::Guid> {
        size_t operator()(const tradeid::domain::Guid& guid) const {
            return hash<tradeid::domain::Identifier>()(guid.asIdentifier());
        }
    };
}
