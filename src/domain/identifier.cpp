/**
 * @file identifier.cpp
 * @brief Identifier factory implementation
 */

#include "tradeid/domain/identifier.h"

namespace tradeid::domain {

Identifier Identifier::of(const std::string& raw, const std::string& category) {
    return of(raw, category, ValidationPolicy::defaults());
}

Identifier Identifier::of(const std::string& raw, const std::string& category,
                          const ValidationPolicy& policy) {
    ValidString value = ValidString::of(raw, policy);
    policy.checkCategory(category);
    if (category == GUID_CATEGORY) {
        policy.checkGuid(raw);
    }
    return Identifier(std::move(value), category);
}

} // namespace tradeid::domain
