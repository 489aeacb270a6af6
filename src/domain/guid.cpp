/**
 * @file guid.cpp
 * @brief GUID factory implementation
 */

#include "tradeid/domain/guid.h"
#include <uuid/uuid.h>

namespace tradeid::domain {

Guid Guid::of(const std::string& raw) {
    return of(raw, ValidationPolicy::defaults());
}

Guid Guid::of(const std::string& raw, const ValidationPolicy& policy) {
    return Guid(Identifier::of(raw, CATEGORY, policy));
}

Guid Guid::generate() {
    uuid_t uuid;
    uuid_generate_random(uuid);

    char str[37];
    uuid_unparse_lower(uuid, str);

    return of(std::string(str), ValidationPolicy::defaults());
}

std::optional<Guid> Guid::fromIdentifier(const Identifier& id) {
    if (!id.isGuid()) {
        return std::nullopt;
    }
    return Guid(id);
}

} // namespace tradeid::domain
