/**
 * @file valid_string.cpp
 * @brief ValidString factory implementation
 */

#include "tradeid/domain/valid_string.h"

namespace tradeid::domain {

ValidString ValidString::of(const std::string& raw) {
    return of(raw, ValidationPolicy::defaults());
}

ValidString ValidString::of(const std::string& raw, const ValidationPolicy& policy) {
    policy.checkValue(raw);
    return ValidString(raw);
}

} // namespace tradeid::domain
