/**
 * @file validation_policy.cpp
 * @brief Validity predicate and GUID grammar implementation
 */

#include "tradeid/domain/validation_policy.h"
#include "tradeid/config/config_manager.h"
#include "tradeid/exception/exceptions.h"
#include "tradeid/utils/string_utils.h"
#include <cctype>
#include <limits>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace tradeid::domain {

using exception::ConfigException;
using exception::InvalidCategoryError;
using exception::InvalidValueError;

namespace {

bool hasCase(const std::string& group, GuidCase letterCase) {
    for (char c : group) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (!std::isalpha(uc)) {
            continue;
        }
        if (letterCase == GuidCase::Lower && !std::islower(uc)) {
            return false;
        }
        if (letterCase == GuidCase::Upper && !std::isupper(uc)) {
            return false;
        }
    }
    return true;
}

// Reason the value fails the base predicate, empty if it passes
std::string valueViolation(const ValidationPolicy& policy, const std::string& value) {
    if (value.empty()) {
        return "value cannot be empty";
    }
    if (!utils::isValidUtf8(value)) {
        return "value is not valid UTF-8";
    }
    if (utils::hasSurroundingWhitespace(value)) {
        return "value has leading or trailing whitespace";
    }
    if (utils::containsControlCharacters(value)) {
        return "value contains control characters";
    }
    if (!policy.allowInnerWhitespace && utils::containsWhitespace(value)) {
        return "value contains whitespace";
    }
    if (policy.maxLength > 0 && value.length() > policy.maxLength) {
        return "value exceeds maximum length of " + std::to_string(policy.maxLength);
    }
    if (utils::containsAnyOf(value, policy.forbiddenCharacters)) {
        return "value contains forbidden characters";
    }
    return "";
}

GuidCase parseGuidCase(const std::string& value) {
    std::string lower = utils::toLower(utils::trim(value));
    if (lower == "lower") {
        return GuidCase::Lower;
    } else if (lower == "upper") {
        return GuidCase::Upper;
    } else if (lower == "either") {
        return GuidCase::Either;
    }
    throw ConfigException(std::string(config::ConfigManager::GUID_CASE) +
                          " must be lower, upper or either: " + value);
}

size_t parseMaxLength(const std::string& value) {
    std::string trimmed = utils::trim(value);
    if (trimmed.empty() || trimmed.find_first_not_of("0123456789") != std::string::npos) {
        throw ConfigException(std::string(config::ConfigManager::MAX_LENGTH) +
                              " must be a non-negative integer: " + value);
    }
    try {
        return static_cast<size_t>(std::stoull(trimmed));
    } catch (const std::out_of_range&) {
        throw ConfigException(std::string(config::ConfigManager::MAX_LENGTH) +
                              " is out of range: " + value);
    }
}

} // namespace

size_t GuidFormat::length() const noexcept {
    if (groupLengths.empty()) {
        return 0;
    }

    size_t total = groupLengths.size() - 1;
    for (size_t groupLength : groupLengths) {
        if (groupLength == 0 || groupLength > std::numeric_limits<size_t>::max() - total) {
            return 0;
        }
        total += groupLength;
    }
    return total;
}

bool GuidFormat::matches(const std::string& value) const {
    size_t expected = length();
    if (expected == 0 || value.length() != expected) {
        return false;
    }

    size_t pos = 0;
    for (size_t i = 0; i < groupLengths.size(); ++i) {
        if (i > 0) {
            if (value[pos] != delimiter) {
                return false;
            }
            ++pos;
        }
        std::string group = value.substr(pos, groupLengths[i]);
        if (!utils::isHexDigits(group) || !hasCase(group, letterCase)) {
            return false;
        }
        pos += groupLengths[i];
    }
    return true;
}

const ValidationPolicy& ValidationPolicy::defaults() {
    static const ValidationPolicy policy{};
    return policy;
}

ValidationPolicy ValidationPolicy::fromConfig(const config::ConfigManager& config) {
    using config::ConfigManager;

    ValidationPolicy policy;

    std::string maxLength = config.getString(ConfigManager::MAX_LENGTH);
    if (!maxLength.empty()) {
        policy.maxLength = parseMaxLength(maxLength);
    }

    std::string innerWhitespace = config.getString(ConfigManager::ALLOW_INNER_WHITESPACE);
    if (!innerWhitespace.empty()) {
        policy.allowInnerWhitespace =
            ConfigManager::parseBool(ConfigManager::ALLOW_INNER_WHITESPACE, innerWhitespace);
    }

    policy.forbiddenCharacters = config.getString(ConfigManager::FORBIDDEN_CHARS);

    std::string guidCase = config.getString(ConfigManager::GUID_CASE);
    if (!guidCase.empty()) {
        policy.guidFormat.letterCase = parseGuidCase(guidCase);
    }

    std::string delimiter = config.getString(ConfigManager::GUID_DELIMITER);
    if (!delimiter.empty()) {
        if (delimiter.length() != 1 ||
            std::isxdigit(static_cast<unsigned char>(delimiter[0])) ||
            utils::containsControlCharacters(delimiter)) {
            throw ConfigException(std::string(ConfigManager::GUID_DELIMITER) +
                                  " must be a single non-hex character: " + delimiter);
        }
        policy.guidFormat.delimiter = delimiter[0];
    }

    spdlog::debug("Validation policy loaded: maxLength={}, allowInnerWhitespace={}, "
                  "forbidden='{}', guidDelimiter='{}'",
                  policy.maxLength, policy.allowInnerWhitespace,
                  policy.forbiddenCharacters, policy.guidFormat.delimiter);
    return policy;
}

void ValidationPolicy::checkValue(const std::string& value) const {
    std::string violation = valueViolation(*this, value);
    if (!violation.empty()) {
        spdlog::debug("Rejected value '{}': {}", value, violation);
        throw InvalidValueError("Invalid value '" + value + "': " + violation);
    }
}

void ValidationPolicy::checkCategory(const std::string& category) const {
    if (category.empty()) {
        throw InvalidCategoryError("Identifier category cannot be empty");
    }
    if (!utils::isValidUtf8(category) || utils::containsWhitespace(category) ||
        utils::containsControlCharacters(category)) {
        spdlog::debug("Rejected category '{}'", category);
        throw InvalidCategoryError("Identifier category is not UTF-8 or contains whitespace or control characters: " +
                                   category);
    }
}

void ValidationPolicy::checkGuid(const std::string& value) const {
    if (!guidFormat.matches(value)) {
        spdlog::debug("Rejected GUID '{}'", value);
        throw InvalidValueError("Value is not a valid GUID: " + value);
    }
}

bool ValidationPolicy::isValidValue(const std::string& value) const {
    return valueViolation(*this, value).empty();
}

bool ValidationPolicy::isValidGuid(const std::string& value) const {
    return guidFormat.matches(value);
}

} // namespace tradeid::domain
