/**
 * @file validation_policy.h
 * @brief Configurable validity predicate and GUID grammar
 */

#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace tradeid::config {
class ConfigManager;
}

namespace tradeid::domain {

/**
 * @brief Letter case accepted in GUID hexadecimal digits
 */
enum class GuidCase {
    Lower,
    Upper,
    Either
};

/**
 * @brief Textual GUID grammar
 *
 * A GUID is a sequence of hexadecimal digit groups of fixed lengths joined
 * by a single delimiter character. The canonical layout is 8-4-4-4-12 with
 * '-' and lowercase digits.
 */
struct GuidFormat {
    std::vector<size_t> groupLengths{8, 4, 4, 4, 12};
    char delimiter = '-';
    GuidCase letterCase = GuidCase::Lower;

    static GuidFormat canonical() { return GuidFormat{}; }

    /**
     * @brief Total character count including delimiters
     *
     * 0 when there are no groups, a group is empty, or the total overflows.
     * Such a format matches nothing.
     */
    [[nodiscard]] size_t length() const noexcept;

    /**
     * @brief Check a string against the grammar
     */
    [[nodiscard]] bool matches(const std::string& value) const;
};

/**
 * @brief Validity predicate applied to identifier values and categories
 *
 * Values are read as UTF-8. They are always rejected when empty, when they
 * are not well-formed UTF-8, when they begin or end with a Unicode
 * whitespace code point, or when they contain C0/C1 control characters. The remaining
 * fields tighten the predicate further.
 */
struct ValidationPolicy {
    /// Maximum value length in bytes, 0 for unlimited
    size_t maxLength = 0;
    bool allowInnerWhitespace = true;
    /// Characters that may not appear anywhere in a value
    std::string forbiddenCharacters;
    GuidFormat guidFormat;

    /**
     * @brief Built-in policy
     */
    static const ValidationPolicy& defaults();

    /**
     * @brief Build a policy from configuration keys
     *
     * Missing keys keep their default. Throws ConfigException for values
     * that cannot be interpreted.
     */
    static ValidationPolicy fromConfig(const config::ConfigManager& config);

    /**
     * @brief Throws InvalidValueError if value fails the predicate
     */
    void checkValue(const std::string& value) const;

    /**
     * @brief Throws InvalidCategoryError if category is empty or malformed
     *
     * Categories must be UTF-8 and may not contain whitespace or control
     * characters.
     */
    void checkCategory(const std::string& category) const;

    /**
     * @brief Throws InvalidValueError if value is not a GUID under guidFormat
     */
    void checkGuid(const std::string& value) const;

    [[nodiscard]] bool isValidValue(const std::string& value) const;
    [[nodiscard]] bool isValidGuid(const std::string& value) const;
};

} // namespace tradeid::domain
