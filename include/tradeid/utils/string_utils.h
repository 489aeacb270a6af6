/**
 * @file string_utils.h
 * @brief String inspection helpers used by the validators
 *
 * @version 1.0.0
 */

#pragma once

#include <optional>
#include <string>

namespace tradeid {
namespace utils {

/**
 * @brief Convert string to lowercase
 *
 * @param str Input string
 * @return Lowercase string
 */
std::string toLower(const std::string& str);

/**
 * @brief Convert string to uppercase
 *
 * @param str Input string
 * @return Uppercase string
 */
std::string toUpper(const std::string& str);

/**
 * @brief Trim whitespace from both ends
 *
 * @param str Input string
 * @return Trimmed string
 */
std::string trim(const std::string& str);

/**
 * @brief Decode a UTF-8 string into code points
 *
 * Rejects truncated sequences, stray continuation bytes, overlong forms,
 * surrogates and code points above U+10FFFF.
 *
 * @param str UTF-8 input
 * @return Code points, or std::nullopt if str is not valid UTF-8
 */
std::optional<std::u32string> decodeUtf8(const std::string& str);

/**
 * @brief Check if string is valid UTF-8
 */
bool isValidUtf8(const std::string& str);

/**
 * @brief Unicode whitespace (ASCII 0x09-0x0D, 0x20, U+0085, U+00A0, U+1680,
 * U+2000-U+200A, U+2028, U+2029, U+202F, U+205F, U+3000)
 */
bool isWhitespaceCodePoint(char32_t cp);

/**
 * @brief C0 and C1 control codes (U+0000-U+001F, U+007F-U+009F)
 */
bool isControlCodePoint(char32_t cp);

/**
 * @brief Check for whitespace at either end
 *
 * The string is read as UTF-8; bytes that do not decode count as neither
 * whitespace nor control characters.
 *
 * @param str Input string
 * @return true if the first or last code point is whitespace
 */
bool hasSurroundingWhitespace(const std::string& str);

/**
 * @brief Check for C0 or C1 control characters
 *
 * @param str Input string
 * @return true if any control character is present
 */
bool containsControlCharacters(const std::string& str);

/**
 * @brief Check for any whitespace code point
 */
bool containsWhitespace(const std::string& str);

/**
 * @brief Check whether str contains any character of chars
 *
 * @param str Input string
 * @param chars Set of characters to look for
 * @return true if at least one character of chars occurs in str
 */
bool containsAnyOf(const std::string& str, const std::string& chars);

/**
 * @brief Check that every character is a hexadecimal digit
 *
 * Empty input is not considered hexadecimal.
 */
bool isHexDigits(const std::string& str);

} // namespace utils
} // namespace tradeid
