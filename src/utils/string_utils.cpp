/**
 * @file string_utils.cpp
 * @brief String inspection helpers implementation
 */

#include "tradeid/utils/string_utils.h"
#include <algorithm>
#include <cctype>

namespace tradeid {
namespace utils {

std::string toLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

std::string toUpper(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::toupper(c); });
    return result;
}

std::string trim(const std::string& str) {
    size_t start = 0;
    while (start < str.length() && std::isspace(static_cast<unsigned char>(str[start]))) {
        ++start;
    }

    if (start == str.length()) {
        return "";
    }

    size_t end = str.length();
    while (end > start && std::isspace(static_cast<unsigned char>(str[end - 1]))) {
        --end;
    }

    return str.substr(start, end - start);
}

namespace {

// Length of the sequence introduced by lead byte c, 0 for an invalid lead
size_t sequenceLength(unsigned char c) {
    if (c < 0x80) {
        return 1;
    } else if (c >= 0xC2 && c <= 0xDF) {
        return 2;
    } else if (c >= 0xE0 && c <= 0xEF) {
        return 3;
    } else if (c >= 0xF0 && c <= 0xF4) {
        return 4;
    }
    return 0;
}

// Decode the sequence at pos, advancing pos. Returns false on malformed input
// and leaves pos one byte further.
bool decodeAt(const std::string& str, size_t& pos, char32_t& cp) {
    unsigned char lead = static_cast<unsigned char>(str[pos]);
    size_t len = sequenceLength(lead);
    if (len == 0 || pos + len > str.length()) {
        ++pos;
        return false;
    }

    if (len == 1) {
        cp = lead;
        ++pos;
        return true;
    }

    cp = lead & (0xFF >> (len + 1));
    for (size_t i = 1; i < len; ++i) {
        unsigned char c = static_cast<unsigned char>(str[pos + i]);
        if ((c & 0xC0) != 0x80) {
            ++pos;
            return false;
        }
        cp = (cp << 6) | (c & 0x3F);
    }

    bool overlong = (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000);
    bool surrogate = cp >= 0xD800 && cp <= 0xDFFF;
    if (overlong || surrogate || cp > 0x10FFFF) {
        ++pos;
        return false;
    }

    pos += len;
    return true;
}

// Lenient decode: malformed bytes become U+FFFD
std::u32string decodeLenient(const std::string& str) {
    std::u32string result;
    size_t pos = 0;
    while (pos < str.length()) {
        char32_t cp = 0;
        result.push_back(decodeAt(str, pos, cp) ? cp : U'\uFFFD');
    }
    return result;
}

} // namespace

std::optional<std::u32string> decodeUtf8(const std::string& str) {
    std::u32string result;
    result.reserve(str.length());

    size_t pos = 0;
    while (pos < str.length()) {
        char32_t cp = 0;
        if (!decodeAt(str, pos, cp)) {
            return std::nullopt;
        }
        result.push_back(cp);
    }
    return result;
}

bool isValidUtf8(const std::string& str) {
    return decodeUtf8(str).has_value();
}

bool isWhitespaceCodePoint(char32_t cp) {
    return (cp >= 0x09 && cp <= 0x0D) || cp == 0x20 || cp == 0x85 || cp == 0xA0 ||
           cp == 0x1680 || (cp >= 0x2000 && cp <= 0x200A) || cp == 0x2028 ||
           cp == 0x2029 || cp == 0x202F || cp == 0x205F || cp == 0x3000;
}

bool isControlCodePoint(char32_t cp) {
    return cp < 0x20 || (cp >= 0x7F && cp <= 0x9F);
}

bool hasSurroundingWhitespace(const std::string& str) {
    std::u32string cps = decodeLenient(str);
    if (cps.empty()) {
        return false;
    }
    return isWhitespaceCodePoint(cps.front()) || isWhitespaceCodePoint(cps.back());
}

bool containsControlCharacters(const std::string& str) {
    std::u32string cps = decodeLenient(str);
    return std::any_of(cps.begin(), cps.end(), isControlCodePoint);
}

bool containsWhitespace(const std::string& str) {
    std::u32string cps = decodeLenient(str);
    return std::any_of(cps.begin(), cps.end(), isWhitespaceCodePoint);
}

bool containsAnyOf(const std::string& str, const std::string& chars) {
    if (chars.empty()) {
        return false;
    }
    return str.find_first_of(chars) != std::string::npos;
}

bool isHexDigits(const std::string& str) {
    if (str.empty()) {
        return false;
    }
    return std::all_of(str.begin(), str.end(), [](unsigned char c) {
        return std::isxdigit(c) != 0;
    });
}

} // namespace utils
} // namespace tradeid
