/**
 * @file exceptions.h
 * @brief Exception hierarchy for identifier validation
 *
 * Every error raised by the library derives from DomainException, which
 * carries a stable error code alongside the human-readable message.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace tradeid::exception {

/**
 * @brief Base exception for domain rule violations
 */
class DomainException : public std::runtime_error {
private:
    std::string code_;
    std::string message_;

public:
    /**
     * @brief Construct a new Domain Exception
     * @param code Error code (e.g., "INVALID_VALUE")
     * @param message Human-readable error message
     */
    DomainException(std::string code, std::string message)
        : std::runtime_error(message),
          code_(std::move(code)),
          message_(std::move(message)) {}

    [[nodiscard]] const std::string& getCode() const noexcept {
        return code_;
    }

    [[nodiscard]] const std::string& getMessage() const noexcept {
        return message_;
    }
};

/**
 * @brief Raw value failed the validity predicate or the GUID format
 */
class InvalidValueError : public DomainException {
public:
    explicit InvalidValueError(std::string message)
        : DomainException("INVALID_VALUE", std::move(message)) {}
};

/**
 * @brief Identifier category is empty or malformed
 */
class InvalidCategoryError : public DomainException {
public:
    explicit InvalidCategoryError(std::string message)
        : DomainException("INVALID_CATEGORY", std::move(message)) {}
};

/**
 * @brief Configuration value cannot be used
 */
class ConfigException : public DomainException {
public:
    explicit ConfigException(const std::string& message)
        : DomainException("INVALID_CONFIG", "Configuration error: " + message) {}
};

} // namespace tradeid::exception
