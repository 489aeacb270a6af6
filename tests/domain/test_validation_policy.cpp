/**
 * @file test_validation_policy.cpp
 * @brief Unit tests for ValidationPolicy and GuidFormat
 */

#include <gtest/gtest.h>
#include <tradeid/config/config_manager.h>
#include <tradeid/domain/validation_policy.h>
#include <tradeid/exception/exceptions.h>

#include <limits>

using namespace tradeid::domain;
using tradeid::config::ConfigManager;
using tradeid::exception::ConfigException;
using tradeid::exception::InvalidCategoryError;
using tradeid::exception::InvalidValueError;

// ============================================================================
// GuidFormat
// ============================================================================

class GuidFormatTest : public ::testing::Test {
protected:
    GuidFormat format_ = GuidFormat::canonical();
};

TEST_F(GuidFormatTest, Canonical_Layout) {
    EXPECT_EQ(format_.length(), 36u);
    EXPECT_EQ(format_.delimiter, '-');
    EXPECT_EQ(format_.letterCase, GuidCase::Lower);
    ASSERT_EQ(format_.groupLengths.size(), 5u);
}

TEST_F(GuidFormatTest, Matches_Canonical) {
    EXPECT_TRUE(format_.matches("2d89666b-1a1e-4a75-b193-4eb3b454c757"));
    EXPECT_FALSE(format_.matches("2d89666b-1a1e-4a75-b193-4eb3b454c75"));
    EXPECT_FALSE(format_.matches(""));
}

TEST_F(GuidFormatTest, Matches_EitherCase) {
    format_.letterCase = GuidCase::Either;
    EXPECT_TRUE(format_.matches("2D89666b-1a1e-4A75-b193-4eb3b454c757"));
}

TEST_F(GuidFormatTest, Matches_CustomGroups) {
    format_.groupLengths = {4, 4};
    format_.delimiter = '.';
    EXPECT_EQ(format_.length(), 9u);
    EXPECT_TRUE(format_.matches("abcd.0123"));
    EXPECT_FALSE(format_.matches("abcd-0123"));
    EXPECT_FALSE(format_.matches("abcd.012g"));
}

TEST_F(GuidFormatTest, Matches_EmptyGroupsNeverMatch) {
    format_.groupLengths.clear();
    EXPECT_EQ(format_.length(), 0u);
    EXPECT_FALSE(format_.matches(""));
}

TEST_F(GuidFormatTest, Matches_OverflowingGroupsNeverMatch) {
    format_.groupLengths = {std::numeric_limits<size_t>::max(), 2};
    EXPECT_EQ(format_.length(), 0u);
    EXPECT_FALSE(format_.matches("ab"));
    EXPECT_FALSE(format_.matches(""));
}

TEST_F(GuidFormatTest, Matches_ZeroLengthGroupNeverMatches) {
    format_.groupLengths = {0, 4};
    EXPECT_EQ(format_.length(), 0u);
    EXPECT_FALSE(format_.matches("-abcd"));
}

// ============================================================================
// ValidationPolicy checks
// ============================================================================

class ValidationPolicyTest : public ::testing::Test {
protected:
    void SetUp() override {
        clearKeys();
    }

    void TearDown() override {
        clearKeys();
    }

    static void clearKeys() {
        auto& config = ConfigManager::getInstance();
        for (const char* key : {ConfigManager::MAX_LENGTH, ConfigManager::ALLOW_INNER_WHITESPACE,
                                ConfigManager::FORBIDDEN_CHARS, ConfigManager::GUID_CASE,
                                ConfigManager::GUID_DELIMITER}) {
            config.set(key, "");
        }
    }
};

TEST_F(ValidationPolicyTest, Defaults_MinimalPredicate) {
    const auto& policy = ValidationPolicy::defaults();
    EXPECT_EQ(policy.maxLength, 0u);
    EXPECT_TRUE(policy.allowInnerWhitespace);
    EXPECT_TRUE(policy.forbiddenCharacters.empty());

    EXPECT_TRUE(policy.isValidValue("ORD-001"));
    EXPECT_TRUE(policy.isValidValue("two words"));
    EXPECT_FALSE(policy.isValidValue(""));
    EXPECT_FALSE(policy.isValidValue(" x"));
    EXPECT_FALSE(policy.isValidValue("x\r"));
}

TEST_F(ValidationPolicyTest, CheckValue_Throws) {
    EXPECT_THROW(ValidationPolicy::defaults().checkValue(""), InvalidValueError);
    EXPECT_NO_THROW(ValidationPolicy::defaults().checkValue("ok"));
}

TEST_F(ValidationPolicyTest, CheckCategory_Throws) {
    EXPECT_THROW(ValidationPolicy::defaults().checkCategory(""), InvalidCategoryError);
    EXPECT_THROW(ValidationPolicy::defaults().checkCategory("Order Id"), InvalidCategoryError);
    EXPECT_NO_THROW(ValidationPolicy::defaults().checkCategory("OrderId"));
}

TEST_F(ValidationPolicyTest, CheckGuid_Throws) {
    EXPECT_THROW(ValidationPolicy::defaults().checkGuid("ORD-001"), InvalidValueError);
    EXPECT_NO_THROW(ValidationPolicy::defaults().checkGuid("2d89666b-1a1e-4a75-b193-4eb3b454c757"));
    EXPECT_TRUE(ValidationPolicy::defaults().isValidGuid("2d89666b-1a1e-4a75-b193-4eb3b454c757"));
}

// ============================================================================
// ValidationPolicy::fromConfig
// ============================================================================

TEST_F(ValidationPolicyTest, FromConfig_EmptyUsesDefaults) {
    auto policy = ValidationPolicy::fromConfig(ConfigManager::getInstance());
    EXPECT_EQ(policy.maxLength, 0u);
    EXPECT_TRUE(policy.allowInnerWhitespace);
    EXPECT_TRUE(policy.forbiddenCharacters.empty());
    EXPECT_EQ(policy.guidFormat.letterCase, GuidCase::Lower);
    EXPECT_EQ(policy.guidFormat.delimiter, '-');
}

TEST_F(ValidationPolicyTest, FromConfig_ReadsAllKeys) {
    auto& config = ConfigManager::getInstance();
    config.set(ConfigManager::MAX_LENGTH, "32");
    config.set(ConfigManager::ALLOW_INNER_WHITESPACE, "no");
    config.set(ConfigManager::FORBIDDEN_CHARS, "|,");
    config.set(ConfigManager::GUID_CASE, "Upper");
    config.set(ConfigManager::GUID_DELIMITER, ":");

    auto policy = ValidationPolicy::fromConfig(config);
    EXPECT_EQ(policy.maxLength, 32u);
    EXPECT_FALSE(policy.allowInnerWhitespace);
    EXPECT_EQ(policy.forbiddenCharacters, "|,");
    EXPECT_EQ(policy.guidFormat.letterCase, GuidCase::Upper);
    EXPECT_EQ(policy.guidFormat.delimiter, ':');

    EXPECT_FALSE(policy.isValidValue("A|B"));
    EXPECT_TRUE(policy.isValidGuid("2D89666B:1A1E:4A75:B193:4EB3B454C757"));
}

TEST_F(ValidationPolicyTest, FromConfig_InvalidMaxLengthThrows) {
    auto& config = ConfigManager::getInstance();
    config.set(ConfigManager::MAX_LENGTH, "-1");
    EXPECT_THROW(ValidationPolicy::fromConfig(config), ConfigException);
    config.set(ConfigManager::MAX_LENGTH, "ten");
    EXPECT_THROW(ValidationPolicy::fromConfig(config), ConfigException);
}

TEST_F(ValidationPolicyTest, FromConfig_InvalidBooleanThrows) {
    auto& config = ConfigManager::getInstance();
    config.set(ConfigManager::ALLOW_INNER_WHITESPACE, "maybe");
    EXPECT_THROW(ValidationPolicy::fromConfig(config), ConfigException);
}

TEST_F(ValidationPolicyTest, FromConfig_InvalidGuidCaseThrows) {
    auto& config = ConfigManager::getInstance();
    config.set(ConfigManager::GUID_CASE, "mixed");
    EXPECT_THROW(ValidationPolicy::fromConfig(config), ConfigException);
}

TEST_F(ValidationPolicyTest, FromConfig_InvalidDelimiterThrows) {
    auto& config = ConfigManager::getInstance();
    config.set(ConfigManager::GUID_DELIMITER, "--");
    EXPECT_THROW(ValidationPolicy::fromConfig(config), ConfigException);
    config.set(ConfigManager::GUID_DELIMITER, "a");
    EXPECT_THROW(ValidationPolicy::fromConfig(config), ConfigException);
}

TEST_F(ValidationPolicyTest, FromConfig_ErrorCarriesCode) {
    auto& config = ConfigManager::getInstance();
    config.set(ConfigManager::GUID_CASE, "mixed");
    try {
        ValidationPolicy::fromConfig(config);
        FAIL() << "expected ConfigException";
    } catch (const ConfigException& e) {
        EXPECT_EQ(e.getCode(), "INVALID_CONFIG");
    }
}
