/**
 * @file test_config_manager.cpp
 * @brief Unit tests for ConfigManager
 */

#include <gtest/gtest.h>
#include <tradeid/config/config_manager.h>
#include <tradeid/exception/exceptions.h>

#include <cstdlib>

using tradeid::config::ConfigManager;
using tradeid::exception::ConfigException;

class ConfigManagerTest : public ::testing::Test {
protected:
    ConfigManager& config_ = ConfigManager::getInstance();

    void TearDown() override {
        config_.remove("TRADEID_TEST_STRING");
        config_.remove("TRADEID_TEST_INT");
        config_.remove("TRADEID_TEST_BOOL");
        config_.remove("TRADEID_TEST_ENV");
        unsetenv("TRADEID_TEST_ENV");
    }
};

TEST_F(ConfigManagerTest, GetInstance_ReturnsSameObject) {
    EXPECT_EQ(&ConfigManager::getInstance(), &config_);
}

TEST_F(ConfigManagerTest, GetString_DefaultWhenMissing) {
    EXPECT_EQ(config_.getString("TRADEID_TEST_STRING", "fallback"), "fallback");
    EXPECT_FALSE(config_.has("TRADEID_TEST_STRING"));
}

TEST_F(ConfigManagerTest, Set_ThenGet) {
    config_.set("TRADEID_TEST_STRING", "value");
    EXPECT_TRUE(config_.has("TRADEID_TEST_STRING"));
    EXPECT_EQ(config_.getString("TRADEID_TEST_STRING"), "value");
}

TEST_F(ConfigManagerTest, Remove_RestoresDefault) {
    config_.set("TRADEID_TEST_STRING", "value");
    config_.remove("TRADEID_TEST_STRING");
    EXPECT_EQ(config_.getString("TRADEID_TEST_STRING", "fallback"), "fallback");
}

TEST_F(ConfigManagerTest, GetString_FallsBackToEnvironment) {
    setenv("TRADEID_TEST_ENV", "from-env", 1);
    EXPECT_TRUE(config_.has("TRADEID_TEST_ENV"));
    EXPECT_EQ(config_.getString("TRADEID_TEST_ENV"), "from-env");
    EXPECT_EQ(ConfigManager::getEnv("TRADEID_TEST_ENV"), "from-env");
}

TEST_F(ConfigManagerTest, Set_OverridesEnvironment) {
    setenv("TRADEID_TEST_ENV", "from-env", 1);
    config_.set("TRADEID_TEST_ENV", "explicit");
    EXPECT_EQ(config_.getString("TRADEID_TEST_ENV"), "explicit");
}

TEST_F(ConfigManagerTest, GetEnv_DefaultWhenUnset) {
    EXPECT_EQ(ConfigManager::getEnv("TRADEID_TEST_ENV", "none"), "none");
}

TEST_F(ConfigManagerTest, GetInt_Parses) {
    config_.set("TRADEID_TEST_INT", "42");
    EXPECT_EQ(config_.getInt("TRADEID_TEST_INT", 7), 42);
}

TEST_F(ConfigManagerTest, GetInt_InvalidUsesDefault) {
    config_.set("TRADEID_TEST_INT", "forty-two");
    EXPECT_EQ(config_.getInt("TRADEID_TEST_INT", 7), 7);
}

TEST_F(ConfigManagerTest, GetInt_TrailingCharactersUseDefault) {
    config_.set("TRADEID_TEST_INT", "42abc");
    EXPECT_EQ(config_.getInt("TRADEID_TEST_INT", 7), 7);
    config_.set("TRADEID_TEST_INT", " 42 ");
    EXPECT_EQ(config_.getInt("TRADEID_TEST_INT", 7), 42);
}

TEST_F(ConfigManagerTest, GetBool_Literals) {
    for (const char* truthy : {"true", "TRUE", "1", "yes", "on"}) {
        config_.set("TRADEID_TEST_BOOL", truthy);
        EXPECT_TRUE(config_.getBool("TRADEID_TEST_BOOL", false)) << truthy;
    }
    for (const char* falsy : {"false", "0", "No", "off"}) {
        config_.set("TRADEID_TEST_BOOL", falsy);
        EXPECT_FALSE(config_.getBool("TRADEID_TEST_BOOL", true)) << falsy;
    }
}

TEST_F(ConfigManagerTest, GetBool_InvalidUsesDefault) {
    config_.set("TRADEID_TEST_BOOL", "perhaps");
    EXPECT_TRUE(config_.getBool("TRADEID_TEST_BOOL", true));
    EXPECT_FALSE(config_.getBool("TRADEID_TEST_BOOL", false));
}

TEST_F(ConfigManagerTest, ParseBool_InvalidThrows) {
    EXPECT_TRUE(ConfigManager::parseBool("KEY", " on "));
    EXPECT_THROW(ConfigManager::parseBool("KEY", "perhaps"), ConfigException);
}
