#include "test_support.hpp"

#include <cstdlib>
#include <fstream>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

class ConfigTest : public TempDirTest {
protected:
    void SetUp() override {
        TempDirTest::SetUp();
        clearEnv();
    }

    void TearDown() override {
        clearEnv();
        TempDirTest::TearDown();
    }

    static void clearEnv() {
        for (const char* name : { "AQUALOG_DATA_DIR", "AQUALOG_SESSION_TIMEOUT", "AQUALOG_MAX_LOGIN_ATTEMPTS",
                                  "AQUALOG_LOCKOUT_DURATION", "AQUALOG_LOG_LEVEL" }) {
            ::unsetenv(name);
        }
    }

    std::string configFile() const { return (testDir / "aqualog.json").string(); }
};

TEST_F(ConfigTest, Defaults) {
    AuthConfig config;
    EXPECT_EQ(config.session_timeout_minutes, 60);
    EXPECT_EQ(config.max_login_attempts, 5);
    EXPECT_EQ(config.lockout_duration_minutes, 15);
    EXPECT_EQ(config.log_level, "info");
    EXPECT_EQ(config.usersPath(), (fs::path("data") / "users.db").string());
    EXPECT_EQ(config.keyPath(), (fs::path("data") / "encryption.key").string());
}

TEST_F(ConfigTest, ExplicitPathsWinOverDataDir) {
    AuthConfig config;
    config.data_dir = "/srv/aqualog";
    config.key_file = "/etc/aqualog/key";

    EXPECT_EQ(config.usersPath(), (fs::path("/srv/aqualog") / "users.db").string());
    EXPECT_EQ(config.keyPath(), "/etc/aqualog/key");
}

TEST_F(ConfigTest, FromJsonReadsSections) {
    AuthConfig config = AuthConfig::fromJson(R"({
        "database": { "data_dir": "/var/lib/aqualog" },
        "auth": { "session_timeout_minutes": 30, "max_login_attempts": 3, "lockout_duration_minutes": 5 },
        "logging": { "level": "debug", "file": "aqualog.log" }
    })");

    EXPECT_EQ(config.data_dir, "/var/lib/aqualog");
    EXPECT_EQ(config.session_timeout_minutes, 30);
    EXPECT_EQ(config.max_login_attempts, 3);
    EXPECT_EQ(config.lockout_duration_minutes, 5);
    EXPECT_EQ(config.log_level, "debug");
    EXPECT_EQ(config.log_file, "aqualog.log");
    EXPECT_EQ(config.hash_ops_limit, 2u);
}

TEST_F(ConfigTest, FromJsonRejectsWrongTypes) {
    EXPECT_THROW(AuthConfig::fromJson(R"({ "auth": { "max_login_attempts": "five" } })"), nlohmann::json::exception);
    EXPECT_THROW(AuthConfig::fromJson("{ not json"), nlohmann::json::exception);
}

TEST_F(ConfigTest, ToJsonRoundTripsThroughFromJson) {
    AuthConfig original;
    original.data_dir = "elsewhere";
    original.max_login_attempts = 7;

    AuthConfig copy = AuthConfig::fromJson(original.toJson());
    EXPECT_EQ(copy.data_dir, "elsewhere");
    EXPECT_EQ(copy.max_login_attempts, 7);
}

TEST_F(ConfigTest, LoadCreatesMissingFileWithDefaults) {
    AuthConfig config = AuthConfig::load(configFile());

    EXPECT_TRUE(fs::exists(configFile()));
    EXPECT_EQ(config.max_login_attempts, 5);
    EXPECT_EQ(AuthConfig::load(configFile()).session_timeout_minutes, 60);
}

TEST_F(ConfigTest, MalformedFileFallsBackToDefaults) {
    std::ofstream(configFile()) << "{ \"auth\": ";

    AuthConfig config = AuthConfig::load(configFile());
    EXPECT_EQ(config.max_login_attempts, 5);
    EXPECT_EQ(config.data_dir, "data");
}

TEST_F(ConfigTest, EnvironmentOverridesFile) {
    std::ofstream(configFile()) << R"({ "auth": { "max_login_attempts": 3 } })";
    ::setenv("AQUALOG_MAX_LOGIN_ATTEMPTS", "8", 1);
    ::setenv("AQUALOG_DATA_DIR", "/tmp/aqualog-env", 1);
    ::setenv("AQUALOG_LOG_LEVEL", "warn", 1);

    AuthConfig config = AuthConfig::load(configFile());
    EXPECT_EQ(config.max_login_attempts, 8);
    EXPECT_EQ(config.data_dir, "/tmp/aqualog-env");
    EXPECT_EQ(config.log_level, "warn");
}

TEST_F(ConfigTest, InvalidEnvironmentValueIsIgnored) {
    std::ofstream(configFile()) << R"({ "auth": { "session_timeout_minutes": 20 } })";
    ::setenv("AQUALOG_SESSION_TIMEOUT", "soon", 1);

    EXPECT_EQ(AuthConfig::load(configFile()).session_timeout_minutes, 20);
}

TEST_F(ConfigTest, ValidateResetsOutOfRangeValues) {
    AuthConfig config;
    config.session_timeout_minutes = 0;
    config.max_login_attempts = -1;
    config.lockout_duration_minutes = -10;
    config.log_level = "chatty";
    config.data_dir = "";

    config.validate();

    EXPECT_EQ(config.session_timeout_minutes, 60);
    EXPECT_EQ(config.max_login_attempts, 5);
    EXPECT_EQ(config.lockout_duration_minutes, 15);
    EXPECT_EQ(config.log_level, "info");
    EXPECT_EQ(config.data_dir, "data");
}

TEST_F(ConfigTest, ValidateResetsHashLimits) {
    AuthConfig config = AuthConfig::fromJson(R"({ "auth": { "hash_ops_limit": -1, "hash_mem_limit": 100 } })");
    config.validate();

    EXPECT_EQ(config.hash_ops_limit, AuthConfig{}.hash_ops_limit);
    EXPECT_EQ(config.hash_mem_limit, AuthConfig{}.hash_mem_limit);
}

TEST_F(ConfigTest, ValidateKeepsMinimumHashCost) {
    AuthConfig config = fastConfig();
    config.validate();

    EXPECT_EQ(config.hash_ops_limit, 1u);
    EXPECT_EQ(config.hash_mem_limit, 8192u);
}
