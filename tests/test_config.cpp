#include <gtest/gtest.h>
#include <devicename/config.hpp>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>

namespace devicename {
namespace {

// Sets an environment variable for the lifetime of the guard
class ScopedEnv {
  public:
    ScopedEnv(const char* name, const char* value) : name_(name) {
        if (const char* previous = std::getenv(name)) {
            previous_ = previous;
        }
        setenv(name, value, 1);
    }

    ~ScopedEnv() {
        if (previous_) {
            setenv(name_, previous_->c_str(), 1);
        } else {
            unsetenv(name_);
        }
    }

  private:
    const char* name_;
    std::optional<std::string> previous_;
};

class TempConfigFile {
  public:
    explicit TempConfigFile(const std::string& content) {
        path_ = std::filesystem::temp_directory_path() /
                ("devicename_config_" +
                 std::to_string(std::chrono::system_clock::now().time_since_epoch().count()) +
                 ".json");
        std::ofstream file(path_);
        file << content;
    }

    ~TempConfigFile() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    std::string path() const { return path_.string(); }

  private:
    std::filesystem::path path_;
};

// ==================== Defaults ====================

TEST(ConfigTest, Defaults) {
    Config config;

    EXPECT_EQ(config.suffix_digit_count, 7);
    EXPECT_FALSE(config.dry_run);
    EXPECT_EQ(config.log_level, "info");
    EXPECT_TRUE(config.model_override.empty());
    EXPECT_TRUE(config.uuid_override.empty());
    EXPECT_EQ(config.dmi_path, "/sys/class/dmi/id");
    EXPECT_TRUE(validate_config(config).is_ok());
}

// ==================== JSON ====================

TEST(ConfigJsonTest, AppliesKnownKeys) {
    Config config;
    auto j = nlohmann::json::parse(R"({
        "suffix_digit_count": 5,
        "dry_run": true,
        "log_level": "debug",
        "model_identifier": "Z1AU001HXB/A",
        "hardware_uuid": "ABCDE-1234-653894A",
        "dmi_path": "/tmp/dmi",
        "unrelated": [1, 2, 3]
    })");

    auto result = apply_config_json(j, config);
    ASSERT_TRUE(result.is_ok()) << result.error_message();

    EXPECT_EQ(config.suffix_digit_count, 5);
    EXPECT_TRUE(config.dry_run);
    EXPECT_EQ(config.log_level, "debug");
    EXPECT_EQ(config.model_override, "Z1AU001HXB/A");
    EXPECT_EQ(config.uuid_override, "ABCDE-1234-653894A");
    EXPECT_EQ(config.dmi_path, "/tmp/dmi");
}

TEST(ConfigJsonTest, WrongTypeIsConfigError) {
    Config config;
    auto j = nlohmann::json::parse(R"({"suffix_digit_count": "seven"})");

    auto result = apply_config_json(j, config);
    EXPECT_EQ(result.error_code(), ErrorCode::ConfigError);
    EXPECT_EQ(config.suffix_digit_count, 7);
}

TEST(ConfigJsonTest, NonObjectIsConfigError) {
    Config config;
    EXPECT_EQ(apply_config_json(nlohmann::json::array(), config).error_code(),
              ErrorCode::ConfigError);
}

TEST(ConfigFileTest, LoadsFile) {
    TempConfigFile file(R"({"suffix_digit_count": 4})");

    auto result = load_config_file(file.path());
    ASSERT_TRUE(result.is_ok()) << result.error_message();
    EXPECT_EQ(result.value().suffix_digit_count, 4);
    EXPECT_EQ(result.value().log_level, "info");
}

TEST(ConfigFileTest, MissingFile) {
    auto result = load_config_file("/nonexistent/devicename.json");
    EXPECT_EQ(result.error_code(), ErrorCode::ConfigError);
}

TEST(ConfigFileTest, MalformedJson) {
    TempConfigFile file("{ not json");

    auto result = load_config_file(file.path());
    EXPECT_EQ(result.error_code(), ErrorCode::ConfigError);
    EXPECT_NE(result.error_message().find(file.path()), std::string::npos);
}

// ==================== Environment ====================

TEST(ConfigEnvTest, OverridesFromEnvironment) {
    ScopedEnv digits(ENV_SUFFIX_DIGITS, "6");
    ScopedEnv dry_run(ENV_DRY_RUN, "yes");
    ScopedEnv level(ENV_LOG_LEVEL, "warning");

    Config config;
    auto result = apply_environment(config);
    ASSERT_TRUE(result.is_ok()) << result.error_message();

    EXPECT_EQ(config.suffix_digit_count, 6);
    EXPECT_TRUE(config.dry_run);
    EXPECT_EQ(config.log_level, "warning");
}

TEST(ConfigEnvTest, BadDigitCount) {
    ScopedEnv digits(ENV_SUFFIX_DIGITS, "7x");

    Config config;
    EXPECT_EQ(apply_environment(config).error_code(), ErrorCode::ConfigError);
}

TEST(ConfigEnvTest, BadBoolean) {
    ScopedEnv dry_run(ENV_DRY_RUN, "maybe");

    Config config;
    EXPECT_EQ(apply_environment(config).error_code(), ErrorCode::ConfigError);
}

// ==================== Validation ====================

TEST(ConfigValidateTest, RejectsNonPositiveDigitCount) {
    Config config;
    config.suffix_digit_count = 0;
    EXPECT_EQ(validate_config(config).error_code(), ErrorCode::ConfigError);

    config.suffix_digit_count = -1;
    EXPECT_EQ(validate_config(config).error_code(), ErrorCode::ConfigError);
}

TEST(ConfigValidateTest, RejectsUnknownLogLevel) {
    Config config;
    config.log_level = "chatty";
    EXPECT_EQ(validate_config(config).error_code(), ErrorCode::ConfigError);
}

}  // namespace
}  // namespace devicename
