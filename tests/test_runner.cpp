#include <gtest/gtest.h>
#include <devicename/runner.hpp>

#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace devicename {
namespace {

// Records apply_identity calls and fails on request
class RecordingApplier : public IdentityApplier {
  public:
    Result<void> apply_identity(const std::string& display_name,
                                const std::string& hostname_safe_name) override {
        calls.emplace_back(display_name, hostname_safe_name);
        if (fail) {
            return Result<void>::error(ErrorCode::ApplyFailed,
                                       "Failed to set hostname; already applied: display name");
        }
        return Result<void>::ok();
    }

    bool fail = false;
    std::vector<std::pair<std::string, std::string>> calls;
};

class NameRunnerTest : public ::testing::Test {
  protected:
    Config config;
    StaticHardwareSource source{HardwareInfo{"Z1AU001HXB/A", "ABCDE-1234-653894A"}};
    RecordingApplier applier;
    std::ostringstream out;
};

TEST_F(NameRunnerTest, AppliesDerivedName) {
    NameRunner runner(config, source, &applier, out);

    auto result = runner.run(true);
    ASSERT_TRUE(result.is_ok()) << result.error_message();

    EXPECT_EQ(result.value().candidate_name, "Z1AU001HXBA-653894A");
    ASSERT_EQ(applier.calls.size(), 1u);
    EXPECT_EQ(applier.calls[0].first, "Z1AU001HXBA-653894A");
    EXPECT_EQ(applier.calls[0].second, "Z1AU001HXBA653894A");

    EXPECT_NE(out.str().find("Setting Computer name to Z1AU001HXBA-653894A"), std::string::npos);
    EXPECT_NE(out.str().find("Setting Hostname to Z1AU001HXBA653894A"), std::string::npos);
}

TEST_F(NameRunnerTest, WithoutPrivilege) {
    NameRunner runner(config, source, &applier, out);

    auto result = runner.run(false);

    EXPECT_EQ(result.error_code(), ErrorCode::InsufficientPrivilege);
    EXPECT_EQ(exit_code_for(result.error_code()), 3);
    EXPECT_TRUE(applier.calls.empty());
    EXPECT_NE(out.str().find("cannot set computer name to Z1AU001HXBA-653894A (Z1AU001HXBA653894A)"),
              std::string::npos);
}

TEST_F(NameRunnerTest, ShortUuid) {
    StaticHardwareSource short_uuid(HardwareInfo{"Z1AU001HXB/A", "1234"});
    NameRunner runner(config, short_uuid, &applier, out);

    auto result = runner.run(true);

    EXPECT_EQ(result.error_code(), ErrorCode::InvalidDigitCount);
    EXPECT_EQ(exit_code_for(result.error_code()), 2);
    EXPECT_TRUE(applier.calls.empty());
}

TEST_F(NameRunnerTest, MissingMetadata) {
    StaticHardwareSource no_uuid(HardwareInfo{"Z1AU001HXB/A", ""});
    NameRunner runner(config, no_uuid, &applier, out);

    auto result = runner.run(true);

    EXPECT_EQ(result.error_code(), ErrorCode::MetadataUnavailable);
    EXPECT_TRUE(applier.calls.empty());
    EXPECT_NE(out.str().find("could not read the hardware UUID"), std::string::npos);
}

TEST_F(NameRunnerTest, CustomDigitCount) {
    config.suffix_digit_count = 4;
    NameRunner runner(config, source, &applier, out);

    auto result = runner.run(true);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().candidate_name, "Z1AU001HXBA-894A");
}

TEST_F(NameRunnerTest, DryRunDoesNotApply) {
    config.dry_run = true;
    NameRunner runner(config, source, nullptr, out);

    auto result = runner.run(false);
    ASSERT_TRUE(result.is_ok()) << result.error_message();
    EXPECT_EQ(result.value().sanitized_hostname, "Z1AU001HXBA653894A");
    EXPECT_NE(out.str().find("Dry run"), std::string::npos);
}

TEST_F(NameRunnerTest, ApplyFailureIsReported) {
    applier.fail = true;
    NameRunner runner(config, source, &applier, out);

    auto result = runner.run(true);

    EXPECT_EQ(result.error_code(), ErrorCode::ApplyFailed);
    EXPECT_EQ(exit_code_for(result.error_code()), 5);
    EXPECT_NE(out.str().find("already applied: display name"), std::string::npos);
}

TEST_F(NameRunnerTest, NoApplierOnPlatform) {
    NameRunner runner(config, source, nullptr, out);

    EXPECT_EQ(runner.run(true).error_code(), ErrorCode::ApplyFailed);
}

}  // namespace
}  // namespace devicename
