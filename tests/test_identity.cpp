#include <gtest/gtest.h>
#include <devicename/identity.hpp>

#include "fake_command_runner.hpp"

#include <string>
#include <vector>

namespace devicename {
namespace {

using Command = std::vector<std::string>;

// ==================== ScutilApplier Tests ====================

TEST(ScutilApplierTest, SetsAllThreeSlots) {
    test_support::FakeCommandRunner runner;
    ScutilApplier applier(runner);

    auto result = applier.apply_identity("Z1AU001HXBA-653894A", "Z1AU001HXBA653894A");
    ASSERT_TRUE(result.is_ok()) << result.error_message();

    ASSERT_EQ(runner.calls.size(), 3u);
    EXPECT_EQ(runner.calls[0], (Command{"scutil", "--set", "ComputerName", "Z1AU001HXBA-653894A"}));
    EXPECT_EQ(runner.calls[1], (Command{"scutil", "--set", "HostName", "Z1AU001HXBA653894A"}));
    EXPECT_EQ(runner.calls[2], (Command{"scutil", "--set", "LocalHostName", "Z1AU001HXBA653894A"}));
}

TEST(ScutilApplierTest, DisplayNameWithSpacesIsOneArgument) {
    test_support::FakeCommandRunner runner;
    ScutilApplier applier(runner);

    ASSERT_TRUE(applier.apply_identity("Mac Book-1234567", "MacBook1234567").is_ok());
    EXPECT_EQ(runner.calls[0].size(), 4u);
    EXPECT_EQ(runner.calls[0][3], "Mac Book-1234567");
}

TEST(ScutilApplierTest, PartialFailureIsReported) {
    test_support::FakeCommandRunner runner;
    runner.respond("scutil --set HostName Z1AU001HXBA653894A", 1, "", "SCPreferencesCommitChanges failed");
    ScutilApplier applier(runner);

    auto result = applier.apply_identity("Z1AU001HXBA-653894A", "Z1AU001HXBA653894A");

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error_code(), ErrorCode::ApplyFailed);
    EXPECT_NE(result.error_message().find("Failed to set hostname"), std::string::npos);
    EXPECT_NE(result.error_message().find("already applied: display name"), std::string::npos);
    EXPECT_NE(result.error_message().find("SCPreferencesCommitChanges failed"), std::string::npos);

    // Stops at the first failure
    EXPECT_EQ(runner.calls.size(), 2u);
}

TEST(ScutilApplierTest, LaunchFailureOnFirstSlot) {
    test_support::FakeCommandRunner runner;
    runner.launch_failures["scutil --set ComputerName Z1AU001HXBA-653894A"] =
        "Could not execute scutil";
    ScutilApplier applier(runner);

    auto result = applier.apply_identity("Z1AU001HXBA-653894A", "Z1AU001HXBA653894A");

    EXPECT_EQ(result.error_code(), ErrorCode::ApplyFailed);
    EXPECT_NE(result.error_message().find("already applied: none"), std::string::npos);
    EXPECT_EQ(runner.calls.size(), 1u);
}

// ==================== HostnamectlApplier Tests ====================

TEST(HostnamectlApplierTest, SetsPrettyStaticAndTransient) {
    test_support::FakeCommandRunner runner;
    HostnamectlApplier applier(runner);

    auto result = applier.apply_identity("LENOVO_MT_20XW-4A3732", "LENOVO_MT_20XW4A3732");
    ASSERT_TRUE(result.is_ok()) << result.error_message();

    ASSERT_EQ(runner.calls.size(), 3u);
    EXPECT_EQ(runner.calls[0],
              (Command{"hostnamectl", "set-hostname", "--pretty", "LENOVO_MT_20XW-4A3732"}));
    EXPECT_EQ(runner.calls[1],
              (Command{"hostnamectl", "set-hostname", "--static", "LENOVO_MT_20XW4A3732"}));
    EXPECT_EQ(runner.calls[2],
              (Command{"hostnamectl", "set-hostname", "--transient", "LENOVO_MT_20XW4A3732"}));
}

TEST(HostnamectlApplierTest, LastSlotFailureListsEarlierSlots) {
    test_support::FakeCommandRunner runner;
    runner.respond("hostnamectl set-hostname --transient H", 1, "", "Access denied");
    HostnamectlApplier applier(runner);

    auto result = applier.apply_identity("D-1", "H");

    EXPECT_EQ(result.error_code(), ErrorCode::ApplyFailed);
    EXPECT_NE(result.error_message().find("already applied: display name, hostname"),
              std::string::npos);
}

// ==================== Misc ====================

TEST(IdentitySlotTest, ToString) {
    EXPECT_STREQ(identity_slot_to_string(IdentitySlot::DisplayName), "display name");
    EXPECT_STREQ(identity_slot_to_string(IdentitySlot::HostName), "hostname");
    EXPECT_STREQ(identity_slot_to_string(IdentitySlot::LocalHostName), "local hostname");
}

TEST(PlatformApplierTest, ExistsOnSupportedPlatforms) {
    test_support::FakeCommandRunner runner;
    auto applier = make_platform_applier(runner);
#if defined(__APPLE__) || defined(__linux__)
    EXPECT_NE(applier, nullptr);
#else
    EXPECT_EQ(applier, nullptr);
#endif
}

}  // namespace
}  // namespace devicename
