#pragma once

/**
 * @file identity.hpp
 * @brief Applying a derived name to the host identity
 *
 * The host identity has three slots: the display name, the hostname and the
 * local hostname. The display slot receives the candidate name, the two
 * hostname slots receive the sanitized form.
 */

#include "devicename/devicename.hpp"
#include "devicename/process.hpp"

#include <memory>
#include <string>
#include <vector>

namespace devicename {

/**
 * @brief Identity slot written by an applier
 */
enum class IdentitySlot {
    DisplayName,   // macOS ComputerName, systemd pretty hostname
    HostName,      // macOS HostName, systemd static hostname
    LocalHostName  // macOS LocalHostName (Bonjour), systemd transient hostname
};

/// Convert identity slot to string
[[nodiscard]] constexpr const char* identity_slot_to_string(IdentitySlot slot) noexcept {
    switch (slot) {
        case IdentitySlot::DisplayName:
            return "display name";
        case IdentitySlot::HostName:
            return "hostname";
        case IdentitySlot::LocalHostName:
            return "local hostname";
    }
    return "unknown";
}

/**
 * @brief Interface for applying names to the host identity
 */
class IdentityApplier {
  public:
    virtual ~IdentityApplier() = default;

    /**
     * @brief Apply the display name and the hostname-safe name
     *
     * A failure after some slots were written is reported as ApplyFailed and
     * the message lists the slots already applied.
     */
    virtual Result<void> apply_identity(const std::string& display_name,
                                        const std::string& hostname_safe_name) = 0;
};

/**
 * @brief Applier that writes each slot with one external command
 *
 * Slots are written in order DisplayName, HostName, LocalHostName and the
 * sequence stops at the first failing command.
 */
class CommandIdentityApplier : public IdentityApplier {
  public:
    explicit CommandIdentityApplier(CommandRunner& runner) : runner_(runner) {}

    Result<void> apply_identity(const std::string& display_name,
                                const std::string& hostname_safe_name) override;

    /// Command that writes @p value into @p slot
    [[nodiscard]] virtual std::vector<std::string> command_for(IdentitySlot slot,
                                                               const std::string& value) const = 0;

  private:
    CommandRunner& runner_;
};

/**
 * @brief macOS applier using scutil --set
 */
class ScutilApplier : public CommandIdentityApplier {
  public:
    using CommandIdentityApplier::CommandIdentityApplier;

    [[nodiscard]] std::vector<std::string> command_for(IdentitySlot slot,
                                                       const std::string& value) const override;
};

/**
 * @brief Linux applier using systemd's hostnamectl
 */
class HostnamectlApplier : public CommandIdentityApplier {
  public:
    using CommandIdentityApplier::CommandIdentityApplier;

    [[nodiscard]] std::vector<std::string> command_for(IdentitySlot slot,
                                                       const std::string& value) const override;
};

/**
 * @brief Create the identity applier for the build platform
 *
 * @return nullptr on platforms without an applier
 */
[[nodiscard]] std::unique_ptr<IdentityApplier> make_platform_applier(CommandRunner& runner);

/// Whether the process may change the host identity (effective uid 0)
[[nodiscard]] bool has_admin_privilege();

}  // namespace devicename
