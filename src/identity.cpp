#include "devicename/identity.hpp"
#include "devicename/hardware.hpp"
#include "devicename/log.hpp"

#include <unistd.h>

namespace devicename {

namespace {

constexpr IdentitySlot SLOT_ORDER[] = {IdentitySlot::DisplayName, IdentitySlot::HostName,
                                       IdentitySlot::LocalHostName};

std::string join_slots(const std::vector<IdentitySlot>& slots) {
    if (slots.empty()) {
        return "none";
    }
    std::string out;
    for (auto slot : slots) {
        if (!out.empty()) {
            out += ", ";
        }
        out += identity_slot_to_string(slot);
    }
    return out;
}

}  // namespace

Result<void> CommandIdentityApplier::apply_identity(const std::string& display_name,
                                                    const std::string& hostname_safe_name) {
    std::vector<IdentitySlot> applied;

    for (auto slot : SLOT_ORDER) {
        const std::string& value =
            slot == IdentitySlot::DisplayName ? display_name : hostname_safe_name;
        auto command = command_for(slot, value);

        auto result = runner_.run(command);
        std::string failure;
        if (result.is_error()) {
            failure = result.error_message();
        } else if (!result.value().success()) {
            failure = describe_command(command) + " exited with " +
                      std::to_string(result.value().exit_code);
            auto detail = trim(result.value().stderr_data);
            if (!detail.empty()) {
                failure += ": " + detail;
            }
        }

        if (!failure.empty()) {
            DEVICENAME_LOG(error) << "Setting " << identity_slot_to_string(slot)
                                  << " failed: " << failure;
            return Result<void>::error(ErrorCode::ApplyFailed,
                                       "Failed to set " +
                                           std::string(identity_slot_to_string(slot)) + " (" +
                                           failure + "); already applied: " + join_slots(applied));
        }

        DEVICENAME_LOG(debug) << "Set " << identity_slot_to_string(slot) << " to " << value;
        applied.push_back(slot);
    }

    return Result<void>::ok();
}

std::vector<std::string> ScutilApplier::command_for(IdentitySlot slot,
                                                    const std::string& value) const {
    switch (slot) {
        case IdentitySlot::DisplayName:
            return {"scutil", "--set", "ComputerName", value};
        case IdentitySlot::HostName:
            return {"scutil", "--set", "HostName", value};
        case IdentitySlot::LocalHostName:
            return {"scutil", "--set", "LocalHostName", value};
    }
    return {};
}

std::vector<std::string> HostnamectlApplier::command_for(IdentitySlot slot,
                                                         const std::string& value) const {
    switch (slot) {
        case IdentitySlot::DisplayName:
            return {"hostnamectl", "set-hostname", "--pretty", value};
        case IdentitySlot::HostName:
            return {"hostnamectl", "set-hostname", "--static", value};
        case IdentitySlot::LocalHostName:
            return {"hostnamectl", "set-hostname", "--transient", value};
    }
    return {};
}

std::unique_ptr<IdentityApplier> make_platform_applier(CommandRunner& runner) {
#if defined(__APPLE__)
    return std::make_unique<ScutilApplier>(runner);
#elif defined(__linux__)
    return std::make_unique<HostnamectlApplier>(runner);
#else
    (void)runner;
    return nullptr;
#endif
}

bool has_admin_privilege() {
    return geteuid() == 0;
}

}  // namespace devicename
