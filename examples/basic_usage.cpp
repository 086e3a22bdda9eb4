/**
 * @file basic_usage.cpp
 * @brief Basic usage example for the devicename library
 *
 * This example demonstrates how to:
 * - Derive a device name from known hardware values
 * - Read the hardware values of the current machine
 * - Run the full naming sequence as a dry run
 * - Handle errors using the Result type
 */

#include <devicename/devicename.hpp>
#include <devicename/hardware.hpp>
#include <devicename/identity.hpp>
#include <devicename/log.hpp>
#include <devicename/naming.hpp>
#include <devicename/process.hpp>
#include <devicename/runner.hpp>

#include <iostream>

int main() {
    devicename::init_logging("warning");

    // Example 1: Derive names from fixed values
    std::cout << "=== Derivation ===\n";
    {
        auto result = devicename::derive_names("Z1AU001HXB/A", "ABCDE-1234-653894A", 7);
        if (result.is_ok()) {
            std::cout << "Computer name: " << result.value().candidate_name << "\n";
            std::cout << "Hostname:      " << result.value().sanitized_hostname << "\n";
        } else {
            std::cout << "Error: " << result.error_message() << "\n";
        }
    }

    // Example 2: A UUID that is too short for the configured suffix
    std::cout << "\n=== Error Handling ===\n";
    {
        auto result = devicename::derive_names("Z1AU001HXB/A", "1234", 7);
        if (result.is_error()) {
            std::cout << devicename::error_code_to_string(result.error_code()) << " (exit "
                      << devicename::exit_code_for(result.error_code())
                      << "): " << result.error_message() << "\n";
        }
    }

    // Example 3: Read this machine's hardware values
    std::cout << "\n=== Hardware ===\n";
    devicename::ProcessRunner process_runner;
    devicename::Config config;
    auto source = devicename::make_platform_source(process_runner, config);
    {
        auto model = source->read_model_identifier();
        auto uuid = source->read_hardware_uuid();
        std::cout << "Model: " << (model.is_ok() ? model.value() : model.error_message()) << "\n";
        std::cout << "UUID:  " << (uuid.is_ok() ? uuid.value() : uuid.error_message()) << "\n";
    }

    // Example 4: Full sequence without touching the host identity
    std::cout << "\n=== Dry Run ===\n";
    {
        config.dry_run = true;
        devicename::NameRunner runner(config, *source, nullptr, std::cout);
        auto result = runner.run(devicename::has_admin_privilege());
        if (result.is_error()) {
            std::cout << "Would exit with " << devicename::exit_code_for(result.error_code())
                      << "\n";
        }
    }

    return 0;
}
