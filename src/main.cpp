/**
 * @file main.cpp
 * @brief devicename command-line entry point
 *
 * Derives <model>-<uuid suffix> from the hardware metadata and sets it as the
 * computer name, hostname and local hostname. Run as root.
 */

#include <devicename/cli.hpp>
#include <devicename/devicename.hpp>
#include <devicename/hardware.hpp>
#include <devicename/identity.hpp>
#include <devicename/log.hpp>
#include <devicename/process.hpp>
#include <devicename/runner.hpp>

#include <iostream>

int main(int argc, char* argv[]) {
    // Default filter until the configured level is known
    devicename::init_logging("info");

    auto options = devicename::parse_command_line(argc, argv);
    if (options.is_error()) {
        std::cerr << options.error_message() << "\n";
        return devicename::exit_code_for(options.error_code());
    }

    if (options.value().show_help) {
        std::cout << options.value().help_text << "\n";
        return 0;
    }
    if (options.value().show_version) {
        std::cout << "devicename " << devicename::VERSION << "\n";
        return 0;
    }

    auto config = devicename::resolve_config(options.value());
    if (config.is_error()) {
        std::cerr << config.error_message() << "\n";
        return devicename::exit_code_for(config.error_code());
    }

    devicename::init_logging(config.value().log_level);

    devicename::ProcessRunner process_runner;
    auto source = devicename::make_platform_source(process_runner, config.value());
    auto applier = devicename::make_platform_applier(process_runner);

    devicename::NameRunner runner(config.value(), *source, applier.get(), std::cout);
    auto result = runner.run(devicename::has_admin_privilege());
    if (result.is_error()) {
        DEVICENAME_LOG(error) << devicename::error_code_to_string(result.error_code()) << ": "
                              << result.error_message();
        return devicename::exit_code_for(result.error_code());
    }

    return 0;
}
