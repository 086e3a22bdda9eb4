#pragma once

/**
 * @file cli.hpp
 * @brief Command-line handling for the devicename tool
 */

#include "devicename/devicename.hpp"

#include <optional>
#include <string>

namespace devicename {

/**
 * @brief Options given on the command line
 *
 * Unset optionals leave the config file / environment value in place.
 */
struct CliOptions {
    bool show_help = false;
    bool show_version = false;
    std::string help_text;

    std::string config_path;
    std::optional<int> suffix_digit_count;
    std::optional<std::string> log_level;
    std::optional<std::string> model_override;
    std::optional<std::string> uuid_override;
    bool dry_run = false;
};

/**
 * @brief Parse argv with boost::program_options
 *
 * @return ConfigError on unknown options or malformed values
 */
[[nodiscard]] Result<CliOptions> parse_command_line(int argc, const char* const argv[]);

/**
 * @brief Build the effective config for a run
 *
 * Layers defaults, the config file (if given), the environment and
 * @p options, then validates the result.
 */
[[nodiscard]] Result<Config> resolve_config(const CliOptions& options);

}  // namespace devicename
