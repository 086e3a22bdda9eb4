#include "devicename/cli.hpp"
#include "devicename/config.hpp"

#include <boost/program_options.hpp>

#include <sstream>

namespace po = boost::program_options;

namespace devicename {

Result<CliOptions> parse_command_line(int argc, const char* const argv[]) {
    CliOptions options;

    po::options_description desc("Usage: devicename [options]\n\n"
                                 "Sets the computer name to <model>-<uuid suffix>.\n"
                                 "Requires root to apply the name.\n\nOptions");
    // clang-format off
    desc.add_options()
        ("help,h", "produce help message")
        ("version", "print version and exit")
        ("config,c", po::value<std::string>(&options.config_path), "JSON config file")
        ("digits,n", po::value<int>(), "number of trailing hardware UUID characters to use")
        ("dry-run", po::bool_switch(&options.dry_run), "print the derived name without applying it")
        ("verbose,v", po::value<std::string>(), "log level: trace|debug|info|warning|error|fatal")
        ("model", po::value<std::string>(), "use this model identifier instead of querying the hardware")
        ("uuid", po::value<std::string>(), "use this hardware UUID instead of querying the hardware");
    // clang-format on

    po::variables_map vm;
    try {
        po::store(po::command_line_parser(argc, argv).options(desc).run(), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        return Result<CliOptions>::error(ErrorCode::ConfigError, e.what());
    }

    std::ostringstream help;
    help << desc;
    options.help_text = help.str();
    options.show_help = vm.count("help") > 0;
    options.show_version = vm.count("version") > 0;

    if (vm.count("digits")) {
        options.suffix_digit_count = vm["digits"].as<int>();
    }
    if (vm.count("verbose")) {
        options.log_level = vm["verbose"].as<std::string>();
    }
    if (vm.count("model")) {
        options.model_override = vm["model"].as<std::string>();
    }
    if (vm.count("uuid")) {
        options.uuid_override = vm["uuid"].as<std::string>();
    }

    return Result<CliOptions>::ok(std::move(options));
}

Result<Config> resolve_config(const CliOptions& options) {
    Config config;

    if (!options.config_path.empty()) {
        auto loaded = load_config_file(options.config_path);
        if (loaded.is_error()) {
            return loaded;
        }
        config = std::move(loaded).value();
    }

    auto env = apply_environment(config);
    if (env.is_error()) {
        return Result<Config>::error(env.error_code(), env.error_message());
    }

    if (options.suffix_digit_count) {
        config.suffix_digit_count = *options.suffix_digit_count;
    }
    if (options.log_level) {
        config.log_level = *options.log_level;
    }
    if (options.model_override) {
        config.model_override = *options.model_override;
    }
    if (options.uuid_override) {
        config.uuid_override = *options.uuid_override;
    }
    if (options.dry_run) {
        config.dry_run = true;
    }

    auto valid = validate_config(config);
    if (valid.is_error()) {
        return Result<Config>::error(valid.error_code(), valid.error_message());
    }

    return Result<Config>::ok(std::move(config));
}

}  // namespace devicename
