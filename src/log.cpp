#include "devicename/log.hpp"

#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>

#include <iostream>

namespace devicename {

namespace logging = boost::log;

std::optional<LogLevel> parse_log_level(const std::string& level) {
    if (level == "trace")
        return logging::trivial::trace;
    if (level == "debug")
        return logging::trivial::debug;
    if (level == "info")
        return logging::trivial::info;
    if (level == "warning")
        return logging::trivial::warning;
    if (level == "error")
        return logging::trivial::error;
    if (level == "fatal")
        return logging::trivial::fatal;
    return std::nullopt;
}

void init_logging(const std::string& level) {
    static bool sink_installed = false;

    if (!sink_installed) {
        logging::add_console_log(
            std::clog, logging::keywords::format = "[%TimeStamp%] [%Severity%]: %Message%",
            logging::keywords::auto_flush = true);
        logging::add_common_attributes();
        sink_installed = true;
    }

    auto parsed = parse_log_level(level).value_or(logging::trivial::info);
    logging::core::get()->set_filter(logging::trivial::severity >= parsed);
}

}  // namespace devicename
