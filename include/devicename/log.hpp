#pragma once

/**
 * @file log.hpp
 * @brief Logging setup for devicename
 *
 * Thin layer over Boost.Log's trivial logger. Records go to stderr so that
 * stdout carries only the operator-facing progress lines.
 */

#include <boost/log/trivial.hpp>

#include <optional>
#include <string>

/// Log a record at the given boost::log::trivial severity (trace ... fatal)
#define DEVICENAME_LOG(severity) BOOST_LOG_TRIVIAL(severity)

namespace devicename {

using LogLevel = boost::log::trivial::severity_level;

/// Parse "trace", "debug", "info", "warning", "error" or "fatal"
[[nodiscard]] std::optional<LogLevel> parse_log_level(const std::string& level);

/**
 * @brief Install the stderr sink and the severity filter
 *
 * Unknown levels fall back to info. Safe to call more than once; the sink is
 * only added the first time.
 */
void init_logging(const std::string& level);

}  // namespace devicename
