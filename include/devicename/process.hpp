#pragma once

/**
 * @file process.hpp
 * @brief External command execution for devicename
 *
 * Hardware queries and identity changes go through host utilities
 * (system_profiler, scutil, hostnamectl). They are run without a shell, so
 * arguments derived from hardware metadata are passed through verbatim.
 */

#include "devicename/devicename.hpp"

#include <string>
#include <vector>

namespace devicename {

/**
 * @brief Captured outcome of a finished command
 */
struct CommandResult {
    int exit_code = -1;
    std::string stdout_data;
    std::string stderr_data;

    [[nodiscard]] bool success() const noexcept { return exit_code == 0; }
};

/**
 * @brief Interface for running external commands
 */
class CommandRunner {
  public:
    virtual ~CommandRunner() = default;

    /**
     * @brief Run a command to completion
     *
     * @param args Program name followed by its arguments
     * @return The captured result, or CommandFailed if the command could not
     *         be launched at all. A non-zero exit is reported in the result,
     *         not as an error.
     */
    virtual Result<CommandResult> run(const std::vector<std::string>& args) = 0;
};

/**
 * @brief Runs commands as child processes (fork/exec, PATH lookup)
 */
class ProcessRunner : public CommandRunner {
  public:
    Result<CommandResult> run(const std::vector<std::string>& args) override;
};

/// Render an argument vector for log messages
[[nodiscard]] std::string describe_command(const std::vector<std::string>& args);

}  // namespace devicename
