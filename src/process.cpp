#include "devicename/process.hpp"
#include "devicename/log.hpp"

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace devicename {

namespace {

void close_pipe(int fds[2]) {
    if (fds[0] != -1) {
        close(fds[0]);
        fds[0] = -1;
    }
    if (fds[1] != -1) {
        close(fds[1]);
        fds[1] = -1;
    }
}

// Drain both pipes until the child closes them. Polling avoids a deadlock
// when the child fills one pipe while we block on the other.
void drain_pipes(int out_fd, int err_fd, std::string& out, std::string& err) {
    pollfd fds[2];
    fds[0].fd = out_fd;
    fds[0].events = POLLIN;
    fds[1].fd = err_fd;
    fds[1].events = POLLIN;

    int open_count = 2;
    char buffer[4096];

    while (open_count > 0) {
        int ready = poll(fds, 2, -1);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }

        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) {
                continue;
            }
            ssize_t n = read(fds[i].fd, buffer, sizeof(buffer));
            if (n > 0) {
                (i == 0 ? out : err).append(buffer, static_cast<std::size_t>(n));
                continue;
            }
            if (n < 0 && errno == EINTR) {
                continue;
            }
            fds[i].fd = -1;
            --open_count;
        }
    }
}

// Report errno to the parent through the status pipe and exit
[[noreturn]] void child_fail(int status_fd) {
    int err = errno;
    ssize_t written = write(status_fd, &err, sizeof(err));
    (void)written;
    _exit(127);
}

// Read the errno a child reported before exec. Returns 0 once exec succeeded,
// which closes the write end.
int read_exec_status(int status_fd) {
    int err = 0;
    ssize_t n;
    do {
        n = read(status_fd, &err, sizeof(err));
    } while (n == -1 && errno == EINTR);
    return n == static_cast<ssize_t>(sizeof(err)) ? err : 0;
}

}  // namespace

Result<CommandResult> ProcessRunner::run(const std::vector<std::string>& args) {
    if (args.empty()) {
        return Result<CommandResult>::error(ErrorCode::CommandFailed, "Empty command");
    }

    DEVICENAME_LOG(debug) << "Running: " << describe_command(args);

    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    int status_pipe[2] = {-1, -1};
    if (pipe(stdout_pipe) == -1 || pipe(stderr_pipe) == -1 || pipe(status_pipe) == -1 ||
        fcntl(status_pipe[1], F_SETFD, FD_CLOEXEC) == -1) {
        int err = errno;
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        close_pipe(status_pipe);
        return Result<CommandResult>::error(
            ErrorCode::CommandFailed,
            std::string("Failed to create pipes: ") + std::strerror(err));
    }

    pid_t pid = fork();
    if (pid == -1) {
        int err = errno;
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        close_pipe(status_pipe);
        return Result<CommandResult>::error(
            ErrorCode::CommandFailed,
            "fork failed while launching " + args.front() + ": " + std::strerror(err));
    }

    if (pid == 0) {
        // child
        close(status_pipe[0]);
        if (dup2(stdout_pipe[1], STDOUT_FILENO) == -1 ||
            dup2(stderr_pipe[1], STDERR_FILENO) == -1) {
            child_fail(status_pipe[1]);
        }
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);

        std::vector<char*> argv;
        argv.reserve(args.size() + 1);
        for (const auto& arg : args) {
            argv.push_back(const_cast<char*>(arg.c_str()));
        }
        argv.push_back(nullptr);

        execvp(argv[0], argv.data());
        child_fail(status_pipe[1]);
    }

    close(stdout_pipe[1]);
    close(stderr_pipe[1]);
    close(status_pipe[1]);

    int exec_errno = read_exec_status(status_pipe[0]);
    close(status_pipe[0]);

    CommandResult result;
    drain_pipes(stdout_pipe[0], stderr_pipe[0], result.stdout_data, result.stderr_data);
    close(stdout_pipe[0]);
    close(stderr_pipe[0]);

    int status = 0;
    while (waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR) {
            return Result<CommandResult>::error(
                ErrorCode::CommandFailed,
                "waitpid failed for " + args.front() + ": " + std::strerror(errno));
        }
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = -1;
        result.stderr_data.append("\nProcess terminated by signal " +
                                  std::to_string(WTERMSIG(status)));
    }

    if (exec_errno != 0) {
        return Result<CommandResult>::error(
            ErrorCode::CommandFailed,
            "Could not execute " + args.front() + ": " + std::strerror(exec_errno));
    }

    DEVICENAME_LOG(debug) << args.front() << " exited with " << result.exit_code;
    return Result<CommandResult>::ok(std::move(result));
}

std::string describe_command(const std::vector<std::string>& args) {
    std::string out;
    for (const auto& arg : args) {
        if (!out.empty()) {
            out += ' ';
        }
        if (arg.empty() || arg.find_first_of(" \t'\"") != std::string::npos) {
            out += '"' + arg + '"';
        } else {
            out += arg;
        }
    }
    return out;
}

}  // namespace devicename
