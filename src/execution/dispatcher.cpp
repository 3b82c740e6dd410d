#include "execution/dispatcher.hpp"

#include <array>
#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <format>
#include <iostream>

#include <fcntl.h>
#include <unistd.h>

#include "execution/process_status.hpp"
#include "support/logger.hpp"

namespace pylauncher {

namespace {

class IgnoreTerminalSignals {
  public:
    IgnoreTerminalSignals() {
        struct sigaction ignore {};
        ignore.sa_handler = SIG_IGN;
        sigemptyset(&ignore.sa_mask);
        sigaction(SIGINT, &ignore, &saved_int_);
        sigaction(SIGQUIT, &ignore, &saved_quit_);
    }

    ~IgnoreTerminalSignals() { restore(); }

    IgnoreTerminalSignals(const IgnoreTerminalSignals &) = delete;
    IgnoreTerminalSignals &operator=(const IgnoreTerminalSignals &) = delete;

    void restore() const noexcept {
        sigaction(SIGINT, &saved_int_, nullptr);
        sigaction(SIGQUIT, &saved_quit_, nullptr);
    }

  private:
    struct sigaction saved_int_ {};
    struct sigaction saved_quit_ {};
};

void flush_standard_streams() {
    std::cout.flush();
    std::cerr.flush();
    std::fflush(nullptr);
}

[[nodiscard]] bool read_exec_errno(int fd, int &error_number) noexcept {
    std::array<char, sizeof(int)> bytes{};
    std::size_t received = 0;

    while (received < bytes.size()) {
        const ssize_t n = read(fd, bytes.data() + received, bytes.size() - received);
        if (n > 0) {
            received += static_cast<std::size_t>(n);
            continue;
        }

        if (n == -1 && errno == EINTR) {
            continue;
        }

        break;
    }

    if (received != bytes.size()) {
        return false;
    }

    std::memcpy(&error_number, bytes.data(), bytes.size());
    return true;
}

} // namespace

Dispatcher::Dispatcher(DispatchStrategy strategy) : strategy_(strategy) {}

std::vector<char *> Dispatcher::build_argv(const std::string &executable, std::span<const std::string> args) {
    std::vector<char *> argv;
    argv.reserve(args.size() + 2);

    argv.push_back(const_cast<char *>(executable.c_str()));
    for (const auto &arg : args) {
        argv.push_back(const_cast<char *>(arg.c_str()));
    }
    argv.push_back(nullptr);

    return argv;
}

DispatchError Dispatcher::make_error(const std::string &executable, int error_number) {
    return DispatchError{
        .executable = executable,
        .error_number = error_number,
        .message = std::format("failed to execute {}: {}", executable, std::strerror(error_number)),
    };
}

std::expected<int, DispatchError> Dispatcher::dispatch(
    const std::filesystem::path &executable, std::span<const std::string> args, char *const *envp) const {
    const std::string executable_string = executable.string();
    Logger::debug("dispatching to {} with {} argument(s)", executable_string, args.size());

    flush_standard_streams();

    if (strategy_ == DispatchStrategy::Spawn) {
        return spawn_and_wait(executable_string, args, envp);
    }

    return std::unexpected(replace_process(executable_string, args, envp));
}

DispatchError Dispatcher::replace_process(
    const std::string &executable, std::span<const std::string> args, char *const *envp) const {
    auto argv = build_argv(executable, args);
    execve(executable.c_str(), argv.data(), envp);
    return make_error(executable, errno);
}

std::expected<int, DispatchError> Dispatcher::spawn_and_wait(
    const std::string &executable, std::span<const std::string> args, char *const *envp) const {
    auto argv = build_argv(executable, args);

    int status_pipe[2];
    if (pipe2(status_pipe, O_CLOEXEC) == -1) {
        return std::unexpected(make_error(executable, errno));
    }

    const IgnoreTerminalSignals ignore_signals;

    const pid_t pid = fork();
    if (pid == -1) {
        const int error_number = errno;
        close(status_pipe[0]);
        close(status_pipe[1]);
        return std::unexpected(make_error(executable, error_number));
    }

    if (pid == 0) {
        ignore_signals.restore();
        close(status_pipe[0]);

        execve(executable.c_str(), argv.data(), envp);

        const int error_number = errno;
        [[maybe_unused]] const ssize_t written = write(status_pipe[1], &error_number, sizeof(error_number));
        _exit(127);
    }

    close(status_pipe[1]);

    int exec_errno = 0;
    const bool exec_failed = read_exec_errno(status_pipe[0], exec_errno);
    close(status_pipe[0]);

    const auto exit_code = wait_for_process(pid);

    if (exec_failed) {
        return std::unexpected(make_error(executable, exec_errno));
    }

    if (!exit_code.has_value()) {
        return std::unexpected(make_error(executable, exit_code.error()));
    }

    return *exit_code;
}

} // namespace pylauncher
