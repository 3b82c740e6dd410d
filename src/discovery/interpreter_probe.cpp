#include "discovery/interpreter_probe.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <string>

#include <fcntl.h>
#include <unistd.h>

#include "execution/process_status.hpp"
#include "support/logger.hpp"

namespace pylauncher {

namespace {

// Valid on both Python 2 and Python 3.
constexpr const char *kProbeScript =
    "import sys, struct; "
    "print('%d.%d.%d %d' % (sys.version_info[0], sys.version_info[1], sys.version_info[2], struct.calcsize('P') * 8))";

[[noreturn]] void exec_probe_in_child(const std::string &executable, int output_fd) noexcept {
    dup2(output_fd, STDOUT_FILENO);
    close(output_fd);

    const int null_fd = open("/dev/null", O_RDWR);
    if (null_fd != -1) {
        dup2(null_fd, STDIN_FILENO);
        dup2(null_fd, STDERR_FILENO);
        close(null_fd);
    }

    std::array<char *, 4> argv{
        const_cast<char *>(executable.c_str()),
        const_cast<char *>("-c"),
        const_cast<char *>(kProbeScript),
        nullptr,
    };

    execv(executable.c_str(), argv.data());
    _exit(127);
}

} // namespace

std::optional<ProbeResult> InterpreterProbe::parse_output(std::string_view output) {
    while (!output.empty() && (output.back() == '\n' || output.back() == '\r' || output.back() == ' ')) {
        output.remove_suffix(1);
    }

    const auto space = output.find(' ');
    if (space == std::string_view::npos) {
        return std::nullopt;
    }

    auto version = ExactVersion::parse(output.substr(0, space));
    if (!version.has_value()) {
        return std::nullopt;
    }

    ProbeResult result{.version = *version, .architecture = Architecture::Unknown};

    const auto bits = output.substr(space + 1);
    if (bits == "64") {
        result.architecture = Architecture::Bits64;
    } else if (bits == "32") {
        result.architecture = Architecture::Bits32;
    }

    return result;
}

std::optional<ProbeResult> InterpreterProbe::probe(const std::filesystem::path &executable) const {
    const std::string executable_string = executable.string();

    int output_pipe[2];
    if (pipe(output_pipe) == -1) {
        Logger::debug("pipe failed while probing {}: {}", executable_string, std::strerror(errno));
        return std::nullopt;
    }

    const pid_t pid = fork();
    if (pid == -1) {
        Logger::debug("fork failed while probing {}: {}", executable_string, std::strerror(errno));
        close(output_pipe[0]);
        close(output_pipe[1]);
        return std::nullopt;
    }

    if (pid == 0) {
        close(output_pipe[0]);
        exec_probe_in_child(executable_string, output_pipe[1]);
    }

    close(output_pipe[1]);

    std::string output;
    std::array<char, 256> buffer{};
    while (true) {
        const ssize_t n = read(output_pipe[0], buffer.data(), buffer.size());
        if (n > 0) {
            output.append(buffer.data(), static_cast<std::size_t>(n));
            continue;
        }

        if (n == -1 && errno == EINTR) {
            continue;
        }

        break;
    }
    close(output_pipe[0]);

    const auto exit_code = wait_for_process(pid);
    if (!exit_code.has_value()) {
        Logger::debug("waitpid failed while probing {}: {}", executable_string, std::strerror(exit_code.error()));
        return std::nullopt;
    }

    if (*exit_code != 0) {
        Logger::debug("probe of {} exited with status {}", executable_string, *exit_code);
        return std::nullopt;
    }

    auto result = parse_output(output);
    if (!result.has_value()) {
        Logger::debug("unrecognized probe output from {}: '{}'", executable_string, output);
    }

    return result;
}

} // namespace pylauncher
