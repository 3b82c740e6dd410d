#include "execution/process_status.hpp"

#include <cerrno>

#include <sys/wait.h>

namespace pylauncher {

int wait_status_to_exit_code(int status) noexcept {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }

    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }

    return 1;
}

std::expected<int, int> wait_for_process(pid_t pid) noexcept {
    int status = 0;

    while (waitpid(pid, &status, 0) == -1) {
        if (errno == EINTR) {
            continue;
        }

        return std::unexpected(errno);
    }

    return wait_status_to_exit_code(status);
}

} // namespace pylauncher
