#pragma once

#include <expected>
#include <sys/types.h>

namespace pylauncher {

// Exit code as a shell reports it: the exit status, or 128 + signal number.
[[nodiscard]] int wait_status_to_exit_code(int status) noexcept;

// Waits for pid, retrying on EINTR. Yields the exit code or the waitpid errno.
[[nodiscard]] std::expected<int, int> wait_for_process(pid_t pid) noexcept;

} // namespace pylauncher
