#pragma once

#include <expected>
#include <filesystem>
#include <span>
#include <string>
#include <vector>

#include "core/errors.hpp"
#include "support/launcher_config.hpp"

namespace pylauncher {

class Dispatcher {
  public:
    explicit Dispatcher(DispatchStrategy strategy = DispatchStrategy::Replace);

    // Replace: execve() the interpreter in place of this process; only an
    // error ever comes back. Spawn: run it as a child and yield its exit code.
    [[nodiscard]] std::expected<int, DispatchError> dispatch(
        const std::filesystem::path &executable, std::span<const std::string> args, char *const *envp) const;

    [[nodiscard]] DispatchStrategy strategy() const noexcept { return strategy_; }

  private:
    DispatchStrategy strategy_;

    [[nodiscard]] DispatchError replace_process(const std::string &executable, std::span<const std::string> args, char *const *envp) const;
    [[nodiscard]] std::expected<int, DispatchError> spawn_and_wait(
        const std::string &executable, std::span<const std::string> args, char *const *envp) const;

    [[nodiscard]] static std::vector<char *> build_argv(const std::string &executable, std::span<const std::string> args);
    [[nodiscard]] static DispatchError make_error(const std::string &executable, int error_number);
};

} // namespace pylauncher
