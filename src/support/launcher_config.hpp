#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include "support/logger.hpp"

namespace pylauncher {

enum class DispatchStrategy {
    Replace,
    Spawn,
};

struct LauncherConfig {
    std::string search_path;
    std::filesystem::path virtual_env;
    std::optional<std::string> default_version;
    std::map<int, std::string> major_defaults;
    std::filesystem::path forced_interpreter;
    std::filesystem::path working_directory;
    std::string launcher_name{"py"};
    LogLevel log_level{LogLevel::Error};
    DispatchStrategy dispatch_strategy{DispatchStrategy::Replace};

    [[nodiscard]] static LauncherConfig from_environment(std::string_view argv0);

    [[nodiscard]] std::optional<std::string> major_default(int major) const;
};

[[nodiscard]] std::string expand_tilde(std::string_view path);

} // namespace pylauncher
