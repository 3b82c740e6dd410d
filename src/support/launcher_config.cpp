#include "support/launcher_config.hpp"

#include <cctype>
#include <charconv>
#include <cstdlib>
#include <string>
#include <system_error>

#include <readline/tilde.h>
#include <unistd.h>

extern char **environ;

namespace pylauncher {

namespace fs = std::filesystem;

namespace {

constexpr std::string_view kDefaultVersionVariable = "PY_PYTHON";

[[nodiscard]] std::string env_or_empty(const char *name) {
    const char *value = std::getenv(name);
    return value != nullptr ? std::string(value) : std::string();
}

[[nodiscard]] std::optional<int> major_from_variable_name(std::string_view name) {
    if (!name.starts_with(kDefaultVersionVariable)) {
        return std::nullopt;
    }

    const auto suffix = name.substr(kDefaultVersionVariable.size());
    if (suffix.empty()) {
        return std::nullopt;
    }

    for (const char c : suffix) {
        if (std::isdigit(static_cast<unsigned char>(c)) == 0) {
            return std::nullopt;
        }
    }

    int major = 0;
    auto [ptr, ec] = std::from_chars(suffix.data(), suffix.data() + suffix.size(), major);
    if (ec != std::errc{} || ptr != suffix.data() + suffix.size()) {
        return std::nullopt;
    }

    return major;
}

} // namespace

std::string expand_tilde(std::string_view path) {
    if (!path.starts_with('~')) {
        return std::string(path);
    }

    const std::string input(path);
    char *expanded = tilde_expand(input.c_str());
    if (expanded == nullptr) {
        return input;
    }

    std::string result(expanded);
    std::free(expanded);
    return result;
}

LauncherConfig LauncherConfig::from_environment(std::string_view argv0) {
    LauncherConfig config;

    config.search_path = env_or_empty("PATH");
    config.virtual_env = env_or_empty("VIRTUAL_ENV");

    if (const char *value = std::getenv("PY_PYTHON"); value != nullptr && *value != '\0') {
        config.default_version = std::string(value);
    }

    for (char **entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        const std::string_view assignment(*entry);
        const auto equals = assignment.find('=');
        if (equals == std::string_view::npos) {
            continue;
        }

        const auto major = major_from_variable_name(assignment.substr(0, equals));
        const auto value = assignment.substr(equals + 1);
        if (major.has_value() && !value.empty()) {
            config.major_defaults[*major] = std::string(value);
        }
    }

    if (const auto forced = env_or_empty("PYLAUNCH_PYTHON"); !forced.empty()) {
        config.forced_interpreter = expand_tilde(forced);
    }

    std::error_code ec;
    config.working_directory = fs::current_path(ec);
    if (ec) {
        config.working_directory.clear();
    }

    if (!argv0.empty()) {
        const auto name = fs::path(argv0).filename().string();
        if (!name.empty()) {
            config.launcher_name = name;
        }
    }

    config.log_level = log_level_from_string(env_or_empty("PYLAUNCH_DEBUG"));
    config.dispatch_strategy =
        env_or_empty("PYLAUNCH_DISPATCH") == "spawn" ? DispatchStrategy::Spawn : DispatchStrategy::Replace;

    return config;
}

std::optional<std::string> LauncherConfig::major_default(int major) const {
    if (const auto it = major_defaults.find(major); it != major_defaults.end()) {
        return it->second;
    }

    return std::nullopt;
}

} // namespace pylauncher
