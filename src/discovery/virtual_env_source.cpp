#include "discovery/virtual_env_source.hpp"

#include <fstream>
#include <string>
#include <string_view>
#include <utility>

#include "discovery/interpreter_inspector.hpp"
#include "support/logger.hpp"
#include "support/text.hpp"

namespace pylauncher {

namespace fs = std::filesystem;

namespace {

// virtualenv writes version_info = 3.11.4.final.0
[[nodiscard]] std::string_view first_three_components(std::string_view value) {
    std::size_t dots = 0;
    for (std::size_t i = 0; i < value.size(); ++i) {
        if (value[i] == '.' && ++dots == 3) {
            return value.substr(0, i);
        }
    }

    return value;
}

} // namespace

VirtualEnvSource::VirtualEnvSource(fs::path virtual_env, VersionSpec request, const InterpreterInspector &inspector)
    : virtual_env_(std::move(virtual_env)), request_(request), inspector_(inspector) {}

std::optional<ExactVersion> VirtualEnvSource::read_pyvenv_version(const fs::path &config_file) {
    std::ifstream file(config_file);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::string line;
    while (std::getline(file, line)) {
        const std::string_view view(line);
        const auto equals = view.find('=');
        if (equals == std::string_view::npos) {
            continue;
        }

        const auto key = trim(view.substr(0, equals));
        if (key != "version" && key != "version_info") {
            continue;
        }

        auto version = ExactVersion::parse(first_three_components(trim(view.substr(equals + 1))));
        if (version.has_value()) {
            return *version;
        }
    }

    return std::nullopt;
}

std::vector<Interpreter> VirtualEnvSource::yield_candidates() const {
    if (virtual_env_.empty()) {
        return {};
    }

    const fs::path executable = virtual_env_ / "bin" / "python";
    if (!is_executable_file(executable)) {
        Logger::debug("VIRTUAL_ENV is set but {} is not an executable file", executable.string());
        return {};
    }

    const auto interpreter =
        inspector_.inspect(executable, OriginTier::VirtualEnv, read_pyvenv_version(virtual_env_ / "pyvenv.cfg"));
    if (!interpreter.has_value()) {
        return {};
    }

    if (!matches(interpreter->version, interpreter->architecture, request_)) {
        Logger::debug("virtual environment {} ({}) does not satisfy {}",
                      virtual_env_.string(),
                      interpreter->version.to_string(),
                      request_.describe());
        return {};
    }

    return {*interpreter};
}

} // namespace pylauncher
