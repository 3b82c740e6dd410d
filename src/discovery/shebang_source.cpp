#include "discovery/shebang_source.hpp"

#include <algorithm>
#include <fstream>
#include <utility>

#include "discovery/interpreter_inspector.hpp"
#include "support/logger.hpp"
#include "support/text.hpp"

namespace pylauncher {

namespace fs = std::filesystem;

namespace {

constexpr std::string_view kShebangMarker = "#!";
constexpr std::size_t kMaxShebangLength = 4096;

[[nodiscard]] std::string base_name(std::string_view command) { return fs::path(command).filename().string(); }

[[nodiscard]] std::optional<VersionSpec> parse_version_token(std::string_view token) {
    if (token.starts_with('-')) {
        token.remove_prefix(1);
    }

    auto spec = VersionSpec::parse(token);
    if (!spec.has_value()) {
        Logger::debug("ignoring shebang version token: {}", spec.error().message);
        return std::nullopt;
    }

    return *spec;
}

} // namespace

std::optional<ShebangLine> parse_shebang_line(std::string_view line, std::span<const std::string> launcher_names) {
    if (!line.starts_with(kShebangMarker)) {
        return std::nullopt;
    }

    const auto words = split_whitespace(line.substr(kShebangMarker.size()));
    if (words.empty()) {
        return std::nullopt;
    }

    std::size_t index = 0;
    bool through_env = false;

    if (base_name(words[index]) == "env") {
        through_env = true;
        ++index;

        // env -S py -3, env PYTHONUTF8=1 python3
        while (index < words.size() && (words[index].starts_with('-') || words[index].find('=') != std::string_view::npos)) {
            ++index;
        }
    }

    if (index >= words.size()) {
        return std::nullopt;
    }

    const std::string_view command = words[index];
    const std::string command_name = base_name(command);

    if (std::find(launcher_names.begin(), launcher_names.end(), command_name) != launcher_names.end()) {
        ShebangLine shebang;
        if (index + 1 < words.size()) {
            shebang.requested_version = parse_version_token(words[index + 1]);
        }

        return shebang;
    }

    const auto name_spec = python_name_spec(command_name);
    if (!name_spec.has_value()) {
        return std::nullopt;
    }

    ShebangLine shebang;
    if (through_env) {
        if (!name_spec->is_any()) {
            shebang.requested_version = *name_spec;
        }

        return shebang;
    }

    if (!command.starts_with('/')) {
        return std::nullopt;
    }

    shebang.interpreter = fs::path(command);
    return shebang;
}

std::optional<std::string> ShebangSource::read_first_line(const fs::path &script) {
    std::ifstream file(script, std::ios::binary);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::string line;
    char c = '\0';
    while (line.size() < kMaxShebangLength && file.get(c) && c != '\n') {
        line.push_back(c);
    }

    if (line.empty() && !file) {
        return std::nullopt;
    }

    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }

    return line;
}

ShebangSource::ShebangSource(const fs::path &script,
                             std::vector<std::string> launcher_names,
                             const InterpreterInspector &inspector)
    : launcher_names_(std::move(launcher_names)), inspector_(inspector) {
    const auto line = read_first_line(script);
    if (!line.has_value()) {
        Logger::debug("could not read a shebang from {}", script.string());
        return;
    }

    shebang_ = parse_shebang_line(*line, launcher_names_);
    if (shebang_.has_value()) {
        Logger::debug("{} has a Python shebang: {}", script.string(), *line);
    }
}

std::optional<VersionSpec> ShebangSource::requested_version() const {
    if (!shebang_.has_value()) {
        return std::nullopt;
    }

    return shebang_->requested_version;
}

std::optional<fs::path> ShebangSource::direct_interpreter() const {
    if (!shebang_.has_value()) {
        return std::nullopt;
    }

    return shebang_->interpreter;
}

std::vector<Interpreter> ShebangSource::yield_candidates() const {
    const auto path = direct_interpreter();
    if (!path.has_value()) {
        return {};
    }

    if (!is_executable_file(*path)) {
        Logger::debug("shebang interpreter {} is not an executable file", path->string());
        return {};
    }

    auto interpreter = inspector_.inspect(*path, OriginTier::Shebang);
    if (!interpreter.has_value()) {
        return {};
    }

    return {std::move(*interpreter)};
}

} // namespace pylauncher
