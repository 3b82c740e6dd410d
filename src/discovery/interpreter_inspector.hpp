#pragma once

#include <filesystem>
#include <optional>
#include <string_view>

#include "core/interpreter.hpp"
#include "core/version.hpp"
#include "discovery/interpreter_probe.hpp"

namespace pylauncher {

// "python" -> any, "python3" -> 3, "python3.11" -> 3.11; nullopt for other names.
[[nodiscard]] std::optional<VersionSpec> python_name_spec(std::string_view file_name);

[[nodiscard]] std::optional<ExactVersion> version_from_file_name(std::string_view file_name);

[[nodiscard]] Architecture architecture_from_elf(const std::filesystem::path &executable);

[[nodiscard]] bool is_executable_file(const std::filesystem::path &path);

class InterpreterInspector {
  public:
    explicit InterpreterInspector(const InterpreterProbe &probe);

    // Builds an Interpreter, spawning the executable only when neither its
    // name nor its symlink target's name carries a major.minor version.
    [[nodiscard]] std::optional<Interpreter> inspect(
        const std::filesystem::path &executable,
        OriginTier tier,
        std::optional<ExactVersion> known_version = std::nullopt) const;

  private:
    const InterpreterProbe &probe_;
};

} // namespace pylauncher
