#include "discovery/interpreter_inspector.hpp"

#include <array>
#include <fstream>
#include <system_error>

#include "support/logger.hpp"

namespace pylauncher {

namespace fs = std::filesystem;

namespace {

constexpr std::string_view kPythonPrefix = "python";

constexpr unsigned char kElfClass32 = 1;
constexpr unsigned char kElfClass64 = 2;

} // namespace

std::optional<VersionSpec> python_name_spec(std::string_view file_name) {
    if (!file_name.starts_with(kPythonPrefix)) {
        return std::nullopt;
    }

    const auto suffix = file_name.substr(kPythonPrefix.size());
    if (suffix.find('-') != std::string_view::npos) {
        return std::nullopt;
    }

    auto spec = VersionSpec::parse(suffix);
    if (!spec.has_value()) {
        return std::nullopt;
    }

    return *spec;
}

std::optional<ExactVersion> version_from_file_name(std::string_view file_name) {
    const auto spec = python_name_spec(file_name);
    if (!spec.has_value() || !spec->minor_version().has_value()) {
        return std::nullopt;
    }

    return ExactVersion{.major = *spec->major_version(), .minor = *spec->minor_version(), .patch = std::nullopt};
}

Architecture architecture_from_elf(const fs::path &executable) {
    std::ifstream file(executable, std::ios::binary);
    if (!file.is_open()) {
        return Architecture::Unknown;
    }

    std::array<char, 5> ident{};
    if (!file.read(ident.data(), static_cast<std::streamsize>(ident.size()))) {
        return Architecture::Unknown;
    }

    if (ident[0] != 0x7f || ident[1] != 'E' || ident[2] != 'L' || ident[3] != 'F') {
        return Architecture::Unknown;
    }

    switch (static_cast<unsigned char>(ident[4])) {
    case kElfClass32:
        return Architecture::Bits32;
    case kElfClass64:
        return Architecture::Bits64;
    default:
        return Architecture::Unknown;
    }
}

bool is_executable_file(const fs::path &path) {
    std::error_code ec;
    const auto status = fs::status(path, ec);
    if (ec || !fs::is_regular_file(status)) {
        return false;
    }

    constexpr auto executable_bits = fs::perms::owner_exec | fs::perms::group_exec | fs::perms::others_exec;
    return (status.permissions() & executable_bits) != fs::perms::none;
}

InterpreterInspector::InterpreterInspector(const InterpreterProbe &probe) : probe_(probe) {}

std::optional<Interpreter> InterpreterInspector::inspect(
    const fs::path &executable, OriginTier tier, std::optional<ExactVersion> known_version) const {
    std::error_code ec;
    fs::path absolute_path = fs::absolute(executable, ec);
    if (ec) {
        absolute_path = executable;
    }

    const fs::path real_path = real_path_of(absolute_path);

    Interpreter interpreter{
        .executable_path = absolute_path,
        .version = {},
        .architecture = architecture_from_elf(real_path),
        .origin_tier = tier,
    };

    std::optional<ExactVersion> version = known_version;
    if (!version.has_value()) {
        version = version_from_file_name(absolute_path.filename().string());
    }

    if (!version.has_value()) {
        version = version_from_file_name(real_path.filename().string());
    }

    if (!version.has_value()) {
        const auto probed = probe_.probe(absolute_path);
        if (!probed.has_value()) {
            Logger::debug("could not determine the version of {}", absolute_path.string());
            return std::nullopt;
        }

        version = probed->version;
        if (interpreter.architecture == Architecture::Unknown) {
            interpreter.architecture = probed->architecture;
        }
    }

    interpreter.version = *version;
    return interpreter;
}

} // namespace pylauncher
