#include "core/version.hpp"

#include <cctype>
#include <charconv>
#include <format>
#include <system_error>

namespace pylauncher {

namespace {

[[nodiscard]] std::optional<int> parse_component(std::string_view text) {
    if (text.empty()) {
        return std::nullopt;
    }

    for (const char c : text) {
        if (std::isdigit(static_cast<unsigned char>(c)) == 0) {
            return std::nullopt;
        }
    }

    int value = 0;
    const char *first = text.data();
    const char *last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last) {
        return std::nullopt;
    }

    return value;
}

[[nodiscard]] ParseError component_error(std::string_view input, std::string_view component) {
    return ParseError{
        .input = std::string(input),
        .message = std::format("error parsing '{}' as a version component in '{}'", component, input),
    };
}

} // namespace

std::string_view architecture_name(Architecture architecture) noexcept {
    switch (architecture) {
    case Architecture::Bits32:
        return "32-bit";
    case Architecture::Bits64:
        return "64-bit";
    case Architecture::Unknown:
        break;
    }

    return "unknown";
}

std::expected<ExactVersion, ParseError> ExactVersion::parse(std::string_view text) {
    const auto first_dot = text.find('.');
    if (first_dot == std::string_view::npos) {
        return std::unexpected(ParseError{.input = std::string(text), .message = std::format("'.' missing from version '{}'", text)});
    }

    ExactVersion version;

    const auto major_text = text.substr(0, first_dot);
    const auto major = parse_component(major_text);
    if (!major.has_value()) {
        return std::unexpected(component_error(text, major_text));
    }
    version.major = *major;

    const auto rest = text.substr(first_dot + 1);
    const auto second_dot = rest.find('.');
    const auto minor_text = rest.substr(0, second_dot);
    const auto minor = parse_component(minor_text);
    if (!minor.has_value()) {
        return std::unexpected(component_error(text, minor_text));
    }
    version.minor = *minor;

    if (second_dot == std::string_view::npos) {
        return version;
    }

    // Patch may carry a release tail: 3.13.0rc1, 3.12.1+.
    const auto patch_field = rest.substr(second_dot + 1);
    std::size_t digits = 0;
    while (digits < patch_field.size() && std::isdigit(static_cast<unsigned char>(patch_field[digits])) != 0) {
        ++digits;
    }

    const auto patch = parse_component(patch_field.substr(0, digits));
    if (!patch.has_value()) {
        return std::unexpected(component_error(text, patch_field));
    }

    if (digits < patch_field.size()) {
        const char tail = patch_field[digits];
        if (std::isalpha(static_cast<unsigned char>(tail)) == 0 && tail != '+') {
            return std::unexpected(component_error(text, patch_field));
        }
    }

    version.patch = *patch;
    return version;
}

std::string ExactVersion::to_string() const {
    if (patch.has_value()) {
        return std::format("{}.{}.{}", major, minor, *patch);
    }

    return std::format("{}.{}", major, minor);
}

VersionSpec VersionSpec::any() noexcept { return VersionSpec{}; }

VersionSpec VersionSpec::major_only(int major, std::optional<Architecture> architecture) noexcept {
    VersionSpec spec;
    spec.major_ = major;
    spec.architecture_ = architecture;
    return spec;
}

VersionSpec VersionSpec::exact(int major, int minor, std::optional<Architecture> architecture) noexcept {
    VersionSpec spec;
    spec.major_ = major;
    spec.minor_ = minor;
    spec.architecture_ = architecture;
    return spec;
}

std::expected<VersionSpec, ParseError> VersionSpec::parse(std::string_view text) {
    if (text.empty()) {
        return VersionSpec::any();
    }

    std::string_view body = text;
    std::optional<Architecture> architecture;

    if (const auto dash = text.find('-'); dash != std::string_view::npos) {
        body = text.substr(0, dash);
        const auto bitness = text.substr(dash + 1);

        if (bitness == "32") {
            architecture = Architecture::Bits32;
        } else if (bitness == "64") {
            architecture = Architecture::Bits64;
        } else {
            return std::unexpected(ParseError{
                .input = std::string(text),
                .message = std::format("unsupported architecture '{}' in '{}' (expected 32 or 64)", bitness, text),
            });
        }

        if (body.empty()) {
            return std::unexpected(ParseError{
                .input = std::string(text),
                .message = std::format("architecture requires a major version in '{}'", text),
            });
        }
    }

    const auto dot = body.find('.');
    const auto major_text = body.substr(0, dot);
    const auto major = parse_component(major_text);
    if (!major.has_value()) {
        return std::unexpected(component_error(text, major_text));
    }

    if (dot == std::string_view::npos) {
        return VersionSpec::major_only(*major, architecture);
    }

    const auto minor_text = body.substr(dot + 1);
    const auto minor = parse_component(minor_text);
    if (!minor.has_value()) {
        return std::unexpected(component_error(text, minor_text));
    }

    return VersionSpec::exact(*major, *minor, architecture);
}

std::string VersionSpec::to_string() const {
    std::string token;
    if (major_.has_value()) {
        token = std::to_string(*major_);
    }

    if (minor_.has_value()) {
        token += std::format(".{}", *minor_);
    }

    if (architecture_ == Architecture::Bits32) {
        token += "-32";
    } else if (architecture_ == Architecture::Bits64) {
        token += "-64";
    }

    return token;
}

std::string VersionSpec::describe() const {
    std::string description = "Python";
    if (major_.has_value()) {
        description += " " + std::to_string(*major_);
    }

    if (minor_.has_value()) {
        description += std::format(".{}", *minor_);
    }

    if (architecture_.has_value()) {
        description += std::format(" ({})", architecture_name(*architecture_));
    }

    return description;
}

bool matches(const ExactVersion &version, Architecture architecture, const VersionSpec &spec) noexcept {
    if (spec.major_version().has_value() && *spec.major_version() != version.major) {
        return false;
    }

    if (spec.minor_version().has_value() && *spec.minor_version() != version.minor) {
        return false;
    }

    if (spec.architecture().has_value() && *spec.architecture() != architecture) {
        return false;
    }

    return true;
}

std::expected<std::optional<VersionSpec>, ParseError> parse_version_flag(std::string_view argument) {
    if (argument.size() < 2 || argument.front() != '-' ||
        std::isdigit(static_cast<unsigned char>(argument[1])) == 0) {
        return std::optional<VersionSpec>{};
    }

    auto spec = VersionSpec::parse(argument.substr(1));
    if (!spec.has_value()) {
        return std::unexpected(spec.error());
    }

    return std::optional<VersionSpec>{*spec};
}

} // namespace pylauncher
