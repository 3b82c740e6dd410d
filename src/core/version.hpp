#pragma once

#include <compare>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

#include "core/errors.hpp"

namespace pylauncher {

enum class Architecture {
    Unknown,
    Bits32,
    Bits64,
};

[[nodiscard]] std::string_view architecture_name(Architecture architecture) noexcept;

struct ExactVersion {
    int major{0};
    int minor{0};
    std::optional<int> patch;

    [[nodiscard]] static std::expected<ExactVersion, ParseError> parse(std::string_view text);
    [[nodiscard]] std::string to_string() const;

    auto operator<=>(const ExactVersion &) const = default;
};

class VersionSpec {
  public:
    VersionSpec() = default;

    [[nodiscard]] static VersionSpec any() noexcept;
    [[nodiscard]] static VersionSpec major_only(int major, std::optional<Architecture> architecture = std::nullopt) noexcept;
    [[nodiscard]] static VersionSpec exact(int major, int minor, std::optional<Architecture> architecture = std::nullopt) noexcept;

    [[nodiscard]] static std::expected<VersionSpec, ParseError> parse(std::string_view text);

    [[nodiscard]] std::optional<int> major_version() const noexcept { return major_; }
    [[nodiscard]] std::optional<int> minor_version() const noexcept { return minor_; }
    [[nodiscard]] std::optional<Architecture> architecture() const noexcept { return architecture_; }

    [[nodiscard]] bool is_any() const noexcept { return !major_.has_value(); }
    [[nodiscard]] bool is_major_only() const noexcept { return major_.has_value() && !minor_.has_value(); }

    // Token form accepted by parse(): "", "3", "3.11", "3.11-64".
    [[nodiscard]] std::string to_string() const;
    // Human form used in messages: "Python", "Python 3.11 (64-bit)".
    [[nodiscard]] std::string describe() const;

    bool operator==(const VersionSpec &) const = default;

  private:
    std::optional<int> major_;
    std::optional<int> minor_;
    std::optional<Architecture> architecture_;
};

[[nodiscard]] bool matches(const ExactVersion &version, Architecture architecture, const VersionSpec &spec) noexcept;

// Recognizes "-3", "-3.11", "-3.11-64". Arguments not shaped like a version
// flag yield nullopt; a malformed one ("-3.x") is an error.
[[nodiscard]] std::expected<std::optional<VersionSpec>, ParseError> parse_version_flag(std::string_view argument);

} // namespace pylauncher
