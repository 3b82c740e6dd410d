#pragma once

#include <filesystem>
#include <optional>
#include <string_view>

#include "core/version.hpp"

namespace pylauncher {

struct ProbeResult {
    ExactVersion version;
    Architecture architecture{Architecture::Unknown};
};

// Asks an interpreter for its own version and pointer width by running it.
class InterpreterProbe {
  public:
    [[nodiscard]] std::optional<ProbeResult> probe(const std::filesystem::path &executable) const;

    [[nodiscard]] static std::optional<ProbeResult> parse_output(std::string_view output);
};

} // namespace pylauncher
