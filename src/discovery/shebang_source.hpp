#pragma once

#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "core/version.hpp"
#include "discovery/candidate_source.hpp"

namespace pylauncher {

class InterpreterInspector;

struct ShebangLine {
    // "#!/usr/bin/env py -3.9", "#!/usr/bin/env python3": the script asks for a version.
    std::optional<VersionSpec> requested_version;
    // "#!/opt/python/bin/python3.11": the script names its interpreter outright.
    std::optional<std::filesystem::path> interpreter;
};

[[nodiscard]] std::optional<ShebangLine> parse_shebang_line(
    std::string_view line, std::span<const std::string> launcher_names);

class ShebangSource final : public CandidateSource {
  public:
    ShebangSource(const std::filesystem::path &script,
                  std::vector<std::string> launcher_names,
                  const InterpreterInspector &inspector);

    [[nodiscard]] OriginTier tier() const noexcept override { return OriginTier::Shebang; }
    [[nodiscard]] bool short_circuits() const noexcept override { return true; }
    [[nodiscard]] std::vector<Interpreter> yield_candidates() const override;

    [[nodiscard]] std::optional<VersionSpec> requested_version() const;
    [[nodiscard]] std::optional<std::filesystem::path> direct_interpreter() const;

    [[nodiscard]] static std::optional<std::string> read_first_line(const std::filesystem::path &script);

  private:
    std::vector<std::string> launcher_names_;
    const InterpreterInspector &inspector_;
    std::optional<ShebangLine> shebang_;
};

} // namespace pylauncher
