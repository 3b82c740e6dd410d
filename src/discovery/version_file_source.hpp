#pragma once

#include <filesystem>
#include <optional>
#include <vector>

#include "core/version.hpp"
#include "discovery/candidate_source.hpp"

namespace pylauncher {

class PathScanner;

class VersionFileSource final : public CandidateSource {
  public:
    VersionFileSource(const std::filesystem::path &start_directory, const PathScanner &scanner);

    [[nodiscard]] OriginTier tier() const noexcept override { return OriginTier::VersionFile; }
    [[nodiscard]] bool short_circuits() const noexcept override { return false; }
    [[nodiscard]] std::vector<Interpreter> yield_candidates() const override;

    [[nodiscard]] const std::optional<VersionSpec> &requested_version() const noexcept { return requested_version_; }
    [[nodiscard]] const std::optional<std::filesystem::path> &version_file() const noexcept { return version_file_; }

    // Closest .python-version in start_directory or any of its ancestors.
    [[nodiscard]] static std::optional<std::filesystem::path> find_version_file(const std::filesystem::path &start_directory);

  private:
    const PathScanner &scanner_;
    std::optional<std::filesystem::path> version_file_;
    std::optional<VersionSpec> requested_version_;
};

} // namespace pylauncher
