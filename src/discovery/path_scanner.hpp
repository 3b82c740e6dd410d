#pragma once

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "core/interpreter.hpp"
#include "discovery/candidate_source.hpp"

namespace pylauncher {

class InterpreterInspector;

class PathScanner {
  public:
    PathScanner(std::string search_path, const InterpreterInspector &inspector);

    // python, pythonX and pythonX.Y executables in PATH order, one per real path.
    [[nodiscard]] std::vector<std::filesystem::path> python_executables() const;

    // Memoized: each executable is inspected at most once per scanner.
    [[nodiscard]] const std::vector<Interpreter> &interpreters() const;

  private:
    std::string search_path_;
    const InterpreterInspector &inspector_;
    mutable std::optional<std::vector<Interpreter>> interpreters_;

    void scan_path_executables(
        const std::function<void(std::string_view filename, const std::filesystem::path &full_path)> &callback) const;
};

class PathSource final : public CandidateSource {
  public:
    explicit PathSource(const PathScanner &scanner);

    [[nodiscard]] OriginTier tier() const noexcept override { return OriginTier::Path; }
    [[nodiscard]] bool short_circuits() const noexcept override { return false; }
    [[nodiscard]] std::vector<Interpreter> yield_candidates() const override;

  private:
    const PathScanner &scanner_;
};

} // namespace pylauncher
