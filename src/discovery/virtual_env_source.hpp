#pragma once

#include <filesystem>
#include <optional>
#include <vector>

#include "core/version.hpp"
#include "discovery/candidate_source.hpp"

namespace pylauncher {

class InterpreterInspector;

class VirtualEnvSource final : public CandidateSource {
  public:
    VirtualEnvSource(std::filesystem::path virtual_env, VersionSpec request, const InterpreterInspector &inspector);

    [[nodiscard]] OriginTier tier() const noexcept override { return OriginTier::VirtualEnv; }
    [[nodiscard]] bool short_circuits() const noexcept override { return true; }
    [[nodiscard]] std::vector<Interpreter> yield_candidates() const override;

    // "version" (venv) or "version_info" (virtualenv) key of pyvenv.cfg.
    [[nodiscard]] static std::optional<ExactVersion> read_pyvenv_version(const std::filesystem::path &config_file);

  private:
    std::filesystem::path virtual_env_;
    VersionSpec request_;
    const InterpreterInspector &inspector_;
};

} // namespace pylauncher
