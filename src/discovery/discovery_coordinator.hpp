#pragma once

#include <filesystem>
#include <optional>
#include <string_view>

#include "core/interpreter.hpp"
#include "core/version.hpp"

namespace pylauncher {

struct LauncherConfig;
class InterpreterInspector;

struct DiscoveryRequest {
    std::optional<VersionSpec> command_line_version;
    std::optional<std::filesystem::path> script;
};

// Where the effective version request came from.
enum class RequestOrigin {
    Default,
    ShebangPath,
    ShebangToken,
    CommandLine,
    VirtualEnv,
    VersionFile,
    Environment,
};

[[nodiscard]] std::string_view request_origin_name(RequestOrigin origin) noexcept;

struct Discovery {
    VersionSpec spec;
    RequestOrigin origin{RequestOrigin::Default};
    CandidateSet candidates;
};

class DiscoveryCoordinator {
  public:
    DiscoveryCoordinator(const LauncherConfig &config, const InterpreterInspector &inspector);

    [[nodiscard]] Discovery discover(const DiscoveryRequest &request) const;

    // Every tier without short-circuiting; an empty set is not an error.
    [[nodiscard]] CandidateSet collect_all() const;

  private:
    const LauncherConfig &config_;
    const InterpreterInspector &inspector_;

    [[nodiscard]] VersionSpec apply_major_default(const VersionSpec &spec) const;
    [[nodiscard]] std::optional<VersionSpec> environment_default() const;
};

} // namespace pylauncher
