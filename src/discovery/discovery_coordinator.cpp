#include "discovery/discovery_coordinator.hpp"

#include <string>
#include <utility>
#include <vector>

#include "discovery/candidate_source.hpp"
#include "discovery/interpreter_inspector.hpp"
#include "discovery/path_scanner.hpp"
#include "discovery/shebang_source.hpp"
#include "discovery/version_file_source.hpp"
#include "discovery/virtual_env_source.hpp"
#include "support/launcher_config.hpp"
#include "support/logger.hpp"

namespace pylauncher {

namespace {

constexpr std::string_view kLauncherName = "py";

[[nodiscard]] std::vector<std::string> launcher_names(const LauncherConfig &config) {
    std::vector<std::string> names{std::string(kLauncherName)};
    if (config.launcher_name != kLauncherName) {
        names.push_back(config.launcher_name);
    }

    return names;
}

} // namespace

std::string_view request_origin_name(RequestOrigin origin) noexcept {
    switch (origin) {
    case RequestOrigin::Default:
        return "default";
    case RequestOrigin::ShebangPath:
        return "shebang interpreter path";
    case RequestOrigin::ShebangToken:
        return "shebang";
    case RequestOrigin::CommandLine:
        return "command line";
    case RequestOrigin::VirtualEnv:
        return "virtual environment";
    case RequestOrigin::VersionFile:
        return ".python-version";
    case RequestOrigin::Environment:
        return "PY_PYTHON";
    }

    return "default";
}

DiscoveryCoordinator::DiscoveryCoordinator(const LauncherConfig &config, const InterpreterInspector &inspector)
    : config_(config), inspector_(inspector) {}

std::optional<VersionSpec> DiscoveryCoordinator::environment_default() const {
    if (!config_.default_version.has_value()) {
        return std::nullopt;
    }

    auto spec = VersionSpec::parse(*config_.default_version);
    if (!spec.has_value()) {
        Logger::warn("ignoring PY_PYTHON: {}", spec.error().message);
        return std::nullopt;
    }

    return *spec;
}

VersionSpec DiscoveryCoordinator::apply_major_default(const VersionSpec &spec) const {
    if (!spec.is_major_only()) {
        return spec;
    }

    const int major = *spec.major_version();
    const auto value = config_.major_default(major);
    if (!value.has_value()) {
        return spec;
    }

    auto refined = VersionSpec::parse(*value);
    if (!refined.has_value()) {
        Logger::warn("ignoring PY_PYTHON{}: {}", major, refined.error().message);
        return spec;
    }

    if (refined->major_version() != major || !refined->minor_version().has_value()) {
        Logger::warn("ignoring PY_PYTHON{}={}: expected a {}.minor version", major, *value, major);
        return spec;
    }

    const auto architecture = spec.architecture().has_value() ? spec.architecture() : refined->architecture();
    Logger::debug("PY_PYTHON{} refines the request to {}.{}", major, major, *refined->minor_version());
    return VersionSpec::exact(major, *refined->minor_version(), architecture);
}

Discovery DiscoveryCoordinator::discover(const DiscoveryRequest &request) const {
    const PathScanner scanner(config_.search_path, inspector_);

    std::optional<ShebangSource> shebang;
    if (request.script.has_value()) {
        shebang.emplace(*request.script, launcher_names(config_), inspector_);
    }

    std::optional<VersionSpec> explicit_spec;
    RequestOrigin explicit_origin = RequestOrigin::Default;

    if (shebang.has_value() && shebang->requested_version().has_value()) {
        explicit_spec = shebang->requested_version();
        explicit_origin = RequestOrigin::ShebangToken;
        if (request.command_line_version.has_value()) {
            Logger::info("the script's shebang ({}) overrides the command line ({})",
                         explicit_spec->describe(),
                         request.command_line_version->describe());
        }
    } else if (request.command_line_version.has_value()) {
        explicit_spec = request.command_line_version;
        explicit_origin = RequestOrigin::CommandLine;
    }

    const VirtualEnvSource virtual_env(config_.virtual_env, explicit_spec.value_or(VersionSpec::any()), inspector_);
    const VersionFileSource version_file(config_.working_directory, scanner);
    const PathSource path(scanner);

    VersionSpec effective = VersionSpec::any();
    RequestOrigin origin = RequestOrigin::Default;

    if (explicit_spec.has_value()) {
        effective = *explicit_spec;
        origin = explicit_origin;
    } else if (version_file.requested_version().has_value()) {
        effective = *version_file.requested_version();
        origin = RequestOrigin::VersionFile;
    } else if (const auto fallback = environment_default(); fallback.has_value()) {
        effective = *fallback;
        origin = RequestOrigin::Environment;
    }

    effective = apply_major_default(effective);

    std::vector<const CandidateSource *> sources;
    if (shebang.has_value()) {
        sources.push_back(&*shebang);
    }
    sources.push_back(&virtual_env);
    if (origin == RequestOrigin::VersionFile) {
        sources.push_back(&version_file);
    }
    sources.push_back(&path);

    CandidateSet candidates;
    for (const CandidateSource *source : sources) {
        auto found = source->yield_candidates();
        if (source->short_circuits() && !found.empty()) {
            Discovery discovery;
            discovery.candidates.add_all(std::move(found));

            if (source->tier() == OriginTier::Shebang) {
                discovery.spec = VersionSpec::any();
                discovery.origin = RequestOrigin::ShebangPath;
            } else {
                discovery.spec = explicit_spec.value_or(VersionSpec::any());
                discovery.origin = RequestOrigin::VirtualEnv;
            }

            Logger::debug("{} tier short-circuits discovery", tier_name(source->tier()));
            return discovery;
        }

        candidates.add_all(std::move(found));
    }

    Logger::debug("requesting {} (from {})", effective.describe(), request_origin_name(origin));
    return Discovery{.spec = effective, .origin = origin, .candidates = std::move(candidates)};
}

CandidateSet DiscoveryCoordinator::collect_all() const {
    const PathScanner scanner(config_.search_path, inspector_);
    const VirtualEnvSource virtual_env(config_.virtual_env, VersionSpec::any(), inspector_);
    const VersionFileSource version_file(config_.working_directory, scanner);
    const PathSource path(scanner);

    const std::vector<const CandidateSource *> sources{&virtual_env, &version_file, &path};

    CandidateSet candidates;
    for (const CandidateSource *source : sources) {
        candidates.add_all(source->yield_candidates());
    }

    return candidates;
}

} // namespace pylauncher
