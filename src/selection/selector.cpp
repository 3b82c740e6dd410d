#include "selection/selector.hpp"

#include <algorithm>
#include <format>
#include <string>
#include <utility>

namespace pylauncher {

namespace {

constexpr std::size_t kMaxSuggestions = 3;

[[nodiscard]] int architecture_rank(Architecture architecture) noexcept {
    switch (architecture) {
    case Architecture::Bits64:
        return 0;
    case Architecture::Unknown:
        return 1;
    case Architecture::Bits32:
        return 2;
    }

    return 1;
}

} // namespace

bool Selector::better(const Interpreter &lhs, const Interpreter &rhs, const VersionSpec &spec) noexcept {
    if (lhs.version != rhs.version) {
        return lhs.version > rhs.version;
    }

    if (!spec.architecture().has_value() && lhs.architecture != rhs.architecture) {
        return architecture_rank(lhs.architecture) < architecture_rank(rhs.architecture);
    }

    return static_cast<int>(lhs.origin_tier) < static_cast<int>(rhs.origin_tier);
}

std::vector<Interpreter> Selector::rank(const VersionSpec &spec, const CandidateSet &candidates) const {
    std::vector<Interpreter> compatible;
    for (const auto &candidate : candidates) {
        if (matches(candidate.version, candidate.architecture, spec)) {
            compatible.push_back(candidate);
        }
    }

    std::stable_sort(compatible.begin(), compatible.end(), [&spec](const Interpreter &lhs, const Interpreter &rhs) {
        return better(lhs, rhs, spec);
    });

    return compatible;
}

std::vector<ExactVersion> Selector::closest_versions(const VersionSpec &spec, const CandidateSet &candidates) {
    std::vector<ExactVersion> versions;
    for (const auto &candidate : candidates) {
        const ExactVersion short_version{.major = candidate.version.major, .minor = candidate.version.minor, .patch = std::nullopt};
        if (std::find(versions.begin(), versions.end(), short_version) == versions.end()) {
            versions.push_back(short_version);
        }
    }

    const auto wanted_major = spec.major_version();
    std::sort(versions.begin(), versions.end(), [&wanted_major](const ExactVersion &lhs, const ExactVersion &rhs) {
        const bool lhs_same_major = wanted_major == lhs.major;
        const bool rhs_same_major = wanted_major == rhs.major;
        if (lhs_same_major != rhs_same_major) {
            return lhs_same_major;
        }

        return lhs > rhs;
    });

    if (versions.size() > kMaxSuggestions) {
        versions.resize(kMaxSuggestions);
    }

    return versions;
}

std::expected<Interpreter, ResolutionError> Selector::select(const VersionSpec &spec, const CandidateSet &candidates) const {
    if (candidates.empty()) {
        return std::unexpected(ResolutionError{
            .kind = ResolutionErrorKind::NoInterpreterFound,
            .message = "No Python interpreter found on PATH; install one or set PYLAUNCH_PYTHON",
        });
    }

    auto ranked = rank(spec, candidates);
    if (ranked.empty()) {
        std::string available;
        for (const auto &version : closest_versions(spec, candidates)) {
            if (!available.empty()) {
                available += ", ";
            }
            available += version.to_string();
        }

        return std::unexpected(ResolutionError{
            .kind = ResolutionErrorKind::NoVersionMatch,
            .message = std::format("No interpreter found for {} (available: {})", spec.describe(), available),
        });
    }

    return std::move(ranked.front());
}

} // namespace pylauncher
