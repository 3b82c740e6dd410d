#pragma once

#include <expected>
#include <vector>

#include "core/errors.hpp"
#include "core/interpreter.hpp"
#include "core/version.hpp"

namespace pylauncher {

class Selector {
  public:
    [[nodiscard]] std::expected<Interpreter, ResolutionError> select(
        const VersionSpec &spec, const CandidateSet &candidates) const;

    // Compatible candidates, best first.
    [[nodiscard]] std::vector<Interpreter> rank(const VersionSpec &spec, const CandidateSet &candidates) const;

  private:
    [[nodiscard]] static bool better(const Interpreter &lhs, const Interpreter &rhs, const VersionSpec &spec) noexcept;
    [[nodiscard]] static std::vector<ExactVersion> closest_versions(const VersionSpec &spec, const CandidateSet &candidates);
};

} // namespace pylauncher
