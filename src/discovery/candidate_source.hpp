#pragma once

#include <vector>

#include "core/interpreter.hpp"

namespace pylauncher {

class CandidateSource {
  public:
    virtual ~CandidateSource() = default;

    [[nodiscard]] virtual OriginTier tier() const noexcept = 0;

    // A source that short-circuits ends discovery as soon as it yields anything.
    [[nodiscard]] virtual bool short_circuits() const noexcept = 0;

    // Failures are never reported from here: an unusable source yields nothing.
    [[nodiscard]] virtual std::vector<Interpreter> yield_candidates() const = 0;
};

} // namespace pylauncher
