#pragma once

#include <iosfwd>

#include "core/interpreter.hpp"

namespace pylauncher {

class ListFormatter {
  public:
    void write(std::ostream &out, const CandidateSet &candidates) const;
};

} // namespace pylauncher
