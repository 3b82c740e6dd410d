#include "core/errors.hpp"

#include <sysexits.h>

namespace pylauncher {

int ParseError::exit_code() const noexcept { return EX_USAGE; }

int ResolutionError::exit_code() const noexcept {
    switch (kind) {
    case ResolutionErrorKind::NoInterpreterFound:
        return EX_UNAVAILABLE;
    case ResolutionErrorKind::NoVersionMatch:
        return EX_DATAERR;
    }

    return EX_SOFTWARE;
}

int DispatchError::exit_code() const noexcept { return EX_OSERR; }

} // namespace pylauncher
