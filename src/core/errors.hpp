#pragma once

#include <string>

namespace pylauncher {

struct ParseError {
    std::string input;
    std::string message;

    [[nodiscard]] int exit_code() const noexcept;
};

enum class ResolutionErrorKind {
    NoInterpreterFound,
    NoVersionMatch,
};

struct ResolutionError {
    ResolutionErrorKind kind;
    std::string message;

    [[nodiscard]] int exit_code() const noexcept;
};

struct DispatchError {
    std::string executable;
    int error_number{0};
    std::string message;

    [[nodiscard]] int exit_code() const noexcept;
};

} // namespace pylauncher
