#include "support/logger.hpp"

#include <charconv>
#include <iostream>
#include <ostream>
#include <system_error>

namespace pylauncher {

namespace {

LogLevel current_level = LogLevel::Error;
std::ostream *current_stream = nullptr;

[[nodiscard]] std::string_view prefix_for(LogLevel level) noexcept {
    switch (level) {
    case LogLevel::Error:
        return "py: ";
    case LogLevel::Warn:
        return "py: warning: ";
    case LogLevel::Info:
        return "py [info]: ";
    case LogLevel::Debug:
        return "py [debug]: ";
    }

    return "py: ";
}

} // namespace

LogLevel log_level_from_string(std::string_view value) noexcept {
    if (value.empty()) {
        return LogLevel::Error;
    }

    int verbosity = 0;
    const char *first = value.data();
    const char *last = value.data() + value.size();
    auto [ptr, ec] = std::from_chars(first, last, verbosity);

    // Any non-numeric value still asks for diagnostics.
    if (ec != std::errc{} || ptr != last) {
        return LogLevel::Debug;
    }

    if (verbosity <= 0) {
        return LogLevel::Error;
    }

    if (verbosity == 1) {
        return LogLevel::Info;
    }

    return LogLevel::Debug;
}

void Logger::set_level(LogLevel level) noexcept { current_level = level; }

LogLevel Logger::level() noexcept { return current_level; }

bool Logger::enabled(LogLevel level) noexcept { return static_cast<int>(level) <= static_cast<int>(current_level); }

void Logger::set_stream(std::ostream &stream) noexcept { current_stream = &stream; }

void Logger::reset_stream() noexcept { current_stream = nullptr; }

void Logger::write(LogLevel level, const std::string &message) {
    std::ostream &out = current_stream != nullptr ? *current_stream : std::cerr;
    out << prefix_for(level) << message << std::endl;
}

} // namespace pylauncher
