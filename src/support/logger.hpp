#pragma once

#include <format>
#include <iosfwd>
#include <string>
#include <string_view>
#include <utility>

namespace pylauncher {

enum class LogLevel {
    Error,
    Warn,
    Info,
    Debug,
};

[[nodiscard]] LogLevel log_level_from_string(std::string_view value) noexcept;

class Logger {
  public:
    static void set_level(LogLevel level) noexcept;
    [[nodiscard]] static LogLevel level() noexcept;
    [[nodiscard]] static bool enabled(LogLevel level) noexcept;

    // Defaults to std::cerr; tests point it at a string stream.
    static void set_stream(std::ostream &stream) noexcept;
    static void reset_stream() noexcept;

    template <typename... Args>
    static void error(std::format_string<Args...> format, Args &&...args) {
        log(LogLevel::Error, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void warn(std::format_string<Args...> format, Args &&...args) {
        log(LogLevel::Warn, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void info(std::format_string<Args...> format, Args &&...args) {
        log(LogLevel::Info, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void debug(std::format_string<Args...> format, Args &&...args) {
        log(LogLevel::Debug, format, std::forward<Args>(args)...);
    }

  private:
    template <typename... Args>
    static void log(LogLevel level, std::format_string<Args...> format, Args &&...args) {
        if (!enabled(level)) {
            return;
        }

        write(level, std::format(format, std::forward<Args>(args)...));
    }

    static void write(LogLevel level, const std::string &message);
};

} // namespace pylauncher
