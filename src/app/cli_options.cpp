#include "app/cli_options.hpp"

#include <format>
#include <utility>

namespace pylauncher {

CommandLine::CommandLine(std::string launcher_name) : launcher_name_(std::move(launcher_name)) {}

std::expected<Request, ParseError> CommandLine::parse(std::span<const std::string> args) const {
    Request request;

    // Only a leading --list belongs to the launcher; later ones go to Python.
    if (!args.empty() && args.front() == "--list") {
        if (args.size() != 1) {
            return std::unexpected(ParseError{
                .input = args.front(),
                .message = std::format(
                    "The `--list` flag must be specified on its own; see `{} --help` for details", launcher_name_),
            });
        }

        request.action = Action::List;
        return request;
    }

    std::size_t first_forwarded = 0;
    if (!args.empty()) {
        auto flag = parse_version_flag(args.front());
        if (!flag.has_value()) {
            return std::unexpected(flag.error());
        }

        if (flag->has_value()) {
            request.version = **flag;
            first_forwarded = 1;
        }
    }

    request.forwarded_args.assign(args.begin() + static_cast<std::ptrdiff_t>(first_forwarded), args.end());

    if (!request.forwarded_args.empty()) {
        const auto &first = request.forwarded_args.front();
        if (first == "-h" || first == "--help") {
            request.show_usage = true;
        } else if (!first.starts_with('-')) {
            request.script = std::filesystem::path(first);
        }
    }

    return request;
}

std::string CommandLine::usage() const {
    return std::format(
        "Python Launcher for Unix\n"
        "\n"
        "usage: {0} [launcher-args] [python-args]\n"
        "\n"
        "Launcher arguments:\n"
        "  -X                : launch the newest Python X.Y, e.g. -3\n"
        "  -X.Y              : launch Python X.Y, e.g. -3.11\n"
        "  -X[.Y]-32|-64     : additionally require a 32- or 64-bit interpreter\n"
        "  --list            : list the interpreters found (must be the only argument)\n"
        "\n"
        "Without a version, the launcher honors in order: a script's shebang,\n"
        "an active virtual environment, a .python-version file, PY_PYTHON,\n"
        "then the newest python on PATH.\n"
        "\n"
        "Environment:\n"
        "  PY_PYTHON         default version, e.g. 3.11\n"
        "  PY_PYTHON{{X}}      default minor version for -X, e.g. PY_PYTHON3=3.11\n"
        "  PYLAUNCH_PYTHON   interpreter to use, skipping discovery\n"
        "  PYLAUNCH_DEBUG    1 for info, 2 for debug logging on stderr\n"
        "  PYLAUNCH_DISPATCH 'spawn' to run the interpreter as a child process\n"
        "\n"
        "The following help text is from Python:\n"
        "\n",
        launcher_name_);
}

} // namespace pylauncher
