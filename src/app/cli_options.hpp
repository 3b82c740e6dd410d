#pragma once

#include <expected>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "core/errors.hpp"
#include "core/version.hpp"

namespace pylauncher {

enum class Action {
    Run,
    List,
};

struct Request {
    Action action{Action::Run};
    std::optional<VersionSpec> version;
    std::optional<std::filesystem::path> script;
    std::vector<std::string> forwarded_args;
    bool show_usage{false};
};

class CommandLine {
  public:
    explicit CommandLine(std::string launcher_name = "py");

    // args excludes argv[0].
    [[nodiscard]] std::expected<Request, ParseError> parse(std::span<const std::string> args) const;

    [[nodiscard]] std::string usage() const;

  private:
    std::string launcher_name_;
};

} // namespace pylauncher
