#include "app/launcher_app.hpp"

#include <ostream>
#include <utility>

#include "support/logger.hpp"

namespace pylauncher {

LauncherApp::LauncherApp(LauncherConfig config, std::ostream &out, char *const *envp)
    : config_(std::move(config)),
      out_(out),
      envp_(envp),
      command_line_(config_.launcher_name),
      probe_(),
      inspector_(probe_),
      coordinator_(config_, inspector_),
      selector_(),
      list_formatter_(),
      dispatcher_(config_.dispatch_strategy) {}

int LauncherApp::run(std::span<const std::string> args) {
    auto request = command_line_.parse(args);
    if (!request.has_value()) {
        Logger::error("{}", request.error().message);
        return request.error().exit_code();
    }

    if (request->action == Action::List) {
        return run_list();
    }

    if (request->show_usage) {
        out_ << command_line_.usage();
        out_.flush();
    }

    return run_interpreter(*request);
}

int LauncherApp::run_list() {
    const auto candidates = coordinator_.collect_all();
    list_formatter_.write(out_, candidates);
    return 0;
}

int LauncherApp::run_interpreter(const Request &request) {
    if (!config_.forced_interpreter.empty()) {
        Logger::info("PYLAUNCH_PYTHON forces {}", config_.forced_interpreter.string());
        return dispatch_to(config_.forced_interpreter, request);
    }

    const auto discovery = coordinator_.discover(DiscoveryRequest{
        .command_line_version = request.version,
        .script = request.script,
    });

    auto chosen = selector_.select(discovery.spec, discovery.candidates);
    if (!chosen.has_value()) {
        Logger::error("{}", chosen.error().message);
        return chosen.error().exit_code();
    }

    Logger::info("selected {} ({}, {}) for {} from {}",
                 chosen->executable_path.string(),
                 chosen->version.to_string(),
                 architecture_name(chosen->architecture),
                 discovery.spec.describe(),
                 request_origin_name(discovery.origin));

    return dispatch_to(chosen->executable_path, request);
}

int LauncherApp::dispatch_to(const std::filesystem::path &executable, const Request &request) {
    const auto result = dispatcher_.dispatch(executable, request.forwarded_args, envp_);
    if (!result.has_value()) {
        Logger::error("{}", result.error().message);
        return result.error().exit_code();
    }

    return *result;
}

} // namespace pylauncher
