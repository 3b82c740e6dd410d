#pragma once

#include <filesystem>
#include <iosfwd>
#include <span>
#include <string>

#include "app/cli_options.hpp"
#include "app/list_formatter.hpp"
#include "discovery/discovery_coordinator.hpp"
#include "discovery/interpreter_inspector.hpp"
#include "discovery/interpreter_probe.hpp"
#include "execution/dispatcher.hpp"
#include "selection/selector.hpp"
#include "support/launcher_config.hpp"

namespace pylauncher {

class LauncherApp {
  public:
    LauncherApp(LauncherConfig config, std::ostream &out, char *const *envp);

    // args excludes argv[0]. Returns only when no interpreter took over.
    int run(std::span<const std::string> args);

  private:
    LauncherConfig config_;
    std::ostream &out_;
    char *const *envp_;
    CommandLine command_line_;
    InterpreterProbe probe_;
    InterpreterInspector inspector_;
    DiscoveryCoordinator coordinator_;
    Selector selector_;
    ListFormatter list_formatter_;
    Dispatcher dispatcher_;

    int run_list();
    int run_interpreter(const Request &request);
    int dispatch_to(const std::filesystem::path &executable, const Request &request);
};

} // namespace pylauncher
