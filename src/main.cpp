#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include <unistd.h>

#include "app/launcher_app.hpp"
#include "support/launcher_config.hpp"
#include "support/logger.hpp"

extern char **environ;

int main(int argc, char *argv[]) {
    auto config = pylauncher::LauncherConfig::from_environment(argc > 0 ? argv[0] : "py");
    pylauncher::Logger::set_level(config.log_level);

    std::vector<std::string> args;
    if (argc > 1) {
        args.assign(argv + 1, argv + argc);
    }

    pylauncher::LauncherApp app(std::move(config), std::cout, environ);
    return app.run(args);
}
