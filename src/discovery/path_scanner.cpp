#include "discovery/path_scanner.hpp"

#include <algorithm>
#include <sstream>
#include <system_error>
#include <utility>

#include "discovery/interpreter_inspector.hpp"
#include "support/logger.hpp"

namespace pylauncher {

namespace fs = std::filesystem;

PathScanner::PathScanner(std::string search_path, const InterpreterInspector &inspector)
    : search_path_(std::move(search_path)), inspector_(inspector) {}

void PathScanner::scan_path_executables(
    const std::function<void(std::string_view filename, const fs::path &full_path)> &callback) const {
    std::stringstream path_stream(search_path_);
    std::string dir;

    while (std::getline(path_stream, dir, ':')) {
        if (dir.empty()) {
            continue;
        }

        std::error_code ec;
        fs::directory_iterator it(dir, ec);
        if (ec) {
            Logger::debug("skipping PATH entry {}: {}", dir, ec.message());
            continue;
        }

        for (; it != fs::directory_iterator(); it.increment(ec)) {
            if (ec) {
                Logger::debug("stopped listing {}: {}", dir, ec.message());
                break;
            }

            const std::string filename = it->path().filename().string();
            if (!python_name_spec(filename).has_value()) {
                continue;
            }

            if (!is_executable_file(it->path())) {
                continue;
            }

            callback(filename, it->path());
        }
    }
}

std::vector<fs::path> PathScanner::python_executables() const {
    std::vector<fs::path> executables;
    std::vector<fs::path> real_paths;

    scan_path_executables([&](std::string_view /*filename*/, const fs::path &full_path) {
        auto real_path = real_path_of(full_path);
        if (std::find(real_paths.begin(), real_paths.end(), real_path) != real_paths.end()) {
            return;
        }

        real_paths.push_back(std::move(real_path));
        executables.push_back(full_path);
    });

    return executables;
}

const std::vector<Interpreter> &PathScanner::interpreters() const {
    if (interpreters_.has_value()) {
        return *interpreters_;
    }

    std::vector<Interpreter> found;
    for (const auto &executable : python_executables()) {
        if (auto interpreter = inspector_.inspect(executable, OriginTier::Path); interpreter.has_value()) {
            found.push_back(std::move(*interpreter));
        }
    }

    Logger::debug("found {} interpreter(s) on PATH", found.size());
    interpreters_ = std::move(found);
    return *interpreters_;
}

PathSource::PathSource(const PathScanner &scanner) : scanner_(scanner) {}

std::vector<Interpreter> PathSource::yield_candidates() const { return scanner_.interpreters(); }

} // namespace pylauncher
