#include "discovery/version_file_source.hpp"

#include <fstream>
#include <string>
#include <string_view>
#include <system_error>

#include "discovery/path_scanner.hpp"
#include "support/logger.hpp"
#include "support/text.hpp"

namespace pylauncher {

namespace fs = std::filesystem;

namespace {

constexpr std::string_view kVersionFileName = ".python-version";

} // namespace

std::optional<fs::path> VersionFileSource::find_version_file(const fs::path &start_directory) {
    if (start_directory.empty()) {
        return std::nullopt;
    }

    std::error_code ec;
    fs::path directory = fs::absolute(start_directory, ec);
    if (ec) {
        return std::nullopt;
    }

    while (true) {
        const fs::path candidate = directory / kVersionFileName;
        if (fs::is_regular_file(candidate, ec) && !ec) {
            return candidate;
        }

        const fs::path parent = directory.parent_path();
        if (parent.empty() || parent == directory) {
            return std::nullopt;
        }

        directory = parent;
    }
}

VersionFileSource::VersionFileSource(const fs::path &start_directory, const PathScanner &scanner)
    : scanner_(scanner), version_file_(find_version_file(start_directory)) {
    if (!version_file_.has_value()) {
        return;
    }

    std::ifstream file(*version_file_);
    std::string line;
    if (!file.is_open() || !std::getline(file, line)) {
        Logger::debug("could not read {}", version_file_->string());
        return;
    }

    const auto token = trim(line);
    if (token.empty()) {
        Logger::debug("{} is empty", version_file_->string());
        return;
    }

    auto spec = VersionSpec::parse(token);
    if (spec.has_value()) {
        Logger::debug("{} requests {}", version_file_->string(), spec->describe());
        requested_version_ = *spec;
        return;
    }

    // pyenv pins a full release such as 3.11.4; the launcher matches on major.minor.
    if (const auto release = ExactVersion::parse(token); release.has_value()) {
        requested_version_ = VersionSpec::exact(release->major, release->minor);
        Logger::info("{} pins {}; matching any {}.{} interpreter",
                     version_file_->string(),
                     release->to_string(),
                     release->major,
                     release->minor);
        return;
    }

    Logger::info("ignoring {}: {}", version_file_->string(), spec.error().message);
}

std::vector<Interpreter> VersionFileSource::yield_candidates() const {
    std::vector<Interpreter> candidates;
    if (!requested_version_.has_value()) {
        return candidates;
    }

    for (const auto &interpreter : scanner_.interpreters()) {
        if (!matches(interpreter.version, interpreter.architecture, *requested_version_)) {
            continue;
        }

        Interpreter tagged = interpreter;
        tagged.origin_tier = OriginTier::VersionFile;
        candidates.push_back(std::move(tagged));
    }

    return candidates;
}

} // namespace pylauncher
