#include "core/interpreter.hpp"

#include <algorithm>
#include <system_error>
#include <utility>

namespace pylauncher {

namespace fs = std::filesystem;

std::string_view tier_name(OriginTier tier) noexcept {
    switch (tier) {
    case OriginTier::Shebang:
        return "shebang";
    case OriginTier::VirtualEnv:
        return "virtualenv";
    case OriginTier::VersionFile:
        return "version-file";
    case OriginTier::Path:
        return "path";
    }

    return "path";
}

fs::path real_path_of(const fs::path &path) {
    std::error_code ec;
    auto resolved = fs::canonical(path, ec);
    if (ec) {
        return path.lexically_normal();
    }

    return resolved;
}

bool CandidateSet::add(Interpreter interpreter) {
    auto real_path = real_path_of(interpreter.executable_path);
    if (std::find(real_paths_.begin(), real_paths_.end(), real_path) != real_paths_.end()) {
        return false;
    }

    real_paths_.push_back(std::move(real_path));
    interpreters_.push_back(std::move(interpreter));
    return true;
}

void CandidateSet::add_all(std::vector<Interpreter> interpreters) {
    for (auto &interpreter : interpreters) {
        add(std::move(interpreter));
    }
}

} // namespace pylauncher
