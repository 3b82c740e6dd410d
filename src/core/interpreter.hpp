#pragma once

#include <cstddef>
#include <filesystem>
#include <string_view>
#include <vector>

#include "core/version.hpp"

namespace pylauncher {

// Declaration order is precedence order: lower values outrank higher ones.
enum class OriginTier {
    Shebang,
    VirtualEnv,
    VersionFile,
    Path,
};

[[nodiscard]] std::string_view tier_name(OriginTier tier) noexcept;

struct Interpreter {
    std::filesystem::path executable_path;
    ExactVersion version;
    Architecture architecture{Architecture::Unknown};
    OriginTier origin_tier{OriginTier::Path};
};

class CandidateSet {
  public:
    using const_iterator = std::vector<Interpreter>::const_iterator;

    // Appends unless an interpreter with the same real path is already present.
    bool add(Interpreter interpreter);
    void add_all(std::vector<Interpreter> interpreters);

    [[nodiscard]] bool empty() const noexcept { return interpreters_.empty(); }
    [[nodiscard]] std::size_t size() const noexcept { return interpreters_.size(); }
    [[nodiscard]] const Interpreter &operator[](std::size_t index) const { return interpreters_[index]; }
    [[nodiscard]] const_iterator begin() const noexcept { return interpreters_.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return interpreters_.end(); }

  private:
    std::vector<Interpreter> interpreters_;
    std::vector<std::filesystem::path> real_paths_;
};

[[nodiscard]] std::filesystem::path real_path_of(const std::filesystem::path &path);

} // namespace pylauncher
