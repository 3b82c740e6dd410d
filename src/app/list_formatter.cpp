#include "app/list_formatter.hpp"

#include <algorithm>
#include <array>
#include <format>
#include <ostream>
#include <string>
#include <vector>

namespace pylauncher {

void ListFormatter::write(std::ostream &out, const CandidateSet &candidates) const {
    std::vector<std::array<std::string, 4>> rows;
    rows.reserve(candidates.size());

    for (const auto &interpreter : candidates) {
        rows.push_back({
            interpreter.version.to_string(),
            std::string(architecture_name(interpreter.architecture)),
            std::string(tier_name(interpreter.origin_tier)),
            interpreter.executable_path.string(),
        });
    }

    std::array<std::size_t, 3> widths{};
    for (const auto &row : rows) {
        for (std::size_t column = 0; column < widths.size(); ++column) {
            widths[column] = std::max(widths[column], row[column].size());
        }
    }

    for (const auto &row : rows) {
        out << std::format("{:<{}}  {:<{}}  {:<{}}  {}\n", row[0], widths[0], row[1], widths[1], row[2], widths[2], row[3]);
    }
}

} // namespace pylauncher
