#pragma once

#include <string_view>
#include <vector>

namespace pylauncher {

[[nodiscard]] std::string_view trim(std::string_view text) noexcept;
[[nodiscard]] std::vector<std::string_view> split_whitespace(std::string_view text);

} // namespace pylauncher
