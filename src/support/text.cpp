#include "support/text.hpp"

namespace pylauncher {

namespace {

constexpr std::string_view kWhitespace = " \t\r\n\v\f";

} // namespace

std::string_view trim(std::string_view text) noexcept {
    const auto first = text.find_first_not_of(kWhitespace);
    if (first == std::string_view::npos) {
        return {};
    }

    const auto last = text.find_last_not_of(kWhitespace);
    return text.substr(first, last - first + 1);
}

std::vector<std::string_view> split_whitespace(std::string_view text) {
    std::vector<std::string_view> words;

    std::size_t position = text.find_first_not_of(kWhitespace);
    while (position != std::string_view::npos) {
        const auto end = text.find_first_of(kWhitespace, position);
        words.push_back(text.substr(position, end == std::string_view::npos ? end : end - position));
        position = end == std::string_view::npos ? end : text.find_first_not_of(kWhitespace, end);
    }

    return words;
}

} // namespace pylauncher
