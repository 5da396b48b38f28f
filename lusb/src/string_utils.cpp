#include "lusb/string_utils.hpp"

#include <string.h>  // for explicit_bzero

#include <cctype>  // for tolower

namespace lusb::utils {

auto join(const std::vector<std::string>& lines, std::string_view delim) noexcept -> std::string {
    return lines | std::ranges::views::join_with(delim) | std::ranges::to<std::string>();
}

auto trim(std::string_view str) noexcept -> std::string_view {
    static constexpr std::string_view whitespace{" \t\n\r\f\v"};

    const auto first = str.find_first_not_of(whitespace);
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = str.find_last_not_of(whitespace);
    return str.substr(first, last - first + 1);
}

auto to_lower(std::string_view str) noexcept -> std::string {
    std::string result{str};
    std::ranges::transform(result, result.begin(),
        [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return result;
}

auto utf8_length(std::string_view str) noexcept -> std::size_t {
    return static_cast<std::size_t>(std::ranges::count_if(str,
        [](char ch) { return (static_cast<unsigned char>(ch) & 0xC0U) != 0x80U; }));
}

void secure_clear(std::string& secret) noexcept {
    if (!secret.empty()) {
        explicit_bzero(secret.data(), secret.size());
    }
    secret.clear();
}

}  // namespace lusb::utils
