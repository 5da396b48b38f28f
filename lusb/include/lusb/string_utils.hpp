#ifndef STRING_UTILS_HPP
#define STRING_UTILS_HPP

#include <algorithm>    // for transform
#include <cstddef>      // for size_t
#include <ranges>       // for ranges::*
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace lusb::utils {

/// @brief Join a vector of strings into a single string using a delimiter.
/// @param lines The lines to join.
/// @param delim The delimiter to join the lines.
/// @return The joined lines as a single string.
auto join(const std::vector<std::string>& lines, std::string_view delim = "\n") noexcept -> std::string;

/// @brief Strip whitespace surrounding the string. Interior whitespace is kept.
auto trim(std::string_view str) noexcept -> std::string_view;

/// @brief ASCII lower-case copy of the string.
auto to_lower(std::string_view str) noexcept -> std::string;

/// @brief Number of code points in UTF-8 text. Continuation bytes are not counted.
auto utf8_length(std::string_view str) noexcept -> std::size_t;

/// @brief Overwrites the contents with zeros, then empties the string.
void secure_clear(std::string& secret) noexcept;

/// @brief Make a split view from a string into multiple lines based on a delimiter.
/// @param str The string to split.
/// @param delim The delimiter to split the string.
/// @return A range view representing the split lines.
constexpr auto make_split_view(std::string_view str, char delim = '\n') noexcept {
    constexpr auto functor = [](auto&& rng) {
        return std::string_view(&*rng.begin(), static_cast<size_t>(std::ranges::distance(rng)));
    };
    constexpr auto second = [](auto&& rng) { return rng != ""; };

    return str
        | std::ranges::views::split(delim)
        | std::ranges::views::transform(functor)
        | std::ranges::views::filter(second);
}

}  // namespace lusb::utils

#endif  // STRING_UTILS_HPP
