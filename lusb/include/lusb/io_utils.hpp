#ifndef IO_UTILS_HPP
#define IO_UTILS_HPP

#include <string>       // for string
#include <string_view>  // for string_view

namespace lusb::utils {

auto safe_getenv(const char* env_name) noexcept -> std::string_view;

/// @brief Home directory of the effective user.
/// @return $HOME if set, otherwise the passwd entry, otherwise "/root".
auto home_dir() noexcept -> std::string;

/// @brief Expands a leading '~' to the home directory.
/// @param path The path to expand.
/// @return The expanded path, or path unchanged when it doesn't start with '~'.
auto expand_home(std::string_view path) noexcept -> std::string;

}  // namespace lusb::utils

#endif  // IO_UTILS_HPP
