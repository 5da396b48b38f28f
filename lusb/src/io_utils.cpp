#include "lusb/io_utils.hpp"

#include <pwd.h>     // for getpwuid
#include <unistd.h>  // for geteuid

#include <cstdlib>  // for getenv

#include <fmt/compile.h>
#include <fmt/format.h>

using namespace std::string_view_literals;

namespace lusb::utils {

auto safe_getenv(const char* env_name) noexcept -> std::string_view {
    const char* const raw_val = getenv(env_name);
    return raw_val != nullptr ? std::string_view{raw_val} : std::string_view{};
}

auto home_dir() noexcept -> std::string {
    const auto& home_env = utils::safe_getenv("HOME");
    if (!home_env.empty()) {
        return std::string{home_env};
    }
    const auto* pw_entry = getpwuid(geteuid());
    if (pw_entry != nullptr && pw_entry->pw_dir != nullptr) {
        return std::string{pw_entry->pw_dir};
    }
    return "/root";
}

auto expand_home(std::string_view path) noexcept -> std::string {
    if (path == "~"sv) {
        return utils::home_dir();
    }
    if (path.starts_with("~/"sv)) {
        return fmt::format(FMT_COMPILE("{}/{}"), utils::home_dir(), path.substr(2));
    }
    return std::string{path};
}

}  // namespace lusb::utils
