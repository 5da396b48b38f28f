#ifndef APP_CONFIG_HPP
#define APP_CONFIG_HPP

#include <cstdint>      // for uint32_t
#include <expected>     // for expected
#include <string>       // for string
#include <string_view>  // for string_view

namespace luks_usb {

/// Runtime configuration, passed explicitly to whoever needs it.
struct AppConfig {
    /// Verbose diagnostics (device detection, logger level).
    bool debug{false};
    /// Where LUKS header backups are written.
    std::string backup_dir{};
    /// Where opened mappings appear.
    std::string mapper_dir{"/dev/mapper"};
    /// spdlog file sink path.
    std::string log_file{"/tmp/luks-usb.log"};
    /// Minimum accepted passphrase length.
    std::uint32_t min_passphrase_length{8};
};

/// Returns AppConfig with defaults, backup_dir resolved to ~/luks_backups.
[[nodiscard]] auto get_default_config() noexcept -> AppConfig;

/// Parses configuration from JSON string content on top of the defaults.
/// @param json_content The JSON configuration content.
/// @return AppConfig on success, or error string on failure.
[[nodiscard]] auto parse_app_config(std::string_view json_content) noexcept
    -> std::expected<AppConfig, std::string>;

/// Reads and parses a configuration file.
/// @param filepath Path of the JSON file.
/// @return AppConfig on success, or error string on failure.
[[nodiscard]] auto load_app_config(std::string_view filepath) noexcept
    -> std::expected<AppConfig, std::string>;

}  // namespace luks_usb

#endif  // APP_CONFIG_HPP
