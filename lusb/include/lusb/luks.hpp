#ifndef LUKS_HPP
#define LUKS_HPP

#include "lusb/subprocess.hpp"

#include <cstdint>      // for int32_t, uint32_t
#include <ctime>        // for tm
#include <expected>     // for expected
#include <filesystem>   // for path
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace lusb::crypto {

/// @brief cryptsetup exit code for "device already exists or device is busy".
inline constexpr std::int32_t CRYPTSETUP_EXIT_BUSY = 5;

/// @brief Algorithm profile passed to luksFormat.
struct LuksFormatProfile final {
    std::string_view type{"luks2"};
    std::string_view cipher{"aes-xts-plain64"};
    std::uint32_t key_size{512};
    std::string_view hash{"sha512"};
    /// Minimum PBKDF calibration window in milliseconds.
    std::uint32_t iter_time{2000};
    std::string_view pbkdf{"argon2id"};
};

enum class OpenErrorKind : std::uint8_t {
    /// Device still mounted or already mapped elsewhere.
    Busy,
    Failed
};

struct OpenError final {
    OpenErrorKind kind{OpenErrorKind::Failed};
    utils::ExternalToolError tool_error{};
};

/// @brief Arguments for cryptsetup luksFormat with the given profile.
auto luks2_format_args(std::string_view device, const LuksFormatProfile& profile = {}) noexcept -> std::vector<std::string>;

/// @brief Formats device as LUKS, answering cryptsetup's overwrite question
/// and passphrase prompts through stdin. Destroys all data on the device.
auto luks2_format(utils::CommandRunner& runner, std::string_view device, std::string_view luks_pass,
    const LuksFormatProfile& profile = {}) -> std::expected<void, utils::ExternalToolError>;

/// @brief Opens a LUKS device as /dev/mapper/<luks_name>.
/// @return OpenErrorKind::Busy when cryptsetup reports the device in use.
auto luks_open(utils::CommandRunner& runner, std::string_view device, std::string_view luks_name,
    std::string_view luks_pass) -> std::expected<void, OpenError>;

/// @brief Backup file path: <backup_dir>/<device base name>_<YYYYMMDD_HHMMSS>.header
auto make_header_backup_path(const std::filesystem::path& backup_dir, std::string_view device, const std::tm& timestamp) noexcept -> std::filesystem::path;

/// @brief Writes a LUKS header backup, creating backup_dir if absent.
/// @return The backup file path, or error message.
auto luks_header_backup(utils::CommandRunner& runner, std::string_view device, const std::filesystem::path& backup_dir)
    -> std::expected<std::filesystem::path, std::string>;

}  // namespace lusb::crypto

#endif  // LUKS_HPP
