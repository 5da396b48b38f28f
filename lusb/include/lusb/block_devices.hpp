#ifndef BLOCK_DEVICES_HPP
#define BLOCK_DEVICES_HPP

#include <expected>     // for expected
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace lusb::disk {

/// @brief One record of lsblk JSON output, with its nested children.
struct LsblkEntry final {
    /// Kernel name (e.g., sdb, sdb1).
    std::string name;
    /// Human readable size (e.g., 14.9G).
    std::string size;
    /// Device type (e.g., disk, part, crypt).
    std::string type;
    /// Filesystem type (e.g., vfat, crypto_LUKS).
    std::string fstype;
    /// Device model, whitespace trimmed.
    std::string model;
    /// Device vendor, whitespace trimmed.
    std::string vendor;
    /// Mount point.
    std::optional<std::string> mountpoint;
    bool is_rotational{false};
    bool is_removable{false};
    /// Partitions and holders nested under this entry.
    std::vector<LsblkEntry> children;
};

/// @brief A removable whole disk offered to the operator.
struct BlockDevice final {
    /// Device path (e.g., /dev/sdb).
    std::string path;
    /// Size label as reported by lsblk.
    std::string size;
    std::string model;
    std::string vendor;
    /// "{vendor} {model} {size}" or "{path} {size}".
    std::string display_name;
    bool is_removable{false};
    /// Whether the disk or any of its partitions is mounted.
    bool is_mounted{false};
};

/// @brief Parses JSON output of lsblk --json into a tree of entries.
/// @param json_output The JSON string from lsblk.
/// @return top level entries, or error message when the output is not valid lsblk JSON.
auto parse_lsblk_json(std::string_view json_output) noexcept -> std::expected<std::vector<LsblkEntry>, std::string>;

/// @brief Whether the entry or any descendant reports a non-empty mountpoint.
auto has_mounted_entry(const LsblkEntry& entry) noexcept -> bool;

/// @brief Whether the entry or one of its direct children is a LUKS layer.
/// @return true if type is "crypt" or fstype is "crypto_LUKS".
auto has_luks_entry(const LsblkEntry& entry) noexcept -> bool;

/// @brief Builds the operator facing label for a disk.
auto make_display_name(std::string_view path, std::string_view vendor, std::string_view model, std::string_view size) noexcept -> std::string;

/// @brief Keeps removable, non-NVMe whole disks, in enumeration order.
/// @param entries Top level lsblk entries.
/// @return candidate devices.
auto filter_candidate_devices(const std::vector<LsblkEntry>& entries) noexcept -> std::vector<BlockDevice>;

}  // namespace lusb::disk

#endif  // BLOCK_DEVICES_HPP
