#ifndef DEVICE_CATALOG_HPP
#define DEVICE_CATALOG_HPP

#include "lusb/block_devices.hpp"
#include "lusb/partition_table.hpp"
#include "lusb/subprocess.hpp"

#include <expected>     // for expected
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace lusb::disk {

// Queries lsblk and parted for the state of removable devices.
class DeviceCatalog final {
 public:
    /// @param runner Executes lsblk and parted.
    /// @param debug Log why encryption detection failed.
    explicit DeviceCatalog(utils::CommandRunner& runner, bool debug = false) noexcept
      : m_runner(runner), m_debug(debug) { }

    /// @brief Lists removable, non-NVMe whole disks in enumeration order.
    /// @return candidate devices (possibly empty), or error message when lsblk fails.
    auto list_candidate_devices() -> std::expected<std::vector<BlockDevice>, std::string>;

    /// @brief Whether the device or any child entry is a LUKS layer.
    /// @return false when the query fails.
    auto detect_encryption(std::string_view device) -> bool;

    /// @brief Partition table kind reported by parted.
    /// @return PartitionTable::Unknown when parted fails or prints no table.
    auto partition_table_kind(std::string_view device) -> PartitionTable;

 private:
    utils::CommandRunner& m_runner;
    bool m_debug{false};
};

}  // namespace lusb::disk

#endif  // DEVICE_CATALOG_HPP
