#ifndef PARTITION_TABLE_HPP
#define PARTITION_TABLE_HPP

#include <cstdint>      // for uint8_t
#include <string_view>  // for string_view

namespace lusb::disk {

/// @brief Partition table kind reported by parted
enum class PartitionTable : std::uint8_t {
    Gpt,
    Mbr,
    Unknown,
    Other
};

/// @brief Convert partition table enum to string representation
/// @param table The partition table kind to convert
/// @return string view of the partition table kind
auto partition_table_to_string(PartitionTable table) noexcept -> std::string_view;

/// @brief Convert a parted label (e.g. "gpt", "msdos") to partition table enum
/// @param label The label, matched case-insensitively after trimming
/// @return partition table enum value
auto string_to_partition_table(std::string_view label) noexcept -> PartitionTable;

/// @brief Scans parted print output for the "Partition Table:" line
/// @param parted_output The output of `parted -s <device> print`
/// @return the kind, PartitionTable::Unknown when the line is missing
auto parse_partition_table(std::string_view parted_output) noexcept -> PartitionTable;

}  // namespace lusb::disk

#endif  // PARTITION_TABLE_HPP
