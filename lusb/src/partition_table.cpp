#include "lusb/partition_table.hpp"
#include "lusb/string_utils.hpp"

using namespace std::string_view_literals;

namespace lusb::disk {

auto partition_table_to_string(PartitionTable table) noexcept -> std::string_view {
    switch (table) {
    case PartitionTable::Gpt:
        return "gpt"sv;
    case PartitionTable::Mbr:
        return "mbr"sv;
    case PartitionTable::Other:
        return "other"sv;
    case PartitionTable::Unknown:
    default:
        return "unknown"sv;
    }
}

auto string_to_partition_table(std::string_view label) noexcept -> PartitionTable {
    const auto& table_str = utils::to_lower(utils::trim(label));
    if (table_str == "gpt"sv) {
        return PartitionTable::Gpt;
    } else if (table_str == "msdos"sv || table_str == "mbr"sv) {
        return PartitionTable::Mbr;
    } else if (table_str.empty() || table_str == "unknown"sv) {
        return PartitionTable::Unknown;
    }
    return PartitionTable::Other;
}

auto parse_partition_table(std::string_view parted_output) noexcept -> PartitionTable {
    static constexpr auto table_label = "Partition Table:"sv;

    for (auto&& line : utils::make_split_view(parted_output)) {
        const auto pos = line.find(table_label);
        if (pos == std::string_view::npos) {
            continue;
        }
        return string_to_partition_table(line.substr(pos + table_label.size()));
    }
    return PartitionTable::Unknown;
}

}  // namespace lusb::disk
