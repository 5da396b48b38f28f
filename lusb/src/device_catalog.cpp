#include "lusb/device_catalog.hpp"

#include <utility>  // for move

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

namespace lusb::disk {

auto DeviceCatalog::list_candidate_devices() -> std::expected<std::vector<BlockDevice>, std::string> {
    auto lsblk_result = m_runner.run("lsblk", {"--json", "-o", "NAME,SIZE,TYPE,ROTA,MODEL,VENDOR,FSTYPE,MOUNTPOINT,RM"});
    if (!lsblk_result) {
        spdlog::error("lsblk failed with exit code {}", lsblk_result.error().exit_code);
        return std::unexpected(utils::format_tool_error(lsblk_result.error()));
    }

    auto entries = parse_lsblk_json(lsblk_result->out);
    if (!entries) {
        spdlog::error("{}", entries.error());
        return std::unexpected(std::move(entries.error()));
    }

    auto devices = filter_candidate_devices(*entries);
    spdlog::info("Found {} candidate device(s) out of {} lsblk entries", devices.size(), entries->size());
    return devices;
}

auto DeviceCatalog::detect_encryption(std::string_view device) -> bool {
    auto lsblk_result = m_runner.run("lsblk", {"--json", "-o", "NAME,TYPE,FSTYPE", std::string{device}});
    if (!lsblk_result) {
        if (m_debug) {
            spdlog::debug("Could not determine LUKS status for {}: {}", device, utils::format_tool_error(lsblk_result.error()));
        }
        return false;
    }

    const auto& entries = parse_lsblk_json(lsblk_result->out);
    if (!entries || entries->empty()) {
        if (m_debug) {
            spdlog::debug("Could not determine LUKS status for {}: {}", device,
                entries ? std::string{"no block device reported"} : entries.error());
        }
        return false;
    }

    const bool is_luks = has_luks_entry(entries->front());
    spdlog::info("Device {} LUKS status: {}", device, is_luks);
    return is_luks;
}

auto DeviceCatalog::partition_table_kind(std::string_view device) -> PartitionTable {
    auto parted_result = m_runner.run("parted", {"-s", std::string{device}, "print"}, {.input = {}, .allow_failure = true});
    if (!parted_result) {
        if (m_debug) {
            spdlog::debug("parted could not be run on {}: {}", device, utils::format_tool_error(parted_result.error()));
        }
        return PartitionTable::Unknown;
    }

    const auto table = parse_partition_table(parted_result->out);
    spdlog::info("Device {} partition table: {}", device, partition_table_to_string(table));
    return table;
}

}  // namespace lusb::disk
