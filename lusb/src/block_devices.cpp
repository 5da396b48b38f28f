#include "lusb/block_devices.hpp"
#include "lusb/string_utils.hpp"

#include <algorithm>  // for any_of
#include <ranges>     // for ranges::*
#include <utility>    // for move

#if defined(__clang__)
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wold-style-cast"
#elif defined(__GNUC__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wuseless-cast"
#pragma GCC diagnostic ignored "-Wold-style-cast"
#endif

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

#if defined(__clang__)
#pragma clang diagnostic pop
#elif defined(__GNUC__)
#pragma GCC diagnostic pop
#endif

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

namespace {

using LsblkEntry = lusb::disk::LsblkEntry;

auto get_string_member(const rapidjson::Value& doc, const char* key) noexcept -> std::string {
    if (doc.HasMember(key) && doc[key].IsString()) {
        return doc[key].GetString();
    }
    return {};
}

// lsblk >= 2.33 emits booleans, older versions emit "0"/"1" strings
auto get_flag_member(const rapidjson::Value& doc, const char* key) noexcept -> bool {
    if (!doc.HasMember(key)) {
        return false;
    }
    const auto& value = doc[key];
    if (value.IsBool()) {
        return value.GetBool();
    }
    if (value.IsInt()) {
        return value.GetInt() != 0;
    }
    if (value.IsString()) {
        return std::string_view{value.GetString()} == "1"sv;
    }
    return false;
}

/// Constructs a LsblkEntry from a RapidJSON object.
auto get_entry_from_json(const rapidjson::Value& doc) -> LsblkEntry {
    auto entry   = LsblkEntry{};
    entry.name   = get_string_member(doc, "name");
    entry.size   = get_string_member(doc, "size");
    entry.type   = get_string_member(doc, "type");
    entry.fstype = get_string_member(doc, "fstype");
    entry.model  = std::string{lusb::utils::trim(get_string_member(doc, "model"))};
    entry.vendor = std::string{lusb::utils::trim(get_string_member(doc, "vendor"))};

    if (doc.HasMember("mountpoint") && doc["mountpoint"].IsString()) {
        entry.mountpoint = doc["mountpoint"].GetString();
    }
    entry.is_rotational = get_flag_member(doc, "rota");
    entry.is_removable  = get_flag_member(doc, "rm");

    if (doc.HasMember("children") && doc["children"].IsArray()) {
        for (const auto& child : doc["children"].GetArray()) {
            if (child.IsObject()) {
                entry.children.emplace_back(get_entry_from_json(child));
            }
        }
    }
    return entry;
}

auto is_nvme_name(std::string_view name) noexcept -> bool {
    return lusb::utils::to_lower(name).contains("nvme"sv);
}

}  // namespace

namespace lusb::disk {

auto parse_lsblk_json(std::string_view json_output) noexcept -> std::expected<std::vector<LsblkEntry>, std::string> {
    rapidjson::Document document;
    document.Parse(json_output.data(), json_output.size());

    if (document.HasParseError()) {
        return std::unexpected(fmt::format(FMT_COMPILE("Failed to parse lsblk output: {}"),
            rapidjson::GetParseError_En(document.GetParseError())));
    }
    if (!document.IsObject() || !document.HasMember("blockdevices") || !document["blockdevices"].IsArray()) {
        return std::unexpected("lsblk output has no 'blockdevices' array");
    }

    std::vector<LsblkEntry> entries{};
    for (const auto& device_json : document["blockdevices"].GetArray()) {
        if (device_json.IsObject()) {
            entries.emplace_back(get_entry_from_json(device_json));
        }
    }
    return entries;
}

auto has_mounted_entry(const LsblkEntry& entry) noexcept -> bool {
    if (entry.mountpoint.has_value() && !entry.mountpoint->empty()) {
        return true;
    }
    return std::ranges::any_of(entry.children, [](auto&& child) { return has_mounted_entry(child); });
}

auto has_luks_entry(const LsblkEntry& entry) noexcept -> bool {
    constexpr auto is_luks_layer = [](const LsblkEntry& layer) {
        return layer.type == "crypt"sv || layer.fstype == "crypto_LUKS"sv;
    };
    return is_luks_layer(entry) || std::ranges::any_of(entry.children, is_luks_layer);
}

auto make_display_name(std::string_view path, std::string_view vendor, std::string_view model, std::string_view size) noexcept -> std::string {
    if (!vendor.empty() && !model.empty()) {
        return fmt::format(FMT_COMPILE("{} {} {}"), vendor, model, size);
    }
    return fmt::format(FMT_COMPILE("{} {}"), path, size);
}

auto filter_candidate_devices(const std::vector<LsblkEntry>& entries) noexcept -> std::vector<BlockDevice> {
    std::vector<BlockDevice> devices{};
    for (const auto& entry : entries) {
        if (entry.type != "disk"sv) {
            continue;
        }
        // internal NVMe drives are never USB targets
        if (is_nvme_name(entry.name)) {
            spdlog::debug("Skipping NVMe device '{}'", entry.name);
            continue;
        }
        if (!entry.is_removable) {
            spdlog::debug("Skipping non-removable device '{}'", entry.name);
            continue;
        }

        auto device         = BlockDevice{};
        device.path         = fmt::format(FMT_COMPILE("/dev/{}"), entry.name);
        device.size         = entry.size;
        device.model        = entry.model;
        device.vendor       = entry.vendor;
        device.display_name = make_display_name(device.path, device.vendor, device.model, device.size);
        device.is_removable = entry.is_removable;
        device.is_mounted   = has_mounted_entry(entry);
        devices.emplace_back(std::move(device));
    }
    return devices;
}

}  // namespace lusb::disk
