#include "app_config.hpp"

// import lusb
#include "lusb/io_utils.hpp"

#include <fstream>  // for ifstream
#include <sstream>  // for stringstream

#if defined(__clang__)
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wold-style-cast"
#elif defined(__GNUC__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wuseless-cast"
#pragma GCC diagnostic ignored "-Wold-style-cast"
#endif

#include <rapidjson/document.h>

#if defined(__clang__)
#pragma clang diagnostic pop
#elif defined(__GNUC__)
#pragma GCC diagnostic pop
#endif

#include <fmt/compile.h>
#include <fmt/format.h>

using namespace std::string_view_literals;

namespace {

auto parse_string_field(const rapidjson::Document& doc, const char* key, std::string& out) noexcept
    -> std::expected<void, std::string> {
    if (!doc.HasMember(key)) {
        return {};
    }
    if (!doc[key].IsString()) {
        return std::unexpected(fmt::format(FMT_COMPILE("'{}' must be a string"), key));
    }
    out = doc[key].GetString();
    return {};
}

}  // namespace

namespace luks_usb {

auto get_default_config() noexcept -> AppConfig {
    return AppConfig{
        .debug                 = false,
        .backup_dir            = lusb::utils::expand_home("~/luks_backups"sv),
        .mapper_dir            = "/dev/mapper",
        .log_file              = "/tmp/luks-usb.log",
        .min_passphrase_length = 8,
    };
}

auto parse_app_config(std::string_view json_content) noexcept
    -> std::expected<AppConfig, std::string> {
    auto config = get_default_config();
    if (json_content.empty()) {
        return config;
    }

    rapidjson::Document doc;
    doc.Parse(json_content.data(), json_content.size());
    if (doc.HasParseError()) {
        return std::unexpected(fmt::format(FMT_COMPILE("JSON parse error at offset {}"), doc.GetErrorOffset()));
    }
    if (!doc.IsObject()) {
        return std::unexpected("JSON root must be an object");
    }

    if (doc.HasMember("debug")) {
        if (!doc["debug"].IsBool()) {
            return std::unexpected("'debug' must be a boolean");
        }
        config.debug = doc["debug"].GetBool();
    }

    if (auto res = parse_string_field(doc, "backup_dir", config.backup_dir); !res) {
        return std::unexpected(res.error());
    }
    if (auto res = parse_string_field(doc, "mapper_dir", config.mapper_dir); !res) {
        return std::unexpected(res.error());
    }
    if (auto res = parse_string_field(doc, "log_file", config.log_file); !res) {
        return std::unexpected(res.error());
    }
    config.backup_dir = lusb::utils::expand_home(config.backup_dir);

    if (doc.HasMember("min_passphrase_length")) {
        if (!doc["min_passphrase_length"].IsUint() || doc["min_passphrase_length"].GetUint() == 0) {
            return std::unexpected("'min_passphrase_length' must be a positive integer");
        }
        config.min_passphrase_length = doc["min_passphrase_length"].GetUint();
    }

    if (config.backup_dir.empty() || config.mapper_dir.empty()) {
        return std::unexpected("'backup_dir' and 'mapper_dir' must not be empty");
    }
    return config;
}

auto load_app_config(std::string_view filepath) noexcept
    -> std::expected<AppConfig, std::string> {
    std::ifstream config_file{std::string{filepath}};
    if (!config_file.is_open()) {
        return std::unexpected(fmt::format(FMT_COMPILE("Failed to open config file '{}'"), filepath));
    }

    std::stringstream buffer{};
    buffer << config_file.rdbuf();
    return parse_app_config(buffer.str());
}

}  // namespace luks_usb
