#include "lusb/luks.hpp"
#include "lusb/string_utils.hpp"

#include <chrono>        // for system_clock
#include <iterator>      // for back_inserter
#include <system_error>  // for error_code

#include <fmt/chrono.h>
#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace lusb::crypto {

auto luks2_format_args(std::string_view device, const LuksFormatProfile& profile) noexcept -> std::vector<std::string> {
    return {
        "luksFormat",
        "--type",
        std::string{profile.type},
        "--cipher",
        std::string{profile.cipher},
        "--key-size",
        std::to_string(profile.key_size),
        "--hash",
        std::string{profile.hash},
        "--iter-time",
        std::to_string(profile.iter_time),
        "--pbkdf",
        std::string{profile.pbkdf},
        std::string{device},
    };
}

auto luks2_format(utils::CommandRunner& runner, std::string_view device, std::string_view luks_pass,
    const LuksFormatProfile& profile) -> std::expected<void, utils::ExternalToolError> {
    // "YES" confirms the overwrite, then passphrase and its verification
    // capacity reserved so the buffer holding the passphrase never reallocates
    utils::RunOptions opts{};
    auto& input = opts.input.emplace();
    input.reserve((luks_pass.size() * 2) + 6);
    fmt::format_to(std::back_inserter(input), FMT_COMPILE("YES\n{0}\n{0}\n"), luks_pass);

    spdlog::info("Formatting {} as {} ({}, {} bit key, {}, {})", device, profile.type, profile.cipher, profile.key_size, profile.hash, profile.pbkdf);
    auto format_result = runner.run("cryptsetup", luks2_format_args(device, profile), opts);
    utils::secure_clear(input);
    if (!format_result) {
        spdlog::error("luksFormat of {} failed with exit code {}", device, format_result.error().exit_code);
        return std::unexpected(std::move(format_result.error()));
    }
    return {};
}

auto luks_open(utils::CommandRunner& runner, std::string_view device, std::string_view luks_name,
    std::string_view luks_pass) -> std::expected<void, OpenError> {
    utils::RunOptions opts{};
    auto& input = opts.input.emplace();
    input.reserve(luks_pass.size() + 1);
    fmt::format_to(std::back_inserter(input), FMT_COMPILE("{}\n"), luks_pass);

    auto open_result = runner.run("cryptsetup", {"luksOpen", std::string{device}, std::string{luks_name}}, opts);
    utils::secure_clear(input);
    if (!open_result) {
        const auto kind = (open_result.error().exit_code == CRYPTSETUP_EXIT_BUSY) ? OpenErrorKind::Busy : OpenErrorKind::Failed;
        spdlog::error("luksOpen of {} as '{}' failed with exit code {}", device, luks_name, open_result.error().exit_code);
        return std::unexpected(OpenError{.kind = kind, .tool_error = std::move(open_result.error())});
    }

    spdlog::info("Opened {} as /dev/mapper/{}", device, luks_name);
    return {};
}

auto make_header_backup_path(const fs::path& backup_dir, std::string_view device, const std::tm& timestamp) noexcept -> fs::path {
    const auto& device_base = fs::path{device}.filename().string();
    return backup_dir / fmt::format("{}_{:%Y%m%d_%H%M%S}.header", device_base, timestamp);
}

auto luks_header_backup(utils::CommandRunner& runner, std::string_view device, const fs::path& backup_dir)
    -> std::expected<fs::path, std::string> {
    std::error_code err{};
    fs::create_directories(backup_dir, err);
    if (err) {
        return std::unexpected(fmt::format(FMT_COMPILE("Failed to create backup directory '{}': {}"), backup_dir.string(), err.message()));
    }

    const auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local_time{};
    localtime_r(&now, &local_time);

    auto backup_file = make_header_backup_path(backup_dir, device, local_time);
    auto backup_result = runner.run("cryptsetup", {"luksHeaderBackup", std::string{device}, "--header-backup-file", backup_file.string()});
    if (!backup_result) {
        return std::unexpected(utils::format_tool_error(backup_result.error()));
    }

    spdlog::info("LUKS header of {} saved to {}", device, backup_file.string());
    return backup_file;
}

}  // namespace lusb::crypto
