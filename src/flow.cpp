#include "flow.hpp"

// import lusb
#include "lusb/luks.hpp"
#include "lusb/partition_table.hpp"
#include "lusb/string_utils.hpp"

#include <charconv>      // for from_chars
#include <filesystem>    // for exists, path
#include <system_error>  // for error_code
#include <utility>       // for move

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;
using namespace std::string_view_literals;

namespace tui {

auto flow_state_to_string(FlowState state) noexcept -> std::string_view {
    switch (state) {
    case FlowState::SelectDevice:
        return "select-device"sv;
    case FlowState::ClassifyDevice:
        return "classify-device"sv;
    case FlowState::EncryptedMenu:
        return "encrypted-menu"sv;
    case FlowState::OpenExisting:
        return "open-existing"sv;
    case FlowState::ConfirmReencrypt:
        return "confirm-reencrypt"sv;
    case FlowState::CheckGpt:
        return "check-gpt"sv;
    case FlowState::ConfirmEncrypt:
        return "confirm-encrypt"sv;
    case FlowState::CollectPassphrase:
        return "collect-passphrase"sv;
    case FlowState::Format:
        return "format"sv;
    case FlowState::HeaderBackup:
        return "header-backup"sv;
    case FlowState::CollectMapperName:
        return "collect-mapper-name"sv;
    case FlowState::OpenNew:
        return "open-new"sv;
    case FlowState::Quit:
        return "quit"sv;
    case FlowState::Opened:
        return "opened"sv;
    }
    return "unknown"sv;
}

auto flow_error_to_string(FlowError error) noexcept -> std::string_view {
    switch (error) {
    case FlowError::ToolFailure:
        return "external tool failure"sv;
    case FlowError::NameConflict:
        return "mapper name conflict"sv;
    case FlowError::DeviceBusy:
        return "device busy"sv;
    case FlowError::PartitionTableUnsupported:
        return "unsupported partition table"sv;
    case FlowError::InputClosed:
        return "input closed"sv;
    }
    return "unknown"sv;
}

auto check_passphrase(std::string_view first, std::string_view second, std::size_t min_length) noexcept -> PassphraseCheck {
    if (first != second) {
        return PassphraseCheck::Mismatch;
    }
    if (lusb::utils::utf8_length(first) < min_length) {
        return PassphraseCheck::TooShort;
    }
    return PassphraseCheck::Accepted;
}

auto matches_confirmation(std::string_view input, std::string_view sentence) noexcept -> bool {
    return lusb::utils::trim(input) == sentence;
}

auto parse_menu_index(std::string_view input, std::size_t count) noexcept -> std::optional<std::size_t> {
    input = lusb::utils::trim(input);
    if (input.empty()) {
        return std::nullopt;
    }

    std::size_t number{};
    const auto* input_end = input.data() + input.size();
    const auto [ptr, ec]  = std::from_chars(input.data(), input_end, number);
    if (ec != std::errc{} || ptr != input_end) {
        return std::nullopt;
    }
    if (number == 0 || number > count) {
        return std::nullopt;
    }
    return number - 1;
}

auto is_valid_mapper_name(std::string_view name) noexcept -> bool {
    return !name.empty() && name != "."sv && name != ".."sv && !name.contains('/');
}

Session::~Session() noexcept {
    lusb::utils::secure_clear(passphrase);
}

DecisionFlow::DecisionFlow(lusb::utils::CommandRunner& runner, Terminal& term, const luks_usb::AppConfig& config) noexcept
  : m_runner(runner), m_term(term), m_config(config), m_catalog(runner, config.debug) { }

auto DecisionFlow::run() -> std::int32_t {
    auto state = FlowState::SelectDevice;
    while (state != FlowState::Quit && state != FlowState::Opened) {
        spdlog::debug("[flow] entering '{}'", flow_state_to_string(state));
        auto next = step(state);
        if (!next) {
            m_error = next.error();
            spdlog::error("[flow] '{}' failed: {}", flow_state_to_string(state), flow_error_to_string(next.error()));
            lusb::utils::secure_clear(m_session.passphrase);
            return 1;
        }
        state = *next;
    }

    spdlog::info("[flow] finished in '{}'", flow_state_to_string(state));
    lusb::utils::secure_clear(m_session.passphrase);
    return 0;
}

auto DecisionFlow::step(FlowState state) -> Transition {
    switch (state) {
    case FlowState::SelectDevice:
        return select_device();
    case FlowState::ClassifyDevice:
        return classify_device();
    case FlowState::EncryptedMenu:
        return encrypted_menu();
    case FlowState::OpenExisting:
        return open_existing();
    case FlowState::ConfirmReencrypt:
        return confirm_reencrypt();
    case FlowState::CheckGpt:
        return check_gpt();
    case FlowState::ConfirmEncrypt:
        return confirm_encrypt();
    case FlowState::CollectPassphrase:
        return collect_passphrase();
    case FlowState::Format:
        return format_device();
    case FlowState::HeaderBackup:
        return header_backup();
    case FlowState::CollectMapperName:
        return collect_mapper_name();
    case FlowState::OpenNew:
        return open_new();
    case FlowState::Quit:
    case FlowState::Opened:
        break;
    }
    return state;
}

auto DecisionFlow::select_device() -> Transition {
    auto devices = m_catalog.list_candidate_devices();
    if (!devices) {
        m_term.print(Style::Error, fmt::format(FMT_COMPILE("Error listing block devices:\n{}\n"), devices.error()));
        return std::unexpected(FlowError::ToolFailure);
    }
    if (devices->empty()) {
        m_term.print(Style::Info, "No suitable USB devices found. Ensure the device is connected and removable.\n"sv);
        return FlowState::Quit;
    }
    m_session.candidates = std::move(*devices);

    m_term.print(Style::Plain, "\nAvailable USB Devices:\n"sv);
    for (std::size_t i = 0; i < m_session.candidates.size(); ++i) {
        const auto& candidate = m_session.candidates[i];
        m_term.print(Style::Plain, fmt::format(FMT_COMPILE("  [{}] {} ({}){}\n"), i + 1, candidate.path,
                                       candidate.display_name, candidate.is_mounted ? " (Currently Mounted)" : ""));
    }

    while (true) {
        auto selection = prompt_line("\nEnter the number of the device to encrypt/open (or 'q' to quit): "sv);
        if (!selection) {
            return std::unexpected(selection.error());
        }

        const auto& input = lusb::utils::trim(*selection);
        if (input == "q"sv || input == "Q"sv) {
            m_term.print(Style::Plain, "Exiting.\n"sv);
            return FlowState::Quit;
        }

        const auto& index = parse_menu_index(input, m_session.candidates.size());
        if (!index) {
            m_term.print(Style::Warning, "Invalid selection.\n"sv);
            continue;
        }

        m_session.device = m_session.candidates[*index];
        spdlog::info("Selected device {}", m_session.device->path);
        m_term.print(Style::Plain, fmt::format(FMT_COMPILE("\nSelected: {} ({})\n"), m_session.device->path, m_session.device->display_name));
        return FlowState::ClassifyDevice;
    }
}

auto DecisionFlow::classify_device() -> Transition {
    if (m_catalog.detect_encryption(device_path())) {
        m_term.print(Style::Info, fmt::format(FMT_COMPILE("\nNote: {} appears to be already LUKS-encrypted.\n"), device_path()));
        return FlowState::EncryptedMenu;
    }
    return FlowState::CheckGpt;
}

auto DecisionFlow::encrypted_menu() -> Transition {
    while (true) {
        auto answer = prompt_line("Do you want to open it (type 'open'), re-encrypt (type 're-encrypt'), or exit (type 'exit')? "sv);
        if (!answer) {
            return std::unexpected(answer.error());
        }

        const auto& action = lusb::utils::to_lower(lusb::utils::trim(*answer));
        if (action == "exit"sv) {
            m_term.print(Style::Plain, "Exiting.\n"sv);
            return FlowState::Quit;
        } else if (action == "open"sv) {
            return FlowState::OpenExisting;
        } else if (action == "re-encrypt"sv) {
            return FlowState::ConfirmReencrypt;
        }
        m_term.print(Style::Warning, "Invalid choice. Type 'open', 're-encrypt', or 'exit'.\n"sv);
    }
}

auto DecisionFlow::open_existing() -> Transition {
    auto mapper_name = prompt_mapper_name("Enter mapper name (e.g., 'my_encrypted_usb'): "sv);
    if (!mapper_name) {
        return std::unexpected(mapper_name.error());
    }
    m_session.mapper_name = std::move(*mapper_name);

    auto passphrase = prompt_secret("Enter LUKS passphrase: "sv);
    if (!passphrase) {
        return std::unexpected(passphrase.error());
    }
    lusb::utils::secure_clear(m_session.passphrase);
    m_session.passphrase = *passphrase;
    lusb::utils::secure_clear(*passphrase);

    auto opened_path = open_volume();
    if (!opened_path) {
        return std::unexpected(opened_path.error());
    }
    m_term.print(Style::Success, fmt::format(FMT_COMPILE("Successfully opened: {}\n"), *opened_path));
    m_term.print(Style::Plain, fmt::format(FMT_COMPILE("You may now mount it, e.g.:\n  sudo mount {} /mnt/usb\n"), *opened_path));
    return FlowState::Opened;
}

auto DecisionFlow::confirm_reencrypt() -> Transition {
    m_term.print(Style::Warning, "\nWARNING: Re-encrypting will ERASE ALL DATA on the selected device.\n"sv);
    m_term.print(Style::Plain, fmt::format(FMT_COMPILE("\nType '{}' to proceed with re-encryption:\n"), REENCRYPT_CONFIRMATION));

    auto answer = prompt_line("> "sv);
    if (!answer) {
        return std::unexpected(answer.error());
    }
    if (!matches_confirmation(*answer, REENCRYPT_CONFIRMATION)) {
        m_term.print(Style::Plain, "Re-encryption cancelled. Exiting.\n"sv);
        return FlowState::Quit;
    }
    spdlog::warn("Operator confirmed re-encryption of {}", device_path());
    return FlowState::CheckGpt;
}

auto DecisionFlow::check_gpt() -> Transition {
    const auto table = m_catalog.partition_table_kind(device_path());
    if (table != lusb::disk::PartitionTable::Gpt) {
        m_term.print(Style::Error, fmt::format(FMT_COMPILE("\nError: {} uses '{}' partition table.\n"
                                                           "Only GPT is supported. Convert it using tools like 'gparted' or 'parted', then run again.\n"),
                                       device_path(), lusb::disk::partition_table_to_string(table)));
        return std::unexpected(FlowError::PartitionTableUnsupported);
    }
    m_term.print(Style::Info, "Partition Table: GPT (OK)\n"sv);
    return FlowState::ConfirmEncrypt;
}

auto DecisionFlow::confirm_encrypt() -> Transition {
    m_term.print(Style::Warning, fmt::format(FMT_COMPILE("\nWARNING: Encrypting will ERASE ALL DATA on {}.\n"), device_path()));
    m_term.print(Style::Plain, fmt::format(FMT_COMPILE("\nType '{}' to proceed:\n"), ENCRYPT_CONFIRMATION));

    auto answer = prompt_line("> "sv);
    if (!answer) {
        return std::unexpected(answer.error());
    }
    if (!matches_confirmation(*answer, ENCRYPT_CONFIRMATION)) {
        m_term.print(Style::Plain, "Confirmation failed. Exiting.\n"sv);
        return FlowState::Quit;
    }
    spdlog::warn("Operator confirmed encryption of {}", device_path());
    return FlowState::CollectPassphrase;
}

auto DecisionFlow::collect_passphrase() -> Transition {
    while (true) {
        auto first = prompt_secret("Enter LUKS passphrase: "sv);
        if (!first) {
            return std::unexpected(first.error());
        }
        auto second = prompt_secret("Confirm LUKS passphrase: "sv);
        if (!second) {
            lusb::utils::secure_clear(*first);
            return std::unexpected(second.error());
        }

        const auto check = check_passphrase(*first, *second, m_config.min_passphrase_length);
        lusb::utils::secure_clear(*second);
        switch (check) {
        case PassphraseCheck::Accepted:
            lusb::utils::secure_clear(m_session.passphrase);
            m_session.passphrase = *first;
            lusb::utils::secure_clear(*first);
            return FlowState::Format;
        case PassphraseCheck::Mismatch:
            m_term.print(Style::Warning, "Passphrases do not match.\n"sv);
            break;
        case PassphraseCheck::TooShort:
            m_term.print(Style::Warning, fmt::format(FMT_COMPILE("Passphrase too short. Use at least {} characters.\n"), m_config.min_passphrase_length));
            break;
        }
        lusb::utils::secure_clear(*first);
    }
}

auto DecisionFlow::format_device() -> Transition {
    m_term.start_progress(fmt::format(FMT_COMPILE("Formatting {} with LUKS"), device_path()));
    auto format_result = lusb::crypto::luks2_format(m_runner, device_path(), m_session.passphrase);
    m_term.stop_progress();

    if (!format_result) {
        m_term.print(Style::Error, fmt::format(FMT_COMPILE("Formatting failed:\n{}\n"), lusb::utils::format_tool_error(format_result.error())));
        return std::unexpected(FlowError::ToolFailure);
    }
    m_term.print(Style::Success, fmt::format(FMT_COMPILE("\nSuccessfully formatted {} with LUKS.\n"), device_path()));
    return FlowState::HeaderBackup;
}

auto DecisionFlow::header_backup() -> Transition {
    // best effort: the device is already formatted
    auto backup_file = lusb::crypto::luks_header_backup(m_runner, device_path(), m_config.backup_dir);
    if (!backup_file) {
        spdlog::error("Header backup of {} failed", device_path());
        m_term.print(Style::Warning, fmt::format(FMT_COMPILE("Failed to back up LUKS header: {}\n"), backup_file.error()));
        return FlowState::CollectMapperName;
    }

    m_term.print(Style::Success, fmt::format(FMT_COMPILE("\nLUKS header backup saved to: {}\n"), backup_file->string()));
    m_term.print(Style::Plain, "Keep this file safe! Use it to restore with:\n"
                               "  cryptsetup luksHeaderRestore <device> --header-backup-file <file>\n"sv);
    return FlowState::CollectMapperName;
}

auto DecisionFlow::collect_mapper_name() -> Transition {
    auto mapper_name = prompt_mapper_name("Enter mapper name to open LUKS volume (e.g., 'my_encrypted_usb'): "sv);
    if (!mapper_name) {
        return std::unexpected(mapper_name.error());
    }
    m_session.mapper_name = std::move(*mapper_name);
    return FlowState::OpenNew;
}

auto DecisionFlow::open_new() -> Transition {
    auto opened_path = open_volume();
    if (!opened_path) {
        return std::unexpected(opened_path.error());
    }
    m_term.print(Style::Success, fmt::format(FMT_COMPILE("\nSuccessfully opened: {}\n"), *opened_path));
    m_term.print(Style::Plain, fmt::format(FMT_COMPILE("You can now create a filesystem on it, e.g.:\n  sudo mkfs.ext4 {0}\n"
                                                       "And mount it, e.g.:\n  sudo mount {0} /mnt/usb\n"),
                                   *opened_path));
    return FlowState::Opened;
}

auto DecisionFlow::prompt_line(std::string_view prompt) -> std::expected<std::string, FlowError> {
    auto line = m_term.read_line(prompt);
    if (!line) {
        m_term.print(Style::Error, "\nInput closed. Exiting.\n"sv);
        return std::unexpected(FlowError::InputClosed);
    }
    return std::move(*line);
}

auto DecisionFlow::prompt_secret(std::string_view prompt) -> std::expected<std::string, FlowError> {
    auto secret = m_term.read_secret(prompt);
    if (!secret) {
        m_term.print(Style::Error, "\nInput closed. Exiting.\n"sv);
        return std::unexpected(FlowError::InputClosed);
    }
    std::expected<std::string, FlowError> result{*secret};
    lusb::utils::secure_clear(*secret);
    return result;
}

auto DecisionFlow::prompt_mapper_name(std::string_view prompt) -> std::expected<std::string, FlowError> {
    std::string mapper_name{};
    while (true) {
        auto answer = prompt_line(prompt);
        if (!answer) {
            return std::unexpected(answer.error());
        }
        mapper_name = lusb::utils::trim(*answer);
        if (is_valid_mapper_name(mapper_name)) {
            break;
        }
        m_term.print(Style::Warning, "Mapper name cannot be empty or contain '/'.\n"sv);
    }

    // never auto-resolved, the operator closes the mapping or picks another name
    const auto& mapper_path = fs::path{m_config.mapper_dir} / mapper_name;
    std::error_code err{};
    if (fs::exists(mapper_path, err)) {
        m_term.print(Style::Error, fmt::format(FMT_COMPILE("Error: {} already exists. Use a different name or close it first.\n"), mapper_path.string()));
        return std::unexpected(FlowError::NameConflict);
    }
    return mapper_name;
}

auto DecisionFlow::open_volume() -> std::expected<std::string, FlowError> {
    const auto& mapper_name = m_session.mapper_name;

    m_term.start_progress(fmt::format(FMT_COMPILE("Opening LUKS volume '{}'"), mapper_name));
    auto open_result = lusb::crypto::luks_open(m_runner, device_path(), mapper_name, m_session.passphrase);
    m_term.stop_progress();

    if (!open_result) {
        if (open_result.error().kind == lusb::crypto::OpenErrorKind::Busy) {
            m_term.print(Style::Error, fmt::format(FMT_COMPILE("\nError: The device '{}' is currently in use.\n"
                                                               "Please ensure it is unmounted and any existing LUKS mappings are closed.\n"
                                                               "A quick fix is to safely remove the USB device, reinsert it, and run this tool again.\n"),
                                           device_path()));
            return std::unexpected(FlowError::DeviceBusy);
        }
        m_term.print(Style::Error, fmt::format(FMT_COMPILE("Failed to open LUKS device:\n{}\n"), lusb::utils::format_tool_error(open_result.error().tool_error)));
        return std::unexpected(FlowError::ToolFailure);
    }
    return (fs::path{m_config.mapper_dir} / mapper_name).string();
}

auto DecisionFlow::device_path() const -> const std::string& {
    return m_session.device->path;
}

}  // namespace tui
