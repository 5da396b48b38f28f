#include "doctest_compatibility.h"
#include "fake_runner.hpp"
#include "fake_terminal.hpp"

#include "app_config.hpp"
#include "flow.hpp"

#include <filesystem>   // for path, create_directories, remove_all
#include <fstream>      // for ofstream
#include <string>       // for string
#include <string_view>  // for string_view
#include <system_error> // for error_code
#include <vector>       // for vector

#include <fmt/format.h>

#include <spdlog/sinks/callback_sink.h>
#include <spdlog/spdlog.h>

using namespace std::string_view_literals;
using lusb::test::FakeRunner;
using tui::test::ScriptedTerminal;
namespace fs = std::filesystem;

namespace {

static constexpr auto LSBLK_ONE_USB = R"({"blockdevices": [
    {"name":"sda", "size":"238.5G", "type":"disk", "rota":false, "model":"INTEL SSD", "vendor":"ATA", "fstype":null, "mountpoint":null, "rm":false,
       "children": [
          {"name":"sda1", "size":"238.5G", "type":"part", "rota":false, "model":null, "vendor":null, "fstype":"ext4", "mountpoint":"/", "rm":false}
       ]
    },
    {"name":"sdb", "size":"57.3G", "type":"disk", "rota":true, "model":"Ultra", "vendor":"SanDisk", "fstype":null, "mountpoint":null, "rm":true}
]})"sv;

static constexpr auto LSBLK_FIXED_ONLY = R"({"blockdevices": [
    {"name":"sda", "size":"238.5G", "type":"disk", "rota":false, "model":"INTEL SSD", "vendor":"ATA", "fstype":null, "mountpoint":null, "rm":false}
]})"sv;

static constexpr auto LSBLK_SDB_PLAIN = R"({"blockdevices": [
    {"name":"sdb", "type":"disk", "fstype":null,
       "children": [ {"name":"sdb1", "type":"part", "fstype":"vfat"} ]
    }
]})"sv;

static constexpr auto LSBLK_SDB_LUKS = R"({"blockdevices": [
    {"name":"sdb", "type":"disk", "fstype":"crypto_LUKS"}
]})"sv;

static constexpr auto PARTED_GPT   = "Model: SanDisk Ultra (scsi)\nDisk /dev/sdb: 61.5GB\nPartition Table: gpt\n"sv;
static constexpr auto PARTED_MSDOS = "Model: SanDisk Ultra (scsi)\nDisk /dev/sdb: 61.5GB\nPartition Table: msdos\n"sv;

// Scratch directories for header backups and mapper nodes, removed on scope exit.
struct ScratchDirs final {
    explicit ScratchDirs(std::string_view name)
      : root(fs::temp_directory_path() / fmt::format("luks-usb-flow-{}", name)) {
        fs::remove_all(root);
        fs::create_directories(root / "mapper");
    }
    ~ScratchDirs() {
        std::error_code err{};
        fs::remove_all(root, err);
    }

    [[nodiscard]] auto config() const -> luks_usb::AppConfig {
        auto config       = luks_usb::get_default_config();
        config.backup_dir = (root / "backups").string();
        config.mapper_dir = (root / "mapper").string();
        return config;
    }

    fs::path root;
};

void script_plain_gpt_device(FakeRunner& runner) {
    runner.on("lsblk --json -o NAME,SIZE", {.exit_code = 0, .out = std::string{LSBLK_ONE_USB}, .err = {}});
    runner.on("lsblk --json -o NAME,TYPE,FSTYPE /dev/sdb", {.exit_code = 0, .out = std::string{LSBLK_SDB_PLAIN}, .err = {}});
    runner.on("parted -s /dev/sdb print", {.exit_code = 0, .out = std::string{PARTED_GPT}, .err = {}});
    runner.on("cryptsetup luksFormat", {});
    runner.on("cryptsetup luksHeaderBackup", {});
    runner.on("cryptsetup luksOpen", {});
}

void script_luks_device(FakeRunner& runner) {
    runner.on("lsblk --json -o NAME,SIZE", {.exit_code = 0, .out = std::string{LSBLK_ONE_USB}, .err = {}});
    runner.on("lsblk --json -o NAME,TYPE,FSTYPE /dev/sdb", {.exit_code = 0, .out = std::string{LSBLK_SDB_LUKS}, .err = {}});
}

void silence_logs() {
    auto callback_sink = std::make_shared<spdlog::sinks::callback_sink_mt>([](const spdlog::details::log_msg&) {
        // noop
    });
    auto logger        = std::make_shared<spdlog::logger>("default", callback_sink);
    spdlog::set_default_logger(logger);
}

}  // namespace

TEST_CASE("flow input helpers test")
{
    SECTION("passphrase checks")
    {
        CHECK(tui::check_passphrase("abc123"sv, "abc123"sv, 8) == tui::PassphraseCheck::TooShort);
        CHECK(tui::check_passphrase("longenough1"sv, "longenough1"sv, 8) == tui::PassphraseCheck::Accepted);
        CHECK(tui::check_passphrase("longenough1"sv, "different1"sv, 8) == tui::PassphraseCheck::Mismatch);
        CHECK(tui::check_passphrase("12345678"sv, "12345678"sv, 8) == tui::PassphraseCheck::Accepted);
        // length is counted in characters, not bytes
        CHECK(tui::check_passphrase("ääää"sv, "ääää"sv, 8) == tui::PassphraseCheck::TooShort);
        CHECK(tui::check_passphrase("日本語"sv, "日本語"sv, 8) == tui::PassphraseCheck::TooShort);
        CHECK(tui::check_passphrase("äöüßäöüß"sv, "äöüßäöüß"sv, 8) == tui::PassphraseCheck::Accepted);
    }
    SECTION("confirmation sentence")
    {
        CHECK(tui::matches_confirmation("I understand and want to encrypt this device"sv, tui::ENCRYPT_CONFIRMATION));
        CHECK(tui::matches_confirmation("  I understand and want to encrypt this device \n"sv, tui::ENCRYPT_CONFIRMATION));
        CHECK(!tui::matches_confirmation("i understand and want to encrypt this device"sv, tui::ENCRYPT_CONFIRMATION));
        CHECK(!tui::matches_confirmation("I understand and want to encrypt this device "sv, tui::REENCRYPT_CONFIRMATION));
        CHECK(!tui::matches_confirmation("I understand and want  to encrypt this device"sv, tui::ENCRYPT_CONFIRMATION));
        CHECK(!tui::matches_confirmation("yes"sv, tui::ENCRYPT_CONFIRMATION));
    }
    SECTION("menu index")
    {
        CHECK(tui::parse_menu_index("1"sv, 2) == 0);
        CHECK(tui::parse_menu_index(" 2 "sv, 2) == 1);
        CHECK(!tui::parse_menu_index("0"sv, 2).has_value());
        CHECK(!tui::parse_menu_index("3"sv, 2).has_value());
        CHECK(!tui::parse_menu_index("1a"sv, 2).has_value());
        CHECK(!tui::parse_menu_index("-1"sv, 2).has_value());
        CHECK(!tui::parse_menu_index(""sv, 2).has_value());
    }
    SECTION("mapper names")
    {
        CHECK(tui::is_valid_mapper_name("my_encrypted_usb"sv));
        CHECK(!tui::is_valid_mapper_name(""sv));
        CHECK(!tui::is_valid_mapper_name("../usb"sv));
        CHECK(!tui::is_valid_mapper_name(".."sv));
    }
}

TEST_CASE("decision flow test")
{
    silence_logs();
    FakeRunner runner;

    SECTION("no removable device")
    {
        ScratchDirs dirs{"no-device"};
        const auto& config = dirs.config();
        runner.on("lsblk --json -o NAME,SIZE", {.exit_code = 0, .out = std::string{LSBLK_FIXED_ONLY}, .err = {}});
        ScriptedTerminal term{std::vector<std::string>{}};

        tui::DecisionFlow flow{runner, term, config};
        CHECK(flow.run() == 0);
        CHECK(term.prompts.empty());
        CHECK(term.output.contains("No suitable USB devices found"sv));
        CHECK(!flow.last_error().has_value());
    }
    SECTION("listing failure")
    {
        ScratchDirs dirs{"listing-failure"};
        const auto& config = dirs.config();
        runner.on("lsblk", {.exit_code = 1, .out = {}, .err = "lsblk: permission denied"});
        ScriptedTerminal term{std::vector<std::string>{}};

        tui::DecisionFlow flow{runner, term, config};
        CHECK(flow.run() == 1);
        CHECK(flow.last_error() == tui::FlowError::ToolFailure);
    }
    SECTION("quit at selection")
    {
        ScratchDirs dirs{"quit"};
        const auto& config = dirs.config();
        script_plain_gpt_device(runner);
        ScriptedTerminal term{{"q"}};

        tui::DecisionFlow flow{runner, term, config};
        CHECK(flow.run() == 0);
        CHECK(runner.count("lsblk --json -o NAME,TYPE,FSTYPE") == 0);
        CHECK(term.output.contains("[1] /dev/sdb (SanDisk Ultra 57.3G)"sv));
        CHECK(!term.output.contains("/dev/sda"sv));
    }
    SECTION("invalid selection is re-prompted")
    {
        ScratchDirs dirs{"reprompt"};
        const auto& config = dirs.config();
        script_plain_gpt_device(runner);
        ScriptedTerminal term{{"7", "sdb", "Q"}};

        tui::DecisionFlow flow{runner, term, config};
        CHECK(flow.run() == 0);
        CHECK(term.prompts.size() == 3);
        CHECK(!flow.session().device.has_value());
    }
    SECTION("msdos table is refused before any prompt for secrets")
    {
        ScratchDirs dirs{"msdos"};
        const auto& config = dirs.config();
        runner.on("lsblk --json -o NAME,SIZE", {.exit_code = 0, .out = std::string{LSBLK_ONE_USB}, .err = {}});
        runner.on("lsblk --json -o NAME,TYPE,FSTYPE", {.exit_code = 0, .out = std::string{LSBLK_SDB_PLAIN}, .err = {}});
        runner.on("parted", {.exit_code = 0, .out = std::string{PARTED_MSDOS}, .err = {}});
        ScriptedTerminal term{{"1"}};

        tui::DecisionFlow flow{runner, term, config};
        CHECK(flow.run() == 1);
        CHECK(flow.last_error() == tui::FlowError::PartitionTableUnsupported);
        CHECK(term.secret_prompts.empty());
        CHECK(runner.count("cryptsetup") == 0);
        CHECK(term.errors.contains("uses 'mbr' partition table"sv));
    }
    SECTION("full encryption")
    {
        ScratchDirs dirs{"encrypt"};
        const auto& config = dirs.config();
        script_plain_gpt_device(runner);
        ScriptedTerminal term{{"1", std::string{tui::ENCRYPT_CONFIRMATION}, "longenough1", "longenough1", "usb"}};

        tui::DecisionFlow flow{runner, term, config};
        CHECK(flow.run() == 0);
        CHECK(!flow.last_error().has_value());
        CHECK(term.remaining_answers() == 0);
        CHECK(term.output.contains("Partition Table: GPT (OK)"sv));

        const auto* format_call = runner.find("cryptsetup luksFormat");
        REQUIRE(format_call != nullptr);
        CHECK(format_call->cmd_line == "cryptsetup luksFormat --type luks2 --cipher aes-xts-plain64 --key-size 512 --hash sha512 --iter-time 2000 --pbkdf argon2id /dev/sdb"sv);
        REQUIRE(format_call->input.has_value());
        CHECK(*format_call->input == "YES\nlongenough1\nlongenough1\n"sv);

        const auto* backup_call = runner.find("cryptsetup luksHeaderBackup /dev/sdb --header-backup-file ");
        REQUIRE(backup_call != nullptr);
        CHECK(fs::path{backup_call->args.back()}.parent_path() == dirs.root / "backups");
        CHECK(fs::is_directory(dirs.root / "backups"));

        const auto* open_call = runner.find("cryptsetup luksOpen /dev/sdb usb");
        REQUIRE(open_call != nullptr);
        REQUIRE(open_call->input.has_value());
        CHECK(*open_call->input == "longenough1\n"sv);

        // format, backup, open in that order
        REQUIRE(runner.invocations.size() == 6);
        CHECK(runner.invocations[3].cmd_line.starts_with("cryptsetup luksFormat"sv));
        CHECK(runner.invocations[4].cmd_line.starts_with("cryptsetup luksHeaderBackup"sv));
        CHECK(runner.invocations[5].cmd_line.starts_with("cryptsetup luksOpen"sv));

        const auto& opened = (dirs.root / "mapper" / "usb").string();
        CHECK(term.output.contains(fmt::format("sudo mkfs.ext4 {}", opened)));
        CHECK(flow.session().passphrase.empty());
        CHECK(!term.progress_running);
    }
    SECTION("passphrase retries")
    {
        ScratchDirs dirs{"retries"};
        const auto& config = dirs.config();
        script_plain_gpt_device(runner);
        ScriptedTerminal term{{"1", std::string{tui::ENCRYPT_CONFIRMATION}, "abc123", "abc123", "longenough1", "longenough2",
            "longenough1", "longenough1", "usb"}};

        tui::DecisionFlow flow{runner, term, config};
        CHECK(flow.run() == 0);
        CHECK(term.secret_prompts.size() == 6);
        CHECK(term.output.contains("Passphrase too short. Use at least 8 characters."sv));
        CHECK(term.output.contains("Passphrases do not match."sv));
        CHECK(runner.count("cryptsetup luksFormat") == 1);
    }
    SECTION("short non-ascii passphrase is re-prompted")
    {
        ScratchDirs dirs{"utf8"};
        const auto& config = dirs.config();
        script_plain_gpt_device(runner);
        ScriptedTerminal term{{"1", std::string{tui::ENCRYPT_CONFIRMATION}, "日本語", "日本語", "äöüßäöüß", "äöüßäöüß", "usb"}};

        tui::DecisionFlow flow{runner, term, config};
        CHECK(flow.run() == 0);
        CHECK(term.output.contains("Passphrase too short."sv));
        const auto* format_call = runner.find("cryptsetup luksFormat");
        REQUIRE(format_call != nullptr);
        REQUIRE(format_call->input.has_value());
        CHECK(*format_call->input == "YES\näöüßäöüß\näöüßäöüß\n"sv);
    }
    SECTION("confirmation with extra words cancels")
    {
        ScratchDirs dirs{"cancel"};
        const auto& config = dirs.config();
        script_plain_gpt_device(runner);
        ScriptedTerminal term{{"1", "I understand and want to encrypt this device please"}};

        tui::DecisionFlow flow{runner, term, config};
        CHECK(flow.run() == 0);
        CHECK(term.output.contains("Confirmation failed. Exiting."sv));
        CHECK(term.secret_prompts.empty());
        CHECK(runner.count("cryptsetup") == 0);
    }
    SECTION("confirmation surrounded by whitespace is accepted")
    {
        ScratchDirs dirs{"whitespace"};
        const auto& config = dirs.config();
        script_plain_gpt_device(runner);
        ScriptedTerminal term{{"1", fmt::format("  {} ", tui::ENCRYPT_CONFIRMATION), "longenough1", "longenough1", "usb"}};

        tui::DecisionFlow flow{runner, term, config};
        CHECK(flow.run() == 0);
        CHECK(runner.count("cryptsetup luksFormat") == 1);
    }
    SECTION("format failure stops the run")
    {
        ScratchDirs dirs{"format-failure"};
        const auto& config = dirs.config();
        runner.on("cryptsetup luksFormat", {.exit_code = 1, .out = {}, .err = "Cannot format device /dev/sdb in use."});
        script_plain_gpt_device(runner);
        ScriptedTerminal term{{"1", std::string{tui::ENCRYPT_CONFIRMATION}, "longenough1", "longenough1", "usb"}};

        tui::DecisionFlow flow{runner, term, config};
        CHECK(flow.run() == 1);
        CHECK(flow.last_error() == tui::FlowError::ToolFailure);
        CHECK(term.errors.contains("Formatting failed:"sv));
        CHECK(runner.count("cryptsetup luksHeaderBackup") == 0);
        CHECK(runner.count("cryptsetup luksOpen") == 0);
    }
    SECTION("header backup failure is not fatal")
    {
        ScratchDirs dirs{"backup-failure"};
        const auto& config = dirs.config();
        runner.on("cryptsetup luksHeaderBackup", {.exit_code = 1, .out = {}, .err = "Requested header backup file already exists."});
        script_plain_gpt_device(runner);
        ScriptedTerminal term{{"1", std::string{tui::ENCRYPT_CONFIRMATION}, "longenough1", "longenough1", "usb"}};

        tui::DecisionFlow flow{runner, term, config};
        CHECK(flow.run() == 0);
        CHECK(term.output.contains("Failed to back up LUKS header"sv));
        CHECK(runner.count("cryptsetup luksOpen") == 1);
    }
    SECTION("open existing volume")
    {
        ScratchDirs dirs{"open"};
        const auto& config = dirs.config();
        script_luks_device(runner);
        runner.on("cryptsetup luksOpen", {});
        ScriptedTerminal term{{"1", "OPEN", "vault", "secret"}};

        tui::DecisionFlow flow{runner, term, config};
        CHECK(flow.run() == 0);
        CHECK(runner.count("parted") == 0);
        CHECK(runner.count("cryptsetup luksFormat") == 0);
        REQUIRE(runner.find("cryptsetup luksOpen /dev/sdb vault") != nullptr);
        CHECK(term.output.contains("already LUKS-encrypted"sv));
        CHECK(term.secret_prompts.size() == 1);
    }
    SECTION("unknown menu answer is re-prompted")
    {
        ScratchDirs dirs{"menu"};
        const auto& config = dirs.config();
        script_luks_device(runner);
        ScriptedTerminal term{{"1", "format", "exit"}};

        tui::DecisionFlow flow{runner, term, config};
        CHECK(flow.run() == 0);
        CHECK(term.output.contains("Invalid choice. Type 'open', 're-encrypt', or 'exit'."sv));
        CHECK(runner.count("cryptsetup") == 0);
    }
    SECTION("existing mapper name conflicts before any cryptsetup call")
    {
        ScratchDirs dirs{"conflict"};
        const auto& config = dirs.config();
        std::ofstream{dirs.root / "mapper" / "usb"} << "";
        script_luks_device(runner);
        ScriptedTerminal term{{"1", "open", "usb", "secret"}};

        tui::DecisionFlow flow{runner, term, config};
        CHECK(flow.run() == 1);
        CHECK(flow.last_error() == tui::FlowError::NameConflict);
        CHECK(runner.count("cryptsetup") == 0);
        CHECK(term.secret_prompts.empty());
        CHECK(term.errors.contains("already exists"sv));
    }
    SECTION("invalid mapper name is re-prompted")
    {
        ScratchDirs dirs{"bad-name"};
        const auto& config = dirs.config();
        script_luks_device(runner);
        runner.on("cryptsetup luksOpen", {});
        ScriptedTerminal term{{"1", "open", "", "a/b", "vault", "secret"}};

        tui::DecisionFlow flow{runner, term, config};
        CHECK(flow.run() == 0);
        CHECK(runner.find("cryptsetup luksOpen /dev/sdb vault") != nullptr);
    }
    SECTION("busy device")
    {
        ScratchDirs dirs{"busy"};
        const auto& config = dirs.config();
        script_luks_device(runner);
        runner.on("cryptsetup luksOpen", {.exit_code = 5, .out = {}, .err = "Cannot use device /dev/sdb which is in use."});
        ScriptedTerminal term{{"1", "open", "vault", "secret"}};

        tui::DecisionFlow flow{runner, term, config};
        CHECK(flow.run() == 1);
        CHECK(flow.last_error() == tui::FlowError::DeviceBusy);
        CHECK(term.errors.contains("is currently in use"sv));
        CHECK(!term.progress_running);
        CHECK(flow.session().passphrase.empty());
    }
    SECTION("wrong passphrase on open")
    {
        ScratchDirs dirs{"wrong-pass"};
        const auto& config = dirs.config();
        script_luks_device(runner);
        runner.on("cryptsetup luksOpen", {.exit_code = 2, .out = {}, .err = "No key available with this passphrase."});
        ScriptedTerminal term{{"1", "open", "vault", "wrong"}};

        tui::DecisionFlow flow{runner, term, config};
        CHECK(flow.run() == 1);
        CHECK(flow.last_error() == tui::FlowError::ToolFailure);
        CHECK(term.errors.contains("No key available"sv));
    }
    SECTION("re-encryption of an encrypted device")
    {
        ScratchDirs dirs{"reencrypt"};
        const auto& config = dirs.config();
        script_luks_device(runner);
        runner.on("parted -s /dev/sdb print", {.exit_code = 0, .out = std::string{PARTED_GPT}, .err = {}});
        runner.on("cryptsetup", {});
        ScriptedTerminal term{{"1", "re-encrypt", std::string{tui::REENCRYPT_CONFIRMATION}, std::string{tui::ENCRYPT_CONFIRMATION},
            "longenough1", "longenough1", "usb"}};

        tui::DecisionFlow flow{runner, term, config};
        CHECK(flow.run() == 0);
        CHECK(runner.count("parted") == 1);
        CHECK(runner.count("cryptsetup luksFormat") == 1);
        CHECK(runner.count("cryptsetup luksOpen /dev/sdb usb") == 1);
    }
    SECTION("re-encryption cancelled")
    {
        ScratchDirs dirs{"reencrypt-cancel"};
        const auto& config = dirs.config();
        script_luks_device(runner);
        ScriptedTerminal term{{"1", "re-encrypt", "no"}};

        tui::DecisionFlow flow{runner, term, config};
        CHECK(flow.run() == 0);
        CHECK(term.output.contains("Re-encryption cancelled. Exiting."sv));
        CHECK(runner.count("parted") == 0);
    }
    SECTION("input closed mid-run")
    {
        ScratchDirs dirs{"eof"};
        const auto& config = dirs.config();
        script_plain_gpt_device(runner);
        ScriptedTerminal term{{"1", std::string{tui::ENCRYPT_CONFIRMATION}, "longenough1"}};

        tui::DecisionFlow flow{runner, term, config};
        CHECK(flow.run() == 1);
        CHECK(flow.last_error() == tui::FlowError::InputClosed);
        CHECK(runner.count("cryptsetup") == 0);
    }
}

TEST_CASE("flow single step test")
{
    silence_logs();
    FakeRunner runner;
    ScratchDirs dirs{"step"};
    const auto& config = dirs.config();
    script_plain_gpt_device(runner);
    ScriptedTerminal term{{"1"}};

    tui::DecisionFlow flow{runner, term, config};
    const auto& next = flow.step(tui::FlowState::SelectDevice);
    REQUIRE(next.has_value());
    CHECK(*next == tui::FlowState::ClassifyDevice);
    REQUIRE(flow.session().device.has_value());
    CHECK(flow.session().device->path == "/dev/sdb"sv);

    const auto& classified = flow.step(tui::FlowState::ClassifyDevice);
    REQUIRE(classified.has_value());
    CHECK(*classified == tui::FlowState::CheckGpt);

    CHECK(tui::flow_state_to_string(tui::FlowState::CollectMapperName) == "collect-mapper-name"sv);
    CHECK(tui::flow_error_to_string(tui::FlowError::DeviceBusy) == "device busy"sv);
}
