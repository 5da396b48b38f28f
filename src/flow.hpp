#ifndef FLOW_HPP
#define FLOW_HPP

#include "app_config.hpp"
#include "terminal.hpp"

// import lusb
#include "lusb/block_devices.hpp"
#include "lusb/device_catalog.hpp"
#include "lusb/subprocess.hpp"

#include <cstddef>      // for size_t
#include <cstdint>      // for int32_t, uint8_t
#include <expected>     // for expected
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace tui {

inline constexpr std::string_view ENCRYPT_CONFIRMATION   = "I understand and want to encrypt this device";
inline constexpr std::string_view REENCRYPT_CONFIRMATION = "I understand and want to re-encrypt this device";

/// States of one run. Each has exactly one transition function.
enum class FlowState : std::uint8_t {
    SelectDevice,
    ClassifyDevice,
    EncryptedMenu,
    OpenExisting,
    ConfirmReencrypt,
    CheckGpt,
    ConfirmEncrypt,
    CollectPassphrase,
    Format,
    HeaderBackup,
    CollectMapperName,
    OpenNew,
    // terminal states
    Quit,
    Opened
};

/// Fatal outcomes. Input mistakes are re-prompted and never show up here.
enum class FlowError : std::uint8_t {
    ToolFailure,
    NameConflict,
    DeviceBusy,
    PartitionTableUnsupported,
    InputClosed
};

enum class PassphraseCheck : std::uint8_t {
    Accepted,
    Mismatch,
    TooShort
};

[[nodiscard]] auto flow_state_to_string(FlowState state) noexcept -> std::string_view;
[[nodiscard]] auto flow_error_to_string(FlowError error) noexcept -> std::string_view;

/// Both entries must match and be at least min_length UTF-8 code points long.
[[nodiscard]] auto check_passphrase(std::string_view first, std::string_view second, std::size_t min_length) noexcept -> PassphraseCheck;

/// Operator input, stripped of surrounding whitespace, must equal the sentence byte for byte.
[[nodiscard]] auto matches_confirmation(std::string_view input, std::string_view sentence) noexcept -> bool;

/// Parses a 1-based menu selection.
/// @return zero-based index, std::nullopt when not a number in [1, count].
[[nodiscard]] auto parse_menu_index(std::string_view input, std::size_t count) noexcept -> std::optional<std::size_t>;

/// Mapper names become /dev/mapper/<name>; empty names and path separators are rejected.
[[nodiscard]] auto is_valid_mapper_name(std::string_view name) noexcept -> bool;

// Ephemeral state of one run. The passphrase is wiped on destruction.
struct Session final {
    Session() = default;
    ~Session() noexcept;

    // explicitly deleted
    Session(const Session&)        = delete;
    auto operator=(const Session&) = delete;

    std::vector<lusb::disk::BlockDevice> candidates{};
    std::optional<lusb::disk::BlockDevice> device{};
    std::string passphrase{};
    std::string mapper_name{};
};

// Interactive device selection, encryption and opening.
class DecisionFlow final {
 public:
    DecisionFlow(lusb::utils::CommandRunner& runner, Terminal& term, const luks_usb::AppConfig& config) noexcept;

    /// @brief Drives the state machine from SelectDevice until a terminal state or a fatal error.
    /// @return process exit status: 0 on quit or success, 1 on failure.
    auto run() -> std::int32_t;

    /// @brief Executes one transition.
    /// @return the next state, or the fatal error that ends the run.
    auto step(FlowState state) -> std::expected<FlowState, FlowError>;

    [[nodiscard]] auto last_error() const noexcept -> std::optional<FlowError> { return m_error; }
    [[nodiscard]] auto session() const noexcept -> const Session& { return m_session; }

 private:
    using Transition = std::expected<FlowState, FlowError>;

    auto select_device() -> Transition;
    auto classify_device() -> Transition;
    auto encrypted_menu() -> Transition;
    auto open_existing() -> Transition;
    auto confirm_reencrypt() -> Transition;
    auto check_gpt() -> Transition;
    auto confirm_encrypt() -> Transition;
    auto collect_passphrase() -> Transition;
    auto format_device() -> Transition;
    auto header_backup() -> Transition;
    auto collect_mapper_name() -> Transition;
    auto open_new() -> Transition;

    auto prompt_line(std::string_view prompt) -> std::expected<std::string, FlowError>;
    auto prompt_secret(std::string_view prompt) -> std::expected<std::string, FlowError>;
    auto prompt_mapper_name(std::string_view prompt) -> std::expected<std::string, FlowError>;
    auto open_volume() -> std::expected<std::string, FlowError>;
    [[nodiscard]] auto device_path() const -> const std::string&;

    lusb::utils::CommandRunner& m_runner;
    Terminal& m_term;
    const luks_usb::AppConfig& m_config;
    lusb::disk::DeviceCatalog m_catalog;
    Session m_session{};
    std::optional<FlowError> m_error{};
};

}  // namespace tui

#endif  // FLOW_HPP
