#ifndef SUBPROCESS_HPP
#define SUBPROCESS_HPP

#include <cstdint>      // for int32_t
#include <expected>     // for expected
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace lusb::utils {

/// @brief Captured output of a finished process.
struct CommandResult final {
    /// Everything the process wrote to stdout.
    std::string out;
    /// Everything the process wrote to stderr.
    std::string err;
    /// Exit status, -1 when the process could not be spawned.
    std::int32_t exit_code{0};
};

/// @brief A collaborator tool exited nonzero, or could not be started.
struct ExternalToolError final {
    /// Full command line, space separated.
    std::string command;
    std::int32_t exit_code{-1};
    std::string out;
    std::string err;
};

struct RunOptions final {
    /// Text written to the process stdin before it is closed.
    std::optional<std::string> input{};
    /// Return the result even when the process exits nonzero.
    bool allow_failure{false};
};

/// @brief Multi-line human readable report of a tool failure.
auto format_tool_error(const ExternalToolError& error) noexcept -> std::string;

// Executes external programs. Abstract so the flow can be driven by a fake.
class CommandRunner {
 public:
    virtual ~CommandRunner() = default;

    /// @brief Runs command with args and waits for it to finish.
    /// @param command The program to launch, looked up in PATH.
    /// @param args The arguments passed after the program name.
    /// @param opts Piped input and failure handling.
    /// @return The captured output, or the error when the process exits nonzero
    ///         and opts.allow_failure is not set.
    virtual auto run(std::string_view command, const std::vector<std::string>& args, const RunOptions& opts = {})
        -> std::expected<CommandResult, ExternalToolError> = 0;
};

// Runs programs through the subprocess library, capturing stdout and stderr separately.
class SubprocessRunner final : public CommandRunner {
 public:
    auto run(std::string_view command, const std::vector<std::string>& args, const RunOptions& opts = {})
        -> std::expected<CommandResult, ExternalToolError> override;
};

}  // namespace lusb::utils

#endif  // SUBPROCESS_HPP
