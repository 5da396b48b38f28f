#include "lusb/subprocess.hpp"
#include "lusb/io_utils.hpp"
#include "lusb/string_utils.hpp"

#include <poll.h>    // for poll, pollfd
#include <unistd.h>  // for read

#include <cerrno>   // for errno, EINTR
#include <cstdio>   // for FILE, fileno, fwrite, fclose
#include <cstring>  // for strerror

#include <algorithm>    // for transform
#include <array>        // for array
#include <iterator>     // for back_inserter
#include <string_view>  // for string_view_literals

#include <subprocess.h>

#include <fmt/compile.h>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

namespace {

// Reads stdout and stderr together until both reach EOF.
void drain_streams(std::FILE* out_stream, std::FILE* err_stream, std::string& out, std::string& err) noexcept {
    std::array<pollfd, 2> fds{{
        {.fd = (out_stream != nullptr) ? fileno(out_stream) : -1, .events = POLLIN, .revents = 0},
        {.fd = (err_stream != nullptr) ? fileno(err_stream) : -1, .events = POLLIN, .revents = 0},
    }};
    std::array<std::string*, 2> sinks{&out, &err};

    std::array<char, 8192> buf{};
    while (fds[0].fd >= 0 || fds[1].fd >= 0) {
        if (poll(fds.data(), static_cast<nfds_t>(fds.size()), -1) < 0) {
            if (errno == EINTR) {
                continue;
            }
            spdlog::error("[run] poll failed: {}", std::strerror(errno));
            return;
        }
        for (std::size_t i = 0; i < fds.size(); ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) {
                continue;
            }
            const auto bytes_read = read(fds[i].fd, buf.data(), buf.size());
            if (bytes_read > 0) {
                sinks[i]->append(buf.data(), static_cast<std::size_t>(bytes_read));
            } else if (bytes_read == 0 || errno != EINTR) {
                // EOF, negative fd is skipped by poll
                fds[i].fd = -1;
            }
        }
    }
}

}  // namespace

namespace lusb::utils {

auto format_tool_error(const ExternalToolError& error) noexcept -> std::string {
    return fmt::format(FMT_COMPILE("Error executing command: {}\nExit code: {}\nSTDOUT: {}\nSTDERR: {}"),
        error.command, error.exit_code, utils::trim(error.out), utils::trim(error.err));
}

auto SubprocessRunner::run(std::string_view command, const std::vector<std::string>& args, const RunOptions& opts)
    -> std::expected<CommandResult, ExternalToolError> {
    std::vector<std::string> cmd_args{std::string{command}};
    cmd_args.insert(cmd_args.end(), args.begin(), args.end());
    auto cmd_line = utils::join(cmd_args, " "sv);

    // stdin contents may be a passphrase, only the command line is logged
    const bool log_exec_cmds = utils::safe_getenv("LUSB_LOG_EXEC_CMDS") == "1"sv;
    if (log_exec_cmds && spdlog::default_logger_raw() != nullptr) {
        spdlog::debug("[run] cmd := {}", cmd_args);
    }

    std::vector<const char*> argv;
    std::transform(cmd_args.cbegin(), cmd_args.cend(), std::back_inserter(argv),
        [](const std::string& arg) -> const char* { return arg.c_str(); });
    argv.push_back(nullptr);

    subprocess_s process{};
    static constexpr auto spawn_options = subprocess_option_inherit_environment | subprocess_option_search_user_path;
    if (subprocess_create(argv.data(), spawn_options, &process) != 0) {
        spdlog::error("[run] Failed to spawn '{}'", cmd_line);
        return std::unexpected(ExternalToolError{
            .command = std::move(cmd_line), .exit_code = -1, .out = {}, .err = "failed to spawn process"});
    }

    if (opts.input.has_value() && !opts.input->empty()) {
        std::FILE* p_stdin = subprocess_stdin(&process);
        if (std::fwrite(opts.input->data(), sizeof(char), opts.input->size(), p_stdin) != opts.input->size()) {
            spdlog::warn("[run] '{}' did not consume all of its input", cmd_line);
        }
    }
    // close stdin so the child sees EOF
    if (process.stdin_file != nullptr) {
        std::fclose(process.stdin_file);
        process.stdin_file = nullptr;
    }

    CommandResult result{};
    drain_streams(subprocess_stdout(&process), subprocess_stderr(&process), result.out, result.err);

    int ret{-1};
    if (subprocess_join(&process, &ret) != 0) {
        spdlog::error("[run] Failed to join process: '{}'", cmd_line);
    }
    if (subprocess_destroy(&process) != 0) {
        spdlog::error("[run] Failed to destroy process: '{}'", cmd_line);
    }
    result.exit_code = static_cast<std::int32_t>(ret);

    if (result.exit_code != 0) {
        spdlog::debug("[run] '{}' exited with {}", cmd_line, result.exit_code);
        if (!opts.allow_failure) {
            return std::unexpected(ExternalToolError{
                .command   = std::move(cmd_line),
                .exit_code = result.exit_code,
                .out       = std::move(result.out),
                .err       = std::move(result.err),
            });
        }
    }
    return result;
}

}  // namespace lusb::utils
