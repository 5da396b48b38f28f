#include "terminal.hpp"
#include "definitions.hpp"

#include <termios.h>  // for tcgetattr, tcsetattr
#include <unistd.h>   // for isatty, STDIN_FILENO

#include <cstdio>    // for fflush
#include <iostream>  // for cin, getline

#include <spdlog/spdlog.h>

namespace {

auto read_stdin_line() noexcept -> std::optional<std::string> {
    std::string line{};
    if (!std::getline(std::cin, line)) {
        return std::nullopt;
    }
    return line;
}

}  // namespace

namespace tui {

auto StdTerminal::read_line(std::string_view prompt) -> std::optional<std::string> {
    output_inter("{}", prompt);
    std::fflush(stdout);
    return read_stdin_line();
}

auto StdTerminal::read_secret(std::string_view prompt) -> std::optional<std::string> {
    output_inter("{}", prompt);
    std::fflush(stdout);

    termios old_attrs{};
    bool is_tty = (isatty(STDIN_FILENO) != 0) && (tcgetattr(STDIN_FILENO, &old_attrs) == 0);
    if (is_tty) {
        termios new_attrs = old_attrs;
        new_attrs.c_lflag &= ~static_cast<tcflag_t>(ECHO);
        if (tcsetattr(STDIN_FILENO, TCSAFLUSH, &new_attrs) != 0) {
            spdlog::warn("Failed to disable terminal echo");
            is_tty = false;
        }
    }

    auto line = read_stdin_line();

    if (is_tty) {
        if (tcsetattr(STDIN_FILENO, TCSAFLUSH, &old_attrs) != 0) {
            spdlog::error("Failed to restore terminal echo");
        }
        // the operator's newline was not echoed
        output_inter("\n");
    }
    return line;
}

void StdTerminal::print(Style style, std::string_view text) {
    switch (style) {
    case Style::Info:
        info_inter("{}", text);
        break;
    case Style::Warning:
        warning_inter("{}", text);
        break;
    case Style::Error:
        error_inter("{}", text);
        break;
    case Style::Success:
        success_inter("{}", text);
        break;
    case Style::Plain:
    default:
        output_inter("{}", text);
        break;
    }
    std::fflush(stdout);
}

void StdTerminal::start_progress(std::string_view message) {
    m_spinner.start(std::string{message});
}

void StdTerminal::stop_progress() noexcept {
    m_spinner.stop();
}

}  // namespace tui
