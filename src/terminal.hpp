#ifndef TERMINAL_HPP
#define TERMINAL_HPP

#include "spinner.hpp"

#include <cstdint>      // for uint8_t
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view

namespace tui {

enum class Style : std::uint8_t {
    Plain,
    Info,
    Warning,
    Error,
    Success
};

// Operator facing I/O of the flow.
class Terminal {
 public:
    virtual ~Terminal() = default;

    /// @brief Prints prompt and reads one line.
    /// @return the line without its newline, std::nullopt on end of input.
    virtual auto read_line(std::string_view prompt) -> std::optional<std::string> = 0;

    /// @brief Like read_line, without echoing the typed text.
    virtual auto read_secret(std::string_view prompt) -> std::optional<std::string> = 0;

    virtual void print(Style style, std::string_view text) = 0;

    /// @brief Shows a busy indicator until stop_progress.
    virtual void start_progress(std::string_view message) = 0;
    virtual void stop_progress() noexcept = 0;
};

// Terminal on top of stdin/stdout/stderr.
class StdTerminal final : public Terminal {
 public:
    auto read_line(std::string_view prompt) -> std::optional<std::string> override;
    auto read_secret(std::string_view prompt) -> std::optional<std::string> override;
    void print(Style style, std::string_view text) override;
    void start_progress(std::string_view message) override;
    void stop_progress() noexcept override;

 private:
    detail::Spinner m_spinner{};
};

}  // namespace tui

#endif  // TERMINAL_HPP
