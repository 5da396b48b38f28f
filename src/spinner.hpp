#ifndef SPINNER_HPP
#define SPINNER_HPP

#include <array>    // for array
#include <atomic>   // for atomic_bool
#include <chrono>   // for milliseconds
#include <cstdio>   // for FILE
#include <string>   // for string
#include <thread>   // for jthread

namespace tui::detail {

// Busy indicator repainting a single terminal line from a worker thread.
// Only the running flag is shared with the caller.
class Spinner final {
 public:
    static constexpr std::array<char, 4> symbols{'-', '\\', '|', '/'};
    static constexpr std::chrono::milliseconds delay{100};

    explicit Spinner(std::FILE* stream = stdout) noexcept : m_stream(stream) { }
    ~Spinner() noexcept;

    // explicitly deleted
    Spinner(const Spinner&)           = delete;
    auto operator=(const Spinner&)    = delete;
    Spinner(Spinner&&)                = delete;
    auto operator=(Spinner&&)         = delete;

    /// @brief Starts repainting "\r<message> <symbol>". Restarts if already running.
    void start(std::string message);

    /// @brief Stops the worker and blanks the line. No-op when not running.
    void stop() noexcept;

    [[nodiscard]] auto is_running() const noexcept -> bool { return m_running.load(); }

 private:
    void spin() noexcept;

    std::FILE* m_stream{};
    std::string m_message{};
    std::atomic_bool m_running{false};
    std::jthread m_worker{};
};

}  // namespace tui::detail

#endif  // SPINNER_HPP
