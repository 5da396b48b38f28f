#include "spinner.hpp"

#include <cstdio>   // for fflush
#include <utility>  // for move

#include <fmt/format.h>

namespace tui::detail {

Spinner::~Spinner() noexcept {
    stop();
}

void Spinner::start(std::string message) {
    stop();
    m_message = std::move(message);
    m_running = true;
    m_worker  = std::jthread([this] { spin(); });
}

void Spinner::stop() noexcept {
    m_running = false;
    if (m_worker.joinable()) {
        m_worker.join();
    }
}

void Spinner::spin() noexcept {
    std::size_t index{};
    while (m_running) {
        fmt::print(m_stream, "\r{} {}", m_message, symbols[index % symbols.size()]);
        std::fflush(m_stream);
        ++index;
        std::this_thread::sleep_for(delay);
    }
    // blank the line so following output starts clean
    fmt::print(m_stream, "\r{:{}}\r", "", m_message.size() + 5);
    std::fflush(m_stream);
}

}  // namespace tui::detail
