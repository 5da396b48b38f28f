#include "app_config.hpp"   // for AppConfig
#include "definitions.hpp"  // for error_inter
#include "flow.hpp"         // for DecisionFlow
#include "terminal.hpp"     // for StdTerminal

// import lusb
#include "lusb/logger.hpp"
#include "lusb/subprocess.hpp"

#include <getopt.h>  // for getopt_long
#include <unistd.h>  // for geteuid

#include <csignal>  // for signal, SIGPIPE
#include <memory>   // for make_shared

#include <spdlog/common.h>                 // for debug
#include <spdlog/sinks/basic_file_sink.h>  // for basic_file_sink_mt
#include <spdlog/sinks/null_sink.h>        // for null_sink_mt
#include <spdlog/spdlog.h>                 // for set_default_logger, set_level

#ifndef LUSB_VERSION
#define LUSB_VERSION "unknown"
#endif

namespace {

constexpr auto APP_NAME = "luks-usb";

const struct option long_options[] = {
    {   "help",       no_argument, nullptr, 'h'},
    {"version",       no_argument, nullptr, 'V'},
    {  "debug",       no_argument, nullptr, 'd'},
    { "config", required_argument, nullptr, 'c'},
    {  nullptr,                 0, nullptr,   0}
};

void print_usage() noexcept {
    output_inter("Usage: {} [OPTIONS]\n\n", APP_NAME);
    output_inter("Encrypt a removable USB device with LUKS2, or open an encrypted one.\n\n");
    output_inter("Options:\n");
    output_inter("  -h, --help           Show this help and exit\n");
    output_inter("  -V, --version        Show version and exit\n");
    output_inter("  -d, --debug          Verbose device detection and debug logging\n");
    output_inter("  -c, --config <file>  Read configuration from a JSON file\n");
}

auto make_logger(const luks_usb::AppConfig& config) -> std::shared_ptr<spdlog::logger> {
    try {
        return spdlog::basic_logger_mt("luks_usb_logger", config.log_file);
    } catch (const spdlog::spdlog_ex& ex) {
        warning_inter("Failed to open log file '{}': {}. Logging is disabled.\n", config.log_file, ex.what());
    }
    return std::make_shared<spdlog::logger>("luks_usb_logger", std::make_shared<spdlog::sinks::null_sink_mt>());
}

}  // namespace

int main(int argc, char** argv) {
    bool debug_flag{false};
    const char* config_path{nullptr};

    int opt{};
    while ((opt = getopt_long(argc, argv, "hVdc:", long_options, nullptr)) != -1) {
        switch (opt) {
        case 'h':
            print_usage();
            return 0;
        case 'V':
            output_inter("{} {}\n", APP_NAME, LUSB_VERSION);
            return 0;
        case 'd':
            debug_flag = true;
            break;
        case 'c':
            config_path = optarg;
            break;
        default:
            print_usage();
            return 1;
        }
    }

    // Load configuration, the command line overrides the file.
    auto config = (config_path != nullptr) ? luks_usb::load_app_config(config_path) : luks_usb::parse_app_config({});
    if (!config) {
        error_inter("Invalid configuration: {}\n", config.error());
        return 1;
    }
    if (debug_flag) {
        config->debug = true;
    }

    // Check if we have enough permissions.
    if (geteuid() != 0) {
        error_inter("This tool must be run with root privileges. Try:\n  sudo {}\n", APP_NAME);
        return 1;
    }

    // cryptsetup may exit before reading its piped input
    std::signal(SIGPIPE, SIG_IGN);

    // Initialize logger.
    auto logger = make_logger(*config);
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%r][%^---%L---%$] %v");
    spdlog::set_level(config->debug ? spdlog::level::debug : spdlog::level::info);
    spdlog::flush_on(spdlog::level::info);

    // Set lusb logger.
    lusb::logger::set_logger(logger);

    output_inter("--- USB LUKS Encryption Tool ---\n");
    warning_inter("WARNING: This will ERASE ALL DATA on the selected device if you choose to encrypt.\n");
    output_inter("Only GPT partition tables are supported for new encryption.\n");
    output_inter("{:-<40}\n", "");

    lusb::utils::SubprocessRunner runner{};
    tui::StdTerminal terminal{};
    tui::DecisionFlow flow{runner, terminal, *config};
    const auto exit_code = flow.run();

    spdlog::shutdown();
    return exit_code;
}
