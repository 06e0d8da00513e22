/**
 * @file main.cpp
 * @brief Main entry point for the dhanstream daemon
 *
 * Loads the YAML config (with CLI and environment overrides), opens the market
 * feed, market depth and order update channels, and runs until SIGINT/SIGTERM.
 */

#include "engine/cli_config.h"
#include "engine/stream_service.h"
#include "stream/session_registry.h"
#include "utils/string_utils.h"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

#include <spdlog/spdlog.h>

namespace {

/// Set by the signal handler; the main loop performs the actual shutdown.
std::atomic<bool> g_shutdown_requested{false};

void signal_handler(int) {
    g_shutdown_requested.store(true, std::memory_order_release);
}

std::string mask(const std::string& secret) {
    if (secret.size() <= 8) {
        return "****";
    }
    return secret.substr(0, 4) + "..." + secret.substr(secret.size() - 4);
}

} // namespace

int main(int argc, char* argv[]) {
    dhanstream::StreamConfig config;
    try {
        config = dhanstream::cli::parse_command_line_args(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error parsing command line arguments: " << e.what() << std::endl;
        return 1;
    }

    if (!dhanstream::cli::validate_config(config)) {
        std::cerr << "Use --help for usage information." << std::endl;
        return 1;
    }

    if (!dhanstream::cli::initialize_logging(config.log)) {
        return 1;
    }

    spdlog::info("=== dhanstream ===");
    spdlog::info("[Main] Configuration Summary:");
    spdlog::info("[Main]   Config file: {}", config.config_path.empty() ? "(none)" : config.config_path);
    spdlog::info("[Main]   Client: {} ({})", config.auth.client_id, config.auth.user_type);
    spdlog::info("[Main]   Access token: {} (masked)", mask(config.auth.access_token));
    spdlog::info("[Main]   Feed: {} mode={} instruments={}",
                 config.feed.enabled ? "on" : "off", config.feed.mode, config.feed.instruments.size());
    spdlog::info("[Main]   Depth: {} level={} symbols={}",
                 config.depth.enabled ? "on" : "off", config.depth.level, config.depth.symbols.size());
    spdlog::info("[Main]   Orders: {}", config.orders.enabled ? "on" : "off");
    if (!config.feed.url.empty()) {
        spdlog::info("[Main]   Feed url override: {}", dhanstream::utils::redact_url(config.feed.url));
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try {
        dhanstream::StreamService service(config);
        if (!service.initialize()) {
            spdlog::error("[Main] Failed to initialize stream service");
            return 1;
        }

        service.start();
        spdlog::info("[Main] Streaming started. Press Ctrl+C to stop");

        while (service.is_running() && !g_shutdown_requested.load(std::memory_order_acquire)) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        if (g_shutdown_requested.load(std::memory_order_acquire)) {
            spdlog::info("[Main] Shutdown signal received");
        }
        const auto stopped = dhanstream::stream::SessionRegistry::instance().stop_all();
        spdlog::info("[Main] Stopped {} session(s)", stopped);
        service.stop();
    } catch (const std::exception& e) {
        spdlog::error("[Main] Fatal error: {}", e.what());
        return 1;
    }

    spdlog::info("[Main] Shutdown complete");
    spdlog::shutdown();
    return 0;
}
