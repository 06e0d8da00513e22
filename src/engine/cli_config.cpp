#include "engine/cli_config.h"
#include "core/auth/credentials_resolver.h"
#include <args.hxx>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <cstdlib>
#include <iostream>
#include <filesystem>

namespace dhanstream {
namespace cli {

StreamConfig parse_command_line_args(int argc, char* argv[]) {
    args::ArgumentParser parser("dhanstream",
                                "Streams market feed, market depth and order updates from the broker.");

    args::HelpFlag help(parser, "help", "Display this help menu", {'h', "help"});
    args::ValueFlag<std::string> config_path(parser, "path", "YAML config file",
                                             {'c', "config"});
    args::ValueFlag<std::string> client_id(parser, "id", "Client id (env DHANSTREAM_CLIENT_ID)",
                                           {"client-id"});
    args::ValueFlag<std::string> access_token(parser, "token", "Access token (env DHANSTREAM_ACCESS_TOKEN)",
                                              {"access-token"});
    args::ValueFlag<std::string> log_level(parser, "level", "trace|debug|info|warn|error",
                                           {"log-level"});
    args::ValueFlag<std::string> mode(parser, "mode", "Market feed mode: ticker|quote|full",
                                      {"mode"});
    args::Flag no_orders(parser, "no-orders", "Do not open the order update channel",
                         {"no-orders"});

    StreamConfig config;

    try {
        parser.ParseCLI(argc, argv);
    } catch (const args::Completion& e) {
        std::cout << e.what();
        std::exit(0);
    } catch (const args::Help&) {
        std::cout << parser;
        std::cout << "\nExamples:\n";
        std::cout << "  " << argv[0] << " --config dhanstream.yml\n";
        std::cout << "  " << argv[0] << " --config dhanstream.yml --mode full --log-level debug\n\n";
        std::exit(0);
    } catch (const args::ParseError& e) {
        std::cerr << e.what() << std::endl;
        std::cerr << parser;
        std::exit(1);
    }

    if (config_path) {
        try {
            config = load_stream_config_file(args::get(config_path));
        } catch (const ConfigError& e) {
            std::cerr << "Configuration error: " << e.what() << std::endl;
            std::exit(1);
        }
    }

    // Flags override the file
    if (client_id) config.auth.client_id = args::get(client_id);
    if (access_token) config.auth.access_token = args::get(access_token);
    if (log_level) config.log.level = args::get(log_level);
    if (mode) config.feed.mode = args::get(mode);
    if (no_orders) config.orders.enabled = false;

    return config;
}

bool validate_config(StreamConfig& config) {
    config.auth = auth::resolve_credentials(config.auth);
    config.orders.enabled = auth::parse_bool_env("DHANSTREAM_ORDERS_ENABLED", config.orders.enabled);

    const auto errors = validate_stream_config(config);
    if (!errors.empty()) {
        std::cerr << "Configuration errors:\n";
        for (const auto& error : errors) {
            std::cerr << "  - " << error << "\n";
        }
        return false;
    }

    return true;
}

bool initialize_logging(const LogSettings& settings) {
    const std::filesystem::path log_path(settings.file);
    if (log_path.has_parent_path()) {
        try {
            std::filesystem::create_directories(log_path.parent_path());
        } catch (const std::filesystem::filesystem_error& ex) {
            std::cerr << "Failed to create log directory: " << ex.what() << std::endl;
            return false;
        }
    }

    try {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_level(spdlog::level::debug);

        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            settings.file, 1024*1024*5, 3);
        file_sink->set_level(spdlog::level::trace);

        std::vector<spdlog::sink_ptr> sinks {console_sink, file_sink};
        auto logger = std::make_shared<spdlog::logger>("multi_sink", sinks.begin(), sinks.end());

        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%f] [TID:%t] [%^%l%$] %v");
        logger->set_level(spdlog::level::from_str(settings.level));

        spdlog::set_default_logger(logger);
        spdlog::flush_every(std::chrono::seconds(1));

        return true;
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Log initialization failed: " << ex.what() << std::endl;
        return false;
    }
}

} // namespace cli
} // namespace dhanstream
