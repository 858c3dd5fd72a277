// nodegate
// Config-based gateway runtime with CLI argument parsing

#include <filesystem>
#include <iostream>
#include <string>

#include "logging/logger.hpp"
#include "runtime/config.hpp"
#include "runtime/runtime.hpp"
#include "runtime/signal_handler.hpp"

int main(int argc, char **argv) {
    std::string config_path = "nodegate.yaml";  // Default

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg.substr(0, 9) == "--config=") {
            config_path = arg.substr(9);
        } else if (arg == "--help" || arg == "-h") {
            std::cerr << "Usage: nodegate [OPTIONS]\n\n";
            std::cerr << "Options:\n";
            std::cerr << "  --config=PATH    Path to config file (default: nodegate.yaml)\n";
            std::cerr << "  --help, -h       Show this help\n";
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            std::cerr << "Use --help for usage information\n";
            return 1;
        }
    }

    if (!std::filesystem::exists(config_path)) {
        // Using cerr here as logger might not be configured yet
        std::cerr << "ERROR: Config file not found: " << config_path << "\n";
        std::cerr << "\nCreate a config file or specify path with --config=PATH\n";
        return 1;
    }

    LOG_INFO("nodegate starting...");
    LOG_INFO("Loading config: " << config_path);

    nodegate::runtime::RuntimeConfig config;
    std::string error;

    if (!nodegate::runtime::load_config(config_path, config, error)) {
        LOG_ERROR("Failed to load config: " << error);
        return 1;
    }

    nodegate::logging::Logger::set_level(nodegate::logging::string_to_level(config.logging.level));

    nodegate::runtime::Runtime runtime(config);

    if (!runtime.initialize(error)) {
        LOG_ERROR("Runtime initialization failed: " << error);
        return 1;
    }

    nodegate::runtime::SignalHandler::install();

    LOG_INFO("Gateway Ready");
    LOG_INFO("  HTTP: " << (config.http.enabled ? config.http.bind + ":" + std::to_string(config.http.port)
                                                : std::string("disabled")));
    LOG_INFO("  Invoke timeout: " << config.invoke.default_timeout_ms << "ms (max " << config.invoke.max_timeout_ms
                                  << "ms)");

    // Run main loop (blocking)
    runtime.run();
    runtime.shutdown();

    LOG_INFO("Shutdown complete");
    return 0;
}
