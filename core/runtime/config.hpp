#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace nodegate {
namespace runtime {

struct LoggingConfig {
    std::string level = "info";  // debug, info, warn, error
};

// Runtime section configuration (runtime: in YAML)
struct RuntimeModeConfig {
    std::string name;              // Instance identifier (optional, shown in status)
    int reaper_interval_ms = 100;  // Deadline reaper period (10-10000ms)
};

struct HttpConfig {
    bool enabled = true;                                 // HTTP server enabled
    std::string bind = "127.0.0.1";                      // Bind address
    int port = 8080;                                     // HTTP port
    std::vector<std::string> cors_allowed_origins{"*"};  // CORS allowlist ("*" = allow all)
    bool cors_allow_credentials = false;                 // Whether to emit Access-Control-Allow-Credentials
    int thread_pool_size = 32;                           // Worker thread pool size
};

struct InvokeConfig {
    int64_t default_timeout_ms = 10000;  // Used when node.invoke omits timeout_ms
    int64_t max_timeout_ms = 30000;      // Upper bound accepted from callers
};

struct ConnectionsConfig {
    size_t outbound_queue_size = 256;  // Frames buffered per connection before send() fails
    int max_poll_wait_ms = 25000;      // Cap on GET .../frames?wait_ms
    int idle_timeout_ms = 0;           // Drop connections that stop polling (0 = never)
};

struct RuntimeConfig {
    RuntimeModeConfig runtime;
    HttpConfig http;
    InvokeConfig invoke;
    ConnectionsConfig connections;
    LoggingConfig logging;
};

// Loads configuration from a YAML file
bool load_config(const std::string &config_path, RuntimeConfig &config, std::string &error);

// Validates the configuration
bool validate_config(const RuntimeConfig &config, std::string &error);

}  // namespace runtime
}  // namespace nodegate
