#include "config.hpp"

#include <yaml-cpp/yaml.h>

#include <sstream>

#include "invocation/pending_invocations.hpp"
#include "logging/logger.hpp"

namespace nodegate {
namespace runtime {

bool validate_config(const RuntimeConfig &config, std::string &error) {
    // Validate runtime settings
    if (config.runtime.reaper_interval_ms < 10 || config.runtime.reaper_interval_ms > 10000) {
        error = "runtime.reaper_interval_ms must be between 10 and 10000";
        return false;
    }

    // Validate HTTP settings
    if (config.http.enabled) {
        if (config.http.port < 1 || config.http.port > 65535) {
            error = "HTTP port must be between 1 and 65535";
            return false;
        }
        if (config.http.thread_pool_size < 1) {
            error = "HTTP thread_pool_size must be at least 1";
            return false;
        }
        if (config.http.cors_allowed_origins.empty()) {
            error = "http.cors_allowed_origins must not be empty";
            return false;
        }
    }

    // Validate invoke timeouts
    if (config.invoke.default_timeout_ms < 1) {
        error = "invoke.default_timeout_ms must be >= 1";
        return false;
    }
    if (config.invoke.max_timeout_ms > invocation::kMaxTimeoutMs) {
        error = "invoke.max_timeout_ms must be <= " + std::to_string(invocation::kMaxTimeoutMs) + " (24h)";
        return false;
    }
    if (config.invoke.default_timeout_ms > config.invoke.max_timeout_ms) {
        error = "invoke.default_timeout_ms (" + std::to_string(config.invoke.default_timeout_ms) +
                ") must not exceed invoke.max_timeout_ms (" + std::to_string(config.invoke.max_timeout_ms) + ")";
        return false;
    }

    // Validate connection settings
    if (config.connections.outbound_queue_size < 1) {
        error = "connections.outbound_queue_size must be >= 1";
        return false;
    }
    if (config.connections.max_poll_wait_ms < 0) {
        error = "connections.max_poll_wait_ms must be >= 0";
        return false;
    }
    if (config.connections.idle_timeout_ms < 0) {
        error = "connections.idle_timeout_ms must be >= 0";
        return false;
    }
    if (config.connections.idle_timeout_ms > 0 &&
        config.connections.idle_timeout_ms <= config.connections.max_poll_wait_ms) {
        error = "connections.idle_timeout_ms must exceed connections.max_poll_wait_ms";
        return false;
    }

    // Validate Logging settings
    if (config.logging.level != "debug" && config.logging.level != "info" && config.logging.level != "warn" &&
        config.logging.level != "error") {
        error = "Invalid log level: " + config.logging.level;
        return false;
    }

    return true;
}

bool load_config(const std::string &config_path, RuntimeConfig &config, std::string &error) {
    try {
        YAML::Node yaml = YAML::LoadFile(config_path);

        // Check for unknown top-level keys
        const std::vector<std::string> valid_keys = {"runtime", "http", "invoke", "connections", "logging"};
        for (const auto &key_node : yaml) {
            std::string key = key_node.first.as<std::string>();
            bool known = false;
            for (const auto &valid_key : valid_keys) {
                if (key == valid_key) {
                    known = true;
                    break;
                }
            }
            if (!known) {
                LOG_WARN("[Config] Unknown top-level key: '" << key << "' (will be ignored)");
            }
        }

        // Load runtime config
        if (yaml["runtime"]) {
            if (yaml["runtime"]["name"]) {
                config.runtime.name = yaml["runtime"]["name"].as<std::string>();
            }
            if (yaml["runtime"]["reaper_interval_ms"]) {
                config.runtime.reaper_interval_ms = yaml["runtime"]["reaper_interval_ms"].as<int>();
            }
        }

        // Load HTTP config
        if (yaml["http"]) {
            if (yaml["http"]["enabled"]) {
                config.http.enabled = yaml["http"]["enabled"].as<bool>();
            }
            if (yaml["http"]["bind"]) {
                config.http.bind = yaml["http"]["bind"].as<std::string>();
            }
            if (yaml["http"]["port"]) {
                config.http.port = yaml["http"]["port"].as<int>();
            }

            // CORS allowlist (supports scalar or sequence)
            if (yaml["http"]["cors_allowed_origins"]) {
                const auto &origins_node = yaml["http"]["cors_allowed_origins"];
                config.http.cors_allowed_origins.clear();
                if (origins_node.IsSequence()) {
                    for (const auto &origin : origins_node) {
                        config.http.cors_allowed_origins.push_back(origin.as<std::string>());
                    }
                } else if (origins_node.IsScalar()) {
                    config.http.cors_allowed_origins.push_back(origins_node.as<std::string>());
                }

                if (config.http.cors_allowed_origins.empty()) {
                    config.http.cors_allowed_origins.push_back("*");
                }
            }
            if (yaml["http"]["cors_allow_credentials"]) {
                config.http.cors_allow_credentials = yaml["http"]["cors_allow_credentials"].as<bool>();
            }

            if (yaml["http"]["thread_pool_size"]) {
                config.http.thread_pool_size = yaml["http"]["thread_pool_size"].as<int>();
            }
        }

        // Load invoke config
        if (yaml["invoke"]) {
            if (yaml["invoke"]["default_timeout_ms"]) {
                config.invoke.default_timeout_ms = yaml["invoke"]["default_timeout_ms"].as<int64_t>();
            }
            if (yaml["invoke"]["max_timeout_ms"]) {
                config.invoke.max_timeout_ms = yaml["invoke"]["max_timeout_ms"].as<int64_t>();
            }
        }

        // Load connection config
        if (yaml["connections"]) {
            const auto &conn = yaml["connections"];
            if (conn["outbound_queue_size"]) {
                // Read signed so that a negative value fails validation instead of wrapping
                auto size = conn["outbound_queue_size"].as<int64_t>();
                config.connections.outbound_queue_size = size < 0 ? 0 : static_cast<size_t>(size);
            }
            if (conn["max_poll_wait_ms"]) {
                config.connections.max_poll_wait_ms = conn["max_poll_wait_ms"].as<int>();
            }
            if (conn["idle_timeout_ms"]) {
                config.connections.idle_timeout_ms = conn["idle_timeout_ms"].as<int>();
            }
        }

        // Load logging config
        if (yaml["logging"]) {
            if (yaml["logging"]["level"]) {
                config.logging.level = yaml["logging"]["level"].as<std::string>();
            }
        }

        if (!validate_config(config, error)) {
            return false;
        }

        if (!config.runtime.name.empty()) {
            LOG_INFO("[Config] Runtime name: " << config.runtime.name);
        }

        std::stringstream http_msg;
        http_msg << "[Config] HTTP: " << (config.http.enabled ? "enabled" : "disabled");
        if (config.http.enabled) {
            http_msg << " (" << config.http.bind << ":" << config.http.port << ")";
        }
        LOG_INFO(http_msg.str());

        LOG_INFO("[Config] Invoke timeout: default " << config.invoke.default_timeout_ms << "ms, max "
                                                     << config.invoke.max_timeout_ms << "ms");
        LOG_INFO("[Config] Outbound queue: " << config.connections.outbound_queue_size << " frames");
        LOG_INFO("[Config] Log level: " << config.logging.level);

        return true;
    } catch (const YAML::BadFile &e) {
        error = "Cannot open config file: " + config_path;
        return false;
    } catch (const YAML::ParserException &e) {
        error = "YAML parse error: " + std::string(e.what());
        return false;
    } catch (const std::exception &e) {
        error = "Config load error: " + std::string(e.what());
        return false;
    }
}

}  // namespace runtime
}  // namespace nodegate
