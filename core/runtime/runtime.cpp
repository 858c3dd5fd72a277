#include "runtime.hpp"

#include <chrono>
#include <thread>

#include "logging/logger.hpp"
#include "signal_handler.hpp"

namespace nodegate {
namespace runtime {

Runtime::Runtime(const RuntimeConfig &config) : config_(config) {}

Runtime::~Runtime() { shutdown(); }

bool Runtime::initialize(std::string &error) {
    LOG_INFO("[Runtime] Initializing nodegate" << (config_.runtime.name.empty() ? "" : " '" + config_.runtime.name + "'"));

    if (!init_core_services(error)) {
        return false;
    }

    if (!init_http(error)) {
        return false;
    }

    LOG_INFO("[Runtime] Initialization complete");
    return true;
}

bool Runtime::init_core_services(std::string &error) {
    if (!validate_config(config_, error)) {
        return false;
    }

    capabilities_ = std::make_unique<capability::CapabilityStore>();
    invocations_ = std::make_unique<invocation::PendingInvocationTable>();
    connections_ = std::make_unique<connection::ConnectionRegistry>();
    lifecycle_ = std::make_unique<connection::ConnectionLifecycle>(*connections_, *capabilities_, *invocations_);

    rpc::DispatcherConfig dispatcher_config;
    dispatcher_config.default_timeout_ms = config_.invoke.default_timeout_ms;
    dispatcher_config.max_timeout_ms = config_.invoke.max_timeout_ms;
    dispatcher_ = std::make_unique<rpc::Dispatcher>(*capabilities_, *invocations_, *connections_, dispatcher_config);

    LOG_INFO("[Runtime] Dispatcher created (instance " << dispatcher_->instance_tag() << ")");
    return true;
}

bool Runtime::init_http(std::string &error) {
    if (config_.http.enabled) {
        LOG_INFO("[Runtime] Creating HTTP server");
        http_server_ = std::make_unique<http::HttpServer>(config_.http, config_.connections, *dispatcher_, *lifecycle_,
                                                          *connections_, *capabilities_, *invocations_,
                                                          config_.runtime.name);

        std::string http_error;
        if (!http_server_->start(http_error)) {
            error = "HTTP server failed to start: " + http_error;
            return false;
        }
        LOG_INFO("[Runtime] HTTP server started on " << config_.http.bind << ":" << config_.http.port);
    } else {
        LOG_INFO("[Runtime] HTTP server disabled in config");
    }
    return true;
}

void Runtime::reap_once() {
    if (invocations_) {
        size_t expired = invocations_->expire_overdue();
        if (expired > 0) {
            LOG_DEBUG("[Runtime] Reaper expired " << expired << " invocation(s)");
        }
    }

    if (http_server_) {
        size_t idle = http_server_->reap_idle_connections();
        if (idle > 0) {
            LOG_INFO("[Runtime] Dropped " << idle << " idle connection(s)");
        }
    }
}

void Runtime::run() {
    LOG_INFO("[Runtime] Starting main loop (reaper every " << config_.runtime.reaper_interval_ms << "ms)");
    running_ = true;

    LOG_INFO("[Runtime] Press Ctrl+C to exit");

    while (running_) {
        std::this_thread::sleep_for(std::chrono::milliseconds(config_.runtime.reaper_interval_ms));

        if (SignalHandler::is_shutdown_requested()) {
            LOG_INFO("[Runtime] Signal received, stopping...");
            running_ = false;
            break;
        }

        reap_once();
    }

    LOG_INFO("[Runtime] Shutting down");
}

void Runtime::shutdown() {
    if (http_server_) {
        LOG_INFO("[Runtime] Stopping HTTP server");
        http_server_->stop();
        http_server_.reset();
    }

    // Connections registered outside the HTTP transport
    if (connections_ && lifecycle_) {
        for (const auto &conn_id : connections_->ids()) {
            lifecycle_->on_disconnect(conn_id);
        }
    }
}

}  // namespace runtime
}  // namespace nodegate
