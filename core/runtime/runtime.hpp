#pragma once

#include <atomic>
#include <memory>
#include <string>

#include "capability/capability_store.hpp"
#include "config.hpp"
#include "connection/connection_lifecycle.hpp"
#include "connection/connection_registry.hpp"
#include "http/server.hpp"
#include "invocation/pending_invocations.hpp"
#include "rpc/dispatcher.hpp"

namespace nodegate {
namespace runtime {

/**
 * @brief Owns and wires the gateway components
 *
 * The capability store, pending-invocation table and connection registry are
 * created once here and handed by reference to everything that needs them.
 * run() drives the deadline reaper (and idle-connection reaper) until stop()
 * or a shutdown signal.
 */
class Runtime {
public:
    explicit Runtime(const RuntimeConfig &config);
    ~Runtime();

    Runtime(const Runtime &) = delete;
    Runtime &operator=(const Runtime &) = delete;

    // Initialize all components (core services, HTTP)
    bool initialize(std::string &error);

    // Main runtime loop (blocking)
    void run();

    // Triggers the main loop to exit
    void stop() { running_ = false; }

    // Stops the transport and drops every connection
    void shutdown();

    // One reaper pass (also used by tests)
    void reap_once();

    capability::CapabilityStore &get_capability_store() { return *capabilities_; }
    invocation::PendingInvocationTable &get_invocations() { return *invocations_; }
    connection::ConnectionRegistry &get_connections() { return *connections_; }
    connection::ConnectionLifecycle &get_lifecycle() { return *lifecycle_; }
    rpc::Dispatcher &get_dispatcher() { return *dispatcher_; }

private:
    bool init_core_services(std::string &error);
    bool init_http(std::string &error);

    RuntimeConfig config_;

    std::unique_ptr<capability::CapabilityStore> capabilities_;
    std::unique_ptr<invocation::PendingInvocationTable> invocations_;
    std::unique_ptr<connection::ConnectionRegistry> connections_;
    std::unique_ptr<connection::ConnectionLifecycle> lifecycle_;
    std::unique_ptr<rpc::Dispatcher> dispatcher_;
    std::unique_ptr<http::HttpServer> http_server_;

    std::atomic<bool> running_{false};
};

}  // namespace runtime
}  // namespace nodegate
