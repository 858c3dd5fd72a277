#pragma once

// Prevent Windows macro pollution (must be before httplib.h)
#ifdef _WIN32
#define WIN32_LEAN_AND_MEAN
#define NOMINMAX
#endif

#include <httplib.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "connection/queued_connection.hpp"
#include "runtime/config.hpp"

namespace nodegate {
namespace capability {
class CapabilityStore;
}
namespace connection {
class ConnectionLifecycle;
class ConnectionRegistry;
}  // namespace connection
namespace invocation {
class PendingInvocationTable;
}
namespace rpc {
class Dispatcher;
}

namespace http {

/**
 * @brief HTTP long-poll transport for the gateway
 *
 * Each peer opens a logical connection with POST /v0/connections and then:
 * - pushes JSON-RPC frames with POST /v0/connections/{id}/frames
 * - pulls frames addressed to it with GET /v0/connections/{id}/frames?wait_ms=N
 *
 * Thread model:
 * - Server runs in its own thread (via httplib::Server::listen_after_bind)
 * - Request handlers execute in httplib's thread pool; a node.invoke holds its
 *   worker thread until the invocation is resolved
 *
 * Lifecycle:
 * - start() binds to configured port and spawns server thread
 * - stop() disconnects every session (which releases blocked invocations and
 *   polls), then signals shutdown and joins the server thread
 */
class HttpServer {
public:
    HttpServer(const runtime::HttpConfig &config, const runtime::ConnectionsConfig &connections_config,
               rpc::Dispatcher &dispatcher, connection::ConnectionLifecycle &lifecycle,
               connection::ConnectionRegistry &connections, capability::CapabilityStore &capabilities,
               invocation::PendingInvocationTable &invocations, std::string runtime_name = "");

    ~HttpServer();

    /**
     * @brief Start HTTP server
     *
     * @param error Populated with error message on failure
     * @return true if server started
     */
    bool start(std::string &error);

    // Safe to call multiple times
    void stop();

    bool is_running() const { return running_.load(); }
    int get_port() const { return port_; }

    /**
     * @brief Disconnect sessions that have not polled or sent for idle_timeout_ms
     *
     * Sessions with a request in progress are never reaped. Called from the
     * runtime loop; returns the number of sessions dropped.
     */
    size_t reap_idle_connections();

    size_t session_count() const;

private:
    struct Session {
        std::shared_ptr<connection::QueuedConnection> connection;
        std::string label;
        std::atomic<int> active_requests{0};
    };

    // Keeps a session from being reaped while one of its requests is running
    class ActiveRequest {
    public:
        explicit ActiveRequest(std::shared_ptr<Session> session) : session_(std::move(session)) {
            session_->active_requests.fetch_add(1);
            session_->connection->touch();
        }
        ~ActiveRequest() {
            session_->connection->touch();
            session_->active_requests.fetch_sub(1);
        }
        ActiveRequest(const ActiveRequest &) = delete;
        ActiveRequest &operator=(const ActiveRequest &) = delete;

    private:
        std::shared_ptr<Session> session_;
    };

    // Configuration
    runtime::HttpConfig config_;
    runtime::ConnectionsConfig connections_config_;
    std::string runtime_name_;
    int port_ = 0;
    std::chrono::steady_clock::time_point start_time_;

    // Gateway component references
    rpc::Dispatcher &dispatcher_;
    connection::ConnectionLifecycle &lifecycle_;
    connection::ConnectionRegistry &connections_;
    capability::CapabilityStore &capabilities_;
    invocation::PendingInvocationTable &invocations_;

    // Transport sessions (conn_id -> outbound queue)
    mutable std::mutex sessions_mutex_;
    std::unordered_map<std::string, std::shared_ptr<Session>> sessions_;
    std::atomic<uint64_t> next_conn_seq_{1};

    // Server state
    std::unique_ptr<httplib::Server> server_;
    std::unique_ptr<std::thread> server_thread_;
    std::atomic<bool> running_{false};

    void setup_routes();

    std::string next_conn_id();
    std::shared_ptr<Session> find_session(const std::string &conn_id) const;

    // Removes the session and runs the disconnect hook. Returns false if it was already gone.
    bool disconnect_session(const std::string &conn_id, const char *reason);
    void disconnect_all();

    // Route handlers (implemented in handlers/*.cpp)
    void handle_post_connection(const httplib::Request &req, httplib::Response &res);
    void handle_get_connections(const httplib::Request &req, httplib::Response &res);
    void handle_delete_connection(const httplib::Request &req, httplib::Response &res);
    void handle_post_frame(const httplib::Request &req, httplib::Response &res);
    void handle_get_frames(const httplib::Request &req, httplib::Response &res);
    void handle_get_nodes(const httplib::Request &req, httplib::Response &res);
    void handle_get_runtime_status(const httplib::Request &req, httplib::Response &res);
};

}  // namespace http
}  // namespace nodegate
