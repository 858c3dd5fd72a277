#include "server.hpp"

#include <algorithm>

#include "connection/connection_lifecycle.hpp"
#include "errors.hpp"
#include "logging/logger.hpp"

namespace nodegate {
namespace http {

namespace {
constexpr int kDefaultReadTimeoutSeconds = 5;
constexpr int kStatusNoContent = 204;
constexpr int kStatusBadRequest = 400;
constexpr int kStatusNotFound = 404;
constexpr int kStatusInternal = 500;

// Invocations and long polls legitimately keep a response open for a while
constexpr int kPollSlackSeconds = 5;
}  // namespace

HttpServer::HttpServer(const runtime::HttpConfig &config, const runtime::ConnectionsConfig &connections_config,
                       rpc::Dispatcher &dispatcher, connection::ConnectionLifecycle &lifecycle,
                       connection::ConnectionRegistry &connections, capability::CapabilityStore &capabilities,
                       invocation::PendingInvocationTable &invocations, std::string runtime_name)
    : config_(config),
      connections_config_(connections_config),
      runtime_name_(std::move(runtime_name)),
      start_time_(std::chrono::steady_clock::now()),
      dispatcher_(dispatcher),
      lifecycle_(lifecycle),
      connections_(connections),
      capabilities_(capabilities),
      invocations_(invocations) {}

HttpServer::~HttpServer() { stop(); }

bool HttpServer::start(std::string &error) {
    if (running_.load()) {
        error = "Server already running";
        return false;
    }

    LOG_INFO("[HTTP] Starting server on " << config_.bind << ":" << config_.port);

    server_ = std::make_unique<httplib::Server>();

    server_->set_read_timeout(kDefaultReadTimeoutSeconds, 0);
    server_->set_write_timeout(connections_config_.max_poll_wait_ms / 1000 + kPollSlackSeconds, 0);

    // Every blocked node.invoke and every long poll occupies one worker
    int pool_size = config_.thread_pool_size;
    server_->new_task_queue = [pool_size] { return new httplib::ThreadPool(pool_size); };

    // Add CORS headers to all responses (allowlist with wildcard support)
    const bool allow_credentials = config_.cors_allow_credentials;
    server_->set_post_routing_handler([allow_credentials, origins = config_.cors_allowed_origins](
                                          const httplib::Request &req, httplib::Response &res) {
        const auto origin_it = req.headers.find("Origin");
        if (origin_it == req.headers.end()) {
            return;
        }

        const std::string origin = origin_it->second;
        auto origin_matches = [&origin](const std::string &allowed) {
            if (allowed == "*") {
                return true;
            }

            const auto wildcard_pos = allowed.find('*');
            if (wildcard_pos == std::string::npos) {
                return allowed == origin;
            }

            const std::string prefix = allowed.substr(0, wildcard_pos);
            const std::string suffix = allowed.substr(wildcard_pos + 1);
            if (origin.size() < prefix.size() + suffix.size()) {
                return false;
            }

            const bool prefix_ok = origin.compare(0, prefix.size(), prefix) == 0;
            const bool suffix_ok = origin.compare(origin.size() - suffix.size(), suffix.size(), suffix) == 0;
            return prefix_ok && suffix_ok;
        };

        auto matched = std::find_if(origins.begin(), origins.end(), origin_matches);
        if (matched == origins.end()) {
            return;
        }

        const std::string &allowed = *matched;
        const std::string response_origin = allowed == "*" ? "*" : origin;

        res.set_header("Access-Control-Allow-Origin", response_origin.c_str());
        res.set_header("Access-Control-Allow-Methods", "GET, POST, DELETE, OPTIONS");
        res.set_header("Access-Control-Allow-Headers", "Content-Type");
        if (allow_credentials) {
            res.set_header("Access-Control-Allow-Credentials", "true");
        }
    });

    setup_routes();

    // JSON error bodies for HTTP errors like 404 (only when the handler set no content)
    server_->set_error_handler([](const httplib::Request &req, httplib::Response &res) {
        if (!res.body.empty()) {
            return;
        }

        StatusCode code = StatusCode::INTERNAL;
        std::string message = "Internal server error";

        if (res.status == kStatusNotFound) {
            code = StatusCode::NOT_FOUND;
            message = "Route not found: " + req.method + " " + req.path;
        } else if (res.status == kStatusBadRequest) {
            code = StatusCode::INVALID_ARGUMENT;
            message = "Bad request";
        }

        nlohmann::json response = make_error_response(code, message);
        res.set_content(response.dump(), "application/json");
    });

    server_->set_exception_handler([](const httplib::Request &, httplib::Response &res, std::exception_ptr ep) {
        std::string msg = "Unknown error";
        try {
            std::rethrow_exception(std::move(ep));
        } catch (const std::exception &e) {
            msg = e.what();
            LOG_ERROR("[HTTP] Exception: " << e.what());
        } catch (...) {
            msg = "Unknown exception";
            LOG_ERROR("[HTTP] Unknown exception");
        }

        nlohmann::json response = make_error_response(StatusCode::INTERNAL, msg);
        res.status = kStatusInternal;
        res.set_content(response.dump(), "application/json");
    });

    if (!server_->bind_to_port(config_.bind.c_str(), config_.port)) {
        error = "Failed to bind to " + config_.bind + ":" + std::to_string(config_.port);
        server_.reset();
        return false;
    }
    port_ = config_.port;

    running_.store(true);
    server_thread_ = std::make_unique<std::thread>([this]() {
        LOG_INFO("[HTTP] Server thread started");
        server_->listen_after_bind();
        LOG_INFO("[HTTP] Server thread exiting");
    });

    LOG_INFO("[HTTP] Server listening on " << config_.bind << ":" << config_.port);
    return true;
}

void HttpServer::stop() {
    if (!running_.load()) {
        return;
    }

    LOG_INFO("[HTTP] Stopping server");
    running_.store(false);

    // Release workers blocked in invocations and long polls before joining the pool
    disconnect_all();

    if (server_) {
        server_->stop();
    }

    if (server_thread_ && server_thread_->joinable()) {
        server_thread_->join();
    }

    server_thread_.reset();
    server_.reset();
    LOG_INFO("[HTTP] Server stopped");
}

void HttpServer::setup_routes() {
    // POST /v0/connections - Open a logical connection
    server_->Post("/v0/connections",
                  [this](const httplib::Request &req, httplib::Response &res) { handle_post_connection(req, res); });

    // GET /v0/connections - List open connections
    server_->Get("/v0/connections",
                 [this](const httplib::Request &req, httplib::Response &res) { handle_get_connections(req, res); });

    // DELETE /v0/connections/:conn_id - Close a connection
    server_->Delete(R"(/v0/connections/([^/]+))", [this](const httplib::Request &req, httplib::Response &res) {
        handle_delete_connection(req, res);
    });

    // POST /v0/connections/:conn_id/frames - Deliver one JSON-RPC frame
    server_->Post(R"(/v0/connections/([^/]+)/frames)",
                  [this](const httplib::Request &req, httplib::Response &res) { handle_post_frame(req, res); });

    // GET /v0/connections/:conn_id/frames - Long-poll outbound frames
    server_->Get(R"(/v0/connections/([^/]+)/frames)",
                 [this](const httplib::Request &req, httplib::Response &res) { handle_get_frames(req, res); });

    // GET /v0/nodes - Capability snapshot
    server_->Get("/v0/nodes", [this](const httplib::Request &req, httplib::Response &res) { handle_get_nodes(req, res); });

    // GET /v0/runtime/status - Counts and uptime
    server_->Get("/v0/runtime/status",
                 [this](const httplib::Request &req, httplib::Response &res) { handle_get_runtime_status(req, res); });

    // OPTIONS catch-all for CORS preflight on all routes
    server_->Options(R"(/v0/.*)", [](const httplib::Request &, httplib::Response &res) {
        res.status = kStatusNoContent;
        res.set_header("Access-Control-Allow-Methods", "GET, POST, DELETE, OPTIONS");
        res.set_header("Access-Control-Allow-Headers", "Content-Type");
    });

    LOG_INFO("[HTTP] Routes configured:");
    LOG_INFO("[HTTP]   POST   /v0/connections");
    LOG_INFO("[HTTP]   GET    /v0/connections");
    LOG_INFO("[HTTP]   DELETE /v0/connections/{conn_id}");
    LOG_INFO("[HTTP]   POST   /v0/connections/{conn_id}/frames");
    LOG_INFO("[HTTP]   GET    /v0/connections/{conn_id}/frames?wait_ms=N");
    LOG_INFO("[HTTP]   GET    /v0/nodes");
    LOG_INFO("[HTTP]   GET    /v0/runtime/status");
}

std::string HttpServer::next_conn_id() { return "conn-" + std::to_string(next_conn_seq_.fetch_add(1)); }

std::shared_ptr<HttpServer::Session> HttpServer::find_session(const std::string &conn_id) const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    auto it = sessions_.find(conn_id);
    if (it == sessions_.end()) {
        return nullptr;
    }
    return it->second;
}

size_t HttpServer::session_count() const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    return sessions_.size();
}

bool HttpServer::disconnect_session(const std::string &conn_id, const char *reason) {
    std::shared_ptr<Session> session;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        auto it = sessions_.find(conn_id);
        if (it == sessions_.end()) {
            return false;
        }
        session = std::move(it->second);
        sessions_.erase(it);
    }

    // Only the thread that erased the session runs the hook. Closing first makes a
    // describe racing with this disconnect undo its own registration.
    LOG_INFO("[HTTP] Closing " << conn_id << " (" << reason << ")");
    session->connection->close();
    lifecycle_.on_disconnect(conn_id);
    return true;
}

void HttpServer::disconnect_all() {
    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        ids.reserve(sessions_.size());
        for (const auto &entry : sessions_) {
            ids.push_back(entry.first);
        }
    }

    for (const auto &conn_id : ids) {
        disconnect_session(conn_id, "shutdown");
    }
}

size_t HttpServer::reap_idle_connections() {
    if (connections_config_.idle_timeout_ms <= 0) {
        return 0;
    }

    const auto cutoff =
        std::chrono::steady_clock::now() - std::chrono::milliseconds(connections_config_.idle_timeout_ms);

    std::vector<std::string> idle;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        for (const auto &entry : sessions_) {
            const auto &session = entry.second;
            if (session->active_requests.load() == 0 && session->connection->last_activity() < cutoff) {
                idle.push_back(entry.first);
            }
        }
    }

    size_t reaped = 0;
    for (const auto &conn_id : idle) {
        if (disconnect_session(conn_id, "idle")) {
            ++reaped;
        }
    }
    return reaped;
}

}  // namespace http
}  // namespace nodegate
