#include "../../connection/connection_lifecycle.hpp"
#include "../../logging/logger.hpp"
#include "../../rpc/dispatcher.hpp"
#include "../json.hpp"
#include "../server.hpp"
#include "utils.hpp"

namespace nodegate {
namespace http {

//=============================================================================
// POST /v0/connections
//=============================================================================
void HttpServer::handle_post_connection(const httplib::Request &req, httplib::Response &res) {
    std::string role, label, error;
    if (!decode_open_connection_request(req.body, role, label, error)) {
        send_error(res, StatusCode::INVALID_ARGUMENT, error);
        return;
    }

    if (!running_.load()) {
        send_error(res, StatusCode::UNAVAILABLE, "Server is shutting down");
        return;
    }

    auto session = std::make_shared<Session>();
    const std::string conn_id = next_conn_id();
    session->connection =
        std::make_shared<connection::QueuedConnection>(conn_id, role, connections_config_.outbound_queue_size);
    session->label = label;

    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        sessions_[conn_id] = session;
    }
    lifecycle_.on_connect(session->connection);

    LOG_INFO("[HTTP] Opened " << conn_id << " (role " << role << (label.empty() ? "" : ", label " + label) << ")");

    nlohmann::json response = {{"status", make_status(StatusCode::OK)}, {"conn_id", conn_id}, {"role", role}};
    send_json(res, StatusCode::OK, response);
}

//=============================================================================
// GET /v0/connections
//=============================================================================
void HttpServer::handle_get_connections(const httplib::Request &, httplib::Response &res) {
    nlohmann::json connections_json = nlohmann::json::array();

    std::vector<std::pair<std::string, std::shared_ptr<Session>>> snapshot;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        snapshot.assign(sessions_.begin(), sessions_.end());
    }

    for (const auto &entry : snapshot) {
        const auto &conn = entry.second->connection;
        connections_json.push_back({{"conn_id", entry.first},
                                    {"role", conn->role()},
                                    {"label", entry.second->label},
                                    {"queued_frames", conn->queued()},
                                    {"rejected_frames", conn->rejected_count()}});
    }

    nlohmann::json response = {{"status", make_status(StatusCode::OK)}, {"connections", connections_json}};
    send_json(res, StatusCode::OK, response);
}

//=============================================================================
// DELETE /v0/connections/{conn_id}
//=============================================================================
void HttpServer::handle_delete_connection(const httplib::Request &req, httplib::Response &res) {
    std::string conn_id;
    if (!parse_conn_id(req, conn_id)) {
        send_error(res, StatusCode::INVALID_ARGUMENT, "Invalid path: expected /v0/connections/{conn_id}");
        return;
    }

    if (!disconnect_session(conn_id, "closed by peer")) {
        send_error(res, StatusCode::NOT_FOUND, "Connection not found: " + conn_id);
        return;
    }

    nlohmann::json response = {{"status", make_status(StatusCode::OK)}, {"conn_id", conn_id}};
    send_json(res, StatusCode::OK, response);
}

//=============================================================================
// POST /v0/connections/{conn_id}/frames
//=============================================================================
void HttpServer::handle_post_frame(const httplib::Request &req, httplib::Response &res) {
    std::string conn_id;
    if (!parse_conn_id(req, conn_id)) {
        send_error(res, StatusCode::INVALID_ARGUMENT, "Invalid path: expected /v0/connections/{conn_id}/frames");
        return;
    }

    auto session = find_session(conn_id);
    if (!session) {
        send_error(res, StatusCode::NOT_FOUND, "Connection not found: " + conn_id);
        return;
    }

    ActiveRequest active(session);

    rpc::RequestContext ctx;
    ctx.conn_id = conn_id;
    ctx.role = session->connection->role();

    auto reply = dispatcher_.handle_frame(ctx, req.body);
    if (!reply) {
        send_json(res, StatusCode::ACCEPTED, {{"status", make_status(StatusCode::ACCEPTED, "Frame accepted")}});
        return;
    }

    res.status = status_code_to_http(StatusCode::OK);
    res.set_content(*reply, "application/json");
}

//=============================================================================
// GET /v0/connections/{conn_id}/frames?wait_ms=N
//=============================================================================
void HttpServer::handle_get_frames(const httplib::Request &req, httplib::Response &res) {
    std::string conn_id;
    if (!parse_conn_id(req, conn_id)) {
        send_error(res, StatusCode::INVALID_ARGUMENT, "Invalid path: expected /v0/connections/{conn_id}/frames");
        return;
    }

    int wait_ms = 0;
    if (req.has_param("wait_ms")) {
        std::string error;
        if (!decode_wait_ms(req.get_param_value("wait_ms"), connections_config_.max_poll_wait_ms, wait_ms, error)) {
            send_error(res, StatusCode::INVALID_ARGUMENT, error);
            return;
        }
    }

    auto session = find_session(conn_id);
    if (!session) {
        send_error(res, StatusCode::NOT_FOUND, "Connection not found: " + conn_id);
        return;
    }

    ActiveRequest active(session);
    auto frames = session->connection->pop_frames(wait_ms);

    if (frames.empty() && !session->connection->is_open()) {
        // Closed while we were waiting
        send_error(res, StatusCode::NOT_FOUND, "Connection closed: " + conn_id);
        return;
    }

    nlohmann::json response = {{"status", make_status(StatusCode::OK)}, {"frames", encode_frames(frames)}};
    send_json(res, StatusCode::OK, response);
}

}  // namespace http
}  // namespace nodegate
