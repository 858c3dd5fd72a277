#pragma once

#include <httplib.h>

#include <nlohmann/json.hpp>
#include <string>

#include "../errors.hpp"

namespace nodegate {
namespace http {

// Helper: conn_id from the first regex capture
inline bool parse_conn_id(const httplib::Request &req, std::string &conn_id) {
    if (req.matches.size() >= 2) {
        conn_id = req.matches[1].str();
        return !conn_id.empty();
    }
    return false;
}

// Helper: Send JSON response
inline void send_json(httplib::Response &res, StatusCode code, const nlohmann::json &body) {
    res.status = status_code_to_http(code);
    res.set_content(body.dump(), "application/json");
}

inline void send_error(httplib::Response &res, StatusCode code, const std::string &message) {
    send_json(res, code, make_error_response(code, message));
}

}  // namespace http
}  // namespace nodegate
