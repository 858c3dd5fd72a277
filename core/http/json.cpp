#include "json.hpp"

#include <stdexcept>

#include "rpc/dispatcher.hpp"

namespace nodegate {
namespace http {

namespace {
constexpr const char *kOperatorRole = "operator";
}  // namespace

bool is_known_role(const std::string &role) { return role == rpc::kNodeRole || role == kOperatorRole; }

bool decode_open_connection_request(const std::string &body, std::string &role, std::string &label,
                                    std::string &error) {
    role = rpc::kNodeRole;
    label.clear();

    if (body.find_first_not_of(" \t\r\n") == std::string::npos) {
        return true;
    }

    nlohmann::json json;
    try {
        json = nlohmann::json::parse(body);
    } catch (const std::exception &e) {
        error = std::string("Invalid JSON: ") + e.what();
        return false;
    }

    if (!json.is_object()) {
        error = "Request body must be a JSON object";
        return false;
    }

    if (json.contains("role")) {
        if (!json["role"].is_string()) {
            error = "'role' must be a string";
            return false;
        }
        role = json["role"].get<std::string>();
        if (!is_known_role(role)) {
            error = "Unknown role: " + role;
            return false;
        }
    }

    if (json.contains("label")) {
        if (!json["label"].is_string()) {
            error = "'label' must be a string";
            return false;
        }
        label = json["label"].get<std::string>();
    }

    return true;
}

bool decode_wait_ms(const std::string &text, int max_wait_ms, int &wait_ms, std::string &error) {
    size_t consumed = 0;
    long value = 0;
    try {
        value = std::stol(text, &consumed);
    } catch (const std::exception &) {
        error = "wait_ms must be an integer: " + text;
        return false;
    }

    if (consumed != text.size()) {
        error = "wait_ms must be an integer: " + text;
        return false;
    }
    if (value < 0) {
        error = "wait_ms must be >= 0";
        return false;
    }

    wait_ms = value > max_wait_ms ? max_wait_ms : static_cast<int>(value);
    return true;
}

nlohmann::json encode_frames(const std::vector<std::string> &frames) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto &frame : frames) {
        auto parsed = nlohmann::json::parse(frame, nullptr, false);
        if (parsed.is_discarded()) {
            out.push_back(frame);
        } else {
            out.push_back(std::move(parsed));
        }
    }
    return out;
}

}  // namespace http
}  // namespace nodegate
