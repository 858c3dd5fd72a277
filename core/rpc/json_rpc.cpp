#include "json_rpc.hpp"

namespace nodegate {
namespace rpc {

namespace {

constexpr const char *kJsonRpcVersion = "2.0";

// Correlation ids travel as strings; numeric ids from foreign clients are normalised
bool id_to_correlation_id(const nlohmann::json &id, std::string &out) {
    if (id.is_string()) {
        out = id.get<std::string>();
        return !out.empty();
    }
    if (id.is_number_integer() || id.is_number_unsigned()) {
        out = id.dump();
        return true;
    }
    return false;
}

bool is_valid_request_id(const nlohmann::json &id) {
    return id.is_null() || id.is_string() || id.is_number_integer() || id.is_number_unsigned();
}

bool decode_rpc_error(const nlohmann::json &json, RpcError &out) {
    if (json.is_string()) {
        out.code = error_codes::DEVICE_ERROR;
        out.message = json.get<std::string>();
        return true;
    }
    if (!json.is_object()) {
        return false;
    }
    if (json.contains("code") && json["code"].is_number_integer()) {
        out.code = json["code"].get<int>();
    } else {
        out.code = error_codes::DEVICE_ERROR;
    }
    if (json.contains("message") && json["message"].is_string()) {
        out.message = json["message"].get<std::string>();
    }
    if (json.contains("data")) {
        out.data = json["data"];
    }
    return true;
}

bool read_optional_string(const nlohmann::json &json, const char *key, std::optional<std::string> &out,
                          std::string &error) {
    if (!json.contains(key) || json[key].is_null()) {
        out.reset();
        return true;
    }
    if (!json[key].is_string()) {
        error = std::string("'") + key + "' must be a string";
        return false;
    }
    out = json[key].get<std::string>();
    return true;
}

}  // namespace

bool parse_frame(const std::string &text, Frame &frame, RpcError &error, nlohmann::json &error_id) {
    error_id = nullptr;

    nlohmann::json json;
    try {
        json = nlohmann::json::parse(text);
    } catch (const std::exception &e) {
        error.code = error_codes::PARSE_ERROR;
        error.message = std::string("Failed to parse JSON: ") + e.what();
        return false;
    }

    if (!json.is_object()) {
        error.code = error_codes::INVALID_REQUEST;
        error.message = "Frame must be a JSON object";
        return false;
    }

    if (json.contains("id") && is_valid_request_id(json["id"])) {
        error_id = json["id"];
    }

    // Response: no method, carries result or error
    if (!json.contains("method") && (json.contains("result") || json.contains("error"))) {
        frame.type = FrameType::RESPONSE;

        bool have_id = false;
        if (json.contains("correlation_id")) {
            have_id = id_to_correlation_id(json["correlation_id"], frame.correlation_id);
        } else if (json.contains("id")) {
            have_id = id_to_correlation_id(json["id"], frame.correlation_id);
        }
        if (!have_id) {
            error.code = error_codes::INVALID_REQUEST;
            error.message = "Response frame missing correlation id";
            return false;
        }

        if (json.contains("error") && !json["error"].is_null()) {
            RpcError device_error;
            if (!decode_rpc_error(json["error"], device_error)) {
                error.code = error_codes::INVALID_REQUEST;
                error.message = "Response 'error' must be an object or string";
                return false;
            }
            frame.error = device_error;
        } else {
            frame.result = json.contains("result") ? json["result"] : nlohmann::json();
        }
        return true;
    }

    if (!json.contains("jsonrpc") || !json["jsonrpc"].is_string() ||
        json["jsonrpc"].get<std::string>() != kJsonRpcVersion) {
        error.code = error_codes::INVALID_REQUEST;
        std::string got = json.contains("jsonrpc") ? json["jsonrpc"].dump() : "none";
        error.message = "Invalid jsonrpc version: expected '2.0', got " + got;
        return false;
    }

    if (!json.contains("method") || !json["method"].is_string() || json["method"].get<std::string>().empty()) {
        error.code = error_codes::INVALID_REQUEST;
        error.message = "Missing or empty 'method' field";
        return false;
    }

    if (json.contains("id") && !is_valid_request_id(json["id"])) {
        error.code = error_codes::INVALID_REQUEST;
        error.message = "'id' must be a string, an integer or null";
        return false;
    }

    frame.method = json["method"].get<std::string>();
    frame.params = json.contains("params") ? json["params"] : nlohmann::json();
    frame.id = json.contains("id") ? json["id"] : nlohmann::json();
    frame.type = frame.id.is_null() ? FrameType::NOTIFICATION : FrameType::REQUEST;
    return true;
}

nlohmann::json make_result(const nlohmann::json &id, nlohmann::json result) {
    return {{"jsonrpc", kJsonRpcVersion}, {"result", std::move(result)}, {"id", id}};
}

nlohmann::json make_error(const nlohmann::json &id, int code, const std::string &message,
                          const nlohmann::json &data) {
    nlohmann::json error = {{"code", code}, {"message", message}};
    if (!data.is_null()) {
        error["data"] = data;
    }
    return {{"jsonrpc", kJsonRpcVersion}, {"error", error}, {"id", id}};
}

nlohmann::json make_error(const nlohmann::json &id, ErrorKind kind, const std::string &message,
                          nlohmann::json data) {
    if (!data.is_object()) {
        nlohmann::json detail = nlohmann::json::object();
        if (!data.is_null()) {
            detail["detail"] = std::move(data);
        }
        data = std::move(detail);
    }
    data["kind"] = error_kind_to_string(kind);
    return make_error(id, error_kind_to_code(kind), message, data);
}

nlohmann::json make_request(const std::string &id, const std::string &method, nlohmann::json params) {
    return {{"jsonrpc", kJsonRpcVersion}, {"method", method}, {"params", std::move(params)}, {"id", id}};
}

bool decode_describe_params(const nlohmann::json &json, DescribeParams &out, ErrorKind &kind, std::string &error) {
    kind = ErrorKind::INVALID_PARAMS;

    if (!json.is_object()) {
        error = json.is_null() ? "Missing parameters: capabilities required" : "Parameters must be an object";
        return false;
    }

    if (!read_optional_string(json, "device_id", out.device_id, error)) {
        kind = ErrorKind::INVALID_CAPABILITY_LIST;
        return false;
    }

    kind = ErrorKind::INVALID_CAPABILITY_LIST;
    if (!json.contains("capabilities") || !json["capabilities"].is_array()) {
        error = "'capabilities' must be a list";
        return false;
    }

    out.capabilities.clear();
    size_t index = 0;
    for (const auto &entry : json["capabilities"]) {
        const std::string where = "capabilities[" + std::to_string(index++) + "]";
        if (!entry.is_object()) {
            error = where + " must be an object";
            return false;
        }
        if (!entry.contains("service") || !entry["service"].is_string()) {
            error = where + " missing string 'service'";
            return false;
        }
        const std::string service = entry["service"].get<std::string>();

        if (entry.contains("method")) {
            if (!entry["method"].is_string()) {
                error = where + ".method must be a string";
                return false;
            }
            out.capabilities.push_back({service, entry["method"].get<std::string>()});
        } else if (entry.contains("methods")) {
            // Grouped form: {service, methods: [...], description?}
            if (!entry["methods"].is_array() || entry["methods"].empty()) {
                error = where + ".methods must be a non-empty list";
                return false;
            }
            for (const auto &method : entry["methods"]) {
                if (!method.is_string()) {
                    error = where + ".methods entries must be strings";
                    return false;
                }
                out.capabilities.push_back({service, method.get<std::string>()});
            }
        } else {
            error = where + " missing 'method'";
            return false;
        }
    }

    kind = ErrorKind::NONE;
    return true;
}

bool decode_invoke_params(const nlohmann::json &json, InvokeParams &out, ErrorKind &kind, std::string &error) {
    kind = ErrorKind::INVALID_PARAMS;

    if (!json.is_object()) {
        error = json.is_null() ? "Missing parameters: service and method required" : "Parameters must be an object";
        return false;
    }

    if (!json.contains("service") || !json["service"].is_string()) {
        error = "'service' must be a string";
        return false;
    }
    if (!json.contains("method") || !json["method"].is_string()) {
        error = "'method' must be a string";
        return false;
    }
    out.service = json["service"].get<std::string>();
    out.method = json["method"].get<std::string>();

    if (!read_optional_string(json, "device_id", out.device_id, error)) {
        return false;
    }

    out.params = json.contains("params") && !json["params"].is_null() ? json["params"] : nlohmann::json::object();

    out.timeout_ms.reset();
    if (json.contains("timeout_ms") && !json["timeout_ms"].is_null()) {
        const auto &timeout = json["timeout_ms"];
        if (timeout.is_number_unsigned()) {
            auto value = timeout.get<uint64_t>();
            out.timeout_ms = value > static_cast<uint64_t>(INT64_MAX) ? INT64_MAX : static_cast<int64_t>(value);
        } else if (timeout.is_number_integer()) {
            out.timeout_ms = timeout.get<int64_t>();
        } else {
            kind = ErrorKind::INVALID_TIMEOUT;
            error = "'timeout_ms' must be an integer";
            return false;
        }
    }

    kind = ErrorKind::NONE;
    return true;
}

nlohmann::json encode_capability(const capability::Capability &capability) {
    return {{"service", capability.service}, {"method", capability.method}};
}

nlohmann::json encode_connection_capabilities(const capability::ConnectionCapabilities &entry) {
    nlohmann::json capabilities = nlohmann::json::array();
    for (const auto &cap : entry.capabilities) {
        capabilities.push_back(encode_capability(cap));
    }

    nlohmann::json json = {{"conn_id", entry.conn_id}, {"services", entry.services()}, {"capabilities", capabilities}};
    json["device_id"] = entry.device_id ? nlohmann::json(*entry.device_id) : nlohmann::json();
    return json;
}

}  // namespace rpc
}  // namespace nodegate
