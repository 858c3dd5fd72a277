#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "capability/capability_store.hpp"
#include "errors.hpp"

namespace nodegate {
namespace rpc {

/**
 * @brief JSON-RPC 2.0 framing for the gateway
 *
 * Three inbound shapes are recognised:
 * - request       {"jsonrpc":"2.0","method":...,"params":...,"id":...}
 * - notification  a request without "id"
 * - response      no "method", carries "result" or "error"; correlated by
 *                 "correlation_id" when present, otherwise by "id"
 *
 * Responses are accepted with or without the "jsonrpc" member because devices
 * may answer with the short {correlation_id, result} form.
 */

struct RpcError {
    int code = 0;
    std::string message;
    nlohmann::json data;  // null when absent
};

enum class FrameType { REQUEST, NOTIFICATION, RESPONSE };

struct Frame {
    FrameType type = FrameType::REQUEST;

    // Requests / notifications
    std::string method;
    nlohmann::json params;  // null when absent
    nlohmann::json id;      // null for notifications

    // Responses
    std::string correlation_id;
    nlohmann::json result;
    std::optional<RpcError> error;
};

// Parse a text frame. On failure fills error and error_id (the request id when it could be read).
bool parse_frame(const std::string &text, Frame &frame, RpcError &error, nlohmann::json &error_id);

// Outbound envelopes
nlohmann::json make_result(const nlohmann::json &id, nlohmann::json result);
nlohmann::json make_error(const nlohmann::json &id, int code, const std::string &message,
                          const nlohmann::json &data = nlohmann::json());
nlohmann::json make_error(const nlohmann::json &id, ErrorKind kind, const std::string &message,
                          nlohmann::json data = nlohmann::json());
nlohmann::json make_request(const std::string &id, const std::string &method, nlohmann::json params);

// node.describe params
struct DescribeParams {
    std::optional<std::string> device_id;
    std::vector<capability::Capability> capabilities;
};

// node.invoke params
struct InvokeParams {
    std::string service;
    std::string method;
    nlohmann::json params;  // forwarded verbatim; {} when absent
    std::optional<int64_t> timeout_ms;
    std::optional<std::string> device_id;
};

// Structural decoding only (types and presence). Semantic validation is the dispatcher's job.
bool decode_describe_params(const nlohmann::json &json, DescribeParams &out, ErrorKind &kind, std::string &error);
bool decode_invoke_params(const nlohmann::json &json, InvokeParams &out, ErrorKind &kind, std::string &error);

nlohmann::json encode_capability(const capability::Capability &capability);
nlohmann::json encode_connection_capabilities(const capability::ConnectionCapabilities &entry);

}  // namespace rpc
}  // namespace nodegate
