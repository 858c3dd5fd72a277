#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace nodegate {
namespace http {

/**
 * @brief JSON helpers for the transport endpoints
 *
 * JSON-RPC frames themselves are handled by rpc/json_rpc.hpp. These cover the
 * small request/response bodies of the connection endpoints.
 */

// POST /v0/connections body: {"role"?: "node"|"operator", "label"?: string}. Empty body is allowed.
bool decode_open_connection_request(const std::string &body, std::string &role, std::string &label,
                                    std::string &error);

bool is_known_role(const std::string &role);

// wait_ms query parameter: non-negative integer, clamped to max_wait_ms
bool decode_wait_ms(const std::string &text, int max_wait_ms, int &wait_ms, std::string &error);

// Outbound frames as JSON values (frames that are not valid JSON are passed as strings)
nlohmann::json encode_frames(const std::vector<std::string> &frames);

}  // namespace http
}  // namespace nodegate
