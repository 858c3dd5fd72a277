#pragma once

#include <string>

namespace nodegate {
namespace rpc {

/**
 * @brief Gateway error kinds and their JSON-RPC error codes
 *
 * Envelope-level failures use the standard JSON-RPC range:
 * - PARSE_ERROR      -32700
 * - INVALID_REQUEST  -32600
 * - METHOD_NOT_FOUND -32601
 *
 * Everything that can go wrong inside node.describe / node.invoke is an ErrorKind.
 * The kind name travels in error.data.kind so callers do not have to decode codes.
 */
enum class ErrorKind {
    NONE,
    INVALID_PARAMS,
    INVALID_CAPABILITY_LIST,
    INVALID_TIMEOUT,
    UNAUTHORIZED,
    SERVICE_UNAVAILABLE,
    METHOD_UNSUPPORTED,
    DEVICE_UNREACHABLE,
    TIMEOUT,
    DEVICE_DISCONNECTED,
    CANCELLED,
    DEVICE_ERROR,
    DUPLICATE_CORRELATION_ID,
    INTERNAL
};

namespace error_codes {
constexpr int PARSE_ERROR = -32700;
constexpr int INVALID_REQUEST = -32600;
constexpr int METHOD_NOT_FOUND = -32601;
constexpr int INVALID_PARAMS = -32602;
constexpr int INTERNAL_ERROR = -32603;
constexpr int UNAUTHORIZED = -32003;
constexpr int SERVICE_UNAVAILABLE = -32004;
constexpr int METHOD_UNSUPPORTED = -32005;
constexpr int DEVICE_UNREACHABLE = -32006;
constexpr int TIMEOUT = -32007;
constexpr int DEVICE_DISCONNECTED = -32008;
constexpr int CANCELLED = -32009;
constexpr int DEVICE_ERROR = -32010;
}  // namespace error_codes

inline int error_kind_to_code(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::INVALID_PARAMS:
        case ErrorKind::INVALID_CAPABILITY_LIST:
        case ErrorKind::INVALID_TIMEOUT:
            return error_codes::INVALID_PARAMS;
        case ErrorKind::UNAUTHORIZED:
            return error_codes::UNAUTHORIZED;
        case ErrorKind::SERVICE_UNAVAILABLE:
            return error_codes::SERVICE_UNAVAILABLE;
        case ErrorKind::METHOD_UNSUPPORTED:
            return error_codes::METHOD_UNSUPPORTED;
        case ErrorKind::DEVICE_UNREACHABLE:
            return error_codes::DEVICE_UNREACHABLE;
        case ErrorKind::TIMEOUT:
            return error_codes::TIMEOUT;
        case ErrorKind::DEVICE_DISCONNECTED:
            return error_codes::DEVICE_DISCONNECTED;
        case ErrorKind::CANCELLED:
            return error_codes::CANCELLED;
        case ErrorKind::DEVICE_ERROR:
            return error_codes::DEVICE_ERROR;
        case ErrorKind::DUPLICATE_CORRELATION_ID:
        case ErrorKind::INTERNAL:
        default:
            return error_codes::INTERNAL_ERROR;
    }
}

inline std::string error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE:
            return "None";
        case ErrorKind::INVALID_PARAMS:
            return "InvalidParams";
        case ErrorKind::INVALID_CAPABILITY_LIST:
            return "InvalidCapabilityList";
        case ErrorKind::INVALID_TIMEOUT:
            return "InvalidTimeout";
        case ErrorKind::UNAUTHORIZED:
            return "Unauthorized";
        case ErrorKind::SERVICE_UNAVAILABLE:
            return "ServiceUnavailable";
        case ErrorKind::METHOD_UNSUPPORTED:
            return "MethodUnsupported";
        case ErrorKind::DEVICE_UNREACHABLE:
            return "DeviceUnreachable";
        case ErrorKind::TIMEOUT:
            return "Timeout";
        case ErrorKind::DEVICE_DISCONNECTED:
            return "DeviceDisconnected";
        case ErrorKind::CANCELLED:
            return "Cancelled";
        case ErrorKind::DEVICE_ERROR:
            return "DeviceError";
        case ErrorKind::DUPLICATE_CORRELATION_ID:
            return "DuplicateCorrelationId";
        case ErrorKind::INTERNAL:
        default:
            return "Internal";
    }
}

}  // namespace rpc
}  // namespace nodegate
