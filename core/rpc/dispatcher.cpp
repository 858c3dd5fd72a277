#include "dispatcher.hpp"

#include <algorithm>
#include <chrono>
#include <iomanip>
#include <random>
#include <sstream>

#include "logging/logger.hpp"

namespace nodegate {
namespace rpc {

namespace {

constexpr const char *kMethodDescribe = "node.describe";
constexpr const char *kMethodInvoke = "node.invoke";

// 8 hex digits, distinct per process so correlation ids never collide across restarts
std::string make_instance_tag() {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<uint32_t> dist;

    std::ostringstream oss;
    oss << std::hex << std::setw(8) << std::setfill('0') << dist(gen);
    return oss.str();
}

nlohmann::json describe_device_error(const RpcError &error) {
    nlohmann::json json = {{"code", error.code}, {"message", error.message}};
    if (!error.data.is_null()) {
        json["data"] = error.data;
    }
    return json;
}

}  // namespace

Dispatcher::Dispatcher(capability::CapabilityStore &capabilities, invocation::PendingInvocationTable &invocations,
                       connection::ConnectionRegistry &connections, DispatcherConfig config)
    : capabilities_(capabilities),
      invocations_(invocations),
      connections_(connections),
      resolver_(capabilities),
      config_(config),
      instance_tag_(make_instance_tag()) {
    if (config_.max_timeout_ms > invocation::kMaxTimeoutMs) {
        LOG_WARN("[Dispatcher] max_timeout_ms " << config_.max_timeout_ms << " clamped to "
                                                << invocation::kMaxTimeoutMs);
        config_.max_timeout_ms = invocation::kMaxTimeoutMs;
    }
    config_.default_timeout_ms = std::min(config_.default_timeout_ms, config_.max_timeout_ms);
}

std::string Dispatcher::next_correlation_id() {
    return instance_tag_ + "-" + std::to_string(next_sequence_.fetch_add(1));
}

DescribeResult Dispatcher::describe(const RequestContext &ctx, const std::optional<std::string> &device_id,
                                    const std::vector<capability::Capability> &capabilities) {
    DescribeResult result;

    if (!is_node(ctx)) {
        result.error = ErrorKind::UNAUTHORIZED;
        result.error_message = "Role '" + ctx.role + "' may not declare capabilities";
        LOG_WARN("[Dispatcher] describe from " << ctx.conn_id << " rejected: " << result.error_message);
        return result;
    }

    if (device_id.has_value() && device_id->empty()) {
        result.error = ErrorKind::INVALID_CAPABILITY_LIST;
        result.error_message = "device_id must not be empty";
        return result;
    }

    capability::CapabilitySet set;
    for (const auto &cap : capabilities) {
        if (cap.service.empty() || cap.method.empty()) {
            result.error = ErrorKind::INVALID_CAPABILITY_LIST;
            result.error_message = "Capability with empty service or method name";
            return result;
        }
        set.insert(cap);
    }

    auto connection = connections_.get(ctx.conn_id);
    if (!connection || !connection->is_open()) {
        result.error = ErrorKind::DEVICE_DISCONNECTED;
        result.error_message = "Connection closed: " + ctx.conn_id;
        return result;
    }

    auto previous_owner = capabilities_.register_capabilities(ctx.conn_id, device_id, std::move(set));

    // A disconnect may have purged this connection while we were registering
    if (!connection->is_open() || !connections_.get(ctx.conn_id)) {
        capabilities_.revert_registration(ctx.conn_id, device_id, previous_owner);
        result.error = ErrorKind::DEVICE_DISCONNECTED;
        result.error_message = "Connection closed: " + ctx.conn_id;
        return result;
    }

    auto registered = capabilities_.get(ctx.conn_id);
    if (registered) {
        result.registered_services = registered->services();
    }
    result.success = true;

    LOG_INFO("[Dispatcher] " << ctx.conn_id << " described " << capabilities.size() << " capabilities"
                             << (device_id ? " as device " + *device_id : std::string()));
    return result;
}

invocation::InvocationOutcome Dispatcher::invoke(const RequestContext &ctx, const InvokeParams &params) {
    using invocation::InvocationOutcome;

    if (params.service.empty() || params.method.empty()) {
        return InvocationOutcome::failure(ErrorKind::INVALID_PARAMS, "service and method must be non-empty");
    }

    int64_t timeout_ms = params.timeout_ms.value_or(config_.default_timeout_ms);
    if (timeout_ms < 1 || timeout_ms > config_.max_timeout_ms) {
        return InvocationOutcome::failure(ErrorKind::INVALID_TIMEOUT,
                                          "timeout_ms must be between 1 and " +
                                              std::to_string(config_.max_timeout_ms) + ", got " +
                                              std::to_string(timeout_ms));
    }

    if (params.device_id.has_value() && params.device_id->empty()) {
        return InvocationOutcome::failure(ErrorKind::INVALID_PARAMS, "device_id must not be empty");
    }

    auto route = resolver_.resolve(params.service, params.device_id);
    if (!route) {
        std::string message = "No connection provides service '" + params.service + "'";
        if (params.device_id) {
            message += " for device " + *params.device_id;
        }
        LOG_WARN("[Dispatcher] " << message);
        return InvocationOutcome::failure(ErrorKind::SERVICE_UNAVAILABLE, message);
    }

    auto target = capabilities_.get(route->conn_id);
    if (!target) {
        // Removed between resolution and this check
        return InvocationOutcome::failure(ErrorKind::SERVICE_UNAVAILABLE,
                                          "No connection provides service '" + params.service + "'");
    }
    if (!target->advertises(params.service, params.method)) {
        return InvocationOutcome::failure(ErrorKind::METHOD_UNSUPPORTED,
                                          "Method '" + params.method + "' not supported by service '" +
                                              params.service + "' on " + route->conn_id);
    }

    const std::string correlation_id = next_correlation_id();
    auto waiter = invocations_.create(correlation_id, route->conn_id, ctx.conn_id,
                                      std::chrono::milliseconds(timeout_ms));
    if (!waiter) {
        return InvocationOutcome::failure(ErrorKind::DUPLICATE_CORRELATION_ID,
                                          "Correlation id already in use: " + correlation_id);
    }

    nlohmann::json forward_params = {{"correlation_id", correlation_id},
                                     {"service", params.service},
                                     {"method", params.method},
                                     {"params", params.params},
                                     {"timeout_ms", timeout_ms}};
    const std::string frame = make_request(correlation_id, kMethodInvoke, std::move(forward_params)).dump();

    LOG_DEBUG("[Dispatcher] " << correlation_id << ": " << params.service << "." << params.method << " -> "
                              << route->conn_id << " via " << routing::route_source_to_string(route->source));

    auto connection = connections_.get(route->conn_id);
    if (!connection || !connection->send(frame)) {
        if (!connection || !connection->is_open()) {
            invocations_.complete(correlation_id, InvocationOutcome::failure(ErrorKind::DEVICE_DISCONNECTED,
                                                                             "Device disconnected: " + route->conn_id));
        } else {
            std::string message = "Could not deliver request to " + route->conn_id;
            LOG_WARN("[Dispatcher] " << correlation_id << ": " << message);
            invocations_.complete(correlation_id,
                                  InvocationOutcome::failure(ErrorKind::DEVICE_UNREACHABLE, message));
        }
    }

    auto outcome = waiter->wait();
    if (!outcome.success) {
        LOG_DEBUG("[Dispatcher] " << correlation_id << " failed: " << error_kind_to_string(outcome.error) << " - "
                                  << outcome.error_message);
    }
    return outcome;
}

bool Dispatcher::handle_response(const RequestContext &ctx, const Frame &frame) {
    using invocation::InvocationOutcome;

    InvocationOutcome outcome;
    if (frame.error.has_value()) {
        const auto &device_error = *frame.error;
        std::string message = device_error.message.empty() ? "Device returned an error" : device_error.message;
        outcome = InvocationOutcome::failure(ErrorKind::DEVICE_ERROR, message,
                                             {{"device_error", describe_device_error(device_error)}});
    } else {
        outcome = InvocationOutcome::ok(frame.result);
    }

    if (!invocations_.complete(frame.correlation_id, std::move(outcome), ctx.conn_id)) {
        LOG_DEBUG("[Dispatcher] Dropped response " << frame.correlation_id << " from " << ctx.conn_id);
        return false;
    }
    return true;
}

std::optional<std::string> Dispatcher::handle_frame(const RequestContext &ctx, const std::string &text) {
    Frame frame;
    RpcError error;
    nlohmann::json error_id;
    if (!parse_frame(text, frame, error, error_id)) {
        LOG_WARN("[Dispatcher] Bad frame from " << ctx.conn_id << ": " << error.message);
        return make_error(error_id, error.code, error.message).dump();
    }

    if (frame.type == FrameType::RESPONSE) {
        handle_response(ctx, frame);
        return std::nullopt;
    }

    if (frame.type == FrameType::NOTIFICATION) {
        // Only describe has an effect without a reply channel
        if (frame.method == kMethodDescribe) {
            handle_describe(ctx, frame);
        } else {
            LOG_DEBUG("[Dispatcher] Ignoring notification '" << frame.method << "' from " << ctx.conn_id);
        }
        return std::nullopt;
    }

    nlohmann::json response;
    if (frame.method == kMethodDescribe) {
        response = handle_describe(ctx, frame);
    } else if (frame.method == kMethodInvoke) {
        response = handle_invoke(ctx, frame);
    } else {
        response = make_error(frame.id, error_codes::METHOD_NOT_FOUND, "Method not found: " + frame.method);
    }
    return response.dump();
}

nlohmann::json Dispatcher::handle_describe(const RequestContext &ctx, const Frame &frame) {
    if (!is_node(ctx)) {
        return make_error(frame.id, ErrorKind::UNAUTHORIZED, "Role '" + ctx.role + "' may not declare capabilities");
    }

    DescribeParams params;
    ErrorKind kind = ErrorKind::NONE;
    std::string error;
    if (!decode_describe_params(frame.params, params, kind, error)) {
        LOG_WARN("[Dispatcher] describe from " << ctx.conn_id << " rejected: " << error);
        return make_error(frame.id, kind, error);
    }

    auto result = describe(ctx, params.device_id, params.capabilities);
    if (!result.success) {
        return make_error(frame.id, result.error, result.error_message);
    }
    return make_result(frame.id, {{"accepted", true}, {"registered_services", result.registered_services}});
}

nlohmann::json Dispatcher::handle_invoke(const RequestContext &ctx, const Frame &frame) {
    InvokeParams params;
    ErrorKind kind = ErrorKind::NONE;
    std::string error;
    if (!decode_invoke_params(frame.params, params, kind, error)) {
        return make_error(frame.id, kind, error);
    }

    auto outcome = invoke(ctx, params);
    if (!outcome.success) {
        return make_error(frame.id, outcome.error, outcome.error_message, outcome.error_data);
    }
    return make_result(frame.id, outcome.result);
}

}  // namespace rpc
}  // namespace nodegate
