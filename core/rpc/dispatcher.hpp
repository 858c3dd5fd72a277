#ifndef NODEGATE_RPC_DISPATCHER_HPP
#define NODEGATE_RPC_DISPATCHER_HPP

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "capability/capability_store.hpp"
#include "connection/connection_registry.hpp"
#include "errors.hpp"
#include "invocation/pending_invocations.hpp"
#include "json_rpc.hpp"
#include "routing/routing_resolver.hpp"

namespace nodegate {
namespace rpc {

// Only connections authenticated with this role may declare capabilities
constexpr const char *kNodeRole = "node";

// Who sent a frame, as established by the transport
struct RequestContext {
    std::string conn_id;
    std::string role;
};

struct DispatcherConfig {
    int64_t default_timeout_ms = 10000;
    int64_t max_timeout_ms = 30000;
};

struct DescribeResult {
    bool success = false;
    ErrorKind error = ErrorKind::NONE;
    std::string error_message;
    std::vector<std::string> registered_services;
};

// Dispatcher - entry point for every inbound JSON-RPC frame
/**
 * node.describe  registers the caller's capabilities
 * node.invoke    routes a call to a device and blocks until it is resolved
 * responses      complete the matching pending invocation
 *
 * handle_frame() may be called concurrently from any number of transport
 * threads. invoke() is the only call that blocks, and it never holds a lock
 * while sending or waiting.
 */
class Dispatcher {
public:
    Dispatcher(capability::CapabilityStore &capabilities, invocation::PendingInvocationTable &invocations,
               connection::ConnectionRegistry &connections, DispatcherConfig config = DispatcherConfig());

    Dispatcher(const Dispatcher &) = delete;
    Dispatcher &operator=(const Dispatcher &) = delete;

    DescribeResult describe(const RequestContext &ctx, const std::optional<std::string> &device_id,
                            const std::vector<capability::Capability> &capabilities);

    invocation::InvocationOutcome invoke(const RequestContext &ctx, const InvokeParams &params);

    // Returns true if the response resolved a pending invocation
    bool handle_response(const RequestContext &ctx, const Frame &frame);

    // Returns the response text, or nullopt when no reply is due (device responses, notifications)
    std::optional<std::string> handle_frame(const RequestContext &ctx, const std::string &text);

    std::string next_correlation_id();

    const std::string &instance_tag() const { return instance_tag_; }
    const DispatcherConfig &config() const { return config_; }

private:
    capability::CapabilityStore &capabilities_;
    invocation::PendingInvocationTable &invocations_;
    connection::ConnectionRegistry &connections_;
    routing::RoutingResolver resolver_;
    DispatcherConfig config_;

    std::string instance_tag_;
    std::atomic<uint64_t> next_sequence_{1};

    static bool is_node(const RequestContext &ctx) { return ctx.role == kNodeRole; }

    nlohmann::json handle_describe(const RequestContext &ctx, const Frame &frame);
    nlohmann::json handle_invoke(const RequestContext &ctx, const Frame &frame);
};

}  // namespace rpc
}  // namespace nodegate

#endif  // NODEGATE_RPC_DISPATCHER_HPP
