#pragma once

#include <optional>
#include <string>

#include "capability/capability_store.hpp"

namespace nodegate {
namespace routing {

// How a target connection was found
enum class RouteSource {
    DEVICE_INDEX,       // device_id was indexed (fast path)
    FALLBACK_REPAIRED,  // device_id not indexed, found by service scan, index repaired
    SERVICE_SCAN        // no device_id given, first connection advertising the service
};

struct Route {
    std::string conn_id;
    RouteSource source;
};

const char *route_source_to_string(RouteSource source);

// RoutingResolver - picks the connection that receives a node.invoke
class RoutingResolver {
public:
    explicit RoutingResolver(capability::CapabilityStore &store);

    std::optional<Route> resolve(const std::string &service, const std::optional<std::string> &device_id);

    // Connection id only
    std::optional<std::string> resolve_target(const std::string &service, const std::optional<std::string> &device_id);

private:
    capability::CapabilityStore &store_;
};

}  // namespace routing
}  // namespace nodegate
