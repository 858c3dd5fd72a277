#include "routing_resolver.hpp"

#include "logging/logger.hpp"

namespace nodegate {
namespace routing {

const char *route_source_to_string(RouteSource source) {
    switch (source) {
        case RouteSource::DEVICE_INDEX:
            return "device_index";
        case RouteSource::FALLBACK_REPAIRED:
            return "fallback_repaired";
        case RouteSource::SERVICE_SCAN:
            return "service_scan";
        default:
            return "unknown";
    }
}

RoutingResolver::RoutingResolver(capability::CapabilityStore &store) : store_(store) {}

std::optional<Route> RoutingResolver::resolve(const std::string &service,
                                              const std::optional<std::string> &device_id) {
    if (!device_id.has_value()) {
        auto conn_id = store_.find_connection_advertising(service);
        if (!conn_id) {
            return std::nullopt;
        }
        return Route{*conn_id, RouteSource::SERVICE_SCAN};
    }

    if (auto conn_id = store_.lookup_by_device(*device_id)) {
        return Route{*conn_id, RouteSource::DEVICE_INDEX};
    }

    // Device never linked (or link lost): fall back to any connection advertising the service
    auto conn_id = store_.find_connection_advertising(service);
    if (!conn_id) {
        LOG_DEBUG("[Router] No route for service '" << service << "' (device " << *device_id << ")");
        return std::nullopt;
    }

    if (store_.bind_device(*device_id, *conn_id)) {
        LOG_INFO("[Router] Repaired device index: " << *device_id << " -> " << *conn_id);
    } else {
        // Connection went away between scan and repair
        LOG_DEBUG("[Router] Fallback target " << *conn_id << " disconnected before repair");
        return std::nullopt;
    }

    return Route{*conn_id, RouteSource::FALLBACK_REPAIRED};
}

std::optional<std::string> RoutingResolver::resolve_target(const std::string &service,
                                                           const std::optional<std::string> &device_id) {
    auto route = resolve(service, device_id);
    if (!route) {
        return std::nullopt;
    }
    return route->conn_id;
}

}  // namespace routing
}  // namespace nodegate
