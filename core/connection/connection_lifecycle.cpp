#include "connection_lifecycle.hpp"

#include "logging/logger.hpp"

namespace nodegate {
namespace connection {

ConnectionLifecycle::ConnectionLifecycle(ConnectionRegistry &connections, capability::CapabilityStore &capabilities,
                                         invocation::PendingInvocationTable &invocations)
    : connections_(connections), capabilities_(capabilities), invocations_(invocations) {}

void ConnectionLifecycle::on_connect(std::shared_ptr<IConnection> connection) {
    if (!connection) {
        return;
    }
    LOG_INFO("[Lifecycle] Connected: " << connection->conn_id() << " (role " << connection->role() << ", "
                                       << connections_.count() + 1 << " total)");
    connections_.add(std::move(connection));
}

void ConnectionLifecycle::on_disconnect(const std::string &conn_id) {
    // Closed first so an invoke that resolved this connection just before
    // the purge fails its send instead of waiting out the timeout
    auto connection = connections_.remove(conn_id);
    if (connection) {
        connection->close();
    }

    capabilities_.remove(conn_id);

    size_t failed = invocations_.fail_all_for_connection(conn_id, rpc::ErrorKind::DEVICE_DISCONNECTED,
                                                         "Device disconnected: " + conn_id);
    size_t cancelled = invocations_.cancel_all_for_caller(conn_id);

    LOG_INFO("[Lifecycle] Disconnected: " << conn_id << " (" << failed << " invocations failed, " << cancelled
                                          << " cancelled, " << connections_.count() << " remaining)");
}

}  // namespace connection
}  // namespace nodegate
