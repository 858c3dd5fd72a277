#pragma once

#include <memory>
#include <string>

#include "capability/capability_store.hpp"
#include "connection_registry.hpp"
#include "i_connection.hpp"
#include "invocation/pending_invocations.hpp"

namespace nodegate {
namespace connection {

/**
 * @brief Transport connect/disconnect callbacks
 *
 * Keeps the connection registry, capability store and pending-invocation table
 * consistent with the set of live connections. The transport calls each hook
 * exactly once per transition and never concurrently for the same conn_id.
 */
class ConnectionLifecycle {
public:
    ConnectionLifecycle(ConnectionRegistry &connections, capability::CapabilityStore &capabilities,
                        invocation::PendingInvocationTable &invocations);

    // Connections start without capabilities; only the send handle is registered
    void on_connect(std::shared_ptr<IConnection> connection);

    /**
     * Teardown order:
     * 1. drop and close the send handle (late sends to it fail)
     * 2. capability store (no new invocation can resolve to this connection)
     * 3. fail invocations targeting it (DeviceDisconnected)
     * 4. cancel invocations it was waiting on as a caller
     */
    void on_disconnect(const std::string &conn_id);

private:
    ConnectionRegistry &connections_;
    capability::CapabilityStore &capabilities_;
    invocation::PendingInvocationTable &invocations_;
};

}  // namespace connection
}  // namespace nodegate
