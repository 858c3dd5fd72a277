#pragma once

#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "i_connection.hpp"

namespace nodegate {
namespace connection {

/**
 * @brief Thread-safe registry of live transport connections
 *
 * Maps conn_id to the send handle the dispatcher forwards invocations through.
 * Readers (dispatcher, HTTP handlers) share the lock; the lifecycle hook takes it
 * exclusively on connect/disconnect.
 *
 * get() hands out a shared_ptr, so a handle fetched just before a disconnect stays
 * valid; sending on it simply fails once the connection is closed.
 */
class ConnectionRegistry {
public:
    ConnectionRegistry() = default;
    ~ConnectionRegistry() = default;

    ConnectionRegistry(const ConnectionRegistry &) = delete;
    ConnectionRegistry &operator=(const ConnectionRegistry &) = delete;
    ConnectionRegistry(ConnectionRegistry &&) = delete;
    ConnectionRegistry &operator=(ConnectionRegistry &&) = delete;

    // Add or replace
    void add(std::shared_ptr<IConnection> connection);

    // Returns the removed handle (nullptr if unknown)
    std::shared_ptr<IConnection> remove(const std::string &conn_id);

    std::shared_ptr<IConnection> get(const std::string &conn_id) const;

    /**
     * @brief Snapshot of all connections
     *
     * Returns a copy so callers can iterate while connections come and go.
     */
    std::vector<std::shared_ptr<IConnection>> get_all() const;

    std::vector<std::string> ids() const;
    bool has(const std::string &conn_id) const;
    size_t count() const;

    // Closes and drops every connection (shutdown)
    void clear();

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<IConnection>> connections_;
};

}  // namespace connection
}  // namespace nodegate
