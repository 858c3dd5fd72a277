#include "connection_registry.hpp"

#include <mutex>

namespace nodegate {
namespace connection {

void ConnectionRegistry::add(std::shared_ptr<IConnection> connection) {
    if (!connection) {
        return;
    }
    std::unique_lock<std::shared_mutex> lock(mutex_);
    const std::string id = connection->conn_id();
    connections_[id] = std::move(connection);
}

std::shared_ptr<IConnection> ConnectionRegistry::remove(const std::string &conn_id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto it = connections_.find(conn_id);
    if (it == connections_.end()) {
        return nullptr;
    }
    auto removed = std::move(it->second);
    connections_.erase(it);
    return removed;
}

std::shared_ptr<IConnection> ConnectionRegistry::get(const std::string &conn_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    auto it = connections_.find(conn_id);
    if (it != connections_.end()) {
        return it->second;
    }
    return nullptr;
}

std::vector<std::shared_ptr<IConnection>> ConnectionRegistry::get_all() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    std::vector<std::shared_ptr<IConnection>> result;
    result.reserve(connections_.size());
    for (const auto &[id, connection] : connections_) {
        result.push_back(connection);
    }
    return result;
}

std::vector<std::string> ConnectionRegistry::ids() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    std::vector<std::string> ids;
    ids.reserve(connections_.size());
    for (const auto &[id, connection] : connections_) {
        ids.push_back(id);
    }
    return ids;
}

bool ConnectionRegistry::has(const std::string &conn_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return connections_.find(conn_id) != connections_.end();
}

size_t ConnectionRegistry::count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return connections_.size();
}

void ConnectionRegistry::clear() {
    std::unordered_map<std::string, std::shared_ptr<IConnection>> dropped;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        dropped.swap(connections_);
    }
    // Close outside the lock, close() may wake waiting pollers
    for (auto &[id, connection] : dropped) {
        connection->close();
    }
}

}  // namespace connection
}  // namespace nodegate
