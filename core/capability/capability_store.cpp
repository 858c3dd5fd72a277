#include "capability_store.hpp"

#include <algorithm>
#include <mutex>

#include "logging/logger.hpp"

namespace nodegate {
namespace capability {

bool ConnectionCapabilities::advertises_service(const std::string &service) const {
    auto it = capabilities.lower_bound(Capability{service, ""});
    return it != capabilities.end() && it->service == service;
}

bool ConnectionCapabilities::advertises(const std::string &service, const std::string &method) const {
    return capabilities.count(Capability{service, method}) > 0;
}

std::vector<std::string> ConnectionCapabilities::services() const {
    std::vector<std::string> result;
    for (const auto &cap : capabilities) {
        if (result.empty() || result.back() != cap.service) {
            result.push_back(cap.service);
        }
    }
    return result;
}

std::optional<std::string> CapabilityStore::register_capabilities(const std::string &conn_id,
                                                                  const std::optional<std::string> &device_id,
                                                                  CapabilitySet capabilities) {
    size_t capability_count = capabilities.size();
    std::optional<std::string> previous_owner;

    {
        std::unique_lock<std::shared_mutex> lock(mutex_);

        auto it = conn_to_index_.find(conn_id);
        if (it == conn_to_index_.end()) {
            ConnectionCapabilities entry;
            entry.conn_id = conn_id;
            entry.capabilities = std::move(capabilities);
            entry.device_id = device_id;
            conn_to_index_[conn_id] = connections_.size();
            connections_.push_back(std::move(entry));
        } else {
            auto &entry = connections_[it->second];

            // A redeclared identity replaces the old one; drop the stale index entry if it is still ours
            if (entry.device_id.has_value() && entry.device_id != device_id) {
                auto dev_it = device_to_conn_.find(*entry.device_id);
                if (dev_it != device_to_conn_.end() && dev_it->second == conn_id) {
                    device_to_conn_.erase(dev_it);
                }
            }

            entry.capabilities = std::move(capabilities);
            entry.device_id = device_id;
        }

        if (device_id.has_value()) {
            auto previous = device_to_conn_.find(*device_id);
            if (previous != device_to_conn_.end() && previous->second != conn_id) {
                previous_owner = previous->second;
                LOG_INFO("[CapabilityStore] Device " << *device_id << " moved from " << previous->second << " to "
                                                     << conn_id);
            }
            device_to_conn_[*device_id] = conn_id;
        }
    }

    LOG_INFO("[CapabilityStore] Registered " << conn_id << " (" << capability_count << " capabilities"
                                             << (device_id ? ", device " + *device_id : std::string()) << ")");
    return previous_owner;
}

void CapabilityStore::revert_registration(const std::string &conn_id, const std::optional<std::string> &device_id,
                                          const std::optional<std::string> &previous_owner) {
    remove(conn_id);

    if (!device_id.has_value() || !previous_owner.has_value()) {
        return;
    }

    bool restored = false;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        if (conn_to_index_.count(*previous_owner) > 0 && device_to_conn_.count(*device_id) == 0) {
            device_to_conn_[*device_id] = *previous_owner;
            restored = true;
        }
    }

    if (restored) {
        LOG_INFO("[CapabilityStore] Device " << *device_id << " returned to " << *previous_owner);
    }
}

bool CapabilityStore::bind_device(const std::string &device_id, const std::string &conn_id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto it = conn_to_index_.find(conn_id);
    if (it == conn_to_index_.end()) {
        return false;
    }

    device_to_conn_[device_id] = conn_id;

    auto &entry = connections_[it->second];
    if (!entry.device_id.has_value()) {
        entry.device_id = device_id;
    }
    return true;
}

std::optional<std::string> CapabilityStore::lookup_by_device(const std::string &device_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    auto it = device_to_conn_.find(device_id);
    if (it == device_to_conn_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<std::string> CapabilityStore::find_connection_advertising(const std::string &service) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    for (const auto &entry : connections_) {
        if (entry.advertises_service(service)) {
            return entry.conn_id;
        }
    }
    return std::nullopt;
}

std::optional<ConnectionCapabilities> CapabilityStore::get(const std::string &conn_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    auto it = conn_to_index_.find(conn_id);
    if (it == conn_to_index_.end()) {
        return std::nullopt;
    }
    return connections_[it->second];
}

std::vector<ConnectionCapabilities> CapabilityStore::get_all() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return connections_;
}

void CapabilityStore::remove(const std::string &conn_id) {
    size_t removed_devices = 0;
    bool removed = false;

    {
        std::unique_lock<std::shared_mutex> lock(mutex_);

        auto it = conn_to_index_.find(conn_id);
        if (it != conn_to_index_.end()) {
            connections_.erase(connections_.begin() + static_cast<std::ptrdiff_t>(it->second));

            // Indices after the erased slot shifted, rebuild
            conn_to_index_.clear();
            for (size_t i = 0; i < connections_.size(); ++i) {
                conn_to_index_[connections_[i].conn_id] = i;
            }
            removed = true;
        }

        size_t before = device_to_conn_.size();
        erase_device_entries_for(conn_id);
        removed_devices = before - device_to_conn_.size();
    }

    if (removed || removed_devices > 0) {
        LOG_INFO("[CapabilityStore] Removed " << conn_id << " (" << removed_devices << " device mappings)");
    }
}

size_t CapabilityStore::connection_count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return connections_.size();
}

size_t CapabilityStore::device_count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return device_to_conn_.size();
}

void CapabilityStore::erase_device_entries_for(const std::string &conn_id) {
    // Value check: a device repointed to a newer connection keeps its mapping
    for (auto it = device_to_conn_.begin(); it != device_to_conn_.end();) {
        if (it->second == conn_id) {
            it = device_to_conn_.erase(it);
        } else {
            ++it;
        }
    }
}

}  // namespace capability
}  // namespace nodegate
