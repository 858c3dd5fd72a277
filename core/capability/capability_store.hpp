#ifndef NODEGATE_CAPABILITY_CAPABILITY_STORE_HPP
#define NODEGATE_CAPABILITY_CAPABILITY_STORE_HPP

#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <tuple>
#include <unordered_map>
#include <vector>

namespace nodegate {
namespace capability {

// A (service, method) pair a device claims to support
struct Capability {
    std::string service;
    std::string method;

    bool operator<(const Capability &other) const {
        return std::tie(service, method) < std::tie(other.service, other.method);
    }
    bool operator==(const Capability &other) const { return service == other.service && method == other.method; }
};

using CapabilitySet = std::set<Capability>;

// Capabilities declared by one live connection (populated from node.describe)
struct ConnectionCapabilities {
    std::string conn_id;
    CapabilitySet capabilities;
    std::optional<std::string> device_id;

    bool advertises_service(const std::string &service) const;
    bool advertises(const std::string &service, const std::string &method) const;

    // Unique service names, sorted
    std::vector<std::string> services() const;
};

// Capability Store - connection -> declared capabilities, device_id -> connection
/**
 * Thread Safety:
 * - One shared_mutex guards both maps together, so register/remove are atomic
 *   with respect to readers (a resolver never sees a half-updated state)
 * - Read methods use shared_lock and do not block each other
 * - Returns by value; snapshots stay valid after the connection is removed
 *
 * Iteration order of find_connection_advertising() and get_all() is the order in
 * which connections first described themselves. Re-describing keeps the slot.
 */
class CapabilityStore {
public:
    CapabilityStore() = default;

    CapabilityStore(const CapabilityStore &) = delete;
    CapabilityStore &operator=(const CapabilityStore &) = delete;

    // Replace the capability set for conn_id. A present device_id is (re)pointed
    // at conn_id unconditionally. Returns the connection device_id pointed at
    // before, when that was a different connection.
    std::optional<std::string> register_capabilities(const std::string &conn_id,
                                                     const std::optional<std::string> &device_id,
                                                     CapabilitySet capabilities);

    // Undo a registration made by a connection that closed meanwhile: removes
    // conn_id and hands device_id back to previous_owner if it is still registered
    // and the device has no other owner.
    void revert_registration(const std::string &conn_id, const std::optional<std::string> &device_id,
                             const std::optional<std::string> &previous_owner);

    // Device-index update only. Returns false (and changes nothing) when conn_id
    // has no live capability entry.
    bool bind_device(const std::string &device_id, const std::string &conn_id);

    std::optional<std::string> lookup_by_device(const std::string &device_id) const;
    std::optional<std::string> find_connection_advertising(const std::string &service) const;

    std::optional<ConnectionCapabilities> get(const std::string &conn_id) const;
    std::vector<ConnectionCapabilities> get_all() const;

    // Idempotent. Device-index entries are dropped only while they still point at conn_id.
    void remove(const std::string &conn_id);

    size_t connection_count() const;
    size_t device_count() const;

private:
    // vector keeps insertion order for deterministic scans, map gives O(1) access
    std::vector<ConnectionCapabilities> connections_;
    std::unordered_map<std::string, size_t> conn_to_index_;
    std::unordered_map<std::string, std::string> device_to_conn_;

    mutable std::shared_mutex mutex_;

    // Not thread-safe, called under unique lock
    void erase_device_entries_for(const std::string &conn_id);
};

}  // namespace capability
}  // namespace nodegate

#endif  // NODEGATE_CAPABILITY_CAPABILITY_STORE_HPP
