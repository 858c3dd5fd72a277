#pragma once

#include <string>

namespace nodegate {
namespace connection {

// Outbound half of a transport connection, as seen by the gateway core
class IConnection {
public:
    virtual ~IConnection() = default;

    virtual const std::string &conn_id() const = 0;

    // Authenticated role handed over by the transport ("node", "operator", ...)
    virtual const std::string &role() const = 0;

    // Queue one text frame for delivery. Returns false if the peer is gone or cannot accept it.
    virtual bool send(const std::string &frame) = 0;

    virtual bool is_open() const = 0;
    virtual void close() = 0;
};

}  // namespace connection
}  // namespace nodegate
