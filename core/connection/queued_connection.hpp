#pragma once

/**
 * @file queued_connection.hpp
 * @brief IConnection backed by a bounded outbound frame queue
 *
 * Used by the HTTP long-poll transport:
 * - send() is called from dispatcher threads and never blocks
 * - pop_frames() is called from the poll handler and blocks up to wait_ms
 *
 * Unlike a telemetry queue, a full queue does not drop old frames: an invocation
 * request that is silently dropped would only surface as a timeout, so send()
 * refuses instead and the invocation fails as DeviceUnreachable right away.
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

#include "i_connection.hpp"

namespace nodegate {
namespace connection {

class QueuedConnection : public IConnection {
public:
    QueuedConnection(std::string conn_id, std::string role, size_t max_queue_size);
    ~QueuedConnection() override = default;

    QueuedConnection(const QueuedConnection &) = delete;
    QueuedConnection &operator=(const QueuedConnection &) = delete;

    const std::string &conn_id() const override { return conn_id_; }
    const std::string &role() const override { return role_; }

    bool send(const std::string &frame) override;
    bool is_open() const override { return !closed_.load(std::memory_order_acquire); }
    void close() override;

    /**
     * @brief Drain queued frames (consumer side)
     *
     * Blocks until at least one frame is queued, the connection is closed, or
     * wait_ms elapses. Returns at most max_frames frames (0 = no limit).
     */
    std::vector<std::string> pop_frames(int wait_ms, size_t max_frames = 0);

    size_t queued() const;
    size_t rejected_count() const { return rejected_count_.load(); }

    // Peer activity: polls and inbound frames. Outbound sends do not count.
    void touch();
    std::chrono::steady_clock::time_point last_activity() const;

private:
    const std::string conn_id_;
    const std::string role_;
    const size_t max_queue_size_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::string> queue_;
    std::chrono::steady_clock::time_point last_activity_;

    std::atomic<bool> closed_{false};
    std::atomic<size_t> rejected_count_{0};
};

}  // namespace connection
}  // namespace nodegate
