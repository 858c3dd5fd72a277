#include "queued_connection.hpp"

#include "logging/logger.hpp"

namespace nodegate {
namespace connection {

QueuedConnection::QueuedConnection(std::string conn_id, std::string role, size_t max_queue_size)
    : conn_id_(std::move(conn_id)),
      role_(std::move(role)),
      max_queue_size_(max_queue_size),
      last_activity_(std::chrono::steady_clock::now()) {}

bool QueuedConnection::send(const std::string &frame) {
    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (closed_.load(std::memory_order_acquire)) {
            return false;
        }

        if (queue_.size() >= max_queue_size_) {
            size_t rejected = ++rejected_count_;
            // Log periodically, a stuck poller would otherwise flood the log
            if (rejected % 100 == 1) {
                LOG_WARN("[Connection] Outbound queue full for " << conn_id_ << ", rejected " << rejected
                                                                 << " frames total");
            }
            return false;
        }

        queue_.push_back(frame);
    }
    cv_.notify_one();
    return true;
}

void QueuedConnection::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_.store(true, std::memory_order_release);
        queue_.clear();
    }
    cv_.notify_all();
}

std::vector<std::string> QueuedConnection::pop_frames(int wait_ms, size_t max_frames) {
    std::unique_lock<std::mutex> lock(mutex_);
    last_activity_ = std::chrono::steady_clock::now();

    if (wait_ms > 0) {
        cv_.wait_for(lock, std::chrono::milliseconds(wait_ms),
                     [this] { return !queue_.empty() || closed_.load(std::memory_order_acquire); });
    }

    last_activity_ = std::chrono::steady_clock::now();

    std::vector<std::string> frames;
    while (!queue_.empty() && (max_frames == 0 || frames.size() < max_frames)) {
        frames.push_back(std::move(queue_.front()));
        queue_.pop_front();
    }
    return frames;
}

void QueuedConnection::touch() {
    std::lock_guard<std::mutex> lock(mutex_);
    last_activity_ = std::chrono::steady_clock::now();
}

size_t QueuedConnection::queued() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

std::chrono::steady_clock::time_point QueuedConnection::last_activity() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_activity_;
}

}  // namespace connection
}  // namespace nodegate
