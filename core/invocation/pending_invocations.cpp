#include "pending_invocations.hpp"

#include <algorithm>
#include <utility>

#include "logging/logger.hpp"

namespace nodegate {
namespace invocation {

InvocationOutcome InvocationOutcome::ok(nlohmann::json result) {
    InvocationOutcome outcome;
    outcome.success = true;
    outcome.result = std::move(result);
    return outcome;
}

InvocationOutcome InvocationOutcome::failure(rpc::ErrorKind kind, std::string message, nlohmann::json data) {
    InvocationOutcome outcome;
    outcome.success = false;
    outcome.error = kind;
    outcome.error_message = std::move(message);
    outcome.error_data = std::move(data);
    return outcome;
}

InvocationWaiter::InvocationWaiter(PendingInvocationTable &table, std::string correlation_id,
                                   Clock::time_point deadline, std::future<InvocationOutcome> future)
    : table_(table), correlation_id_(std::move(correlation_id)), deadline_(deadline), future_(std::move(future)) {}

InvocationOutcome InvocationWaiter::wait() {
    if (future_.wait_until(deadline_) == std::future_status::timeout) {
        // Losing this race is fine: the winner has erased the entry and is about to publish
        table_.expire(correlation_id_);
    }
    return future_.get();
}

template <typename Pred>
std::vector<std::pair<std::string, std::promise<InvocationOutcome>>> PendingInvocationTable::take_if(Pred pred) {
    std::vector<std::pair<std::string, std::promise<InvocationOutcome>>> taken;

    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (pred(it->first, it->second)) {
            taken.emplace_back(it->first, std::move(it->second.promise));
            it = entries_.erase(it);
        } else {
            ++it;
        }
    }
    return taken;
}

std::unique_ptr<InvocationWaiter> PendingInvocationTable::create(const std::string &correlation_id,
                                                                 const std::string &target_conn_id,
                                                                 const std::string &caller_conn_id,
                                                                 std::chrono::milliseconds timeout) {
    timeout = std::min(timeout, std::chrono::milliseconds(kMaxTimeoutMs));
    auto deadline = Clock::now() + timeout;
    std::future<InvocationOutcome> future;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (entries_.find(correlation_id) != entries_.end()) {
            LOG_ERROR("[Invocations] Duplicate correlation id: " << correlation_id);
            return nullptr;
        }

        Entry entry;
        entry.target_conn_id = target_conn_id;
        entry.caller_conn_id = caller_conn_id;
        entry.deadline = deadline;
        entry.timeout = timeout;
        future = entry.promise.get_future();
        entries_.emplace(correlation_id, std::move(entry));
    }

    LOG_DEBUG("[Invocations] Pending " << correlation_id << " -> " << target_conn_id << " (" << timeout.count()
                                       << "ms)");
    return std::make_unique<InvocationWaiter>(*this, correlation_id, deadline, std::move(future));
}

bool PendingInvocationTable::complete(const std::string &correlation_id, InvocationOutcome outcome,
                                      const std::string &responder_conn_id) {
    std::promise<InvocationOutcome> promise;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(correlation_id);
        if (it == entries_.end()) {
            LOG_DEBUG("[Invocations] No pending entry for " << correlation_id << " (late or unknown response)");
            return false;
        }
        if (!responder_conn_id.empty() && it->second.target_conn_id != responder_conn_id) {
            LOG_WARN("[Invocations] Response for " << correlation_id << " from " << responder_conn_id
                                                   << " rejected (expected " << it->second.target_conn_id << ")");
            return false;
        }
        promise = std::move(it->second.promise);
        entries_.erase(it);
    }

    promise.set_value(std::move(outcome));
    return true;
}

bool PendingInvocationTable::expire(const std::string &correlation_id) {
    std::promise<InvocationOutcome> promise;
    std::chrono::milliseconds timeout{0};

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(correlation_id);
        if (it == entries_.end()) {
            return false;
        }
        timeout = it->second.timeout;
        promise = std::move(it->second.promise);
        entries_.erase(it);
    }

    LOG_WARN("[Invocations] " << correlation_id << " timed out after " << timeout.count() << "ms");
    promise.set_value(InvocationOutcome::failure(
        rpc::ErrorKind::TIMEOUT, "Device did not respond within " + std::to_string(timeout.count()) + "ms"));
    return true;
}

size_t PendingInvocationTable::expire_overdue() {
    auto now = Clock::now();
    std::vector<std::pair<std::string, std::chrono::milliseconds>> timeouts;

    auto taken = take_if([&now, &timeouts](const std::string &id, const Entry &entry) {
        if (entry.deadline <= now) {
            timeouts.emplace_back(id, entry.timeout);
            return true;
        }
        return false;
    });

    for (size_t i = 0; i < taken.size(); ++i) {
        const auto &timeout = timeouts[i].second;
        LOG_WARN("[Invocations] " << taken[i].first << " expired by reaper after " << timeout.count() << "ms");
        taken[i].second.set_value(InvocationOutcome::failure(
            rpc::ErrorKind::TIMEOUT, "Device did not respond within " + std::to_string(timeout.count()) + "ms"));
    }
    return taken.size();
}

size_t PendingInvocationTable::fail_all_for_connection(const std::string &conn_id, rpc::ErrorKind kind,
                                                       const std::string &message) {
    auto taken = take_if(
        [&conn_id](const std::string &, const Entry &entry) { return entry.target_conn_id == conn_id; });

    for (auto &item : taken) {
        item.second.set_value(InvocationOutcome::failure(kind, message));
    }

    if (!taken.empty()) {
        LOG_INFO("[Invocations] Failed " << taken.size() << " pending invocation(s) targeting " << conn_id << ": "
                                         << rpc::error_kind_to_string(kind));
    }
    return taken.size();
}

size_t PendingInvocationTable::cancel_all_for_caller(const std::string &conn_id) {
    auto taken = take_if(
        [&conn_id](const std::string &, const Entry &entry) { return entry.caller_conn_id == conn_id; });

    for (auto &item : taken) {
        item.second.set_value(InvocationOutcome::failure(rpc::ErrorKind::CANCELLED, "Caller disconnected"));
    }

    if (!taken.empty()) {
        LOG_INFO("[Invocations] Abandoned " << taken.size() << " pending invocation(s) from " << conn_id);
    }
    return taken.size();
}

size_t PendingInvocationTable::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

bool PendingInvocationTable::contains(const std::string &correlation_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.find(correlation_id) != entries_.end();
}

}  // namespace invocation
}  // namespace nodegate
