#pragma once

/**
 * @file pending_invocations.hpp
 * @brief In-flight node.invoke calls awaiting a device response
 *
 * Each entry is resolved exactly once, by whichever of these happens first:
 * - complete()                 matching response frame from the target
 * - expire() / expire_overdue() deadline elapsed
 * - fail_all_for_connection()  target connection dropped
 * - cancel_all_for_caller()    caller connection dropped
 *
 * Resolution rule: a consumer must erase the entry from the table under mutex_.
 * Only the thread that erased it fulfils the promise, so two outcomes can never
 * be delivered. Promises are fulfilled after the lock is released.
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <unordered_map>
#include <vector>

#include "rpc/errors.hpp"

namespace nodegate {
namespace invocation {

using Clock = std::chrono::steady_clock;

// Longest accepted invocation timeout (24h). Keeps now() + timeout far from overflow.
constexpr int64_t kMaxTimeoutMs = 24LL * 60 * 60 * 1000;

struct InvocationOutcome {
    bool success = false;
    nlohmann::json result;  // device payload on success
    rpc::ErrorKind error = rpc::ErrorKind::NONE;
    std::string error_message;
    nlohmann::json error_data;  // optional extra detail (device error object)

    static InvocationOutcome ok(nlohmann::json result);
    static InvocationOutcome failure(rpc::ErrorKind kind, std::string message,
                                     nlohmann::json data = nlohmann::json());
};

class PendingInvocationTable;

/**
 * @brief Caller-side handle for one pending invocation
 *
 * wait() blocks until the entry is resolved. When the deadline passes first it
 * expires the entry itself, so wait() never blocks past the deadline by more
 * than the time another resolver needs to publish its outcome.
 */
class InvocationWaiter {
public:
    InvocationWaiter(PendingInvocationTable &table, std::string correlation_id, Clock::time_point deadline,
                     std::future<InvocationOutcome> future);

    InvocationWaiter(const InvocationWaiter &) = delete;
    InvocationWaiter &operator=(const InvocationWaiter &) = delete;

    const std::string &correlation_id() const { return correlation_id_; }
    Clock::time_point deadline() const { return deadline_; }

    InvocationOutcome wait();

private:
    PendingInvocationTable &table_;
    std::string correlation_id_;
    Clock::time_point deadline_;
    std::future<InvocationOutcome> future_;
};

class PendingInvocationTable {
public:
    PendingInvocationTable() = default;

    PendingInvocationTable(const PendingInvocationTable &) = delete;
    PendingInvocationTable &operator=(const PendingInvocationTable &) = delete;

    // Returns nullptr if correlation_id is already pending (DuplicateCorrelationId).
    // timeout is clamped to kMaxTimeoutMs.
    std::unique_ptr<InvocationWaiter> create(const std::string &correlation_id, const std::string &target_conn_id,
                                             const std::string &caller_conn_id, std::chrono::milliseconds timeout);

    // Deliver a response. A non-empty responder_conn_id must match the entry's target,
    // otherwise the response is rejected and the entry stays pending.
    bool complete(const std::string &correlation_id, InvocationOutcome outcome,
                  const std::string &responder_conn_id = "");

    bool expire(const std::string &correlation_id);
    size_t expire_overdue();

    size_t fail_all_for_connection(const std::string &conn_id, rpc::ErrorKind kind, const std::string &message);
    size_t cancel_all_for_caller(const std::string &conn_id);

    size_t size() const;
    bool contains(const std::string &correlation_id) const;

private:
    struct Entry {
        std::string target_conn_id;
        std::string caller_conn_id;
        Clock::time_point deadline;
        std::chrono::milliseconds timeout;
        std::promise<InvocationOutcome> promise;
    };

    // Erase every entry matching pred under the lock, returning the promises to fulfil
    template <typename Pred>
    std::vector<std::pair<std::string, std::promise<InvocationOutcome>>> take_if(Pred pred);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
};

}  // namespace invocation
}  // namespace nodegate
