#pragma once

#include "agentlink/clock.hpp"
#include "agentlink/data/action_store.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace agentlink::data {

/// Delivers one action. Returns false if it could not be sent.
using DispatchSink = std::function<bool(const PendingAction &)>;

struct ProcessResult {
    size_t dispatched = 0;
    size_t expired = 0;
    size_t remaining = 0;
};

/// Durable FIFO of permission decisions made while disconnected.
/// Every mutation is persisted through the ActionStore. process_queue()
/// replays entries in insertion order and drops those older than the TTL,
/// since the server has already timed out the request behind them.
///
/// The sink runs with the queue lock held and must not call back into the queue.
class OfflineActionQueue {
  public:
    static constexpr std::chrono::seconds kDefaultTtl{120};

    OfflineActionQueue(ActionStore &store, const Clock &clock,
                       const ConnectivityProvider &connectivity, DispatchSink sink,
                       std::chrono::seconds ttl = kDefaultTtl);

    /// Append a decision with a fresh id and the current time, then persist.
    /// If the store throws, the error propagates and the queue is unchanged.
    PendingAction queue_approval(const std::string &request_id, bool approved);

    /// Remove every entry for `request_id`. No-op if none. Like
    /// queue_approval(), a failed save leaves the queue unchanged.
    void remove_action(const std::string &request_id);

    void clear_all();

    /// Replay the queue. Does nothing (no I/O) if offline when called.
    ProcessResult process_queue();

    [[nodiscard]] std::vector<PendingAction> pending_actions() const;
    [[nodiscard]] size_t pending_count() const;
    [[nodiscard]] bool has_pending() const { return pending_count() > 0; }

    [[nodiscard]] std::chrono::seconds ttl() const { return ttl_; }

  private:
    bool is_expired(const PendingAction &action, TimePoint now) const {
        return now - action.timestamp > ttl_;
    }

    ActionStore &store_;
    const Clock &clock_;
    const ConnectivityProvider &connectivity_;
    DispatchSink sink_;
    std::chrono::seconds ttl_;

    mutable std::mutex mutex_;
    std::vector<PendingAction> actions_;
};

} // namespace agentlink::data
