#include "agentlink/data/offline_queue.hpp"

#include "agentlink/data/uuid.hpp"

#include <algorithm>
#include <cstdio>

namespace agentlink::data {

OfflineActionQueue::OfflineActionQueue(ActionStore &store, const Clock &clock,
                                       const ConnectivityProvider &connectivity,
                                       DispatchSink sink, std::chrono::seconds ttl)
    : store_(store), clock_(clock), connectivity_(connectivity), sink_(std::move(sink)),
      ttl_(ttl), actions_(store_.load()) {
    if (!actions_.empty()) {
        std::printf("[OfflineQueue] Restored %zu pending action(s)\n", actions_.size());
    }
}

PendingAction OfflineActionQueue::queue_approval(const std::string &request_id, bool approved) {
    PendingAction action{make_uuid(), request_id, approved, clock_.now()};

    std::lock_guard<std::mutex> lock(mutex_);
    // Memory changes only once the store has accepted the new list.
    auto updated = actions_;
    updated.push_back(action);
    store_.save(updated);
    actions_ = std::move(updated);
    std::printf("[OfflineQueue] Queued %s for %s (%zu pending)\n",
                approved ? "approval" : "denial", request_id.c_str(), actions_.size());
    return action;
}

void OfflineActionQueue::remove_action(const std::string &request_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto updated = actions_;
    auto it = std::remove_if(updated.begin(), updated.end(), [&](const PendingAction &a) {
        return a.request_id == request_id;
    });
    if (it == updated.end()) {
        return;
    }
    updated.erase(it, updated.end());
    store_.save(updated);
    actions_ = std::move(updated);
}

void OfflineActionQueue::clear_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    store_.save({});
    actions_.clear();
}

ProcessResult OfflineActionQueue::process_queue() {
    std::lock_guard<std::mutex> lock(mutex_);

    ProcessResult result;
    if (!connectivity_.is_connected()) {
        result.remaining = actions_.size();
        return result;
    }

    const TimePoint now = clock_.now();
    std::vector<PendingAction> remaining;
    remaining.reserve(actions_.size());

    size_t i = 0;
    for (; i < actions_.size(); ++i) {
        const auto &action = actions_[i];
        if (is_expired(action, now)) {
            ++result.expired;
            continue;
        }
        if (!connectivity_.is_connected()) {
            break;
        }
        if (!sink_ || !sink_(action)) {
            std::fprintf(stderr, "[OfflineQueue] Dispatch failed for %s, keeping for next pass\n",
                         action.request_id.c_str());
            break;
        }
        ++result.dispatched;
    }
    for (; i < actions_.size(); ++i) {
        remaining.push_back(actions_[i]);
    }

    if (result.dispatched > 0 || result.expired > 0) {
        // Dispatched actions are gone whether or not the save lands.
        actions_ = std::move(remaining);
        store_.save(actions_);
    }
    result.remaining = actions_.size();

    if (result.dispatched > 0 || result.expired > 0) {
        std::printf("[OfflineQueue] Processed: %zu sent, %zu expired, %zu remaining\n",
                    result.dispatched, result.expired, result.remaining);
    }
    return result;
}

std::vector<PendingAction> OfflineActionQueue::pending_actions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return actions_;
}

size_t OfflineActionQueue::pending_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return actions_.size();
}

} // namespace agentlink::data
