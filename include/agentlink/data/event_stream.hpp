#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace agentlink::data {

using SubscriptionId = uint64_t;

/// Multi-subscriber callback list. Every subscriber sees every published event,
/// in subscription order. Callbacks run on the publishing thread, outside the
/// internal lock, so a callback may subscribe or unsubscribe.
template <typename T> class EventStream {
  public:
    using Callback = std::function<void(const T &)>;

    SubscriptionId subscribe(Callback callback) {
        std::lock_guard<std::mutex> lock(mutex_);
        const SubscriptionId id = next_id_++;
        subscribers_.emplace(id, std::make_shared<Callback>(std::move(callback)));
        return id;
    }

    /// Returns false if `id` was not subscribed.
    bool unsubscribe(SubscriptionId id) {
        std::lock_guard<std::mutex> lock(mutex_);
        return subscribers_.erase(id) > 0;
    }

    void publish(const T &event) const {
        std::vector<std::shared_ptr<Callback>> snapshot;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            snapshot.reserve(subscribers_.size());
            for (const auto &[id, callback] : subscribers_) {
                snapshot.push_back(callback);
            }
        }
        for (const auto &callback : snapshot) {
            (*callback)(event);
        }
    }

    [[nodiscard]] size_t subscriber_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return subscribers_.size();
    }

  private:
    mutable std::mutex mutex_;
    std::map<SubscriptionId, std::shared_ptr<Callback>> subscribers_;
    SubscriptionId next_id_ = 1;
};

} // namespace agentlink::data
