#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <thread>
#include <utility>

namespace agentlink::protocol {

using TimerId = uint64_t;

/// One-shot cancellable timers.
class Scheduler {
  public:
    virtual ~Scheduler() = default;

    /// Run `task` once after `delay`. Returns a non-zero id for cancel().
    virtual TimerId schedule(std::chrono::milliseconds delay, std::function<void()> task) = 0;

    /// Cancel a pending timer. Unknown or already-fired ids are ignored.
    virtual void cancel(TimerId id) = 0;
};

/// Scheduler backed by a single worker thread. Tasks run on the worker.
class ThreadScheduler : public Scheduler {
  public:
    ThreadScheduler();
    ~ThreadScheduler() override;

    ThreadScheduler(const ThreadScheduler &) = delete;
    ThreadScheduler &operator=(const ThreadScheduler &) = delete;

    TimerId schedule(std::chrono::milliseconds delay, std::function<void()> task) override;
    void cancel(TimerId id) override;

    /// Drop pending timers and join the worker. Idempotent.
    void shutdown();

  private:
    using TimePoint = std::chrono::steady_clock::time_point;

    void run();

    std::mutex mutex_;
    std::condition_variable cv_;
    // Ordered by due time, then id so equal deadlines keep submission order.
    std::map<std::pair<TimePoint, TimerId>, std::function<void()>> timers_;
    TimerId next_id_ = 1;
    bool stopping_ = false;
    std::thread worker_;
};

} // namespace agentlink::protocol
