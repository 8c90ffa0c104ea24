#include "agentlink/protocol/scheduler.hpp"

#include <cstdio>
#include <exception>

namespace agentlink::protocol {

ThreadScheduler::ThreadScheduler() : worker_([this] { run(); }) {}

ThreadScheduler::~ThreadScheduler() { shutdown(); }

TimerId ThreadScheduler::schedule(std::chrono::milliseconds delay, std::function<void()> task) {
    std::lock_guard<std::mutex> lock(mutex_);
    const TimerId id = next_id_++;
    if (stopping_) {
        return id;
    }
    timers_.emplace(std::make_pair(std::chrono::steady_clock::now() + delay, id), std::move(task));
    cv_.notify_one();
    return id;
}

void ThreadScheduler::cancel(TimerId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = timers_.begin(); it != timers_.end(); ++it) {
        if (it->first.second == id) {
            timers_.erase(it);
            cv_.notify_one();
            return;
        }
    }
}

void ThreadScheduler::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
        timers_.clear();
    }
    cv_.notify_all();
    if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
        worker_.join();
    }
}

void ThreadScheduler::run() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stopping_) {
        if (timers_.empty()) {
            cv_.wait(lock);
            continue;
        }
        auto due = timers_.begin()->first.first;
        if (std::chrono::steady_clock::now() < due) {
            cv_.wait_until(lock, due);
            continue;
        }
        auto task = std::move(timers_.begin()->second);
        timers_.erase(timers_.begin());

        lock.unlock();
        try {
            task();
        } catch (const std::exception &e) {
            std::fprintf(stderr, "[Scheduler] Task failed: %s\n", e.what());
        }
        lock.lock();
    }
}

} // namespace agentlink::protocol
