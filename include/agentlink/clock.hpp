#pragma once

#include <atomic>
#include <chrono>

namespace agentlink {

using TimePoint = std::chrono::system_clock::time_point;

/// Wall-clock source.
class Clock {
  public:
    virtual ~Clock() = default;
    [[nodiscard]] virtual TimePoint now() const = 0;
};

class SystemClock : public Clock {
  public:
    [[nodiscard]] TimePoint now() const override { return std::chrono::system_clock::now(); }
};

/// Reports whether the device currently has network connectivity.
class ConnectivityProvider {
  public:
    virtual ~ConnectivityProvider() = default;
    [[nodiscard]] virtual bool is_connected() const = 0;
};

/// Connectivity flag set by the host (or a test). Thread-safe.
class StaticConnectivity : public ConnectivityProvider {
  public:
    explicit StaticConnectivity(bool connected = true) : connected_(connected) {}

    [[nodiscard]] bool is_connected() const override {
        return connected_.load(std::memory_order_relaxed);
    }

    void set_connected(bool connected) { connected_.store(connected, std::memory_order_relaxed); }

  private:
    std::atomic<bool> connected_;
};

} // namespace agentlink
