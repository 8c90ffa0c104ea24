#pragma once

#include "agentlink/protocol/transport.hpp"

#include <ixwebsocket/IXWebSocket.h>

#include <cstdint>
#include <memory>
#include <mutex>

namespace agentlink::protocol {

/// Transport over IXWebSocket. Runs the socket on IXWebSocket's background
/// thread; handlers are invoked from that thread. Reconnection is driven by
/// BridgeClient, so IXWebSocket's own automatic reconnection is disabled.
class WebSocketTransport : public Transport {
  public:
    explicit WebSocketTransport(int ping_interval_seconds = 30);
    ~WebSocketTransport() override;

    WebSocketTransport(const WebSocketTransport &) = delete;
    WebSocketTransport &operator=(const WebSocketTransport &) = delete;

    void set_handlers(Handlers handlers) override;
    void open(const std::string &url) override;
    void close() override;
    bool send_text(const std::string &text) override;

  private:
    void on_message(uint64_t generation, const ix::WebSocketMessagePtr &msg);

    int ping_interval_seconds_;
    Handlers handlers_;

    std::mutex mutex_;
    std::unique_ptr<ix::WebSocket> ws_;
    // Sockets closed from their own callback thread; stopped on the next
    // open() or in the destructor.
    std::unique_ptr<ix::WebSocket> retired_;
    uint64_t generation_ = 0;
};

} // namespace agentlink::protocol
