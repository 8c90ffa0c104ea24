#pragma once

#include <functional>
#include <string>

namespace agentlink::protocol {

/// Text-frame socket used by BridgeClient. Handlers may be invoked from a
/// background thread owned by the transport.
class Transport {
  public:
    struct Handlers {
        std::function<void()> on_open;
        std::function<void(const std::string &text)> on_message;
        /// Peer or local close. `reason` may be empty.
        std::function<void(int code, const std::string &reason)> on_close;
        /// Failure to connect or a broken socket.
        std::function<void(const std::string &reason)> on_error;
    };

    virtual ~Transport() = default;

    /// Install handlers. Must be called before open().
    virtual void set_handlers(Handlers handlers) = 0;

    /// Begin connecting (non-blocking).
    virtual void open(const std::string &url) = 0;

    /// Close the socket. No handlers fire after close() returns.
    virtual void close() = 0;

    /// Write one text frame. Returns false if the write failed.
    virtual bool send_text(const std::string &text) = 0;
};

} // namespace agentlink::protocol
