#include "agentlink/protocol/websocket_transport.hpp"

#include <utility>

namespace agentlink::protocol {

namespace {

// Set while a handler runs on an IXWebSocket thread. stop() joins that
// thread, so it must not be called from there.
thread_local bool t_in_socket_callback = false;

struct CallbackScope {
    CallbackScope() { t_in_socket_callback = true; }
    ~CallbackScope() { t_in_socket_callback = false; }
};

} // namespace

WebSocketTransport::WebSocketTransport(int ping_interval_seconds)
    : ping_interval_seconds_(ping_interval_seconds) {}

WebSocketTransport::~WebSocketTransport() {
    close();
    std::unique_ptr<ix::WebSocket> retired;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        retired = std::move(retired_);
    }
    if (retired) {
        retired->stop();
    }
}

void WebSocketTransport::set_handlers(Handlers handlers) { handlers_ = std::move(handlers); }

void WebSocketTransport::open(const std::string &url) {
    close();

    std::unique_ptr<ix::WebSocket> retired;
    auto ws = std::make_unique<ix::WebSocket>();
    ws->setUrl(url);
    ws->disableAutomaticReconnection();
    if (ping_interval_seconds_ > 0) {
        ws->setPingInterval(ping_interval_seconds_);
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        const uint64_t generation = ++generation_;
        ws->setOnMessageCallback([this, generation](const ix::WebSocketMessagePtr &msg) {
            on_message(generation, msg);
        });
        if (!t_in_socket_callback) {
            retired = std::move(retired_);
        }
        ws_ = std::move(ws);
        ws_->start();
    }

    if (retired) {
        retired->stop();
    }
}

void WebSocketTransport::close() {
    std::unique_ptr<ix::WebSocket> ws;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++generation_;
        ws = std::move(ws_);
    }
    if (!ws) {
        return;
    }

    if (t_in_socket_callback) {
        ws->close();
        std::lock_guard<std::mutex> lock(mutex_);
        if (retired_) {
            // Two closes from callback threads without an open() in between.
            // The older socket's thread has already returned from its callback.
            auto older = std::move(retired_);
            retired_ = std::move(ws);
            older->close();
            return;
        }
        retired_ = std::move(ws);
        return;
    }

    ws->stop();
}

bool WebSocketTransport::send_text(const std::string &text) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!ws_ || ws_->getReadyState() != ix::ReadyState::Open) {
        return false;
    }
    return ws_->sendText(text).success;
}

void WebSocketTransport::on_message(uint64_t generation, const ix::WebSocketMessagePtr &msg) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != generation_) {
            return; // socket already closed or replaced
        }
    }

    CallbackScope scope;

    switch (msg->type) {
    case ix::WebSocketMessageType::Message:
        if (!msg->binary && handlers_.on_message) {
            handlers_.on_message(msg->str);
        }
        break;

    case ix::WebSocketMessageType::Open:
        if (handlers_.on_open) {
            handlers_.on_open();
        }
        break;

    case ix::WebSocketMessageType::Close:
        if (handlers_.on_close) {
            handlers_.on_close(msg->closeInfo.code, msg->closeInfo.reason);
        }
        break;

    case ix::WebSocketMessageType::Error:
        if (handlers_.on_error) {
            handlers_.on_error(msg->errorInfo.reason);
        }
        break;

    default:
        break;
    }
}

} // namespace agentlink::protocol
