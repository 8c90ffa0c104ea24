#include "agentlink/protocol/client.hpp"

#include "agentlink/protocol/codec.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <exception>

namespace agentlink::protocol {

namespace {

bool starts_with(const std::string &s, std::string_view prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

BridgeClient::BridgeClient(Transport &transport, Scheduler &scheduler,
                           const ConnectivityProvider &connectivity, BackoffPolicy backoff)
    : transport_(transport), scheduler_(scheduler), connectivity_(connectivity),
      backoff_(backoff) {
    Transport::Handlers handlers;
    handlers.on_open = [this] { handle_open(); };
    handlers.on_message = [this](const std::string &text) { handle_text(text); };
    handlers.on_close = [this](int code, const std::string &reason) {
        handle_loss(reason.empty() ? "Connection closed (" + std::to_string(code) + ")" : reason);
    };
    handlers.on_error = [this](const std::string &reason) { handle_loss(reason); };
    transport_.set_handlers(std::move(handlers));
}

BridgeClient::~BridgeClient() { disconnect(true); }

std::optional<std::string> BridgeClient::build_websocket_url(const std::string &server_url) {
    if (server_url.empty()) {
        return std::nullopt;
    }

    std::string scheme;
    std::string rest;
    if (starts_with(server_url, "http://")) {
        scheme = "ws://";
        rest = server_url.substr(7);
    } else if (starts_with(server_url, "https://")) {
        scheme = "wss://";
        rest = server_url.substr(8);
    } else if (starts_with(server_url, "ws://")) {
        scheme = "ws://";
        rest = server_url.substr(5);
    } else if (starts_with(server_url, "wss://")) {
        scheme = "wss://";
        rest = server_url.substr(6);
    } else {
        scheme = "ws://";
        rest = server_url;
    }

    if (!rest.empty() && rest.back() == '/') {
        rest.pop_back();
    }
    if (rest.empty() || rest.front() == '/' ||
        std::any_of(rest.begin(), rest.end(),
                    [](unsigned char c) { return std::isspace(c) || std::iscntrl(c); })) {
        return std::nullopt;
    }
    return scheme + rest + "/ws";
}

void BridgeClient::connect(const StartRequest &request) {
    auto url = build_websocket_url(request.server_url);
    if (!url) {
        std::fprintf(stderr, "[BridgeClient] Invalid server URL: '%s'\n",
                     request.server_url.c_str());
        throw ConnectionException(ConnectionError::invalid_server_url());
    }
    if (!connectivity_.is_connected()) {
        throw ConnectionException(ConnectionError::network_unavailable());
    }

    ConnectionState published;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!std::holds_alternative<Disconnected>(state_)) {
            std::printf("[BridgeClient] connect() ignored while %s\n",
                        display_text(state_).c_str());
            return;
        }
        request_ = request;
        url_ = *url;
        session_id_ = request.session_id;
        attempt_ = 0;
        awaiting_network_ = false;
        ++epoch_;
        state_ = Connecting{};
        published = state_;
    }

    std::printf("[BridgeClient] Connecting to %s\n", url->c_str());
    state_stream_.publish(published);
    transport_.open(*url);
}

void BridgeClient::disconnect(bool preserve_session) {
    bool changed = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++epoch_;
        if (retry_timer_ != 0) {
            scheduler_.cancel(retry_timer_);
            retry_timer_ = 0;
        }
        attempt_ = 0;
        awaiting_network_ = false;
        if (!preserve_session) {
            session_id_.reset();
            agent_id_.reset();
            last_message_id_.reset();
        }
        changed = !std::holds_alternative<Disconnected>(state_);
        state_ = Disconnected{};
    }

    try {
        transport_.close();
    } catch (const std::exception &e) {
        std::fprintf(stderr, "[BridgeClient] Error closing transport: %s\n", e.what());
    }

    if (changed) {
        std::printf("[BridgeClient] Disconnected\n");
        state_stream_.publish(Disconnected{});
    }
}

void BridgeClient::send(const ClientMessage &message) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!std::holds_alternative<Connected>(state_)) {
            throw NotConnectedError();
        }
    }
    if (!write(encode(message))) {
        throw SendError(message_type(message));
    }
}

void BridgeClient::on_network_restored() {
    std::string url;
    ConnectionState published;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!awaiting_network_ || !std::holds_alternative<Disconnected>(state_)) {
            return;
        }
        awaiting_network_ = false;
        ++epoch_;
        attempt_ = 1;
        state_ = Reconnecting{attempt_};
        published = state_;
        url = url_;
    }

    std::printf("[BridgeClient] Network restored, reconnecting\n");
    state_stream_.publish(published);
    transport_.open(url);
}

ConnectionState BridgeClient::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::optional<std::string> BridgeClient::session_id() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_id_;
}

std::optional<std::string> BridgeClient::last_message_id() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_message_id_;
}

bool BridgeClient::write(const std::string &text) {
    std::lock_guard<std::mutex> lock(send_mutex_);
    return transport_.send_text(text);
}

ClientMessage BridgeClient::handshake_locked() const {
    if (std::holds_alternative<Reconnecting>(state_) && agent_id_) {
        return ReconnectMessage{*agent_id_, last_message_id_};
    }
    return StartMessage{request_.project_path, session_id_, request_.model, request_.helper};
}

void BridgeClient::handle_open() {
    ClientMessage hello;
    bool stale = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stale = !is_connecting(state_);
        if (!stale) {
            hello = handshake_locked();
        }
    }

    if (stale) {
        // A retry opened this socket after disconnect() had already closed.
        std::printf("[BridgeClient] Closing socket opened after disconnect\n");
        transport_.close();
        return;
    }
    if (!write(encode(hello))) {
        handle_loss(std::string("Failed to send ") + message_type(hello) + " message");
    }
}

void BridgeClient::handle_text(const std::string &text) {
    if (std::holds_alternative<Disconnected>(state())) {
        return; // socket outlived a disconnect or halt
    }

    ServerMessage message;
    try {
        message = decode_server_message(text);
    } catch (const DecodeError &e) {
        std::fprintf(stderr, "[BridgeClient] Dropping undecodable frame (%s): %s\n",
                     decode_error_kind_name(e.kind()), e.what());
        error_stream_.publish(ConnectionError::protocol_error(e.what()));
        return;
    }

    std::optional<ConnectionState> published;
    if (const auto *connected = std::get_if<ConnectedMessage>(&message)) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!is_connecting(state_)) {
                return; // duplicate handshake
            }
            if (session_id_ != connected->session_id) {
                last_message_id_.reset();
            }
            session_id_ = connected->session_id;
            agent_id_ = connected->agent_id;
            published = mark_connected_locked(connected->agent_id);
        }
        std::printf("[BridgeClient] Connected: agent=%s session=%s\n",
                    connected->agent_id.c_str(), connected->session_id.c_str());
    } else if (const auto *resumed = std::get_if<ReconnectCompleteMessage>(&message)) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (is_connecting(state_) && agent_id_) {
            published = mark_connected_locked(*agent_id_);
        }
        std::printf("[BridgeClient] Reconnect complete, %lld missed messages replayed\n",
                    static_cast<long long>(resumed->missed_count));
    } else if (const auto *stream = std::get_if<StreamMessage>(&message)) {
        std::lock_guard<std::mutex> lock(mutex_);
        last_message_id_ = stream->id;
    }

    if (published) {
        state_stream_.publish(*published);
    }
    message_stream_.publish(message);

    if (const auto *error = std::get_if<ErrorMessage>(&message)) {
        handle_server_error(*error);
    }
}

ConnectionState BridgeClient::mark_connected_locked(const std::string &agent_id) {
    if (retry_timer_ != 0) {
        scheduler_.cancel(retry_timer_);
        retry_timer_ = 0;
    }
    attempt_ = 0;
    state_ = Connected{agent_id};
    return state_;
}

void BridgeClient::handle_server_error(const ErrorMessage &error) {
    auto classified =
        classify_server_error(error.code, error.message, error.retry_after, error.recoverable);
    std::fprintf(stderr, "[BridgeClient] Server error %s: %s\n", error.code.c_str(),
                 error.message.c_str());

    const bool halt = classified.requires_user_action() ||
                      classified.kind() == ConnectionErrorKind::RateLimited;
    bool changed = false;
    if (classified.kind() == ConnectionErrorKind::AgentTimedOut) {
        // The agent is gone; the next attempt starts a new one for the session.
        std::lock_guard<std::mutex> lock(mutex_);
        agent_id_.reset();
    }
    if (halt) {
        std::lock_guard<std::mutex> lock(mutex_);
        ++epoch_;
        if (retry_timer_ != 0) {
            scheduler_.cancel(retry_timer_);
            retry_timer_ = 0;
        }
        attempt_ = 0;
        awaiting_network_ = false;
        if (classified.kind() == ConnectionErrorKind::SessionNotFound ||
            classified.kind() == ConnectionErrorKind::SessionInvalid) {
            session_id_.reset();
            agent_id_.reset();
            last_message_id_.reset();
        }
        changed = !std::holds_alternative<Disconnected>(state_);
        state_ = Disconnected{};
    }

    error_stream_.publish(classified);

    if (halt) {
        transport_.close();
        if (changed) {
            state_stream_.publish(Disconnected{});
        }
    }
}

ConnectionState BridgeClient::schedule_retry_locked(int attempt) {
    attempt_ = attempt;
    const auto delay = backoff_.delay_for(attempt, rng_);
    const uint64_t epoch = epoch_;
    retry_timer_ = scheduler_.schedule(delay, [this, epoch] { attempt_reconnect(epoch); });
    std::printf("[BridgeClient] Reconnect attempt %d in %lld ms\n", attempt,
                static_cast<long long>(delay.count()));
    state_ = Reconnecting{attempt};
    return state_;
}

void BridgeClient::handle_loss(const std::string &detail) {
    std::optional<ConnectionState> published;
    std::optional<ConnectionError> error;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (std::holds_alternative<Disconnected>(state_)) {
            return;
        }
        ++epoch_;

        const bool offline =
            !connectivity_.is_connected() ||
            classify_transport_failure(detail).kind() == ConnectionErrorKind::NetworkUnavailable;
        if (offline) {
            awaiting_network_ = true;
            attempt_ = 0;
            state_ = Disconnected{};
            published = state_;
            error = ConnectionError::network_unavailable();
        } else if (std::holds_alternative<Connecting>(state_)) {
            state_ = Disconnected{};
            published = state_;
            error = ConnectionError::connection_failed(detail);
        } else if (backoff_.exhausted(attempt_ + 1)) {
            attempt_ = 0;
            state_ = Disconnected{};
            published = state_;
            error = ConnectionError::reconnect_failed();
        } else {
            published = schedule_retry_locked(attempt_ + 1);
        }
    }

    std::fprintf(stderr, "[BridgeClient] Connection lost: %s\n", detail.c_str());
    transport_.close();

    if (error) {
        error_stream_.publish(*error);
    }
    if (published) {
        state_stream_.publish(*published);
    }
}

void BridgeClient::attempt_reconnect(uint64_t epoch) {
    std::string url;
    bool offline = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (epoch != epoch_ || !std::holds_alternative<Reconnecting>(state_)) {
            return;
        }
        retry_timer_ = 0;
        if (!connectivity_.is_connected()) {
            ++epoch_;
            awaiting_network_ = true;
            attempt_ = 0;
            state_ = Disconnected{};
            offline = true;
        }
        url = url_;
    }

    if (offline) {
        error_stream_.publish(ConnectionError::network_unavailable());
        state_stream_.publish(Disconnected{});
        return;
    }
    transport_.open(url);
}

} // namespace agentlink::protocol
