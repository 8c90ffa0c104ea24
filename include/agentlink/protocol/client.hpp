#pragma once

#include "agentlink/clock.hpp"
#include "agentlink/data/event_stream.hpp"
#include "agentlink/protocol/backoff.hpp"
#include "agentlink/protocol/connection_error.hpp"
#include "agentlink/protocol/connection_state.hpp"
#include "agentlink/protocol/messages.hpp"
#include "agentlink/protocol/scheduler.hpp"
#include "agentlink/protocol/transport.hpp"

#include <cstdint>
#include <mutex>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>

namespace agentlink::protocol {

/// Parameters of a connection. The server URL is an http(s) or ws(s) base URL.
struct StartRequest {
    std::string server_url;
    std::string project_path;
    std::optional<std::string> session_id;
    std::optional<std::string> model;
    std::optional<bool> helper;
};

/// send() called while not connected.
class NotConnectedError : public std::runtime_error {
  public:
    NotConnectedError() : std::runtime_error("Not connected") {}
};

/// The transport rejected a write.
class SendError : public std::runtime_error {
  public:
    explicit SendError(const std::string &type)
        : std::runtime_error("Failed to send '" + type + "' message") {}
};

/// Connection state machine for one agent session.
///
/// connect() opens the transport and sends `start`; the server's `connected`
/// message moves the state to Connected. Unexpected loss while connected
/// retries with exponential backoff on the scheduler until the policy's
/// attempts are used up. A retry resumes the known agent with `reconnect`,
/// carrying the last stream message id so the server can replay what was
/// missed. Handlers run on the transport's or the scheduler's thread;
/// streams are published outside the internal lock.
class BridgeClient {
  public:
    BridgeClient(Transport &transport, Scheduler &scheduler,
                 const ConnectivityProvider &connectivity, BackoffPolicy backoff = {});
    ~BridgeClient();

    BridgeClient(const BridgeClient &) = delete;
    BridgeClient &operator=(const BridgeClient &) = delete;

    /// Start a connection from Disconnected (no-op in any other state).
    /// Throws ConnectionException with InvalidServerUrl or NetworkUnavailable;
    /// the state stays Disconnected in both cases.
    void connect(const StartRequest &request);

    /// Go to Disconnected from any state, cancelling any pending retry.
    /// Forgets the session unless `preserve_session` is set. Never throws.
    void disconnect(bool preserve_session = false);

    /// Send a message. Throws NotConnectedError unless Connected, SendError
    /// if the transport write fails.
    void send(const ClientMessage &message);

    /// Application-level keepalive.
    void ping() { send(PingMessage{}); }

    /// Resume a connection that was dropped because the network went away.
    void on_network_restored();

    [[nodiscard]] ConnectionState state() const;
    [[nodiscard]] std::optional<std::string> session_id() const;
    /// Id of the newest stream message received, sent with `reconnect`.
    [[nodiscard]] std::optional<std::string> last_message_id() const;

    data::EventStream<ConnectionState> &state_stream() { return state_stream_; }
    data::EventStream<ServerMessage> &message_stream() { return message_stream_; }
    data::EventStream<ConnectionError> &error_stream() { return error_stream_; }

    /// http -> ws, https -> wss, bare host -> ws; trailing '/' stripped and
    /// "/ws" appended. Returns nullopt for an empty or unusable URL.
    static std::optional<std::string> build_websocket_url(const std::string &server_url);

  private:
    void handle_open();
    void handle_text(const std::string &text);
    void handle_loss(const std::string &detail);
    void handle_server_error(const ErrorMessage &error);
    void attempt_reconnect(uint64_t epoch);

    // Caller holds mutex_. Return the new state.
    ConnectionState schedule_retry_locked(int attempt);
    ConnectionState mark_connected_locked(const std::string &agent_id);
    // `reconnect` when resuming a known agent, otherwise `start`.
    ClientMessage handshake_locked() const;

    bool write(const std::string &text);

    Transport &transport_;
    Scheduler &scheduler_;
    const ConnectivityProvider &connectivity_;
    BackoffPolicy backoff_;

    mutable std::mutex mutex_;
    ConnectionState state_{Disconnected{}};
    StartRequest request_;
    std::string url_;
    std::optional<std::string> session_id_;
    std::optional<std::string> agent_id_;
    std::optional<std::string> last_message_id_;
    int attempt_ = 0;
    TimerId retry_timer_ = 0;
    bool awaiting_network_ = false;
    // Bumped on connect/disconnect/halt so stale retry tasks do nothing.
    uint64_t epoch_ = 0;
    std::mt19937_64 rng_{std::random_device{}()};

    std::mutex send_mutex_;

    data::EventStream<ConnectionState> state_stream_;
    data::EventStream<ServerMessage> message_stream_;
    data::EventStream<ConnectionError> error_stream_;
};

} // namespace agentlink::protocol
