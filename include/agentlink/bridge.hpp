#pragma once

#include "agentlink/clock.hpp"
#include "agentlink/config.hpp"
#include "agentlink/data/event_stream.hpp"
#include "agentlink/data/offline_queue.hpp"
#include "agentlink/permissions/permission_manager.hpp"
#include "agentlink/protocol/client.hpp"

#include <optional>
#include <string>
#include <vector>

namespace agentlink {

/// Collaborators supplied by the host. All must outlive the Bridge, and the
/// scheduler must stop running tasks before the Bridge is destroyed.
struct BridgeDependencies {
    protocol::Transport &transport;
    protocol::Scheduler &scheduler;
    const Clock &clock;
    const ConnectivityProvider &connectivity;
    data::ActionStore &action_store;
    permissions::PolicyStore &policy_store;
    permissions::LocalOverrideStore *local_overrides = nullptr;
};

/// Wires the client, permission engine and offline queue together.
///
/// - flushes the offline queue whenever the client reports Connected
/// - queues permission decisions made while disconnected instead of sending
/// - answers permission requests the policy auto-approves, and publishes the
///   rest on permission_stream() for the user
/// - records server permission_mode_changed events as the session override
class Bridge {
  public:
    Bridge(const BridgeConfig &config, BridgeDependencies deps);
    ~Bridge();

    Bridge(const Bridge &) = delete;
    Bridge &operator=(const Bridge &) = delete;

    /// Connect with the configured server, project, model and session.
    /// Throws protocol::ConnectionException.
    void connect();
    void disconnect(bool preserve_session = false) { client_.disconnect(preserve_session); }

    /// Connectivity came back: resume the connection and replay queued decisions.
    void on_network_restored();

    // Outbound intents. Each throws protocol::NotConnectedError or
    // protocol::SendError from the client.
    void send_input(const std::string &text,
                    std::optional<std::vector<protocol::ImageAttachment>> images = std::nullopt,
                    std::optional<std::string> thinking_mode = std::nullopt);
    void answer_question(const std::string &request_id, protocol::JsonObject answers);
    void interrupt() { client_.send(protocol::InterruptMessage{}); }
    void stop() { client_.send(protocol::StopMessage{}); }
    void cancel_queued() { client_.send(protocol::CancelQueuedMessage{}); }
    void retry(const std::string &message_id) { client_.send(protocol::RetryMessage{message_id}); }
    void set_model(const std::string &model) { client_.send(protocol::SetModelMessage{model}); }
    void set_permission_mode(protocol::PermissionMode mode);
    void subscribe_sessions(std::optional<std::string> project_path = std::nullopt);

    /// Send a decision, or queue it while disconnected. Returns true if sent.
    bool respond_to_permission(const std::string &request_id, protocol::PermissionChoice choice);

    /// Replay queued decisions now.
    data::ProcessResult flush_offline_queue() { return queue_.process_queue(); }

    /// Session override for the active session, if the server set one.
    [[nodiscard]] std::optional<protocol::PermissionMode> session_permission_mode() const;

    [[nodiscard]] const std::string &project_path() const { return config_.project_path; }

    protocol::BridgeClient &client() { return client_; }
    permissions::PermissionManager &permissions() { return permissions_; }
    data::OfflineActionQueue &offline_queue() { return queue_; }

    /// Permission requests that need a user decision.
    data::EventStream<protocol::PermissionRequest> &permission_stream() {
        return permission_stream_;
    }

  private:
    void handle_state(const protocol::ConnectionState &state);
    void handle_message(const protocol::ServerMessage &message);
    void handle_permission_request(const protocol::PermissionRequest &request);
    bool dispatch_pending(const data::PendingAction &action);

    BridgeConfig config_;
    protocol::BridgeClient client_;
    permissions::PermissionManager permissions_;
    data::OfflineActionQueue queue_;
    data::EventStream<protocol::PermissionRequest> permission_stream_;

    data::SubscriptionId state_subscription_ = 0;
    data::SubscriptionId message_subscription_ = 0;
};

/// Backoff policy from the reconnect section of a config.
protocol::BackoffPolicy backoff_from_config(const ReconnectConfig &config);

} // namespace agentlink
