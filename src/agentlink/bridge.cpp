#include "agentlink/bridge.hpp"

#include <cstdio>
#include <exception>

namespace agentlink {

protocol::BackoffPolicy backoff_from_config(const ReconnectConfig &config) {
    protocol::BackoffPolicy policy;
    policy.base_delay = std::chrono::milliseconds(config.base_delay_ms);
    policy.max_delay = std::chrono::milliseconds(config.max_delay_ms);
    policy.max_jitter = std::chrono::milliseconds(config.max_jitter_ms);
    policy.max_attempts = config.max_attempts;
    return policy;
}

Bridge::Bridge(const BridgeConfig &config, BridgeDependencies deps)
    : config_(config),
      client_(deps.transport, deps.scheduler, deps.connectivity,
              backoff_from_config(config.reconnect)),
      permissions_(deps.policy_store, deps.local_overrides),
      queue_(deps.action_store, deps.clock, deps.connectivity,
             [this](const data::PendingAction &action) { return dispatch_pending(action); },
             std::chrono::seconds(config.offline_queue.ttl_seconds)) {
    state_subscription_ = client_.state_stream().subscribe(
        [this](const protocol::ConnectionState &state) { handle_state(state); });
    message_subscription_ = client_.message_stream().subscribe(
        [this](const protocol::ServerMessage &message) { handle_message(message); });
}

Bridge::~Bridge() {
    client_.state_stream().unsubscribe(state_subscription_);
    client_.message_stream().unsubscribe(message_subscription_);
    client_.disconnect(true);
}

void Bridge::connect() {
    protocol::StartRequest request;
    request.server_url = config_.server_url;
    request.project_path = config_.project_path;
    request.session_id = config_.session_id;
    request.model = config_.model;
    client_.connect(request);
    // Warm the policy cache; failures surface on the first explicit load.
    permissions_.load_config();
}

void Bridge::on_network_restored() {
    client_.on_network_restored();
    if (protocol::is_connected(client_.state())) {
        queue_.process_queue();
    }
}

void Bridge::send_input(const std::string &text,
                        std::optional<std::vector<protocol::ImageAttachment>> images,
                        std::optional<std::string> thinking_mode) {
    protocol::InputMessage input;
    input.text = text;
    input.images = std::move(images);
    input.thinking_mode = std::move(thinking_mode);
    client_.send(input);
}

void Bridge::answer_question(const std::string &request_id, protocol::JsonObject answers) {
    client_.send(protocol::QuestionResponseMessage{request_id, std::move(answers)});
}

void Bridge::set_permission_mode(protocol::PermissionMode mode) {
    client_.send(protocol::SetPermissionModeMessage{mode});
}

void Bridge::subscribe_sessions(std::optional<std::string> project_path) {
    client_.send(protocol::SubscribeSessionsMessage{
        project_path ? std::move(project_path) : std::optional<std::string>(config_.project_path)});
}

bool Bridge::respond_to_permission(const std::string &request_id,
                                   protocol::PermissionChoice choice) {
    if (protocol::is_connected(client_.state())) {
        try {
            client_.send(protocol::PermissionResponseMessage{request_id, choice});
            return true;
        } catch (const protocol::NotConnectedError &) {
            // Dropped between the check and the send; fall through to the queue.
        } catch (const protocol::SendError &e) {
            std::fprintf(stderr, "[agentlink] %s, queueing decision\n", e.what());
        }
    }
    queue_.queue_approval(request_id, choice != protocol::PermissionChoice::Deny);
    return false;
}

std::optional<protocol::PermissionMode> Bridge::session_permission_mode() const {
    auto session = client_.session_id();
    if (!session) {
        return std::nullopt;
    }
    return permissions_.session_mode(*session);
}

void Bridge::handle_state(const protocol::ConnectionState &state) {
    std::printf("[agentlink] %s\n", protocol::display_text(state).c_str());
    if (!protocol::is_connected(state)) {
        return;
    }
    try {
        queue_.process_queue();
    } catch (const std::exception &e) {
        std::fprintf(stderr, "[agentlink] Offline queue flush failed: %s\n", e.what());
    }
}

void Bridge::handle_message(const protocol::ServerMessage &message) {
    try {
        if (const auto *changed = std::get_if<protocol::PermissionModeChangedMessage>(&message)) {
            if (auto session = client_.session_id()) {
                permissions_.set_session_mode(*session, changed->mode);
            }
            return;
        }
        if (const auto *request = std::get_if<protocol::PermissionRequest>(&message)) {
            handle_permission_request(*request);
            return;
        }
        if (const auto *stream = std::get_if<protocol::StreamMessage>(&message)) {
            if (const auto *request = std::get_if<protocol::PermissionRequest>(&stream->content)) {
                handle_permission_request(*request);
            }
        }
    } catch (const std::exception &e) {
        std::fprintf(stderr, "[agentlink] Failed to handle %s: %s\n",
                     protocol::message_type(message), e.what());
    }
}

void Bridge::handle_permission_request(const protocol::PermissionRequest &request) {
    const auto session_mode = session_permission_mode();
    if (permissions_.should_auto_approve(request.tool, config_.project_path, session_mode)) {
        std::printf("[agentlink] Auto-approved %s\n", request.description().c_str());
        respond_to_permission(request.id, protocol::PermissionChoice::Allow);
        return;
    }
    if (permissions_.is_tool_denied(request.tool, config_.project_path)) {
        std::printf("[agentlink] Denied by policy: %s\n", request.description().c_str());
        respond_to_permission(request.id, protocol::PermissionChoice::Deny);
        return;
    }
    permission_stream_.publish(request);
}

bool Bridge::dispatch_pending(const data::PendingAction &action) {
    const auto choice =
        action.approved ? protocol::PermissionChoice::Allow : protocol::PermissionChoice::Deny;
    try {
        client_.send(protocol::PermissionResponseMessage{action.request_id, choice});
        return true;
    } catch (const protocol::NotConnectedError &) {
        return false;
    } catch (const protocol::SendError &e) {
        std::fprintf(stderr, "[agentlink] %s\n", e.what());
        return false;
    }
}

} // namespace agentlink
