#include "agentlink/protocol/messages.hpp"

#include <type_traits>

namespace agentlink::protocol {

namespace {

template <class> inline constexpr bool kAlwaysFalse = false;

} // namespace

const char *permission_mode_name(PermissionMode mode) {
    switch (mode) {
    case PermissionMode::AcceptEdits:
        return "acceptEdits";
    case PermissionMode::BypassPermissions:
        return "bypassPermissions";
    case PermissionMode::Default:
    default:
        return "default";
    }
}

std::optional<PermissionMode> parse_permission_mode(std::string_view value) {
    if (value == "default") {
        return PermissionMode::Default;
    }
    if (value == "acceptEdits") {
        return PermissionMode::AcceptEdits;
    }
    if (value == "bypassPermissions") {
        return PermissionMode::BypassPermissions;
    }
    return std::nullopt;
}

ImageAttachment ImageAttachment::base64(std::string data, std::string mime_type) {
    ImageAttachment image;
    image.kind = Kind::Base64;
    image.data = std::move(data);
    image.mime_type = std::move(mime_type);
    return image;
}

ImageAttachment ImageAttachment::reference(std::string id) {
    ImageAttachment image;
    image.kind = Kind::Reference;
    image.id = std::move(id);
    return image;
}

const char *permission_choice_name(PermissionChoice choice) {
    switch (choice) {
    case PermissionChoice::Allow:
        return "allow";
    case PermissionChoice::Always:
        return "always";
    case PermissionChoice::Deny:
    default:
        return "deny";
    }
}

std::string PermissionRequest::description() const {
    if (auto it = input.find("command"); it != input.end()) {
        return "Run command: " + it->second.string_value();
    }
    for (const char *key : {"file_path", "filePath"}) {
        if (auto it = input.find(key); it != input.end()) {
            return tool + ": " + it->second.string_value();
        }
    }
    return tool;
}

double UsageContent::context_percentage() const {
    if (!context_used || !context_limit || *context_limit <= 0) {
        return 0.0;
    }
    return static_cast<double>(*context_used) / static_cast<double>(*context_limit) * 100.0;
}

const char *agent_state_name(AgentState state) {
    switch (state) {
    case AgentState::Starting:
        return "starting";
    case AgentState::Thinking:
        return "thinking";
    case AgentState::Executing:
        return "executing";
    case AgentState::WaitingInput:
        return "waiting_input";
    case AgentState::WaitingPermission:
        return "waiting_permission";
    case AgentState::Recovering:
        return "recovering";
    case AgentState::Stopped:
        return "stopped";
    case AgentState::Idle:
    default:
        return "idle";
    }
}

std::optional<AgentState> parse_agent_state(std::string_view value) {
    static constexpr AgentState kAll[] = {
        AgentState::Starting,     AgentState::Thinking,          AgentState::Executing,
        AgentState::WaitingInput, AgentState::WaitingPermission, AgentState::Idle,
        AgentState::Recovering,   AgentState::Stopped,
    };
    for (auto state : kAll) {
        if (value == agent_state_name(state)) {
            return state;
        }
    }
    return std::nullopt;
}

const char *message_type(const ClientMessage &message) {
    return std::visit(
        [](const auto &m) -> const char * {
            using T = std::decay_t<decltype(m)>;
            if constexpr (std::is_same_v<T, StartMessage>) {
                return "start";
            } else if constexpr (std::is_same_v<T, InputMessage>) {
                return "input";
            } else if constexpr (std::is_same_v<T, PermissionResponseMessage>) {
                return "permission_response";
            } else if constexpr (std::is_same_v<T, QuestionResponseMessage>) {
                return "question_response";
            } else if constexpr (std::is_same_v<T, InterruptMessage>) {
                return "interrupt";
            } else if constexpr (std::is_same_v<T, StopMessage>) {
                return "stop";
            } else if constexpr (std::is_same_v<T, SubscribeSessionsMessage>) {
                return "subscribe_sessions";
            } else if constexpr (std::is_same_v<T, SetModelMessage>) {
                return "set_model";
            } else if constexpr (std::is_same_v<T, SetPermissionModeMessage>) {
                return "set_permission_mode";
            } else if constexpr (std::is_same_v<T, CancelQueuedMessage>) {
                return "cancel_queued";
            } else if constexpr (std::is_same_v<T, RetryMessage>) {
                return "retry";
            } else if constexpr (std::is_same_v<T, PingMessage>) {
                return "ping";
            } else if constexpr (std::is_same_v<T, ReconnectMessage>) {
                return "reconnect";
            } else {
                static_assert(kAlwaysFalse<T>, "unhandled client message");
            }
        },
        message);
}

const char *message_type(const ServerMessage &message) {
    return std::visit(
        [](const auto &m) -> const char * {
            using T = std::decay_t<decltype(m)>;
            if constexpr (std::is_same_v<T, ConnectedMessage>) {
                return "connected";
            } else if constexpr (std::is_same_v<T, StreamMessage>) {
                return "stream";
            } else if constexpr (std::is_same_v<T, PermissionRequest>) {
                return "permission";
            } else if constexpr (std::is_same_v<T, QuestionRequest>) {
                return "question";
            } else if constexpr (std::is_same_v<T, SessionEventMessage>) {
                return "session_event";
            } else if constexpr (std::is_same_v<T, HistoryMessage>) {
                return "history";
            } else if constexpr (std::is_same_v<T, ModelChangedMessage>) {
                return "model_changed";
            } else if constexpr (std::is_same_v<T, PermissionModeChangedMessage>) {
                return "permission_mode_changed";
            } else if constexpr (std::is_same_v<T, QueuedMessage>) {
                return "queued";
            } else if constexpr (std::is_same_v<T, QueueClearedMessage>) {
                return "queue_cleared";
            } else if constexpr (std::is_same_v<T, ErrorMessage>) {
                return "error";
            } else if constexpr (std::is_same_v<T, PongMessage>) {
                return "pong";
            } else if constexpr (std::is_same_v<T, StoppedMessage>) {
                return "stopped";
            } else if constexpr (std::is_same_v<T, InterruptedMessage>) {
                return "interrupted";
            } else if constexpr (std::is_same_v<T, ReconnectCompleteMessage>) {
                return "reconnect_complete";
            } else {
                static_assert(kAlwaysFalse<T>, "unhandled server message");
            }
        },
        message);
}

const char *content_type(const StreamContent &content) {
    return std::visit(
        [](const auto &c) -> const char * {
            using T = std::decay_t<decltype(c)>;
            if constexpr (std::is_same_v<T, AssistantContent>) {
                return "assistant";
            } else if constexpr (std::is_same_v<T, UserContent>) {
                return "user";
            } else if constexpr (std::is_same_v<T, SystemContent>) {
                return "system";
            } else if constexpr (std::is_same_v<T, ThinkingContent>) {
                return "thinking";
            } else if constexpr (std::is_same_v<T, ToolUseContent>) {
                return "tool_use";
            } else if constexpr (std::is_same_v<T, ToolResultContent>) {
                return "tool_result";
            } else if constexpr (std::is_same_v<T, ProgressContent>) {
                return "progress";
            } else if constexpr (std::is_same_v<T, UsageContent>) {
                return "usage";
            } else if constexpr (std::is_same_v<T, StateContent>) {
                return "state";
            } else if constexpr (std::is_same_v<T, SubagentStartContent>) {
                return "subagent_start";
            } else if constexpr (std::is_same_v<T, SubagentCompleteContent>) {
                return "subagent_complete";
            } else if constexpr (std::is_same_v<T, QuestionRequest>) {
                return "question";
            } else if constexpr (std::is_same_v<T, PermissionRequest>) {
                return "permission";
            } else {
                static_assert(kAlwaysFalse<T>, "unhandled stream content");
            }
        },
        content);
}

} // namespace agentlink::protocol
