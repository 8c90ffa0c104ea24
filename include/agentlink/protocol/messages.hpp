#pragma once

#include "agentlink/protocol/json_value.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace agentlink::protocol {

/// Agent permission mode. Wire values: "default", "acceptEdits", "bypassPermissions".
enum class PermissionMode {
    Default,
    AcceptEdits,
    BypassPermissions,
};

const char *permission_mode_name(PermissionMode mode);

/// Parse a wire permission mode. Returns nullopt for unknown values.
std::optional<PermissionMode> parse_permission_mode(std::string_view value);

// ---------------------------------------------------------------------------
// Client -> server
// ---------------------------------------------------------------------------

/// Image attached to an input message: inline base64 data or a reference to a
/// previously uploaded image. Exactly one form is encoded on the wire.
struct ImageAttachment {
    enum class Kind { Base64, Reference };

    Kind kind = Kind::Base64;
    std::string data;      // Base64 only
    std::string mime_type; // Base64 only
    std::string id;        // Reference only

    static ImageAttachment base64(std::string data, std::string mime_type);
    static ImageAttachment reference(std::string id);

    bool operator==(const ImageAttachment &) const = default;
};

struct StartMessage {
    std::string project_path;
    std::optional<std::string> session_id;
    std::optional<std::string> model;
    std::optional<bool> helper;

    bool operator==(const StartMessage &) const = default;
};

struct InputMessage {
    std::string text;
    std::optional<std::vector<ImageAttachment>> images;
    std::optional<std::string> message_id;
    std::optional<std::string> thinking_mode;

    bool operator==(const InputMessage &) const = default;
};

enum class PermissionChoice { Allow, Deny, Always };

const char *permission_choice_name(PermissionChoice choice);

struct PermissionResponseMessage {
    std::string id;
    PermissionChoice choice = PermissionChoice::Deny;

    bool operator==(const PermissionResponseMessage &) const = default;
};

struct QuestionResponseMessage {
    std::string id;
    JsonObject answers;

    bool operator==(const QuestionResponseMessage &) const = default;
};

struct InterruptMessage {
    bool operator==(const InterruptMessage &) const = default;
};

struct StopMessage {
    bool operator==(const StopMessage &) const = default;
};

struct SubscribeSessionsMessage {
    std::optional<std::string> project_path;

    bool operator==(const SubscribeSessionsMessage &) const = default;
};

struct SetModelMessage {
    std::string model;

    bool operator==(const SetModelMessage &) const = default;
};

struct SetPermissionModeMessage {
    PermissionMode mode = PermissionMode::Default;

    bool operator==(const SetPermissionModeMessage &) const = default;
};

struct CancelQueuedMessage {
    bool operator==(const CancelQueuedMessage &) const = default;
};

struct RetryMessage {
    std::string message_id;

    bool operator==(const RetryMessage &) const = default;
};

struct PingMessage {
    bool operator==(const PingMessage &) const = default;
};

/// Resume an existing agent after a drop. The server replays stream messages
/// newer than `last_message_id`.
struct ReconnectMessage {
    std::string agent_id;
    std::optional<std::string> last_message_id;

    bool operator==(const ReconnectMessage &) const = default;
};

using ClientMessage =
    std::variant<StartMessage, InputMessage, PermissionResponseMessage, QuestionResponseMessage,
                 InterruptMessage, StopMessage, SubscribeSessionsMessage, SetModelMessage,
                 SetPermissionModeMessage, CancelQueuedMessage, RetryMessage, PingMessage,
                 ReconnectMessage>;

// ---------------------------------------------------------------------------
// Shared request payloads (top-level or inside a stream message)
// ---------------------------------------------------------------------------

struct PermissionRequest {
    std::string id;
    std::string tool;
    JsonObject input;
    std::vector<std::string> options; // e.g. ["allow", "deny", "always"]

    /// Human-readable summary of the request, e.g. "Run command: ls -la".
    [[nodiscard]] std::string description() const;

    bool operator==(const PermissionRequest &) const = default;
};

struct QuestionOption {
    std::string label;
    std::optional<std::string> description;

    bool operator==(const QuestionOption &) const = default;
};

struct QuestionItem {
    std::string question;
    std::string header;
    std::vector<QuestionOption> options;
    bool multi_select = false;

    bool operator==(const QuestionItem &) const = default;
};

struct QuestionRequest {
    std::string id;
    std::vector<QuestionItem> questions;

    bool operator==(const QuestionRequest &) const = default;
};

// ---------------------------------------------------------------------------
// Stream content (second-level dispatch inside "stream")
// ---------------------------------------------------------------------------

struct AssistantContent {
    std::string content;
    std::optional<bool> delta;

    /// A missing delta flag means the chunk is final.
    [[nodiscard]] bool is_final() const { return !delta.value_or(false); }

    bool operator==(const AssistantContent &) const = default;
};

struct UserContent {
    std::string content;

    bool operator==(const UserContent &) const = default;
};

struct SystemContent {
    std::string content;
    std::optional<std::string> subtype; // "init" | "result" | "progress"

    bool operator==(const SystemContent &) const = default;
};

struct ThinkingContent {
    std::string content;

    bool operator==(const ThinkingContent &) const = default;
};

struct ToolUseContent {
    std::string id;
    std::string name;
    JsonObject input;

    bool operator==(const ToolUseContent &) const = default;
};

struct ToolResultContent {
    std::string id;
    std::string tool;
    std::string output;
    bool success = false;
    std::optional<bool> is_error;

    bool operator==(const ToolResultContent &) const = default;
};

struct ProgressContent {
    std::string id;
    std::string tool;
    double elapsed = 0.0;
    std::optional<int64_t> progress;
    std::optional<std::string> detail;

    bool operator==(const ProgressContent &) const = default;
};

struct UsageContent {
    int64_t input_tokens = 0;
    int64_t output_tokens = 0;
    std::optional<int64_t> cache_read_tokens;
    std::optional<int64_t> cache_create_tokens;
    std::optional<double> total_cost;
    std::optional<int64_t> context_used;
    std::optional<int64_t> context_limit;

    [[nodiscard]] int64_t total_tokens() const { return input_tokens + output_tokens; }
    [[nodiscard]] double context_percentage() const;

    bool operator==(const UsageContent &) const = default;
};

enum class AgentState {
    Starting,
    Thinking,
    Executing,
    WaitingInput,
    WaitingPermission,
    Idle,
    Recovering,
    Stopped,
};

const char *agent_state_name(AgentState state);
std::optional<AgentState> parse_agent_state(std::string_view value);

struct StateContent {
    AgentState state = AgentState::Idle;
    std::optional<std::string> tool;

    bool operator==(const StateContent &) const = default;
};

struct SubagentStartContent {
    std::string id;
    std::string description;
    std::optional<std::string> agent_type;

    bool operator==(const SubagentStartContent &) const = default;
};

struct SubagentCompleteContent {
    std::string id;
    std::optional<std::string> summary;

    bool operator==(const SubagentCompleteContent &) const = default;
};

using StreamContent =
    std::variant<AssistantContent, UserContent, SystemContent, ThinkingContent, ToolUseContent,
                 ToolResultContent, ProgressContent, UsageContent, StateContent,
                 SubagentStartContent, SubagentCompleteContent, QuestionRequest,
                 PermissionRequest>;

// ---------------------------------------------------------------------------
// Server -> client
// ---------------------------------------------------------------------------

struct ConnectedMessage {
    std::string agent_id;
    std::string session_id;
    std::string model;
    std::string version;
    std::string protocol_version;

    bool operator==(const ConnectedMessage &) const = default;
};

struct StreamMessage {
    std::string id;
    std::string timestamp; // ISO-8601
    StreamContent content;

    bool operator==(const StreamMessage &) const = default;
};

enum class SessionAction { Created, Updated, Deleted };

struct SessionEventMessage {
    SessionAction action = SessionAction::Updated;
    std::string project_path;
    std::string session_id;
    std::optional<JsonValue> metadata;

    bool operator==(const SessionEventMessage &) const = default;
};

struct HistoryToolUse {
    std::string tool;
    std::optional<JsonValue> input;
    std::optional<std::string> result;

    bool operator==(const HistoryToolUse &) const = default;
};

struct HistoryEntry {
    std::string type; // "user", "assistant", ...
    std::optional<std::string> id;
    std::optional<std::string> content;
    std::optional<std::string> timestamp;
    std::optional<std::string> thinking;
    std::optional<std::vector<HistoryToolUse>> tool_use;

    bool operator==(const HistoryEntry &) const = default;
};

struct HistoryMessage {
    std::vector<HistoryEntry> messages;
    bool has_more = false;
    std::optional<std::string> cursor;

    bool operator==(const HistoryMessage &) const = default;
};

struct ModelChangedMessage {
    std::string model;
    std::optional<std::string> previous_model;

    bool operator==(const ModelChangedMessage &) const = default;
};

struct PermissionModeChangedMessage {
    PermissionMode mode = PermissionMode::Default;

    bool operator==(const PermissionModeChangedMessage &) const = default;
};

struct QueuedMessage {
    int64_t position = 0;

    bool operator==(const QueuedMessage &) const = default;
};

struct QueueClearedMessage {
    bool operator==(const QueueClearedMessage &) const = default;
};

struct ErrorMessage {
    std::string code;
    std::string message;
    bool recoverable = false;
    std::optional<bool> retryable;
    std::optional<int64_t> retry_after; // seconds

    bool operator==(const ErrorMessage &) const = default;
};

struct PongMessage {
    std::optional<int64_t> server_time;

    bool operator==(const PongMessage &) const = default;
};

struct StoppedMessage {
    std::string reason;

    bool operator==(const StoppedMessage &) const = default;
};

struct InterruptedMessage {
    bool operator==(const InterruptedMessage &) const = default;
};

/// Sent after a `reconnect` once missed messages have been replayed.
struct ReconnectCompleteMessage {
    int64_t missed_count = 0;
    std::optional<std::string> from_message_id;

    bool operator==(const ReconnectCompleteMessage &) const = default;
};

using ServerMessage =
    std::variant<ConnectedMessage, StreamMessage, PermissionRequest, QuestionRequest,
                 SessionEventMessage, HistoryMessage, ModelChangedMessage,
                 PermissionModeChangedMessage, QueuedMessage, QueueClearedMessage, ErrorMessage,
                 PongMessage, StoppedMessage, InterruptedMessage, ReconnectCompleteMessage>;

/// Wire discriminator of a message ("start", "permission_response", ...).
const char *message_type(const ClientMessage &message);
const char *message_type(const ServerMessage &message);
const char *content_type(const StreamContent &content);

} // namespace agentlink::protocol
