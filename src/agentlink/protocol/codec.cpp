#include "agentlink/protocol/codec.hpp"

#include <type_traits>

namespace agentlink::protocol {

using nlohmann::json;

namespace {

template <class> inline constexpr bool kAlwaysFalse = false;

[[noreturn]] void invalid_field(const std::string &type, const char *key, const char *expected) {
    throw DecodeError(DecodeErrorKind::InvalidField,
                      "Message '" + type + "' field '" + key + "' must be " + expected, type);
}

const json *find_field(const json &msg, const char *key) {
    auto it = msg.find(key);
    if (it == msg.end() || it->is_null()) {
        return nullptr;
    }
    return &*it;
}

std::string require_string(const json &msg, const char *key, const std::string &type) {
    const json *field = find_field(msg, key);
    if (field == nullptr || !field->is_string()) {
        invalid_field(type, key, "a string");
    }
    return field->get<std::string>();
}

std::optional<std::string> optional_string(const json &msg, const char *key,
                                           const std::string &type) {
    const json *field = find_field(msg, key);
    if (field == nullptr) {
        return std::nullopt;
    }
    if (!field->is_string()) {
        invalid_field(type, key, "a string");
    }
    return field->get<std::string>();
}

bool require_bool(const json &msg, const char *key, const std::string &type) {
    const json *field = find_field(msg, key);
    if (field == nullptr || !field->is_boolean()) {
        invalid_field(type, key, "a boolean");
    }
    return field->get<bool>();
}

std::optional<bool> optional_bool(const json &msg, const char *key, const std::string &type) {
    const json *field = find_field(msg, key);
    if (field == nullptr) {
        return std::nullopt;
    }
    if (!field->is_boolean()) {
        invalid_field(type, key, "a boolean");
    }
    return field->get<bool>();
}

// Integers may arrive as 3 or 3.0; both decode to 3.
std::optional<int64_t> optional_int(const json &msg, const char *key, const std::string &type) {
    const json *field = find_field(msg, key);
    if (field == nullptr) {
        return std::nullopt;
    }
    auto value = JsonValue(*field).int_value();
    if (!value) {
        invalid_field(type, key, "an integer");
    }
    return value;
}

int64_t require_int(const json &msg, const char *key, const std::string &type) {
    auto value = optional_int(msg, key, type);
    if (!value) {
        invalid_field(type, key, "an integer");
    }
    return *value;
}

std::optional<double> optional_number(const json &msg, const char *key,
                                      const std::string &type) {
    const json *field = find_field(msg, key);
    if (field == nullptr) {
        return std::nullopt;
    }
    if (!field->is_number()) {
        invalid_field(type, key, "a number");
    }
    return field->get<double>();
}

const json &require_object(const json &msg, const char *key, const std::string &type) {
    const json *field = find_field(msg, key);
    if (field == nullptr || !field->is_object()) {
        invalid_field(type, key, "an object");
    }
    return *field;
}

const json &require_array(const json &msg, const char *key, const std::string &type) {
    const json *field = find_field(msg, key);
    if (field == nullptr || !field->is_array()) {
        invalid_field(type, key, "an array");
    }
    return *field;
}

std::vector<std::string> require_string_array(const json &msg, const char *key,
                                              const std::string &type) {
    std::vector<std::string> out;
    for (const auto &item : require_array(msg, key, type)) {
        if (!item.is_string()) {
            invalid_field(type, key, "an array of strings");
        }
        out.push_back(item.get<std::string>());
    }
    return out;
}

template <typename T> void put_optional(json &out, const char *key, const std::optional<T> &value) {
    if (value.has_value()) {
        out[key] = *value;
    }
}

std::string require_type(const json &msg) {
    if (!msg.is_object()) {
        throw DecodeError(DecodeErrorKind::MalformedJson, "Message is not a JSON object");
    }
    auto it = msg.find("type");
    if (it == msg.end() || !it->is_string()) {
        throw DecodeError(DecodeErrorKind::MissingType, "Message missing string 'type'");
    }
    return it->get<std::string>();
}

json parse_text(const std::string &text) {
    auto msg = json::parse(text, nullptr, false);
    if (msg.is_discarded()) {
        throw DecodeError(DecodeErrorKind::MalformedJson, "Malformed JSON message");
    }
    return msg;
}

// --- shared payloads -------------------------------------------------------

PermissionRequest decode_permission_request(const json &msg, const std::string &type) {
    PermissionRequest request;
    request.id = require_string(msg, "id", type);
    request.tool = require_string(msg, "tool", type);
    request.input = to_json_object(require_object(msg, "input", type));
    if (find_field(msg, "options") != nullptr) {
        request.options = require_string_array(msg, "options", type);
    }
    return request;
}

QuestionRequest decode_question_request(const json &msg, const std::string &type) {
    QuestionRequest request;
    request.id = require_string(msg, "id", type);
    for (const auto &item_json : require_array(msg, "questions", type)) {
        if (!item_json.is_object()) {
            invalid_field(type, "questions", "an array of objects");
        }
        QuestionItem item;
        item.question = require_string(item_json, "question", type);
        item.header = require_string(item_json, "header", type);
        item.multi_select = optional_bool(item_json, "multiSelect", type).value_or(false);
        for (const auto &option_json : require_array(item_json, "options", type)) {
            if (!option_json.is_object()) {
                invalid_field(type, "options", "an array of objects");
            }
            QuestionOption option;
            option.label = require_string(option_json, "label", type);
            option.description = optional_string(option_json, "description", type);
            item.options.push_back(std::move(option));
        }
        request.questions.push_back(std::move(item));
    }
    return request;
}

PermissionMode require_permission_mode(const json &msg, const std::string &type) {
    auto mode = parse_permission_mode(require_string(msg, "mode", type));
    if (!mode) {
        invalid_field(type, "mode", "one of default, acceptEdits, bypassPermissions");
    }
    return *mode;
}

// --- server messages -------------------------------------------------------

SessionEventMessage decode_session_event(const json &msg, const std::string &type) {
    SessionEventMessage event;
    const std::string action = require_string(msg, "action", type);
    if (action == "created") {
        event.action = SessionAction::Created;
    } else if (action == "updated") {
        event.action = SessionAction::Updated;
    } else if (action == "deleted") {
        event.action = SessionAction::Deleted;
    } else {
        invalid_field(type, "action", "one of created, updated, deleted");
    }
    event.project_path = require_string(msg, "projectPath", type);
    event.session_id = require_string(msg, "sessionId", type);
    if (const json *metadata = find_field(msg, "metadata")) {
        event.metadata = JsonValue(*metadata);
    }
    return event;
}

HistoryMessage decode_history(const json &msg, const std::string &type) {
    HistoryMessage history;
    for (const auto &entry_json : require_array(msg, "messages", type)) {
        if (!entry_json.is_object()) {
            invalid_field(type, "messages", "an array of objects");
        }
        HistoryEntry entry;
        entry.type = require_string(entry_json, "type", type);
        entry.id = optional_string(entry_json, "id", type);
        entry.content = optional_string(entry_json, "content", type);
        entry.timestamp = optional_string(entry_json, "timestamp", type);
        entry.thinking = optional_string(entry_json, "thinking", type);
        if (find_field(entry_json, "toolUse") != nullptr) {
            std::vector<HistoryToolUse> tools;
            for (const auto &tool_json : require_array(entry_json, "toolUse", type)) {
                if (!tool_json.is_object()) {
                    invalid_field(type, "toolUse", "an array of objects");
                }
                HistoryToolUse tool;
                tool.tool = require_string(tool_json, "tool", type);
                if (const json *input = find_field(tool_json, "input")) {
                    tool.input = JsonValue(*input);
                }
                tool.result = optional_string(tool_json, "result", type);
                tools.push_back(std::move(tool));
            }
            entry.tool_use = std::move(tools);
        }
        history.messages.push_back(std::move(entry));
    }
    history.has_more = optional_bool(msg, "hasMore", type).value_or(false);
    history.cursor = optional_string(msg, "cursor", type);
    return history;
}

} // namespace

const char *decode_error_kind_name(DecodeErrorKind kind) {
    switch (kind) {
    case DecodeErrorKind::MalformedJson:
        return "malformed_json";
    case DecodeErrorKind::MissingType:
        return "missing_type";
    case DecodeErrorKind::UnrecognizedType:
        return "unrecognized_type";
    case DecodeErrorKind::InvalidField:
    default:
        return "invalid_field";
    }
}

DecodeError::DecodeError(DecodeErrorKind kind, const std::string &message, std::string type)
    : std::runtime_error(message), kind_(kind), type_(std::move(type)) {}

StreamContent decode_stream_content(const json &msg) {
    const std::string type = require_type(msg);

    if (type == "assistant") {
        return AssistantContent{require_string(msg, "content", type),
                                optional_bool(msg, "delta", type)};
    }
    if (type == "user") {
        return UserContent{require_string(msg, "content", type)};
    }
    if (type == "system") {
        return SystemContent{require_string(msg, "content", type),
                             optional_string(msg, "subtype", type)};
    }
    if (type == "thinking") {
        return ThinkingContent{require_string(msg, "content", type)};
    }
    if (type == "tool_use") {
        return ToolUseContent{require_string(msg, "id", type), require_string(msg, "name", type),
                              to_json_object(require_object(msg, "input", type))};
    }
    if (type == "tool_result") {
        return ToolResultContent{require_string(msg, "id", type), require_string(msg, "tool", type),
                                 require_string(msg, "output", type),
                                 require_bool(msg, "success", type),
                                 optional_bool(msg, "isError", type)};
    }
    if (type == "progress") {
        return ProgressContent{optional_string(msg, "id", type).value_or(""),
                               require_string(msg, "tool", type),
                               optional_number(msg, "elapsed", type).value_or(0.0),
                               optional_int(msg, "progress", type),
                               optional_string(msg, "detail", type)};
    }
    if (type == "usage") {
        return UsageContent{require_int(msg, "inputTokens", type),
                            require_int(msg, "outputTokens", type),
                            optional_int(msg, "cacheReadTokens", type),
                            optional_int(msg, "cacheCreateTokens", type),
                            optional_number(msg, "totalCost", type),
                            optional_int(msg, "contextUsed", type),
                            optional_int(msg, "contextLimit", type)};
    }
    if (type == "state") {
        auto state = parse_agent_state(require_string(msg, "state", type));
        if (!state) {
            invalid_field(type, "state", "a known agent state");
        }
        return StateContent{*state, optional_string(msg, "tool", type)};
    }
    if (type == "subagent_start") {
        return SubagentStartContent{optional_string(msg, "id", type).value_or(""),
                                    require_string(msg, "description", type),
                                    optional_string(msg, "agentType", type)};
    }
    if (type == "subagent_complete") {
        return SubagentCompleteContent{optional_string(msg, "id", type).value_or(""),
                                       optional_string(msg, "summary", type)};
    }
    if (type == "question") {
        return decode_question_request(msg, type);
    }
    if (type == "permission") {
        return decode_permission_request(msg, type);
    }

    throw DecodeError(DecodeErrorKind::UnrecognizedType, "Unknown stream content type: " + type,
                      type);
}

ServerMessage decode_server_message(const json &msg) {
    const std::string type = require_type(msg);

    if (type == "connected") {
        return ConnectedMessage{require_string(msg, "agentId", type),
                                require_string(msg, "sessionId", type),
                                optional_string(msg, "model", type).value_or(""),
                                optional_string(msg, "version", type).value_or(""),
                                optional_string(msg, "protocolVersion", type).value_or("")};
    }
    if (type == "stream") {
        StreamMessage stream;
        stream.id = require_string(msg, "id", type);
        stream.timestamp = require_string(msg, "timestamp", type);
        stream.content = decode_stream_content(require_object(msg, "message", type));
        return stream;
    }
    if (type == "permission") {
        return decode_permission_request(msg, type);
    }
    if (type == "question") {
        return decode_question_request(msg, type);
    }
    if (type == "session_event") {
        return decode_session_event(msg, type);
    }
    if (type == "history") {
        return decode_history(msg, type);
    }
    if (type == "model_changed") {
        return ModelChangedMessage{require_string(msg, "model", type),
                                   optional_string(msg, "previousModel", type)};
    }
    if (type == "permission_mode_changed") {
        return PermissionModeChangedMessage{require_permission_mode(msg, type)};
    }
    if (type == "queued") {
        return QueuedMessage{require_int(msg, "position", type)};
    }
    if (type == "queue_cleared") {
        return QueueClearedMessage{};
    }
    if (type == "error") {
        return ErrorMessage{require_string(msg, "code", type), require_string(msg, "message", type),
                            optional_bool(msg, "recoverable", type).value_or(false),
                            optional_bool(msg, "retryable", type),
                            optional_int(msg, "retryAfter", type)};
    }
    if (type == "pong") {
        return PongMessage{optional_int(msg, "serverTime", type)};
    }
    if (type == "stopped") {
        return StoppedMessage{optional_string(msg, "reason", type).value_or("")};
    }
    if (type == "interrupted") {
        return InterruptedMessage{};
    }
    if (type == "reconnect_complete") {
        return ReconnectCompleteMessage{optional_int(msg, "missedCount", type).value_or(0),
                                        optional_string(msg, "fromMessageId", type)};
    }

    throw DecodeError(DecodeErrorKind::UnrecognizedType, "Unknown message type: " + type, type);
}

ServerMessage decode_server_message(const std::string &text) {
    return decode_server_message(parse_text(text));
}

json to_json(const ClientMessage &message) {
    json out = {{"type", message_type(message)}};

    std::visit(
        [&out](const auto &m) {
            using T = std::decay_t<decltype(m)>;
            if constexpr (std::is_same_v<T, StartMessage>) {
                out["projectPath"] = m.project_path;
                put_optional(out, "sessionId", m.session_id);
                put_optional(out, "model", m.model);
                put_optional(out, "helper", m.helper);
            } else if constexpr (std::is_same_v<T, InputMessage>) {
                out["text"] = m.text;
                if (m.images) {
                    json images = json::array();
                    for (const auto &image : *m.images) {
                        if (image.kind == ImageAttachment::Kind::Base64) {
                            images.push_back({{"type", "base64"},
                                              {"data", image.data},
                                              {"mimeType", image.mime_type}});
                        } else {
                            images.push_back({{"type", "reference"}, {"id", image.id}});
                        }
                    }
                    out["images"] = std::move(images);
                }
                put_optional(out, "messageId", m.message_id);
                put_optional(out, "thinkingMode", m.thinking_mode);
            } else if constexpr (std::is_same_v<T, PermissionResponseMessage>) {
                out["id"] = m.id;
                out["choice"] = permission_choice_name(m.choice);
            } else if constexpr (std::is_same_v<T, QuestionResponseMessage>) {
                out["id"] = m.id;
                out["answers"] = from_json_object(m.answers);
            } else if constexpr (std::is_same_v<T, SubscribeSessionsMessage>) {
                put_optional(out, "projectPath", m.project_path);
            } else if constexpr (std::is_same_v<T, SetModelMessage>) {
                out["model"] = m.model;
            } else if constexpr (std::is_same_v<T, SetPermissionModeMessage>) {
                out["mode"] = permission_mode_name(m.mode);
            } else if constexpr (std::is_same_v<T, RetryMessage>) {
                out["messageId"] = m.message_id;
            } else if constexpr (std::is_same_v<T, ReconnectMessage>) {
                out["agentId"] = m.agent_id;
                put_optional(out, "lastMessageId", m.last_message_id);
            } else if constexpr (std::is_same_v<T, InterruptMessage> ||
                                 std::is_same_v<T, StopMessage> ||
                                 std::is_same_v<T, CancelQueuedMessage> ||
                                 std::is_same_v<T, PingMessage>) {
                // Type discriminator only.
            } else {
                static_assert(kAlwaysFalse<T>, "unhandled client message");
            }
        },
        message);

    return out;
}

std::string encode(const ClientMessage &message) { return to_json(message).dump(); }

ClientMessage decode_client_message(const json &msg) {
    const std::string type = require_type(msg);

    if (type == "start") {
        return StartMessage{require_string(msg, "projectPath", type),
                            optional_string(msg, "sessionId", type),
                            optional_string(msg, "model", type),
                            optional_bool(msg, "helper", type)};
    }
    if (type == "input") {
        InputMessage input;
        input.text = require_string(msg, "text", type);
        if (find_field(msg, "images") != nullptr) {
            std::vector<ImageAttachment> images;
            for (const auto &image_json : require_array(msg, "images", type)) {
                if (!image_json.is_object()) {
                    invalid_field(type, "images", "an array of objects");
                }
                const std::string kind = require_string(image_json, "type", type);
                if (kind == "base64") {
                    images.push_back(ImageAttachment::base64(
                        require_string(image_json, "data", type),
                        require_string(image_json, "mimeType", type)));
                } else if (kind == "reference") {
                    images.push_back(
                        ImageAttachment::reference(require_string(image_json, "id", type)));
                } else {
                    invalid_field(type, "images", "base64 or reference attachments");
                }
            }
            input.images = std::move(images);
        }
        input.message_id = optional_string(msg, "messageId", type);
        input.thinking_mode = optional_string(msg, "thinkingMode", type);
        return input;
    }
    if (type == "permission_response") {
        PermissionResponseMessage response;
        response.id = require_string(msg, "id", type);
        const std::string choice = require_string(msg, "choice", type);
        if (choice == "allow") {
            response.choice = PermissionChoice::Allow;
        } else if (choice == "deny") {
            response.choice = PermissionChoice::Deny;
        } else if (choice == "always") {
            response.choice = PermissionChoice::Always;
        } else {
            invalid_field(type, "choice", "one of allow, deny, always");
        }
        return response;
    }
    if (type == "question_response") {
        return QuestionResponseMessage{require_string(msg, "id", type),
                                       to_json_object(require_object(msg, "answers", type))};
    }
    if (type == "interrupt") {
        return InterruptMessage{};
    }
    if (type == "stop") {
        return StopMessage{};
    }
    if (type == "subscribe_sessions") {
        return SubscribeSessionsMessage{optional_string(msg, "projectPath", type)};
    }
    if (type == "set_model") {
        return SetModelMessage{require_string(msg, "model", type)};
    }
    if (type == "set_permission_mode") {
        return SetPermissionModeMessage{require_permission_mode(msg, type)};
    }
    if (type == "cancel_queued") {
        return CancelQueuedMessage{};
    }
    if (type == "retry") {
        return RetryMessage{require_string(msg, "messageId", type)};
    }
    if (type == "ping") {
        return PingMessage{};
    }
    if (type == "reconnect") {
        return ReconnectMessage{require_string(msg, "agentId", type),
                                optional_string(msg, "lastMessageId", type)};
    }

    throw DecodeError(DecodeErrorKind::UnrecognizedType, "Unknown client message type: " + type,
                      type);
}

ClientMessage decode_client_message(const std::string &text) {
    return decode_client_message(parse_text(text));
}

} // namespace agentlink::protocol
