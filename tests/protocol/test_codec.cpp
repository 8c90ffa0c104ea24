#include "agentlink/protocol/codec.hpp"

#include <gtest/gtest.h>

#include <vector>

using namespace agentlink::protocol;
using nlohmann::json;

namespace {

DecodeErrorKind server_decode_error(const json &msg) {
    try {
        decode_server_message(msg);
    } catch (const DecodeError &e) {
        return e.kind();
    }
    ADD_FAILURE() << "decoded without error: " << msg.dump();
    return DecodeErrorKind::MalformedJson;
}

} // namespace

// --- client messages ---------------------------------------------------------

TEST(ClientCodec, StartOmitsAbsentOptionals) {
    auto out = to_json(StartMessage{"/proj", std::nullopt, std::nullopt, std::nullopt});
    EXPECT_EQ(out, (json{{"type", "start"}, {"projectPath", "/proj"}}));

    auto full = to_json(StartMessage{"/proj", "sess-1", "opus", true});
    EXPECT_EQ(full["sessionId"], "sess-1");
    EXPECT_EQ(full["model"], "opus");
    EXPECT_EQ(full["helper"], true);
}

TEST(ClientCodec, InputWithImages) {
    InputMessage input;
    input.text = "what is this?";
    input.images = std::vector<ImageAttachment>{ImageAttachment::base64("aGVsbG8=", "image/png"),
                                                ImageAttachment::reference("img-7")};
    input.message_id = "m-1";

    auto out = to_json(input);
    EXPECT_EQ(out["type"], "input");
    EXPECT_EQ(out["text"], "what is this?");
    ASSERT_EQ(out["images"].size(), 2u);
    EXPECT_EQ(out["images"][0],
              (json{{"type", "base64"}, {"data", "aGVsbG8="}, {"mimeType", "image/png"}}));
    EXPECT_EQ(out["images"][1], (json{{"type", "reference"}, {"id", "img-7"}}));
    EXPECT_EQ(out["messageId"], "m-1");
    EXPECT_FALSE(out.contains("thinkingMode"));
}

TEST(ClientCodec, WireNames) {
    EXPECT_EQ(to_json(PermissionResponseMessage{"req-1", PermissionChoice::Always}),
              (json{{"type", "permission_response"}, {"id", "req-1"}, {"choice", "always"}}));
    EXPECT_EQ(to_json(SetPermissionModeMessage{PermissionMode::AcceptEdits}),
              (json{{"type", "set_permission_mode"}, {"mode", "acceptEdits"}}));
    EXPECT_EQ(to_json(RetryMessage{"m-9"}), (json{{"type", "retry"}, {"messageId", "m-9"}}));
    EXPECT_EQ(to_json(CancelQueuedMessage{}), (json{{"type", "cancel_queued"}}));
    EXPECT_EQ(encode(PingMessage{}), R"({"type":"ping"})");
}

TEST(ClientCodec, RoundTripEveryVariant) {
    QuestionResponseMessage answers;
    answers.id = "q-1";
    answers.answers = to_json_object(json{{"Which db?", "sqlite"}, {"count", 3}});

    InputMessage input;
    input.text = "hello";
    input.images = std::vector<ImageAttachment>{ImageAttachment::base64("AAAA", "image/jpeg"),
                                                ImageAttachment::reference("img-1")};
    input.message_id = "m-1";
    input.thinking_mode = "think_hard";

    const std::vector<ClientMessage> messages = {
        StartMessage{"/proj", std::nullopt, std::nullopt, std::nullopt},
        StartMessage{"/proj", "sess-1", "sonnet", false},
        InputMessage{"plain", std::nullopt, std::nullopt, std::nullopt},
        input,
        PermissionResponseMessage{"req-1", PermissionChoice::Allow},
        PermissionResponseMessage{"req-2", PermissionChoice::Deny},
        PermissionResponseMessage{"req-3", PermissionChoice::Always},
        answers,
        InterruptMessage{},
        StopMessage{},
        SubscribeSessionsMessage{},
        SubscribeSessionsMessage{"/proj"},
        SetModelMessage{"opus"},
        SetPermissionModeMessage{PermissionMode::BypassPermissions},
        CancelQueuedMessage{},
        RetryMessage{"m-2"},
        PingMessage{},
        ReconnectMessage{"agent-1", std::nullopt},
        ReconnectMessage{"agent-1", "s-9"},
    };

    for (const auto &message : messages) {
        auto decoded = decode_client_message(encode(message));
        EXPECT_EQ(decoded, message) << encode(message);
    }
}

TEST(ClientCodec, DecodeRejectsUnknownChoice) {
    try {
        decode_client_message(
            json{{"type", "permission_response"}, {"id", "r"}, {"choice", "maybe"}});
        FAIL() << "expected DecodeError";
    } catch (const DecodeError &e) {
        EXPECT_EQ(e.kind(), DecodeErrorKind::InvalidField);
        EXPECT_EQ(e.type(), "permission_response");
    }
}

// --- server messages ---------------------------------------------------------

TEST(ServerCodec, Connected) {
    auto msg = decode_server_message(json{{"type", "connected"},
                                          {"agentId", "agent-1"},
                                          {"sessionId", "sess-1"},
                                          {"model", "sonnet"},
                                          {"version", "0.9.0"},
                                          {"protocolVersion", "1"}});
    const auto &connected = std::get<ConnectedMessage>(msg);
    EXPECT_EQ(connected.agent_id, "agent-1");
    EXPECT_EQ(connected.session_id, "sess-1");
    EXPECT_EQ(connected.protocol_version, "1");
    EXPECT_STREQ(message_type(msg), "connected");
}

TEST(ServerCodec, ReconnectComplete) {
    auto msg = decode_server_message(
        json{{"type", "reconnect_complete"}, {"missedCount", 3}, {"fromMessageId", "s-4"}});
    EXPECT_EQ(msg, ServerMessage(ReconnectCompleteMessage{3, "s-4"}));
    EXPECT_STREQ(message_type(msg), "reconnect_complete");
}

TEST(ServerCodec, DecodesFromText) {
    auto msg = decode_server_message(std::string(R"({"type":"queued","position":2})"));
    EXPECT_EQ(std::get<QueuedMessage>(msg).position, 2);
}

TEST(ServerCodec, StreamAssistantDelta) {
    auto msg = decode_server_message(json::parse(R"({
        "type": "stream",
        "id": "s-1",
        "timestamp": "2026-01-05T10:00:00Z",
        "message": {"type": "assistant", "content": "Hel", "delta": true}
    })"));
    const auto &stream = std::get<StreamMessage>(msg);
    EXPECT_EQ(stream.id, "s-1");
    const auto &text = std::get<AssistantContent>(stream.content);
    EXPECT_EQ(text.content, "Hel");
    EXPECT_FALSE(text.is_final());
    EXPECT_STREQ(content_type(stream.content), "assistant");
}

TEST(ServerCodec, AssistantWithoutDeltaIsFinal) {
    auto content = decode_stream_content(json{{"type", "assistant"}, {"content", "Done."}});
    EXPECT_TRUE(std::get<AssistantContent>(content).is_final());
}

TEST(ServerCodec, StreamToolContent) {
    auto use = decode_stream_content(json::parse(
        R"({"type": "tool_use", "id": "t-1", "name": "Bash", "input": {"command": "ls"}})"));
    const auto &tool = std::get<ToolUseContent>(use);
    EXPECT_EQ(tool.name, "Bash");
    EXPECT_EQ(tool.input.at("command").string_value(), "ls");

    auto result = decode_stream_content(json::parse(
        R"({"type": "tool_result", "id": "t-1", "tool": "Bash", "output": "a.txt",
            "success": true})"));
    const auto &r = std::get<ToolResultContent>(result);
    EXPECT_TRUE(r.success);
    EXPECT_FALSE(r.is_error.has_value());
}

TEST(ServerCodec, UsageAcceptsWholeFloats) {
    auto content = decode_stream_content(json::parse(R"({
        "type": "usage", "inputTokens": 1200.0, "outputTokens": 300,
        "totalCost": 0.0125, "contextUsed": 50000, "contextLimit": 200000
    })"));
    const auto &usage = std::get<UsageContent>(content);
    EXPECT_EQ(usage.input_tokens, 1200);
    EXPECT_EQ(usage.total_tokens(), 1500);
    EXPECT_DOUBLE_EQ(usage.context_percentage(), 25.0);
    EXPECT_FALSE(usage.cache_read_tokens.has_value());

    EXPECT_THROW(decode_stream_content(json{{"type", "usage"},
                                            {"inputTokens", 1.5},
                                            {"outputTokens", 1}}),
                 DecodeError);
}

TEST(ServerCodec, StateContent) {
    auto content = decode_stream_content(
        json{{"type", "state"}, {"state", "waiting_permission"}, {"tool", "Bash"}});
    const auto &state = std::get<StateContent>(content);
    EXPECT_EQ(state.state, AgentState::WaitingPermission);
    EXPECT_EQ(state.tool, "Bash");

    EXPECT_THROW(decode_stream_content(json{{"type", "state"}, {"state", "dreaming"}}),
                 DecodeError);
}

TEST(ServerCodec, PermissionRequestTopLevelAndInStream) {
    const json request = {{"id", "perm-1"},
                          {"tool", "Bash"},
                          {"input", {{"command", "rm -rf build"}}},
                          {"options", {"allow", "deny", "always"}}};

    json top = request;
    top["type"] = "permission";
    auto msg = decode_server_message(top);
    const auto &perm = std::get<PermissionRequest>(msg);
    EXPECT_EQ(perm.id, "perm-1");
    EXPECT_EQ(perm.options, (std::vector<std::string>{"allow", "deny", "always"}));
    EXPECT_EQ(perm.description(), "Run command: rm -rf build");

    json inner = request;
    inner["type"] = "permission";
    auto streamed = decode_server_message(
        json{{"type", "stream"}, {"id", "s"}, {"timestamp", "t"}, {"message", inner}});
    EXPECT_EQ(std::get<PermissionRequest>(std::get<StreamMessage>(streamed).content), perm);
}

TEST(ServerCodec, QuestionRequest) {
    auto msg = decode_server_message(json::parse(R"({
        "type": "question", "id": "q-1",
        "questions": [{
            "question": "Which database?", "header": "Storage", "multiSelect": true,
            "options": [{"label": "sqlite"}, {"label": "postgres", "description": "server"}]
        }]
    })"));
    const auto &question = std::get<QuestionRequest>(msg);
    ASSERT_EQ(question.questions.size(), 1u);
    EXPECT_TRUE(question.questions[0].multi_select);
    ASSERT_EQ(question.questions[0].options.size(), 2u);
    EXPECT_FALSE(question.questions[0].options[0].description.has_value());
    EXPECT_EQ(question.questions[0].options[1].description, "server");
}

TEST(ServerCodec, SessionEventAndHistory) {
    auto event = decode_server_message(json{{"type", "session_event"},
                                            {"action", "created"},
                                            {"projectPath", "/proj"},
                                            {"sessionId", "sess-2"}});
    EXPECT_EQ(std::get<SessionEventMessage>(event).action, SessionAction::Created);

    auto history = decode_server_message(json::parse(R"({
        "type": "history", "hasMore": true, "cursor": "c-1",
        "messages": [
            {"type": "user", "content": "hi"},
            {"type": "assistant", "content": "hello",
             "toolUse": [{"tool": "Read", "input": {"file_path": "a.txt"}, "result": "ok"}]}
        ]
    })"));
    const auto &h = std::get<HistoryMessage>(history);
    EXPECT_TRUE(h.has_more);
    ASSERT_EQ(h.messages.size(), 2u);
    ASSERT_TRUE(h.messages[1].tool_use.has_value());
    EXPECT_EQ((*h.messages[1].tool_use)[0].tool, "Read");
}

TEST(ServerCodec, ErrorMessage) {
    auto msg = decode_server_message(json{{"type", "error"},
                                          {"code", "rate_limited"},
                                          {"message", "Too many requests"},
                                          {"retryAfter", 30.0}});
    const auto &error = std::get<ErrorMessage>(msg);
    EXPECT_EQ(error.code, "rate_limited");
    EXPECT_FALSE(error.recoverable);
    EXPECT_EQ(error.retry_after, 30);
}

TEST(ServerCodec, SmallMessages) {
    EXPECT_EQ(std::get<PermissionModeChangedMessage>(
                  decode_server_message(json{{"type", "permission_mode_changed"},
                                             {"mode", "bypassPermissions"}}))
                  .mode,
              PermissionMode::BypassPermissions);
    auto model = decode_server_message(
        json{{"type", "model_changed"}, {"model", "opus"}, {"previousModel", "haiku"}});
    EXPECT_EQ(std::get<ModelChangedMessage>(model).previous_model, "haiku");
    EXPECT_TRUE(std::holds_alternative<QueueClearedMessage>(
        decode_server_message(json{{"type", "queue_cleared"}})));
    EXPECT_FALSE(std::get<PongMessage>(decode_server_message(json{{"type", "pong"}}))
                     .server_time.has_value());
    EXPECT_TRUE(std::holds_alternative<InterruptedMessage>(
        decode_server_message(json{{"type", "interrupted"}})));
}

TEST(ServerCodec, UnknownTypeIsStructuredFailure) {
    try {
        decode_server_message(json{{"type", "mystery"}});
        FAIL() << "expected DecodeError";
    } catch (const DecodeError &e) {
        EXPECT_EQ(e.kind(), DecodeErrorKind::UnrecognizedType);
        EXPECT_EQ(e.type(), "mystery");
    }

    EXPECT_EQ(server_decode_error(json{{"type", "stream"},
                                       {"id", "s"},
                                       {"timestamp", "t"},
                                       {"message", {{"type", "hologram"}}}}),
              DecodeErrorKind::UnrecognizedType);
}

TEST(ServerCodec, MalformedInput) {
    try {
        decode_server_message(std::string("{\"type\": "));
        FAIL() << "expected DecodeError";
    } catch (const DecodeError &e) {
        EXPECT_EQ(e.kind(), DecodeErrorKind::MalformedJson);
    }
    EXPECT_EQ(server_decode_error(json::array({1, 2})), DecodeErrorKind::MalformedJson);
    EXPECT_EQ(server_decode_error(json{{"id", "x"}}), DecodeErrorKind::MissingType);
    EXPECT_EQ(server_decode_error(json{{"type", 7}}), DecodeErrorKind::MissingType);
}

TEST(ServerCodec, MissingOrMistypedField) {
    EXPECT_EQ(server_decode_error(json{{"type", "connected"}, {"agentId", "a"}}),
              DecodeErrorKind::InvalidField);
    EXPECT_EQ(server_decode_error(json{{"type", "queued"}, {"position", "first"}}),
              DecodeErrorKind::InvalidField);
    EXPECT_EQ(server_decode_error(json{{"type", "permission_mode_changed"}, {"mode", "yolo"}}),
              DecodeErrorKind::InvalidField);
    EXPECT_EQ(server_decode_error(json{{"type", "session_event"},
                                       {"action", "archived"},
                                       {"projectPath", "/p"},
                                       {"sessionId", "s"}}),
              DecodeErrorKind::InvalidField);
}

TEST(ServerCodec, NullOptionalIsAbsent) {
    auto msg = decode_server_message(
        json{{"type", "model_changed"}, {"model", "opus"}, {"previousModel", nullptr}});
    EXPECT_FALSE(std::get<ModelChangedMessage>(msg).previous_model.has_value());
}
