#include "agentlink/bridge.hpp"

#include "support/fakes.hpp"

#include <gtest/gtest.h>

using namespace agentlink;
using agentlink::testing::FakePolicyStore;
using agentlink::testing::FakeTransport;
using agentlink::testing::ManualClock;
using agentlink::testing::ManualScheduler;
using agentlink::testing::MemoryActionStore;
using nlohmann::json;

namespace {

const std::string kProject = "/home/dev/app";

const json kConnected = {{"type", "connected"}, {"agentId", "agent-1"}, {"sessionId", "sess-1"}};

json permission_request(const std::string &id, const std::string &tool) {
    return {{"type", "permission"},
            {"id", id},
            {"tool", tool},
            {"input", {{"file_path", "/home/dev/app/main.cpp"}}},
            {"options", {"allow", "deny", "always"}}};
}

BridgeConfig test_config() {
    BridgeConfig config;
    config.server_url = "http://localhost:3100";
    config.project_path = kProject;
    return config;
}

struct Harness {
    FakeTransport transport;
    ManualScheduler scheduler;
    ManualClock clock;
    StaticConnectivity connectivity{true};
    MemoryActionStore actions;
    FakePolicyStore policy;
    permissions::LocalOverrideStore local;
    std::vector<protocol::PermissionRequest> prompts;
    Bridge bridge{test_config(),
                  {transport, scheduler, clock, connectivity, actions, policy, &local}};

    Harness() {
        bridge.permission_stream().subscribe(
            [this](const protocol::PermissionRequest &r) { prompts.push_back(r); });
    }

    void connect() {
        bridge.connect();
        transport.fire_open();
        transport.fire_json(kConnected);
        bridge.permissions().load_config().get();
    }

    // Response messages sent after the start message.
    std::vector<json> responses() const {
        std::vector<json> out;
        for (size_t i = 0; i < transport.sent.size(); ++i) {
            auto msg = transport.sent_json(i);
            if (msg["type"] == "permission_response") {
                out.push_back(msg);
            }
        }
        return out;
    }
};

} // namespace

TEST(Bridge, QueuesDecisionsWhileDisconnected) {
    Harness h;

    EXPECT_FALSE(h.bridge.respond_to_permission("req-1", protocol::PermissionChoice::Allow));
    EXPECT_FALSE(h.bridge.respond_to_permission("req-2", protocol::PermissionChoice::Always));
    EXPECT_FALSE(h.bridge.respond_to_permission("req-3", protocol::PermissionChoice::Deny));

    ASSERT_EQ(h.actions.stored.size(), 3u);
    EXPECT_EQ(h.actions.stored[0].request_id, "req-1");
    EXPECT_TRUE(h.actions.stored[0].approved);
    EXPECT_TRUE(h.actions.stored[1].approved);
    EXPECT_FALSE(h.actions.stored[2].approved);
    EXPECT_TRUE(h.transport.sent.empty());
}

TEST(Bridge, FlushesQueueOnConnect) {
    Harness h;
    h.bridge.respond_to_permission("req-1", protocol::PermissionChoice::Allow);
    h.bridge.respond_to_permission("req-2", protocol::PermissionChoice::Deny);

    h.connect();

    auto sent = h.responses();
    ASSERT_EQ(sent.size(), 2u);
    EXPECT_EQ(sent[0]["id"], "req-1");
    EXPECT_EQ(sent[0]["choice"], "allow");
    EXPECT_EQ(sent[1]["id"], "req-2");
    EXPECT_EQ(sent[1]["choice"], "deny");
    EXPECT_FALSE(h.bridge.offline_queue().has_pending());
    EXPECT_TRUE(h.actions.stored.empty());
}

TEST(Bridge, ExpiredDecisionsAreDroppedOnConnect) {
    Harness h;
    h.bridge.respond_to_permission("req-old", protocol::PermissionChoice::Allow);
    h.clock.advance(std::chrono::seconds(121));
    h.bridge.respond_to_permission("req-new", protocol::PermissionChoice::Allow);

    h.connect();

    auto sent = h.responses();
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0]["id"], "req-new");
    EXPECT_FALSE(h.bridge.offline_queue().has_pending());
}

TEST(Bridge, SendsDecisionWhenConnected) {
    Harness h;
    h.connect();

    EXPECT_TRUE(h.bridge.respond_to_permission("req-1", protocol::PermissionChoice::Always));
    EXPECT_EQ(h.transport.last_sent()["choice"], "always");
    EXPECT_FALSE(h.bridge.offline_queue().has_pending());
}

TEST(Bridge, QueuesWhenSendFails) {
    Harness h;
    h.connect();
    h.transport.fail_sends = true;

    EXPECT_FALSE(h.bridge.respond_to_permission("req-1", protocol::PermissionChoice::Allow));
    EXPECT_EQ(h.bridge.offline_queue().pending_count(), 1u);
}

TEST(Bridge, FailedQueueSaveStaysInsideHandler) {
    Harness h;
    h.policy.config.global.default_mode = protocol::PermissionMode::AcceptEdits;
    h.connect();
    h.transport.fail_sends = true;
    h.actions.fail_saves = true;

    EXPECT_NO_THROW(h.transport.fire_json(permission_request("perm-1", "Edit")));
    EXPECT_FALSE(h.bridge.offline_queue().has_pending());
    EXPECT_TRUE(protocol::is_connected(h.bridge.client().state()));

    h.transport.fail_sends = false;
    h.actions.fail_saves = false;
    h.transport.fire_json(permission_request("perm-2", "Edit"));
    auto sent = h.responses();
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0]["id"], "perm-2");
}

TEST(Bridge, ReplaysQueueAfterNetworkRestored) {
    Harness h;
    h.connect();

    h.connectivity.set_connected(false);
    h.transport.fire_close(1006, "");
    EXPECT_FALSE(h.bridge.respond_to_permission("req-1", protocol::PermissionChoice::Allow));

    h.connectivity.set_connected(true);
    h.bridge.on_network_restored();
    EXPECT_EQ(h.transport.open_count, 2);
    h.transport.fire_open();
    h.transport.fire_json(kConnected);

    auto sent = h.responses();
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0]["id"], "req-1");
    EXPECT_FALSE(h.bridge.offline_queue().has_pending());
}

TEST(Bridge, AutoApprovesByPolicy) {
    Harness h;
    h.policy.config.global.default_mode = protocol::PermissionMode::AcceptEdits;
    h.connect();

    h.transport.fire_json(permission_request("perm-1", "Edit"));

    auto sent = h.responses();
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0]["id"], "perm-1");
    EXPECT_EQ(sent[0]["choice"], "allow");
    EXPECT_TRUE(h.prompts.empty());
}

TEST(Bridge, DeniesToolsOnDenyList) {
    Harness h;
    h.policy.config.global.bypass_all = true;
    h.policy.config.projects[kProject].always_deny = {"Bash"};
    h.connect();

    h.transport.fire_json(permission_request("perm-1", "Bash"));

    auto sent = h.responses();
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0]["choice"], "deny");
    EXPECT_TRUE(h.prompts.empty());
}

TEST(Bridge, PublishesRequestsNeedingAUser) {
    Harness h;
    h.connect();

    h.transport.fire_json(permission_request("perm-1", "Bash"));

    EXPECT_TRUE(h.responses().empty());
    ASSERT_EQ(h.prompts.size(), 1u);
    EXPECT_EQ(h.prompts[0].id, "perm-1");
    EXPECT_EQ(h.prompts[0].tool, "Bash");
}

TEST(Bridge, HandlesPermissionInsideStream) {
    Harness h;
    h.connect();

    json stream = {{"type", "stream"},
                   {"id", "s-1"},
                   {"timestamp", "2024-01-01T00:00:00Z"},
                   {"message", permission_request("perm-2", "Write")}};
    h.transport.fire_json(stream);

    ASSERT_EQ(h.prompts.size(), 1u);
    EXPECT_EQ(h.prompts[0].id, "perm-2");
}

TEST(Bridge, ServerModeChangeBecomesSessionOverride) {
    Harness h;
    h.connect();
    EXPECT_FALSE(h.bridge.session_permission_mode().has_value());

    h.transport.fire_json({{"type", "permission_mode_changed"}, {"mode", "bypassPermissions"}});
    EXPECT_EQ(h.bridge.session_permission_mode(), protocol::PermissionMode::BypassPermissions);
    EXPECT_EQ(h.bridge.permissions().session_mode("sess-1"),
              protocol::PermissionMode::BypassPermissions);

    h.transport.fire_json(permission_request("perm-1", "Bash"));
    auto sent = h.responses();
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0]["choice"], "allow");
}

TEST(Bridge, LocalOverrideApplies) {
    Harness h;
    h.local.set_project_mode(kProject, protocol::PermissionMode::AcceptEdits);
    h.connect();

    h.transport.fire_json(permission_request("perm-1", "Write"));
    ASSERT_EQ(h.responses().size(), 1u);
    EXPECT_TRUE(h.prompts.empty());
}

TEST(Bridge, OutboundIntents) {
    Harness h;
    EXPECT_THROW(h.bridge.send_input("hello"), protocol::NotConnectedError);

    h.connect();
    h.bridge.send_input("hello", std::nullopt, std::string("think"));
    auto input = h.transport.last_sent();
    EXPECT_EQ(input["type"], "input");
    EXPECT_EQ(input["text"], "hello");
    EXPECT_EQ(input["thinkingMode"], "think");

    h.bridge.subscribe_sessions();
    EXPECT_EQ(h.transport.last_sent(),
              (json{{"type", "subscribe_sessions"}, {"projectPath", kProject}}));

    h.bridge.subscribe_sessions(std::string("/elsewhere"));
    EXPECT_EQ(h.transport.last_sent()["projectPath"], "/elsewhere");

    h.bridge.set_permission_mode(protocol::PermissionMode::AcceptEdits);
    EXPECT_EQ(h.transport.last_sent(),
              (json{{"type", "set_permission_mode"}, {"mode", "acceptEdits"}}));

    h.bridge.set_model("opus");
    EXPECT_EQ(h.transport.last_sent(), (json{{"type", "set_model"}, {"model", "opus"}}));

    h.bridge.interrupt();
    EXPECT_EQ(h.transport.last_sent()["type"], "interrupt");
    h.bridge.stop();
    EXPECT_EQ(h.transport.last_sent()["type"], "stop");
}

TEST(Bridge, BackoffFromConfig) {
    ReconnectConfig reconnect;
    reconnect.base_delay_ms = 250;
    reconnect.max_delay_ms = 4000;
    reconnect.max_jitter_ms = 0;
    reconnect.max_attempts = 3;

    auto policy = backoff_from_config(reconnect);
    EXPECT_EQ(policy.base_delay, std::chrono::milliseconds(250));
    EXPECT_EQ(policy.max_delay, std::chrono::milliseconds(4000));
    EXPECT_EQ(policy.max_jitter, std::chrono::milliseconds(0));
    EXPECT_EQ(policy.max_attempts, 3);
}
