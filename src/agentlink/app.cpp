#include "agentlink/app.hpp"

#include "agentlink/data/action_store.hpp"
#include "agentlink/permissions/local_overrides.hpp"
#include "agentlink/permissions/policy_store.hpp"
#include "agentlink/protocol/scheduler.hpp"
#include "agentlink/protocol/websocket_transport.hpp"

#include <cstdio>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <type_traits>

namespace agentlink {

namespace {

void print_usage(const char *argv0) {
    std::printf("Usage: %s [config.json]\n", argv0);
}

std::string arg_after(const std::string &line, size_t prefix_len) {
    if (line.size() <= prefix_len) {
        return {};
    }
    auto start = line.find_first_not_of(' ', prefix_len);
    return start == std::string::npos ? std::string() : line.substr(start);
}

} // namespace

App::App() = default;
App::~App() = default;

int App::run(int argc, char *argv[]) {
    if (argc > 1 && (std::strcmp(argv[1], "--help") == 0 || std::strcmp(argv[1], "-h") == 0)) {
        print_usage(argv[0]);
        return 0;
    }

    try {
        if (argc > 1) {
            config_ = load_config(argv[1]);
        }
    } catch (const std::runtime_error &e) {
        std::fprintf(stderr, "[agentlink] %s\n", e.what());
        return 1;
    }
    if (config_.project_path.empty()) {
        config_.project_path = std::filesystem::current_path().string();
    }

    protocol::WebSocketTransport transport(config_.ping_interval_seconds);
    protocol::ThreadScheduler scheduler;
    SystemClock clock;
    data::FileActionStore action_store(config_.offline_queue.path);
    permissions::HttpPolicyStore policy_store(config_.server_url, config_.auth_token);
    permissions::LocalOverrideStore local_overrides(config_.permissions.local_overrides_path);

    Bridge bridge(config_, BridgeDependencies{transport, scheduler, clock, connectivity_,
                                              action_store, policy_store, &local_overrides});

    bridge.client().message_stream().subscribe(
        [this](const protocol::ServerMessage &message) { log_message(message); });
    bridge.client().error_stream().subscribe([](const protocol::ConnectionError &error) {
        std::fprintf(stderr, "[agentlink] %s: %s\n",
                     protocol::connection_error_kind_name(error.kind()),
                     error.description().c_str());
    });
    bridge.permission_stream().subscribe([](const protocol::PermissionRequest &request) {
        std::printf("[agentlink] Permission needed (%s): %s  -> /allow, /always or /deny %s\n",
                    request.id.c_str(), request.description().c_str(), request.id.c_str());
    });

    if (bridge.offline_queue().has_pending()) {
        std::printf("[agentlink] %zu decision(s) waiting to be sent\n",
                    bridge.offline_queue().pending_count());
    }

    try {
        bridge.connect();
    } catch (const protocol::ConnectionException &e) {
        std::fprintf(stderr, "[agentlink] Cannot connect: %s\n", e.what());
        scheduler.shutdown();
        return 1;
    }

    std::string line;
    while (std::getline(std::cin, line)) {
        if (line.empty()) {
            continue;
        }
        try {
            if (!handle_command(bridge, line)) {
                break;
            }
        } catch (const protocol::NotConnectedError &) {
            std::fprintf(stderr, "[agentlink] Not connected (%s)\n",
                         protocol::display_text(bridge.client().state()).c_str());
        } catch (const std::runtime_error &e) {
            std::fprintf(stderr, "[agentlink] %s\n", e.what());
        }
    }

    bridge.disconnect(true);
    scheduler.shutdown();
    return 0;
}

bool App::handle_command(Bridge &bridge, const std::string &line) {
    if (line[0] != '/') {
        bridge.send_input(line);
        return true;
    }

    if (line == "/quit") {
        return false;
    }
    if (line == "/interrupt") {
        bridge.interrupt();
    } else if (line == "/stop") {
        bridge.stop();
    } else if (line == "/cancel") {
        bridge.cancel_queued();
    } else if (line == "/ping") {
        bridge.client().ping();
    } else if (line == "/offline") {
        connectivity_.set_connected(false);
        std::printf("[agentlink] Connectivity off\n");
    } else if (line == "/online") {
        connectivity_.set_connected(true);
        bridge.on_network_restored();
    } else if (line == "/flush") {
        auto result = bridge.flush_offline_queue();
        std::printf("[agentlink] Flushed: %zu sent, %zu expired, %zu remaining\n",
                    result.dispatched, result.expired, result.remaining);
    } else if (line.rfind("/allow ", 0) == 0) {
        bridge.respond_to_permission(arg_after(line, 7), protocol::PermissionChoice::Allow);
    } else if (line.rfind("/always ", 0) == 0) {
        bridge.respond_to_permission(arg_after(line, 8), protocol::PermissionChoice::Always);
    } else if (line.rfind("/deny ", 0) == 0) {
        bridge.respond_to_permission(arg_after(line, 6), protocol::PermissionChoice::Deny);
    } else if (line.rfind("/mode ", 0) == 0) {
        auto mode = protocol::parse_permission_mode(arg_after(line, 6));
        if (!mode) {
            std::fprintf(stderr, "[agentlink] Modes: default, acceptEdits, bypassPermissions\n");
        } else {
            bridge.set_permission_mode(*mode);
        }
    } else if (line.rfind("/model ", 0) == 0) {
        bridge.set_model(arg_after(line, 7));
    } else {
        std::fprintf(stderr, "[agentlink] Unknown command: %s\n", line.c_str());
    }
    return true;
}

void App::log_message(const protocol::ServerMessage &message) {
    std::visit(
        [&message](const auto &m) {
            using T = std::decay_t<decltype(m)>;
            if constexpr (std::is_same_v<T, protocol::StreamMessage>) {
                if (const auto *text = std::get_if<protocol::AssistantContent>(&m.content)) {
                    std::printf("%s%s", text->content.c_str(), text->is_final() ? "\n" : "");
                    std::fflush(stdout);
                } else if (const auto *tool = std::get_if<protocol::ToolUseContent>(&m.content)) {
                    std::printf("[tool] %s\n", tool->name.c_str());
                } else if (const auto *state = std::get_if<protocol::StateContent>(&m.content)) {
                    std::printf("[state] %s\n", protocol::agent_state_name(state->state));
                }
            } else if constexpr (std::is_same_v<T, protocol::ModelChangedMessage>) {
                std::printf("[agentlink] Model: %s\n", m.model.c_str());
            } else if constexpr (std::is_same_v<T, protocol::PermissionModeChangedMessage>) {
                std::printf("[agentlink] Permission mode: %s\n",
                            protocol::permission_mode_name(m.mode));
            } else if constexpr (std::is_same_v<T, protocol::QueuedMessage>) {
                std::printf("[agentlink] Input queued at position %lld\n",
                            static_cast<long long>(m.position));
            } else if constexpr (std::is_same_v<T, protocol::StoppedMessage>) {
                std::printf("[agentlink] Agent stopped: %s\n", m.reason.c_str());
            } else if constexpr (std::is_same_v<T, protocol::ErrorMessage>) {
                // Reported on the error stream.
            } else {
                std::printf("[agentlink] <%s>\n", protocol::message_type(message));
            }
        },
        message);
}

} // namespace agentlink
