#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace agentlink {

struct ReconnectConfig {
    int base_delay_ms = 1000;
    int max_delay_ms = 16000;
    int max_jitter_ms = 500;
    int max_attempts = 5;
};

struct OfflineQueueConfig {
    std::string path = "agentlink-pending-actions.json";
    int ttl_seconds = 120;
};

struct PermissionsConfig {
    std::string local_overrides_path = "agentlink-permission-overrides.json";
};

/// Runtime configuration. Every field has a default; a config file only needs
/// the keys it changes.
struct BridgeConfig {
    std::string server_url = "http://127.0.0.1:3100";
    std::string project_path;
    std::optional<std::string> model;
    std::optional<std::string> session_id;
    std::string auth_token;
    int ping_interval_seconds = 30;
    ReconnectConfig reconnect;
    OfflineQueueConfig offline_queue;
    PermissionsConfig permissions;
};

/// Overlay `j` onto the defaults. Unknown keys are ignored; a known key with
/// the wrong JSON type throws std::runtime_error naming the key.
BridgeConfig config_from_json(const nlohmann::json &j);

/// Read a JSON config file. Throws std::runtime_error with the path and reason.
BridgeConfig load_config(const std::string &path);

} // namespace agentlink
