#include "agentlink/config.hpp"

#include <fstream>
#include <stdexcept>

namespace agentlink {

namespace {

void read_string(const nlohmann::json &j, const char *key, const std::string &prefix,
                 std::string &out) {
    if (!j.contains(key)) {
        return;
    }
    if (!j[key].is_string()) {
        throw std::runtime_error("Config key '" + prefix + key + "' must be a string");
    }
    out = j[key].get<std::string>();
}

void read_optional_string(const nlohmann::json &j, const char *key,
                          std::optional<std::string> &out) {
    if (!j.contains(key) || j[key].is_null()) {
        return;
    }
    if (!j[key].is_string()) {
        throw std::runtime_error(std::string("Config key '") + key + "' must be a string");
    }
    out = j[key].get<std::string>();
}

void read_int(const nlohmann::json &j, const char *key, const std::string &prefix, int &out) {
    if (!j.contains(key)) {
        return;
    }
    if (!j[key].is_number_integer()) {
        throw std::runtime_error("Config key '" + prefix + key + "' must be an integer");
    }
    out = j[key].get<int>();
}

const nlohmann::json *section(const nlohmann::json &j, const char *key) {
    if (!j.contains(key)) {
        return nullptr;
    }
    if (!j[key].is_object()) {
        throw std::runtime_error(std::string("Config key '") + key + "' must be an object");
    }
    return &j[key];
}

} // namespace

BridgeConfig config_from_json(const nlohmann::json &j) {
    if (!j.is_object()) {
        throw std::runtime_error("Config must be a JSON object");
    }

    BridgeConfig config;
    read_string(j, "server_url", "", config.server_url);
    read_string(j, "project_path", "", config.project_path);
    read_optional_string(j, "model", config.model);
    read_optional_string(j, "session_id", config.session_id);
    read_string(j, "auth_token", "", config.auth_token);
    read_int(j, "ping_interval_seconds", "", config.ping_interval_seconds);

    if (const auto *reconnect = section(j, "reconnect")) {
        read_int(*reconnect, "base_delay_ms", "reconnect.", config.reconnect.base_delay_ms);
        read_int(*reconnect, "max_delay_ms", "reconnect.", config.reconnect.max_delay_ms);
        read_int(*reconnect, "max_jitter_ms", "reconnect.", config.reconnect.max_jitter_ms);
        read_int(*reconnect, "max_attempts", "reconnect.", config.reconnect.max_attempts);
    }
    if (const auto *queue = section(j, "offline_queue")) {
        read_string(*queue, "path", "offline_queue.", config.offline_queue.path);
        read_int(*queue, "ttl_seconds", "offline_queue.", config.offline_queue.ttl_seconds);
    }
    if (const auto *permissions = section(j, "permissions")) {
        read_string(*permissions, "local_overrides_path", "permissions.",
                    config.permissions.local_overrides_path);
    }
    return config;
}

BridgeConfig load_config(const std::string &path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open config file: " + path);
    }
    auto doc = nlohmann::json::parse(in, nullptr, false);
    if (doc.is_discarded()) {
        throw std::runtime_error("Config file is not valid JSON: " + path);
    }
    try {
        return config_from_json(doc);
    } catch (const std::runtime_error &e) {
        throw std::runtime_error(path + ": " + e.what());
    }
}

} // namespace agentlink
