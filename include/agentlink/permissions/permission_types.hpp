#pragma once

#include "agentlink/protocol/messages.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <optional>
#include <set>
#include <string>

namespace agentlink::permissions {

using protocol::PermissionMode;

/// Server-wide defaults.
struct GlobalPermissions {
    bool bypass_all = false;
    PermissionMode default_mode = PermissionMode::Default;

    bool operator==(const GlobalPermissions &) const = default;
};

/// Per-project policy. Unset fields defer to lower-priority layers.
struct ProjectPermissions {
    std::optional<PermissionMode> permission_mode;
    std::optional<bool> bypass_all;
    std::set<std::string> always_allow;
    std::set<std::string> always_deny;

    bool operator==(const ProjectPermissions &) const = default;
};

/// Full policy as served by the policy store, keyed by project path.
struct PermissionConfig {
    GlobalPermissions global;
    std::map<std::string, ProjectPermissions> projects;

    [[nodiscard]] const ProjectPermissions *project(const std::string &project_path) const {
        auto it = projects.find(project_path);
        return it == projects.end() ? nullptr : &it->second;
    }

    bool operator==(const PermissionConfig &) const = default;
};

struct GlobalPermissionsUpdate {
    std::optional<bool> bypass_all;
    std::optional<PermissionMode> default_mode;
};

/// Lists, when present, replace the stored list.
struct ProjectPermissionsUpdate {
    std::optional<PermissionMode> permission_mode;
    std::optional<bool> bypass_all;
    std::optional<std::set<std::string>> always_allow;
    std::optional<std::set<std::string>> always_deny;
};

/// Partial update sent with PUT. Absent fields are left unchanged.
struct PermissionConfigUpdate {
    std::optional<GlobalPermissionsUpdate> global;
    std::map<std::string, ProjectPermissionsUpdate> projects;
};

/// Tools auto-approved in acceptEdits mode.
const std::set<std::string> &accept_edits_tools();

/// Deny list first, then allow list, then the mode.
bool is_tool_auto_approved(const std::string &tool, PermissionMode mode,
                           const std::set<std::string> &always_allow = {},
                           const std::set<std::string> &always_deny = {});

// JSON uses the policy store's snake_case keys.
nlohmann::json to_json(const PermissionConfig &config);
nlohmann::json to_json(const PermissionConfigUpdate &update);

/// Throws std::runtime_error on a mistyped field. Missing fields take defaults.
PermissionConfig permission_config_from_json(const nlohmann::json &j);

} // namespace agentlink::permissions
