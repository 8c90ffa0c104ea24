#include "agentlink/permissions/permission_types.hpp"

#include <stdexcept>

namespace agentlink::permissions {

namespace {

PermissionMode parse_mode(const nlohmann::json &j, const std::string &where) {
    if (!j.is_string()) {
        throw std::runtime_error("'" + where + "' must be a string");
    }
    auto mode = protocol::parse_permission_mode(j.get<std::string>());
    if (!mode) {
        throw std::runtime_error("Unknown permission mode '" + j.get<std::string>() + "' in '" +
                                 where + "'");
    }
    return *mode;
}

std::set<std::string> parse_tool_list(const nlohmann::json &j, const std::string &where) {
    if (!j.is_array()) {
        throw std::runtime_error("'" + where + "' must be an array");
    }
    std::set<std::string> tools;
    for (const auto &tool : j) {
        if (!tool.is_string()) {
            throw std::runtime_error("'" + where + "' must contain strings");
        }
        tools.insert(tool.get<std::string>());
    }
    return tools;
}

bool has(const nlohmann::json &j, const char *key) { return j.contains(key) && !j[key].is_null(); }

} // namespace

const std::set<std::string> &accept_edits_tools() {
    static const std::set<std::string> kTools = {"Read", "Write", "Edit", "Glob", "Grep", "LS"};
    return kTools;
}

bool is_tool_auto_approved(const std::string &tool, PermissionMode mode,
                           const std::set<std::string> &always_allow,
                           const std::set<std::string> &always_deny) {
    if (always_deny.count(tool) > 0) {
        return false;
    }
    if (always_allow.count(tool) > 0) {
        return true;
    }
    switch (mode) {
    case PermissionMode::BypassPermissions:
        return true;
    case PermissionMode::AcceptEdits:
        return accept_edits_tools().count(tool) > 0;
    case PermissionMode::Default:
    default:
        return false;
    }
}

nlohmann::json to_json(const PermissionConfig &config) {
    nlohmann::json projects = nlohmann::json::object();
    for (const auto &[path, project] : config.projects) {
        nlohmann::json p = nlohmann::json::object();
        if (project.permission_mode) {
            p["permission_mode"] = protocol::permission_mode_name(*project.permission_mode);
        }
        if (project.bypass_all) {
            p["bypass_all"] = *project.bypass_all;
        }
        if (!project.always_allow.empty()) {
            p["always_allow"] = project.always_allow;
        }
        if (!project.always_deny.empty()) {
            p["always_deny"] = project.always_deny;
        }
        projects[path] = std::move(p);
    }
    return {{"global",
             {{"bypass_all", config.global.bypass_all},
              {"default_mode", protocol::permission_mode_name(config.global.default_mode)}}},
            {"projects", std::move(projects)}};
}

nlohmann::json to_json(const PermissionConfigUpdate &update) {
    nlohmann::json out = nlohmann::json::object();
    if (update.global) {
        nlohmann::json g = nlohmann::json::object();
        if (update.global->bypass_all) {
            g["bypass_all"] = *update.global->bypass_all;
        }
        if (update.global->default_mode) {
            g["default_mode"] = protocol::permission_mode_name(*update.global->default_mode);
        }
        out["global"] = std::move(g);
    }
    if (!update.projects.empty()) {
        nlohmann::json projects = nlohmann::json::object();
        for (const auto &[path, project] : update.projects) {
            nlohmann::json p = nlohmann::json::object();
            if (project.permission_mode) {
                p["permission_mode"] = protocol::permission_mode_name(*project.permission_mode);
            }
            if (project.bypass_all) {
                p["bypass_all"] = *project.bypass_all;
            }
            if (project.always_allow) {
                p["always_allow"] = *project.always_allow;
            }
            if (project.always_deny) {
                p["always_deny"] = *project.always_deny;
            }
            projects[path] = std::move(p);
        }
        out["projects"] = std::move(projects);
    }
    return out;
}

PermissionConfig permission_config_from_json(const nlohmann::json &j) {
    if (!j.is_object()) {
        throw std::runtime_error("Permission config is not an object");
    }

    PermissionConfig config;
    if (has(j, "global")) {
        const auto &g = j["global"];
        if (!g.is_object()) {
            throw std::runtime_error("'global' must be an object");
        }
        if (has(g, "bypass_all")) {
            if (!g["bypass_all"].is_boolean()) {
                throw std::runtime_error("'global.bypass_all' must be a boolean");
            }
            config.global.bypass_all = g["bypass_all"].get<bool>();
        }
        if (has(g, "default_mode")) {
            config.global.default_mode = parse_mode(g["default_mode"], "global.default_mode");
        }
    }

    if (has(j, "projects")) {
        const auto &projects = j["projects"];
        if (!projects.is_object()) {
            throw std::runtime_error("'projects' must be an object");
        }
        for (const auto &[path, p] : projects.items()) {
            if (!p.is_object()) {
                throw std::runtime_error("Project '" + path + "' must be an object");
            }
            ProjectPermissions project;
            if (has(p, "permission_mode")) {
                project.permission_mode =
                    parse_mode(p["permission_mode"], path + ".permission_mode");
            }
            if (has(p, "bypass_all")) {
                if (!p["bypass_all"].is_boolean()) {
                    throw std::runtime_error("'" + path + ".bypass_all' must be a boolean");
                }
                project.bypass_all = p["bypass_all"].get<bool>();
            }
            if (has(p, "always_allow")) {
                project.always_allow = parse_tool_list(p["always_allow"], path + ".always_allow");
            }
            if (has(p, "always_deny")) {
                project.always_deny = parse_tool_list(p["always_deny"], path + ".always_deny");
            }
            config.projects.emplace(path, std::move(project));
        }
    }
    return config;
}

} // namespace agentlink::permissions
