#include "agentlink/permissions/local_overrides.hpp"

#include <nlohmann/json.hpp>

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <system_error>

namespace agentlink::permissions {

LocalOverrideStore::LocalOverrideStore(std::string path) : path_(std::move(path)) { load(); }

std::optional<PermissionMode>
LocalOverrideStore::project_mode(const std::string &project_path) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = projects_.find(project_path);
    if (it == projects_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void LocalOverrideStore::set_project_mode(const std::string &project_path,
                                          std::optional<PermissionMode> mode) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (mode) {
        projects_[project_path] = *mode;
    } else {
        projects_.erase(project_path);
    }
    save_locked();
}

std::optional<PermissionMode> LocalOverrideStore::app_mode() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return app_mode_;
}

void LocalOverrideStore::set_app_mode(std::optional<PermissionMode> mode) {
    std::lock_guard<std::mutex> lock(mutex_);
    app_mode_ = mode;
    save_locked();
}

void LocalOverrideStore::load() {
    if (path_.empty()) {
        return;
    }
    std::ifstream in(path_);
    if (!in) {
        return;
    }

    auto doc = nlohmann::json::parse(in, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        std::fprintf(stderr, "[Permissions] Ignoring corrupt override file: %s\n", path_.c_str());
        return;
    }

    if (doc.contains("app_mode") && doc["app_mode"].is_string()) {
        app_mode_ = protocol::parse_permission_mode(doc["app_mode"].get<std::string>());
    }
    if (doc.contains("projects") && doc["projects"].is_object()) {
        for (auto &[project, mode_json] : doc["projects"].items()) {
            if (!mode_json.is_string()) {
                continue;
            }
            if (auto mode = protocol::parse_permission_mode(mode_json.get<std::string>())) {
                projects_[project] = *mode;
            }
        }
    }
}

void LocalOverrideStore::save_locked() const {
    if (path_.empty()) {
        return;
    }

    nlohmann::json doc;
    nlohmann::json projects = nlohmann::json::object();
    for (const auto &[project, mode] : projects_) {
        projects[project] = protocol::permission_mode_name(mode);
    }
    doc["projects"] = std::move(projects);
    if (app_mode_) {
        doc["app_mode"] = protocol::permission_mode_name(*app_mode_);
    }

    const std::filesystem::path target(path_);
    if (target.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(target.parent_path(), ec);
    }
    std::ofstream out(path_, std::ios::trunc);
    if (!out) {
        throw std::runtime_error("Cannot write override file: " + path_);
    }
    out << doc.dump(2);
}

} // namespace agentlink::permissions
