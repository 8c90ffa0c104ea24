#include "agentlink/permissions/permission_manager.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>

namespace agentlink::permissions {

namespace {

bool is_ready(const std::shared_future<PermissionConfig> &future) {
    return future.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

bool has_exception(const std::shared_future<PermissionConfig> &future) {
    try {
        future.get();
        return false;
    } catch (const std::exception &) {
        return true;
    }
}

} // namespace

PermissionManager::PermissionManager(PolicyStore &store, LocalOverrideStore *local)
    : store_(store), local_(local) {}

PermissionManager::~PermissionManager() {
    std::shared_future<PermissionConfig> inflight;
    std::vector<std::shared_future<PermissionConfig>> retired;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        inflight = std::move(inflight_);
        retired = std::move(retired_);
    }
    if (inflight.valid()) {
        inflight.wait();
    }
    for (auto &future : retired) {
        future.wait();
    }
}

std::shared_future<PermissionConfig> PermissionManager::load_config() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (cache_) {
        std::promise<PermissionConfig> ready;
        ready.set_value(*cache_);
        return ready.get_future().share();
    }

    if (inflight_.valid() && inflight_generation_ == generation_ &&
        !(is_ready(inflight_) && has_exception(inflight_))) {
        return inflight_;
    }

    // Finished fetches no longer touch mutex_, so dropping them here is safe.
    retired_.erase(std::remove_if(retired_.begin(), retired_.end(), is_ready), retired_.end());
    if (inflight_.valid()) {
        retired_.push_back(std::move(inflight_));
    }

    const uint64_t generation = generation_;
    inflight_generation_ = generation;
    inflight_ =
        std::async(std::launch::async, [this, generation] { return fetch(generation); }).share();
    return inflight_;
}

PermissionConfig PermissionManager::fetch(uint64_t generation) {
    PermissionConfig config;
    try {
        config = store_.fetch();
    } catch (const PolicyStoreError &e) {
        if (e.kind() != PolicyStoreErrorKind::NotFound) {
            std::fprintf(stderr, "[Permissions] Failed to load config: %s\n", e.what());
            throw;
        }
        std::printf("[Permissions] No server config, using defaults\n");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (generation == generation_) {
        cache_ = std::make_shared<const PermissionConfig>(config);
    }
    return config;
}

std::shared_ptr<const PermissionConfig> PermissionManager::cached_config() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cache_;
}

void PermissionManager::invalidate_cache() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++generation_;
    cache_.reset();
}

std::shared_ptr<const PermissionConfig> PermissionManager::current_config() const {
    std::shared_future<PermissionConfig> reload;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cache_ || !inflight_.valid() || inflight_generation_ != generation_) {
            return cache_;
        }
        reload = inflight_;
    }

    try {
        return std::make_shared<const PermissionConfig>(reload.get());
    } catch (const std::exception &e) {
        std::fprintf(stderr, "[Permissions] Reload failed, no server config: %s\n", e.what());
        return nullptr;
    }
}

void PermissionManager::update_config(const PermissionConfigUpdate &update) {
    store_.update(update);
    invalidate_cache();
    load_config().get();
}

void PermissionManager::set_global_default_mode(PermissionMode mode) {
    PermissionConfigUpdate update;
    update.global = GlobalPermissionsUpdate{std::nullopt, mode};
    update_config(update);
}

void PermissionManager::set_global_bypass_all(bool bypass) {
    PermissionConfigUpdate update;
    update.global = GlobalPermissionsUpdate{bypass, std::nullopt};
    update_config(update);
}

void PermissionManager::set_project_mode(const std::string &project_path, PermissionMode mode) {
    PermissionConfigUpdate update;
    update.projects[project_path].permission_mode = mode;
    update_config(update);
}

void PermissionManager::enable_project_bypass(const std::string &project_path) {
    PermissionConfigUpdate update;
    update.projects[project_path].bypass_all = true;
    update_config(update);
}

void PermissionManager::disable_project_bypass(const std::string &project_path) {
    PermissionConfigUpdate update;
    update.projects[project_path].bypass_all = false;
    update_config(update);
}

std::set<std::string> PermissionManager::current_tool_list(const std::string &project_path,
                                                           bool deny_list) {
    auto snapshot = cached_config();
    PermissionConfig loaded;
    const PermissionConfig *config = snapshot.get();
    if (config == nullptr) {
        loaded = load_config().get();
        config = &loaded;
    }
    const auto *project = config->project(project_path);
    if (project == nullptr) {
        return {};
    }
    return deny_list ? project->always_deny : project->always_allow;
}

void PermissionManager::add_always_allow(const std::string &tool,
                                         const std::string &project_path) {
    auto tools = current_tool_list(project_path, false);
    tools.insert(tool);
    PermissionConfigUpdate update;
    update.projects[project_path].always_allow = std::move(tools);
    update_config(update);
}

void PermissionManager::remove_always_allow(const std::string &tool,
                                            const std::string &project_path) {
    auto tools = current_tool_list(project_path, false);
    tools.erase(tool);
    PermissionConfigUpdate update;
    update.projects[project_path].always_allow = std::move(tools);
    update_config(update);
}

void PermissionManager::add_always_deny(const std::string &tool,
                                        const std::string &project_path) {
    auto tools = current_tool_list(project_path, true);
    tools.insert(tool);
    PermissionConfigUpdate update;
    update.projects[project_path].always_deny = std::move(tools);
    update_config(update);
}

void PermissionManager::remove_always_deny(const std::string &tool,
                                           const std::string &project_path) {
    auto tools = current_tool_list(project_path, true);
    tools.erase(tool);
    PermissionConfigUpdate update;
    update.projects[project_path].always_deny = std::move(tools);
    update_config(update);
}

PermissionMode
PermissionManager::resolve_permission_mode(const std::string &project_path,
                                           std::optional<PermissionMode> session_override,
                                           std::optional<PermissionMode> local_project_override,
                                           std::optional<PermissionMode> global_app_setting) const {
    if (session_override) {
        return *session_override;
    }
    if (local_project_override) {
        return *local_project_override;
    }
    return resolve_from(current_config().get(), project_path, global_app_setting);
}

PermissionMode PermissionManager::resolve_from(const PermissionConfig *config,
                                               const std::string &project_path,
                                               std::optional<PermissionMode> global_app_setting) {
    if (config) {
        if (const auto *project = config->project(project_path)) {
            if (project->bypass_all.value_or(false)) {
                return PermissionMode::BypassPermissions;
            }
            if (project->permission_mode) {
                return *project->permission_mode;
            }
        }
    }

    if (global_app_setting) {
        return *global_app_setting;
    }

    if (config) {
        if (config->global.bypass_all) {
            return PermissionMode::BypassPermissions;
        }
        return config->global.default_mode;
    }
    return PermissionMode::Default;
}

PermissionMode
PermissionManager::effective_mode(const std::string &project_path,
                                  std::optional<PermissionMode> session_override) const {
    std::optional<PermissionMode> local_project;
    std::optional<PermissionMode> app_setting;
    if (local_ != nullptr) {
        local_project = local_->project_mode(project_path);
        app_setting = local_->app_mode();
    }
    return resolve_permission_mode(project_path, session_override, local_project, app_setting);
}

bool PermissionManager::should_auto_approve(const std::string &tool,
                                            const std::string &project_path,
                                            std::optional<PermissionMode> session_override) const {
    // One snapshot for both the lists and the mode.
    const auto config = current_config();
    const ProjectPermissions *project = config ? config->project(project_path) : nullptr;

    PermissionMode mode;
    if (session_override) {
        mode = *session_override;
    } else if (auto local = local_ ? local_->project_mode(project_path) : std::nullopt) {
        mode = *local;
    } else {
        mode = resolve_from(config.get(), project_path,
                            local_ ? local_->app_mode() : std::nullopt);
    }

    static const std::set<std::string> kEmpty;
    return is_tool_auto_approved(tool, mode, project ? project->always_allow : kEmpty,
                                 project ? project->always_deny : kEmpty);
}

bool PermissionManager::is_tool_denied(const std::string &tool,
                                       const std::string &project_path) const {
    return always_deny_list(project_path).count(tool) > 0;
}

std::set<std::string> PermissionManager::always_allow_list(const std::string &project_path) const {
    const auto config = current_config();
    if (!config) {
        return {};
    }
    const auto *project = config->project(project_path);
    return project ? project->always_allow : std::set<std::string>{};
}

std::set<std::string> PermissionManager::always_deny_list(const std::string &project_path) const {
    const auto config = current_config();
    if (!config) {
        return {};
    }
    const auto *project = config->project(project_path);
    return project ? project->always_deny : std::set<std::string>{};
}

void PermissionManager::set_session_mode(const std::string &session_id, PermissionMode mode) {
    std::lock_guard<std::mutex> lock(mutex_);
    session_modes_[session_id] = mode;
}

void PermissionManager::clear_session_mode(const std::string &session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    session_modes_.erase(session_id);
}

std::optional<PermissionMode> PermissionManager::session_mode(const std::string &session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = session_modes_.find(session_id);
    if (it == session_modes_.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace agentlink::permissions
