#pragma once

#include "agentlink/permissions/local_overrides.hpp"
#include "agentlink/permissions/permission_types.hpp"
#include "agentlink/permissions/policy_store.hpp"

#include <cstdint>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace agentlink::permissions {

/// Resolves the effective permission mode for a project and decides whether a
/// tool call can be approved without asking.
///
/// Layers, highest first: session override, device-local project override,
/// server project config, device-wide app setting, server global config. The
/// server config is fetched lazily and cached as an immutable snapshot.
class PermissionManager {
  public:
    /// `local` may be null, in which case layers 2 and 4 are empty unless
    /// passed explicitly.
    explicit PermissionManager(PolicyStore &store, LocalOverrideStore *local = nullptr);
    ~PermissionManager();

    PermissionManager(const PermissionManager &) = delete;
    PermissionManager &operator=(const PermissionManager &) = delete;

    /// Cached config, or a fetch shared by every caller while it is in flight.
    /// A NotFound store error resolves to an empty config; other store errors
    /// are rethrown from get().
    std::shared_future<PermissionConfig> load_config();

    /// Last loaded snapshot, or null.
    [[nodiscard]] std::shared_ptr<const PermissionConfig> cached_config() const;
    [[nodiscard]] bool has_config() const { return cached_config() != nullptr; }

    /// Drop the cache. A fetch already in flight will not repopulate it.
    void invalidate_cache();

    /// Send a partial update, invalidate, and wait for the reload. Errors from
    /// the write propagate and leave the cache untouched; a failed reload
    /// propagates after the write has landed.
    void update_config(const PermissionConfigUpdate &update);

    void set_global_default_mode(PermissionMode mode);
    void set_global_bypass_all(bool bypass);
    void set_project_mode(const std::string &project_path, PermissionMode mode);
    void enable_project_bypass(const std::string &project_path);
    void disable_project_bypass(const std::string &project_path);
    void add_always_allow(const std::string &tool, const std::string &project_path);
    void remove_always_allow(const std::string &tool, const std::string &project_path);
    void add_always_deny(const std::string &tool, const std::string &project_path);
    void remove_always_deny(const std::string &tool, const std::string &project_path);

    /// Priority chain over the cached server config. Each layer applies only
    /// when every higher layer is absent. While a reload for the current
    /// cache generation is in flight this waits for it; it never starts a
    /// fetch itself.
    [[nodiscard]] PermissionMode
    resolve_permission_mode(const std::string &project_path,
                            std::optional<PermissionMode> session_override = std::nullopt,
                            std::optional<PermissionMode> local_project_override = std::nullopt,
                            std::optional<PermissionMode> global_app_setting = std::nullopt) const;

    /// resolve_permission_mode() with layers 2 and 4 taken from the local store.
    [[nodiscard]] PermissionMode
    effective_mode(const std::string &project_path,
                   std::optional<PermissionMode> session_override = std::nullopt) const;

    [[nodiscard]] bool
    should_auto_approve(const std::string &tool, const std::string &project_path,
                        std::optional<PermissionMode> session_override = std::nullopt) const;

    [[nodiscard]] bool is_tool_denied(const std::string &tool,
                                      const std::string &project_path) const;

    [[nodiscard]] std::set<std::string> always_allow_list(const std::string &project_path) const;
    [[nodiscard]] std::set<std::string> always_deny_list(const std::string &project_path) const;

    /// Per-session mode set by the server (permission_mode_changed).
    void set_session_mode(const std::string &session_id, PermissionMode mode);
    void clear_session_mode(const std::string &session_id);
    [[nodiscard]] std::optional<PermissionMode> session_mode(const std::string &session_id) const;

  private:
    PermissionConfig fetch(uint64_t generation);

    // Cached snapshot, or the result of the current-generation reload once it
    // lands. Null when neither exists or the reload failed.
    std::shared_ptr<const PermissionConfig> current_config() const;

    // Layers 3 to 6 of the priority chain.
    static PermissionMode resolve_from(const PermissionConfig *config,
                                       const std::string &project_path,
                                       std::optional<PermissionMode> global_app_setting);

    // Current allow or deny list for a project, loading the config if needed.
    std::set<std::string> current_tool_list(const std::string &project_path, bool deny_list);

    PolicyStore &store_;
    LocalOverrideStore *local_;

    mutable std::mutex mutex_;
    uint64_t generation_ = 0;
    std::shared_ptr<const PermissionConfig> cache_;
    std::map<std::string, PermissionMode> session_modes_;
    // Futures from std::async block on destruction until the fetch finishes,
    // so they are released outside mutex_ and joined before destruction.
    std::shared_future<PermissionConfig> inflight_;
    uint64_t inflight_generation_ = 0;
    std::vector<std::shared_future<PermissionConfig>> retired_;
};

} // namespace agentlink::permissions
