#pragma once

#include "agentlink/protocol/messages.hpp"

#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace agentlink::permissions {

using protocol::PermissionMode;

/// Device-local permission modes: one per project plus an optional app-wide
/// mode. Persisted as JSON after every change:
///   {"app_mode": "acceptEdits", "projects": {"/path": "default"}}
/// An empty path keeps the overrides in memory only.
class LocalOverrideStore {
  public:
    explicit LocalOverrideStore(std::string path = {});

    [[nodiscard]] std::optional<PermissionMode> project_mode(const std::string &project_path) const;

    /// nullopt clears the override.
    void set_project_mode(const std::string &project_path, std::optional<PermissionMode> mode);

    [[nodiscard]] std::optional<PermissionMode> app_mode() const;
    void set_app_mode(std::optional<PermissionMode> mode);

  private:
    void load();
    void save_locked() const;

    std::string path_;
    mutable std::mutex mutex_;
    std::map<std::string, PermissionMode> projects_;
    std::optional<PermissionMode> app_mode_;
};

} // namespace agentlink::permissions
