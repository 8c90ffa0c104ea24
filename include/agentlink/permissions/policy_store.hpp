#pragma once

#include "agentlink/permissions/permission_types.hpp"

#include <stdexcept>
#include <string>

namespace agentlink::permissions {

enum class PolicyStoreErrorKind {
    NotFound,
    Unauthorized,
    RateLimited,
    Server,
    Transport,
    InvalidResponse,
    NotConfigured,
};

const char *policy_store_error_kind_name(PolicyStoreErrorKind kind);

class PolicyStoreError : public std::runtime_error {
  public:
    PolicyStoreError(PolicyStoreErrorKind kind, const std::string &message, int status = 0)
        : std::runtime_error(message), kind_(kind), status_(status) {}

    [[nodiscard]] PolicyStoreErrorKind kind() const { return kind_; }

    /// HTTP status, or 0 when no response was received.
    [[nodiscard]] int status() const { return status_; }

  private:
    PolicyStoreErrorKind kind_;
    int status_;
};

/// Server-held permission policy. Both calls block and throw PolicyStoreError.
class PolicyStore {
  public:
    virtual ~PolicyStore() = default;

    virtual PermissionConfig fetch() = 0;
    virtual void update(const PermissionConfigUpdate &update) = 0;
};

/// GET/PUT {base_url}/permissions over ix::HttpClient.
class HttpPolicyStore : public PolicyStore {
  public:
    explicit HttpPolicyStore(std::string base_url, std::string auth_token = {},
                             int timeout_seconds = 10);

    PermissionConfig fetch() override;
    void update(const PermissionConfigUpdate &update) override;

    /// http(s) base from a server URL: ws -> http, wss -> https, bare host -> http,
    /// trailing '/' stripped.
    static std::string http_base_url(const std::string &server_url);

    /// Map a non-2xx status to an error kind.
    static PolicyStoreErrorKind classify_status(int status);

  private:
    std::string endpoint() const;

    std::string base_url_;
    std::string auth_token_;
    int timeout_seconds_;
};

} // namespace agentlink::permissions
