#include "agentlink/permissions/policy_store.hpp"

#include <ixwebsocket/IXHttpClient.h>

#include <cstdio>

namespace agentlink::permissions {

namespace {

bool starts_with(const std::string &s, const char *prefix) {
    return s.rfind(prefix, 0) == 0;
}

void check_response(const ix::HttpResponsePtr &response, const char *what) {
    if (!response) {
        throw PolicyStoreError(PolicyStoreErrorKind::Transport,
                               std::string(what) + ": no response");
    }
    if (response->errorCode != ix::HttpErrorCode::Ok && response->statusCode == 0) {
        throw PolicyStoreError(PolicyStoreErrorKind::Transport,
                               std::string(what) + ": " + response->errorMsg);
    }
    if (response->statusCode < 200 || response->statusCode >= 300) {
        const int status = response->statusCode;
        throw PolicyStoreError(HttpPolicyStore::classify_status(status),
                               std::string(what) + ": HTTP " + std::to_string(status), status);
    }
}

} // namespace

const char *policy_store_error_kind_name(PolicyStoreErrorKind kind) {
    switch (kind) {
    case PolicyStoreErrorKind::NotFound:
        return "not_found";
    case PolicyStoreErrorKind::Unauthorized:
        return "unauthorized";
    case PolicyStoreErrorKind::RateLimited:
        return "rate_limited";
    case PolicyStoreErrorKind::Server:
        return "server";
    case PolicyStoreErrorKind::Transport:
        return "transport";
    case PolicyStoreErrorKind::InvalidResponse:
        return "invalid_response";
    case PolicyStoreErrorKind::NotConfigured:
    default:
        return "not_configured";
    }
}

HttpPolicyStore::HttpPolicyStore(std::string base_url, std::string auth_token,
                                 int timeout_seconds)
    : base_url_(http_base_url(base_url)), auth_token_(std::move(auth_token)),
      timeout_seconds_(timeout_seconds) {}

std::string HttpPolicyStore::http_base_url(const std::string &server_url) {
    std::string url = server_url;
    if (starts_with(url, "ws://")) {
        url = "http://" + url.substr(5);
    } else if (starts_with(url, "wss://")) {
        url = "https://" + url.substr(6);
    } else if (!url.empty() && !starts_with(url, "http://") && !starts_with(url, "https://")) {
        url = "http://" + url;
    }
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url;
}

PolicyStoreErrorKind HttpPolicyStore::classify_status(int status) {
    if (status == 404) {
        return PolicyStoreErrorKind::NotFound;
    }
    if (status == 401 || status == 403) {
        return PolicyStoreErrorKind::Unauthorized;
    }
    if (status == 429) {
        return PolicyStoreErrorKind::RateLimited;
    }
    if (status >= 500) {
        return PolicyStoreErrorKind::Server;
    }
    return PolicyStoreErrorKind::InvalidResponse;
}

std::string HttpPolicyStore::endpoint() const {
    if (base_url_.empty()) {
        throw PolicyStoreError(PolicyStoreErrorKind::NotConfigured,
                               "Policy store has no server URL");
    }
    return base_url_ + "/permissions";
}

PermissionConfig HttpPolicyStore::fetch() {
    const std::string url = endpoint();

    ix::HttpClient client;
    auto args = client.createRequest(url, ix::HttpClient::kGet);
    args->connectTimeout = timeout_seconds_;
    args->transferTimeout = timeout_seconds_;
    args->extraHeaders["Accept"] = "application/json";
    if (!auth_token_.empty()) {
        args->extraHeaders["Authorization"] = "Bearer " + auth_token_;
    }

    auto response = client.get(url, args);
    check_response(response, "GET /permissions");

    auto body = nlohmann::json::parse(response->body, nullptr, false);
    if (body.is_discarded()) {
        throw PolicyStoreError(PolicyStoreErrorKind::InvalidResponse,
                               "GET /permissions: body is not JSON", response->statusCode);
    }
    try {
        return permission_config_from_json(body);
    } catch (const std::runtime_error &e) {
        throw PolicyStoreError(PolicyStoreErrorKind::InvalidResponse,
                               std::string("GET /permissions: ") + e.what(),
                               response->statusCode);
    }
}

void HttpPolicyStore::update(const PermissionConfigUpdate &update) {
    const std::string url = endpoint();

    ix::HttpClient client;
    auto args = client.createRequest(url, ix::HttpClient::kPut);
    args->connectTimeout = timeout_seconds_;
    args->transferTimeout = timeout_seconds_;
    args->extraHeaders["Content-Type"] = "application/json";
    if (!auth_token_.empty()) {
        args->extraHeaders["Authorization"] = "Bearer " + auth_token_;
    }

    auto response = client.put(url, to_json(update).dump(), args);
    check_response(response, "PUT /permissions");
    std::printf("[Permissions] Policy updated\n");
}

} // namespace agentlink::permissions
