#include "agentlink/protocol/connection_error.hpp"

#include <algorithm>
#include <cctype>

namespace agentlink::protocol {

namespace {

std::string to_lower(std::string_view value) {
    std::string out(value);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

// Codes the server uses for generic agent failures; they carry their own
// message and recoverable flag.
constexpr const char *kGenericServerCodes[] = {
    "invalid_message",   "no_agent",          "agent_busy",
    "project_not_found", "permission_denied", "agent_error",
};

} // namespace

const char *connection_error_kind_name(ConnectionErrorKind kind) {
    switch (kind) {
    case ConnectionErrorKind::ServerAtCapacity:
        return "serverAtCapacity";
    case ConnectionErrorKind::AgentTimedOut:
        return "agentTimedOut";
    case ConnectionErrorKind::ConnectionReplaced:
        return "connectionReplaced";
    case ConnectionErrorKind::QueueFull:
        return "queueFull";
    case ConnectionErrorKind::RateLimited:
        return "rateLimited";
    case ConnectionErrorKind::ReconnectFailed:
        return "reconnectFailed";
    case ConnectionErrorKind::NetworkUnavailable:
        return "networkUnavailable";
    case ConnectionErrorKind::InvalidServerUrl:
        return "invalidServerURL";
    case ConnectionErrorKind::SessionNotFound:
        return "sessionNotFound";
    case ConnectionErrorKind::SessionInvalid:
        return "sessionInvalid";
    case ConnectionErrorKind::SessionExpired:
        return "sessionExpired";
    case ConnectionErrorKind::AuthenticationFailed:
        return "authenticationFailed";
    case ConnectionErrorKind::ServerError:
        return "serverError";
    case ConnectionErrorKind::ConnectionFailed:
        return "connectionFailed";
    case ConnectionErrorKind::ProtocolError:
        return "protocolError";
    case ConnectionErrorKind::Unknown:
    default:
        return "unknown";
    }
}

ConnectionError ConnectionError::server_at_capacity() {
    return ConnectionError(ConnectionErrorKind::ServerAtCapacity);
}

ConnectionError ConnectionError::agent_timed_out() {
    return ConnectionError(ConnectionErrorKind::AgentTimedOut);
}

ConnectionError ConnectionError::connection_replaced() {
    return ConnectionError(ConnectionErrorKind::ConnectionReplaced);
}

ConnectionError ConnectionError::queue_full() {
    return ConnectionError(ConnectionErrorKind::QueueFull);
}

ConnectionError ConnectionError::rate_limited(int64_t retry_after_seconds) {
    ConnectionError error(ConnectionErrorKind::RateLimited);
    error.retry_after_seconds_ = retry_after_seconds;
    return error;
}

ConnectionError ConnectionError::reconnect_failed() {
    return ConnectionError(ConnectionErrorKind::ReconnectFailed);
}

ConnectionError ConnectionError::network_unavailable() {
    return ConnectionError(ConnectionErrorKind::NetworkUnavailable);
}

ConnectionError ConnectionError::invalid_server_url() {
    return ConnectionError(ConnectionErrorKind::InvalidServerUrl);
}

ConnectionError ConnectionError::session_not_found() {
    return ConnectionError(ConnectionErrorKind::SessionNotFound);
}

ConnectionError ConnectionError::session_invalid() {
    return ConnectionError(ConnectionErrorKind::SessionInvalid);
}

ConnectionError ConnectionError::session_expired() {
    return ConnectionError(ConnectionErrorKind::SessionExpired);
}

ConnectionError ConnectionError::authentication_failed() {
    return ConnectionError(ConnectionErrorKind::AuthenticationFailed);
}

ConnectionError ConnectionError::server_error(std::string code, std::string message,
                                              std::optional<bool> recoverable) {
    ConnectionError error(ConnectionErrorKind::ServerError);
    error.code_ = std::move(code);
    error.detail_ = std::move(message);
    error.recoverable_ = recoverable;
    return error;
}

ConnectionError ConnectionError::connection_failed(std::string detail) {
    ConnectionError error(ConnectionErrorKind::ConnectionFailed);
    error.detail_ = std::move(detail);
    return error;
}

ConnectionError ConnectionError::protocol_error(std::string detail) {
    ConnectionError error(ConnectionErrorKind::ProtocolError);
    error.detail_ = std::move(detail);
    return error;
}

ConnectionError ConnectionError::unknown(std::string detail) {
    ConnectionError error(ConnectionErrorKind::Unknown);
    error.detail_ = std::move(detail);
    return error;
}

bool ConnectionError::is_retryable() const {
    switch (kind_) {
    case ConnectionErrorKind::ServerAtCapacity:
    case ConnectionErrorKind::RateLimited:
    case ConnectionErrorKind::NetworkUnavailable:
    case ConnectionErrorKind::ConnectionFailed:
        return true;
    case ConnectionErrorKind::ServerError:
        return recoverable_.value_or(false);
    default:
        return false;
    }
}

bool ConnectionError::requires_user_action() const {
    switch (kind_) {
    case ConnectionErrorKind::ConnectionReplaced:
    case ConnectionErrorKind::SessionNotFound:
    case ConnectionErrorKind::SessionInvalid:
    case ConnectionErrorKind::AuthenticationFailed:
        return true;
    default:
        return false;
    }
}

std::string ConnectionError::description() const {
    switch (kind_) {
    case ConnectionErrorKind::ServerAtCapacity:
        return "Server is at capacity. Please try again later.";
    case ConnectionErrorKind::AgentTimedOut:
        return "Session timed out due to inactivity.";
    case ConnectionErrorKind::ConnectionReplaced:
        return "Session opened on another device.";
    case ConnectionErrorKind::QueueFull:
        return "Input queue is full. Please wait.";
    case ConnectionErrorKind::RateLimited:
        return "Rate limited. Retry in " + std::to_string(retry_after_seconds_) + " seconds.";
    case ConnectionErrorKind::ReconnectFailed:
        return "Failed to reconnect after multiple attempts.";
    case ConnectionErrorKind::NetworkUnavailable:
        return "No network connection available.";
    case ConnectionErrorKind::InvalidServerUrl:
        return "Invalid server URL.";
    case ConnectionErrorKind::SessionNotFound:
        return "Session not found.";
    case ConnectionErrorKind::SessionInvalid:
        return "Session is corrupted and cannot be restored.";
    case ConnectionErrorKind::SessionExpired:
        return "Session expired.";
    case ConnectionErrorKind::AuthenticationFailed:
        return "Authentication failed.";
    case ConnectionErrorKind::ServerError:
        return detail_;
    case ConnectionErrorKind::ConnectionFailed:
        return "Connection failed: " + detail_;
    case ConnectionErrorKind::ProtocolError:
        return "Protocol error: " + detail_;
    case ConnectionErrorKind::Unknown:
    default:
        return detail_.empty() ? "Unknown error." : detail_;
    }
}

ConnectionError classify_server_error(std::string_view code, const std::string &message,
                                      std::optional<int64_t> retry_after,
                                      std::optional<bool> recoverable) {
    const std::string normalized = to_lower(code);

    if (normalized == "max_agents_reached") {
        return ConnectionError::server_at_capacity();
    }
    if (normalized == "agent_not_found") {
        return ConnectionError::agent_timed_out();
    }
    if (normalized == "connection_replaced" || normalized == "cursor_evicted") {
        return ConnectionError::connection_replaced();
    }
    if (normalized == "queue_full") {
        return ConnectionError::queue_full();
    }
    if (normalized == "rate_limited") {
        return ConnectionError::rate_limited(
            retry_after.value_or(ConnectionError::kDefaultRetryAfterSeconds));
    }
    if (normalized == "session_not_found") {
        return ConnectionError::session_not_found();
    }
    if (normalized == "session_invalid" || normalized == "cursor_invalid") {
        return ConnectionError::session_invalid();
    }
    if (normalized == "session_expired") {
        return ConnectionError::session_expired();
    }
    if (normalized == "authentication_failed") {
        return ConnectionError::authentication_failed();
    }
    for (const char *generic : kGenericServerCodes) {
        if (normalized == generic) {
            return ConnectionError::server_error(std::string(code), message, recoverable);
        }
    }
    return ConnectionError::protocol_error(message);
}

ConnectionError classify_transport_failure(const std::string &reason) {
    const std::string lowered = to_lower(reason);
    for (const char *marker : {"network is unreachable", "network unreachable",
                               "not connected to the internet", "no route to host"}) {
        if (lowered.find(marker) != std::string::npos) {
            return ConnectionError::network_unavailable();
        }
    }
    return ConnectionError::connection_failed(reason);
}

} // namespace agentlink::protocol
