#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace agentlink::protocol {

enum class ConnectionErrorKind {
    ServerAtCapacity,
    AgentTimedOut,
    ConnectionReplaced,
    QueueFull,
    RateLimited,
    ReconnectFailed,
    NetworkUnavailable,
    InvalidServerUrl,
    SessionNotFound,
    SessionInvalid,
    SessionExpired,
    AuthenticationFailed,
    ServerError,
    ConnectionFailed,
    ProtocolError,
    Unknown,
};

const char *connection_error_kind_name(ConnectionErrorKind kind);

/// Semantic connection failure published on the client's error stream.
/// Payload fields are only meaningful for the kinds that carry them.
class ConnectionError {
  public:
    static constexpr int64_t kDefaultRetryAfterSeconds = 60;

    static ConnectionError server_at_capacity();
    static ConnectionError agent_timed_out();
    static ConnectionError connection_replaced();
    static ConnectionError queue_full();
    static ConnectionError rate_limited(int64_t retry_after_seconds);
    static ConnectionError reconnect_failed();
    static ConnectionError network_unavailable();
    static ConnectionError invalid_server_url();
    static ConnectionError session_not_found();
    static ConnectionError session_invalid();
    static ConnectionError session_expired();
    static ConnectionError authentication_failed();
    static ConnectionError server_error(std::string code, std::string message,
                                        std::optional<bool> recoverable = std::nullopt);
    static ConnectionError connection_failed(std::string detail);
    static ConnectionError protocol_error(std::string detail);
    static ConnectionError unknown(std::string detail);

    [[nodiscard]] ConnectionErrorKind kind() const { return kind_; }

    /// RateLimited only.
    [[nodiscard]] int64_t retry_after_seconds() const { return retry_after_seconds_; }

    /// ServerError only.
    [[nodiscard]] const std::string &code() const { return code_; }
    [[nodiscard]] std::optional<bool> recoverable() const { return recoverable_; }

    /// Message for ServerError, detail for ConnectionFailed/ProtocolError/Unknown.
    [[nodiscard]] const std::string &detail() const { return detail_; }

    /// Worth retrying automatically.
    [[nodiscard]] bool is_retryable() const;

    /// The user must act (re-authenticate, pick another session, ...) before
    /// a reconnect can succeed.
    [[nodiscard]] bool requires_user_action() const;

    /// User-facing text.
    [[nodiscard]] std::string description() const;

    bool operator==(const ConnectionError &) const = default;

  private:
    explicit ConnectionError(ConnectionErrorKind kind) : kind_(kind) {}

    ConnectionErrorKind kind_;
    int64_t retry_after_seconds_ = 0;
    std::string code_;
    std::string detail_;
    std::optional<bool> recoverable_;
};

/// Map a server `error` code to a semantic error. Codes are matched
/// case-insensitively; unknown codes become ProtocolError(message).
ConnectionError classify_server_error(std::string_view code, const std::string &message,
                                      std::optional<int64_t> retry_after = std::nullopt,
                                      std::optional<bool> recoverable = std::nullopt);

/// Map a transport failure reason to ConnectionFailed, or NetworkUnavailable
/// when the reason reports an unreachable network.
ConnectionError classify_transport_failure(const std::string &reason);

/// Thrown where an operation must fail with a ConnectionError.
class ConnectionException : public std::runtime_error {
  public:
    explicit ConnectionException(ConnectionError error)
        : std::runtime_error(error.description()), error_(std::move(error)) {}

    [[nodiscard]] const ConnectionError &error() const { return error_; }

  private:
    ConnectionError error_;
};

} // namespace agentlink::protocol
