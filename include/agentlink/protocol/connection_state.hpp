#pragma once

#include <optional>
#include <string>
#include <variant>

namespace agentlink::protocol {

struct Disconnected {
    bool operator==(const Disconnected &) const = default;
};

struct Connecting {
    bool operator==(const Connecting &) const = default;
};

struct Connected {
    std::string agent_id;

    bool operator==(const Connected &) const = default;
};

struct Reconnecting {
    int attempt = 1; // >= 1

    bool operator==(const Reconnecting &) const = default;
};

/// Lifecycle of one logical connection. Only BridgeClient drives transitions.
using ConnectionState = std::variant<Disconnected, Connecting, Connected, Reconnecting>;

/// "Disconnected", "Connecting...", "Connected", "Reconnecting (N)...".
std::string display_text(const ConnectionState &state);

inline bool is_connected(const ConnectionState &state) {
    return std::holds_alternative<Connected>(state);
}

/// True while connecting or reconnecting.
inline bool is_connecting(const ConnectionState &state) {
    return std::holds_alternative<Connecting>(state) ||
           std::holds_alternative<Reconnecting>(state);
}

inline std::optional<std::string> agent_id(const ConnectionState &state) {
    if (const auto *connected = std::get_if<Connected>(&state)) {
        return connected->agent_id;
    }
    return std::nullopt;
}

} // namespace agentlink::protocol
