#include "agentlink/protocol/connection_state.hpp"

#include <type_traits>

namespace agentlink::protocol {

std::string display_text(const ConnectionState &state) {
    return std::visit(
        [](const auto &s) -> std::string {
            using T = std::decay_t<decltype(s)>;
            if constexpr (std::is_same_v<T, Disconnected>) {
                return "Disconnected";
            } else if constexpr (std::is_same_v<T, Connecting>) {
                return "Connecting...";
            } else if constexpr (std::is_same_v<T, Connected>) {
                return "Connected";
            } else {
                return "Reconnecting (" + std::to_string(s.attempt) + ")...";
            }
        },
        state);
}

} // namespace agentlink::protocol
