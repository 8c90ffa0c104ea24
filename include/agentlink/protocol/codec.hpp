#pragma once

#include "agentlink/protocol/messages.hpp"

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <string>
#include <string_view>

namespace agentlink::protocol {

enum class DecodeErrorKind {
    MalformedJson,    // not parseable, or not a JSON object
    MissingType,      // no string "type" discriminator
    UnrecognizedType, // "type" outside the known vocabulary
    InvalidField,     // required field missing or of the wrong JSON type
};

const char *decode_error_kind_name(DecodeErrorKind kind);

/// Structured decode failure. Never swallowed by the codec itself.
class DecodeError : public std::runtime_error {
  public:
    DecodeError(DecodeErrorKind kind, const std::string &message, std::string type = {});

    [[nodiscard]] DecodeErrorKind kind() const { return kind_; }

    /// The offending "type" value for UnrecognizedType, else the type being decoded.
    [[nodiscard]] const std::string &type() const { return type_; }

  private:
    DecodeErrorKind kind_;
    std::string type_;
};

/// Encode a client message as a JSON object: {"type": "...", ...payload}.
/// Absent optional fields are omitted.
nlohmann::json to_json(const ClientMessage &message);

/// Encode a client message as compact JSON text for a text frame.
std::string encode(const ClientMessage &message);

/// Decode one server message. Dispatch is on "type"; "stream" dispatches a
/// second time on "message.type". Throws DecodeError.
ServerMessage decode_server_message(const nlohmann::json &msg);
ServerMessage decode_server_message(const std::string &text);

/// Decode a client message (inverse of encode). Throws DecodeError.
ClientMessage decode_client_message(const nlohmann::json &msg);
ClientMessage decode_client_message(const std::string &text);

/// Decode the content of a stream message ({"type": "assistant", ...}).
StreamContent decode_stream_content(const nlohmann::json &msg);

} // namespace agentlink::protocol
