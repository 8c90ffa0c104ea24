#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace agentlink::protocol {

/// Dynamic JSON value carried inside protocol messages (tool inputs, answers).
/// Integers and floating-point literals keep their original representation.
class JsonValue {
  public:
    JsonValue() = default;
    JsonValue(nlohmann::json value) : value_(std::move(value)) {}

    /// Display rendering: strings as-is, objects with a string "stdout" key
    /// render that value, everything else as compact JSON.
    [[nodiscard]] std::string string_value() const;

    [[nodiscard]] std::optional<std::string> string_or_null() const;

    /// Integers, and floating-point values with no fractional part.
    [[nodiscard]] std::optional<int64_t> int_value() const;
    [[nodiscard]] std::optional<double> double_value() const;
    [[nodiscard]] std::optional<bool> bool_value() const;
    [[nodiscard]] std::optional<std::vector<JsonValue>> array_value() const;
    [[nodiscard]] std::optional<std::map<std::string, JsonValue>> dict_value() const;

    [[nodiscard]] bool is_null() const { return value_.is_null(); }
    [[nodiscard]] const nlohmann::json &json() const { return value_; }

    bool operator==(const JsonValue &other) const { return value_ == other.value_; }

  private:
    nlohmann::json value_;
};

/// String-keyed object of dynamic values, the shape of tool inputs.
using JsonObject = std::map<std::string, JsonValue>;

/// Convert a JSON object into a JsonObject. Throws std::invalid_argument if
/// the value is not an object.
JsonObject to_json_object(const nlohmann::json &value);

nlohmann::json from_json_object(const JsonObject &object);

} // namespace agentlink::protocol
