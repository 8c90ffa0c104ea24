#include "agentlink/protocol/json_value.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>

namespace agentlink::protocol {

std::string JsonValue::string_value() const {
    if (value_.is_string()) {
        return value_.get<std::string>();
    }
    if (value_.is_object()) {
        auto it = value_.find("stdout");
        if (it != value_.end() && it->is_string()) {
            return it->get<std::string>();
        }
    }
    return value_.dump();
}

std::optional<std::string> JsonValue::string_or_null() const {
    if (!value_.is_string()) {
        return std::nullopt;
    }
    return value_.get<std::string>();
}

std::optional<int64_t> JsonValue::int_value() const {
    if (value_.is_number_integer()) {
        return value_.get<int64_t>();
    }
    if (value_.is_number_float()) {
        const double d = value_.get<double>();
        // Whole floats such as 3.0 are accepted; 3.5 is not an integer.
        if (std::isfinite(d) && std::trunc(d) == d &&
            d >= static_cast<double>(std::numeric_limits<int64_t>::min()) &&
            d < static_cast<double>(std::numeric_limits<int64_t>::max())) {
            return static_cast<int64_t>(d);
        }
    }
    return std::nullopt;
}

std::optional<double> JsonValue::double_value() const {
    if (!value_.is_number()) {
        return std::nullopt;
    }
    return value_.get<double>();
}

std::optional<bool> JsonValue::bool_value() const {
    if (!value_.is_boolean()) {
        return std::nullopt;
    }
    return value_.get<bool>();
}

std::optional<std::vector<JsonValue>> JsonValue::array_value() const {
    if (!value_.is_array()) {
        return std::nullopt;
    }
    std::vector<JsonValue> items;
    items.reserve(value_.size());
    for (const auto &item : value_) {
        items.emplace_back(item);
    }
    return items;
}

std::optional<std::map<std::string, JsonValue>> JsonValue::dict_value() const {
    if (!value_.is_object()) {
        return std::nullopt;
    }
    return to_json_object(value_);
}

JsonObject to_json_object(const nlohmann::json &value) {
    if (!value.is_object()) {
        throw std::invalid_argument("Expected a JSON object");
    }
    JsonObject object;
    for (auto &[key, item] : value.items()) {
        object.emplace(key, JsonValue(item));
    }
    return object;
}

nlohmann::json from_json_object(const JsonObject &object) {
    nlohmann::json out = nlohmann::json::object();
    for (const auto &[key, item] : object) {
        out[key] = item.json();
    }
    return out;
}

} // namespace agentlink::protocol
