#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace stella::json {

using Value = nlohmann::json;

// Keeps keys in insertion order; used wherever the emitted key order is part of the format.
using OrderedValue = nlohmann::ordered_json;

using Exception = nlohmann::json::exception;

inline Value Parse(std::string_view text) {
    return Value::parse(text);
}

inline Value Object() {
    return Value::object();
}

inline std::string Dump(const Value& value, int indent = -1) {
    return value.dump(indent);
}

inline std::string Dump(const OrderedValue& value, int indent = -1) {
    return value.dump(indent);
}

} // namespace stella::json
