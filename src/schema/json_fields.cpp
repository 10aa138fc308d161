#include "schema/json_fields.hpp"

#include "common/error.hpp"

namespace {

using stella::json::Value;

const Value* Lookup(const Value& object, const char* key) {
    const auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return nullptr;
    }
    return &(*it);
}

[[noreturn]] void ThrowTypeMismatch(const std::string& context, const char* key, const char* expected,
                                    const Value& actual) {
    throw stella::ParseError(context + "." + key + ": expected " + expected + ", got " + actual.type_name());
}

} // namespace

namespace stella::schema::fields {

json::Value ParseDocument(std::string_view text, const char* label) {
    try {
        return json::Parse(text);
    } catch (const json::Exception& e) {
        throw ParseError(std::string("Invalid JSON in ") + label + ": " + e.what());
    }
}

std::string DumpDocument(const json::OrderedValue& value, const char* label) {
    try {
        return json::Dump(value, 2);
    } catch (const json::Exception& e) {
        throw ValidationError(std::string("Cannot serialize ") + label + ": " + e.what());
    }
}

void RequireObject(const json::Value& value, const std::string& context) {
    if (!value.is_object()) {
        throw ParseError(context + ": expected object, got " + value.type_name());
    }
}

const json::Value* FindObject(const json::Value& object, const char* key, const std::string& context) {
    const auto* value = Lookup(object, key);
    if (value && !value->is_object()) {
        ThrowTypeMismatch(context, key, "object", *value);
    }
    return value;
}

std::string ReadString(const json::Value& object, const char* key, const std::string& defaultValue,
                       const std::string& context) {
    const auto value = ReadOptionalString(object, key, context);
    return value ? *value : defaultValue;
}

std::optional<std::string> ReadOptionalString(const json::Value& object, const char* key,
                                              const std::string& context) {
    const auto* value = Lookup(object, key);
    if (!value) {
        return std::nullopt;
    }
    if (!value->is_string()) {
        ThrowTypeMismatch(context, key, "string", *value);
    }
    return value->get<std::string>();
}

int64_t ReadInt(const json::Value& object, const char* key, int64_t defaultValue, const std::string& context) {
    const auto value = ReadOptionalInt(object, key, context);
    return value ? *value : defaultValue;
}

std::optional<int64_t> ReadOptionalInt(const json::Value& object, const char* key, const std::string& context) {
    const auto* value = Lookup(object, key);
    if (!value) {
        return std::nullopt;
    }
    if (value->is_number_unsigned()) {
        const auto raw = value->get<uint64_t>();
        if (raw > static_cast<uint64_t>(INT64_MAX)) {
            throw ParseError(context + "." + key + ": integer out of range");
        }
        return static_cast<int64_t>(raw);
    }
    if (!value->is_number_integer()) {
        ThrowTypeMismatch(context, key, "integer", *value);
    }
    return value->get<int64_t>();
}

double ReadNumber(const json::Value& object, const char* key, double defaultValue, const std::string& context) {
    const auto* value = Lookup(object, key);
    if (!value) {
        return defaultValue;
    }
    if (!value->is_number()) {
        ThrowTypeMismatch(context, key, "number", *value);
    }
    return value->get<double>();
}

std::array<double, 3> ReadVec3(const json::Value& object, const char* key, const std::array<double, 3>& defaultValue,
                               const std::string& context) {
    const auto* value = Lookup(object, key);
    if (!value) {
        return defaultValue;
    }
    if (!value->is_array() || value->size() != 3) {
        ThrowTypeMismatch(context, key, "array of 3 numbers", *value);
    }
    std::array<double, 3> out{};
    for (std::size_t i = 0; i < 3; ++i) {
        const auto& component = (*value)[i];
        if (!component.is_number()) {
            ThrowTypeMismatch(context, key, "array of 3 numbers", *value);
        }
        out[i] = component.get<double>();
    }
    return out;
}

std::vector<std::string> ReadStringList(const json::Value& object, const char* key,
                                        const std::vector<std::string>& defaultValue, const std::string& context) {
    const auto* value = Lookup(object, key);
    if (!value) {
        return defaultValue;
    }
    if (!value->is_array()) {
        ThrowTypeMismatch(context, key, "array of strings", *value);
    }
    std::vector<std::string> out;
    out.reserve(value->size());
    for (const auto& item : *value) {
        if (!item.is_string()) {
            ThrowTypeMismatch(context, key, "array of strings", *value);
        }
        out.push_back(item.get<std::string>());
    }
    return out;
}

std::map<std::string, bool> ReadBoolMap(const json::Value& object, const char* key,
                                        const std::map<std::string, bool>& defaultValue,
                                        const std::string& context) {
    const auto* value = FindObject(object, key, context);
    if (!value) {
        return defaultValue;
    }
    std::map<std::string, bool> out;
    for (const auto& [name, flag] : value->items()) {
        if (!flag.is_boolean()) {
            throw ParseError(context + "." + key + "." + name + ": expected boolean, got " + flag.type_name());
        }
        out[name] = flag.get<bool>();
    }
    return out;
}

std::map<std::string, std::string> ReadStringMap(const json::Value& object, const char* key,
                                                 const std::string& context) {
    const auto* value = FindObject(object, key, context);
    if (!value) {
        return {};
    }
    std::map<std::string, std::string> out;
    for (const auto& [name, entry] : value->items()) {
        if (!entry.is_string()) {
            throw ParseError(context + "." + key + "." + name + ": expected string, got " + entry.type_name());
        }
        out[name] = entry.get<std::string>();
    }
    return out;
}

} // namespace stella::schema::fields
