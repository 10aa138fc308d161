#pragma once

#include "common/json.hpp"

#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Typed field readers shared by the schema records. Absent or null fields yield the
// default; a present field of the wrong type throws ParseError naming `context.key`.
namespace stella::schema::fields {

json::Value ParseDocument(std::string_view text, const char* label);

// Pretty-prints with a two-space indent. Text that cannot be emitted as UTF-8 throws ValidationError.
std::string DumpDocument(const json::OrderedValue& value, const char* label);

void RequireObject(const json::Value& value, const std::string& context);

// Returns nullptr when `key` is absent or null, otherwise the object stored there.
const json::Value* FindObject(const json::Value& object, const char* key, const std::string& context);

std::string ReadString(const json::Value& object, const char* key, const std::string& defaultValue,
                       const std::string& context);
std::optional<std::string> ReadOptionalString(const json::Value& object, const char* key,
                                              const std::string& context);
int64_t ReadInt(const json::Value& object, const char* key, int64_t defaultValue, const std::string& context);
std::optional<int64_t> ReadOptionalInt(const json::Value& object, const char* key, const std::string& context);
double ReadNumber(const json::Value& object, const char* key, double defaultValue, const std::string& context);
std::array<double, 3> ReadVec3(const json::Value& object, const char* key, const std::array<double, 3>& defaultValue,
                               const std::string& context);
std::vector<std::string> ReadStringList(const json::Value& object, const char* key,
                                        const std::vector<std::string>& defaultValue, const std::string& context);
std::map<std::string, bool> ReadBoolMap(const json::Value& object, const char* key,
                                        const std::map<std::string, bool>& defaultValue,
                                        const std::string& context);
std::map<std::string, std::string> ReadStringMap(const json::Value& object, const char* key,
                                                 const std::string& context);

} // namespace stella::schema::fields
