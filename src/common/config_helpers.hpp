#pragma once

#include <cstdint>
#include <filesystem>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>

#include "common/json.hpp"
#include <spdlog/spdlog.h>

namespace stella::config {

// Looks up a dotted path such as "package.compressionLevel" or "levels[0].id". Returns nullptr if absent.
const json::Value* ValueAtPath(const json::Value& root, std::string_view path);

std::optional<json::Value> LoadJsonFile(const std::filesystem::path& path,
                                        const std::string& label,
                                        spdlog::level::level_enum missingLevel);

// The first path present in `root` wins. Values that cannot be interpreted are logged and fall back to the default.
bool ReadBoolConfig(const json::Value& root, std::initializer_list<const char*> paths, bool defaultValue);
int64_t ReadIntConfig(const json::Value& root, std::initializer_list<const char*> paths, int64_t defaultValue);
std::optional<int64_t> ReadOptionalIntConfig(const json::Value& root, const char* path);
std::string ReadStringConfig(const json::Value& root, const char* path, const std::string& defaultValue);

} // namespace stella::config
