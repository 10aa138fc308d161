#include "common/config_helpers.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <limits>

namespace {

std::optional<bool> InterpretBool(const stella::json::Value& value) {
    if (value.is_boolean()) {
        return value.get<bool>();
    }
    if (value.is_number_integer()) {
        return value.get<long long>() != 0;
    }
    if (value.is_number_float()) {
        return value.get<double>() != 0.0;
    }
    if (value.is_string()) {
        std::string text = value.get<std::string>();
        std::transform(text.begin(), text.end(), text.begin(),
                       [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
        if (text == "true" || text == "1" || text == "yes" || text == "on") {
            return true;
        }
        if (text == "false" || text == "0" || text == "no" || text == "off") {
            return false;
        }
    }
    return std::nullopt;
}

std::optional<int64_t> InterpretInt(const stella::json::Value& value) {
    if (value.is_number_integer()) {
        return value.get<int64_t>();
    }
    if (value.is_number_float()) {
        const double raw = value.get<double>();
        if (std::isfinite(raw) && std::floor(raw) == raw
            && raw >= static_cast<double>(std::numeric_limits<int64_t>::min())
            && raw <= static_cast<double>(std::numeric_limits<int64_t>::max())) {
            return static_cast<int64_t>(raw);
        }
        return std::nullopt;
    }
    if (value.is_string()) {
        try {
            std::size_t consumed = 0;
            const std::string text = value.get<std::string>();
            const long long parsed = std::stoll(text, &consumed);
            if (consumed == text.size()) {
                return static_cast<int64_t>(parsed);
            }
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

} // namespace

namespace stella::config {

const json::Value* ValueAtPath(const json::Value& root, std::string_view path) {
    if (path.empty()) {
        return &root;
    }

    const json::Value* current = &root;
    std::size_t position = 0;

    while (position < path.size()) {
        const std::size_t dot = path.find('.', position);
        const bool lastSegment = (dot == std::string_view::npos);
        const std::string segment(path.substr(position, lastSegment ? std::string_view::npos : dot - position));
        if (segment.empty()) {
            return nullptr;
        }

        std::string key = segment;
        std::optional<std::size_t> arrayIndex;
        const auto bracketPos = segment.find('[');
        if (bracketPos != std::string::npos) {
            key = segment.substr(0, bracketPos);
            const auto closingPos = segment.find(']', bracketPos);
            if (closingPos == std::string::npos || closingPos != segment.size() - 1) {
                return nullptr;
            }
            const std::string indexText = segment.substr(bracketPos + 1, closingPos - bracketPos - 1);
            if (indexText.empty()
                || !std::all_of(indexText.begin(), indexText.end(),
                                [](unsigned char ch) { return std::isdigit(ch) != 0; })) {
                return nullptr;
            }
            try {
                arrayIndex = static_cast<std::size_t>(std::stoul(indexText));
            } catch (const std::out_of_range&) {
                return nullptr;
            }
        }

        if (!key.empty()) {
            if (!current->is_object()) {
                return nullptr;
            }
            const auto it = current->find(key);
            if (it == current->end()) {
                return nullptr;
            }
            current = &(*it);
        }

        if (arrayIndex.has_value()) {
            if (!current->is_array() || *arrayIndex >= current->size()) {
                return nullptr;
            }
            current = &((*current)[*arrayIndex]);
        }

        if (lastSegment) {
            break;
        }

        position = dot + 1;
    }

    return current;
}

std::optional<json::Value> LoadJsonFile(const std::filesystem::path& path,
                                        const std::string& label,
                                        spdlog::level::level_enum missingLevel) {
    if (!std::filesystem::exists(path)) {
        spdlog::log(missingLevel, "config: {} not found: {}", label, path.string());
        return std::nullopt;
    }

    std::ifstream stream(path);
    if (!stream) {
        spdlog::error("config: Failed to open {}: {}", label, path.string());
        return std::nullopt;
    }

    try {
        json::Value value;
        stream >> value;
        return value;
    } catch (const json::Exception& e) {
        spdlog::error("config: Failed to parse {}: {}", label, e.what());
        return std::nullopt;
    }
}

bool ReadBoolConfig(const json::Value& root, std::initializer_list<const char*> paths, bool defaultValue) {
    for (const char* path : paths) {
        if (const auto* value = ValueAtPath(root, path)) {
            if (auto parsed = InterpretBool(*value)) {
                return *parsed;
            }
            spdlog::warn("Config '{}' cannot be interpreted as boolean", path);
        }
    }
    return defaultValue;
}

int64_t ReadIntConfig(const json::Value& root, std::initializer_list<const char*> paths, int64_t defaultValue) {
    for (const char* path : paths) {
        if (const auto* value = ValueAtPath(root, path)) {
            if (auto parsed = InterpretInt(*value)) {
                return *parsed;
            }
            spdlog::warn("Config '{}' cannot be interpreted as integer", path);
        }
    }
    return defaultValue;
}

std::optional<int64_t> ReadOptionalIntConfig(const json::Value& root, const char* path) {
    const auto* value = ValueAtPath(root, path);
    if (!value || value->is_null()) {
        return std::nullopt;
    }
    auto parsed = InterpretInt(*value);
    if (!parsed) {
        spdlog::warn("Config '{}' cannot be interpreted as integer; ignoring", path);
    }
    return parsed;
}

std::string ReadStringConfig(const json::Value& root, const char* path, const std::string& defaultValue) {
    if (const auto* value = ValueAtPath(root, path)) {
        if (value->is_string()) {
            return value->get<std::string>();
        }
        spdlog::warn("Config '{}' is not a string", path);
    }
    return defaultValue;
}

} // namespace stella::config
