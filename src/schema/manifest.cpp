#include "schema/manifest.hpp"

#include "common/error.hpp"
#include "schema/json_fields.hpp"

#include <chrono>
#include <ctime>

namespace stella::schema {

namespace {

constexpr const char* kContext = "manifest";

json::OrderedValue AxisToJson(const Axis& axis) {
    json::OrderedValue out = json::OrderedValue::object();
    out["up"] = axis.up;
    out["forward"] = axis.forward;
    out["handedness"] = axis.handedness;
    return out;
}

json::OrderedValue LevelReferenceToJson(const LevelReference& level) {
    json::OrderedValue out = json::OrderedValue::object();
    out["id"] = level.id;
    out["path"] = level.path;
    if (level.name) {
        out["name"] = *level.name;
    }
    return out;
}

json::OrderedValue GeneratorToJson(const Generator& generator) {
    json::OrderedValue out = json::OrderedValue::object();
    out["name"] = generator.name;
    out["version"] = generator.version;
    if (generator.gitCommit) {
        out["git_commit"] = *generator.gitCommit;
    }
    return out;
}

json::OrderedValue WorldToJson(const World& world) {
    json::OrderedValue out = json::OrderedValue::object();
    out["title"] = world.title;
    out["tags"] = world.tags;
    json::OrderedValue privacy = json::OrderedValue::object();
    for (const auto& [flag, enabled] : world.privacy) {
        privacy[flag] = enabled;
    }
    out["privacy"] = std::move(privacy);
    return out;
}

Axis AxisFromJson(const json::Value& value) {
    const std::string context = std::string(kContext) + ".axis";
    Axis axis;
    axis.up = fields::ReadString(value, "up", axis.up, context);
    axis.forward = fields::ReadString(value, "forward", axis.forward, context);
    axis.handedness = fields::ReadString(value, "handedness", axis.handedness, context);
    return axis;
}

LevelReference LevelReferenceFromJson(const json::Value& value, std::size_t index) {
    const std::string context = std::string(kContext) + ".levels[" + std::to_string(index) + "]";
    fields::RequireObject(value, context);
    LevelReference level;
    level.id = fields::ReadString(value, "id", "", context);
    level.path = fields::ReadString(value, "path", "", context);
    level.name = fields::ReadOptionalString(value, "name", context);
    return level;
}

Generator GeneratorFromJson(const json::Value& value) {
    const std::string context = std::string(kContext) + ".generator";
    Generator generator;
    generator.name = fields::ReadString(value, "name", generator.name, context);
    generator.version = fields::ReadString(value, "version", generator.version, context);
    generator.gitCommit = fields::ReadOptionalString(value, "git_commit", context);
    return generator;
}

World WorldFromJson(const json::Value& value) {
    const std::string context = std::string(kContext) + ".world";
    World world;
    world.title = fields::ReadString(value, "title", world.title, context);
    world.tags = fields::ReadStringList(value, "tags", world.tags, context);
    world.privacy = fields::ReadBoolMap(value, "privacy", world.privacy, context);
    return world;
}

} // namespace

std::string CurrentUtcTimestamp() {
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm utc{};
#if defined(_WIN32)
    gmtime_s(&utc, &now);
#else
    gmtime_r(&now, &utc);
#endif
    char buffer[32];
    const std::size_t written = std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &utc);
    return std::string(buffer, written);
}

json::OrderedValue Manifest::ToJson() const {
    json::OrderedValue out = json::OrderedValue::object();
    out["format"] = format;
    out["version"] = version;
    out["created_utc"] = createdUtc;
    out["units"] = units;
    out["axis"] = AxisToJson(axis);

    json::OrderedValue levelArray = json::OrderedValue::array();
    for (const auto& level : levels) {
        levelArray.push_back(LevelReferenceToJson(level));
    }
    out["levels"] = std::move(levelArray);

    if (generator) {
        out["generator"] = GeneratorToJson(*generator);
    }
    if (world) {
        out["world"] = WorldToJson(*world);
    }
    if (!assets.empty()) {
        json::OrderedValue assetMap = json::OrderedValue::object();
        for (const auto& [key, path] : assets) {
            assetMap[key] = path;
        }
        out["assets"] = std::move(assetMap);
    }
    return out;
}

std::string Manifest::ToCanonicalText() const {
    return fields::DumpDocument(ToJson(), "manifest.json");
}

Manifest Manifest::FromJson(const json::Value& value) {
    fields::RequireObject(value, kContext);

    Manifest manifest;
    manifest.format = fields::ReadString(value, "format", manifest.format, kContext);
    manifest.version = fields::ReadInt(value, "version", manifest.version, kContext);
    manifest.createdUtc = fields::ReadString(value, "created_utc", manifest.createdUtc, kContext);
    manifest.units = fields::ReadString(value, "units", manifest.units, kContext);

    if (const auto* axisJson = fields::FindObject(value, "axis", kContext)) {
        manifest.axis = AxisFromJson(*axisJson);
    }

    const auto levelsIt = value.find("levels");
    if (levelsIt != value.end() && !levelsIt->is_null()) {
        if (!levelsIt->is_array()) {
            throw ParseError(std::string(kContext) + ".levels: expected array, got " + levelsIt->type_name());
        }
        manifest.levels.reserve(levelsIt->size());
        for (std::size_t i = 0; i < levelsIt->size(); ++i) {
            manifest.levels.push_back(LevelReferenceFromJson((*levelsIt)[i], i));
        }
    }

    // An empty object is treated the same as an absent one.
    if (const auto* generatorJson = fields::FindObject(value, "generator", kContext);
        generatorJson && !generatorJson->empty()) {
        manifest.generator = GeneratorFromJson(*generatorJson);
    }
    if (const auto* worldJson = fields::FindObject(value, "world", kContext); worldJson && !worldJson->empty()) {
        manifest.world = WorldFromJson(*worldJson);
    }
    manifest.assets = fields::ReadStringMap(value, "assets", kContext);
    return manifest;
}

Manifest Manifest::FromText(std::string_view text) {
    return FromJson(fields::ParseDocument(text, "manifest.json"));
}

std::vector<std::string> Manifest::Validate() const {
    std::vector<std::string> errors;

    if (format != kFormatTag) {
        errors.push_back("Invalid format: " + format + ", expected '" + kFormatTag + "'");
    }
    if (version != kManifestVersion) {
        errors.push_back("Unsupported version: " + std::to_string(version) + ", expected "
                         + std::to_string(kManifestVersion));
    }
    if (levels.empty()) {
        errors.push_back("Manifest must contain at least one level");
    }
    for (const auto& level : levels) {
        if (level.id.empty()) {
            errors.push_back("Level missing required 'id' field");
        }
        if (level.path.empty()) {
            errors.push_back("Level " + level.id + " missing required 'path' field");
        }
    }
    if (axis.up != "Y" && axis.up != "Z") {
        errors.push_back("Invalid up axis: " + axis.up);
    }
    if (axis.handedness != "left" && axis.handedness != "right") {
        errors.push_back("Invalid handedness: " + axis.handedness);
    }
    return errors;
}

Manifest MakeManifest(const std::string& title,
                      std::optional<std::vector<LevelReference>> levels,
                      const std::vector<std::string>& tags,
                      const std::optional<std::string>& thumbnail) {
    Manifest manifest;
    if (levels) {
        manifest.levels = std::move(*levels);
    } else {
        manifest.levels.push_back({"0", "levels/0/level.json", std::string("Floor 0")});
    }
    manifest.generator = Generator{};
    World world;
    world.title = title;
    world.tags = tags;
    manifest.world = std::move(world);
    if (thumbnail) {
        manifest.assets["thumbnail"] = *thumbnail;
    }
    return manifest;
}

bool operator==(const Axis& a, const Axis& b) {
    return a.up == b.up && a.forward == b.forward && a.handedness == b.handedness;
}

bool operator==(const Generator& a, const Generator& b) {
    return a.name == b.name && a.version == b.version && a.gitCommit == b.gitCommit;
}

bool operator==(const World& a, const World& b) {
    return a.title == b.title && a.tags == b.tags && a.privacy == b.privacy;
}

bool operator==(const LevelReference& a, const LevelReference& b) {
    return a.id == b.id && a.path == b.path && a.name == b.name;
}

bool operator==(const Manifest& a, const Manifest& b) {
    return a.format == b.format
        && a.version == b.version
        && a.createdUtc == b.createdUtc
        && a.units == b.units
        && a.axis == b.axis
        && a.levels == b.levels
        && a.generator == b.generator
        && a.world == b.world
        && a.assets == b.assets;
}

} // namespace stella::schema
