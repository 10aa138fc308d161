#include "schema/level.hpp"

#include "common/error.hpp"
#include "schema/json_fields.hpp"

#include <cmath>
#include <sstream>

namespace stella::schema {

namespace {

constexpr const char* kContext = "level";

std::string FormatNumber(double value) {
    std::ostringstream stream;
    stream << value;
    return stream.str();
}

bool IsPositive(double value) {
    return std::isfinite(value) && value > 0.0;
}

bool HasOnlyFiniteNumbers(const LevelDescriptor& level) {
    const double values[] = {
        level.scale.metersPerUnit,
        level.spawn.position[0],
        level.spawn.position[1],
        level.spawn.position[2],
        level.spawn.yawDegrees,
        level.collision.player.heightM,
        level.collision.player.radiusM,
        level.collision.player.stepHeightM,
    };
    for (const double value : values) {
        if (!std::isfinite(value)) {
            return false;
        }
    }
    return true;
}

Spawn SpawnFromJson(const json::Value& value) {
    const std::string context = std::string(kContext) + ".spawn";
    Spawn spawn;
    spawn.position = fields::ReadVec3(value, "position", spawn.position, context);
    spawn.yawDegrees = fields::ReadNumber(value, "yaw_degrees", spawn.yawDegrees, context);
    return spawn;
}

RenderAsset RenderFromJson(const json::Value& value) {
    const std::string context = std::string(kContext) + ".render";
    RenderAsset render;
    render.type = fields::ReadString(value, "type", render.type, context);
    render.uri = fields::ReadString(value, "uri", render.uri, context);
    return render;
}

CollisionAsset CollisionFromJson(const json::Value& value) {
    const std::string context = std::string(kContext) + ".collision";
    CollisionAsset collision;
    collision.type = fields::ReadString(value, "type", collision.type, context);
    collision.uri = fields::ReadString(value, "uri", collision.uri, context);
    if (const auto* player = fields::FindObject(value, "player", context)) {
        const std::string playerContext = context + ".player";
        auto& capsule = collision.player;
        capsule.heightM = fields::ReadNumber(*player, "height_m", capsule.heightM, playerContext);
        capsule.radiusM = fields::ReadNumber(*player, "radius_m", capsule.radiusM, playerContext);
        capsule.stepHeightM = fields::ReadNumber(*player, "step_height_m", capsule.stepHeightM, playerContext);
    }
    return collision;
}

NavigationAsset NavigationFromJson(const json::Value& value) {
    const std::string context = std::string(kContext) + ".navigation";
    NavigationAsset navigation;
    navigation.type = fields::ReadString(value, "type", navigation.type, context);
    navigation.uri = fields::ReadOptionalString(value, "uri", context);
    return navigation;
}

CaptureInfo CaptureFromJson(const json::Value& value) {
    const std::string context = std::string(kContext) + ".capture";
    CaptureInfo capture;
    capture.source = fields::ReadString(value, "source", capture.source, context);
    capture.sourceFps = fields::ReadOptionalInt(value, "source_fps", context);
    capture.notes = fields::ReadOptionalString(value, "notes", context);
    return capture;
}

} // namespace

json::OrderedValue LevelDescriptor::ToJson() const {
    json::OrderedValue out = json::OrderedValue::object();
    out["level_version"] = levelVersion;
    out["name"] = name;
    out["scale"] = {{"meters_per_unit", scale.metersPerUnit}};

    json::OrderedValue spawnJson = json::OrderedValue::object();
    spawnJson["position"] = spawn.position;
    spawnJson["yaw_degrees"] = spawn.yawDegrees;
    out["spawn"] = std::move(spawnJson);

    json::OrderedValue renderJson = json::OrderedValue::object();
    renderJson["type"] = render.type;
    renderJson["uri"] = render.uri;
    out["render"] = std::move(renderJson);

    json::OrderedValue playerJson = json::OrderedValue::object();
    playerJson["height_m"] = collision.player.heightM;
    playerJson["radius_m"] = collision.player.radiusM;
    playerJson["step_height_m"] = collision.player.stepHeightM;
    json::OrderedValue collisionJson = json::OrderedValue::object();
    collisionJson["type"] = collision.type;
    collisionJson["uri"] = collision.uri;
    collisionJson["player"] = std::move(playerJson);
    out["collision"] = std::move(collisionJson);

    json::OrderedValue navigationJson = json::OrderedValue::object();
    navigationJson["type"] = navigation.type;
    if (navigation.uri) {
        navigationJson["uri"] = *navigation.uri;
    }
    out["navigation"] = std::move(navigationJson);

    if (capture) {
        json::OrderedValue captureJson = json::OrderedValue::object();
        captureJson["source"] = capture->source;
        if (capture->sourceFps) {
            captureJson["source_fps"] = *capture->sourceFps;
        }
        if (capture->notes) {
            captureJson["notes"] = *capture->notes;
        }
        out["capture"] = std::move(captureJson);
    }
    return out;
}

std::string LevelDescriptor::ToCanonicalText() const {
    // NaN and infinity would be written as null and read back as defaults.
    if (!HasOnlyFiniteNumbers(*this)) {
        throw ValidationError("Cannot serialize level.json: non-finite number");
    }
    return fields::DumpDocument(ToJson(), "level.json");
}

LevelDescriptor LevelDescriptor::FromJson(const json::Value& value) {
    fields::RequireObject(value, kContext);

    LevelDescriptor level;
    level.levelVersion = fields::ReadInt(value, "level_version", level.levelVersion, kContext);
    level.name = fields::ReadString(value, "name", level.name, kContext);
    if (const auto* scaleJson = fields::FindObject(value, "scale", kContext)) {
        level.scale.metersPerUnit = fields::ReadNumber(*scaleJson, "meters_per_unit", level.scale.metersPerUnit,
                                                       std::string(kContext) + ".scale");
    }
    if (const auto* spawnJson = fields::FindObject(value, "spawn", kContext)) {
        level.spawn = SpawnFromJson(*spawnJson);
    }
    if (const auto* renderJson = fields::FindObject(value, "render", kContext)) {
        level.render = RenderFromJson(*renderJson);
    }
    if (const auto* collisionJson = fields::FindObject(value, "collision", kContext)) {
        level.collision = CollisionFromJson(*collisionJson);
    }
    if (const auto* navigationJson = fields::FindObject(value, "navigation", kContext)) {
        level.navigation = NavigationFromJson(*navigationJson);
    }
    if (const auto* captureJson = fields::FindObject(value, "capture", kContext);
        captureJson && !captureJson->empty()) {
        level.capture = CaptureFromJson(*captureJson);
    }
    return level;
}

LevelDescriptor LevelDescriptor::FromText(std::string_view text) {
    return FromJson(fields::ParseDocument(text, "level.json"));
}

std::vector<std::string> LevelDescriptor::Validate() const {
    std::vector<std::string> errors;
    if (levelVersion != kLevelVersion) {
        errors.push_back("Unsupported level version: " + std::to_string(levelVersion) + ", expected "
                         + std::to_string(kLevelVersion));
    }
    if (!IsPositive(scale.metersPerUnit)) {
        errors.push_back("Invalid meters_per_unit: " + FormatNumber(scale.metersPerUnit));
    }
    for (const double coordinate : spawn.position) {
        if (!std::isfinite(coordinate)) {
            errors.push_back("Invalid spawn position: " + FormatNumber(spawn.position[0]) + ", "
                             + FormatNumber(spawn.position[1]) + ", " + FormatNumber(spawn.position[2]));
            break;
        }
    }
    if (!std::isfinite(spawn.yawDegrees)) {
        errors.push_back("Invalid spawn yaw: " + FormatNumber(spawn.yawDegrees));
    }
    if (render.uri.empty()) {
        errors.push_back("Render asset missing required 'uri' field");
    }
    if (collision.uri.empty()) {
        errors.push_back("Collision asset missing required 'uri' field");
    }
    if (!IsPositive(collision.player.heightM)) {
        errors.push_back("Invalid player height: " + FormatNumber(collision.player.heightM));
    }
    if (!IsPositive(collision.player.radiusM)) {
        errors.push_back("Invalid player radius: " + FormatNumber(collision.player.radiusM));
    }
    if (!(std::isfinite(collision.player.stepHeightM) && collision.player.stepHeightM >= 0.0)) {
        errors.push_back("Invalid player step height: " + FormatNumber(collision.player.stepHeightM));
    }
    if (navigation.type != kNoNavigation && (!navigation.uri || navigation.uri->empty())) {
        errors.push_back("Navigation asset of type " + navigation.type + " missing required 'uri' field");
    }
    return errors;
}

LevelDescriptor MakeLevelDescriptor(const std::string& name,
                                    const std::optional<std::array<double, 3>>& spawnPosition,
                                    double playerHeight,
                                    const std::string& renderUri,
                                    const std::string& collisionUri) {
    LevelDescriptor level;
    level.name = name;
    level.spawn.position = spawnPosition.value_or(std::array<double, 3>{0.0, playerHeight, 0.0});
    level.render.uri = renderUri;
    level.collision.uri = collisionUri;
    level.collision.player.heightM = playerHeight;
    return level;
}

bool operator==(const Spawn& a, const Spawn& b) {
    return a.position == b.position && a.yawDegrees == b.yawDegrees;
}

bool operator==(const RenderAsset& a, const RenderAsset& b) {
    return a.type == b.type && a.uri == b.uri;
}

bool operator==(const PlayerCapsule& a, const PlayerCapsule& b) {
    return a.heightM == b.heightM && a.radiusM == b.radiusM && a.stepHeightM == b.stepHeightM;
}

bool operator==(const CollisionAsset& a, const CollisionAsset& b) {
    return a.type == b.type && a.uri == b.uri && a.player == b.player;
}

bool operator==(const NavigationAsset& a, const NavigationAsset& b) {
    return a.type == b.type && a.uri == b.uri;
}

bool operator==(const CaptureInfo& a, const CaptureInfo& b) {
    return a.source == b.source && a.sourceFps == b.sourceFps && a.notes == b.notes;
}

bool operator==(const LevelDescriptor& a, const LevelDescriptor& b) {
    return a.levelVersion == b.levelVersion
        && a.name == b.name
        && a.scale.metersPerUnit == b.scale.metersPerUnit
        && a.spawn == b.spawn
        && a.render == b.render
        && a.collision == b.collision
        && a.navigation == b.navigation
        && a.capture == b.capture;
}

} // namespace stella::schema
