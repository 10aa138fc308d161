#pragma once

#include "common/json.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace stella::schema {

inline constexpr int kLevelVersion = 1;
inline constexpr const char* kNoNavigation = "none";

struct Scale {
    double metersPerUnit = 1.0;
};

struct Spawn {
    std::array<double, 3> position{0.0, 1.7, 0.0};
    double yawDegrees = 0.0;
};

struct RenderAsset {
    std::string type = "glb";
    std::string uri = "render.glb";
};

// Vertical capsule used for player-vs-collision queries.
struct PlayerCapsule {
    double heightM = 1.7;
    double radiusM = 0.3;
    double stepHeightM = 0.35;
};

struct CollisionAsset {
    std::string type = "rlevox";
    std::string uri = "collision.rlevox";
    PlayerCapsule player;
};

// type "none" means the level ships no navigation data.
struct NavigationAsset {
    std::string type = kNoNavigation;
    std::optional<std::string> uri;
};

struct CaptureInfo {
    std::string source = "unknown";
    std::optional<int64_t> sourceFps;
    std::optional<std::string> notes;
};

// Per-level record stored at levels/<id>/level.json.
struct LevelDescriptor {
    int64_t levelVersion = kLevelVersion;
    std::string name = "Level 0";
    Scale scale;
    Spawn spawn;
    RenderAsset render;
    CollisionAsset collision;
    NavigationAsset navigation;
    std::optional<CaptureInfo> capture;

    json::OrderedValue ToJson() const;
    // Throws ValidationError for non-finite numbers or text that is not valid UTF-8.
    std::string ToCanonicalText() const;

    static LevelDescriptor FromJson(const json::Value& value);
    static LevelDescriptor FromText(std::string_view text);

    std::vector<std::string> Validate() const;
};

LevelDescriptor MakeLevelDescriptor(const std::string& name = "Level 0",
                                    const std::optional<std::array<double, 3>>& spawnPosition = std::nullopt,
                                    double playerHeight = 1.7,
                                    const std::string& renderUri = "render.glb",
                                    const std::string& collisionUri = "collision.rlevox");

bool operator==(const Spawn& a, const Spawn& b);
bool operator==(const RenderAsset& a, const RenderAsset& b);
bool operator==(const PlayerCapsule& a, const PlayerCapsule& b);
bool operator==(const CollisionAsset& a, const CollisionAsset& b);
bool operator==(const NavigationAsset& a, const NavigationAsset& b);
bool operator==(const CaptureInfo& a, const CaptureInfo& b);
bool operator==(const LevelDescriptor& a, const LevelDescriptor& b);

inline bool operator!=(const LevelDescriptor& a, const LevelDescriptor& b) { return !(a == b); }

} // namespace stella::schema
