#pragma once

#include "common/json.hpp"
#include "common/version.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace stella::schema {

inline constexpr const char* kFormatTag = "stella.world";
inline constexpr int kManifestVersion = 1;
inline constexpr const char* kGeneratorName = "stella-cli";

std::string CurrentUtcTimestamp();

struct Axis {
    std::string up = "Y";
    std::string forward = "-Z";
    std::string handedness = "right";
};

// Build tool provenance.
struct Generator {
    std::string name = kGeneratorName;
    std::string version = kLibraryVersion;
    std::optional<std::string> gitCommit;
};

struct World {
    std::string title = "Untitled World";
    std::vector<std::string> tags;
    std::map<std::string, bool> privacy{{"contains_source_media", false}};
};

struct LevelReference {
    std::string id;
    std::string path;
    std::optional<std::string> name;
};

// Root record stored as manifest.json. Member initializers are the defaults for both
// construction and parsing.
struct Manifest {
    std::string format = kFormatTag;
    int64_t version = kManifestVersion;
    std::string createdUtc = CurrentUtcTimestamp();
    std::string units = "meters";
    Axis axis;
    std::vector<LevelReference> levels;
    std::optional<Generator> generator;
    std::optional<World> world;
    std::map<std::string, std::string> assets;

    json::OrderedValue ToJson() const;
    std::string ToCanonicalText() const;

    // Both throw ParseError on malformed text or wrongly typed fields. Unknown keys are ignored.
    static Manifest FromJson(const json::Value& value);
    static Manifest FromText(std::string_view text);

    // Rule violations in check order; empty when valid. Level id uniqueness is not checked.
    std::vector<std::string> Validate() const;
};

Manifest MakeManifest(const std::string& title = "Untitled World",
                      std::optional<std::vector<LevelReference>> levels = std::nullopt,
                      const std::vector<std::string>& tags = {},
                      const std::optional<std::string>& thumbnail = std::nullopt);

bool operator==(const Axis& a, const Axis& b);
bool operator==(const Generator& a, const Generator& b);
bool operator==(const World& a, const World& b);
bool operator==(const LevelReference& a, const LevelReference& b);
bool operator==(const Manifest& a, const Manifest& b);

inline bool operator!=(const Axis& a, const Axis& b) { return !(a == b); }
inline bool operator!=(const Generator& a, const Generator& b) { return !(a == b); }
inline bool operator!=(const World& a, const World& b) { return !(a == b); }
inline bool operator!=(const LevelReference& a, const LevelReference& b) { return !(a == b); }
inline bool operator!=(const Manifest& a, const Manifest& b) { return !(a == b); }

} // namespace stella::schema
