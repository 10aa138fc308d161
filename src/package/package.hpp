#pragma once

#include "package/checksums.hpp"
#include "package/pack_options.hpp"
#include "package/zip_archive.hpp"
#include "schema/level.hpp"
#include "schema/manifest.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace stella::package {

inline constexpr const char* kManifestPath = "manifest.json";
inline constexpr const char* kLevelDescriptorFile = "level.json";
inline constexpr const char* kRenderMeshFile = "render.glb";
inline constexpr const char* kCollisionFile = "collision.rlevox";

// Archive-relative path -> bytes. std::map keeps the paths sorted, which fixes the entry order.
using PayloadMap = std::map<std::string, Bytes>;

// "levels/<id>/<file>"
std::string LevelEntryPath(const std::string& levelId, const std::string& file);

// Writes `manifest` and `payloads` to `outputPath` and returns it. The archive holds manifest.json
// first, the payloads sorted by path, then checksums.sha256 when enabled. The destination only
// ever sees a complete archive.
// Throws StructuralError(ReservedPath/UnsafePath) for a bad payload path and IOError on storage failure.
std::filesystem::path Pack(const std::filesystem::path& outputPath,
                           const schema::Manifest& manifest,
                           const PayloadMap& payloads,
                           const PackOptions& options = {});
std::filesystem::path Pack(const std::filesystem::path& outputPath,
                           const schema::Manifest& manifest,
                           const PayloadMap& payloads,
                           bool includeChecksums);

struct UnpackResult {
    schema::Manifest manifest;
    ArchiveReader archive;
};

// Throws IOError, StructuralError(NotAnArchive/MissingManifest/UnsafePath) or ParseError.
UnpackResult Unpack(const std::filesystem::path& archivePath,
                    const std::optional<std::filesystem::path>& extractTo = std::nullopt);

Bytes ReadEntry(const std::filesystem::path& archivePath, const std::string& entryPath);

std::vector<std::string> ListContents(const std::filesystem::path& archivePath);

struct ArchiveInfo {
    schema::Manifest manifest;
    std::vector<EntryInfo> files;
    uint64_t totalUncompressedSize = 0;
    uint64_t archiveSize = 0;
};

ArchiveInfo GetInfo(const std::filesystem::path& archivePath);

// Throws StructuralError(LevelNotFound) if `levelId` is not declared in the manifest.
schema::LevelDescriptor ReadLevelDescriptor(const ArchiveReader& archive,
                                            const schema::Manifest& manifest,
                                            const std::string& levelId);
schema::LevelDescriptor ReadLevelDescriptor(const std::filesystem::path& archivePath, const std::string& levelId);

// Structural check of an archive on disk. Never throws for a bad archive; every problem found is
// reported in the returned messages.
CheckReport Validate(const std::filesystem::path& archivePath);

} // namespace stella::package
