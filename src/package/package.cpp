#include "package/package.hpp"

#include "common/error.hpp"
#include "common/file_utils.hpp"

#include <spdlog/spdlog.h>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace stella::package {

namespace {

Bytes ToBytes(const std::string& text) {
    return Bytes(text.begin(), text.end());
}

void CheckPayloadPath(const std::string& path) {
    if (path == kManifestPath || path == kChecksumsPath) {
        throw StructuralError(StructuralErrorCode::ReservedPath,
                              "Payload path is reserved for the archive itself: " + path);
    }
    if (!IsSafeEntryPath(path)) {
        throw StructuralError(StructuralErrorCode::UnsafePath, "Payload path is not a safe relative path: '" + path + "'");
    }
}

} // namespace

std::string LevelEntryPath(const std::string& levelId, const std::string& file) {
    return "levels/" + levelId + "/" + file;
}

fs::path Pack(const fs::path& outputPath,
              const schema::Manifest& manifest,
              const PayloadMap& payloads,
              const PackOptions& options) {
    for (const auto& [path, data] : payloads) {
        CheckPayloadPath(path);
    }
    for (const auto& problem : manifest.Validate()) {
        spdlog::warn("Package: Manifest for {}: {}", outputPath.string(), problem);
    }

    const Bytes manifestBytes = ToBytes(manifest.ToCanonicalText());
    Bytes checksumBytes;
    if (options.includeChecksums) {
        PayloadMap covered = payloads;
        covered.emplace(kManifestPath, manifestBytes);
        checksumBytes = ToBytes(BuildChecksumManifest(covered));
    }

    file::ScopedTempFile temp(outputPath);
    {
        ArchiveWriter writer(temp.path(), options.compressionLevel, options.fixedTimestamp);
        writer.add(kManifestPath, manifestBytes);
        for (const auto& [path, data] : payloads) {
            writer.add(path, data);
        }
        if (options.includeChecksums) {
            writer.add(kChecksumsPath, checksumBytes);
        }
        writer.finalize();
    }
    temp.commit();

    const std::size_t entryCount = 1 + payloads.size() + (options.includeChecksums ? 1 : 0);
    spdlog::info("Package: Wrote {} entries to {}", entryCount, outputPath.string());
    return outputPath;
}

fs::path Pack(const fs::path& outputPath,
              const schema::Manifest& manifest,
              const PayloadMap& payloads,
              bool includeChecksums) {
    PackOptions options;
    options.includeChecksums = includeChecksums;
    return Pack(outputPath, manifest, payloads, options);
}

UnpackResult Unpack(const fs::path& archivePath, const std::optional<fs::path>& extractTo) {
    ArchiveReader archive = ArchiveReader::Open(archivePath);
    if (!archive.contains(kManifestPath)) {
        throw StructuralError(StructuralErrorCode::MissingManifest, "Invalid .stella file: missing manifest.json");
    }

    const Bytes raw = archive.read(kManifestPath);
    schema::Manifest manifest = schema::Manifest::FromText(std::string(raw.begin(), raw.end()));

    if (extractTo) {
        archive.extractAll(*extractTo);
    }
    return UnpackResult{std::move(manifest), std::move(archive)};
}

Bytes ReadEntry(const fs::path& archivePath, const std::string& entryPath) {
    return ArchiveReader::Open(archivePath).read(entryPath);
}

std::vector<std::string> ListContents(const fs::path& archivePath) {
    return ArchiveReader::Open(archivePath).entryNames();
}

ArchiveInfo GetInfo(const fs::path& archivePath) {
    UnpackResult unpacked = Unpack(archivePath);

    ArchiveInfo info;
    info.manifest = std::move(unpacked.manifest);
    info.files = unpacked.archive.entries();
    for (const auto& entry : info.files) {
        info.totalUncompressedSize += entry.uncompressedSize;
    }

    std::error_code ec;
    const auto size = fs::file_size(archivePath, ec);
    if (ec) {
        throw IOError("Failed to stat " + archivePath.string() + ": " + ec.message());
    }
    info.archiveSize = size;
    return info;
}

schema::LevelDescriptor ReadLevelDescriptor(const ArchiveReader& archive,
                                            const schema::Manifest& manifest,
                                            const std::string& levelId) {
    for (const auto& level : manifest.levels) {
        if (level.id != levelId) {
            continue;
        }
        const Bytes raw = archive.read(level.path);
        return schema::LevelDescriptor::FromText(std::string(raw.begin(), raw.end()));
    }
    throw StructuralError(StructuralErrorCode::LevelNotFound,
                          "Level '" + levelId + "' is not declared in " + archive.path().string());
}

schema::LevelDescriptor ReadLevelDescriptor(const fs::path& archivePath, const std::string& levelId) {
    const UnpackResult unpacked = Unpack(archivePath);
    return ReadLevelDescriptor(unpacked.archive, unpacked.manifest, levelId);
}

} // namespace stella::package
