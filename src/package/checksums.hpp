#pragma once

#include "package/zip_archive.hpp"

#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace stella::package {

inline constexpr const char* kChecksumsPath = "checksums.sha256";
inline constexpr const char* kNoChecksumsNote = "No checksums.sha256 file found (not an error)";

// Outcome of a verification pass. `messages` lists every problem found, or an informational
// note when there was nothing to check.
struct CheckReport {
    bool ok = true;
    std::vector<std::string> messages;
};

std::string ComputeSha256(const Bytes& data);

// "<hex>  <path>" lines sorted by path, joined by '\n', without a trailing newline.
std::string BuildChecksumManifest(const std::map<std::string, Bytes>& entries);

CheckReport VerifyChecksums(const ArchiveReader& archive);
// Throws IOError or StructuralError if the archive cannot be opened.
CheckReport VerifyChecksums(const std::filesystem::path& archivePath);

} // namespace stella::package
