#pragma once

#include <cstdint>
#include <ctime>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace stella::package {

using Bytes = std::vector<uint8_t>;

struct EntryInfo {
    std::string path;
    uint64_t compressedSize = 0;
    uint64_t uncompressedSize = 0;
};

// Relative, forward-slash separated, no empty, "." or ".." segments and no backslashes.
bool IsSafeEntryPath(std::string_view path);

// Read-only view of a ZIP archive on disk. The underlying handle is released when the reader is destroyed.
class ArchiveReader {
public:
    // Throws IOError if the file does not exist and StructuralError(NotAnArchive) if it is not a ZIP archive.
    static ArchiveReader Open(const std::filesystem::path& path);

    ArchiveReader(ArchiveReader&& other) noexcept;
    ArchiveReader& operator=(ArchiveReader&& other) noexcept;
    ArchiveReader(const ArchiveReader&) = delete;
    ArchiveReader& operator=(const ArchiveReader&) = delete;
    ~ArchiveReader();

    const std::filesystem::path& path() const { return archivePath; }

    bool contains(const std::string& entry) const;
    // Entry names in archive order.
    std::vector<std::string> entryNames() const;
    std::vector<EntryInfo> entries() const;

    // Exact stored bytes. Throws StructuralError(MissingEntry) if absent and IOError if extraction fails.
    Bytes read(const std::string& entry) const;

    // Recreates every entry under `destDir`. Throws StructuralError(UnsafePath) before writing an
    // entry whose name would escape `destDir`.
    void extractAll(const std::filesystem::path& destDir) const;

private:
    struct Handle;

    ArchiveReader(std::filesystem::path path, std::unique_ptr<Handle> handle);

    std::filesystem::path archivePath;
    std::unique_ptr<Handle> handle;
};

// Streams entries into a new ZIP file. Entries appear in the order they are added.
class ArchiveWriter {
public:
    // `timestamp` pins every entry's modification time; when unset the current time is used.
    ArchiveWriter(const std::filesystem::path& path, int compressionLevel,
                  std::optional<std::time_t> timestamp = std::nullopt);
    ArchiveWriter(const ArchiveWriter&) = delete;
    ArchiveWriter& operator=(const ArchiveWriter&) = delete;
    ~ArchiveWriter();

    void add(const std::string& entry, const Bytes& data);
    void finalize();

private:
    struct Handle;

    std::filesystem::path archivePath;
    int compressionLevel;
    std::optional<std::time_t> timestamp;
    std::unique_ptr<Handle> handle;
};

} // namespace stella::package
