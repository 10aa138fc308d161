#pragma once

#include <cstdint>
#include <filesystem>
#include <vector>

namespace stella::file {

using Bytes = std::vector<uint8_t>;

// Throws IOError when the file cannot be opened or read. An empty file yields an empty buffer.
Bytes ReadFileBytes(const std::filesystem::path& path);

// Writes through a ScopedTempFile so a failed write never leaves a partial file at `path`.
void WriteFileBytes(const std::filesystem::path& path, const Bytes& bytes);

// A uniquely named file beside `destination`. Removed on destruction unless commit() moved it into place.
class ScopedTempFile {
public:
    explicit ScopedTempFile(const std::filesystem::path& destination);
    ScopedTempFile(const ScopedTempFile&) = delete;
    ScopedTempFile& operator=(const ScopedTempFile&) = delete;
    ~ScopedTempFile();

    const std::filesystem::path& path() const { return tempPath; }

    void commit();

private:
    std::filesystem::path destinationPath;
    std::filesystem::path tempPath;
    bool committed = false;
};

} // namespace stella::file
