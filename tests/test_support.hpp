#pragma once

#include "package/package.hpp"
#include "voxel/voxel_field.hpp"

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace stella::test {

// Fresh directory under the system temp dir, removed with everything in it on destruction.
class ScopedTempDir {
public:
    ScopedTempDir();
    ScopedTempDir(const ScopedTempDir&) = delete;
    ScopedTempDir& operator=(const ScopedTempDir&) = delete;
    ~ScopedTempDir();

    const std::filesystem::path& path() const { return root; }
    std::filesystem::path operator/(const std::string& name) const { return root / name; }

private:
    std::filesystem::path root;
};

package::Bytes ToBytes(const std::string& text);

// 10x10x10 field at 0.1m with the [2, 8) cube solid.
voxel::VoxelField MakeCubeField();

// level.json, render.glb and collision.rlevox for level `levelId`.
package::PayloadMap MakeLevelPayloads(const std::string& levelId = "0");

using EntryList = std::vector<std::pair<std::string, package::Bytes>>;

// Writes `entries` verbatim, in order, with no manifest or checksum handling.
void WriteRawArchive(const std::filesystem::path& path, const EntryList& entries);

// Every entry of `path`, in archive order.
EntryList ReadRawArchive(const std::filesystem::path& path);

} // namespace stella::test
