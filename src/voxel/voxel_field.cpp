#include "voxel/voxel_field.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

namespace stella::voxel {

namespace {

std::size_t CheckedCellCount(const glm::uvec3& dims) {
    if (dims.x == 0 || dims.y == 0 || dims.z == 0) {
        throw std::invalid_argument("VoxelField: dimensions must be >= 1, got "
                                    + std::to_string(dims.x) + "x" + std::to_string(dims.y) + "x"
                                    + std::to_string(dims.z));
    }
    const uint64_t plane = static_cast<uint64_t>(dims.x) * dims.y;
    if (plane > std::numeric_limits<std::size_t>::max() / dims.z) {
        throw std::invalid_argument("VoxelField: cell count overflows addressable memory");
    }
    return static_cast<std::size_t>(plane * dims.z);
}

} // namespace

VoxelField::VoxelField(const glm::uvec3& dims, float voxelSize, const glm::vec3& origin)
    : dims(dims),
      voxelSize(voxelSize),
      origin(origin),
      cells(CheckedCellCount(dims), 0) {}

VoxelField::VoxelField(const glm::uvec3& dims, std::vector<uint8_t> cells, float voxelSize, const glm::vec3& origin)
    : dims(dims),
      voxelSize(voxelSize),
      origin(origin),
      cells(std::move(cells)) {
    if (this->cells.size() != CheckedCellCount(dims)) {
        throw std::invalid_argument("VoxelField: expected " + std::to_string(CheckedCellCount(dims))
                                    + " cells, got " + std::to_string(this->cells.size()));
    }
    for (auto& cell : this->cells) {
        cell = cell ? 1 : 0;
    }
}

std::size_t VoxelField::offset(uint32_t x, uint32_t y, uint32_t z) const {
    return (static_cast<std::size_t>(z) * dims.y + y) * dims.x + x;
}

bool VoxelField::contains(const glm::ivec3& index) const {
    return index.x >= 0 && index.y >= 0 && index.z >= 0
        && static_cast<uint32_t>(index.x) < dims.x
        && static_cast<uint32_t>(index.y) < dims.y
        && static_cast<uint32_t>(index.z) < dims.z;
}

bool VoxelField::isSolid(uint32_t x, uint32_t y, uint32_t z) const {
    if (x >= dims.x || y >= dims.y || z >= dims.z) {
        throw std::out_of_range("VoxelField: index out of range");
    }
    return cells[offset(x, y, z)] != 0;
}

void VoxelField::setSolid(uint32_t x, uint32_t y, uint32_t z, bool solid) {
    if (x >= dims.x || y >= dims.y || z >= dims.z) {
        throw std::out_of_range("VoxelField: index out of range");
    }
    cells[offset(x, y, z)] = solid ? 1 : 0;
}

void VoxelField::fillBox(const glm::uvec3& min, const glm::uvec3& max, bool solid) {
    const glm::uvec3 hi = glm::min(max, dims);
    for (uint32_t z = min.z; z < hi.z; ++z) {
        for (uint32_t y = min.y; y < hi.y; ++y) {
            if (min.x >= hi.x) {
                continue;
            }
            uint8_t* start = row(y, z);
            std::fill(start + min.x, start + hi.x, static_cast<uint8_t>(solid ? 1 : 0));
        }
    }
}

std::size_t VoxelField::solidCount() const {
    return static_cast<std::size_t>(std::count(cells.begin(), cells.end(), static_cast<uint8_t>(1)));
}

const uint8_t* VoxelField::row(uint32_t y, uint32_t z) const {
    return cells.data() + offset(0, y, z);
}

uint8_t* VoxelField::row(uint32_t y, uint32_t z) {
    return cells.data() + offset(0, y, z);
}

bool operator==(const VoxelField& a, const VoxelField& b) {
    return a.getDims() == b.getDims()
        && a.getVoxelSize() == b.getVoxelSize()
        && a.getOrigin() == b.getOrigin()
        && a.data() == b.data();
}

VoxelStats ComputeStats(const VoxelField& field) {
    VoxelStats stats;
    stats.dims = field.getDims();
    stats.voxelSize = field.getVoxelSize();
    stats.totalVoxels = field.cellCount();
    stats.solidVoxels = field.solidCount();
    stats.emptyVoxels = stats.totalVoxels - stats.solidVoxels;
    stats.fillRatio = stats.totalVoxels > 0
        ? static_cast<double>(stats.solidVoxels) / static_cast<double>(stats.totalVoxels)
        : 0.0;
    stats.worldSize = glm::vec3(stats.dims) * stats.voxelSize;
    return stats;
}

} // namespace stella::voxel
