#pragma once

#include <glm/glm.hpp>

#include <cstddef>
#include <cstdint>
#include <vector>

namespace stella::voxel {

// Dense 3D occupancy grid indexed [x, y, z]. Cells are stored x-fastest, then y, then z,
// so one (y, z) row is contiguous. Cell [0,0,0] has its minimum corner at `origin`.
class VoxelField {
public:
    // Throws std::invalid_argument if any dimension is zero or the cell count is not addressable.
    explicit VoxelField(const glm::uvec3& dims, float voxelSize = 0.1f, const glm::vec3& origin = glm::vec3(0.0f));
    // `cells` holds one byte per cell (0 = empty, anything else = solid) in storage order.
    VoxelField(const glm::uvec3& dims, std::vector<uint8_t> cells, float voxelSize, const glm::vec3& origin);

    const glm::uvec3& getDims() const { return dims; }
    float getVoxelSize() const { return voxelSize; }
    const glm::vec3& getOrigin() const { return origin; }

    bool contains(const glm::ivec3& index) const;
    bool isSolid(uint32_t x, uint32_t y, uint32_t z) const;
    void setSolid(uint32_t x, uint32_t y, uint32_t z, bool solid);

    // Sets every cell in the half-open box [min, max), clamped to the grid.
    void fillBox(const glm::uvec3& min, const glm::uvec3& max, bool solid);

    std::size_t cellCount() const { return cells.size(); }
    std::size_t solidCount() const;

    // Pointer to the dims.x cells of row (y, z).
    const uint8_t* row(uint32_t y, uint32_t z) const;
    uint8_t* row(uint32_t y, uint32_t z);

    const std::vector<uint8_t>& data() const { return cells; }

private:
    std::size_t offset(uint32_t x, uint32_t y, uint32_t z) const;

    glm::uvec3 dims;
    float voxelSize;
    glm::vec3 origin;
    std::vector<uint8_t> cells;
};

// Same dims, voxel size, origin and occupancy.
bool operator==(const VoxelField& a, const VoxelField& b);
inline bool operator!=(const VoxelField& a, const VoxelField& b) { return !(a == b); }

struct VoxelStats {
    glm::uvec3 dims{0u};
    float voxelSize = 0.0f;
    uint64_t totalVoxels = 0;
    uint64_t solidVoxels = 0;
    uint64_t emptyVoxels = 0;
    double fillRatio = 0.0;
    glm::vec3 worldSize{0.0f};
};

VoxelStats ComputeStats(const VoxelField& field);

} // namespace stella::voxel
