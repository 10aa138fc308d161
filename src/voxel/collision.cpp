#include "voxel/collision.hpp"

#include <cmath>
#include <limits>

namespace stella::voxel {

namespace {

int FloorToInt(float value) {
    if (std::isnan(value)) {
        return std::numeric_limits<int>::min();
    }
    const float floored = std::floor(value);
    if (floored <= static_cast<float>(std::numeric_limits<int>::min())) {
        return std::numeric_limits<int>::min();
    }
    if (floored >= static_cast<float>(std::numeric_limits<int>::max())) {
        return std::numeric_limits<int>::max();
    }
    return static_cast<int>(floored);
}

// Clamps a grid-space coordinate to [0, limit] before converting, so far-away positions cannot overflow.
uint32_t ClampToGrid(float value, uint32_t limit) {
    if (!(value > 0.0f)) {
        return 0;
    }
    if (value >= static_cast<float>(limit)) {
        return limit;
    }
    return static_cast<uint32_t>(value);
}

} // namespace

glm::vec3 GridToWorld(const VoxelField& field, const glm::ivec3& index) {
    return field.getOrigin() + (glm::vec3(index) + 0.5f) * field.getVoxelSize();
}

glm::ivec3 WorldToGrid(const VoxelField& field, const glm::vec3& position) {
    const glm::vec3 local = (position - field.getOrigin()) / field.getVoxelSize();
    return glm::ivec3(FloorToInt(local.x), FloorToInt(local.y), FloorToInt(local.z));
}

bool IsSolidAt(const VoxelField& field, const glm::vec3& position) {
    const glm::ivec3 index = WorldToGrid(field, position);
    if (!field.contains(index)) {
        return false;
    }
    return field.isSolid(static_cast<uint32_t>(index.x), static_cast<uint32_t>(index.y),
                         static_cast<uint32_t>(index.z));
}

bool CapsuleCollides(const VoxelField& field, const glm::vec3& feetPosition, float radius, float height) {
    const glm::vec3& origin = field.getOrigin();
    const float voxelSize = field.getVoxelSize();
    const glm::uvec3& dims = field.getDims();

    const glm::vec3 minPos = feetPosition - glm::vec3(radius, 0.0f, radius);
    const glm::vec3 maxPos = feetPosition + glm::vec3(radius, height, radius);
    const glm::vec3 minGrid = glm::floor((minPos - origin) / voxelSize);
    const glm::vec3 maxGrid = glm::ceil((maxPos - origin) / voxelSize);

    const glm::uvec3 lo(ClampToGrid(minGrid.x, dims.x), ClampToGrid(minGrid.y, dims.y), ClampToGrid(minGrid.z, dims.z));
    const glm::uvec3 hi(ClampToGrid(maxGrid.x, dims.x), ClampToGrid(maxGrid.y, dims.y), ClampToGrid(maxGrid.z, dims.z));

    for (uint32_t z = lo.z; z < hi.z; ++z) {
        for (uint32_t y = lo.y; y < hi.y; ++y) {
            const uint8_t* cells = field.row(y, z);
            for (uint32_t x = lo.x; x < hi.x; ++x) {
                if (cells[x]) {
                    return true;
                }
            }
        }
    }
    return false;
}

bool CapsuleCollides(const VoxelField& field, const glm::vec3& feetPosition, const schema::PlayerCapsule& capsule) {
    return CapsuleCollides(field, feetPosition, static_cast<float>(capsule.radiusM),
                           static_cast<float>(capsule.heightM));
}

} // namespace stella::voxel
