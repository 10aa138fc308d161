#pragma once

#include "schema/level.hpp"
#include "voxel/voxel_field.hpp"

#include <glm/glm.hpp>

namespace stella::voxel {

// World position of the center of cell `index`.
glm::vec3 GridToWorld(const VoxelField& field, const glm::ivec3& index);

// Index of the cell containing `position`. The result may lie outside the grid.
glm::ivec3 WorldToGrid(const VoxelField& field, const glm::vec3& position);

// Out-of-bounds positions are never solid.
bool IsSolidAt(const VoxelField& field, const glm::vec3& position);

// Approximates a vertical capsule standing at `feetPosition` by its axis-aligned bounding box
// and reports whether any solid cell overlaps it.
bool CapsuleCollides(const VoxelField& field, const glm::vec3& feetPosition, float radius, float height);
bool CapsuleCollides(const VoxelField& field, const glm::vec3& feetPosition, const schema::PlayerCapsule& capsule);

} // namespace stella::voxel
