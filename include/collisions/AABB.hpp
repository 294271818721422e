/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef VOXELNAV_AABB_HPP
#define VOXELNAV_AABB_HPP

#include "utils/Vector2D.hpp"

namespace VoxelNav {

// Axis-aligned box on the XZ plane; "near"/"far" are the -Z/+Z faces.
struct AABB {
    Vector2D center;   // world center
    Vector2D halfSize; // half extents along X and Z

    AABB() = default;
    AABB(float cx, float cz, float hw, float hd) : center(cx, cz), halfSize(hw, hd) {}

    float left() const { return center.getX() - halfSize.getX(); }
    float right() const { return center.getX() + halfSize.getX(); }
    float nearSide() const { return center.getZ() - halfSize.getZ(); }
    float farSide() const { return center.getZ() + halfSize.getZ(); }

    bool intersects(const AABB& other) const;
    bool contains(const Vector2D& p) const;
    Vector2D closestPoint(const Vector2D& p) const;
};

} // namespace VoxelNav

#endif // VOXELNAV_AABB_HPP
