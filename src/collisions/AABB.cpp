/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "collisions/AABB.hpp"
#include <algorithm>

namespace VoxelNav {

bool AABB::intersects(const AABB& other) const {
    // Edge-touching boxes (adjacent blocks) do not intersect
    if (right() <= other.left() || other.right() <= left()) return false;
    if (farSide() <= other.nearSide() || other.farSide() <= nearSide()) return false;
    return true;
}

bool AABB::contains(const Vector2D& p) const {
    return p.getX() >= left() && p.getX() <= right() &&
           p.getZ() >= nearSide() && p.getZ() <= farSide();
}

Vector2D AABB::closestPoint(const Vector2D& p) const {
    return Vector2D{std::clamp(p.getX(), left(), right()),
                    std::clamp(p.getZ(), nearSide(), farSide())};
}

} // namespace VoxelNav
