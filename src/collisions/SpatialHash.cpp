/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "collisions/SpatialHash.hpp"
#include <cmath>     // std::floor
#include <fmt/format.h>
#include <stdexcept>

namespace VoxelNav {

SpatialHash::SpatialHash(float cellSize) : m_cellSize(cellSize) {
    if (!(cellSize > 0.0f)) {
        throw std::invalid_argument(fmt::format("SpatialHash cell size must be > 0 (got {})", cellSize));
    }
}

void SpatialHash::insert(EntityID id, const AABB& aabb) {
    m_aabbs[id] = aabb;
    forEachOverlappingBucket(aabb, [&](BucketCoord c) {
        m_buckets[c].push_back(id);
    });
}

void SpatialHash::query(const AABB& area, std::vector<EntityID>& out) const {
    out.clear();
    m_seen.clear();

    forEachOverlappingBucket(area, [&](BucketCoord c) {
        auto it = m_buckets.find(c);
        if (it == m_buckets.end()) return;
        for (EntityID id : it->second) {
            if (m_seen.emplace(id).second) {
                out.push_back(id);
            }
        }
    });
}

void SpatialHash::clear() {
    m_buckets.clear();
    m_aabbs.clear();
}

void SpatialHash::forEachOverlappingBucket(const AABB& aabb, const std::function<void(BucketCoord)>& fn) const {
    const int minX = static_cast<int>(std::floor(aabb.left() / m_cellSize));
    const int maxX = static_cast<int>(std::floor(aabb.right() / m_cellSize));
    const int minZ = static_cast<int>(std::floor(aabb.nearSide() / m_cellSize));
    const int maxZ = static_cast<int>(std::floor(aabb.farSide() / m_cellSize));
    for (int z = minZ; z <= maxZ; ++z) {
        for (int x = minX; x <= maxX; ++x) {
            fn(BucketCoord{x, z});
        }
    }
}

} // namespace VoxelNav
