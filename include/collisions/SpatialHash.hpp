/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef VOXELNAV_SPATIAL_HASH_HPP
#define VOXELNAV_SPATIAL_HASH_HPP

#include <unordered_map>
#include <unordered_set>
#include <vector>
#include <cstdint>
#include <functional>
#include "collisions/AABB.hpp"
#include "entities/Entity.hpp"

namespace VoxelNav {

/**
 * @brief Uniform bucket grid for broad-phase collision queries
 *
 * A body is stored in every bucket its bounds overlap. Buckets are
 * independent of navigation cells; CollisionConfig::cellSize sets their
 * edge length.
 */
class SpatialHash {
public:
    explicit SpatialHash(float cellSize = 2.0f);

    void insert(EntityID id, const AABB& aabb);

    // Every id sharing a bucket with area, each reported once
    void query(const AABB& area, std::vector<EntityID>& out) const;
    void clear();

    float getCellSize() const { return m_cellSize; }
    size_t size() const { return m_aabbs.size(); }

private:
    struct BucketCoord { int x; int z; };
    struct BucketCoordHash {
        size_t operator()(const BucketCoord& c) const noexcept {
            return (static_cast<uint64_t>(static_cast<uint32_t>(c.x)) << 32) ^
                   static_cast<uint32_t>(c.z);
        }
    };
    struct BucketCoordEq {
        bool operator()(const BucketCoord& a, const BucketCoord& b) const noexcept {
            return a.x == b.x && a.z == b.z;
        }
    };

    using BucketVector = std::vector<EntityID>;

    float m_cellSize{2.0f};
    std::unordered_map<EntityID, AABB> m_aabbs; // latest bounds per id
    std::unordered_map<BucketCoord, BucketVector, BucketCoordHash, BucketCoordEq> m_buckets;
    mutable std::unordered_set<EntityID> m_seen; // query scratch

    void forEachOverlappingBucket(const AABB& aabb, const std::function<void(BucketCoord)>& fn) const;
};

} // namespace VoxelNav

#endif // VOXELNAV_SPATIAL_HASH_HPP
