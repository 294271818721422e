/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef VOXELNAV_COLLISION_DETECTOR_HPP
#define VOXELNAV_COLLISION_DETECTOR_HPP

#include <optional>
#include <vector>
#include "ai/BehaviorConfig.hpp"
#include "collisions/AABB.hpp"
#include "collisions/SpatialHash.hpp"
#include "entities/Components.hpp"
#include "utils/Vector2D.hpp"

namespace VoxelNav {

class EntityRegistry;

// Separation of body A from body B: the normal points from B toward A
struct ContactManifold {
    Vector2D normal;
    float penetration{0.0f};
};

/**
 * @brief Narrow and broad phase for Position + Collider entities
 *
 * Each tick the contact lists of every collider are rebuilt. Pairs are
 * found through a SpatialHash and tested once. A body records a contact
 * only if its collidesWith mask includes the other body's layer.
 * Entities with a Collider but no CollisionState receive one.
 */
class CollisionDetector {
public:
    explicit CollisionDetector(const CollisionConfig& config = {});

    void update(EntityRegistry& registry);

    static AABB bounds(const Vector2D& pos, const Collider& collider);

    // Shape dispatch; nullopt when the bodies do not overlap
    static std::optional<ContactManifold> testPair(const Vector2D& posA, const Collider& a,
                                                   const Vector2D& posB, const Collider& b);

    static std::optional<ContactManifold> circleVsCircle(const Vector2D& posA, float radiusA,
                                                         const Vector2D& posB, float radiusB);
    static std::optional<ContactManifold> circleVsBox(const Vector2D& circlePos, float radius,
                                                      const AABB& box);
    static std::optional<ContactManifold> boxVsBox(const AABB& a, const AABB& b);

    const SpatialHash& getSpatialHash() const { return m_hash; }

private:
    CollisionConfig m_config;
    SpatialHash m_hash;
    std::vector<EntityID> m_nearby;
};

} // namespace VoxelNav

#endif // VOXELNAV_COLLISION_DETECTOR_HPP
