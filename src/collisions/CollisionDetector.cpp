/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "collisions/CollisionDetector.hpp"
#include "core/Logger.hpp"
#include "entities/EntityRegistry.hpp"
#include <algorithm>
#include <cmath>
#include <fmt/format.h>

namespace VoxelNav {

CollisionDetector::CollisionDetector(const CollisionConfig& config)
    : m_config(config), m_hash(config.cellSize) {
    m_config.validate();
}

AABB CollisionDetector::bounds(const Vector2D& pos, const Collider& collider) {
    if (collider.shape == ColliderShape::Box) {
        return AABB(pos.getX(), pos.getZ(), collider.halfWidth, collider.halfDepth);
    }
    return AABB(pos.getX(), pos.getZ(), collider.radius, collider.radius);
}

void CollisionDetector::update(EntityRegistry& registry) {
    const std::vector<EntityID> bodies = registry.query<Position, Collider>();

    m_hash.clear();
    for (EntityID id : bodies) {
        CollisionState* state = registry.get<CollisionState>(id);
        if (!state) {
            state = &registry.add<CollisionState>(id);
        }
        state->contacts.clear();
        state->isColliding = false;

        m_hash.insert(id, bounds(registry.get<Position>(id)->ground(), *registry.get<Collider>(id)));
    }

    for (EntityID a : bodies) {
        const Vector2D posA = registry.get<Position>(a)->ground();
        const Collider& colA = *registry.get<Collider>(a);

        m_hash.query(bounds(posA, colA), m_nearby);
        for (EntityID b : m_nearby) {
            // Each unordered pair is tested from its lower id only
            if (b <= a) continue;

            const Collider& colB = *registry.get<Collider>(b);
            const bool aCollidesWithB = (colA.collidesWith & colB.layer) != 0;
            const bool bCollidesWithA = (colB.collidesWith & colA.layer) != 0;
            if (!aCollidesWithB && !bCollidesWithA) continue;

            const Vector2D posB = registry.get<Position>(b)->ground();
            const std::optional<ContactManifold> manifold = testPair(posA, colA, posB, colB);
            if (!manifold) continue;

            if (aCollidesWithB) {
                CollisionState& state = *registry.get<CollisionState>(a);
                state.contacts.push_back(CollisionContact{b, colB.layer, manifold->normal,
                                                          manifold->penetration});
                state.isColliding = true;
            }
            if (bCollidesWithA) {
                CollisionState& state = *registry.get<CollisionState>(b);
                state.contacts.push_back(CollisionContact{a, colA.layer, manifold->normal * -1.0f,
                                                          manifold->penetration});
                state.isColliding = true;
            }
            COLLISION_DEBUG(fmt::format("Contact {} ({}) <-> {} ({}), depth {:.3f}", a,
                                        layerName(colA.layer), b, layerName(colB.layer),
                                        manifold->penetration));
        }
    }
}

std::optional<ContactManifold> CollisionDetector::testPair(const Vector2D& posA, const Collider& a,
                                                           const Vector2D& posB, const Collider& b) {
    const bool aBox = a.shape == ColliderShape::Box;
    const bool bBox = b.shape == ColliderShape::Box;

    if (aBox && bBox) {
        return boxVsBox(bounds(posA, a), bounds(posB, b));
    }
    if (!aBox && !bBox) {
        return circleVsCircle(posA, a.radius, posB, b.radius);
    }
    if (!aBox) {
        return circleVsBox(posA, a.radius, bounds(posB, b));
    }

    // Box A against circle B: flip the circle's separation direction
    std::optional<ContactManifold> manifold = circleVsBox(posB, b.radius, bounds(posA, a));
    if (manifold) {
        manifold->normal = manifold->normal * -1.0f;
    }
    return manifold;
}

std::optional<ContactManifold> CollisionDetector::circleVsCircle(const Vector2D& posA, float radiusA,
                                                                 const Vector2D& posB, float radiusB) {
    const Vector2D delta = posA - posB;
    const float dist = delta.length();
    const float minDist = radiusA + radiusB;
    if (dist >= minDist) {
        return std::nullopt;
    }
    // Coincident centres: pick a fixed axis so the pair can still separate
    const Vector2D normal = dist > 0.0f ? delta / dist : Vector2D(1.0f, 0.0f);
    return ContactManifold{normal, minDist - dist};
}

std::optional<ContactManifold> CollisionDetector::circleVsBox(const Vector2D& circlePos, float radius,
                                                              const AABB& box) {
    if (!box.contains(circlePos)) {
        const Vector2D closest = box.closestPoint(circlePos);
        const Vector2D delta = circlePos - closest;
        const float dist = delta.length();
        if (dist >= radius) {
            return std::nullopt;
        }
        return ContactManifold{delta / dist, radius - dist};
    }

    // Centre inside the box: leave through the nearest face
    const float toLeft = circlePos.getX() - box.left();
    const float toRight = box.right() - circlePos.getX();
    const float toNear = circlePos.getZ() - box.nearSide();
    const float toFar = box.farSide() - circlePos.getZ();
    const float nearest = std::min({toLeft, toRight, toNear, toFar});

    Vector2D normal(1.0f, 0.0f);
    if (nearest == toLeft) normal = Vector2D(-1.0f, 0.0f);
    else if (nearest == toRight) normal = Vector2D(1.0f, 0.0f);
    else if (nearest == toNear) normal = Vector2D(0.0f, -1.0f);
    else normal = Vector2D(0.0f, 1.0f);
    return ContactManifold{normal, radius + nearest};
}

std::optional<ContactManifold> CollisionDetector::boxVsBox(const AABB& a, const AABB& b) {
    if (!a.intersects(b)) {
        return std::nullopt;
    }
    const float overlapX = a.halfSize.getX() + b.halfSize.getX() -
                           std::fabs(a.center.getX() - b.center.getX());
    const float overlapZ = a.halfSize.getZ() + b.halfSize.getZ() -
                           std::fabs(a.center.getZ() - b.center.getZ());

    // Resolve along the axis of least penetration
    if (overlapX < overlapZ) {
        const float sign = a.center.getX() < b.center.getX() ? -1.0f : 1.0f;
        return ContactManifold{Vector2D(sign, 0.0f), overlapX};
    }
    const float sign = a.center.getZ() < b.center.getZ() ? -1.0f : 1.0f;
    return ContactManifold{Vector2D(0.0f, sign), overlapZ};
}

} // namespace VoxelNav
