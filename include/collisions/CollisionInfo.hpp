/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef VOXELNAV_COLLISION_INFO_HPP
#define VOXELNAV_COLLISION_INFO_HPP

#include "collisions/CollisionBody.hpp"
#include "entities/Entity.hpp"
#include "utils/Vector2D.hpp"

namespace VoxelNav {

// One contact as seen from the entity that stores it. The normal points
// from the other body toward this one, so pushing along it separates them.
struct CollisionContact {
    EntityID other{INVALID_ENTITY_ID};
    CollisionLayer otherLayer{Layer_None};
    Vector2D normal{0.0f, 0.0f};
    float penetration{0.0f};
};

} // namespace VoxelNav

#endif // VOXELNAV_COLLISION_INFO_HPP
