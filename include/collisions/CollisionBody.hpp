/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef VOXELNAV_COLLISION_BODY_HPP
#define VOXELNAV_COLLISION_BODY_HPP

#include <cstdint>

namespace VoxelNav {

// Footprint on the ground plane
enum class ColliderShape : uint8_t {
    Box,     // Axis-aligned, used by blocks
    Circle   // Used by moving agents
};

// Bitmask collision layers (combine via bitwise OR)
enum CollisionLayer : uint32_t {
    Layer_None   = 0u,
    Layer_Block  = 1u << 0,
    Layer_NPC    = 1u << 1,
    Layer_Player = 1u << 2,
};

inline const char* layerName(CollisionLayer layer) {
    switch (layer) {
        case Layer_Block: return "Block";
        case Layer_NPC: return "NPC";
        case Layer_Player: return "Player";
        default: return "None";
    }
}

} // namespace VoxelNav

#endif // VOXELNAV_COLLISION_BODY_HPP
