/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef VOXELNAV_ENTITY_HPP
#define VOXELNAV_ENTITY_HPP

#include <cstdint>
#include <ostream>

namespace VoxelNav {

/**
 * @brief Stable integer identity handed out by EntityRegistry.
 *
 * Ids are never reused within one registry lifetime, so a stale id held by
 * a pursuer or spawner simply fails its next lookup.
 */
using EntityID = std::uint32_t;

inline constexpr EntityID INVALID_ENTITY_ID = 0;

/**
 * @brief Archetype tag for logging and factory bookkeeping
 *
 * Logic never branches on the kind; systems select entities by the
 * components they hold.
 */
enum class EntityKind : uint8_t {
    Player = 0,
    NPC = 1,
    Block = 2,      // Static obstacle occupying one cell
    Spawner = 3,

    COUNT
};

inline std::ostream& operator<<(std::ostream& os, EntityKind kind) {
    switch (kind) {
        case EntityKind::Player: return os << "Player";
        case EntityKind::NPC: return os << "NPC";
        case EntityKind::Block: return os << "Block";
        case EntityKind::Spawner: return os << "Spawner";
        default: return os << "Unknown";
    }
}

} // namespace VoxelNav

#endif // VOXELNAV_ENTITY_HPP
