/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef VOXELNAV_SPAWNER_SYSTEM_HPP
#define VOXELNAV_SPAWNER_SYSTEM_HPP

#include <optional>
#include "entities/Entity.hpp"
#include "world/GridIndex.hpp"

namespace VoxelNav {

class EntityFactory;
class EntityRegistry;
class NavEventQueue;

/**
 * @brief Timer-driven NPC spawning for SpawnerData + Position entities
 *
 * Every spawnInterval, while fewer than maxNPCs of its NPCs are alive, a
 * spawner places one NPC on the nearest walkable cell around it. NPCs
 * inherit the spawner's owner and wander around the spawner.
 */
class SpawnerSystem {
public:
    SpawnerSystem(const GridIndex& grid, const EntityFactory& factory,
                  NavEventQueue* events = nullptr);

    void update(EntityRegistry& registry, float deltaTime);

    // First walkable cell on square rings of radius 1..ceil(radius) around origin
    std::optional<CellCoord> findWalkableSpawnCell(const CellCoord& origin, float radius) const;

private:
    const GridIndex& m_grid;
    const EntityFactory& m_factory;
    NavEventQueue* m_events;
};

} // namespace VoxelNav

#endif // VOXELNAV_SPAWNER_SYSTEM_HPP
