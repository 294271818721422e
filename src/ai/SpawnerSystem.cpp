/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/SpawnerSystem.hpp"
#include "core/Logger.hpp"
#include "entities/EntityFactory.hpp"
#include "entities/EntityRegistry.hpp"
#include "events/NavEventQueue.hpp"
#include <cmath>
#include <cstdlib>
#include <fmt/format.h>
#include <iterator>

namespace VoxelNav {

SpawnerSystem::SpawnerSystem(const GridIndex& grid, const EntityFactory& factory,
                             NavEventQueue* events)
    : m_grid(grid), m_factory(factory), m_events(events) {}

void SpawnerSystem::update(EntityRegistry& registry, float deltaTime) {
    for (EntityID id : registry.query<SpawnerData, Position>()) {
        SpawnerData& spawner = *registry.get<SpawnerData>(id);
        const Position pos = *registry.get<Position>(id);

        // Forget NPCs that were destroyed since the last tick
        for (auto it = spawner.spawned.begin(); it != spawner.spawned.end();) {
            it = registry.isAlive(*it) ? std::next(it) : spawner.spawned.erase(it);
        }

        spawner.timeSinceLastSpawn += deltaTime;
        if (spawner.timeSinceLastSpawn < spawner.spawnInterval ||
            static_cast<int>(spawner.spawned.size()) >= spawner.maxNPCs) {
            continue;
        }
        spawner.timeSinceLastSpawn = 0.0f;

        const CellCoord origin = GridIndex::worldToCell(pos.x, pos.z);
        const std::optional<CellCoord> cell = findWalkableSpawnCell(origin, spawner.radius);
        if (!cell) {
            SPAWNER_WARN(fmt::format("Spawner {} found no walkable cell within {}", id,
                                     spawner.radius));
            continue;
        }

        NpcOptions options;
        options.origin = Vector2D(pos.x, pos.z);
        options.wanderRadius = spawner.radius;
        options.spawner = id;
        if (const Ownership* owner = registry.get<Ownership>(id)) {
            options.ownerId = owner->ownerId;
        }

        const Vector2D world = GridIndex::cellToWorld(*cell);
        const EntityID npc = m_factory.createNPC(registry, world.getX(), pos.y, world.getZ(), options);

        spawner.spawned.insert(npc);

        SPAWNER_INFO(fmt::format("Spawner {} spawned NPC {} at ({},{})", id, npc, cell->x, cell->z));
        if (m_events) {
            m_events->push(NavEvent::withOther(NavEventType::NPCSpawned, npc, id));
        }
    }
}

std::optional<CellCoord> SpawnerSystem::findWalkableSpawnCell(const CellCoord& origin,
                                                              float radius) const {
    // Ring 0 is the spawner's own cell
    const int maxRing = static_cast<int>(std::ceil(radius));
    for (int r = 1; r <= maxRing; ++r) {
        for (int dx = -r; dx <= r; ++dx) {
            for (int dz = -r; dz <= r; ++dz) {
                if (std::abs(dx) != r && std::abs(dz) != r) continue;
                const CellCoord cell{origin.x + dx, origin.z + dz};
                if (!m_grid.isBlocked(cell)) {
                    return cell;
                }
            }
        }
    }
    return std::nullopt;
}

} // namespace VoxelNav
