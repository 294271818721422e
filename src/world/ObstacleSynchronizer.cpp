/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "world/ObstacleSynchronizer.hpp"
#include "core/Logger.hpp"
#include "entities/EntityRegistry.hpp"
#include "events/NavEventQueue.hpp"
#include <algorithm>
#include <fmt/format.h>
#include <vector>

namespace VoxelNav {

ObstacleSynchronizer::ObstacleSynchronizer(GridIndex& grid, NavEventQueue* events)
    : m_grid(grid), m_events(events) {}

void ObstacleSynchronizer::update(const EntityRegistry& registry) {
    const std::vector<EntityID> obstacles = registry.query<NavObstacle, Position>();

    // Forget obstacles that were destroyed or lost the capability. Done before
    // registering so a block replaced within one tick keeps its cell blocked.
    for (auto it = m_records.begin(); it != m_records.end();) {
        if (!std::binary_search(obstacles.begin(), obstacles.end(), it->first)) {
            freeCell(it->first, it->second);
            it = m_records.erase(it);
        } else {
            ++it;
        }
    }

    for (EntityID id : obstacles) {
        const Position* pos = registry.get<Position>(id);
        const CellCoord cell = GridIndex::worldToCell(pos->x, pos->z);

        auto it = m_records.find(id);
        if (it != m_records.end()) {
            if (it->second == cell) {
                continue;
            }
            freeCell(id, it->second);
            it->second = cell;
        } else {
            m_records.emplace(id, cell);
        }
        blockCell(id, cell);
    }
}

std::optional<CellCoord> ObstacleSynchronizer::getRegisteredCell(EntityID id) const {
    auto it = m_records.find(id);
    if (it == m_records.end()) {
        return std::nullopt;
    }
    return it->second;
}

void ObstacleSynchronizer::freeCell(EntityID id, const CellCoord& cell) {
    m_grid.setWalkable(cell);
    OBSTACLE_DEBUG(fmt::format("Entity {} freed cell ({},{})", id, cell.x, cell.z));
    if (m_events) {
        m_events->push(NavEvent::withCell(NavEventType::ObstacleFreed, id, cell));
    }
}

void ObstacleSynchronizer::blockCell(EntityID id, const CellCoord& cell) {
    m_grid.setBlocked(cell);
    OBSTACLE_DEBUG(fmt::format("Entity {} blocked cell ({},{})", id, cell.x, cell.z));
    if (m_events) {
        m_events->push(NavEvent::withCell(NavEventType::ObstacleRegistered, id, cell));
    }
}

} // namespace VoxelNav
