/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef VOXELNAV_OBSTACLE_SYNCHRONIZER_HPP
#define VOXELNAV_OBSTACLE_SYNCHRONIZER_HPP

#include <cstddef>
#include <optional>
#include <boost/container/flat_map.hpp>
#include "entities/Entity.hpp"
#include "world/GridIndex.hpp"

namespace VoxelNav {

class EntityRegistry;
class NavEventQueue;

/**
 * @brief Keeps GridIndex in step with entities carrying NavObstacle + Position
 *
 * Each obstacle entity has at most one registered cell. Moving an obstacle
 * frees its old cell and blocks the new one; a destroyed obstacle (or one
 * that lost NavObstacle) frees its cell. Freeing does not check whether
 * another obstacle still sits on the cell: placement never stacks blocks.
 */
class ObstacleSynchronizer {
public:
    explicit ObstacleSynchronizer(GridIndex& grid, NavEventQueue* events = nullptr);

    // Safe to run every tick; unchanged obstacles cost a lookup and compare
    void update(const EntityRegistry& registry);

    std::optional<CellCoord> getRegisteredCell(EntityID id) const;
    size_t getTrackedCount() const { return m_records.size(); }

private:
    void freeCell(EntityID id, const CellCoord& cell);
    void blockCell(EntityID id, const CellCoord& cell);

    GridIndex& m_grid;
    NavEventQueue* m_events;
    boost::container::flat_map<EntityID, CellCoord> m_records;
};

} // namespace VoxelNav

#endif // VOXELNAV_OBSTACLE_SYNCHRONIZER_HPP
