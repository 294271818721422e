/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef VOXELNAV_GRID_DEBUG_VIEW_HPP
#define VOXELNAV_GRID_DEBUG_VIEW_HPP

#include <optional>
#include <vector>
#include "world/GridIndex.hpp"

namespace VoxelNav {

struct DebugCell {
    CellCoord cell;
    bool blocked{false};
};

/**
 * @brief Read-only snapshot of cells around a viewing centre, for overlays
 *
 * collect() returns the (2 * halfExtent + 1)^2 cells of the square centred
 * on the view cell, row by row (Z outer, X inner).
 */
class GridDebugView {
public:
    static constexpr int DEFAULT_HALF_EXTENT = 30;
    static constexpr int REBUILD_DISTANCE = 5;

    explicit GridDebugView(const GridIndex& grid, int halfExtent = DEFAULT_HALF_EXTENT);

    std::vector<DebugCell> collect(float centerX, float centerZ);

    // True before the first collect, or once the view cell has moved more than REBUILD_DISTANCE cells
    bool needsRebuild(float centerX, float centerZ) const;

    int getHalfExtent() const { return m_halfExtent; }

private:
    const GridIndex& m_grid;
    int m_halfExtent;
    std::optional<CellCoord> m_lastCenter;
};

} // namespace VoxelNav

#endif // VOXELNAV_GRID_DEBUG_VIEW_HPP
