/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "world/GridDebugView.hpp"
#include <cstdlib>
#include <fmt/format.h>
#include <stdexcept>

namespace VoxelNav {

GridDebugView::GridDebugView(const GridIndex& grid, int halfExtent)
    : m_grid(grid), m_halfExtent(halfExtent) {
    if (halfExtent < 0) {
        throw std::invalid_argument(
            fmt::format("GridDebugView half extent must be >= 0 (got {})", halfExtent));
    }
}

std::vector<DebugCell> GridDebugView::collect(float centerX, float centerZ) {
    const CellCoord center = GridIndex::worldToCell(centerX, centerZ);
    m_lastCenter = center;

    const int side = 2 * m_halfExtent + 1;
    std::vector<DebugCell> out;
    out.reserve(static_cast<size_t>(side) * static_cast<size_t>(side));
    for (int dz = -m_halfExtent; dz <= m_halfExtent; ++dz) {
        for (int dx = -m_halfExtent; dx <= m_halfExtent; ++dx) {
            const CellCoord cell{center.x + dx, center.z + dz};
            out.push_back(DebugCell{cell, m_grid.isBlocked(cell)});
        }
    }
    return out;
}

bool GridDebugView::needsRebuild(float centerX, float centerZ) const {
    if (!m_lastCenter) {
        return true;
    }
    const CellCoord center = GridIndex::worldToCell(centerX, centerZ);
    return std::abs(center.x - m_lastCenter->x) > REBUILD_DISTANCE ||
           std::abs(center.z - m_lastCenter->z) > REBUILD_DISTANCE;
}

} // namespace VoxelNav
