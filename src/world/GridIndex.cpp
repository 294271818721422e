/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "world/GridIndex.hpp"
#include "core/Logger.hpp"
#include <cmath>
#include <fmt/format.h>

namespace VoxelNav {

float cellDistance(const CellCoord& a, const CellCoord& b) {
    const float dx = static_cast<float>(a.x - b.x);
    const float dz = static_cast<float>(a.z - b.z);
    return std::sqrt(dx * dx + dz * dz);
}

void GridIndex::setBlocked(int cellX, int cellZ) {
    m_blocked.insert(CellCoord{cellX, cellZ});
}

void GridIndex::setWalkable(int cellX, int cellZ) {
    m_blocked.erase(CellCoord{cellX, cellZ});
}

bool GridIndex::isBlocked(int cellX, int cellZ) const {
    return m_blocked.find(CellCoord{cellX, cellZ}) != m_blocked.end();
}

CellCoord GridIndex::worldToCell(float x, float z) {
    return CellCoord{static_cast<int>(std::floor(x + 0.5f)),
                     static_cast<int>(std::floor(z + 0.5f))};
}

Vector2D GridIndex::cellToWorld(int cellX, int cellZ) {
    return Vector2D(static_cast<float>(cellX), static_cast<float>(cellZ));
}

void GridIndex::clear() {
    GRID_DEBUG(fmt::format("Clearing {} blocked cells", m_blocked.size()));
    m_blocked.clear();
}

} // namespace VoxelNav
