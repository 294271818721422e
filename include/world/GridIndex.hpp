/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef VOXELNAV_GRID_INDEX_HPP
#define VOXELNAV_GRID_INDEX_HPP

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <ostream>
#include <unordered_set>
#include "utils/Vector2D.hpp"

namespace VoxelNav {

/**
 * @brief Integer cell on the ground plane. Cell (x, z) is centred on world
 * (x, z) and spans half a unit either side.
 */
struct CellCoord {
    int x{0};
    int z{0};

    bool operator==(const CellCoord& other) const { return x == other.x && z == other.z; }
    bool operator!=(const CellCoord& other) const { return !(*this == other); }
    bool operator<(const CellCoord& other) const {
        return x < other.x || (x == other.x && z < other.z);
    }
};

struct CellCoordHash {
    size_t operator()(const CellCoord& c) const noexcept {
        return (static_cast<uint64_t>(static_cast<uint32_t>(c.x)) << 32) ^
               static_cast<uint32_t>(c.z);
    }
};

inline std::ostream& operator<<(std::ostream& os, const CellCoord& c) {
    return os << "(" << c.x << "," << c.z << ")";
}

inline int manhattanDistance(const CellCoord& a, const CellCoord& b) {
    return std::abs(a.x - b.x) + std::abs(a.z - b.z);
}

// Straight-line distance measured in cells, used for detection radii
float cellDistance(const CellCoord& a, const CellCoord& b);

/**
 * @brief Authoritative walkable/blocked set for the whole world.
 *
 * The world is unbounded, so only blocked cells are stored. Membership is
 * binary: several obstacles sharing a cell do not stack, only the add and
 * remove transitions matter.
 *
 * Owned by SimulationPipeline and handed by reference to the systems that
 * read or write it. Written only by ObstacleSynchronizer during a tick.
 */
class GridIndex {
public:
    GridIndex() = default;

    void setBlocked(int cellX, int cellZ);
    void setWalkable(int cellX, int cellZ);
    bool isBlocked(int cellX, int cellZ) const;

    void setBlocked(const CellCoord& cell) { setBlocked(cell.x, cell.z); }
    void setWalkable(const CellCoord& cell) { setWalkable(cell.x, cell.z); }
    bool isBlocked(const CellCoord& cell) const { return isBlocked(cell.x, cell.z); }

    // Rounds each axis to the nearest integer, halves toward +infinity
    static CellCoord worldToCell(float x, float z);
    static CellCoord worldToCell(const Vector2D& pos) { return worldToCell(pos.getX(), pos.getZ()); }

    // Identity: the cell index is the world coordinate of its centre
    static Vector2D cellToWorld(int cellX, int cellZ);
    static Vector2D cellToWorld(const CellCoord& cell) { return cellToWorld(cell.x, cell.z); }

    void clear();
    size_t getBlockedCount() const { return m_blocked.size(); }

private:
    std::unordered_set<CellCoord, CellCoordHash> m_blocked;
};

} // namespace VoxelNav

#endif // VOXELNAV_GRID_INDEX_HPP
