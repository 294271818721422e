/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef VOXELNAV_PATH_PLANNER_HPP
#define VOXELNAV_PATH_PLANNER_HPP

#include <cstdint>
#include <ostream>
#include <queue>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include "ai/BehaviorConfig.hpp"
#include "world/GridIndex.hpp"

namespace VoxelNav {

enum class PathfindingResult { SUCCESS, NO_PATH_FOUND, INVALID_START, INVALID_GOAL, TIMEOUT };

// Stream operator for PathfindingResult to support test output
inline std::ostream& operator<<(std::ostream& os, const PathfindingResult& result) {
    switch (result) {
        case PathfindingResult::SUCCESS: return os << "SUCCESS";
        case PathfindingResult::NO_PATH_FOUND: return os << "NO_PATH_FOUND";
        case PathfindingResult::INVALID_START: return os << "INVALID_START";
        case PathfindingResult::INVALID_GOAL: return os << "INVALID_GOAL";
        case PathfindingResult::TIMEOUT: return os << "TIMEOUT";
        default: return os << "UNKNOWN";
    }
}

using Path = std::vector<CellCoord>;

/**
 * @brief A* over the 4-connected, uniform-cost grid held by GridIndex
 *
 * Heuristic is Manhattan distance, so returned paths are shortest. The
 * search is synchronous and bounded by an expansion budget; running out of
 * budget is reported as TIMEOUT, which callers treat like NO_PATH_FOUND.
 *
 * A successful path starts at the start cell and ends at the goal cell,
 * and consecutive cells differ by one step along one axis.
 */
class PathPlanner {
public:
    explicit PathPlanner(const GridIndex& grid, const PathPlannerConfig& config = {});

    // Uses the configured iteration budget
    PathfindingResult findPath(const CellCoord& start, const CellCoord& goal,
                               Path& outPath);

    // outPath is cleared, and filled only on SUCCESS
    PathfindingResult findPath(const CellCoord& start, const CellCoord& goal,
                               Path& outPath, int maxIterations);

    int getMaxIterations() const { return m_config.maxIterations; }

    // Statistics
    struct PathfindingStats {
        uint64_t totalRequests{0};
        uint64_t successfulPaths{0};
        uint64_t noPathFound{0};
        uint64_t timeouts{0};
        uint64_t invalidStarts{0};
        uint64_t invalidGoals{0};
        uint64_t totalIterations{0};
    };

    void resetStats() { m_stats = PathfindingStats{}; }
    const PathfindingStats& getStats() const { return m_stats; }

private:
    struct SearchScratch {
        struct Node { CellCoord cell; int f; uint64_t seq; };
        // Lowest f first, earliest insertion wins ties
        struct Cmp {
            bool operator()(const Node& a, const Node& b) const {
                return a.f > b.f || (a.f == b.f && a.seq > b.seq);
            }
        };

        std::priority_queue<Node, std::vector<Node>, Cmp> open;
        std::unordered_map<CellCoord, int, CellCoordHash> gScore;
        std::unordered_map<CellCoord, CellCoord, CellCoordHash> parent;
        std::unordered_set<CellCoord, CellCoordHash> closed;
        uint64_t nextSeq{0};

        void reset() {
            open = {};
            gScore.clear();
            parent.clear();
            closed.clear();
            nextSeq = 0;
        }
    };

    void reconstruct(const CellCoord& start, const CellCoord& goal, Path& outPath) const;

    const GridIndex& m_grid;
    PathPlannerConfig m_config;
    PathfindingStats m_stats;
    SearchScratch m_scratch; // reused across calls to keep bucket storage
};

} // namespace VoxelNav

#endif // VOXELNAV_PATH_PLANNER_HPP
