/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/pathfinding/PathPlanner.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <fmt/format.h>

namespace VoxelNav {

namespace {
// Neighbour order: -X, +X, -Z, +Z
constexpr int kDirX[4] = {-1, 1, 0, 0};
constexpr int kDirZ[4] = {0, 0, -1, 1};
} // namespace

PathPlanner::PathPlanner(const GridIndex& grid, const PathPlannerConfig& config)
    : m_grid(grid), m_config(config) {
    m_config.validate();
}

PathfindingResult PathPlanner::findPath(const CellCoord& start, const CellCoord& goal,
                                        Path& outPath) {
    return findPath(start, goal, outPath, m_config.maxIterations);
}

PathfindingResult PathPlanner::findPath(const CellCoord& start, const CellCoord& goal,
                                        Path& outPath, int maxIterations) {
    outPath.clear();
    m_stats.totalRequests++;

    if (maxIterations < 1) {
        PATHFIND_WARN(fmt::format("findPath: iteration budget {} leaves no room to search",
                                  maxIterations));
        m_stats.timeouts++;
        return PathfindingResult::TIMEOUT;
    }

    // Goal is checked first: planning into an obstacle is the common case
    if (m_grid.isBlocked(goal)) {
        PATHFIND_DEBUG(fmt::format("findPath: INVALID_GOAL - cell ({},{}) is blocked",
                                   goal.x, goal.z));
        m_stats.invalidGoals++;
        return PathfindingResult::INVALID_GOAL;
    }
    if (m_grid.isBlocked(start)) {
        PATHFIND_WARN(fmt::format("findPath: INVALID_START - cell ({},{}) is blocked",
                                  start.x, start.z));
        m_stats.invalidStarts++;
        return PathfindingResult::INVALID_START;
    }

    if (start == goal) {
        outPath.push_back(start);
        m_stats.successfulPaths++;
        return PathfindingResult::SUCCESS;
    }

    m_scratch.reset();
    auto& open = m_scratch.open;
    auto& gScore = m_scratch.gScore;
    auto& parent = m_scratch.parent;
    auto& closed = m_scratch.closed;

    gScore[start] = 0;
    open.push(SearchScratch::Node{start, manhattanDistance(start, goal), m_scratch.nextSeq++});

    int iterations = 0;
    while (!open.empty() && iterations < maxIterations) {
        const SearchScratch::Node cur = open.top();
        open.pop();

        // Stale duplicate of a node that was already expanded with a lower f
        if (!closed.insert(cur.cell).second) continue;
        ++iterations;

        if (cur.cell == goal) {
            reconstruct(start, goal, outPath);
            m_stats.successfulPaths++;
            m_stats.totalIterations += static_cast<uint64_t>(iterations);
            PATHFIND_DEBUG(fmt::format("findPath: ({},{}) -> ({},{}) in {} cells, {} expansions",
                                       start.x, start.z, goal.x, goal.z, outPath.size(), iterations));
            return PathfindingResult::SUCCESS;
        }

        const int gCur = gScore[cur.cell];
        for (int i = 0; i < 4; ++i) {
            const CellCoord next{cur.cell.x + kDirX[i], cur.cell.z + kDirZ[i]};
            if (closed.count(next) != 0 || m_grid.isBlocked(next)) continue;

            const int tentative = gCur + 1;
            auto it = gScore.find(next);
            if (it == gScore.end() || tentative < it->second) {
                gScore[next] = tentative;
                parent[next] = cur.cell;
                open.push(SearchScratch::Node{next, tentative + manhattanDistance(next, goal),
                                              m_scratch.nextSeq++});
            }
        }
    }

    m_stats.totalIterations += static_cast<uint64_t>(iterations);

    // Determine termination reason: exhausted search vs. iteration cap
    if (open.empty()) {
        PATHFIND_DEBUG(fmt::format("findPath: NO_PATH_FOUND ({},{}) -> ({},{}) after {} expansions",
                                   start.x, start.z, goal.x, goal.z, iterations));
        m_stats.noPathFound++;
        return PathfindingResult::NO_PATH_FOUND;
    }

    PATHFIND_DEBUG(fmt::format("findPath: TIMEOUT ({},{}) -> ({},{}) after {} expansions",
                               start.x, start.z, goal.x, goal.z, iterations));
    m_stats.timeouts++;
    return PathfindingResult::TIMEOUT;
}

void PathPlanner::reconstruct(const CellCoord& start, const CellCoord& goal, Path& outPath) const {
    outPath.clear();
    CellCoord cur = goal;
    outPath.push_back(cur);
    while (cur != start) {
        auto it = m_scratch.parent.find(cur);
        if (it == m_scratch.parent.end()) break;
        cur = it->second;
        outPath.push_back(cur);
    }
    std::reverse(outPath.begin(), outPath.end());
}

} // namespace VoxelNav
