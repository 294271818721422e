/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/behaviors/WanderBehavior.hpp"
#include "ai/MovementExecutor.hpp"
#include "ai/OpponentSelector.hpp"
#include "core/Logger.hpp"
#include "entities/EntityRegistry.hpp"
#include <algorithm>
#include <cmath>
#include <fmt/format.h>
#include <numbers>

namespace VoxelNav {

namespace {

std::mt19937 makeRng(uint32_t seed) {
  if (seed != 0) {
    return std::mt19937(seed);
  }
  std::random_device rd;
  return std::mt19937(rd());
}

} // namespace

WanderBehavior::WanderBehavior(const GridIndex &grid,
                               const OpponentSelector &opponents,
                               const WanderBehaviorConfig &config)
    : m_grid(grid), m_opponents(opponents), m_config(config),
      m_rng(makeRng(config.randomSeed)) {
  m_config.validate();
}

void WanderBehavior::update(EntityRegistry &registry, float deltaTime) {
  if (!m_active) {
    return;
  }

  std::vector<CellCoord> avoid;
  for (EntityID id : registry.query<WanderData, PathFollower, Position>()) {
    // Pursuit owns the follower while seeking or chasing
    if (const PursuitData *pursuit = registry.get<PursuitData>(id);
        pursuit && isPursuing(pursuit->state)) {
      continue;
    }

    WanderData &wander = *registry.get<WanderData>(id);
    PathFollower &follower = *registry.get<PathFollower>(id);

    if (wander.waitTime > 0.0f) {
      wander.waitTime -= deltaTime;
    }

    const bool idle = !follower.hasActivePath() && !follower.needsPath;
    if (!idle) {
      continue;
    }

    // The follower finished (or gave up on) the last wander target
    if (wander.travelling) {
      wander.travelling = false;
      wander.waitTime = randomWait(wander);
      continue;
    }

    if (wander.waitTime > 0.0f || follower.pathRetryTime > 0.0f) {
      continue;
    }

    avoid.clear();
    if (m_config.avoidOpponentCells) {
      for (EntityID opponent : m_opponents.validOpponents(registry, id)) {
        const Position *pos = registry.get<Position>(opponent);
        avoid.push_back(GridIndex::worldToCell(pos->x, pos->z));
      }
    }

    const std::optional<CellCoord> cell = pickTarget(wander, avoid);
    if (!cell) {
      WANDER_DEBUG(fmt::format("Entity {} found no wander cell in {} attempts",
                               id, m_config.maxTargetAttempts));
      wander.waitTime = m_config.noTargetWait;
      continue;
    }

    MovementExecutor::requestMoveTo(follower, GridIndex::cellToWorld(*cell));
    wander.travelling = true;
  }
}

std::optional<CellCoord>
WanderBehavior::pickTarget(const WanderData &wander,
                           const std::vector<CellCoord> &avoid) {
  const CellCoord originCell = GridIndex::worldToCell(wander.origin);
  std::uniform_real_distribution<float> angleDist(0.0f,
                                                  2.0f * std::numbers::pi_v<float>);
  std::uniform_real_distribution<float> radiusDist(0.0f,
                                                   std::max(wander.radius, 0.0f));

  for (int attempt = 0; attempt < m_config.maxTargetAttempts; ++attempt) {
    const float angle = angleDist(m_rng);
    const float dist = radiusDist(m_rng);
    const CellCoord cell{
        originCell.x + static_cast<int>(std::floor(std::cos(angle) * dist)),
        originCell.z + static_cast<int>(std::floor(std::sin(angle) * dist))};

    if (m_grid.isBlocked(cell)) continue;
    if (std::find(avoid.begin(), avoid.end(), cell) != avoid.end()) continue;
    return cell;
  }
  return std::nullopt;
}

float WanderBehavior::randomWait(const WanderData &wander) {
  if (wander.maxWait <= wander.minWait) {
    return wander.minWait;
  }
  std::uniform_real_distribution<float> waitDist(wander.minWait, wander.maxWait);
  return waitDist(m_rng);
}

} // namespace VoxelNav
