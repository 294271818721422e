/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/behaviors/PursuitBehavior.hpp"
#include "ai/OpponentSelector.hpp"
#include "core/Logger.hpp"
#include "entities/EntityRegistry.hpp"
#include "events/NavEventQueue.hpp"
#include <fmt/format.h>
#include <optional>

namespace VoxelNav {

namespace {

std::optional<CellCoord> opponentCell(const EntityRegistry &registry,
                                      EntityID opponent) {
  const Position *pos = registry.get<Position>(opponent);
  if (!pos) {
    return std::nullopt;
  }
  return GridIndex::worldToCell(pos->x, pos->z);
}

// Where the opponent is heading; its own cell if it has no follower
Vector2D opponentDestination(const EntityRegistry &registry, EntityID opponent,
                             const CellCoord &fallback) {
  if (const PathFollower *follower = registry.get<PathFollower>(opponent)) {
    return follower->target;
  }
  return GridIndex::cellToWorld(fallback);
}

} // namespace

PursuitBehavior::PursuitBehavior(const OpponentSelector &opponents,
                                 const PursuitBehaviorConfig &config,
                                 NavEventQueue *events)
    : m_opponents(opponents), m_config(config), m_events(events) {
  m_config.validate();
}

void PursuitBehavior::update(EntityRegistry &registry, float deltaTime) {
  if (!m_active) {
    return;
  }

  for (EntityID id : registry.query<PursuitData, PathFollower, Position>()) {
    PursuitData &data = *registry.get<PursuitData>(id);
    PathFollower &follower = *registry.get<PathFollower>(id);
    const Position &pos = *registry.get<Position>(id);
    const CellCoord selfCell = GridIndex::worldToCell(pos.x, pos.z);

    switch (data.state) {
    case PursuitState::Idle:
      updateIdle(registry, id, data, follower);
      break;
    case PursuitState::Seeking:
      updateSeeking(registry, id, data, follower);
      break;
    case PursuitState::Cooldown:
      updateCooldown(registry, id, data, deltaTime);
      break;
    case PursuitState::AggressivePursuit:
      updateAggressive(registry, id, data, follower, selfCell, deltaTime);
      break;
    }
  }
}

void PursuitBehavior::updateIdle(EntityRegistry &registry, EntityID id,
                                 PursuitData &data, PathFollower &follower) {
  const std::optional<EntityID> opponent =
      m_opponents.findNearestEnemy(registry, id, data.detectionRadius);
  if (!opponent) {
    return;
  }

  const CellCoord cell = *opponentCell(registry, *opponent);
  data.opponent = *opponent;
  data.stepsRemaining = data.pursuitSteps;
  data.lastOpponentCell = cell;
  data.lastPathIndex = -1;

  follower.clearPath();
  retarget(data, follower, cell);

  PURSUIT_DEBUG(fmt::format("Entity {} detected opponent {} at ({},{})", id,
                            *opponent, cell.x, cell.z));
  transition(registry, id, data, PursuitState::Seeking);
}

void PursuitBehavior::updateSeeking(EntityRegistry &registry, EntityID id,
                                    PursuitData &data,
                                    PathFollower &follower) {
  const std::optional<CellCoord> cell = opponentCell(registry, data.opponent);
  if (!cell || !m_opponents.isValidOpponent(registry, id, data.opponent)) {
    PURSUIT_DEBUG(fmt::format("Entity {} lost opponent {} while seeking", id,
                              data.opponent));
    enterCooldown(registry, id, data, follower, false);
    return;
  }

  countSteps(data, follower);

  if (data.stepsRemaining <= 0) {
    data.aggravationCount++;
    data.lastPathIndex = -1;

    if (data.aggravationCount >= data.aggravationThreshold) {
      data.aggressiveRemaining = data.aggressiveDuration;
      const Vector2D destination =
          opponentDestination(registry, data.opponent, *cell);
      data.lastOpponentDestination = destination;
      follower.target = destination;
      follower.needsPath = true;
      follower.clearPath();

      PURSUIT_INFO(fmt::format("Entity {} aggravated ({}/{}), chasing {}", id,
                               data.aggravationCount,
                               data.aggravationThreshold, data.opponent));
      transition(registry, id, data, PursuitState::AggressivePursuit);
    } else {
      enterCooldown(registry, id, data, follower, false);
    }
    return;
  }

  if (*cell != data.lastOpponentCell) {
    data.lastOpponentCell = *cell;
    retarget(data, follower, *cell);
  }

  // Keep chasing after arriving or after a failed plan
  if (!follower.hasActivePath() && follower.path.empty() &&
      !follower.needsPath) {
    follower.target = GridIndex::cellToWorld(*cell);
    follower.needsPath = true;
  }
}

void PursuitBehavior::updateCooldown(EntityRegistry &registry, EntityID id,
                                     PursuitData &data, float deltaTime) {
  data.cooldownRemaining -= deltaTime;
  if (data.cooldownRemaining <= 0.0f) {
    data.cooldownRemaining = 0.0f;
    data.opponent = INVALID_ENTITY_ID;
    transition(registry, id, data, PursuitState::Idle);
  }
}

void PursuitBehavior::updateAggressive(EntityRegistry &registry, EntityID id,
                                       PursuitData &data,
                                       PathFollower &follower,
                                       const CellCoord &selfCell,
                                       float deltaTime) {
  data.aggressiveRemaining -= deltaTime;

  const std::optional<CellCoord> cell = opponentCell(registry, data.opponent);
  if (!cell || !m_opponents.isValidOpponent(registry, id, data.opponent)) {
    PURSUIT_DEBUG(fmt::format("Entity {} lost opponent {} during aggressive pursuit",
                              id, data.opponent));
    enterCooldown(registry, id, data, follower, true);
    return;
  }

  const float escapeDistance =
      data.detectionRadius * m_config.escapeRadiusMultiplier;
  if (cellDistance(selfCell, *cell) > escapeDistance) {
    PURSUIT_DEBUG(fmt::format("Opponent {} escaped entity {}", data.opponent, id));
    enterCooldown(registry, id, data, follower, true);
    return;
  }

  const Vector2D destination =
      opponentDestination(registry, data.opponent, *cell);
  if (!(follower.target == destination)) {
    data.lastOpponentDestination = destination;
    follower.target = destination;
    follower.needsPath = true;
  }

  if (!follower.hasActivePath() && follower.path.empty() &&
      !follower.needsPath) {
    follower.needsPath = true;
  }

  if (data.aggressiveRemaining <= 0.0f) {
    enterCooldown(registry, id, data, follower, true);
  }
}

void PursuitBehavior::countSteps(PursuitData &data,
                                 const PathFollower &follower) const {
  const int index = follower.pathIndex;
  if (data.settling) {
    // Waypoint 0 is the start cell and 1 the first step of a fresh path
    if (index >= m_config.minCountedIndex) {
      data.settling = false;
    }
  } else if (index == data.lastPathIndex + 1 &&
             index >= m_config.minCountedIndex) {
    data.stepsRemaining--;
  }
  data.lastPathIndex = index;
}

void PursuitBehavior::retarget(PursuitData &data, PathFollower &follower,
                               const CellCoord &cell) const {
  follower.target = GridIndex::cellToWorld(cell);
  follower.needsPath = true;
  data.settling = true;
}

void PursuitBehavior::releaseToWander(EntityRegistry &registry, EntityID id,
                                      PathFollower &follower) const {
  follower.clearPath();
  follower.needsPath = false;
  if (WanderData *wander = registry.get<WanderData>(id)) {
    wander->waitTime = m_config.resumeWanderWait;
    wander->travelling = false;
  }
}

void PursuitBehavior::enterCooldown(EntityRegistry &registry, EntityID id,
                                    PursuitData &data, PathFollower &follower,
                                    bool resetAggravation) {
  if (resetAggravation) {
    data.aggravationCount = 0;
  }
  data.cooldownRemaining = data.cooldownTime;
  data.aggressiveRemaining = 0.0f;
  data.lastPathIndex = -1;
  data.settling = false;
  releaseToWander(registry, id, follower);
  transition(registry, id, data, PursuitState::Cooldown);
}

void PursuitBehavior::transition(EntityRegistry &registry, EntityID id,
                                 PursuitData &data, PursuitState to) {
  const PursuitState from = data.state;
  data.state = to;

  if (Appearance *appearance = registry.get<Appearance>(id)) {
    appearance->marker = markerFor(to);
  }
  if (m_events) {
    m_events->push(NavEvent::pursuitStateChanged(id, from, to));
  }
  PURSUIT_DEBUG(fmt::format("Entity {} {} -> {}", id, static_cast<int>(from),
                            static_cast<int>(to)));
}

} // namespace VoxelNav
