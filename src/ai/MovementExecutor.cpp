/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/MovementExecutor.hpp"
#include "core/Logger.hpp"
#include "entities/EntityRegistry.hpp"
#include "events/NavEventQueue.hpp"
#include "world/GridIndex.hpp"
#include <algorithm>
#include <fmt/format.h>

namespace VoxelNav {

MovementExecutor::MovementExecutor(PathPlanner& planner, const MovementConfig& config,
                                   NavEventQueue* events)
    : m_planner(planner), m_config(config), m_events(events) {
    m_config.validate();
}

void MovementExecutor::update(EntityRegistry& registry, float deltaTime) {
    for (EntityID id : registry.query<Position, PathFollower>()) {
        updateEntity(id, *registry.get<Position>(id), *registry.get<PathFollower>(id),
                     registry.get<MovementState>(id), registry.get<Facing>(id), deltaTime);
    }
}

void MovementExecutor::updateEntity(EntityID id, Position& pos, PathFollower& follower,
                                    MovementState* history, Facing* facing, float deltaTime) {
    if (history) {
        history->previous = pos.ground();
    }

    if (follower.pathRetryTime > 0.0f) {
        follower.pathRetryTime -= deltaTime;
    }

    if (follower.needsPath && follower.pathRetryTime <= 0.0f) {
        planIfRequested(id, pos, follower);
    }

    if (!follower.hasActivePath()) {
        if (follower.pathIndex >= 0) {
            follower.clearPath();
        }
        return;
    }

    const Vector2D waypoint = GridIndex::cellToWorld(follower.path[follower.pathIndex]);
    Vector2D current = pos.ground();
    const Vector2D toWaypoint = waypoint - current;
    const float dist = toWaypoint.length();

    if (dist < m_config.arrivalThreshold) {
        pos.setGround(waypoint);
        follower.pathIndex++;
        if (follower.pathIndex >= static_cast<int>(follower.path.size())) {
            MOVEMENT_DEBUG(fmt::format("Entity {} arrived at ({},{})", id,
                                       waypoint.getX(), waypoint.getZ()));
            follower.clearPath();
        }
    } else {
        stepToward(current, waypoint, follower.moveSpeed * deltaTime);
        pos.setGround(current);
    }

    if (facing && dist > m_config.facingEpsilon) {
        facing->angle = toWaypoint.heading();
    }
}

void MovementExecutor::planIfRequested(EntityID id, const Position& pos, PathFollower& follower) {
    const CellCoord start = GridIndex::worldToCell(pos.x, pos.z);
    const CellCoord goal = GridIndex::worldToCell(follower.target);

    const PathfindingResult result = m_planner.findPath(start, goal, m_pathBuffer);
    follower.needsPath = false;

    if (result == PathfindingResult::SUCCESS) {
        follower.path.swap(m_pathBuffer);
        follower.pathIndex = 0;
        return;
    }

    follower.pathRetryTime = m_config.pathRetryCooldown;
    MOVEMENT_DEBUG(fmt::format("Entity {} could not plan ({},{}) -> ({},{}): retry in {}s",
                               id, start.x, start.z, goal.x, goal.z, m_config.pathRetryCooldown));
    if (m_events) {
        m_events->push(NavEvent::withCell(NavEventType::PathFailed, id, goal));
    }
}

void MovementExecutor::requestMoveTo(PathFollower& follower, const Vector2D& target) {
    follower.target = target;
    follower.needsPath = true;
}

float MovementExecutor::stepToward(Vector2D& pos, const Vector2D& target, float maxStep) {
    const Vector2D delta = target - pos;
    const float dist = delta.length();
    if (dist <= 0.0f || maxStep <= 0.0f) {
        return 0.0f;
    }

    // Ratio clamp: a long frame lands on the target instead of past it
    const float ratio = std::min(maxStep / dist, 1.0f);
    if (ratio >= 1.0f) {
        pos = target;
        return dist;
    }
    pos += delta * ratio;
    return dist * ratio;
}

} // namespace VoxelNav
