/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef VOXELNAV_MOVEMENT_EXECUTOR_HPP
#define VOXELNAV_MOVEMENT_EXECUTOR_HPP

#include "ai/BehaviorConfig.hpp"
#include "ai/pathfinding/PathPlanner.hpp"
#include "entities/Components.hpp"
#include "entities/Entity.hpp"
#include "utils/Vector2D.hpp"

namespace VoxelNav {

class EntityRegistry;
class NavEventQueue;

/**
 * @brief Steers every Position + PathFollower entity along its path
 *
 * Per entity and tick:
 *  1. Remember the pre-move position (MovementState) for collision revert
 *  2. Tick down the retry cooldown
 *  3. Plan if a path was requested and the cooldown allows it. Success
 *     replaces the path; failure arms the cooldown and keeps whatever path
 *     was active. The request flag is consumed either way.
 *  4. Move toward the current waypoint centre, never past it. Within the
 *     arrival threshold, snap and advance; the last waypoint clears the path.
 *  5. Update Facing while the waypoint is not underfoot.
 *
 * An unreachable target is not an error: the requester keeps asking and
 * the cooldown limits how often the planner is hit.
 */
class MovementExecutor {
public:
    explicit MovementExecutor(PathPlanner& planner, const MovementConfig& config = {},
                              NavEventQueue* events = nullptr);

    void update(EntityRegistry& registry, float deltaTime);

    void updateEntity(EntityID id, Position& pos, PathFollower& follower,
                      MovementState* history, Facing* facing, float deltaTime);

    // Click-to-move and remote feeds: point the follower somewhere new
    static void requestMoveTo(PathFollower& follower, const Vector2D& target);

    // Moves pos toward target by at most maxStep; returns the distance moved
    static float stepToward(Vector2D& pos, const Vector2D& target, float maxStep);

    const MovementConfig& getConfig() const { return m_config; }

private:
    void planIfRequested(EntityID id, const Position& pos, PathFollower& follower);

    PathPlanner& m_planner;
    MovementConfig m_config;
    NavEventQueue* m_events;
    Path m_pathBuffer;
};

} // namespace VoxelNav

#endif // VOXELNAV_MOVEMENT_EXECUTOR_HPP
