/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef VOXELNAV_PURSUIT_BEHAVIOR_HPP
#define VOXELNAV_PURSUIT_BEHAVIOR_HPP

#include "ai/AIBehavior.hpp"
#include "ai/BehaviorConfig.hpp"
#include "entities/Components.hpp"
#include "entities/Entity.hpp"
#include "world/GridIndex.hpp"
#include <string>

namespace VoxelNav {

class NavEventQueue;
class OpponentSelector;

/**
 * @brief Four-state pursuit machine for PursuitData + PathFollower agents
 *
 * Idle -> Seeking when a valid opponent is within the detection radius.
 * Seeking chases the opponent's current cell and counts waypoint steps;
 * when the budget runs out the aggravation counter grows, and the agent
 * either cools down or, at the threshold, enters AggressivePursuit.
 * AggressivePursuit chases the opponent's intended destination until the
 * timer runs out, the opponent escapes, or the opponent disappears; each of
 * those resets aggravation and cools down. Cooldown returns to Idle.
 *
 * Must run before WanderBehavior each tick so a freshly detected opponent
 * wins over a wander retarget.
 */
class PursuitBehavior : public AIBehavior {
public:
  PursuitBehavior(const OpponentSelector &opponents,
                  const PursuitBehaviorConfig &config = {},
                  NavEventQueue *events = nullptr);

  void update(EntityRegistry &registry, float deltaTime) override;

  std::string getName() const override { return "Pursuit"; }

private:
  void updateIdle(EntityRegistry &registry, EntityID id, PursuitData &data,
                  PathFollower &follower);
  void updateSeeking(EntityRegistry &registry, EntityID id, PursuitData &data,
                     PathFollower &follower);
  void updateCooldown(EntityRegistry &registry, EntityID id, PursuitData &data,
                      float deltaTime);
  void updateAggressive(EntityRegistry &registry, EntityID id,
                        PursuitData &data, PathFollower &follower,
                        const CellCoord &selfCell, float deltaTime);

  // Counts one step per single-waypoint advance once the path has settled
  void countSteps(PursuitData &data, const PathFollower &follower) const;

  // Aims the follower at a new cell; step counting waits for the new path
  void retarget(PursuitData &data, PathFollower &follower,
                const CellCoord &cell) const;

  // Stops the follower and lets wander take over after a short pause
  void releaseToWander(EntityRegistry &registry, EntityID id,
                       PathFollower &follower) const;

  void enterCooldown(EntityRegistry &registry, EntityID id, PursuitData &data,
                     PathFollower &follower, bool resetAggravation);

  void transition(EntityRegistry &registry, EntityID id, PursuitData &data,
                  PursuitState to);

  const OpponentSelector &m_opponents;
  PursuitBehaviorConfig m_config;
  NavEventQueue *m_events;
};

} // namespace VoxelNav

#endif // VOXELNAV_PURSUIT_BEHAVIOR_HPP
