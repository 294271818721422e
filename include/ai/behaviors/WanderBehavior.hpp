/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef VOXELNAV_WANDER_BEHAVIOR_HPP
#define VOXELNAV_WANDER_BEHAVIOR_HPP

#include "ai/AIBehavior.hpp"
#include "ai/BehaviorConfig.hpp"
#include "entities/Components.hpp"
#include "world/GridIndex.hpp"
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace VoxelNav {

class OpponentSelector;

/**
 * @brief Idle wandering around an origin for WanderData + PathFollower agents
 *
 * An agent that has no active or requested path and whose wait has run out
 * gets a random walkable cell within its radius as the new follower target.
 * Agents that are seeking or in aggressive pursuit are left alone.
 */
class WanderBehavior : public AIBehavior {
public:
  WanderBehavior(const GridIndex &grid, const OpponentSelector &opponents,
                 const WanderBehaviorConfig &config = {});

  void update(EntityRegistry &registry, float deltaTime) override;

  std::string getName() const override { return "Wander"; }

  /**
   * @brief Draws up to maxTargetAttempts random cells around the origin
   *
   * Rejects blocked cells and any cell listed in avoid.
   * @return the first accepted cell, or nullopt when every attempt failed
   */
  std::optional<CellCoord> pickTarget(const WanderData &wander,
                                      const std::vector<CellCoord> &avoid);

private:
  float randomWait(const WanderData &wander);

  const GridIndex &m_grid;
  const OpponentSelector &m_opponents;
  WanderBehaviorConfig m_config;
  std::mt19937 m_rng;
};

} // namespace VoxelNav

#endif // VOXELNAV_WANDER_BEHAVIOR_HPP
