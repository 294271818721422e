/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef VOXELNAV_AI_BEHAVIOR_HPP
#define VOXELNAV_AI_BEHAVIOR_HPP

#include <string>

namespace VoxelNav {

class EntityRegistry;

/**
 * @brief Decision layer that runs once per tick over every agent it manages
 *
 * Behaviors choose destinations and hand them to the PathFollower
 * (target + needsPath). They never move entities themselves.
 */
class AIBehavior {
public:
  virtual ~AIBehavior() = default;

  /**
   * @brief Run one decision pass
   *
   * @param registry Entity store; the behavior selects agents by component
   * @param deltaTime Seconds since the previous tick
   */
  virtual void update(EntityRegistry &registry, float deltaTime) = 0;

  // Behavior identification
  virtual std::string getName() const = 0;

  // Behavior state access
  virtual bool isActive() const { return m_active; }
  virtual void setActive(bool active) { m_active = active; }

protected:
  bool m_active{true};
};

} // namespace VoxelNav

#endif // VOXELNAV_AI_BEHAVIOR_HPP
