/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef VOXELNAV_SIMULATION_PIPELINE_HPP
#define VOXELNAV_SIMULATION_PIPELINE_HPP

/**
 * @file SimulationPipeline.hpp
 * @brief Owns the navigation systems and runs them in tick order
 *
 * One update() is one simulation tick:
 *   1. ObstacleSynchronizer   - grid follows block entities
 *   2. SpawnerSystem          - timed NPC spawns
 *   3. PursuitBehavior        - detection and chase targets
 *   4. WanderBehavior         - idle targets for everyone not pursuing
 *   5. MovementExecutor       - planning and steering
 *   6. CollisionDetector      - contact lists
 *   7. CollisionResponder     - revert / nudge
 *   8. NavEventQueue          - deliver this tick's events
 *
 * Pursuit runs before wander so a fresh detection wins the follower. The
 * pipeline is single threaded; dt comes from the caller's clock.
 */

#include <cstdint>
#include "ai/BehaviorConfig.hpp"
#include "ai/MovementExecutor.hpp"
#include "ai/OpponentSelector.hpp"
#include "ai/SpawnerSystem.hpp"
#include "ai/behaviors/PursuitBehavior.hpp"
#include "ai/behaviors/WanderBehavior.hpp"
#include "ai/pathfinding/PathPlanner.hpp"
#include "collisions/CollisionDetector.hpp"
#include "collisions/CollisionResponder.hpp"
#include "entities/EntityFactory.hpp"
#include "events/NavEventQueue.hpp"
#include "world/GridIndex.hpp"
#include "world/ObstacleSynchronizer.hpp"

namespace VoxelNav {

class EntityRegistry;

class SimulationPipeline {
public:
    /**
     * @throws std::invalid_argument when any part of config fails validation
     */
    explicit SimulationPipeline(const SimulationConfig& config = {});

    SimulationPipeline(const SimulationPipeline&) = delete;
    SimulationPipeline& operator=(const SimulationPipeline&) = delete;

    void update(EntityRegistry& registry, float deltaTime);

    /**
     * @brief Click-to-move and remote position feeds
     * @return false if the entity has no PathFollower
     */
    bool requestMoveTo(EntityRegistry& registry, EntityID id, float x, float z);

    // Opponent for agents that carry no Ownership
    void setDefaultOpponent(EntityID id) { m_opponents.setDefaultOpponent(id); }

    uint64_t getTickCount() const { return m_tickCount; }
    const SimulationConfig& getConfig() const { return m_config; }

    GridIndex& getGrid() { return m_grid; }
    const GridIndex& getGrid() const { return m_grid; }
    PathPlanner& getPlanner() { return m_planner; }
    const OpponentSelector& getOpponents() const { return m_opponents; }
    NavEventQueue& getEvents() { return m_events; }
    const EntityFactory& getFactory() const { return m_factory; }
    const ObstacleSynchronizer& getObstacles() const { return m_obstacles; }
    SpawnerSystem& getSpawners() { return m_spawners; }
    PursuitBehavior& getPursuit() { return m_pursuit; }
    WanderBehavior& getWander() { return m_wander; }
    MovementExecutor& getMovement() { return m_movement; }
    const CollisionDetector& getCollisionDetector() const { return m_detector; }

private:
    static const SimulationConfig& validated(const SimulationConfig& config);

    // Declaration order is construction order: systems hold references to the members above them
    SimulationConfig m_config;
    GridIndex m_grid;
    PathPlanner m_planner;
    OpponentSelector m_opponents;
    NavEventQueue m_events;
    EntityFactory m_factory;
    ObstacleSynchronizer m_obstacles;
    SpawnerSystem m_spawners;
    PursuitBehavior m_pursuit;
    WanderBehavior m_wander;
    MovementExecutor m_movement;
    CollisionDetector m_detector;
    CollisionResponder m_responder;
    uint64_t m_tickCount{0};
};

} // namespace VoxelNav

#endif // VOXELNAV_SIMULATION_PIPELINE_HPP
