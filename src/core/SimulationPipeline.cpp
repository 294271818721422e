/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/SimulationPipeline.hpp"
#include "core/Logger.hpp"
#include "entities/EntityRegistry.hpp"
#include <fmt/format.h>

namespace VoxelNav {

const SimulationConfig& SimulationPipeline::validated(const SimulationConfig& config) {
    config.validate();
    return config;
}

SimulationPipeline::SimulationPipeline(const SimulationConfig& config)
    : m_config(validated(config)),
      m_planner(m_grid, m_config.planner),
      m_factory(m_config.agents),
      m_obstacles(m_grid, &m_events),
      m_spawners(m_grid, m_factory, &m_events),
      m_pursuit(m_opponents, m_config.pursuit, &m_events),
      m_wander(m_grid, m_opponents, m_config.wander),
      m_movement(m_planner, m_config.movement, &m_events),
      m_detector(m_config.collision),
      m_responder(m_opponents, m_config.collision, &m_events) {
    SIM_INFO(fmt::format("Pipeline ready (planner budget {}, hash cell {})",
                         m_config.planner.maxIterations, m_config.collision.cellSize));
}

void SimulationPipeline::update(EntityRegistry& registry, float deltaTime) {
    m_obstacles.update(registry);
    m_spawners.update(registry, deltaTime);

    m_pursuit.update(registry, deltaTime);
    m_wander.update(registry, deltaTime);

    m_movement.update(registry, deltaTime);
    m_detector.update(registry);
    m_responder.update(registry);

    m_events.dispatch();
    ++m_tickCount;
}

bool SimulationPipeline::requestMoveTo(EntityRegistry& registry, EntityID id, float x, float z) {
    PathFollower* follower = registry.get<PathFollower>(id);
    if (!follower) {
        SIM_WARN(fmt::format("Move request for entity {} without a PathFollower", id));
        return false;
    }
    MovementExecutor::requestMoveTo(*follower, Vector2D(x, z));
    SIM_DEBUG(fmt::format("Entity {} moving to ({:.2f}, {:.2f})", id, x, z));
    return true;
}

} // namespace VoxelNav
