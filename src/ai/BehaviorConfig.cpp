/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/BehaviorConfig.hpp"
#include <fmt/format.h>
#include <stdexcept>

namespace VoxelNav {

namespace {

void requirePositive(float value, const char* name) {
    if (!(value > 0.0f)) {
        throw std::invalid_argument(fmt::format("{} must be > 0 (got {})", name, value));
    }
}

void requireNonNegative(float value, const char* name) {
    if (!(value >= 0.0f)) {
        throw std::invalid_argument(fmt::format("{} must be >= 0 (got {})", name, value));
    }
}

void requireAtLeast(int value, int minimum, const char* name) {
    if (value < minimum) {
        throw std::invalid_argument(
            fmt::format("{} must be >= {} (got {})", name, minimum, value));
    }
}

} // namespace

void PathPlannerConfig::validate() const {
    requireAtLeast(maxIterations, 1, "PathPlannerConfig::maxIterations");
}

void MovementConfig::validate() const {
    requirePositive(arrivalThreshold, "MovementConfig::arrivalThreshold");
    requireNonNegative(pathRetryCooldown, "MovementConfig::pathRetryCooldown");
    requireNonNegative(facingEpsilon, "MovementConfig::facingEpsilon");
}

void WanderBehaviorConfig::validate() const {
    requireAtLeast(maxTargetAttempts, 1, "WanderBehaviorConfig::maxTargetAttempts");
    requireNonNegative(noTargetWait, "WanderBehaviorConfig::noTargetWait");
}

void PursuitBehaviorConfig::validate() const {
    requirePositive(escapeRadiusMultiplier, "PursuitBehaviorConfig::escapeRadiusMultiplier");
    requireAtLeast(minCountedIndex, 0, "PursuitBehaviorConfig::minCountedIndex");
    requireNonNegative(resumeWanderWait, "PursuitBehaviorConfig::resumeWanderWait");
}

void CollisionConfig::validate() const {
    requirePositive(cellSize, "CollisionConfig::cellSize");
    requireNonNegative(agentNudgeThreshold, "CollisionConfig::agentNudgeThreshold");
    requireNonNegative(nudgeFactor, "CollisionConfig::nudgeFactor");
    requireNonNegative(obstacleWait, "CollisionConfig::obstacleWait");
}

void AgentDefaults::validate() const {
    requirePositive(npcMoveSpeed, "AgentDefaults::npcMoveSpeed");
    requirePositive(npcRadius, "AgentDefaults::npcRadius");
    requireNonNegative(wanderRadius, "AgentDefaults::wanderRadius");
    requireNonNegative(wanderMinWait, "AgentDefaults::wanderMinWait");
    if (wanderMaxWait < wanderMinWait) {
        throw std::invalid_argument(
            fmt::format("AgentDefaults::wanderMaxWait ({}) is below wanderMinWait ({})",
                        wanderMaxWait, wanderMinWait));
    }
    requireNonNegative(wanderInitialWait, "AgentDefaults::wanderInitialWait");
    requireNonNegative(detectionRadius, "AgentDefaults::detectionRadius");
    requireAtLeast(pursuitSteps, 1, "AgentDefaults::pursuitSteps");
    requireNonNegative(cooldownTime, "AgentDefaults::cooldownTime");
    requireAtLeast(aggravationThreshold, 1, "AgentDefaults::aggravationThreshold");
    requireNonNegative(aggressiveDuration, "AgentDefaults::aggressiveDuration");
    requirePositive(playerMoveSpeed, "AgentDefaults::playerMoveSpeed");
    requirePositive(playerRadius, "AgentDefaults::playerRadius");
    requirePositive(blockHalfExtent, "AgentDefaults::blockHalfExtent");
}

void SimulationConfig::validate() const {
    planner.validate();
    movement.validate();
    wander.validate();
    pursuit.validate();
    collision.validate();
    agents.validate();
}

} // namespace VoxelNav
