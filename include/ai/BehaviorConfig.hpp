/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef VOXELNAV_BEHAVIOR_CONFIG_HPP
#define VOXELNAV_BEHAVIOR_CONFIG_HPP

#include <cstdint>

namespace VoxelNav
{

/**
 * Configuration for PathPlanner
 *
 * The iteration budget is the only cancellation mechanism a search has, so
 * it bounds the worst-case cost of a single tick.
 */
struct PathPlannerConfig
{
    int maxIterations = 1000;                     // Node expansions before a search gives up

    void validate() const;
};

/**
 * Configuration for MovementExecutor
 */
struct MovementConfig
{
    float arrivalThreshold = 0.05f;               // Distance (units) at which a waypoint snaps
    float pathRetryCooldown = 0.5f;               // Seconds before a failed request may plan again
    float facingEpsilon = 0.01f;                  // Minimum waypoint distance that updates facing

    void validate() const;
};

/**
 * Configuration for WanderBehavior
 *
 * Controls target selection around an agent's origin. Per-agent radius and
 * wait range live on the WanderData component.
 */
struct WanderBehaviorConfig
{
    int maxTargetAttempts = 20;                   // Random cells tried before giving up this tick
    float noTargetWait = 0.5f;                    // Seconds to wait when no cell was accepted
    bool avoidOpponentCells = true;               // Reject cells occupied by a valid opponent
    uint32_t randomSeed = 0;                      // 0 seeds from std::random_device

    void validate() const;
};

/**
 * Configuration for PursuitBehavior
 *
 * Per-agent radii, budgets and timers live on the PursuitData component;
 * these are the rules shared by every pursuer.
 */
struct PursuitBehaviorConfig
{
    float escapeRadiusMultiplier = 4.0f;          // Aggressive pursuit ends beyond detection * this
    int minCountedIndex = 2;                      // Waypoint index before steps start counting
    float resumeWanderWait = 0.5f;                // Wander wait applied when pursuit hands back control

    void validate() const;
};

/**
 * Configuration for CollisionDetector and CollisionResponder
 */
struct CollisionConfig
{
    float cellSize = 2.0f;                        // Spatial hash bucket size (units)
    float agentNudgeThreshold = 0.2f;             // Agent overlap tolerated without correction
    float nudgeFactor = 0.5f;                     // Fraction of penetration applied per nudge
    float obstacleWait = 0.2f;                    // Wander wait after a reverting contact

    void validate() const;
};

/**
 * Archetype defaults applied by EntityFactory
 */
struct AgentDefaults
{
    // NPC movement and body
    float npcMoveSpeed = 3.0f;                    // Units per second
    float npcRadius = 0.3f;

    // NPC wander
    float wanderRadius = 5.0f;                    // Used when no spawner supplies one
    float wanderMinWait = 0.5f;                   // Seconds idle at a reached destination
    float wanderMaxWait = 1.5f;
    float wanderInitialWait = 0.5f;

    // NPC pursuit
    float detectionRadius = 4.0f;                 // Cells
    int pursuitSteps = 5;                         // Counted steps per Seeking episode
    float cooldownTime = 3.0f;                    // Seconds
    int aggravationThreshold = 3;                 // Exhausted episodes before aggressive pursuit
    float aggressiveDuration = 10.0f;             // Seconds

    // Player movement and body
    float playerMoveSpeed = 4.0f;
    float playerRadius = 0.3f;

    // Blocks are unit cubes
    float blockHalfExtent = 0.5f;

    void validate() const;
};

/**
 * Configuration for SimulationPipeline
 */
struct SimulationConfig
{
    PathPlannerConfig planner;
    MovementConfig movement;
    WanderBehaviorConfig wander;
    PursuitBehaviorConfig pursuit;
    CollisionConfig collision;
    AgentDefaults agents;

    void validate() const;
};

} // namespace VoxelNav

#endif // VOXELNAV_BEHAVIOR_CONFIG_HPP
