/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef VOXELNAV_COMPONENTS_HPP
#define VOXELNAV_COMPONENTS_HPP

/**
 * @file Components.hpp
 * @brief Per-entity data records stored by EntityRegistry
 *
 * Records are plain data. Each tick phase has one writer:
 * - Position: MovementExecutor (steering), CollisionResponder (revert/nudge)
 * - PathFollower: pursuit/wander set target + needsPath, MovementExecutor
 *   consumes them, CollisionResponder clears stale paths
 * - PursuitData: PursuitBehavior only
 * - WanderData: WanderBehavior, plus wait resets from pursuit and collision
 * - CollisionState: CollisionDetector only
 */

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <vector>
#include <boost/container/flat_set.hpp>
#include <boost/container/small_vector.hpp>
#include "collisions/CollisionBody.hpp"
#include "collisions/CollisionInfo.hpp"
#include "entities/Entity.hpp"
#include "utils/Vector2D.hpp"
#include "world/GridIndex.hpp"

namespace VoxelNav {

struct Position {
    float x{0.0f};
    float y{0.0f};   // Height, ignored by navigation
    float z{0.0f};

    Vector2D ground() const { return Vector2D(x, z); }
    void setGround(const Vector2D& p) { x = p.getX(); z = p.getZ(); }
};

// Ground position before this tick's movement, for collision revert
struct MovementState {
    Vector2D previous;
};

// Yaw in radians, atan2(dx, dz)
struct Facing {
    float angle{0.0f};
};

/**
 * Path Follower record. Idle: pathIndex -1, path empty, needsPath false.
 * Requesting: needsPath true. Following: pathIndex >= 0, path non-empty.
 */
struct PathFollower {
    std::vector<CellCoord> path;
    int pathIndex{-1};
    Vector2D target;              // Destination that triggered planning
    float moveSpeed{3.0f};
    bool needsPath{false};
    float pathRetryTime{0.0f};    // Seconds until a failed request may plan again

    bool hasActivePath() const {
        return pathIndex >= 0 && pathIndex < static_cast<int>(path.size());
    }

    void clearPath() {
        path.clear();
        pathIndex = -1;
    }
};

struct WanderData {
    Vector2D origin;
    float radius{5.0f};
    float waitTime{0.5f};
    float minWait{0.5f};
    float maxWait{1.5f};
    bool travelling{false};       // A wander target was handed to the follower
};

enum class PursuitState : uint8_t {
    Idle,
    Seeking,
    Cooldown,
    AggressivePursuit
};

inline std::ostream& operator<<(std::ostream& os, PursuitState state) {
    switch (state) {
        case PursuitState::Idle: return os << "Idle";
        case PursuitState::Seeking: return os << "Seeking";
        case PursuitState::Cooldown: return os << "Cooldown";
        case PursuitState::AggressivePursuit: return os << "AggressivePursuit";
        default: return os << "Unknown";
    }
}

inline bool isPursuing(PursuitState state) {
    return state == PursuitState::Seeking || state == PursuitState::AggressivePursuit;
}

struct PursuitData {
    PursuitState state{PursuitState::Idle};
    float detectionRadius{4.0f};          // Cells
    int pursuitSteps{5};
    int stepsRemaining{0};
    float cooldownTime{3.0f};
    float cooldownRemaining{0.0f};
    CellCoord lastOpponentCell;
    int aggravationCount{0};
    int aggravationThreshold{3};
    float aggressiveDuration{10.0f};
    float aggressiveRemaining{0.0f};

    EntityID opponent{INVALID_ENTITY_ID};
    Vector2D lastOpponentDestination;     // Aggressive pursuit retarget check
    int lastPathIndex{-1};
    bool settling{false};                 // Path was just replaced; don't count steps yet
};

// Static obstacle marker
struct NavObstacle {};

struct Collider {
    ColliderShape shape{ColliderShape::Circle};
    float halfWidth{0.5f};    // Box only, along X
    float halfDepth{0.5f};    // Box only, along Z
    float radius{0.3f};       // Circle only
    CollisionLayer layer{Layer_NPC};
    uint32_t collidesWith{0};
};

struct CollisionState {
    boost::container::small_vector<CollisionContact, 4> contacts;
    bool isColliding{false};
};

struct NpcData {
    EntityID spawner{INVALID_ENTITY_ID};
};

struct PlayerData {};

// Relayed by the network feed for every connected player
struct PlayerIdentity {
    std::string playerId;
    bool isLocal{false};
    std::string displayName;
};

// Owner of a spawner and of everything it spawns
struct Ownership {
    std::string ownerId;
};

struct SpawnerData {
    float radius{5.0f};
    int maxNPCs{3};
    float spawnInterval{5.0f};
    float timeSinceLastSpawn{0.0f};
    boost::container::flat_set<EntityID> spawned;
};

struct BlockData {
    std::string blockType;
};

// Visual marker shown by the renderer. Idle and cooldown share Calm.
enum class AppearanceMarker : uint8_t {
    Calm,
    Alert,
    Enraged
};

inline std::ostream& operator<<(std::ostream& os, AppearanceMarker marker) {
    switch (marker) {
        case AppearanceMarker::Calm: return os << "Calm";
        case AppearanceMarker::Alert: return os << "Alert";
        case AppearanceMarker::Enraged: return os << "Enraged";
        default: return os << "Unknown";
    }
}

inline AppearanceMarker markerFor(PursuitState state) {
    switch (state) {
        case PursuitState::Seeking: return AppearanceMarker::Alert;
        case PursuitState::AggressivePursuit: return AppearanceMarker::Enraged;
        default: return AppearanceMarker::Calm;
    }
}

struct Appearance {
    AppearanceMarker marker{AppearanceMarker::Calm};
};

} // namespace VoxelNav

#endif // VOXELNAV_COMPONENTS_HPP
