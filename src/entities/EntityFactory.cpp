/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "entities/EntityFactory.hpp"
#include "core/Logger.hpp"
#include "entities/EntityRegistry.hpp"
#include "world/GridIndex.hpp"
#include <fmt/format.h>

namespace VoxelNav {

EntityFactory::EntityFactory(const AgentDefaults& defaults) : m_defaults(defaults) {
    m_defaults.validate();
}

EntityID EntityFactory::createPlayer(EntityRegistry& registry, float x, float z,
                                     const std::string& playerId, bool isLocal,
                                     const std::string& displayName) const {
    const EntityID id = registry.createEntity();
    registry.add<Position>(id, Position{x, 0.0f, z});
    registry.add<PlayerData>(id);
    registry.add<PlayerIdentity>(id, PlayerIdentity{playerId, isLocal,
                                                    displayName.empty() ? playerId : displayName});

    // Target starts underfoot so pursuers never chase a stale origin
    PathFollower follower;
    follower.target = Vector2D(x, z);
    follower.moveSpeed = m_defaults.playerMoveSpeed;
    registry.add<PathFollower>(id, std::move(follower));
    registry.add<MovementState>(id, MovementState{Vector2D(x, z)});
    registry.add<Facing>(id);

    Collider collider;
    collider.shape = ColliderShape::Circle;
    collider.radius = m_defaults.playerRadius;
    collider.layer = Layer_Player;
    collider.collidesWith = Layer_NPC | Layer_Block;
    registry.add<Collider>(id, collider);
    registry.add<CollisionState>(id);

    ENTITY_INFO(fmt::format("Player '{}' ({}) created as entity {} at ({},{})", playerId,
                            isLocal ? "local" : "remote", id, x, z));
    return id;
}

EntityID EntityFactory::createNPC(EntityRegistry& registry, float x, float y, float z,
                                  const NpcOptions& options) const {
    const EntityID id = registry.createEntity();
    registry.add<Position>(id, Position{x, y, z});
    registry.add<NpcData>(id, NpcData{options.spawner});
    if (options.ownerId) {
        registry.add<Ownership>(id, Ownership{*options.ownerId});
    }

    WanderData wander;
    wander.origin = options.origin;
    wander.radius = options.wanderRadius >= 0.0f ? options.wanderRadius : m_defaults.wanderRadius;
    wander.waitTime = m_defaults.wanderInitialWait;
    wander.minWait = m_defaults.wanderMinWait;
    wander.maxWait = m_defaults.wanderMaxWait;
    registry.add<WanderData>(id, wander);

    if (options.canPursue) {
        PursuitData pursuit;
        pursuit.detectionRadius = m_defaults.detectionRadius;
        pursuit.pursuitSteps = m_defaults.pursuitSteps;
        pursuit.cooldownTime = m_defaults.cooldownTime;
        pursuit.aggravationThreshold = m_defaults.aggravationThreshold;
        pursuit.aggressiveDuration = m_defaults.aggressiveDuration;
        registry.add<PursuitData>(id, pursuit);
        registry.add<Appearance>(id);
    }

    PathFollower follower;
    follower.target = Vector2D(x, z);
    follower.moveSpeed = m_defaults.npcMoveSpeed;
    registry.add<PathFollower>(id, std::move(follower));
    registry.add<MovementState>(id, MovementState{Vector2D(x, z)});
    registry.add<Facing>(id);

    Collider collider;
    collider.shape = ColliderShape::Circle;
    collider.radius = m_defaults.npcRadius;
    collider.layer = Layer_NPC;
    collider.collidesWith = Layer_Block | Layer_NPC | Layer_Player;
    registry.add<Collider>(id, collider);
    registry.add<CollisionState>(id);

    ENTITY_DEBUG(fmt::format("NPC {} created at ({},{}), spawner {}", id, x, z, options.spawner));
    return id;
}

std::optional<EntityID> EntityFactory::createBlock(EntityRegistry& registry, const GridIndex& grid,
                                                   int x, int y, int z,
                                                   const std::string& blockType) const {
    const CellCoord cell{x, z};
    if (grid.isBlocked(cell)) {
        ENTITY_DEBUG(fmt::format("Block rejected: cell ({},{}) is blocked", x, z));
        return std::nullopt;
    }
    // Blocks placed this tick are not in the grid until the next sync
    for (EntityID other : registry.query<NavObstacle, Position>()) {
        const Position* pos = registry.get<Position>(other);
        if (GridIndex::worldToCell(pos->x, pos->z) == cell) {
            ENTITY_DEBUG(fmt::format("Block rejected: cell ({},{}) holds block {}", x, z, other));
            return std::nullopt;
        }
    }

    const EntityID id = registry.createEntity();
    registry.add<Position>(id, Position{static_cast<float>(x), static_cast<float>(y),
                                        static_cast<float>(z)});
    registry.add<BlockData>(id, BlockData{blockType});
    registry.add<NavObstacle>(id);

    Collider collider;
    collider.shape = ColliderShape::Box;
    collider.halfWidth = m_defaults.blockHalfExtent;
    collider.halfDepth = m_defaults.blockHalfExtent;
    collider.layer = Layer_Block;
    collider.collidesWith = Layer_None;
    registry.add<Collider>(id, collider);
    return id;
}

EntityID EntityFactory::createSpawner(EntityRegistry& registry, float x, float z,
                                      const SpawnerOptions& options) const {
    const EntityID id = registry.createEntity();
    registry.add<Position>(id, Position{x, 0.0f, z});

    SpawnerData spawner;
    spawner.radius = options.radius;
    spawner.maxNPCs = options.maxNPCs;
    spawner.spawnInterval = options.spawnInterval;
    registry.add<SpawnerData>(id, std::move(spawner));
    if (options.ownerId) {
        registry.add<Ownership>(id, Ownership{*options.ownerId});
    }

    ENTITY_INFO(fmt::format("Spawner {} at ({},{}): up to {} NPCs every {}s", id, x, z,
                            options.maxNPCs, options.spawnInterval));
    return id;
}

} // namespace VoxelNav
