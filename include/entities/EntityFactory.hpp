/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef VOXELNAV_ENTITY_FACTORY_HPP
#define VOXELNAV_ENTITY_FACTORY_HPP

#include <optional>
#include <string>
#include "ai/BehaviorConfig.hpp"
#include "entities/Entity.hpp"
#include "utils/Vector2D.hpp"

namespace VoxelNav {

class EntityRegistry;
class GridIndex;

struct NpcOptions {
    Vector2D origin;                      // Wander centre
    float wanderRadius{-1.0f};            // < 0 uses AgentDefaults::wanderRadius
    std::optional<std::string> ownerId;   // Without an owner the NPC chases the default opponent
    EntityID spawner{INVALID_ENTITY_ID};
    bool canPursue{true};
};

struct SpawnerOptions {
    float radius{5.0f};
    int maxNPCs{3};
    float spawnInterval{5.0f};
    std::optional<std::string> ownerId;
};

/**
 * @brief Builds the component sets for each archetype
 *
 * Bodies sit on the ground plane; y is carried for the renderer only.
 */
class EntityFactory {
public:
    explicit EntityFactory(const AgentDefaults& defaults = {});

    EntityID createPlayer(EntityRegistry& registry, float x, float z, const std::string& playerId,
                          bool isLocal, const std::string& displayName = {}) const;

    EntityID createNPC(EntityRegistry& registry, float x, float y, float z,
                       const NpcOptions& options) const;

    /**
     * @brief Places a unit block on cell (x, z)
     *
     * A cell holds at most one block whatever its height: the obstacle
     * synchronizer frees a cell without counting occupants.
     * @return the block, or nullopt when the cell is already occupied
     */
    std::optional<EntityID> createBlock(EntityRegistry& registry, const GridIndex& grid, int x, int y,
                                        int z, const std::string& blockType) const;

    EntityID createSpawner(EntityRegistry& registry, float x, float z,
                           const SpawnerOptions& options) const;

    const AgentDefaults& getDefaults() const { return m_defaults; }

private:
    AgentDefaults m_defaults;
};

} // namespace VoxelNav

#endif // VOXELNAV_ENTITY_FACTORY_HPP
