/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef VOXELNAV_OPPONENT_SELECTOR_HPP
#define VOXELNAV_OPPONENT_SELECTOR_HPP

#include <optional>
#include <vector>
#include "entities/Entity.hpp"

namespace VoxelNav {

class EntityRegistry;

/**
 * @brief Decides who an agent may pursue
 *
 * An agent carrying Ownership may pursue any player (PlayerIdentity +
 * Position) whose playerId differs from its owner. An agent without
 * Ownership falls back to the single default opponent, if one is set.
 */
class OpponentSelector {
public:
    void setDefaultOpponent(EntityID id) { m_defaultOpponent = id; }
    EntityID getDefaultOpponent() const { return m_defaultOpponent; }

    std::vector<EntityID> validOpponents(const EntityRegistry& registry, EntityID agent) const;

    bool isValidOpponent(const EntityRegistry& registry, EntityID agent, EntityID candidate) const;

    // Nearest valid opponent within maxCellDistance (inclusive), by cell distance
    std::optional<EntityID> findNearestEnemy(const EntityRegistry& registry, EntityID agent,
                                             float maxCellDistance) const;

private:
    EntityID m_defaultOpponent{INVALID_ENTITY_ID};
};

} // namespace VoxelNav

#endif // VOXELNAV_OPPONENT_SELECTOR_HPP
