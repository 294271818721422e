/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/OpponentSelector.hpp"
#include "entities/EntityRegistry.hpp"
#include "world/GridIndex.hpp"

namespace VoxelNav {

std::vector<EntityID> OpponentSelector::validOpponents(const EntityRegistry& registry,
                                                       EntityID agent) const {
    std::vector<EntityID> out;
    const Ownership* owner = registry.get<Ownership>(agent);
    if (!owner) {
        if (m_defaultOpponent != agent && registry.has<Position>(m_defaultOpponent)) {
            out.push_back(m_defaultOpponent);
        }
        return out;
    }

    for (EntityID id : registry.query<PlayerIdentity, Position>()) {
        if (id == agent) continue;
        if (registry.get<PlayerIdentity>(id)->playerId == owner->ownerId) continue;
        out.push_back(id);
    }
    return out;
}

bool OpponentSelector::isValidOpponent(const EntityRegistry& registry, EntityID agent,
                                       EntityID candidate) const {
    if (candidate == agent || !registry.has<Position>(candidate)) {
        return false;
    }
    const Ownership* owner = registry.get<Ownership>(agent);
    if (!owner) {
        return candidate == m_defaultOpponent;
    }
    const PlayerIdentity* identity = registry.get<PlayerIdentity>(candidate);
    return identity && identity->playerId != owner->ownerId;
}

std::optional<EntityID> OpponentSelector::findNearestEnemy(const EntityRegistry& registry,
                                                           EntityID agent,
                                                           float maxCellDistance) const {
    const Position* agentPos = registry.get<Position>(agent);
    if (!agentPos) {
        return std::nullopt;
    }
    const CellCoord agentCell = GridIndex::worldToCell(agentPos->x, agentPos->z);

    std::optional<EntityID> nearest;
    float nearestDist = maxCellDistance;
    for (EntityID id : validOpponents(registry, agent)) {
        const Position* pos = registry.get<Position>(id);
        const float dist = cellDistance(agentCell, GridIndex::worldToCell(pos->x, pos->z));
        if (dist <= maxCellDistance && (!nearest || dist < nearestDist)) {
            nearest = id;
            nearestDist = dist;
        }
    }
    return nearest;
}

} // namespace VoxelNav
