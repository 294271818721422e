/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef VOXELNAV_COLLISION_RESPONDER_HPP
#define VOXELNAV_COLLISION_RESPONDER_HPP

#include "ai/BehaviorConfig.hpp"
#include "entities/Components.hpp"
#include "entities/Entity.hpp"

namespace VoxelNav {

class EntityRegistry;
class NavEventQueue;
class OpponentSelector;

/**
 * @brief Turns this tick's contacts into corrections
 *
 * Only entities with Position + MovementState + CollisionState respond;
 * the first matching rule wins:
 *  - Block contact: revert to the pre-move position, drop the path, and
 *    give wander a short wait. Applies to every mover.
 *  - Opponent contact (agents only): while pursuing, revert only and keep
 *    the path; otherwise handle like a block contact.
 *  - Agent contact (agents only): nudge apart when the overlap is deeper
 *    than the tolerance; shallow overlaps are left alone.
 * "Agents" are entities with NpcData.
 */
class CollisionResponder {
public:
    CollisionResponder(const OpponentSelector& opponents, const CollisionConfig& config = {},
                       NavEventQueue* events = nullptr);

    void update(EntityRegistry& registry);

private:
    const CollisionContact* findBlockContact(const CollisionState& state) const;
    const CollisionContact* findOpponentContact(const EntityRegistry& registry, EntityID id,
                                                const CollisionState& state) const;
    const CollisionContact* findAgentContact(const CollisionState& state) const;

    // Revert plus path invalidation
    void hardRevert(EntityRegistry& registry, EntityID id, Position& pos,
                    const MovementState& history, EntityID other);

    const OpponentSelector& m_opponents;
    CollisionConfig m_config;
    NavEventQueue* m_events;
};

} // namespace VoxelNav

#endif // VOXELNAV_COLLISION_RESPONDER_HPP
