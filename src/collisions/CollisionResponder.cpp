/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "collisions/CollisionResponder.hpp"
#include "ai/OpponentSelector.hpp"
#include "core/Logger.hpp"
#include "entities/EntityRegistry.hpp"
#include "events/NavEventQueue.hpp"
#include <fmt/format.h>

namespace VoxelNav {

CollisionResponder::CollisionResponder(const OpponentSelector& opponents,
                                       const CollisionConfig& config, NavEventQueue* events)
    : m_opponents(opponents), m_config(config), m_events(events) {
    m_config.validate();
}

void CollisionResponder::update(EntityRegistry& registry) {
    for (EntityID id : registry.query<CollisionState, Position, MovementState>()) {
        const CollisionState& state = *registry.get<CollisionState>(id);
        if (!state.isColliding) continue;

        Position& pos = *registry.get<Position>(id);
        const MovementState& history = *registry.get<MovementState>(id);

        // Obstacles are absolute, whatever the pursuit state
        if (const CollisionContact* block = findBlockContact(state)) {
            hardRevert(registry, id, pos, history, block->other);
            continue;
        }

        if (!registry.has<NpcData>(id)) continue;

        if (const CollisionContact* opponent = findOpponentContact(registry, id, state)) {
            const PursuitData* pursuit = registry.get<PursuitData>(id);
            if (pursuit && isPursuing(pursuit->state)) {
                // Caught: stop here, pursuit keeps owning the target
                pos.setGround(history.previous);
                if (m_events) {
                    m_events->push(NavEvent::withOther(NavEventType::CollisionReverted, id,
                                                       opponent->other));
                }
            } else {
                hardRevert(registry, id, pos, history, opponent->other);
            }
            continue;
        }

        if (const CollisionContact* agent = findAgentContact(state)) {
            if (agent->penetration > m_config.agentNudgeThreshold) {
                pos.setGround(pos.ground() +
                              agent->normal * (agent->penetration * m_config.nudgeFactor));
                COLLISION_DEBUG(fmt::format("Nudged entity {} away from {} by {:.3f}", id,
                                            agent->other,
                                            agent->penetration * m_config.nudgeFactor));
            }
        }
    }
}

const CollisionContact* CollisionResponder::findBlockContact(const CollisionState& state) const {
    for (const CollisionContact& contact : state.contacts) {
        if (contact.otherLayer == Layer_Block) return &contact;
    }
    return nullptr;
}

const CollisionContact* CollisionResponder::findOpponentContact(const EntityRegistry& registry,
                                                                EntityID id,
                                                                const CollisionState& state) const {
    for (const CollisionContact& contact : state.contacts) {
        if (m_opponents.isValidOpponent(registry, id, contact.other)) return &contact;
    }
    return nullptr;
}

const CollisionContact* CollisionResponder::findAgentContact(const CollisionState& state) const {
    for (const CollisionContact& contact : state.contacts) {
        if (contact.otherLayer == Layer_NPC) return &contact;
    }
    return nullptr;
}

void CollisionResponder::hardRevert(EntityRegistry& registry, EntityID id, Position& pos,
                                    const MovementState& history, EntityID other) {
    pos.setGround(history.previous);

    if (PathFollower* follower = registry.get<PathFollower>(id)) {
        follower->clearPath();
        follower->needsPath = false;
    }
    if (WanderData* wander = registry.get<WanderData>(id)) {
        wander->waitTime = m_config.obstacleWait;
        wander->travelling = false;
    }

    COLLISION_DEBUG(fmt::format("Entity {} reverted after touching {}", id, other));
    if (m_events) {
        m_events->push(NavEvent::withOther(NavEventType::CollisionReverted, id, other));
    }
}

} // namespace VoxelNav
