/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "entities/EntityRegistry.hpp"
#include "core/Logger.hpp"
#include <fmt/format.h>

namespace VoxelNav {

EntityID EntityRegistry::createEntity() {
    const EntityID id = m_nextId++;
    m_masks.emplace_hint(m_masks.end(), id, ComponentMask{0});
    return id;
}

void EntityRegistry::destroyEntity(EntityID id) {
    auto it = m_masks.find(id);
    if (it == m_masks.end()) {
        return;
    }
    std::apply([id](auto&... pools) { (pools.erase(id), ...); }, m_pools);
    m_masks.erase(it);
    ENTITY_DEBUG(fmt::format("Destroyed entity {}", id));
}

void EntityRegistry::throwDeadEntity(EntityID id) {
    ENTITY_ERROR(fmt::format("Component added to dead entity {}", id));
    throw std::out_of_range(fmt::format("Entity {} is not alive", id));
}

} // namespace VoxelNav
