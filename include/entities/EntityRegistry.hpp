/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef VOXELNAV_ENTITY_REGISTRY_HPP
#define VOXELNAV_ENTITY_REGISTRY_HPP

/**
 * @file EntityRegistry.hpp
 * @brief Capability table for the navigation core
 *
 * Every alive entity owns a bitmask with one bit per component type of a
 * fixed, compile-time component set. Queries are "mask contains all of
 * {A,B,C}" checks walked in ascending id order, so every system visits
 * entities deterministically.
 *
 * Component records live in one node-based pool per type. A reference
 * returned by get<T>() stays valid while other entities gain or lose
 * components; it is invalidated only when that component or entity is
 * removed.
 */

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <tuple>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>
#include <boost/container/flat_map.hpp>
#include "entities/Components.hpp"
#include "entities/Entity.hpp"

namespace VoxelNav {

template <typename T>
class ComponentPool {
public:
    T& emplace(EntityID id, T value) {
        auto result = m_data.insert_or_assign(id, std::move(value));
        return result.first->second;
    }

    T* find(EntityID id) {
        auto it = m_data.find(id);
        return it == m_data.end() ? nullptr : &it->second;
    }

    const T* find(EntityID id) const {
        auto it = m_data.find(id);
        return it == m_data.end() ? nullptr : &it->second;
    }

    void erase(EntityID id) { m_data.erase(id); }
    size_t size() const { return m_data.size(); }

private:
    std::unordered_map<EntityID, T> m_data;
};

using ComponentTypes = std::tuple<Position, MovementState, Facing, PathFollower,
                                  WanderData, PursuitData, NavObstacle, Collider,
                                  CollisionState, NpcData, PlayerData, PlayerIdentity,
                                  Ownership, SpawnerData, BlockData, Appearance>;

namespace detail {

template <typename T, typename Tuple>
struct ComponentIndex;

template <typename T, typename... Rest>
struct ComponentIndex<T, std::tuple<T, Rest...>>
    : std::integral_constant<size_t, 0> {};

template <typename T, typename First, typename... Rest>
struct ComponentIndex<T, std::tuple<First, Rest...>>
    : std::integral_constant<size_t, 1 + ComponentIndex<T, std::tuple<Rest...>>::value> {};

template <typename Tuple>
struct PoolsFor;

template <typename... Ts>
struct PoolsFor<std::tuple<Ts...>> {
    using type = std::tuple<ComponentPool<Ts>...>;
};

} // namespace detail

class EntityRegistry {
public:
    using ComponentMask = uint32_t;

    static_assert(std::tuple_size_v<ComponentTypes> <= sizeof(ComponentMask) * 8,
                  "ComponentMask too narrow for the component set");

    EntityRegistry() = default;
    EntityRegistry(const EntityRegistry&) = delete;
    EntityRegistry& operator=(const EntityRegistry&) = delete;

    EntityID createEntity();

    // Drops every component of the entity; unknown ids are ignored
    void destroyEntity(EntityID id);

    bool isAlive(EntityID id) const { return m_masks.find(id) != m_masks.end(); }
    size_t size() const { return m_masks.size(); }

    /**
     * @brief Attach (or overwrite) a component
     * @throws std::out_of_range if the entity is not alive
     */
    template <typename T>
    T& add(EntityID id, T value = T{}) {
        auto it = m_masks.find(id);
        if (it == m_masks.end()) {
            throwDeadEntity(id);
        }
        it->second |= bitFor<T>();
        return pool<T>().emplace(id, std::move(value));
    }

    template <typename T>
    T* get(EntityID id) {
        return has<T>(id) ? pool<T>().find(id) : nullptr;
    }

    template <typename T>
    const T* get(EntityID id) const {
        return has<T>(id) ? pool<T>().find(id) : nullptr;
    }

    template <typename T>
    bool has(EntityID id) const {
        auto it = m_masks.find(id);
        return it != m_masks.end() && (it->second & bitFor<T>()) != 0;
    }

    template <typename T>
    void remove(EntityID id) {
        auto it = m_masks.find(id);
        if (it == m_masks.end()) {
            return;
        }
        it->second &= ~bitFor<T>();
        pool<T>().erase(id);
    }

    // Alive entities holding every listed component, ascending id order
    template <typename... Ts>
    std::vector<EntityID> query() const {
        static_assert(sizeof...(Ts) > 0, "query needs at least one component");
        const ComponentMask required = (bitFor<Ts>() | ...);
        std::vector<EntityID> out;
        for (const auto& [id, mask] : m_masks) {
            if ((mask & required) == required) {
                out.push_back(id);
            }
        }
        return out;
    }

    template <typename T>
    static constexpr ComponentMask bitFor() {
        return ComponentMask{1} << detail::ComponentIndex<T, ComponentTypes>::value;
    }

private:
    using Pools = typename detail::PoolsFor<ComponentTypes>::type;

    template <typename T>
    ComponentPool<T>& pool() { return std::get<ComponentPool<T>>(m_pools); }

    template <typename T>
    const ComponentPool<T>& pool() const { return std::get<ComponentPool<T>>(m_pools); }

    [[noreturn]] static void throwDeadEntity(EntityID id);

    boost::container::flat_map<EntityID, ComponentMask> m_masks;
    Pools m_pools;
    EntityID m_nextId{INVALID_ENTITY_ID + 1};
};

} // namespace VoxelNav

#endif // VOXELNAV_ENTITY_REGISTRY_HPP
