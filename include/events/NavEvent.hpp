/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef VOXELNAV_NAV_EVENT_HPP
#define VOXELNAV_NAV_EVENT_HPP

/**
 * @file NavEvent.hpp
 * @brief Outbound notifications produced by the navigation core
 *
 * Events describe what happened during a tick for renderers, overlays and
 * debug tooling. Nothing inside the core reads them back.
 */

#include <cstdint>
#include <ostream>
#include "entities/Components.hpp"
#include "entities/Entity.hpp"
#include "world/GridIndex.hpp"

namespace VoxelNav {

// Strongly typed event type enumeration for fast lookups
enum class NavEventType : uint8_t {
  PursuitStateChanged = 0, // from/to state, marker
  PathFailed = 1,          // cell = goal that could not be planned
  CollisionReverted = 2,   // other = body that was hit
  NPCSpawned = 3,          // other = spawner
  ObstacleRegistered = 4,  // cell now blocked
  ObstacleFreed = 5,       // cell now walkable
  COUNT = 6
};

inline std::ostream &operator<<(std::ostream &os, NavEventType type) {
  switch (type) {
  case NavEventType::PursuitStateChanged: return os << "PursuitStateChanged";
  case NavEventType::PathFailed: return os << "PathFailed";
  case NavEventType::CollisionReverted: return os << "CollisionReverted";
  case NavEventType::NPCSpawned: return os << "NPCSpawned";
  case NavEventType::ObstacleRegistered: return os << "ObstacleRegistered";
  case NavEventType::ObstacleFreed: return os << "ObstacleFreed";
  default: return os << "Unknown";
  }
}

struct NavEvent {
  NavEventType type{NavEventType::COUNT};
  EntityID entity{INVALID_ENTITY_ID};
  EntityID other{INVALID_ENTITY_ID};
  CellCoord cell;
  PursuitState from{PursuitState::Idle};
  PursuitState to{PursuitState::Idle};
  AppearanceMarker marker{AppearanceMarker::Calm};

  static NavEvent pursuitStateChanged(EntityID id, PursuitState from,
                                      PursuitState to) {
    NavEvent e;
    e.type = NavEventType::PursuitStateChanged;
    e.entity = id;
    e.from = from;
    e.to = to;
    e.marker = markerFor(to);
    return e;
  }

  static NavEvent withCell(NavEventType type, EntityID id, CellCoord cell) {
    NavEvent e;
    e.type = type;
    e.entity = id;
    e.cell = cell;
    return e;
  }

  static NavEvent withOther(NavEventType type, EntityID id, EntityID other) {
    NavEvent e;
    e.type = type;
    e.entity = id;
    e.other = other;
    return e;
  }
};

} // namespace VoxelNav

#endif // VOXELNAV_NAV_EVENT_HPP
