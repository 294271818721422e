/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef VOXELNAV_NAV_EVENT_QUEUE_HPP
#define VOXELNAV_NAV_EVENT_QUEUE_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>
#include "events/NavEvent.hpp"

namespace VoxelNav {

using NavEventHandler = std::function<void(const NavEvent &)>;

/**
 * @brief Outbound queue drained once per tick
 *
 * Systems push while the tick runs; SimulationPipeline calls dispatch() at
 * the end of the tick. Handlers registered during dispatch take effect on
 * the next one.
 */
class NavEventQueue {
public:
  struct HandlerToken {
    uint64_t id{0};
  };

  void push(const NavEvent &event) { m_pending.push_back(event); }

  HandlerToken subscribe(NavEventHandler handler);
  bool unsubscribe(const HandlerToken &token);

  // Delivers pending events in push order, then empties the queue
  void dispatch();

  // Moves pending events out without delivering them
  std::vector<NavEvent> drain();

  size_t pendingCount() const { return m_pending.size(); }
  size_t handlerCount() const { return m_handlers.size(); }
  void clear() { m_pending.clear(); }

private:
  struct HandlerEntry {
    uint64_t id{0};
    NavEventHandler callable;
  };

  std::vector<NavEvent> m_pending;
  std::vector<HandlerEntry> m_handlers;
  uint64_t m_nextHandlerId{1};
};

} // namespace VoxelNav

#endif // VOXELNAV_NAV_EVENT_QUEUE_HPP
