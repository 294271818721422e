/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "events/NavEventQueue.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <exception>
#include <fmt/format.h>
#include <utility>

namespace VoxelNav {

NavEventQueue::HandlerToken NavEventQueue::subscribe(NavEventHandler handler) {
  HandlerToken token{m_nextHandlerId++};
  m_handlers.push_back(HandlerEntry{token.id, std::move(handler)});
  return token;
}

bool NavEventQueue::unsubscribe(const HandlerToken &token) {
  auto it = std::find_if(m_handlers.begin(), m_handlers.end(),
                         [&](const HandlerEntry &e) { return e.id == token.id; });
  if (it == m_handlers.end()) {
    return false;
  }
  m_handlers.erase(it);
  return true;
}

void NavEventQueue::dispatch() {
  if (m_pending.empty()) {
    return;
  }

  // Swap out first so handlers that push land in the next tick
  std::vector<NavEvent> batch;
  batch.swap(m_pending);
  const std::vector<HandlerEntry> handlers = m_handlers;

  for (const NavEvent &event : batch) {
    for (const HandlerEntry &entry : handlers) {
      try {
        entry.callable(event);
      } catch (const std::exception &e) {
        SIM_ERROR(fmt::format("Handler {} threw on event type {}: {}", entry.id,
                              static_cast<int>(event.type), e.what()));
      }
    }
  }
}

std::vector<NavEvent> NavEventQueue::drain() {
  std::vector<NavEvent> out;
  out.swap(m_pending);
  return out;
}

} // namespace VoxelNav
