/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/Logger.hpp"
#include "core/SimulationPipeline.hpp"
#include "entities/EntityRegistry.hpp"
#include <array>
#include <cstdint>
#include <cstring>
#include <exception>
#include <fmt/format.h>
#include <string>

namespace {

constexpr float FIXED_STEP{1.0f / 60.0f};
constexpr int DEFAULT_TICKS{1800};          // 30 seconds of simulated time
constexpr int ARENA_HALF_SIZE{12};
constexpr int MOVE_INTERVAL_TICKS{240};     // New click-to-move target every 4s

// Player click-to-move script, cycled
constexpr std::array<std::array<float, 2>, 5> MOVE_SCRIPT{{
    {{8.0f, 8.0f}}, {{-8.0f, 6.0f}}, {{-6.0f, -9.0f}}, {{9.0f, -7.0f}}, {{0.0f, 0.0f}}}};

void buildArena(VoxelNav::SimulationPipeline& sim, VoxelNav::EntityRegistry& registry) {
    const VoxelNav::EntityFactory& factory = sim.getFactory();
    const VoxelNav::GridIndex& grid = sim.getGrid();
    int placed = 0;
    auto place = [&](int x, int z, const char* type) {
        // Corners are visited twice; the second placement is rejected
        if (factory.createBlock(registry, grid, x, 0, z, type)) {
            ++placed;
        }
    };

    // Perimeter wall
    for (int i = -ARENA_HALF_SIZE; i <= ARENA_HALF_SIZE; ++i) {
        place(i, -ARENA_HALF_SIZE, "stone");
        place(i, ARENA_HALF_SIZE, "stone");
        place(-ARENA_HALF_SIZE, i, "stone");
        place(ARENA_HALF_SIZE, i, "stone");
    }

    // Two inner walls with a gap so paths have to route around them
    for (int z = -6; z <= 6; ++z) {
        if (z != 0) {
            place(-3, z, "wood");
        }
    }
    for (int x = 2; x <= 9; ++x) {
        place(x, 3, "wood");
    }

    SIM_INFO(fmt::format("Arena built with {} blocks", placed));
}

} // namespace

int main(int argc, char* argv[]) {
  int ticks = DEFAULT_TICKS;
  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], "--quiet") == 0) {
      VOXELNAV_ENABLE_BENCHMARK_MODE();
      continue;
    }
    try {
      ticks = std::stoi(argv[i]);
    } catch (const std::exception& e) {
      SIM_CRITICAL(fmt::format("Invalid tick count '{}': {}", argv[i], e.what()));
      return -1;
    }
    if (ticks < 0) {
      SIM_CRITICAL(fmt::format("Tick count must be >= 0 (got {})", ticks));
      return -1;
    }
  }

  VoxelNav::SimulationConfig config;
  config.wander.randomSeed = 1337;

  try {
    VoxelNav::SimulationPipeline sim(config);
    VoxelNav::EntityRegistry registry;

    std::array<uint64_t, static_cast<size_t>(VoxelNav::NavEventType::COUNT)> eventCounts{};
    sim.getEvents().subscribe([&eventCounts](const VoxelNav::NavEvent& event) {
      ++eventCounts[static_cast<size_t>(event.type)];
    });

    buildArena(sim, registry);
    const VoxelNav::EntityID player =
        sim.getFactory().createPlayer(registry, 0.0f, 0.0f, "local", true, "Player");
    sim.setDefaultOpponent(player);

    VoxelNav::SpawnerOptions spawnerOptions;
    spawnerOptions.radius = 4.0f;
    spawnerOptions.maxNPCs = 4;
    spawnerOptions.spawnInterval = 2.0f;
    sim.getFactory().createSpawner(registry, -7.0f, -7.0f, spawnerOptions);

    SIM_INFO(fmt::format("Running {} ticks at {:.4f}s per tick", ticks, FIXED_STEP));

    size_t scriptIndex = 0;
    for (int tick = 0; tick < ticks; ++tick) {
      if (tick > 0 && tick % MOVE_INTERVAL_TICKS == 0) {
        const auto& target = MOVE_SCRIPT[scriptIndex++ % MOVE_SCRIPT.size()];
        sim.requestMoveTo(registry, player, target[0], target[1]);
      }
      sim.update(registry, FIXED_STEP);
    }

    // Summary
    std::array<int, 4> stateCounts{};
    for (VoxelNav::EntityID id : registry.query<VoxelNav::PursuitData>()) {
      ++stateCounts[static_cast<size_t>(registry.get<VoxelNav::PursuitData>(id)->state)];
    }
    const auto& stats = sim.getPlanner().getStats();
    const VoxelNav::Position* playerPos = registry.get<VoxelNav::Position>(player);

    SIM_INFO(fmt::format("Simulated {} ticks, {} entities, {} blocked cells",
                         sim.getTickCount(), registry.size(), sim.getGrid().getBlockedCount()));
    SIM_INFO(fmt::format("Player at ({:.2f}, {:.2f})", playerPos->x, playerPos->z));
    SIM_INFO(fmt::format("NPC states: idle {}, seeking {}, cooldown {}, aggressive {}",
                         stateCounts[0], stateCounts[1], stateCounts[2], stateCounts[3]));
    SIM_INFO(fmt::format("Planner: {} requests, {} ok, {} no path, {} timeouts, {} nodes",
                         stats.totalRequests, stats.successfulPaths, stats.noPathFound,
                         stats.timeouts, stats.totalIterations));
    SIM_INFO(fmt::format("Events: {} pursuit changes, {} path failures, {} reverts, {} spawns",
                         eventCounts[0], eventCounts[1], eventCounts[2], eventCounts[3]));
  } catch (const std::exception& e) {
    SIM_CRITICAL(fmt::format("Simulation aborted: {}", e.what()));
    return -1;
  }

  return 0;
}
