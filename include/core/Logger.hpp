/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef VOXELNAV_LOGGER_HPP
#define VOXELNAV_LOGGER_HPP

// Required includes for logging system:
// - string: Used in macro expansions for std::string() conversions
// - cstdio: Required for fprintf() and fflush() functions
// - cstdint: Required for uint8_t type
// - mutex: Serialises writes from tests that share stdout
// - atomic: Required for std::atomic<bool> benchmark mode flag
#include <atomic> // IWYU pragma: keep - Required for std::atomic<bool> benchmark mode flag
#include <cstdint> // IWYU pragma: keep - Required for uint8_t type
#include <cstdio> // IWYU pragma: keep - Required for fprintf() and fflush() functions
#include <mutex> // IWYU pragma: keep - Required for serialised logging
#include <string> // IWYU pragma: keep - Required for std::string() conversions in macros

namespace VoxelNav {
enum class LogLevel : uint8_t {
  CRITICAL = 0,     // Always logs
  ERROR_LEVEL = 1,  // Always logs (renamed to avoid macro conflicts)
  WARNING = 2,      // Debug only
  INFO = 3,         // Debug only
  DEBUG_LEVEL = 4   // Debug only (renamed to avoid macro conflicts)
};

class Logger {
private:
  inline static std::atomic<bool> s_benchmarkMode{false};
  inline static std::mutex s_logMutex;

public:
  static void SetBenchmarkMode(bool enabled) {
    s_benchmarkMode.store(enabled, std::memory_order_relaxed);
  }

  static bool IsBenchmarkMode() {
    return s_benchmarkMode.load(std::memory_order_relaxed);
  }

  static void Log(LogLevel level, const char *system,
                  const std::string &message) {
    Log(level, system, message.c_str());
  }

  static void Log(LogLevel level, const char *system, const char *message) {
    if (s_benchmarkMode.load(std::memory_order_relaxed)) {
      return;
    }

    // Failures go to stderr so the headless sim can be piped quietly
    FILE *out = level <= LogLevel::ERROR_LEVEL ? stderr : stdout;
    std::lock_guard<std::mutex> lock(s_logMutex);
    fprintf(out, "VoxelNav - [%s] %s: %s\n", system, getLevelString(level),
            message);
    fflush(out);
  }

private:
  static const char *getLevelString(LogLevel level) {
    switch (level) {
    case LogLevel::CRITICAL:
      return "CRITICAL";
    case LogLevel::ERROR_LEVEL:
      return "ERROR";
    case LogLevel::WARNING:
      return "WARNING";
    case LogLevel::INFO:
      return "INFO";
    case LogLevel::DEBUG_LEVEL:
      return "DEBUG";
    default:
      return "UNKNOWN";
    }
  }
};

#define VOXELNAV_CRITICAL(system, msg)                                         \
  VoxelNav::Logger::Log(VoxelNav::LogLevel::CRITICAL, system, msg)
#define VOXELNAV_ERROR(system, msg)                                            \
  VoxelNav::Logger::Log(VoxelNav::LogLevel::ERROR_LEVEL, system, msg)

#ifdef DEBUG
// Debug build macros - full functionality
#define VOXELNAV_WARN(system, msg)                                             \
  VoxelNav::Logger::Log(VoxelNav::LogLevel::WARNING, system, msg)
#define VOXELNAV_INFO(system, msg)                                             \
  VoxelNav::Logger::Log(VoxelNav::LogLevel::INFO, system, msg)
#define VOXELNAV_DEBUG(system, msg)                                            \
  VoxelNav::Logger::Log(VoxelNav::LogLevel::DEBUG_LEVEL, system, msg)
#else
#define VOXELNAV_WARN(system, msg) ((void)0)  // Zero overhead
#define VOXELNAV_INFO(system, msg) ((void)0)  // Zero overhead
#define VOXELNAV_DEBUG(system, msg) ((void)0) // Zero overhead
#endif

// Convenience macros for each system

#define GRID_CRITICAL(msg) VOXELNAV_CRITICAL("GridIndex", msg)
#define GRID_ERROR(msg) VOXELNAV_ERROR("GridIndex", msg)
#define GRID_WARN(msg) VOXELNAV_WARN("GridIndex", msg)
#define GRID_INFO(msg) VOXELNAV_INFO("GridIndex", msg)
#define GRID_DEBUG(msg) VOXELNAV_DEBUG("GridIndex", msg)

#define OBSTACLE_CRITICAL(msg) VOXELNAV_CRITICAL("ObstacleSync", msg)
#define OBSTACLE_ERROR(msg) VOXELNAV_ERROR("ObstacleSync", msg)
#define OBSTACLE_WARN(msg) VOXELNAV_WARN("ObstacleSync", msg)
#define OBSTACLE_INFO(msg) VOXELNAV_INFO("ObstacleSync", msg)
#define OBSTACLE_DEBUG(msg) VOXELNAV_DEBUG("ObstacleSync", msg)

#define PATHFIND_CRITICAL(msg) VOXELNAV_CRITICAL("Pathfinding", msg)
#define PATHFIND_ERROR(msg) VOXELNAV_ERROR("Pathfinding", msg)
#define PATHFIND_WARN(msg) VOXELNAV_WARN("Pathfinding", msg)
#define PATHFIND_INFO(msg) VOXELNAV_INFO("Pathfinding", msg)
#define PATHFIND_DEBUG(msg) VOXELNAV_DEBUG("Pathfinding", msg)

#define MOVEMENT_CRITICAL(msg) VOXELNAV_CRITICAL("Movement", msg)
#define MOVEMENT_ERROR(msg) VOXELNAV_ERROR("Movement", msg)
#define MOVEMENT_WARN(msg) VOXELNAV_WARN("Movement", msg)
#define MOVEMENT_INFO(msg) VOXELNAV_INFO("Movement", msg)
#define MOVEMENT_DEBUG(msg) VOXELNAV_DEBUG("Movement", msg)

#define WANDER_CRITICAL(msg) VOXELNAV_CRITICAL("Wander", msg)
#define WANDER_ERROR(msg) VOXELNAV_ERROR("Wander", msg)
#define WANDER_WARN(msg) VOXELNAV_WARN("Wander", msg)
#define WANDER_INFO(msg) VOXELNAV_INFO("Wander", msg)
#define WANDER_DEBUG(msg) VOXELNAV_DEBUG("Wander", msg)

#define PURSUIT_CRITICAL(msg) VOXELNAV_CRITICAL("Pursuit", msg)
#define PURSUIT_ERROR(msg) VOXELNAV_ERROR("Pursuit", msg)
#define PURSUIT_WARN(msg) VOXELNAV_WARN("Pursuit", msg)
#define PURSUIT_INFO(msg) VOXELNAV_INFO("Pursuit", msg)
#define PURSUIT_DEBUG(msg) VOXELNAV_DEBUG("Pursuit", msg)

#define COLLISION_CRITICAL(msg) VOXELNAV_CRITICAL("Collision", msg)
#define COLLISION_ERROR(msg) VOXELNAV_ERROR("Collision", msg)
#define COLLISION_WARN(msg) VOXELNAV_WARN("Collision", msg)
#define COLLISION_INFO(msg) VOXELNAV_INFO("Collision", msg)
#define COLLISION_DEBUG(msg) VOXELNAV_DEBUG("Collision", msg)

#define SPAWNER_CRITICAL(msg) VOXELNAV_CRITICAL("Spawner", msg)
#define SPAWNER_ERROR(msg) VOXELNAV_ERROR("Spawner", msg)
#define SPAWNER_WARN(msg) VOXELNAV_WARN("Spawner", msg)
#define SPAWNER_INFO(msg) VOXELNAV_INFO("Spawner", msg)
#define SPAWNER_DEBUG(msg) VOXELNAV_DEBUG("Spawner", msg)

#define ENTITY_CRITICAL(msg) VOXELNAV_CRITICAL("Entity", msg)
#define ENTITY_ERROR(msg) VOXELNAV_ERROR("Entity", msg)
#define ENTITY_WARN(msg) VOXELNAV_WARN("Entity", msg)
#define ENTITY_INFO(msg) VOXELNAV_INFO("Entity", msg)
#define ENTITY_DEBUG(msg) VOXELNAV_DEBUG("Entity", msg)

#define SIM_CRITICAL(msg) VOXELNAV_CRITICAL("Simulation", msg)
#define SIM_ERROR(msg) VOXELNAV_ERROR("Simulation", msg)
#define SIM_WARN(msg) VOXELNAV_WARN("Simulation", msg)
#define SIM_INFO(msg) VOXELNAV_INFO("Simulation", msg)
#define SIM_DEBUG(msg) VOXELNAV_DEBUG("Simulation", msg)

// Benchmark mode convenience macros
#define VOXELNAV_ENABLE_BENCHMARK_MODE()                                       \
  VoxelNav::Logger::SetBenchmarkMode(true)
#define VOXELNAV_DISABLE_BENCHMARK_MODE()                                      \
  VoxelNav::Logger::SetBenchmarkMode(false)

} // namespace VoxelNav

#endif // VOXELNAV_LOGGER_HPP
