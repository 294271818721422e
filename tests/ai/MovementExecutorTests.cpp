/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE MovementExecutorTests
#include <boost/test/unit_test.hpp>

#include "ai/MovementExecutor.hpp"
#include "ai/pathfinding/PathPlanner.hpp"
#include "core/Logger.hpp"
#include "entities/EntityRegistry.hpp"
#include "events/NavEventQueue.hpp"
#include "world/GridIndex.hpp"
#include <cmath>
#include <numbers>
#include <vector>

using namespace VoxelNav;

struct QuietLogFixture {
    QuietLogFixture() { VOXELNAV_ENABLE_BENCHMARK_MODE(); }
    ~QuietLogFixture() { VOXELNAV_DISABLE_BENCHMARK_MODE(); }
};
BOOST_GLOBAL_FIXTURE(QuietLogFixture);

struct MovementFixture {
    static constexpr float DT = 1.0f / 60.0f;

    GridIndex grid;
    PathPlanner planner{grid};
    NavEventQueue events;
    MovementExecutor movement{planner, MovementConfig{}, &events};
    EntityRegistry registry;

    EntityID makeMover(float x, float z, float speed) {
        const EntityID id = registry.createEntity();
        registry.add<Position>(id, Position{x, 0.0f, z});
        PathFollower follower;
        follower.moveSpeed = speed;
        registry.add<PathFollower>(id, follower);
        registry.add<MovementState>(id);
        registry.add<Facing>(id);
        return id;
    }

    void run(int ticks, float dt = DT) {
        for (int i = 0; i < ticks; ++i) {
            movement.update(registry, dt);
        }
    }
};

BOOST_AUTO_TEST_SUITE(StepTowardTests)

BOOST_AUTO_TEST_CASE(TestStepNeverOvershoots)
{
    const std::vector<float> speeds{0.5f, 3.0f, 25.0f, 400.0f};
    const std::vector<float> deltas{0.001f, 1.0f / 60.0f, 0.25f, 2.0f};
    const std::vector<Vector2D> targets{Vector2D(0.01f, 0.0f), Vector2D(1.0f, 0.0f),
                                        Vector2D(-3.0f, 4.0f), Vector2D(0.7f, -0.7f)};

    for (float speed : speeds) {
        for (float dt : deltas) {
            for (const Vector2D& target : targets) {
                Vector2D pos(0.0f, 0.0f);
                const float before = Vector2D::distance(pos, target);
                const float moved = MovementExecutor::stepToward(pos, target, speed * dt);
                const float after = Vector2D::distance(pos, target);

                BOOST_CHECK_GE(after, 0.0f);
                BOOST_CHECK_LE(moved, before + 1e-5f);
                BOOST_CHECK_LE(after, before + 1e-5f);
            }
        }
    }
}

BOOST_AUTO_TEST_CASE(TestLongStepLandsOnTarget)
{
    Vector2D pos(1.0f, 1.0f);
    const float moved = MovementExecutor::stepToward(pos, Vector2D(4.0f, 5.0f), 100.0f);
    BOOST_CHECK_CLOSE(moved, 5.0f, 0.01f);
    BOOST_CHECK(pos == Vector2D(4.0f, 5.0f));
}

BOOST_AUTO_TEST_CASE(TestZeroStepDoesNothing)
{
    Vector2D pos(2.0f, 2.0f);
    BOOST_CHECK_SMALL(MovementExecutor::stepToward(pos, Vector2D(3.0f, 2.0f), 0.0f), 1e-6f);
    BOOST_CHECK(pos == Vector2D(2.0f, 2.0f));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(PathFollowingTests, MovementFixture)

BOOST_AUTO_TEST_CASE(TestFollowsPathToTarget)
{
    const EntityID id = makeMover(0.0f, 0.0f, 3.0f);
    MovementExecutor::requestMoveTo(*registry.get<PathFollower>(id), Vector2D(3.0f, 0.0f));

    run(1);
    const PathFollower& follower = *registry.get<PathFollower>(id);
    BOOST_CHECK(!follower.needsPath);
    BOOST_CHECK_EQUAL(follower.path.size(), 4u);

    run(200);
    const Position& pos = *registry.get<Position>(id);
    BOOST_CHECK_CLOSE(pos.x, 3.0f, 0.001f);
    BOOST_CHECK_SMALL(pos.z, 1e-5f);
    BOOST_CHECK(follower.path.empty());
    BOOST_CHECK_EQUAL(follower.pathIndex, -1);

    // Heading toward +X
    BOOST_CHECK_CLOSE(registry.get<Facing>(id)->angle, std::numbers::pi_v<float> / 2.0f, 0.01f);
}

BOOST_AUTO_TEST_CASE(TestLargeFrameSnapsWaypoints)
{
    const EntityID id = makeMover(0.0f, 0.0f, 3.0f);
    MovementExecutor::requestMoveTo(*registry.get<PathFollower>(id), Vector2D(1.0f, 0.0f));

    run(1, 10.0f);   // Plan, start cell already underfoot
    BOOST_CHECK_EQUAL(registry.get<PathFollower>(id)->pathIndex, 1);

    run(1, 10.0f);   // Would travel 30 units, clamps to the waypoint
    BOOST_CHECK_CLOSE(registry.get<Position>(id)->x, 1.0f, 0.001f);

    run(1, 10.0f);   // Arrival
    BOOST_CHECK(!registry.get<PathFollower>(id)->hasActivePath());
    BOOST_CHECK_CLOSE(registry.get<Position>(id)->x, 1.0f, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestRecordsPreviousPosition)
{
    const EntityID id = makeMover(0.0f, 0.0f, 3.0f);
    MovementExecutor::requestMoveTo(*registry.get<PathFollower>(id), Vector2D(0.0f, 4.0f));
    run(10);

    const Vector2D before = registry.get<Position>(id)->ground();
    run(1);
    BOOST_CHECK(registry.get<MovementState>(id)->previous == before);
    BOOST_CHECK_GT(registry.get<Position>(id)->z, before.getZ());
}

BOOST_AUTO_TEST_CASE(TestFailedPlanArmsCooldownAndKeepsPath)
{
    const EntityID id = makeMover(0.0f, 0.0f, 3.0f);
    PathFollower& follower = *registry.get<PathFollower>(id);
    MovementExecutor::requestMoveTo(follower, Vector2D(5.0f, 0.0f));
    run(1);
    BOOST_REQUIRE(follower.hasActivePath());
    const size_t activeLength = follower.path.size();

    grid.setBlocked(0, 6);
    MovementExecutor::requestMoveTo(follower, Vector2D(0.0f, 6.0f));
    run(1);

    BOOST_CHECK(!follower.needsPath);
    BOOST_CHECK_GT(follower.pathRetryTime, 0.0f);
    BOOST_CHECK(follower.hasActivePath());
    BOOST_CHECK_EQUAL(follower.path.size(), activeLength);

    const std::vector<NavEvent> emitted = events.drain();
    BOOST_REQUIRE_EQUAL(emitted.size(), 1u);
    BOOST_CHECK_EQUAL(emitted[0].type, NavEventType::PathFailed);
    BOOST_CHECK_EQUAL(emitted[0].entity, id);
    BOOST_CHECK_EQUAL(emitted[0].cell, (CellCoord{0, 6}));
}

BOOST_AUTO_TEST_CASE(TestRetryWaitsForCooldown)
{
    const EntityID id = makeMover(0.0f, 0.0f, 3.0f);
    PathFollower& follower = *registry.get<PathFollower>(id);
    grid.setBlocked(4, 4);

    MovementExecutor::requestMoveTo(follower, Vector2D(4.0f, 4.0f));
    run(1, 0.1f);
    BOOST_CHECK_EQUAL(planner.getStats().totalRequests, 1u);

    // Re-requested straight away: gated until the 0.5s cooldown has passed
    MovementExecutor::requestMoveTo(follower, Vector2D(4.0f, 4.0f));
    run(3, 0.1f);
    BOOST_CHECK(follower.needsPath);
    BOOST_CHECK_EQUAL(planner.getStats().totalRequests, 1u);

    run(3, 0.1f);
    BOOST_CHECK(!follower.needsPath);
    BOOST_CHECK_EQUAL(planner.getStats().totalRequests, 2u);

    // Reachability changed, the next permitted attempt succeeds
    grid.setWalkable(4, 4);
    MovementExecutor::requestMoveTo(follower, Vector2D(4.0f, 4.0f));
    run(6, 0.1f);
    BOOST_CHECK(follower.hasActivePath());
}

BOOST_AUTO_TEST_CASE(TestMoversWithoutHistoryStillMove)
{
    const EntityID id = registry.createEntity();
    registry.add<Position>(id, Position{0.0f, 0.0f, 0.0f});
    registry.add<PathFollower>(id);
    MovementExecutor::requestMoveTo(*registry.get<PathFollower>(id), Vector2D(-2.0f, 0.0f));

    run(120);
    BOOST_CHECK_CLOSE(registry.get<Position>(id)->x, -2.0f, 0.001f);
}

BOOST_AUTO_TEST_SUITE_END()
