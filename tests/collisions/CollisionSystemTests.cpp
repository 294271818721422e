/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE CollisionSystemTests
#include <boost/test/unit_test.hpp>

#include "ai/OpponentSelector.hpp"
#include "collisions/AABB.hpp"
#include "collisions/CollisionBody.hpp"
#include "collisions/CollisionDetector.hpp"
#include "collisions/CollisionResponder.hpp"
#include "collisions/SpatialHash.hpp"
#include "core/Logger.hpp"
#include "entities/EntityFactory.hpp"
#include "entities/EntityRegistry.hpp"
#include "events/NavEventQueue.hpp"
#include "utils/Vector2D.hpp"
#include "world/GridIndex.hpp"
#include <algorithm>
#include <stdexcept>
#include <vector>

using namespace VoxelNav;

struct QuietLogFixture {
    QuietLogFixture() { VOXELNAV_ENABLE_BENCHMARK_MODE(); }
    ~QuietLogFixture() { VOXELNAV_DISABLE_BENCHMARK_MODE(); }
};
BOOST_GLOBAL_FIXTURE(QuietLogFixture);

BOOST_AUTO_TEST_SUITE(AABBTests)

BOOST_AUTO_TEST_CASE(TestAABBBasicProperties)
{
    AABB aabb(10.0f, 20.0f, 5.0f, 7.5f);

    BOOST_CHECK_CLOSE(aabb.left(), 5.0f, 0.01f);
    BOOST_CHECK_CLOSE(aabb.right(), 15.0f, 0.01f);
    BOOST_CHECK_CLOSE(aabb.nearSide(), 12.5f, 0.01f);
    BOOST_CHECK_CLOSE(aabb.farSide(), 27.5f, 0.01f);
}

BOOST_AUTO_TEST_CASE(TestAABBIntersection)
{
    AABB aabb1(10.0f, 10.0f, 5.0f, 5.0f);
    AABB aabb2(15.0f, 10.0f, 3.0f, 3.0f);
    AABB aabb3(20.0f, 10.0f, 2.0f, 2.0f);

    BOOST_CHECK(aabb1.intersects(aabb2));
    BOOST_CHECK(aabb2.intersects(aabb1));
    BOOST_CHECK(!aabb1.intersects(aabb3));
    BOOST_CHECK(!aabb3.intersects(aabb1));
}

BOOST_AUTO_TEST_CASE(TestAdjacentBlocksDoNotIntersect)
{
    AABB a(0.0f, 0.0f, 0.5f, 0.5f);
    AABB b(1.0f, 0.0f, 0.5f, 0.5f);
    BOOST_CHECK(!a.intersects(b));
    BOOST_CHECK(!CollisionDetector::boxVsBox(a, b).has_value());
}

BOOST_AUTO_TEST_CASE(TestAABBContainsAndClosestPoint)
{
    AABB aabb(10.0f, 10.0f, 5.0f, 5.0f);

    BOOST_CHECK(aabb.contains(Vector2D(10.0f, 10.0f)));
    BOOST_CHECK(aabb.contains(Vector2D(5.0f, 5.0f)));
    BOOST_CHECK(!aabb.contains(Vector2D(20.0f, 20.0f)));

    const Vector2D inside = aabb.closestPoint(Vector2D(11.0f, 9.0f));
    BOOST_CHECK_CLOSE(inside.getX(), 11.0f, 0.01f);
    BOOST_CHECK_CLOSE(inside.getZ(), 9.0f, 0.01f);

    const Vector2D outside = aabb.closestPoint(Vector2D(20.0f, 0.0f));
    BOOST_CHECK_CLOSE(outside.getX(), 15.0f, 0.01f);
    BOOST_CHECK_CLOSE(outside.getZ(), 5.0f, 0.01f);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(SpatialHashTests)

BOOST_AUTO_TEST_CASE(TestInsertAndQuery)
{
    SpatialHash hash(2.0f);
    hash.insert(1, AABB(1.0f, 1.0f, 0.3f, 0.3f));
    hash.insert(2, AABB(9.0f, 9.0f, 0.3f, 0.3f));
    hash.insert(3, AABB(2.0f, 2.0f, 1.5f, 1.5f));   // Spans several buckets

    std::vector<EntityID> results;
    hash.query(AABB(1.0f, 1.0f, 0.5f, 0.5f), results);
    BOOST_CHECK(std::find(results.begin(), results.end(), 1u) != results.end());
    BOOST_CHECK(std::find(results.begin(), results.end(), 3u) != results.end());
    BOOST_CHECK(std::find(results.begin(), results.end(), 2u) == results.end());
    BOOST_CHECK_EQUAL(hash.size(), 3u);
}

BOOST_AUTO_TEST_CASE(TestQueryReportsEachIdOnce)
{
    SpatialHash hash(1.0f);
    hash.insert(7, AABB(0.0f, 0.0f, 3.0f, 3.0f));

    std::vector<EntityID> results;
    hash.query(AABB(0.0f, 0.0f, 3.0f, 3.0f), results);
    BOOST_CHECK_EQUAL(results.size(), 1u);
}

BOOST_AUTO_TEST_CASE(TestClearEmptiesBuckets)
{
    SpatialHash hash(2.0f);
    hash.insert(1, AABB(0.0f, 0.0f, 0.3f, 0.3f));
    hash.clear();

    std::vector<EntityID> results;
    hash.query(AABB(0.0f, 0.0f, 0.5f, 0.5f), results);
    BOOST_CHECK(results.empty());
    BOOST_CHECK_EQUAL(hash.size(), 0u);

    hash.insert(2, AABB(20.0f, 20.0f, 0.3f, 0.3f));
    hash.query(AABB(20.0f, 20.0f, 0.5f, 0.5f), results);
    BOOST_REQUIRE_EQUAL(results.size(), 1u);
    BOOST_CHECK_EQUAL(results.front(), 2u);
}

BOOST_AUTO_TEST_CASE(TestInvalidCellSize)
{
    BOOST_CHECK_THROW(SpatialHash(0.0f), std::invalid_argument);
    BOOST_CHECK_THROW(SpatialHash(-1.0f), std::invalid_argument);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(NarrowPhaseTests)

BOOST_AUTO_TEST_CASE(TestCircleVsCircle)
{
    const auto hit = CollisionDetector::circleVsCircle(Vector2D(0.0f, 0.0f), 0.3f,
                                                       Vector2D(0.4f, 0.0f), 0.3f);
    BOOST_REQUIRE(hit.has_value());
    BOOST_CHECK_CLOSE(hit->penetration, 0.2f, 0.1f);
    BOOST_CHECK_CLOSE(hit->normal.getX(), -1.0f, 0.01f);   // Points from B toward A
    BOOST_CHECK_SMALL(hit->normal.getZ(), 1e-5f);

    BOOST_CHECK(!CollisionDetector::circleVsCircle(Vector2D(0.0f, 0.0f), 0.3f,
                                                   Vector2D(0.6f, 0.0f), 0.3f).has_value());
}

BOOST_AUTO_TEST_CASE(TestCoincidentCirclesStillSeparate)
{
    const auto hit = CollisionDetector::circleVsCircle(Vector2D(1.0f, 1.0f), 0.3f,
                                                       Vector2D(1.0f, 1.0f), 0.3f);
    BOOST_REQUIRE(hit.has_value());
    BOOST_CHECK_CLOSE(hit->normal.length(), 1.0f, 0.01f);
    BOOST_CHECK_CLOSE(hit->penetration, 0.6f, 0.1f);
}

BOOST_AUTO_TEST_CASE(TestCircleVsBoxOutside)
{
    const AABB box(0.0f, 0.0f, 0.5f, 0.5f);
    const auto hit = CollisionDetector::circleVsBox(Vector2D(0.7f, 0.0f), 0.3f, box);
    BOOST_REQUIRE(hit.has_value());
    BOOST_CHECK_CLOSE(hit->penetration, 0.1f, 0.1f);
    BOOST_CHECK_CLOSE(hit->normal.getX(), 1.0f, 0.01f);

    BOOST_CHECK(!CollisionDetector::circleVsBox(Vector2D(0.9f, 0.0f), 0.3f, box).has_value());
}

BOOST_AUTO_TEST_CASE(TestCircleCentreInsideBox)
{
    const AABB box(0.0f, 0.0f, 0.5f, 0.5f);
    const auto hit = CollisionDetector::circleVsBox(Vector2D(0.4f, 0.1f), 0.3f, box);
    BOOST_REQUIRE(hit.has_value());
    BOOST_CHECK_CLOSE(hit->normal.getX(), 1.0f, 0.01f);
    BOOST_CHECK_CLOSE(hit->penetration, 0.4f, 0.1f);
}

BOOST_AUTO_TEST_CASE(TestBoxVsBoxLeastPenetrationAxis)
{
    const auto hit = CollisionDetector::boxVsBox(AABB(0.0f, 0.0f, 0.5f, 0.5f),
                                                 AABB(0.2f, 0.9f, 0.5f, 0.5f));
    BOOST_REQUIRE(hit.has_value());
    BOOST_CHECK_CLOSE(hit->normal.getZ(), -1.0f, 0.01f);
    BOOST_CHECK_CLOSE(hit->penetration, 0.1f, 0.1f);
}

BOOST_AUTO_TEST_SUITE_END()

struct CollisionFixture {
    GridIndex grid;
    EntityFactory factory;
    OpponentSelector opponents;
    NavEventQueue events;
    CollisionDetector detector;
    CollisionResponder responder{opponents, CollisionConfig{}, &events};
    EntityRegistry registry;

    EntityID makeNpc(float x, float z) {
        return factory.createNPC(registry, x, 0.0f, z, NpcOptions{});
    }

    // Pretend the entity moved from `from` to its current position this tick
    void movedFrom(EntityID id, float x, float z) {
        registry.get<MovementState>(id)->previous = Vector2D(x, z);
    }

    void step() {
        detector.update(registry);
        responder.update(registry);
    }
};

BOOST_FIXTURE_TEST_SUITE(DetectorTests, CollisionFixture)

BOOST_AUTO_TEST_CASE(TestAgentAgainstBlockRecordsContact)
{
    const EntityID block = *factory.createBlock(registry, grid, 0, 0, 0, "stone");
    const EntityID npc = makeNpc(0.7f, 0.0f);
    detector.update(registry);

    const CollisionState& npcState = *registry.get<CollisionState>(npc);
    BOOST_CHECK(npcState.isColliding);
    BOOST_REQUIRE_EQUAL(npcState.contacts.size(), 1u);
    BOOST_CHECK_EQUAL(npcState.contacts[0].other, block);
    BOOST_CHECK_EQUAL(npcState.contacts[0].otherLayer, Layer_Block);
    BOOST_CHECK_GT(npcState.contacts[0].normal.getX(), 0.0f);

    // Blocks collide with nothing, but still get a state to read
    BOOST_REQUIRE(registry.has<CollisionState>(block));
    BOOST_CHECK(!registry.get<CollisionState>(block)->isColliding);
}

BOOST_AUTO_TEST_CASE(TestContactsAreMirrored)
{
    const EntityID a = makeNpc(0.0f, 0.0f);
    const EntityID b = makeNpc(0.0f, 0.4f);
    detector.update(registry);

    const CollisionState& sa = *registry.get<CollisionState>(a);
    const CollisionState& sb = *registry.get<CollisionState>(b);
    BOOST_REQUIRE_EQUAL(sa.contacts.size(), 1u);
    BOOST_REQUIRE_EQUAL(sb.contacts.size(), 1u);
    BOOST_CHECK_EQUAL(sa.contacts[0].other, b);
    BOOST_CHECK_EQUAL(sb.contacts[0].other, a);
    BOOST_CHECK_LT(sa.contacts[0].normal.getZ(), 0.0f);
    BOOST_CHECK_GT(sb.contacts[0].normal.getZ(), 0.0f);
    BOOST_CHECK_CLOSE(sa.contacts[0].penetration, sb.contacts[0].penetration, 0.01f);
}

BOOST_AUTO_TEST_CASE(TestContactsClearedWhenApart)
{
    const EntityID a = makeNpc(0.0f, 0.0f);
    makeNpc(0.3f, 0.0f);
    detector.update(registry);
    BOOST_REQUIRE(registry.get<CollisionState>(a)->isColliding);

    registry.get<Position>(a)->x = -5.0f;
    detector.update(registry);
    BOOST_CHECK(!registry.get<CollisionState>(a)->isColliding);
    BOOST_CHECK(registry.get<CollisionState>(a)->contacts.empty());
}

BOOST_AUTO_TEST_CASE(TestLayerMasksFilterPairs)
{
    // Overlapping blocks never report each other
    const EntityID b1 = *factory.createBlock(registry, grid, 0, 0, 0, "stone");
    const EntityID b2 = registry.createEntity();
    registry.add<Position>(b2, Position{0.5f, 0.0f, 0.0f});
    registry.add<Collider>(b2, *registry.get<Collider>(b1));
    detector.update(registry);

    BOOST_CHECK(!registry.get<CollisionState>(b1)->isColliding);
    BOOST_CHECK(!registry.get<CollisionState>(b2)->isColliding);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(ResponderTests, CollisionFixture)

BOOST_AUTO_TEST_CASE(TestBlockContactRevertsAndClearsPath)
{
    factory.createBlock(registry, grid, 0, 0, 0, "stone");
    const EntityID npc = makeNpc(0.7f, 0.0f);
    movedFrom(npc, 1.5f, 0.0f);

    PathFollower& follower = *registry.get<PathFollower>(npc);
    follower.path = {CellCoord{1, 0}, CellCoord{0, 0}};
    follower.pathIndex = 1;
    registry.get<WanderData>(npc)->travelling = true;

    step();

    const Position& pos = *registry.get<Position>(npc);
    BOOST_CHECK_CLOSE(pos.x, 1.5f, 0.001f);
    BOOST_CHECK(!follower.hasActivePath());
    BOOST_CHECK(follower.path.empty());
    BOOST_CHECK(!follower.needsPath);
    BOOST_CHECK_CLOSE(registry.get<WanderData>(npc)->waitTime, 0.2f, 0.01f);
    BOOST_CHECK(!registry.get<WanderData>(npc)->travelling);

    const std::vector<NavEvent> emitted = events.drain();
    BOOST_REQUIRE_EQUAL(emitted.size(), 1u);
    BOOST_CHECK_EQUAL(emitted[0].type, NavEventType::CollisionReverted);
    BOOST_CHECK_EQUAL(emitted[0].entity, npc);
}

BOOST_AUTO_TEST_CASE(TestBlockWinsEvenWhilePursuing)
{
    factory.createBlock(registry, grid, 0, 0, 0, "stone");
    const EntityID npc = makeNpc(0.7f, 0.0f);
    movedFrom(npc, 1.5f, 0.0f);
    registry.get<PursuitData>(npc)->state = PursuitState::AggressivePursuit;
    registry.get<PathFollower>(npc)->path = {CellCoord{1, 0}, CellCoord{0, 0}};
    registry.get<PathFollower>(npc)->pathIndex = 1;

    step();
    BOOST_CHECK_CLOSE(registry.get<Position>(npc)->x, 1.5f, 0.001f);
    BOOST_CHECK(registry.get<PathFollower>(npc)->path.empty());
}

BOOST_AUTO_TEST_CASE(TestCaughtOpponentKeepsPursuitPath)
{
    const EntityID player = factory.createPlayer(registry, 2.9f, 0.0f, "p1", true);
    opponents.setDefaultOpponent(player);
    const EntityID npc = makeNpc(2.5f, 0.0f);
    movedFrom(npc, 2.4f, 0.0f);
    movedFrom(player, 2.9f, 0.0f);

    registry.get<PursuitData>(npc)->state = PursuitState::Seeking;
    PathFollower& follower = *registry.get<PathFollower>(npc);
    follower.path = {CellCoord{2, 0}, CellCoord{3, 0}};
    follower.pathIndex = 1;

    step();
    BOOST_CHECK_CLOSE(registry.get<Position>(npc)->x, 2.4f, 0.001f);
    BOOST_CHECK(follower.hasActivePath());
    BOOST_CHECK_EQUAL(follower.pathIndex, 1);
}

BOOST_AUTO_TEST_CASE(TestOpponentContactWhileIdleActsLikeObstacle)
{
    const EntityID player = factory.createPlayer(registry, 2.9f, 0.0f, "p1", true);
    opponents.setDefaultOpponent(player);
    const EntityID npc = makeNpc(2.5f, 0.0f);
    movedFrom(npc, 2.4f, 0.0f);
    movedFrom(player, 2.9f, 0.0f);

    PathFollower& follower = *registry.get<PathFollower>(npc);
    follower.path = {CellCoord{2, 0}, CellCoord{3, 0}};
    follower.pathIndex = 1;

    step();
    BOOST_CHECK_CLOSE(registry.get<Position>(npc)->x, 2.4f, 0.001f);
    BOOST_CHECK(follower.path.empty());
    BOOST_CHECK_CLOSE(registry.get<WanderData>(npc)->waitTime, 0.2f, 0.01f);

    // The player is not an agent and is left where it stands
    BOOST_CHECK_CLOSE(registry.get<Position>(player)->x, 2.9f, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestDeepAgentOverlapIsNudged)
{
    const EntityID a = makeNpc(0.0f, 0.0f);
    const EntityID b = makeNpc(0.3f, 0.0f);
    movedFrom(a, 0.0f, 0.0f);
    movedFrom(b, 0.3f, 0.0f);

    step();
    // Penetration 0.3, half applied along each contact normal
    BOOST_CHECK_CLOSE(registry.get<Position>(a)->x, -0.15f, 0.1f);
    BOOST_CHECK_CLOSE(registry.get<Position>(b)->x, 0.45f, 0.1f);
}

BOOST_AUTO_TEST_CASE(TestShallowAgentOverlapIsTolerated)
{
    const EntityID a = makeNpc(0.0f, 0.0f);
    const EntityID b = makeNpc(0.5f, 0.0f);
    movedFrom(a, 0.0f, 0.0f);
    movedFrom(b, 0.5f, 0.0f);

    step();
    BOOST_CHECK_SMALL(registry.get<Position>(a)->x, 1e-5f);
    BOOST_CHECK_CLOSE(registry.get<Position>(b)->x, 0.5f, 0.001f);
    BOOST_CHECK(events.drain().empty());
}

BOOST_AUTO_TEST_CASE(TestPlayerRevertsOnBlock)
{
    factory.createBlock(registry, grid, 0, 0, 0, "stone");
    const EntityID player = factory.createPlayer(registry, -0.7f, 0.0f, "p1", true);
    movedFrom(player, -1.2f, 0.0f);

    step();
    BOOST_CHECK_CLOSE(registry.get<Position>(player)->x, -1.2f, 0.001f);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(CollisionConfigTests)

BOOST_AUTO_TEST_CASE(TestInvalidConfigRejected)
{
    CollisionConfig config;
    config.cellSize = 0.0f;
    BOOST_CHECK_THROW(CollisionDetector{config}, std::invalid_argument);

    OpponentSelector opponents;
    CollisionConfig negative;
    negative.nudgeFactor = -1.0f;
    BOOST_CHECK_THROW(CollisionResponder(opponents, negative), std::invalid_argument);
}

BOOST_AUTO_TEST_SUITE_END()
