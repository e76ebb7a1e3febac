/**
 * @file TestCollisionDetector.cpp
 * @brief Unit tests for physics::CollisionDetector.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <sky/physics/CollisionDetector.hpp>

namespace sky::physics {

using Catch::Matchers::WithinAbs;

TEST_CASE("CollisionDetector::testSphereVsSphere", "[physics][narrowphase]")
{
    SECTION("overlapping spheres")
    {
        const auto c = CollisionDetector::testSphereVsSphere({0.0f, 0.0f, 0.0f}, 5.0f, {8.0f, 0.0f, 0.0f}, 5.0f);
        REQUIRE(c.has_value());
        REQUIRE_THAT(c->penetrationDepth, WithinAbs(2.0f, 1e-5f));
        REQUIRE_THAT(c->normal.x, WithinAbs(1.0f, 1e-6f));
        REQUIRE_THAT(c->position.x, WithinAbs(5.0f, 1e-5f));
    }

    SECTION("touching spheres collide with zero penetration")
    {
        const auto c = CollisionDetector::testSphereVsSphere({0.0f, 0.0f, 0.0f}, 5.0f, {0.0f, 0.0f, 10.0f}, 5.0f);
        REQUIRE(c.has_value());
        REQUIRE_THAT(c->penetrationDepth, WithinAbs(0.0f, 1e-5f));
    }

    SECTION("separated spheres")
    {
        REQUIRE_FALSE(CollisionDetector::testSphereVsSphere({0.0f, 0.0f, 0.0f}, 5.0f, {11.0f, 0.0f, 0.0f}, 5.0f));
    }

    SECTION("coincident centres fall back to +Y")
    {
        const auto c = CollisionDetector::testSphereVsSphere({1.0f, 2.0f, 3.0f}, 2.0f, {1.0f, 2.0f, 3.0f}, 3.0f);
        REQUIRE(c.has_value());
        REQUIRE(c->normal == math::Vec3f{0.0f, 1.0f, 0.0f});
        REQUIRE_THAT(c->penetrationDepth, WithinAbs(5.0f, 1e-5f));
        REQUIRE_THAT(c->position.y, WithinAbs(4.0f, 1e-5f));
    }
}

TEST_CASE("CollisionDetector::rayVsAABB", "[physics][narrowphase]")
{
    const math::AABBf box{math::Vec3f{-1.0f, -1.0f, -1.0f}, math::Vec3f{1.0f, 1.0f, 1.0f}};

    SECTION("entry distance from outside")
    {
        const auto t = CollisionDetector::rayVsAABB({{0.0f, 10.0f, 0.0f}, {0.0f, -1.0f, 0.0f}}, box);
        REQUIRE(t.has_value());
        REQUIRE_THAT(*t, WithinAbs(9.0f, 1e-5f));
    }

    SECTION("exit distance from inside")
    {
        const auto t = CollisionDetector::rayVsAABB({{0.0f, 0.0f, 0.0f}, {1.0f, 0.0f, 0.0f}}, box);
        REQUIRE(t.has_value());
        REQUIRE_THAT(*t, WithinAbs(1.0f, 1e-5f));
    }

    SECTION("box behind the origin")
    {
        REQUIRE_FALSE(CollisionDetector::rayVsAABB({{0.0f, 10.0f, 0.0f}, {0.0f, 1.0f, 0.0f}}, box));
    }

    SECTION("parallel ray outside the slab")
    {
        REQUIRE_FALSE(CollisionDetector::rayVsAABB({{-10.0f, 5.0f, 0.0f}, {1.0f, 0.0f, 0.0f}}, box));
    }
}

TEST_CASE("CollisionDetector::rayVsSphere", "[physics][narrowphase]")
{
    const math::Vec3f center{0.0f, 0.0f, 0.0f};

    SECTION("entering point")
    {
        const auto t = CollisionDetector::rayVsSphere({{0.0f, 0.0f, -10.0f}, {0.0f, 0.0f, 1.0f}}, center, 2.0f);
        REQUIRE(t.has_value());
        REQUIRE_THAT(*t, WithinAbs(8.0f, 1e-5f));
    }

    SECTION("exiting point from inside")
    {
        const auto t = CollisionDetector::rayVsSphere({{0.0f, 0.0f, 0.0f}, {0.0f, 0.0f, 1.0f}}, center, 2.0f);
        REQUIRE(t.has_value());
        REQUIRE_THAT(*t, WithinAbs(2.0f, 1e-5f));
    }

    SECTION("miss to the side")
    {
        REQUIRE_FALSE(CollisionDetector::rayVsSphere({{3.0f, 0.0f, -10.0f}, {0.0f, 0.0f, 1.0f}}, center, 2.0f));
    }

    SECTION("sphere behind the origin")
    {
        REQUIRE_FALSE(CollisionDetector::rayVsSphere({{0.0f, 0.0f, 10.0f}, {0.0f, 0.0f, 1.0f}}, center, 2.0f));
    }
}

} // namespace sky::physics
