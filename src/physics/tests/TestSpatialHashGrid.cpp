/**
 * @file TestSpatialHashGrid.cpp
 * @brief Unit tests for physics::SpatialHashGrid.
 */

#include <catch2/catch_test_macros.hpp>

#include <sky/physics/SpatialHashGrid.hpp>

#include <algorithm>
#include <random>
#include <vector>

namespace sky::physics {

namespace {

math::AABBf box(math::Vec3f min, math::Vec3f max)
{
    return {min, max};
}

/// Every (cell, id) pair the grid holds for @p id inside @p range.
std::vector<CellKey> cellsOf(const SpatialHashGrid& grid, core::EntityId id, const CellRange& range)
{
    std::vector<CellKey> out;
    for (core::i32 x = range.min.x; x <= range.max.x; ++x)
        for (core::i32 y = range.min.y; y <= range.max.y; ++y)
            for (core::i32 z = range.min.z; z <= range.max.z; ++z)
                if (grid.contains({x, y, z}, id))
                    out.push_back({x, y, z});
    return out;
}

} // namespace

TEST_CASE("SpatialHashGrid covers the floor range of the bounds", "[physics][grid]")
{
    SpatialHashGrid grid{100.0f};

    SECTION("X span 95..205 occupies columns 0, 1, 2")
    {
        grid.insertObject(1, box({95.0f, 10.0f, 10.0f}, {205.0f, 20.0f, 20.0f}));

        REQUIRE(grid.cellCount() == 3);
        REQUIRE(grid.contains({0, 0, 0}, 1));
        REQUIRE(grid.contains({1, 0, 0}, 1));
        REQUIRE(grid.contains({2, 0, 0}, 1));
        REQUIRE_FALSE(grid.contains({3, 0, 0}, 1));
        REQUIRE_FALSE(grid.contains({-1, 0, 0}, 1));
    }

    SECTION("same span on Y")
    {
        grid.insertObject(1, box({10.0f, 95.0f, 10.0f}, {20.0f, 205.0f, 20.0f}));

        REQUIRE(grid.cellCount() == 3);
        REQUIRE(grid.contains({0, 0, 0}, 1));
        REQUIRE(grid.contains({0, 1, 0}, 1));
        REQUIRE(grid.contains({0, 2, 0}, 1));
    }

    SECTION("same span on Z")
    {
        grid.insertObject(1, box({10.0f, 10.0f, 95.0f}, {20.0f, 20.0f, 205.0f}));

        REQUIRE(grid.cellCount() == 3);
        REQUIRE(grid.contains({0, 0, 0}, 1));
        REQUIRE(grid.contains({0, 0, 1}, 1));
        REQUIRE(grid.contains({0, 0, 2}, 1));
    }

    SECTION("negative coordinates use floor")
    {
        grid.insertObject(1, box({-0.5f, -150.0f, -100.0f}, {0.5f, -120.0f, -100.0f}));

        const auto range = grid.cellRange(box({-0.5f, -150.0f, -100.0f}, {0.5f, -120.0f, -100.0f}));
        REQUIRE(range.min == CellKey{-1, -2, -1});
        REQUIRE(range.max == CellKey{0, -2, -1});
        REQUIRE(grid.cellCount() == 2);
        REQUIRE(grid.contains({-1, -2, -1}, 1));
        REQUIRE(grid.contains({0, -2, -1}, 1));
    }
}

TEST_CASE("SpatialHashGrid::removeObject erases emptied cells", "[physics][grid]")
{
    SpatialHashGrid grid{10.0f};
    const auto a = box({0.0f, 0.0f, 0.0f}, {15.0f, 5.0f, 5.0f});
    const auto b = box({1.0f, 1.0f, 1.0f}, {2.0f, 2.0f, 2.0f});

    grid.insertObject(1, a);
    grid.insertObject(2, b);
    REQUIRE(grid.cellCount() == 2);

    grid.removeObject(1, a);
    REQUIRE(grid.cellCount() == 1);
    REQUIRE(grid.cell({0, 0, 0}).size() == 1);
    REQUIRE(grid.cell({1, 0, 0}).empty());

    grid.removeObject(2, b);
    REQUIRE(grid.cellCount() == 0);
}

TEST_CASE("SpatialHashGrid::updateObject matches a fresh insert", "[physics][grid]")
{
    const auto before = box({-20.0f, 0.0f, 0.0f}, {25.0f, 5.0f, 5.0f});
    const auto after  = box({5.0f, 0.0f, 0.0f}, {48.0f, 15.0f, 5.0f});
    const CellRange probe{{-5, -5, -5}, {5, 5, 5}};

    SpatialHashGrid moved{10.0f};
    moved.insertObject(7, before);
    moved.updateObject(7, after, before);

    SpatialHashGrid fresh{10.0f};
    fresh.insertObject(7, after);

    REQUIRE(cellsOf(moved, 7, probe) == cellsOf(fresh, 7, probe));
    REQUIRE(moved.cellCount() == fresh.cellCount());

    SECTION("unchanged bounds are idempotent")
    {
        moved.updateObject(7, after, after);
        REQUIRE(cellsOf(moved, 7, probe) == cellsOf(fresh, 7, probe));
        REQUIRE(moved.cellCount() == fresh.cellCount());
    }
}

TEST_CASE("SpatialHashGrid::findPotentialCollisions", "[physics][grid]")
{
    SpatialHashGrid grid{100.0f};
    const auto a = box({50.0f, 10.0f, 10.0f}, {150.0f, 20.0f, 20.0f});
    grid.insertObject(1, a);
    grid.insertObject(2, box({10.0f, 10.0f, 10.0f}, {20.0f, 20.0f, 20.0f}));
    grid.insertObject(3, box({90.0f, 10.0f, 10.0f}, {110.0f, 20.0f, 20.0f}));
    grid.insertObject(4, box({500.0f, 10.0f, 10.0f}, {510.0f, 20.0f, 20.0f}));

    SECTION("excludes self, unique, first-seen order")
    {
        REQUIRE(grid.findPotentialCollisions(1, a) == std::vector<core::EntityId>{2, 3});
    }

    SECTION("unregistered query id sees everyone in range")
    {
        const auto right = box({120.0f, 10.0f, 10.0f}, {130.0f, 20.0f, 20.0f});
        REQUIRE(grid.findPotentialCollisions(99, right) == std::vector<core::EntityId>{1, 3});
    }

    SECTION("empty region")
    {
        REQUIRE(grid.findPotentialCollisions(99, box({-900.0f, 0.0f, 0.0f}, {-850.0f, 1.0f, 1.0f})).empty());
    }
}

TEST_CASE("SpatialHashGrid never misses an overlapping pair", "[physics][grid]")
{
    SpatialHashGrid grid{25.0f};
    std::mt19937 rng{7};
    std::uniform_real_distribution<core::f32> coord{-200.0f, 200.0f};
    std::uniform_real_distribution<core::f32> extent{1.0f, 60.0f};

    std::vector<math::AABBf> bounds;
    for (core::EntityId id = 0; id < 150; ++id)
    {
        bounds.push_back(math::AABBf::fromCenterExtents(
            {coord(rng), coord(rng), coord(rng)}, {extent(rng), extent(rng), extent(rng)}));
        grid.insertObject(id, bounds.back());
    }

    for (core::EntityId a = 0; a < bounds.size(); ++a)
    {
        const auto candidates = grid.findPotentialCollisions(a, bounds[a]);
        for (core::EntityId b = 0; b < bounds.size(); ++b)
        {
            if (a != b && bounds[a].intersects(bounds[b]))
                REQUIRE(std::find(candidates.begin(), candidates.end(), b) != candidates.end());
        }
    }
}

TEST_CASE("SpatialHashGrid clamps cell indices to the grid range", "[physics][grid]")
{
    SpatialHashGrid grid{100.0f};

    REQUIRE(grid.cellOf({1e12f, -1e12f, 250.0f}) == CellKey{core::kGridCellLimit, -core::kGridCellLimit, 2});

    grid.insertObject(7, box({1e12f, 0.0f, 0.0f}, {1e12f, 1.0f, 1.0f}));
    REQUIRE(grid.contains({core::kGridCellLimit, 0, 0}, 7));
    REQUIRE(grid.cellCount() == 1);

    grid.removeObject(7, box({1e12f, 0.0f, 0.0f}, {1e12f, 1.0f, 1.0f}));
    REQUIRE(grid.cellCount() == 0);
}

TEST_CASE("SpatialHashGrid::checkBounds", "[physics][grid]")
{
    SpatialHashGrid grid{100.0f};

    SECTION("ordinary box fits")
    {
        REQUIRE(grid.checkBounds(box({-250.0f, 0.0f, 0.0f}, {250.0f, 10.0f, 10.0f})).has_value());
    }

    SECTION("coordinate beyond the cell limit")
    {
        const auto r = grid.checkBounds(box({1e12f, 0.0f, 0.0f}, {1e12f, 1.0f, 1.0f}));
        REQUIRE(r.error().code() == core::ErrorCode::kOutOfRange);
    }

    SECTION("too many covered cells")
    {
        const auto r = grid.checkBounds(box({-1e6f, -1e6f, -1e6f}, {1e6f, 1e6f, 1e6f}));
        REQUIRE(r.error().code() == core::ErrorCode::kOutOfRange);
    }
}

TEST_CASE("SpatialHashGrid::clear drops every cell", "[physics][grid]")
{
    SpatialHashGrid grid;
    grid.insertObject(1, box({0.0f, 0.0f, 0.0f}, {300.0f, 1.0f, 1.0f}));
    REQUIRE(grid.cellCount() == 4);

    grid.clear();
    REQUIRE(grid.cellCount() == 0);
    REQUIRE_FALSE(grid.contains({0, 0, 0}, 1));
}

} // namespace sky::physics
