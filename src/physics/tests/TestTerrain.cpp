/**
 * @file TestTerrain.cpp
 * @brief Unit tests for physics::Heightfield and terrain height sampling.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <sky/physics/TerrainChunk.hpp>

#include <vector>

namespace sky::physics {

using Catch::Matchers::WithinAbs;

namespace {

/// 4x4 heightfield with sample (xi, zi) = xi * 10 + zi.
Heightfield rampField()
{
    Heightfield hf{4, 4};
    for (core::usize xi = 0; xi < 4; ++xi)
        for (core::usize zi = 0; zi < 4; ++zi)
            hf.set(xi, zi, static_cast<core::f32>(xi * 10 + zi));
    return hf;
}

TerrainChunk rampChunk()
{
    TerrainChunk chunk;
    chunk.id = 1;
    chunk.bounds = {math::Vec3f{0.0f, -10.0f, 0.0f}, math::Vec3f{4.0f, 40.0f, 4.0f}};
    chunk.heightfield = rampField();
    return chunk;
}

} // namespace

TEST_CASE("Heightfield factories validate their input", "[physics][terrain]")
{
    SECTION("fromRows keeps [x][z] indexing")
    {
        const auto hf = Heightfield::fromRows({{1.0f, 2.0f, 3.0f}, {4.0f, 5.0f, 6.0f}});
        REQUIRE(hf.has_value());
        REQUIRE(hf->width() == 2);
        REQUIRE(hf->depth() == 3);
        REQUIRE_THAT(hf->at(1, 2), WithinAbs(6.0f, 1e-6f));
    }

    SECTION("ragged rows")
    {
        const auto hf = Heightfield::fromRows({{1.0f, 2.0f}, {3.0f}});
        REQUIRE_FALSE(hf.has_value());
        REQUIRE(hf.error().code() == core::ErrorCode::kInvalidArgument);
    }

    SECTION("sample count mismatch")
    {
        const auto hf = Heightfield::fromSamples(3, 3, std::vector<core::f32>(8, 0.0f));
        REQUIRE_FALSE(hf.has_value());
        REQUIRE(hf.error().code() == core::ErrorCode::kInvalidArgument);
    }

    SECTION("inRange")
    {
        const Heightfield hf{2, 3};
        REQUIRE(hf.inRange(1, 2));
        REQUIRE_FALSE(hf.inRange(2, 0));
        REQUIRE_FALSE(hf.inRange(-1, 0));
    }
}

TEST_CASE("sampleTerrainHeight picks heightfield, then probe, then min.y", "[physics][terrain]")
{
    auto chunk = rampChunk();

    SECTION("heightfield sample at floor index")
    {
        REQUIRE_THAT(sampleTerrainHeight(chunk, 2.5f, 1.2f), WithinAbs(21.0f, 1e-6f));
        REQUIRE_THAT(sampleTerrainHeight(chunk, 0.0f, 0.0f), WithinAbs(0.0f, 1e-6f));
    }

    SECTION("scale divides the local coordinate")
    {
        chunk.heightfieldScale = {2.0f, 2.0f};
        REQUIRE_THAT(sampleTerrainHeight(chunk, 3.0f, 5.0f), WithinAbs(12.0f, 1e-6f));
    }

    SECTION("out of range without probe falls back to min.y")
    {
        REQUIRE_THAT(sampleTerrainHeight(chunk, 5.0f, 1.0f), WithinAbs(-10.0f, 1e-6f));
        REQUIRE_THAT(sampleTerrainHeight(chunk, -0.5f, 1.0f), WithinAbs(-10.0f, 1e-6f));
    }

    SECTION("out of range uses the probe when present")
    {
        chunk.heightProbe = [](core::f32 x, core::f32 z) { return x + z; };
        REQUIRE_THAT(sampleTerrainHeight(chunk, 5.0f, 1.0f), WithinAbs(6.0f, 1e-6f));
    }

    SECTION("probe-only chunk")
    {
        chunk.heightfield.reset();
        chunk.heightProbe = [](core::f32, core::f32) { return 7.0f; };
        REQUIRE_THAT(sampleTerrainHeight(chunk, 2.0f, 2.0f), WithinAbs(7.0f, 1e-6f));
    }
}

TEST_CASE("validateTerrainChunk", "[physics][terrain]")
{
    auto chunk = rampChunk();
    REQUIRE(validateTerrainChunk(chunk).has_value());

    SECTION("inverted bounds")
    {
        chunk.bounds = {math::Vec3f{4.0f, 0.0f, 0.0f}, math::Vec3f{0.0f, 1.0f, 4.0f}};
        REQUIRE(validateTerrainChunk(chunk).error().code() == core::ErrorCode::kInvalidArgument);
    }

    SECTION("non-positive scale")
    {
        chunk.heightfieldScale = {0.0f, 1.0f};
        REQUIRE(validateTerrainChunk(chunk).error().code() == core::ErrorCode::kInvalidArgument);
    }

    SECTION("heightfield without samples")
    {
        chunk.heightfield = Heightfield{0, 0};
        REQUIRE(validateTerrainChunk(chunk).error().code() == core::ErrorCode::kInvalidArgument);
    }

    SECTION("no heightfield is fine")
    {
        chunk.heightfield.reset();
        chunk.heightfieldScale = {0.0f, 0.0f};
        REQUIRE(validateTerrainChunk(chunk).has_value());
    }
}

} // namespace sky::physics
