/**
 * @file SpatialHashGrid.hpp
 * @brief Unbounded uniform hash grid for dynamic entities.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef SKY_PHYSICS_SPATIALHASHGRID_HPP
    #define SKY_PHYSICS_SPATIALHASHGRID_HPP

#include <sky/math/AABB.hpp>
#include <sky/math/Morton.hpp>
#include <sky/core/Constants.hpp>
#include <sky/core/Expected.hpp>
#include <sky/core/NonCopyable.hpp>
#include <sky/core/Types.hpp>

#include <functional>
#include <memory>
#include <span>
#include <vector>

namespace sky::physics {

/** @brief Integer cell coordinate: floor(coord / cellSize) per axis. */
struct CellKey
{
    core::i32 x{0};
    core::i32 y{0};
    core::i32 z{0};

    [[nodiscard]] constexpr bool operator==(const CellKey&) const = default;
};

/** @brief Inclusive box of cells covered by an AABB. */
struct CellRange
{
    CellKey min{};
    CellKey max{};

    [[nodiscard]] constexpr bool contains(const CellKey& c) const noexcept
    {
        return c.x >= min.x && c.x <= max.x
            && c.y >= min.y && c.y <= max.y
            && c.z >= min.z && c.z <= max.z;
    }
};

/** @brief Hashes a cell through its Morton code. */
struct CellKeyHash
{
    [[nodiscard]] core::usize operator()(const CellKey& key) const noexcept
    {
        return static_cast<core::usize>(math::morton::encode3D(key.x, key.y, key.z));
    }
};

/**
 * @class SpatialHashGrid
 * @brief Cell id → entity ids. An entity is listed in exactly the cells its
 *        current bounds touch. Cells are created on demand and erased once
 *        empty.
 *
 * Cell indices are clamped to ±kGridCellLimit; checkBounds() tells whether
 * a box fits without clamping.
 */
class SpatialHashGrid final : public core::NonCopyable<SpatialHashGrid>
{
public:
    /**
     * @brief Constructs an empty grid.
     * @param cellSize Side length of each cubic cell, > 0.
     */
    explicit SpatialHashGrid(core::f32 cellSize = core::kGridCellSize);
    ~SpatialHashGrid();

    SpatialHashGrid(SpatialHashGrid&&) noexcept;
    SpatialHashGrid& operator=(SpatialHashGrid&&) noexcept;

    void insertObject(core::EntityId id, const math::AABBf& bounds);
    void removeObject(core::EntityId id, const math::AABBf& bounds);

    /** @brief Moves @p id from the cells of @p oldBounds to those of @p newBounds,
     *         touching only the cells that differ. */
    void updateObject(core::EntityId id, const math::AABBf& newBounds, const math::AABBf& oldBounds);

    /**
     * @brief Ids sharing at least one cell with @p bounds, without @p id.
     * @return Unique ids in the order they are first met while walking the
     *         covered cells (x, then y, then z).
     */
    [[nodiscard]] std::vector<core::EntityId> findPotentialCollisions(
        core::EntityId id, const math::AABBf& bounds) const;

    /**
     * @brief Whether @p bounds can be indexed as-is.
     * @return kOutOfRange when a cell index would leave ±kGridCellLimit or the
     *         box covers more than kGridMaxCellsPerObject cells.
     */
    [[nodiscard]] core::ExpectedVoid checkBounds(const math::AABBf& bounds) const;

    [[nodiscard]] CellRange cellRange(const math::AABBf& bounds) const noexcept;
    [[nodiscard]] CellKey   cellOf(const math::Vec3f& point) const noexcept;

    /** @brief Ids listed in @p key, empty when the cell does not exist. */
    [[nodiscard]] std::span<const core::EntityId> cell(const CellKey& key) const;
    [[nodiscard]] bool contains(const CellKey& key, core::EntityId id) const;

    [[nodiscard]] core::usize cellCount() const noexcept;
    [[nodiscard]] core::f32   cellSize() const noexcept;

    void clear();

private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace sky::physics

#endif // SKY_PHYSICS_SPATIALHASHGRID_HPP
