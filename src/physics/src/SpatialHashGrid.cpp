/**
 * @file SpatialHashGrid.cpp
 * @brief Uniform spatial hash grid implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <sky/physics/SpatialHashGrid.hpp>
#include <sky/core/Assert.hpp>

#include <algorithm>
#include <cmath>
#include <format>
#include <unordered_map>
#include <unordered_set>

namespace sky::physics {

struct SpatialHashGrid::Impl
{
    core::f32                                                            cellSize;
    std::unordered_map<CellKey, std::vector<core::EntityId>, CellKeyHash> cells;

    explicit Impl(core::f32 cs) : cellSize{cs} {}

    [[nodiscard]] core::f64 rawCell(core::f32 v) const
    {
        return std::floor(static_cast<core::f64>(v) / cellSize);
    }

    [[nodiscard]] core::i32 toCell(core::f32 v) const
    {
        constexpr auto kLimit = static_cast<core::f64>(core::kGridCellLimit);

        const core::f64 c = rawCell(v);
        if (!(c > -kLimit))
            return -core::kGridCellLimit;
        if (c > kLimit)
            return core::kGridCellLimit;
        return static_cast<core::i32>(c);
    }

    template <typename Fn>
    static void forEachCell(const CellRange& range, Fn&& fn)
    {
        for (core::i32 cx = range.min.x; cx <= range.max.x; ++cx)
        {
            for (core::i32 cy = range.min.y; cy <= range.max.y; ++cy)
            {
                for (core::i32 cz = range.min.z; cz <= range.max.z; ++cz)
                {
                    fn(CellKey{cx, cy, cz});
                }
            }
        }
    }

    void addToCell(const CellKey& key, core::EntityId id)
    {
        auto& ids = cells[key];
        if (std::find(ids.begin(), ids.end(), id) == ids.end())
        {
            ids.push_back(id);
        }
    }

    void removeFromCell(const CellKey& key, core::EntityId id)
    {
        auto it = cells.find(key);
        if (it == cells.end())
        {
            return;
        }

        auto& ids = it->second;
        ids.erase(std::remove(ids.begin(), ids.end(), id), ids.end());
        if (ids.empty())
        {
            cells.erase(it);
        }
    }
};

SpatialHashGrid::SpatialHashGrid(core::f32 cellSize)
    : _impl{std::make_unique<Impl>(cellSize)}
{
    SKY_ASSERT(cellSize > 0.0f);
}

SpatialHashGrid::~SpatialHashGrid() = default;
SpatialHashGrid::SpatialHashGrid(SpatialHashGrid&&) noexcept = default;
SpatialHashGrid& SpatialHashGrid::operator=(SpatialHashGrid&&) noexcept = default;

CellKey SpatialHashGrid::cellOf(const math::Vec3f& point) const noexcept
{
    return {_impl->toCell(point.x), _impl->toCell(point.y), _impl->toCell(point.z)};
}

core::ExpectedVoid SpatialHashGrid::checkBounds(const math::AABBf& bounds) const
{
    constexpr auto kLimit = static_cast<core::f64>(core::kGridCellLimit);

    const core::f64 lo[3] = {_impl->rawCell(bounds.min.x), _impl->rawCell(bounds.min.y), _impl->rawCell(bounds.min.z)};
    const core::f64 hi[3] = {_impl->rawCell(bounds.max.x), _impl->rawCell(bounds.max.y), _impl->rawCell(bounds.max.z)};

    core::f64 cells = 1.0;
    for (int axis = 0; axis < 3; ++axis)
    {
        if (!(lo[axis] >= -kLimit) || !(hi[axis] <= kLimit))
        {
            return core::makeError(core::ErrorCode::kOutOfRange,
                std::format("bounds leave the grid cell range ±{}", core::kGridCellLimit));
        }
        cells *= hi[axis] - lo[axis] + 1.0;
    }

    if (cells > static_cast<core::f64>(core::kGridMaxCellsPerObject))
    {
        return core::makeError(core::ErrorCode::kOutOfRange,
            std::format("bounds cover {} cells, limit is {}", cells, core::kGridMaxCellsPerObject));
    }
    return {};
}

CellRange SpatialHashGrid::cellRange(const math::AABBf& bounds) const noexcept
{
    return {cellOf(bounds.min), cellOf(bounds.max)};
}

void SpatialHashGrid::insertObject(core::EntityId id, const math::AABBf& bounds)
{
    Impl::forEachCell(cellRange(bounds), [&](const CellKey& key) { _impl->addToCell(key, id); });
}

void SpatialHashGrid::removeObject(core::EntityId id, const math::AABBf& bounds)
{
    Impl::forEachCell(cellRange(bounds), [&](const CellKey& key) { _impl->removeFromCell(key, id); });
}

void SpatialHashGrid::updateObject(core::EntityId id, const math::AABBf& newBounds, const math::AABBf& oldBounds)
{
    const CellRange oldRange = cellRange(oldBounds);
    const CellRange newRange = cellRange(newBounds);

    Impl::forEachCell(oldRange, [&](const CellKey& key) {
        if (!newRange.contains(key))
            _impl->removeFromCell(key, id);
    });
    Impl::forEachCell(newRange, [&](const CellKey& key) {
        if (!oldRange.contains(key))
            _impl->addToCell(key, id);
    });
}

std::vector<core::EntityId> SpatialHashGrid::findPotentialCollisions(
    core::EntityId id, const math::AABBf& bounds) const
{
    std::vector<core::EntityId> result;
    std::unordered_set<core::EntityId> seen;

    Impl::forEachCell(cellRange(bounds), [&](const CellKey& key) {
        auto it = _impl->cells.find(key);
        if (it == _impl->cells.end())
            return;

        for (core::EntityId other : it->second)
        {
            if (other != id && seen.insert(other).second)
                result.push_back(other);
        }
    });
    return result;
}

std::span<const core::EntityId> SpatialHashGrid::cell(const CellKey& key) const
{
    auto it = _impl->cells.find(key);
    if (it == _impl->cells.end())
    {
        return {};
    }
    return it->second;
}

bool SpatialHashGrid::contains(const CellKey& key, core::EntityId id) const
{
    const auto ids = cell(key);
    return std::find(ids.begin(), ids.end(), id) != ids.end();
}

core::usize SpatialHashGrid::cellCount() const noexcept
{
    return _impl->cells.size();
}

core::f32 SpatialHashGrid::cellSize() const noexcept
{
    return _impl->cellSize;
}

void SpatialHashGrid::clear()
{
    _impl->cells.clear();
}

} // namespace sky::physics
