/**
 * @file Octree.cpp
 * @brief Flat-array octree with incremental leaf subdivision.
 *
 *   - Flat node array: children of a node are 8 consecutive entries
 *   - Octant order: lower Y layer first, then X, then Z within a layer
 *   - Query: recursive traversal with early AABB rejection
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <sky/physics/Octree.hpp>
#include <sky/core/Assert.hpp>
#include <sky/core/Log.hpp>

#include <format>
#include <utility>

namespace sky::physics {

// ========================================================================== //
//  Impl - Flat node tree                                                     //
// ========================================================================== //

struct Octree::Impl
{
    struct FlatNode
    {
        math::AABBf       bound;
        core::u32         depth{0};
        core::i32         firstChild{-1};
        std::vector<Item> items;

        [[nodiscard]] bool isLeaf() const noexcept { return firstChild < 0; }
    };

    math::AABBf           worldBounds;
    core::u32             maxDepth;
    core::u32             maxObjectsPerLeaf;
    std::vector<FlatNode> nodes;

    Impl(const math::AABBf& wb, core::u32 depth, core::u32 capacity)
        : worldBounds{wb}, maxDepth{depth}, maxObjectsPerLeaf{capacity}
    {
        reset();
    }

    void reset()
    {
        nodes.clear();
        nodes.push_back(FlatNode{worldBounds, 0, -1, {}});
    }

    // ────────────────────────────────────────────────────────────────────── //
    //  Insertion                                                             //
    // ────────────────────────────────────────────────────────────────────── //

    void insertAt(core::u32 nodeIdx, const Item& item)
    {
        if (!nodes[nodeIdx].isLeaf())
        {
            const auto first = static_cast<core::u32>(nodes[nodeIdx].firstChild);
            for (core::u32 octant = 0; octant < 8; ++octant)
            {
                if (nodes[first + octant].bound.intersects(item.bounds))
                {
                    insertAt(first + octant, item);
                }
            }
            return;
        }

        auto& leaf = nodes[nodeIdx];
        leaf.items.push_back(item);

        if (leaf.items.size() <= maxObjectsPerLeaf)
        {
            return;
        }

        if (leaf.depth < maxDepth)
        {
            subdivide(nodeIdx);
        }
        else if (leaf.items.size() == static_cast<core::usize>(maxObjectsPerLeaf) + 1)
        {
            core::Log::debug("physics", std::format(
                "octree: leaf at max depth {} exceeds capacity {}", maxDepth, maxObjectsPerLeaf));
        }
    }

    /**
     * @brief Turns leaf @p nodeIdx into an internal node with 8 children and
     *        redistributes its items into every child they intersect.
     */
    void subdivide(core::u32 nodeIdx)
    {
        const math::AABBf parent = nodes[nodeIdx].bound;
        const core::u32 childDepth = nodes[nodeIdx].depth + 1;
        std::vector<Item> held = std::move(nodes[nodeIdx].items);
        nodes[nodeIdx].items.clear();

        const auto mid = parent.center();
        const auto& mn = parent.min;
        const auto& mx = parent.max;

        const auto firstChildIdx = static_cast<core::u32>(nodes.size());
        nodes.resize(firstChildIdx + 8);
        nodes[nodeIdx].firstChild = static_cast<core::i32>(firstChildIdx);

        for (core::u32 octant = 0; octant < 8; ++octant)
        {
            math::Vec3f childMin, childMax;

            // X axis (bit 0)
            if (octant & 1) { childMin.x = mid.x; childMax.x = mx.x; }
            else            { childMin.x = mn.x;  childMax.x = mid.x; }

            // Z axis (bit 1)
            if (octant & 2) { childMin.z = mid.z; childMax.z = mx.z; }
            else            { childMin.z = mn.z;  childMax.z = mid.z; }

            // Y axis (bit 2)
            if (octant & 4) { childMin.y = mid.y; childMax.y = mx.y; }
            else            { childMin.y = mn.y;  childMax.y = mid.y; }

            auto& child = nodes[firstChildIdx + octant];
            child.bound = {childMin, childMax};
            child.depth = childDepth;
        }

        for (const auto& item : held)
        {
            for (core::u32 octant = 0; octant < 8; ++octant)
            {
                if (nodes[firstChildIdx + octant].bound.intersects(item.bounds))
                {
                    insertAt(firstChildIdx + octant, item);
                }
            }
        }
    }

    // ────────────────────────────────────────────────────────────────────── //
    //  Query                                                                 //
    // ────────────────────────────────────────────────────────────────────── //

    void queryRecursive(core::u32 nodeIdx, const math::AABBf& region, std::vector<Item>& out) const
    {
        const auto& node = nodes[nodeIdx];
        if (!node.bound.intersects(region))
        {
            return;
        }

        if (node.isLeaf())
        {
            out.insert(out.end(), node.items.begin(), node.items.end());
            return;
        }

        const auto first = static_cast<core::u32>(node.firstChild);
        for (core::u32 octant = 0; octant < 8; ++octant)
        {
            queryRecursive(first + octant, region, out);
        }
    }
};

// ========================================================================== //
//  Public API                                                                //
// ========================================================================== //

Octree::Octree(const math::AABBf& worldBounds, core::u32 maxDepth, core::u32 maxObjectsPerLeaf)
    : _impl{std::make_unique<Impl>(worldBounds, maxDepth, maxObjectsPerLeaf)}
{
    SKY_ASSERT(worldBounds.isValid());
    SKY_ASSERT(maxObjectsPerLeaf > 0);
}

Octree::~Octree() = default;
Octree::Octree(Octree&&) noexcept = default;
Octree& Octree::operator=(Octree&&) noexcept = default;

void Octree::insert(const Item& item)
{
    if (!_impl->worldBounds.intersects(item.bounds))
    {
        core::Log::debug("physics", std::format("octree: item {} lies outside the world bounds", item.id));
        return;
    }
    _impl->insertAt(0, item);
}

void Octree::queryPotentialCollisions(const math::AABBf& queryBounds, std::vector<Item>& out) const
{
    _impl->queryRecursive(0, queryBounds, out);
}

void Octree::clear()
{
    _impl->reset();
}

core::usize Octree::nodeCount() const noexcept
{
    return _impl->nodes.size();
}

core::usize Octree::leafCount() const noexcept
{
    core::usize count = 0;
    for (const auto& node : _impl->nodes)
    {
        if (node.isLeaf())
            ++count;
    }
    return count;
}

core::usize Octree::storedCount() const noexcept
{
    core::usize count = 0;
    for (const auto& node : _impl->nodes)
        count += node.items.size();
    return count;
}

const math::AABBf& Octree::bounds() const noexcept
{
    return _impl->worldBounds;
}

core::u32 Octree::maxDepth() const noexcept
{
    return _impl->maxDepth;
}

core::u32 Octree::maxObjectsPerLeaf() const noexcept
{
    return _impl->maxObjectsPerLeaf;
}

} // namespace sky::physics
