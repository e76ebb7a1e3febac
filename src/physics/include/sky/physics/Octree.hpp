/**
 * @file Octree.hpp
 * @brief Bounded, incrementally subdivided octree over static terrain.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef SKY_PHYSICS_OCTREE_HPP
    #define SKY_PHYSICS_OCTREE_HPP

#include <sky/math/AABB.hpp>
#include <sky/core/Constants.hpp>
#include <sky/core/NonCopyable.hpp>
#include <sky/core/Types.hpp>

#include <memory>
#include <vector>

namespace sky::physics {

/**
 * @class Octree
 * @brief Flat node array octree. A leaf splits into 8 equal octants once it
 *        holds more than @c maxObjectsPerLeaf items, unless it already sits
 *        at @c maxDepth.
 *
 * An item straddling several octants is stored in every one of them, so
 * queries are conservative and may report the same item more than once.
 * Items entirely outside the world bounds are not stored.
 */
class Octree final : public core::NonCopyable<Octree>
{
public:
    /** @brief Stored entry: owner id and its bounds. */
    struct Item
    {
        core::EntityId id{0};
        math::AABBf    bounds{};
    };

    /**
     * @brief Constructs an octree covering @p worldBounds.
     * @param worldBounds       Root node bounds.
     * @param maxDepth          Depth at which leaves stop splitting.
     * @param maxObjectsPerLeaf Leaf capacity before a split.
     */
    Octree(const math::AABBf& worldBounds,
           core::u32 maxDepth = core::kOctreeMaxDepth,
           core::u32 maxObjectsPerLeaf = core::kOctreeLeafCapacity);
    ~Octree();

    Octree(Octree&&) noexcept;
    Octree& operator=(Octree&&) noexcept;

    void insert(const Item& item);

    /**
     * @brief Appends every item stored in a leaf reachable through nodes
     *        intersecting @p queryBounds.
     *
     * Items are not filtered against @p queryBounds and duplicates across
     * leaves are kept.
     */
    void queryPotentialCollisions(const math::AABBf& queryBounds, std::vector<Item>& out) const;

    /** @brief Drops every item and collapses back to a single empty leaf. */
    void clear();

    [[nodiscard]] core::usize nodeCount() const noexcept;
    [[nodiscard]] core::usize leafCount() const noexcept;
    [[nodiscard]] core::usize storedCount() const noexcept;
    [[nodiscard]] const math::AABBf& bounds() const noexcept;
    [[nodiscard]] core::u32 maxDepth() const noexcept;
    [[nodiscard]] core::u32 maxObjectsPerLeaf() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace sky::physics

#endif // SKY_PHYSICS_OCTREE_HPP
