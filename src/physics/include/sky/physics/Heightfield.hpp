/**
 * @file Heightfield.hpp
 * @brief Dense 2D grid of terrain height samples.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef SKY_PHYSICS_HEIGHTFIELD_HPP
    #define SKY_PHYSICS_HEIGHTFIELD_HPP

#include <sky/core/Expected.hpp>
#include <sky/core/Types.hpp>

#include <vector>

namespace sky::physics {

/**
 * @class Heightfield
 * @brief Height samples indexed by (x, z) sample coordinates.
 *
 * Samples are stored x-major: sample (xi, zi) lives at xi * depth + zi.
 */
class Heightfield
{
public:
    /**
     * @brief Builds a flat heightfield.
     * @param width Number of samples along X.
     * @param depth Number of samples along Z.
     * @param fill  Initial height of every sample.
     */
    Heightfield(core::usize width, core::usize depth, core::f32 fill = 0.0f);

    /**
     * @brief Builds a heightfield from x-major samples.
     * @return kInvalidArgument if @p samples does not hold width * depth values.
     */
    [[nodiscard]] static core::Expected<Heightfield> fromSamples(
        core::usize width, core::usize depth, std::vector<core::f32> samples);

    /**
     * @brief Builds a heightfield from rows, rows[xi][zi].
     * @return kInvalidArgument for ragged rows.
     */
    [[nodiscard]] static core::Expected<Heightfield> fromRows(
        const std::vector<std::vector<core::f32>>& rows);

    [[nodiscard]] core::usize width() const noexcept { return _width; }
    [[nodiscard]] core::usize depth() const noexcept { return _depth; }
    [[nodiscard]] bool        empty() const noexcept { return _samples.empty(); }

    /** @brief True when (xi, zi) addresses a sample. */
    [[nodiscard]] bool inRange(core::i64 xi, core::i64 zi) const noexcept;

    [[nodiscard]] core::f32 at(core::usize xi, core::usize zi) const;
    void set(core::usize xi, core::usize zi, core::f32 height);

private:
    core::usize            _width;
    core::usize            _depth;
    std::vector<core::f32> _samples;
};

} // namespace sky::physics

#endif // SKY_PHYSICS_HEIGHTFIELD_HPP
