/**
 * @file Heightfield.cpp
 * @brief Heightfield storage.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <sky/physics/Heightfield.hpp>
#include <sky/core/Assert.hpp>

#include <format>

namespace sky::physics {

Heightfield::Heightfield(core::usize width, core::usize depth, core::f32 fill)
    : _width{width}, _depth{depth}, _samples(width * depth, fill)
{}

core::Expected<Heightfield> Heightfield::fromSamples(
    core::usize width, core::usize depth, std::vector<core::f32> samples)
{
    if (samples.size() != width * depth)
    {
        return core::makeError(core::ErrorCode::kInvalidArgument,
            std::format("heightfield: expected {}x{} samples, got {}", width, depth, samples.size()));
    }

    Heightfield hf{0, 0};
    hf._width   = width;
    hf._depth   = depth;
    hf._samples = std::move(samples);
    return hf;
}

core::Expected<Heightfield> Heightfield::fromRows(const std::vector<std::vector<core::f32>>& rows)
{
    const core::usize width = rows.size();
    const core::usize depth = rows.empty() ? 0 : rows.front().size();

    std::vector<core::f32> samples;
    samples.reserve(width * depth);
    for (const auto& row : rows)
    {
        if (row.size() != depth)
        {
            return core::makeError(core::ErrorCode::kInvalidArgument, "heightfield: ragged rows");
        }
        samples.insert(samples.end(), row.begin(), row.end());
    }
    return fromSamples(width, depth, std::move(samples));
}

bool Heightfield::inRange(core::i64 xi, core::i64 zi) const noexcept
{
    return xi >= 0 && zi >= 0
        && static_cast<core::usize>(xi) < _width
        && static_cast<core::usize>(zi) < _depth;
}

core::f32 Heightfield::at(core::usize xi, core::usize zi) const
{
    SKY_ASSERT_MSG(xi < _width && zi < _depth, "heightfield sample index out of range");
    return _samples[xi * _depth + zi];
}

void Heightfield::set(core::usize xi, core::usize zi, core::f32 height)
{
    SKY_ASSERT_MSG(xi < _width && zi < _depth, "heightfield sample index out of range");
    _samples[xi * _depth + zi] = height;
}

} // namespace sky::physics
