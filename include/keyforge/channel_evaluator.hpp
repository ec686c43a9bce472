#pragma once

#include <cstdint>
#include <keyforge/animation_types.hpp>
#include <optional>
#include <vector>

namespace keyforge
{

// Evaluate a channel at `time`. Pure; safe to call concurrently on a channel
// nobody is mutating.
//
//   - no keys:                     nullopt
//   - one key, or time outside:    value of the nearest boundary key (no extrapolation)
//   - NaN time:                    value of the first key
//   - segment with seg_ease:       procedural curve, tangents and interp ignored
//   - Step:                        holds the segment's first value
//   - either endpoint Bezier:      cubic Hermite; missing tangents use the segment slope
//   - otherwise:                   linear
//
// The channel must be sorted by time.
std::optional<float> evaluate_channel(const Channel& channel, float time);

// Evaluate the segment [k0, k1] at local parameter u in [0, 1].
float evaluate_segment(const Key& k0, const Key& k1, float u);

// Cubic Hermite basis interpolation between (v0, m0) and (v1, m1) over a
// segment of length dt.
float hermite(float v0, float m0, float v1, float m1, float dt, float u);

// Sample `count` evenly spaced values over [start, end] for curve display.
// Empty for a channel with no keys. Non-finite bounds yield boundary values.
std::vector<float> sample_channel(const Channel& channel, float start, float end, uint32_t count);

}  // namespace keyforge
