#pragma once

#include <keyforge/animation_types.hpp>

namespace keyforge
{

namespace ease
{

inline constexpr float MAX_STRENGTH = 3.0f;

float clamp_strength(float strength);

// Four-tier piecewise quadratic bounce.
float bounce_out(float x);
float bounce_in(float x);
float bounce_in_out(float x);

// Exponentially decaying sinusoid. Higher strength shortens the period and
// therefore the settle time. Exact at x = 0 and x = 1.
float elastic_out(float x, float strength);
float elastic_in(float x, float strength);
float elastic_in_out(float x, float strength);

// Maps a local segment parameter u in [0, 1] through the segment curve.
// Returns exactly 0 at u <= 0 and exactly 1 at u >= 1 for every kind and mode.
float apply_segment_ease(const SegmentEase& ease, float u);

}  // namespace ease

}  // namespace keyforge
