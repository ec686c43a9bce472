#include <algorithm>
#include <cassert>
#include <cmath>
#include <keyforge/channel_evaluator.hpp>
#include <keyforge/easing.hpp>

namespace keyforge
{

float hermite(float v0, float m0, float v1, float m1, float dt, float u)
{
    float u2 = u * u;
    float u3 = u2 * u;

    float h00 = 2.0f * u3 - 3.0f * u2 + 1.0f;
    float h10 = u3 - 2.0f * u2 + u;
    float h01 = -2.0f * u3 + 3.0f * u2;
    float h11 = u3 - u2;

    return h00 * v0 + h10 * dt * m0 + h01 * v1 + h11 * dt * m1;
}

float evaluate_segment(const Key& k0, const Key& k1, float u)
{
    if (k0.seg_ease)
    {
        float eased = ease::apply_segment_ease(*k0.seg_ease, u);
        return k0.value + (k1.value - k0.value) * eased;
    }

    if (k0.interp == Interpolation::Step)
        return k0.value;

    if (k0.interp == Interpolation::Bezier || k1.interp == Interpolation::Bezier)
    {
        float dt    = std::max(1e-6f, k1.time - k0.time);
        float slope = (k1.value - k0.value) / dt;
        float m0    = k0.tangent_out.value_or(slope);
        float m1    = k1.tangent_in.value_or(slope);
        return hermite(k0.value, m0, k1.value, m1, dt, u);
    }

    return k0.value * (1.0f - u) + k1.value * u;
}

std::optional<float> evaluate_channel(const Channel& channel, float time)
{
    const auto& keys = channel.keys;
    if (keys.empty())
        return std::nullopt;

    assert(channel.is_sorted() && "channel keys must be sorted by time");

    // NaN fails both boundary tests below; treat it as the start.
    if (keys.size() == 1 || std::isnan(time) || time <= keys.front().time)
        return keys.front().value;
    if (time >= keys.back().time)
        return keys.back().value;

    // First key strictly after `time`; the segment is [it - 1, it). A time that
    // lands exactly on an interior key therefore starts that key's segment at
    // u = 0 and reproduces the key's value exactly.
    auto it = std::upper_bound(keys.begin(),
                               keys.end(),
                               time,
                               [](float t, const Key& k) { return t < k.time; });
    const Key& k1 = *it;
    const Key& k0 = *(it - 1);

    float span = k1.time - k0.time;
    if (span <= 0.0f)
        return k0.value;

    float u = (time - k0.time) / span;
    return evaluate_segment(k0, k1, u);
}

std::vector<float> sample_channel(const Channel& channel, float start, float end, uint32_t count)
{
    std::vector<float> result;
    if (count == 0 || channel.empty())
        return result;
    result.reserve(count);

    if (count == 1)
    {
        result.push_back(*evaluate_channel(channel, start));
        return result;
    }

    float step = (end - start) / static_cast<float>(count - 1);
    for (uint32_t i = 0; i < count; ++i)
    {
        float t = start + step * static_cast<float>(i);
        result.push_back(*evaluate_channel(channel, t));
    }
    return result;
}

}  // namespace keyforge
