#include <algorithm>
#include <cmath>
#include <keyforge/easing.hpp>

namespace keyforge::ease
{

namespace
{
constexpr float PI = 3.14159265358979323846f;

constexpr float MIN_ELASTIC_PERIOD = 1e-3f;

// Angular frequency of the elastic oscillation. `base` is 0.3 for the
// one-sided curves and 0.45 for in-out. The period passes through zero at
// strength 2.5 for the one-sided curves; its magnitude is floored there and
// the sign kept.
float elastic_frequency(float base, float strength)
{
    float period = base + 0.2f * (1.0f - clamp_strength(strength));
    period       = std::copysign(std::max(std::fabs(period), MIN_ELASTIC_PERIOD), period);
    return (2.0f * PI) / period;
}
}  // anonymous namespace

float clamp_strength(float strength)
{
    if (!std::isfinite(strength))
        return 1.0f;
    return std::clamp(strength, 0.0f, MAX_STRENGTH);
}

float bounce_out(float x)
{
    constexpr float n1 = 7.5625f;
    constexpr float d1 = 2.75f;

    if (x < 1.0f / d1)
    {
        return n1 * x * x;
    }
    else if (x < 2.0f / d1)
    {
        x -= 1.5f / d1;
        return n1 * x * x + 0.75f;
    }
    else if (x < 2.5f / d1)
    {
        x -= 2.25f / d1;
        return n1 * x * x + 0.9375f;
    }
    else
    {
        x -= 2.625f / d1;
        return n1 * x * x + 0.984375f;
    }
}

float bounce_in(float x)
{
    return 1.0f - bounce_out(1.0f - x);
}

float bounce_in_out(float x)
{
    if (x < 0.5f)
        return (1.0f - bounce_out(1.0f - 2.0f * x)) / 2.0f;
    return (1.0f + bounce_out(2.0f * x - 1.0f)) / 2.0f;
}

float elastic_out(float x, float strength)
{
    if (x <= 0.0f || x >= 1.0f)
        return std::clamp(x, 0.0f, 1.0f);
    float c = elastic_frequency(0.3f, strength);
    return std::pow(2.0f, -10.0f * x) * std::sin((x - 0.075f) * c) + 1.0f;
}

float elastic_in(float x, float strength)
{
    if (x <= 0.0f || x >= 1.0f)
        return std::clamp(x, 0.0f, 1.0f);
    float c = elastic_frequency(0.3f, strength);
    return -std::pow(2.0f, 10.0f * x - 10.0f) * std::sin((x - 0.075f) * c);
}

float elastic_in_out(float x, float strength)
{
    if (x <= 0.0f || x >= 1.0f)
        return std::clamp(x, 0.0f, 1.0f);
    float c = elastic_frequency(0.45f, strength);
    if (x < 0.5f)
        return -(std::pow(2.0f, 20.0f * x - 10.0f) * std::sin((20.0f * x - 11.125f) * c)) / 2.0f;
    return (std::pow(2.0f, -20.0f * x + 10.0f) * std::sin((20.0f * x - 11.125f) * c)) / 2.0f
           + 1.0f;
}

float apply_segment_ease(const SegmentEase& ease, float u)
{
    if (u <= 0.0f)
        return 0.0f;
    if (u >= 1.0f)
        return 1.0f;

    switch (ease.kind)
    {
        case SegmentEaseKind::Bounce:
            switch (ease.mode)
            {
                case SegmentEaseMode::In:
                    return bounce_in(u);
                case SegmentEaseMode::InOut:
                    return bounce_in_out(u);
                case SegmentEaseMode::Out:
                    return bounce_out(u);
            }
            break;
        case SegmentEaseKind::Elastic:
            switch (ease.mode)
            {
                case SegmentEaseMode::In:
                    return elastic_in(u, ease.strength);
                case SegmentEaseMode::InOut:
                    return elastic_in_out(u, ease.strength);
                case SegmentEaseMode::Out:
                    return elastic_out(u, ease.strength);
            }
            break;
    }
    return u;
}

}  // namespace keyforge::ease
