#include <cmath>
#include <keyforge/frame_time.hpp>
#include <keyforge/snap_resolver.hpp>

namespace keyforge
{

SnapResolver::SnapResolver(const SnapSettings& settings, int fps, float zoom)
    : settings_(settings), fps_(clamp_fps(static_cast<float>(fps))), zoom_(zoom)
{
}

void SnapResolver::add_candidate(float time)
{
    candidates_.push_back(time);
}

void SnapResolver::add_candidates(const std::vector<float>& times)
{
    candidates_.insert(candidates_.end(), times.begin(), times.end());
}

float SnapResolver::key_threshold() const
{
    if (!settings_.enabled || !settings_.to_keys || !(zoom_ > 0.0f))
        return 0.0f;
    return settings_.threshold_px / zoom_;
}

std::optional<float> SnapResolver::nearest_key(float time) const
{
    float threshold = key_threshold();
    if (threshold <= 0.0f)
        return std::nullopt;

    std::optional<float> best;
    float                best_dist = threshold;
    for (float c : candidates_)
    {
        float d = std::fabs(c - time);
        if (d <= best_dist && (!best || d < best_dist))
        {
            best      = c;
            best_dist = d;
        }
    }
    return best;
}

float SnapResolver::resolve(float time) const
{
    if (!settings_.enabled)
        return time;
    if (auto key = nearest_key(time))
        return *key;
    if (settings_.to_frames)
        return quantize_to_frame(time, fps_);
    return time;
}

}  // namespace keyforge
