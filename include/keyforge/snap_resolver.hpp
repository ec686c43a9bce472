#pragma once

#include <keyforge/animation_types.hpp>
#include <optional>
#include <vector>

namespace keyforge
{

// Turns a raw continuous time into a snapped one. Shared by playhead seeks
// and key drags so both snap identically.
//
// With snapping enabled, a candidate key time within threshold_px / zoom
// seconds of the raw time wins (closest first, ties go to the candidate added
// first). Otherwise, with frame snapping on, the time is quantized to the
// nearest frame boundary.
class SnapResolver
{
   public:
    SnapResolver(const SnapSettings& settings, int fps, float zoom);

    void add_candidate(float time);
    void add_candidates(const std::vector<float>& times);
    size_t candidate_count() const { return candidates_.size(); }

    // Snap threshold in seconds (0 when key snapping is off).
    float key_threshold() const;

    // Closest candidate within the key threshold, if any.
    std::optional<float> nearest_key(float time) const;

    float resolve(float time) const;

   private:
    SnapSettings       settings_;
    int                fps_;
    float              zoom_;
    std::vector<float> candidates_;
};

}  // namespace keyforge
