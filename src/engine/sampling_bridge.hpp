#pragma once

#include <keyforge/animation_types.hpp>
#include <keyforge/scene_sink.hpp>
#include <string>
#include <vector>

namespace keyforge
{

// Holds the engine's "sampling in progress" flag for its lifetime. While held,
// property edits reported by the scene are programmatic writes and must not
// be recorded as keys. Restores the previous value on every exit path, so
// nested guards are harmless.
class SamplingGuard
{
   public:
    explicit SamplingGuard(bool& flag) : flag_(flag), previous_(flag) { flag_ = true; }
    ~SamplingGuard() { flag_ = previous_; }

    SamplingGuard(const SamplingGuard&)            = delete;
    SamplingGuard& operator=(const SamplingGuard&) = delete;

   private:
    bool& flag_;
    bool  previous_;
};

// One evaluated track.
struct TrackSample
{
    const Track* track = nullptr;
    float        value = 0.0f;
};

// Every update for one scene object, merged into one write per sink kind.
struct TargetBatch
{
    std::string                target_id;
    TransformPatch             transform;
    std::vector<ModifierPatch> modifiers;  // first-seen order
    SimulationPatch            simulation;
};

// Group samples by target in first-seen order. Tracks whose property path did
// not parse are dropped. Simulation values are clamped to their valid ranges.
std::vector<TargetBatch> batch_samples(const std::vector<TrackSample>& samples);

// Write each batch: transform, then each modifier, then simulation
// parameters. Empty parts are not written.
void dispatch_batches(const std::vector<TargetBatch>& batches, SceneSink& sink);

}  // namespace keyforge
