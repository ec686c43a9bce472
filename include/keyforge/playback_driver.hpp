#pragma once

#include <functional>
#include <keyforge/fwd.hpp>
#include <optional>

namespace keyforge
{

// Drives an AnimationEngine from the host's frame loop.
//
// Each tick while playing advances the playhead, then applies the sample for
// the new time before returning, so a frame never shows a partial update.
// While paused or stopped the sample is re-applied only when the playhead
// moved since the last application (scrubbing).
//
// The playhead sync callback is rate limited to one call per
// EngineConfig::ui_sync_interval while playing, and fires immediately when
// playback stops at the clip end.
class PlaybackDriver
{
   public:
    using PlayheadSyncCallback = std::function<void(float time)>;

    explicit PlaybackDriver(AnimationEngine& engine);
    ~PlaybackDriver() = default;

    PlaybackDriver(const PlaybackDriver&)            = delete;
    PlaybackDriver& operator=(const PlaybackDriver&) = delete;

    // dt: elapsed wall time in seconds since the previous tick.
    void tick(float dt);

    // Forget the last applied time so the next tick re-applies.
    void reset();

    std::optional<float> last_applied_time() const { return last_applied_; }

    void set_on_playhead_sync(PlayheadSyncCallback cb) { on_sync_ = std::move(cb); }

    AnimationEngine& engine() { return engine_; }

   private:
    AnimationEngine&     engine_;
    std::optional<float> last_applied_;
    float                sync_accum_ = 0.0f;
    PlayheadSyncCallback on_sync_;

    void apply(float time);
    void sync(float time);
};

}  // namespace keyforge
