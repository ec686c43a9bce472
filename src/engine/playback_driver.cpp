#include <cmath>
#include <keyforge/animation_engine.hpp>
#include <keyforge/logger.hpp>
#include <keyforge/playback_driver.hpp>

namespace keyforge
{

PlaybackDriver::PlaybackDriver(AnimationEngine& engine) : engine_(engine) {}

void PlaybackDriver::reset()
{
    last_applied_.reset();
    sync_accum_ = 0.0f;
}

void PlaybackDriver::apply(float time)
{
    engine_.apply_sample_at(time);
    last_applied_ = time;
}

void PlaybackDriver::sync(float time)
{
    sync_accum_ = 0.0f;
    if (on_sync_)
        on_sync_(time);
}

void PlaybackDriver::tick(float dt)
{
    if (!engine_.active_clip())
        return;
    if (!std::isfinite(dt) || dt < 0.0f)
        dt = 0.0f;

    if (!engine_.is_playing())
    {
        sync_accum_ = 0.0f;
        float t     = engine_.playhead();
        if (!last_applied_ || *last_applied_ != t)
            apply(t);
        return;
    }

    bool still_playing = engine_.advance(dt);
    float t            = engine_.playhead();
    apply(t);

    if (!still_playing)
    {
        KEYFORGE_LOG_DEBUG("anim.playback", "reached clip end at {}", t);
        sync(t);
        return;
    }

    sync_accum_ += dt;
    if (sync_accum_ >= engine_.config().ui_sync_interval)
        sync(t);
}

}  // namespace keyforge
