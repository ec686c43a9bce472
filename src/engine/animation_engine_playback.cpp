#include <algorithm>
#include <cmath>
#include <keyforge/animation_engine.hpp>
#include <keyforge/channel_evaluator.hpp>
#include <keyforge/frame_time.hpp>
#include <keyforge/logger.hpp>
#include <keyforge/scene_sink.hpp>
#include <limits>

#include "engine/sampling_bridge.hpp"

namespace keyforge
{

// ─── State ───────────────────────────────────────────────────────────────────

void AnimationEngine::set_state(PlaybackState state)
{
    if (state_ == state)
        return;
    state_ = state;
    KEYFORGE_LOG_DEBUG("anim.playback", "playback {}", playback_state_name(state));
    if (on_playback_change_)
        on_playback_change_(state);
}

std::pair<float, float> AnimationEngine::playback_window() const
{
    if (const Clip* c = active_clip())
        return {c->start, c->end};
    return {0.0f, std::numeric_limits<float>::max()};
}

void AnimationEngine::clamp_playhead()
{
    auto [lo, hi] = playback_window();
    playhead_     = std::clamp(playhead_, lo, hi);
}

void AnimationEngine::play()
{
    set_state(PlaybackState::Playing);
}

void AnimationEngine::pause()
{
    set_state(PlaybackState::Paused);
}

void AnimationEngine::stop()
{
    const Clip* c = active_clip();
    playhead_     = c ? c->start : 0.0f;
    set_state(PlaybackState::Stopped);
}

void AnimationEngine::toggle_play()
{
    if (state_ == PlaybackState::Playing)
        pause();
    else
        play();
}

void AnimationEngine::toggle_loop()
{
    if (Clip* c = active_clip_mut())
        c->loop = !c->loop;
}

void AnimationEngine::set_fps(float fps)
{
    fps_           = clamp_fps(fps);
    last_used_fps_ = fps_;
}

// ─── Playhead ────────────────────────────────────────────────────────────────

void AnimationEngine::set_playhead(float time)
{
    if (!std::isfinite(time))
        return;
    playhead_ = time;
    clamp_playhead();
}

void AnimationEngine::seek_seconds(float time)
{
    if (!std::isfinite(time))
        return;
    auto [lo, hi] = playback_window();
    playhead_     = std::clamp(snap_time(std::clamp(time, lo, hi)), lo, hi);
}

void AnimationEngine::seek_frame(int64_t frame)
{
    seek_seconds(frame_to_time(frame, fps_));
}

void AnimationEngine::step_forward()
{
    int64_t frame = time_to_frame(playhead_, fps_) + 1;
    set_playhead(frame_to_time(frame, fps_));
}

void AnimationEngine::step_backward()
{
    int64_t frame = std::max<int64_t>(0, time_to_frame(playhead_, fps_) - 1);
    set_playhead(frame_to_time(frame, fps_));
}

void AnimationEngine::prev_key()
{
    auto [lo, hi] = playback_window();
    std::optional<float> best;
    for (const auto& [id, tr] : tracks_)
    {
        for (const auto& k : tr.channel.keys)
        {
            if (k.time < playhead_ && k.time >= lo && k.time <= hi && (!best || k.time > *best))
                best = k.time;
        }
    }
    if (best)
        playhead_ = *best;
}

void AnimationEngine::next_key()
{
    auto [lo, hi] = playback_window();
    std::optional<float> best;
    for (const auto& [id, tr] : tracks_)
    {
        for (const auto& k : tr.channel.keys)
        {
            if (k.time > playhead_ && k.time >= lo && k.time <= hi && (!best || k.time < *best))
                best = k.time;
        }
    }
    if (best)
        playhead_ = *best;
}

bool AnimationEngine::advance(float dt)
{
    if (state_ != PlaybackState::Playing)
        return false;
    const Clip* c = active_clip();
    if (!c || !std::isfinite(dt))
        return is_playing();

    float t = playhead_ + dt * c->speed;
    if (t > c->end)
    {
        if (c->loop)
        {
            float span = std::max(1e-6f, c->end - c->start);
            t          = c->start + std::fmod(t - c->start, span);
        }
        else
        {
            t = c->end;
            set_state(PlaybackState::Paused);
        }
    }
    if (t < c->start)
        t = c->start;

    playhead_ = std::clamp(quantize_to_frame(t, fps_), c->start, c->end);
    return is_playing();
}

// ─── Sampling ────────────────────────────────────────────────────────────────

namespace
{

std::vector<TrackSample> collect_samples(const Clip&                     clip,
                                         const std::map<TrackId, Track>& tracks,
                                         const std::set<TrackId>&        solo,
                                         float                           time)
{
    std::vector<TrackSample> out;
    float t = std::clamp(time, clip.start, clip.end);
    for (TrackId tid : clip.track_ids)
    {
        if (!solo.empty() && !solo.contains(tid))
            continue;
        auto it = tracks.find(tid);
        if (it == tracks.end())
            continue;
        const Track& tr = it->second;
        // Solo overrides mute.
        if (solo.empty() && tr.muted)
            continue;
        if (auto v = evaluate_channel(tr.channel, t))
            out.push_back({&tr, *v});
    }
    return out;
}

}  // anonymous namespace

std::vector<SampleUpdate> AnimationEngine::sample_at(float time) const
{
    std::vector<SampleUpdate> updates;
    const Clip*               c = active_clip();
    if (!c || !std::isfinite(time))
        return updates;

    for (const auto& s : collect_samples(*c, tracks_, solo_track_ids_, time))
        updates.push_back({s.track->target_id, s.track->property, s.value});
    return updates;
}

void AnimationEngine::apply_sample_at(float time)
{
    const Clip* c = active_clip();
    if (!c || !scene_sink_ || !std::isfinite(time))
        return;

    auto batches = batch_samples(collect_samples(*c, tracks_, solo_track_ids_, time));
    if (batches.empty())
        return;

    SamplingGuard guard(sampling_);
    dispatch_batches(batches, *scene_sink_);
}

}  // namespace keyforge
