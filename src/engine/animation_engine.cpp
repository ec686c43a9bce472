#include <algorithm>
#include <cassert>
#include <cmath>
#include <keyforge/animation_engine.hpp>
#include <keyforge/frame_time.hpp>
#include <keyforge/logger.hpp>
#include <keyforge/property_path.hpp>
#include <keyforge/snap_resolver.hpp>
#include <keyforge/undo_manager.hpp>

namespace keyforge
{

namespace
{

constexpr float MIN_CLIP_SPEED = 0.001f;
constexpr float MAX_CLIP_SPEED = 100.0f;
constexpr float MAX_SNAP_THRESHOLD_PX = 64.0f;

}  // anonymous namespace

AnimationEngine::AnimationEngine(EngineConfig config) : config_(std::move(config))
{
    config_.sanitize();
    fps_           = config_.default_fps;
    last_used_fps_ = fps_;
    snap_          = config_.snap;
    zoom_          = config_.default_zoom;
    auto_key_      = config_.auto_key;
    if (config_.log_level)
        Logger::instance().set_level(*config_.log_level);
}

// ─── Clips ───────────────────────────────────────────────────────────────────

ClipId AnimationEngine::create_clip(const std::string& name)
{
    Clip clip;
    clip.id    = next_clip_id_++;
    clip.name  = name;
    clip.start = 0.0f;
    clip.end   = config_.default_clip_length;
    clip.loop  = config_.default_clip_loop;
    clip.speed = 1.0f;

    ClipId id = clip.id;
    clips_.emplace(id, std::move(clip));
    clip_order_.push_back(id);
    active_clip_id_ = id;
    last_used_clip_ = id;
    playhead_       = 0.0f;

    KEYFORGE_LOG_DEBUG("anim.engine", "created clip {} '{}'", id, name);
    return id;
}

void AnimationEngine::remove_clip(ClipId clip_id)
{
    if (clips_.erase(clip_id) == 0)
    {
        KEYFORGE_LOG_DEBUG("anim.engine", "remove_clip: no clip {}", clip_id);
        return;
    }
    std::erase(clip_order_, clip_id);
    if (last_used_clip_ == clip_id)
        last_used_clip_ = INVALID_ID;

    if (active_clip_id_ == clip_id)
    {
        active_clip_id_ = clip_order_.empty() ? INVALID_ID : clip_order_.back();
        if (active_clip_id_ == INVALID_ID)
        {
            playhead_ = 0.0f;
            set_state(PlaybackState::Stopped);
        }
        clamp_playhead();
    }
}

void AnimationEngine::set_active_clip(ClipId clip_id)
{
    if (clip_id != INVALID_ID && !clips_.contains(clip_id))
    {
        KEYFORGE_LOG_DEBUG("anim.engine", "set_active_clip: no clip {}", clip_id);
        return;
    }
    active_clip_id_ = clip_id;
    last_used_clip_ = clip_id;
    clamp_playhead();
}

const Clip* AnimationEngine::active_clip() const
{
    return clip(active_clip_id_);
}

Clip* AnimationEngine::active_clip_mut()
{
    auto it = clips_.find(active_clip_id_);
    return it != clips_.end() ? &it->second : nullptr;
}

const Clip* AnimationEngine::clip(ClipId clip_id) const
{
    auto it = clips_.find(clip_id);
    return it != clips_.end() ? &it->second : nullptr;
}

void AnimationEngine::rename_clip(ClipId clip_id, const std::string& name)
{
    auto it = clips_.find(clip_id);
    if (it != clips_.end())
        it->second.name = name;
}

void AnimationEngine::set_clip_loop(ClipId clip_id, bool loop)
{
    auto it = clips_.find(clip_id);
    if (it != clips_.end())
        it->second.loop = loop;
}

void AnimationEngine::set_clip_range(float start, float end)
{
    Clip* c = active_clip_mut();
    if (!c || !std::isfinite(start) || !std::isfinite(end))
        return;

    c->start = std::max(0.0f, std::min(start, end));
    c->end   = std::max(c->start, end);
    if (c->start != start || c->end != end)
        KEYFORGE_LOG_TRACE("anim.engine", "clip range clamped to [{}, {}]", c->start, c->end);
    assert(c->start <= c->end);
    clamp_playhead();
}

void AnimationEngine::set_clip_speed(float speed)
{
    Clip* c = active_clip_mut();
    if (!c)
        return;
    if (!std::isfinite(speed))
        speed = 1.0f;
    c->speed = std::clamp(speed, MIN_CLIP_SPEED, MAX_CLIP_SPEED);
}

void AnimationEngine::add_track_to_clip(ClipId clip_id, TrackId track_id)
{
    auto it = clips_.find(clip_id);
    if (it == clips_.end() || !tracks_.contains(track_id))
        return;
    if (!it->second.has_track(track_id))
        it->second.track_ids.push_back(track_id);
}

void AnimationEngine::remove_track_from_clip(ClipId clip_id, TrackId track_id)
{
    auto it = clips_.find(clip_id);
    if (it != clips_.end())
        std::erase(it->second.track_ids, track_id);
}

// ─── Tracks ──────────────────────────────────────────────────────────────────

TrackId AnimationEngine::ensure_track(const std::string& target_id, const std::string& property)
{
    if (TrackId existing = track_id_for(target_id, property); existing != INVALID_ID)
        return existing;

    Track tr;
    tr.id         = next_track_id_++;
    tr.target_id  = target_id;
    tr.property   = property;
    tr.sink       = parse_property_path(property);
    tr.channel.id = next_channel_id_++;
    if (!tr.sink)
        KEYFORGE_LOG_WARN("anim.engine", "track for '{}' has no known sink", property);

    TrackId id = tr.id;
    tracks_.emplace(id, std::move(tr));
    if (Clip* c = active_clip_mut())
    {
        if (!c->has_track(id))
            c->track_ids.push_back(id);
    }
    KEYFORGE_LOG_DEBUG("anim.engine", "created track {} {}:{}", id, target_id, property);
    return id;
}

TrackId AnimationEngine::track_id_for(const std::string& target_id,
                                      const std::string& property) const
{
    for (const auto& [id, tr] : tracks_)
    {
        if (tr.target_id == target_id && tr.property == property)
            return id;
    }
    return INVALID_ID;
}

const Track* AnimationEngine::track(TrackId track_id) const
{
    auto it = tracks_.find(track_id);
    return it != tracks_.end() ? &it->second : nullptr;
}

Track* AnimationEngine::track_mut(TrackId track_id)
{
    auto it = tracks_.find(track_id);
    return it != tracks_.end() ? &it->second : nullptr;
}

Track* AnimationEngine::editable_track(TrackId track_id, const char* op)
{
    Track* tr = track_mut(track_id);
    if (!tr)
    {
        KEYFORGE_LOG_DEBUG("anim.edit", "{}: no track {}", op, track_id);
        return nullptr;
    }
    if (tr->locked)
    {
        KEYFORGE_LOG_DEBUG("anim.edit", "{}: track {} is locked", op, track_id);
        return nullptr;
    }
    return tr;
}

void AnimationEngine::set_track_muted(TrackId track_id, bool muted)
{
    if (Track* tr = track_mut(track_id))
        tr->muted = muted;
}

void AnimationEngine::set_track_locked(TrackId track_id, bool locked)
{
    if (Track* tr = track_mut(track_id))
        tr->locked = locked;
}

void AnimationEngine::toggle_track_solo(TrackId track_id)
{
    if (!tracks_.contains(track_id))
        return;
    if (!solo_track_ids_.erase(track_id))
        solo_track_ids_.insert(track_id);
}

bool AnimationEngine::is_track_soloed(TrackId track_id) const
{
    return solo_track_ids_.contains(track_id);
}

void AnimationEngine::drop_track_references(TrackId track_id)
{
    sorted_cache_.erase(track_id);
    std::erase(selection_.track_ids, track_id);
    selection_.keys.erase(track_id);
    solo_track_ids_.erase(track_id);
    for (auto& [id, c] : clips_)
        std::erase(c.track_ids, track_id);
}

void AnimationEngine::remove_track(TrackId track_id)
{
    if (tracks_.erase(track_id) == 0)
        return;
    drop_track_references(track_id);
}

void AnimationEngine::remove_tracks_for_target(const std::string& target_id)
{
    std::vector<TrackId> doomed;
    for (const auto& [id, tr] : tracks_)
    {
        if (tr.target_id == target_id)
            doomed.push_back(id);
    }
    if (doomed.empty())
        return;

    for (TrackId id : doomed)
    {
        tracks_.erase(id);
        drop_track_references(id);
    }
    KEYFORGE_LOG_DEBUG("anim.engine", "removed {} tracks for '{}'", doomed.size(), target_id);
}

// ─── Sorted-time cache ───────────────────────────────────────────────────────

const std::vector<float>& AnimationEngine::sorted_key_times(TrackId track_id) const
{
    static const std::vector<float> empty;

    auto tr_it = tracks_.find(track_id);
    if (tr_it == tracks_.end())
        return empty;

    auto it = sorted_cache_.find(track_id);
    if (it != sorted_cache_.end())
        return it->second;

    std::vector<float> times;
    times.reserve(tr_it->second.channel.keys.size());
    for (const auto& k : tr_it->second.channel.keys)
        times.push_back(k.time);
    return sorted_cache_.emplace(track_id, std::move(times)).first->second;
}

void AnimationEngine::invalidate_cache(TrackId track_id)
{
    sorted_cache_.erase(track_id);
}

// ─── Markers ─────────────────────────────────────────────────────────────────

MarkerId AnimationEngine::add_marker(float time, const std::string& label, const std::string& color)
{
    Marker m;
    m.id    = next_marker_id_++;
    m.time  = std::isfinite(time) ? std::max(0.0f, time) : 0.0f;
    m.label = label;
    m.color = color;
    markers_.push_back(std::move(m));
    return markers_.back().id;
}

void AnimationEngine::move_marker(MarkerId marker_id, float time)
{
    if (!std::isfinite(time))
        return;
    for (auto& m : markers_)
    {
        if (m.id == marker_id)
        {
            m.time = std::max(0.0f, time);
            return;
        }
    }
}

void AnimationEngine::remove_marker(MarkerId marker_id)
{
    std::erase_if(markers_, [marker_id](const Marker& m) { return m.id == marker_id; });
}

void AnimationEngine::set_marker_label(MarkerId marker_id, const std::string& label)
{
    for (auto& m : markers_)
    {
        if (m.id == marker_id)
            m.label = label;
    }
}

void AnimationEngine::set_marker_color(MarkerId marker_id, const std::string& color)
{
    for (auto& m : markers_)
    {
        if (m.id == marker_id)
            m.color = color;
    }
}

const Marker* AnimationEngine::marker(MarkerId marker_id) const
{
    for (const auto& m : markers_)
    {
        if (m.id == marker_id)
            return &m;
    }
    return nullptr;
}

// ─── Snapping ────────────────────────────────────────────────────────────────

void AnimationEngine::set_snapping(bool enabled)
{
    snap_.enabled = enabled;
}

void AnimationEngine::set_snap_to_frames(bool enabled)
{
    snap_.to_frames = enabled;
}

void AnimationEngine::set_snap_to_keys(bool enabled)
{
    snap_.to_keys = enabled;
}

void AnimationEngine::set_snap_threshold_px(float px)
{
    if (!std::isfinite(px))
        return;
    snap_.threshold_px = std::clamp(px, 0.0f, MAX_SNAP_THRESHOLD_PX);
}

float AnimationEngine::snap_time(float time) const
{
    SnapResolver resolver(snap_, fps_, zoom_);
    if (const Clip* c = active_clip())
    {
        for (TrackId id : c->track_ids)
            resolver.add_candidates(sorted_key_times(id));
    }
    return resolver.resolve(time);
}

// ─── View ────────────────────────────────────────────────────────────────────

void AnimationEngine::set_zoom(float pixels_per_second)
{
    if (!std::isfinite(pixels_per_second))
        return;
    zoom_ = std::clamp(pixels_per_second, config_.min_zoom, config_.max_zoom);
}

void AnimationEngine::set_pan(float seconds)
{
    if (std::isfinite(seconds))
        pan_ = seconds;
}

// ─── Persistence ─────────────────────────────────────────────────────────────

AnimationDocument AnimationEngine::capture_document() const
{
    AnimationDocument doc;
    for (ClipId id : clip_order_)
    {
        if (const Clip* c = clip(id))
            doc.clips.push_back(*c);
    }
    for (const auto& [id, tr] : tracks_)
        doc.tracks.push_back(tr);
    doc.markers        = markers_;
    doc.active_clip_id = active_clip_id_;
    doc.fps            = fps_;
    doc.zoom           = zoom_;
    doc.pan            = pan_;
    doc.last_used_fps  = last_used_fps_;
    doc.last_used_clip = last_used_clip_;
    doc.snap           = snap_;
    doc.auto_key       = auto_key_;
    return doc;
}

void AnimationEngine::restore_document(const AnimationDocument& doc)
{
    clips_.clear();
    clip_order_.clear();
    tracks_.clear();
    markers_.clear();
    solo_track_ids_.clear();
    sorted_cache_.clear();
    selection_ = {};
    if (undo_)
        undo_->clear();

    // Tracks: unique ids and unique (target, property) pairs.
    uint32_t max_track = 0;
    uint32_t max_channel = 0;
    uint32_t max_key = 0;
    for (const auto& src : doc.tracks)
    {
        if (src.id == INVALID_ID || tracks_.contains(src.id)
            || track_id_for(src.target_id, src.property) != INVALID_ID)
        {
            KEYFORGE_LOG_WARN("anim.io", "dropping duplicate track {}", src.id);
            continue;
        }
        Track tr = src;
        tr.sink  = parse_property_path(tr.property);
        for (auto& k : tr.channel.keys)
            k.time = std::isfinite(k.time) ? std::max(0.0f, k.time) : 0.0f;
        tr.channel.sort();
        max_track   = std::max(max_track, tr.id);
        max_channel = std::max(max_channel, tr.channel.id);
        for (const auto& k : tr.channel.keys)
            max_key = std::max(max_key, k.id);
        tracks_.emplace(tr.id, std::move(tr));
    }

    // Key ids must be unique across the engine.
    next_key_id_     = max_key + 1;
    next_channel_id_ = max_channel + 1;
    std::set<KeyId> seen_keys;
    for (auto& [id, tr] : tracks_)
    {
        if (tr.channel.id == INVALID_ID)
            tr.channel.id = next_channel_id_++;
        for (auto& k : tr.channel.keys)
        {
            if (k.id == INVALID_ID || !seen_keys.insert(k.id).second)
            {
                k.id = next_key_id_++;
                seen_keys.insert(k.id);
            }
        }
    }

    uint32_t max_clip = 0;
    for (const auto& src : doc.clips)
    {
        if (src.id == INVALID_ID || clips_.contains(src.id))
            continue;
        Clip c  = src;
        c.start = std::isfinite(c.start) ? std::max(0.0f, c.start) : 0.0f;
        c.end   = std::isfinite(c.end) ? std::max(c.start, c.end) : c.start;
        c.speed = std::isfinite(c.speed) ? std::clamp(c.speed, MIN_CLIP_SPEED, MAX_CLIP_SPEED) : 1.0f;
        c.track_ids.clear();
        for (TrackId tid : src.track_ids)
        {
            if (tracks_.contains(tid) && !c.has_track(tid))
                c.track_ids.push_back(tid);
        }
        max_clip = std::max(max_clip, c.id);
        clip_order_.push_back(c.id);
        clips_.emplace(c.id, std::move(c));
    }

    uint32_t max_marker = 0;
    std::set<MarkerId> seen_markers;
    for (const auto& src : doc.markers)
    {
        if (src.id == INVALID_ID || !seen_markers.insert(src.id).second)
            continue;
        Marker m = src;
        m.time   = std::isfinite(m.time) ? std::max(0.0f, m.time) : 0.0f;
        max_marker = std::max(max_marker, m.id);
        markers_.push_back(std::move(m));
    }

    next_track_id_  = max_track + 1;
    next_clip_id_   = max_clip + 1;
    next_marker_id_ = max_marker + 1;

    fps_           = clamp_fps(static_cast<float>(doc.fps));
    last_used_fps_ = clamp_fps(static_cast<float>(doc.last_used_fps));
    zoom_          = std::isfinite(doc.zoom) ? std::clamp(doc.zoom, config_.min_zoom, config_.max_zoom)
                                             : config_.default_zoom;
    pan_           = std::isfinite(doc.pan) ? doc.pan : 0.0f;
    snap_          = doc.snap;
    snap_.threshold_px = std::isfinite(snap_.threshold_px)
                             ? std::clamp(snap_.threshold_px, 0.0f, MAX_SNAP_THRESHOLD_PX)
                             : config_.snap.threshold_px;
    auto_key_ = doc.auto_key;

    if (clips_.contains(doc.active_clip_id))
        active_clip_id_ = doc.active_clip_id;
    else
        active_clip_id_ = clip_order_.empty() ? INVALID_ID : clip_order_.back();
    last_used_clip_ = clips_.contains(doc.last_used_clip) ? doc.last_used_clip : active_clip_id_;

    const Clip* active = active_clip();
    playhead_ = active ? active->start : 0.0f;
    set_state(PlaybackState::Stopped);

    KEYFORGE_LOG_INFO("anim.engine",
                      "restored {} clips, {} tracks, {} markers",
                      clips_.size(),
                      tracks_.size(),
                      markers_.size());
}

}  // namespace keyforge
