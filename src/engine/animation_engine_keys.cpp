#include <algorithm>
#include <cassert>
#include <cmath>
#include <keyforge/animation_engine.hpp>
#include <keyforge/easing.hpp>
#include <keyforge/frame_time.hpp>
#include <keyforge/logger.hpp>
#include <keyforge/snap_resolver.hpp>
#include <keyforge/undo_manager.hpp>

namespace keyforge
{

namespace
{

// Keys closer than this are at "the same time".
constexpr float SAME_TIME_EPSILON = 1e-6f;

float slope(const Key& a, const Key& b)
{
    float dt = std::max(1e-6f, b.time - a.time);
    return (b.value - a.value) / dt;
}

void ensure_bezier(Key& k)
{
    k.interp = Interpolation::Bezier;
}

}  // anonymous namespace

// ─── Undo support ────────────────────────────────────────────────────────────

AnimationEngine::ChannelSnapshot AnimationEngine::snapshot_channels(
    const std::vector<TrackId>& track_ids) const
{
    ChannelSnapshot snap;
    snap.track_ids = track_ids;
    if (!undo_ || undo_->is_replaying())
        return snap;
    for (TrackId id : track_ids)
    {
        if (const Track* tr = track(id))
            snap.channels.emplace_back(id, tr->channel);
    }
    return snap;
}

void AnimationEngine::commit_edit(const std::string& description, ChannelSnapshot before)
{
    for (TrackId id : before.track_ids)
        invalidate_cache(id);

    if (!undo_ || undo_->is_replaying() || before.channels.empty())
        return;

    ChannelSnapshot after;
    after.track_ids = before.track_ids;
    bool changed    = false;
    for (const auto& [id, channel] : before.channels)
    {
        const Track* tr = track(id);
        if (!tr)
            continue;
        if (!(tr->channel == channel))
            changed = true;
        after.channels.emplace_back(id, tr->channel);
    }
    if (!changed)
        return;

    undo_->push({description,
                 [this, before = std::move(before)]() { restore_channels(before); },
                 [this, after = std::move(after)]() { restore_channels(after); }});
}

void AnimationEngine::restore_channels(const ChannelSnapshot& snapshot)
{
    for (const auto& [id, channel] : snapshot.channels)
    {
        Track* tr = track_mut(id);
        if (!tr)
            continue;
        tr->channel = channel;
        invalidate_cache(id);
        prune_selection(id);
    }
}

void AnimationEngine::prune_selection(TrackId track_id)
{
    auto it = selection_.keys.find(track_id);
    if (it == selection_.keys.end())
        return;
    const Track* tr = track(track_id);
    std::erase_if(it->second, [&](KeyId id) { return !tr || !tr->channel.find(id); });
    if (it->second.empty())
        selection_.keys.erase(it);
}

std::vector<TrackId> AnimationEngine::key_track_ids(const std::vector<KeyRef>& keys) const
{
    std::vector<TrackId> ids;
    for (const auto& ref : keys)
    {
        if (std::find(ids.begin(), ids.end(), ref.track_id) == ids.end())
            ids.push_back(ref.track_id);
    }
    return ids;
}

// ─── Key edits ───────────────────────────────────────────────────────────────

KeyId AnimationEngine::insert_key(TrackId track_id, float time, float value, Interpolation interp)
{
    Track* tr = editable_track(track_id, "insert_key");
    if (!tr || !std::isfinite(time) || !std::isfinite(value))
        return INVALID_ID;

    auto  before = snapshot_channels({track_id});
    float t      = quantize_to_frame(std::max(0.0f, time), fps_);
    auto& keys   = tr->channel.keys;

    KeyId id = INVALID_ID;
    auto  existing =
        std::find_if(keys.begin(), keys.end(),
                     [t](const Key& k) { return std::fabs(k.time - t) < SAME_TIME_EPSILON; });
    if (existing != keys.end())
    {
        existing->value  = value;
        existing->interp = interp;
        id               = existing->id;
    }
    else
    {
        Key k;
        k.id     = next_key_id_++;
        k.time   = t;
        k.value  = value;
        k.interp = interp;
        id       = k.id;
        keys.push_back(k);
        tr->channel.sort();
    }
    assert(tr->channel.is_sorted());

    commit_edit("Insert key", std::move(before));
    return id;
}

void AnimationEngine::remove_key(TrackId track_id, KeyId key_id)
{
    Track* tr = editable_track(track_id, "remove_key");
    if (!tr || !tr->channel.find(key_id))
        return;

    auto before = snapshot_channels({track_id});
    std::erase_if(tr->channel.keys, [key_id](const Key& k) { return k.id == key_id; });
    prune_selection(track_id);
    commit_edit("Remove key", std::move(before));
}

void AnimationEngine::move_key(TrackId track_id, KeyId key_id, float time)
{
    Track* tr = editable_track(track_id, "move_key");
    if (!tr || !std::isfinite(time))
        return;
    Key* k = tr->channel.find(key_id);
    if (!k)
        return;

    auto before = snapshot_channels({track_id});
    if (time < 0.0f)
        KEYFORGE_LOG_TRACE("anim.edit", "move_key: clamped {} to 0", time);
    k->time = std::max(0.0f, time);
    tr->channel.sort();
    assert(tr->channel.is_sorted());
    commit_edit("Move key", std::move(before));
}

void AnimationEngine::drag_key(TrackId track_id, KeyId key_id, float raw_time)
{
    const Track* tr = track(track_id);
    if (!tr || !tr->channel.find(key_id) || !std::isfinite(raw_time))
        return;

    SnapResolver resolver(snap_, fps_, zoom_);
    if (const Clip* c = active_clip())
    {
        for (TrackId id : c->track_ids)
        {
            if (id != track_id)
            {
                resolver.add_candidates(sorted_key_times(id));
                continue;
            }
            for (const auto& k : tr->channel.keys)
            {
                if (k.id != key_id)
                    resolver.add_candidate(k.time);
            }
        }
    }
    move_key(track_id, key_id, resolver.resolve(std::max(0.0f, raw_time)));
}

void AnimationEngine::set_key_value(TrackId track_id, KeyId key_id, float value)
{
    Track* tr = editable_track(track_id, "set_key_value");
    if (!tr || !std::isfinite(value))
        return;
    Key* k = tr->channel.find(key_id);
    if (!k)
        return;

    auto before = snapshot_channels({track_id});
    k->value    = value;
    commit_edit("Set key value", std::move(before));
}

void AnimationEngine::set_interpolation(TrackId track_id, KeyId key_id, Interpolation interp)
{
    Track* tr = editable_track(track_id, "set_interpolation");
    if (!tr)
        return;
    Key* k = tr->channel.find(key_id);
    if (!k)
        return;

    auto before = snapshot_channels({track_id});
    k->interp   = interp;
    k->seg_ease.reset();
    commit_edit("Set interpolation", std::move(before));
}

void AnimationEngine::set_key_tangent_in(TrackId track_id, KeyId key_id, std::optional<float> tangent)
{
    Track* tr = editable_track(track_id, "set_key_tangent_in");
    if (!tr)
        return;
    Key* k = tr->channel.find(key_id);
    if (!k)
        return;

    auto before   = snapshot_channels({track_id});
    k->tangent_in = tangent;
    commit_edit("Set tangent", std::move(before));
}

void AnimationEngine::set_key_tangent_out(TrackId              track_id,
                                          KeyId                key_id,
                                          std::optional<float> tangent)
{
    Track* tr = editable_track(track_id, "set_key_tangent_out");
    if (!tr)
        return;
    Key* k = tr->channel.find(key_id);
    if (!k)
        return;

    auto before    = snapshot_channels({track_id});
    k->tangent_out = tangent;
    commit_edit("Set tangent", std::move(before));
}

void AnimationEngine::set_segment_ease(TrackId                    track_id,
                                       KeyId                      key_id,
                                       std::optional<SegmentEase> seg)
{
    Track* tr = editable_track(track_id, "set_segment_ease");
    if (!tr)
        return;
    int idx = tr->channel.index_of(key_id);
    if (idx < 0)
        return;

    auto  before = snapshot_channels({track_id});
    auto& keys   = tr->channel.keys;
    Key&  cur    = keys[idx];
    if (seg)
    {
        seg->strength = ease::clamp_strength(seg->strength);
        cur.seg_ease  = seg;
        cur.tangent_out.reset();
        if (static_cast<size_t>(idx) + 1 < keys.size())
            keys[idx + 1].tangent_in.reset();
    }
    else
    {
        cur.seg_ease.reset();
    }
    commit_edit("Set segment ease", std::move(before));
}

// ─── Easing presets ──────────────────────────────────────────────────────────

void AnimationEngine::apply_easing_preset(const std::vector<KeyRef>& keys,
                                          EasingPreset               preset,
                                          float                      strength)
{
    if (keys.empty())
        return;

    float s = ease::clamp_strength(strength);
    float k = 1.0f + 1.5f * s;

    auto before = snapshot_channels(key_track_ids(keys));
    for (const auto& ref : keys)
    {
        Track* tr = editable_track(ref.track_id, "apply_easing_preset");
        if (!tr)
            continue;
        int idx = tr->channel.index_of(ref.key_id);
        if (idx < 0)
            continue;

        auto& ks   = tr->channel.keys;
        Key&  cur  = ks[idx];
        Key*  prev = idx > 0 ? &ks[idx - 1] : nullptr;
        Key*  next = static_cast<size_t>(idx) + 1 < ks.size() ? &ks[idx + 1] : nullptr;
        if (!prev && !next)
            continue;

        // Shapes the segment entering `cur` from prev.
        auto shape_in = [&](float cur_factor, float prev_factor)
        {
            ensure_bezier(cur);
            ensure_bezier(*prev);
            float m         = slope(*prev, cur);
            cur.tangent_in  = m * cur_factor;
            prev->tangent_out = m * prev_factor;
        };
        // Shapes the segment leaving `cur` towards next.
        auto shape_out = [&](float cur_factor, float next_factor)
        {
            ensure_bezier(cur);
            ensure_bezier(*next);
            float m          = slope(cur, *next);
            cur.tangent_out  = m * cur_factor;
            next->tangent_in = m * next_factor;
        };

        switch (preset)
        {
            case EasingPreset::EaseIn:
                if (!prev)
                    continue;
                shape_in(0.0f, k);
                cur.seg_ease.reset();
                break;
            case EasingPreset::EaseOut:
                if (!next)
                    continue;
                shape_out(0.0f, 0.75f * k);
                cur.seg_ease.reset();
                break;
            case EasingPreset::EaseInOut:
                if (prev)
                    shape_in(0.0f, 0.75f * k);
                if (next)
                    shape_out(0.0f, 0.75f * k);
                cur.seg_ease.reset();
                break;
            case EasingPreset::BackIn:
                if (!prev)
                    continue;
                shape_in(k, k);
                cur.seg_ease.reset();
                break;
            case EasingPreset::BackOut:
                if (!next)
                    continue;
                shape_out(k, k);
                cur.seg_ease.reset();
                break;
            case EasingPreset::BackInOut:
                if (prev)
                    shape_in(k, k);
                if (next)
                    shape_out(k, k);
                cur.seg_ease.reset();
                break;
            case EasingPreset::Bounce:
            case EasingPreset::Elastic:
                if (!next)
                    continue;
                cur.seg_ease = SegmentEase{preset == EasingPreset::Bounce ? SegmentEaseKind::Bounce
                                                                          : SegmentEaseKind::Elastic,
                                           SegmentEaseMode::Out,
                                           s};
                cur.tangent_out.reset();
                next->tangent_in.reset();
                break;
        }
    }

    KEYFORGE_LOG_DEBUG("anim.edit",
                       "applied {} to {} keys",
                       easing_preset_name(preset),
                       keys.size());
    commit_edit(std::string("Apply ") + easing_preset_name(preset), std::move(before));
}

// ─── Queries ─────────────────────────────────────────────────────────────────

const Key* AnimationEngine::key(TrackId track_id, KeyId key_id) const
{
    const Track* tr = track(track_id);
    return tr ? tr->channel.find(key_id) : nullptr;
}

size_t AnimationEngine::total_key_count() const
{
    size_t n = 0;
    for (const auto& [id, tr] : tracks_)
        n += tr.channel.size();
    return n;
}

KeyId AnimationEngine::find_key_at(TrackId track_id, float time) const
{
    const Track* tr = track(track_id);
    if (!tr || !std::isfinite(time))
        return INVALID_ID;

    float t = quantize_to_frame(time, fps_);
    for (const auto& k : tr->channel.keys)
    {
        if (std::fabs(k.time - t) < SAME_TIME_EPSILON)
            return k.id;
    }
    return INVALID_ID;
}

bool AnimationEngine::has_key_at(const std::string& target_id,
                                 const std::string& property,
                                 float              time) const
{
    TrackId id = track_id_for(target_id, property);
    return id != INVALID_ID && find_key_at(id, time) != INVALID_ID;
}

void AnimationEngine::toggle_key_at(const std::string& target_id,
                                    const std::string& property,
                                    float              time,
                                    float              value,
                                    Interpolation      interp)
{
    TrackId id = ensure_track(target_id, property);
    if (KeyId existing = find_key_at(id, time); existing != INVALID_ID)
        remove_key(id, existing);
    else
        insert_key(id, time, value, interp);
}

// ─── Auto-key ────────────────────────────────────────────────────────────────

KeyId AnimationEngine::notify_property_edited(const std::string& target_id,
                                              const std::string& property,
                                              float              value)
{
    if (!auto_key_)
        return INVALID_ID;
    if (sampling_)
    {
        KEYFORGE_LOG_TRACE("anim.edit", "auto-key ignored write to {} during sampling", property);
        return INVALID_ID;
    }
    TrackId id = ensure_track(target_id, property);
    return insert_key(id, playhead_, value);
}

}  // namespace keyforge
