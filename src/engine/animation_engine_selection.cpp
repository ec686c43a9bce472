#include <algorithm>
#include <cassert>
#include <cmath>
#include <keyforge/animation_engine.hpp>
#include <keyforge/frame_time.hpp>
#include <keyforge/logger.hpp>
#include <limits>

#include "io/key_codec.hpp"

namespace keyforge
{

// ─── Selection ───────────────────────────────────────────────────────────────

std::vector<KeyRef> AnimationEngine::selected_keys() const
{
    std::vector<KeyRef> out;
    for (const auto& [tid, ids] : selection_.keys)
    {
        const Track* tr = track(tid);
        if (!tr)
            continue;
        // Channel order, so callers see keys by time.
        for (const auto& k : tr->channel.keys)
        {
            if (ids.contains(k.id))
                out.push_back({tid, k.id});
        }
    }
    return out;
}

void AnimationEngine::clear_selection()
{
    selection_ = {};
}

void AnimationEngine::select_track(TrackId track_id, bool additive)
{
    if (!tracks_.contains(track_id))
    {
        KEYFORGE_LOG_DEBUG("anim.select", "select_track: no track {}", track_id);
        return;
    }
    if (!additive)
        selection_ = {};
    if (!selection_.is_track_selected(track_id))
        selection_.track_ids.push_back(track_id);
}

void AnimationEngine::select_key(TrackId track_id, KeyId key_id, bool additive)
{
    if (!key(track_id, key_id))
    {
        KEYFORGE_LOG_DEBUG("anim.select", "select_key: no key {} on track {}", key_id, track_id);
        return;
    }
    if (!additive)
        selection_ = {};
    selection_.keys[track_id].insert(key_id);
}

void AnimationEngine::deselect_key(TrackId track_id, KeyId key_id)
{
    auto it = selection_.keys.find(track_id);
    if (it == selection_.keys.end())
        return;
    it->second.erase(key_id);
    if (it->second.empty())
        selection_.keys.erase(it);
}

void AnimationEngine::select_all_keys()
{
    selection_.keys.clear();
    const Clip* c = active_clip();
    for (const auto& [tid, tr] : tracks_)
    {
        if (c && !c->has_track(tid))
            continue;
        for (const auto& k : tr.channel.keys)
            selection_.keys[tid].insert(k.id);
    }
}

void AnimationEngine::select_keys_in_range(float t0, float t1, bool additive)
{
    if (!std::isfinite(t0) || !std::isfinite(t1))
        return;
    if (t0 > t1)
        std::swap(t0, t1);
    if (!additive)
        selection_.keys.clear();

    const Clip* c = active_clip();
    for (const auto& [tid, tr] : tracks_)
    {
        if (c && !c->has_track(tid))
            continue;
        for (const auto& k : tr.channel.keys)
        {
            if (k.time >= t0 && k.time <= t1)
                selection_.keys[tid].insert(k.id);
        }
    }
}

void AnimationEngine::delete_selected_keys()
{
    std::vector<TrackId> ids;
    for (const auto& [tid, keys] : selection_.keys)
        ids.push_back(tid);

    auto before = snapshot_channels(ids);
    for (const auto& [tid, keys] : selection_.keys)
    {
        Track* tr = editable_track(tid, "delete_selected_keys");
        if (!tr)
            continue;
        const auto& doomed = keys;
        std::erase_if(tr->channel.keys, [&](const Key& k) { return doomed.contains(k.id); });
    }
    selection_.keys.clear();
    commit_edit("Delete keys", std::move(before));
}

// ─── Nudge ───────────────────────────────────────────────────────────────────

void AnimationEngine::nudge_keys(const std::map<TrackId, std::set<KeyId>>& keys,
                                 float                                     dt,
                                 std::optional<float>                      dv,
                                 bool                                      snap_to_fps,
                                 const std::string&                        description)
{
    if (keys.empty() || !std::isfinite(dt))
        return;
    if (dv && !std::isfinite(*dv))
        dv.reset();

    std::vector<TrackId> ids;
    for (const auto& [tid, set] : keys)
        ids.push_back(tid);

    auto before = snapshot_channels(ids);
    for (const auto& [tid, set] : keys)
    {
        Track* tr = editable_track(tid, "nudge");
        if (!tr)
            continue;
        for (auto& k : tr->channel.keys)
        {
            if (!set.contains(k.id))
                continue;
            float t = std::max(0.0f, k.time + dt);
            k.time  = snap_to_fps ? quantize_to_frame(t, fps_) : t;
            if (dv)
                k.value += *dv;
        }
        tr->channel.sort();
        assert(tr->channel.is_sorted());
    }
    commit_edit(description, std::move(before));
}

void AnimationEngine::nudge_selected_keys(float dt, std::optional<float> dv, bool snap_to_fps)
{
    nudge_keys(selection_.keys, dt, dv, snap_to_fps, "Nudge keys");
}

void AnimationEngine::nudge_keys_for_tracks(const std::vector<TrackId>& track_ids,
                                            float                       dt,
                                            bool                        snap_to_fps)
{
    std::map<TrackId, std::set<KeyId>> keys;
    for (TrackId tid : track_ids)
    {
        const Track* tr = track(tid);
        if (!tr)
            continue;
        auto& set = keys[tid];
        for (const auto& k : tr->channel.keys)
            set.insert(k.id);
    }
    nudge_keys(keys, dt, std::nullopt, snap_to_fps, "Move tracks");
}

void AnimationEngine::nudge_keys_subset(const std::vector<KeyRef>& keys,
                                        float                      dt,
                                        std::optional<float>       dv,
                                        bool                       snap_to_fps)
{
    std::map<TrackId, std::set<KeyId>> by_track;
    for (const auto& ref : keys)
        by_track[ref.track_id].insert(ref.key_id);
    nudge_keys(by_track, dt, dv, snap_to_fps, "Move keys");
}

// ─── Clipboard ───────────────────────────────────────────────────────────────

void AnimationEngine::set_clipboard(ClipboardSink* sink)
{
    clipboard_ = sink;
}

size_t AnimationEngine::copy_selected_keys()
{
    std::vector<ClipboardEntry> entries;
    for (const auto& ref : selected_keys())
    {
        if (const Key* k = key(ref.track_id, ref.key_id))
            entries.push_back({ref.track_id, *k});
    }
    clipboard().write_text(encode_key_clipboard(entries));
    KEYFORGE_LOG_DEBUG("anim.clipboard", "copied {} keys", entries.size());
    return entries.size();
}

void AnimationEngine::cut_selected_keys()
{
    copy_selected_keys();
    delete_selected_keys();
}

std::vector<KeyRef> AnimationEngine::paste_keys_at_playhead()
{
    std::vector<KeyRef> pasted;

    auto text = clipboard().read_text();
    if (!text)
        return pasted;

    auto entries = decode_key_clipboard(*text);
    if (!entries)
    {
        KEYFORGE_LOG_WARN("anim.clipboard", "clipboard does not hold a key payload");
        return pasted;
    }
    if (entries->empty())
        return pasted;

    float t0 = std::numeric_limits<float>::infinity();
    for (const auto& e : *entries)
        t0 = std::min(t0, e.key.time);
    float base = playhead_ - t0;

    std::vector<TrackId> ids;
    for (const auto& e : *entries)
    {
        if (std::find(ids.begin(), ids.end(), e.track_id) == ids.end())
            ids.push_back(e.track_id);
    }

    auto before = snapshot_channels(ids);
    for (const auto& e : *entries)
    {
        Track* tr = editable_track(e.track_id, "paste");
        if (!tr)
            continue;
        float time = e.key.time + base;
        if (!std::isfinite(time))
            continue;
        Key k  = e.key;
        k.id   = next_key_id_++;
        k.time = std::max(0.0f, time);
        tr->channel.keys.push_back(k);
        pasted.push_back({e.track_id, k.id});
    }
    for (TrackId tid : ids)
    {
        if (Track* tr = track_mut(tid))
        {
            tr->channel.sort();
            assert(tr->channel.is_sorted());
        }
    }
    commit_edit("Paste keys", std::move(before));

    KEYFORGE_LOG_DEBUG("anim.clipboard", "pasted {} keys at {}", pasted.size(), playhead_);
    return pasted;
}

}  // namespace keyforge
