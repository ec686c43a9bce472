#include <algorithm>
#include <keyforge/animation_types.hpp>

namespace keyforge
{

// ─── Channel ─────────────────────────────────────────────────────────────────

bool Channel::is_sorted() const
{
    return std::is_sorted(keys.begin(),
                          keys.end(),
                          [](const Key& a, const Key& b) { return a.time < b.time; });
}

void Channel::sort()
{
    // Stable so keys sharing a time keep their relative order across edits.
    std::stable_sort(keys.begin(),
                     keys.end(),
                     [](const Key& a, const Key& b) { return a.time < b.time; });
}

Key* Channel::find(KeyId key_id)
{
    for (auto& k : keys)
    {
        if (k.id == key_id)
            return &k;
    }
    return nullptr;
}

const Key* Channel::find(KeyId key_id) const
{
    for (const auto& k : keys)
    {
        if (k.id == key_id)
            return &k;
    }
    return nullptr;
}

int Channel::index_of(KeyId key_id) const
{
    for (size_t i = 0; i < keys.size(); ++i)
    {
        if (keys[i].id == key_id)
            return static_cast<int>(i);
    }
    return -1;
}

// ─── Clip / Selection ────────────────────────────────────────────────────────

bool Clip::has_track(TrackId track_id) const
{
    return std::find(track_ids.begin(), track_ids.end(), track_id) != track_ids.end();
}

size_t Selection::key_count() const
{
    size_t count = 0;
    for (const auto& [tid, ids] : keys)
        count += ids.size();
    return count;
}

bool Selection::is_track_selected(TrackId track_id) const
{
    return std::find(track_ids.begin(), track_ids.end(), track_id) != track_ids.end();
}

bool Selection::is_key_selected(TrackId track_id, KeyId key_id) const
{
    auto it = keys.find(track_id);
    return it != keys.end() && it->second.count(key_id) > 0;
}

// ─── Names ───────────────────────────────────────────────────────────────────

const char* interpolation_name(Interpolation interp)
{
    switch (interp)
    {
        case Interpolation::Step:
            return "step";
        case Interpolation::Linear:
            return "linear";
        case Interpolation::Bezier:
            return "bezier";
    }
    return "unknown";
}

const char* segment_ease_kind_name(SegmentEaseKind kind)
{
    switch (kind)
    {
        case SegmentEaseKind::Bounce:
            return "bounce";
        case SegmentEaseKind::Elastic:
            return "elastic";
    }
    return "unknown";
}

const char* segment_ease_mode_name(SegmentEaseMode mode)
{
    switch (mode)
    {
        case SegmentEaseMode::In:
            return "in";
        case SegmentEaseMode::Out:
            return "out";
        case SegmentEaseMode::InOut:
            return "inOut";
    }
    return "unknown";
}

const char* easing_preset_name(EasingPreset preset)
{
    switch (preset)
    {
        case EasingPreset::EaseIn:
            return "easeIn";
        case EasingPreset::EaseOut:
            return "easeOut";
        case EasingPreset::EaseInOut:
            return "easeInOut";
        case EasingPreset::BackIn:
            return "backIn";
        case EasingPreset::BackOut:
            return "backOut";
        case EasingPreset::BackInOut:
            return "backInOut";
        case EasingPreset::Bounce:
            return "bounce";
        case EasingPreset::Elastic:
            return "elastic";
    }
    return "unknown";
}

const char* playback_state_name(PlaybackState state)
{
    switch (state)
    {
        case PlaybackState::Stopped:
            return "Stopped";
        case PlaybackState::Playing:
            return "Playing";
        case PlaybackState::Paused:
            return "Paused";
    }
    return "Unknown";
}

std::optional<Interpolation> parse_interpolation(std::string_view name)
{
    for (auto v : {Interpolation::Step, Interpolation::Linear, Interpolation::Bezier})
    {
        if (name == interpolation_name(v))
            return v;
    }
    return std::nullopt;
}

std::optional<SegmentEaseKind> parse_segment_ease_kind(std::string_view name)
{
    for (auto v : {SegmentEaseKind::Bounce, SegmentEaseKind::Elastic})
    {
        if (name == segment_ease_kind_name(v))
            return v;
    }
    return std::nullopt;
}

std::optional<SegmentEaseMode> parse_segment_ease_mode(std::string_view name)
{
    for (auto v : {SegmentEaseMode::In, SegmentEaseMode::Out, SegmentEaseMode::InOut})
    {
        if (name == segment_ease_mode_name(v))
            return v;
    }
    return std::nullopt;
}

std::optional<EasingPreset> parse_easing_preset(std::string_view name)
{
    for (auto v : {EasingPreset::EaseIn,
                   EasingPreset::EaseOut,
                   EasingPreset::EaseInOut,
                   EasingPreset::BackIn,
                   EasingPreset::BackOut,
                   EasingPreset::BackInOut,
                   EasingPreset::Bounce,
                   EasingPreset::Elastic})
    {
        if (name == easing_preset_name(v))
            return v;
    }
    return std::nullopt;
}

}  // namespace keyforge
