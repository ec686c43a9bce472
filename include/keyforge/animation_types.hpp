#pragma once

#include <cstdint>
#include <keyforge/fwd.hpp>
#include <keyforge/property_path.hpp>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace keyforge
{

// Interpolation used for the segment that starts at a key.
enum class Interpolation : uint8_t
{
    Step,    // Hold this key's value until the next key
    Linear,  // Straight line to the next key
    Bezier,  // Cubic Hermite driven by tangents
};

enum class SegmentEaseKind : uint8_t
{
    Bounce,
    Elastic,
};

enum class SegmentEaseMode : uint8_t
{
    In,
    Out,
    InOut,
};

// Procedural shape applied to a whole key-to-key segment. Overrides the
// segment's interpolation and tangents while present.
struct SegmentEase
{
    SegmentEaseKind kind     = SegmentEaseKind::Bounce;
    SegmentEaseMode mode     = SegmentEaseMode::Out;
    float           strength = 1.0f;  // Clamped to [0, 3] at evaluation

    bool operator==(const SegmentEase&) const = default;
};

// Named presets for apply_easing_preset().
enum class EasingPreset : uint8_t
{
    EaseIn,
    EaseOut,
    EaseInOut,
    BackIn,
    BackOut,
    BackInOut,
    Bounce,
    Elastic,
};

struct Key
{
    KeyId                      id     = INVALID_ID;
    float                      time   = 0.0f;  // seconds, >= 0
    float                      value  = 0.0f;
    Interpolation              interp = Interpolation::Linear;
    std::optional<float>       tangent_in;   // dv/dt entering this key
    std::optional<float>       tangent_out;  // dv/dt leaving this key
    std::optional<SegmentEase> seg_ease;     // shape of the segment to the next key

    bool operator==(const Key&) const = default;
};

// Ordered key list owned by a track. Keys are kept sorted ascending by time.
struct Channel
{
    uint32_t         id = INVALID_ID;
    std::vector<Key> keys;

    bool empty() const { return keys.empty(); }
    size_t size() const { return keys.size(); }

    bool is_sorted() const;
    void sort();

    Key*       find(KeyId key_id);
    const Key* find(KeyId key_id) const;

    // Index of the key with the given id, or -1.
    int index_of(KeyId key_id) const;

    bool operator==(const Channel&) const = default;
};

// One animated scalar property of one external scene object.
struct Track
{
    TrackId                       id = INVALID_ID;
    std::string                   target_id;  // opaque scene object id
    std::string                   property;   // e.g. "position.x", "mod.<id>.<path>"
    std::optional<PropertyTarget> sink;       // parsed from property; nullopt if unknown
    Channel                       channel;
    bool                          muted  = false;
    bool                          locked = false;
};

// A named time window referencing the tracks that play back inside it.
struct Clip
{
    ClipId               id = INVALID_ID;
    std::string          name;
    float                start = 0.0f;
    float                end   = 5.0f;
    bool                 loop  = true;
    float                speed = 1.0f;
    std::vector<TrackId> track_ids;  // ordered, no duplicates

    float duration() const { return end - start; }
    bool has_track(TrackId track_id) const;
};

struct Marker
{
    MarkerId    id = INVALID_ID;
    float       time = 0.0f;
    std::string label;
    std::string color;
};

struct SnapSettings
{
    bool  enabled      = true;
    bool  to_frames    = true;
    bool  to_keys      = true;
    float threshold_px = 8.0f;  // [0, 64]

    bool operator==(const SnapSettings&) const = default;
};

// Selected tracks plus, per track, the selected key ids.
struct Selection
{
    std::vector<TrackId>             track_ids;
    std::map<TrackId, std::set<KeyId>> keys;

    bool empty() const { return track_ids.empty() && keys.empty(); }
    size_t key_count() const;
    bool is_track_selected(TrackId track_id) const;
    bool is_key_selected(TrackId track_id, KeyId key_id) const;
};

struct KeyRef
{
    TrackId track_id = INVALID_ID;
    KeyId   key_id   = INVALID_ID;

    bool operator==(const KeyRef&) const = default;
};

// One evaluated track value, produced by AnimationEngine::sample_at().
struct SampleUpdate
{
    std::string target_id;
    std::string property;
    float       value = 0.0f;
};

enum class PlaybackState : uint8_t
{
    Stopped,
    Playing,
    Paused,
};

// ─── Names ───────────────────────────────────────────────────────────────────

const char* interpolation_name(Interpolation interp);
const char* segment_ease_kind_name(SegmentEaseKind kind);
const char* segment_ease_mode_name(SegmentEaseMode mode);
const char* easing_preset_name(EasingPreset preset);
const char* playback_state_name(PlaybackState state);

std::optional<Interpolation>   parse_interpolation(std::string_view name);
std::optional<SegmentEaseKind> parse_segment_ease_kind(std::string_view name);
std::optional<SegmentEaseMode> parse_segment_ease_mode(std::string_view name);
std::optional<EasingPreset>    parse_easing_preset(std::string_view name);

}  // namespace keyforge
