#pragma once

#include <cstdint>
#include <functional>
#include <keyforge/animation_document.hpp>
#include <keyforge/animation_types.hpp>
#include <keyforge/clipboard.hpp>
#include <keyforge/engine_config.hpp>
#include <keyforge/fwd.hpp>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace keyforge
{

using PlaybackCallback = std::function<void(PlaybackState)>;

// AnimationEngine: owns clips, tracks, markers, selection and the playhead.
//
// Every public operation succeeds structurally: stale ids are ignored,
// out-of-range inputs are clamped, and nothing throws. Key edits on a locked
// track are ignored. When an UndoManager is attached, each key edit pushes one
// undo action that restores the affected channels.
//
// Not thread-safe: the engine has a single owner that drives both playback
// ticks and edits.
class AnimationEngine
{
   public:
    explicit AnimationEngine(EngineConfig config = {});
    ~AnimationEngine() = default;

    AnimationEngine(const AnimationEngine&)            = delete;
    AnimationEngine& operator=(const AnimationEngine&) = delete;

    const EngineConfig& config() const { return config_; }

    // ─── Clips ───────────────────────────────────────────────────────────

    // New clip with the configured default range; becomes active and moves
    // the playhead to its start.
    ClipId create_clip(const std::string& name = "Clip");

    // Tracks survive. The active clip falls back to the last remaining clip.
    void remove_clip(ClipId clip_id);

    // INVALID_ID clears the active clip. The playhead is clamped into the new
    // clip's window.
    void set_active_clip(ClipId clip_id);

    ClipId      active_clip_id() const { return active_clip_id_; }
    const Clip* active_clip() const;
    const Clip* clip(ClipId clip_id) const;

    const std::vector<ClipId>& clip_order() const { return clip_order_; }
    size_t clip_count() const { return clips_.size(); }

    void rename_clip(ClipId clip_id, const std::string& name);
    void set_clip_loop(ClipId clip_id, bool loop);

    // Active clip. start >= 0, end >= start; the playhead is re-clamped.
    void set_clip_range(float start, float end);

    // Active clip. Clamped to [0.001, 100].
    void set_clip_speed(float speed);

    void add_track_to_clip(ClipId clip_id, TrackId track_id);
    void remove_track_from_clip(ClipId clip_id, TrackId track_id);

    // ─── Tracks ──────────────────────────────────────────────────────────

    // Returns the track for (target, property), creating it and appending it
    // to the active clip when missing.
    TrackId ensure_track(const std::string& target_id, const std::string& property);

    // INVALID_ID when no such track exists.
    TrackId track_id_for(const std::string& target_id, const std::string& property) const;

    const Track* track(TrackId track_id) const;
    const std::map<TrackId, Track>& tracks() const { return tracks_; }
    size_t track_count() const { return tracks_.size(); }

    void set_track_muted(TrackId track_id, bool muted);
    void set_track_locked(TrackId track_id, bool locked);

    void toggle_track_solo(TrackId track_id);
    const std::set<TrackId>& solo_track_ids() const { return solo_track_ids_; }
    bool is_track_soloed(TrackId track_id) const;

    // Removes the track and every reference to it (clips, selection, solo).
    void remove_track(TrackId track_id);

    // Called by the scene when an object is deleted.
    void remove_tracks_for_target(const std::string& target_id);

    // Sorted key times of a track; empty for unknown tracks. The reference
    // is invalidated by any edit of that track.
    const std::vector<float>& sorted_key_times(TrackId track_id) const;

    // ─── Keys ────────────────────────────────────────────────────────────

    // Inserts a key at `time` snapped to the nearest frame. An existing key at
    // that frame is updated in place instead. Returns the key's id, or
    // INVALID_ID when the track is missing or locked.
    KeyId insert_key(TrackId       track_id,
                     float         time,
                     float         value,
                     Interpolation interp = Interpolation::Linear);

    void remove_key(TrackId track_id, KeyId key_id);

    // Time is clamped to >= 0; the channel is re-sorted.
    void move_key(TrackId track_id, KeyId key_id, float time);

    // Like move_key(), but the time goes through the snap resolver with every
    // other key of the active clip as a candidate.
    void drag_key(TrackId track_id, KeyId key_id, float raw_time);

    void set_key_value(TrackId track_id, KeyId key_id, float value);

    // Clears the key's segment easing.
    void set_interpolation(TrackId track_id, KeyId key_id, Interpolation interp);

    void set_key_tangent_in(TrackId track_id, KeyId key_id, std::optional<float> tangent);
    void set_key_tangent_out(TrackId track_id, KeyId key_id, std::optional<float> tangent);

    // Setting an ease clears this key's outgoing and the next key's incoming
    // tangent. nullopt removes the ease.
    void set_segment_ease(TrackId track_id, KeyId key_id, std::optional<SegmentEase> ease);

    // Classic presets reshape Bezier tangents of the key and its neighbours
    // with k = 1 + 1.5 * clamp(strength, 0, 3):
    //
    //   easeIn      key.in = 0, prev.out = m * k
    //   easeOut     key.out = 0, next.in = m * 0.75 * k
    //   easeInOut   both sides, neighbour tangent m * 0.75 * k
    //   back*       key and neighbour tangents both m * k
    //
    // where m is the slope towards the neighbour. A side without a neighbour
    // is left alone. bounce/elastic set an "out" segment ease on the segment
    // to the next key and need one. Keys with no neighbour at all are skipped.
    void apply_easing_preset(const std::vector<KeyRef>& keys,
                             EasingPreset               preset,
                             float                      strength = 1.0f);

    const Key* key(TrackId track_id, KeyId key_id) const;
    size_t total_key_count() const;

    // Key at the frame nearest `time`, or INVALID_ID.
    KeyId find_key_at(TrackId track_id, float time) const;
    bool  has_key_at(const std::string& target_id, const std::string& property, float time) const;

    // Removes the key at `time` if present, otherwise inserts one.
    void toggle_key_at(const std::string& target_id,
                       const std::string& property,
                       float              time,
                       float              value,
                       Interpolation      interp = Interpolation::Linear);

    // ─── Selection ───────────────────────────────────────────────────────

    const Selection& selection() const { return selection_; }
    std::vector<KeyRef> selected_keys() const;

    void clear_selection();

    // Non-additive selection replaces both the selected tracks and keys.
    void select_track(TrackId track_id, bool additive = false);
    void select_key(TrackId track_id, KeyId key_id, bool additive = false);
    void deselect_key(TrackId track_id, KeyId key_id);

    void select_all_keys();
    void select_keys_in_range(float t0, float t1, bool additive = false);

    void delete_selected_keys();

    // Shift selected keys by dt (and dv when given). Times stay >= 0 and are
    // frame-quantized when snap_to_fps is set.
    void nudge_selected_keys(float dt, std::optional<float> dv = std::nullopt, bool snap_to_fps = true);

    // Shift every key of the listed tracks (group drag).
    void nudge_keys_for_tracks(const std::vector<TrackId>& track_ids, float dt, bool snap_to_fps = false);

    void nudge_keys_subset(const std::vector<KeyRef>& keys,
                           float                      dt,
                           std::optional<float>       dv          = std::nullopt,
                           bool                       snap_to_fps = false);

    // ─── Clipboard ───────────────────────────────────────────────────────

    // nullptr restores the built-in in-memory clipboard. The sink must
    // outlive the engine or be detached first.
    void set_clipboard(ClipboardSink* sink);
    ClipboardSink& clipboard() { return clipboard_ ? *clipboard_ : default_clipboard_; }

    // Returns the number of keys copied.
    size_t copy_selected_keys();
    void   cut_selected_keys();

    // Re-bases the copied keys so the earliest lands on the playhead. Keys get
    // fresh ids; tracks that no longer exist or are locked are skipped.
    // Returns the pasted keys. A missing or corrupt payload pastes nothing.
    std::vector<KeyRef> paste_keys_at_playhead();

    // ─── Markers ─────────────────────────────────────────────────────────

    MarkerId add_marker(float time, const std::string& label = "", const std::string& color = "");
    void     move_marker(MarkerId marker_id, float time);
    void     remove_marker(MarkerId marker_id);
    void     set_marker_label(MarkerId marker_id, const std::string& label);
    void     set_marker_color(MarkerId marker_id, const std::string& color);

    const Marker*              marker(MarkerId marker_id) const;
    const std::vector<Marker>& markers() const { return markers_; }

    // ─── Snapping ────────────────────────────────────────────────────────

    const SnapSettings& snap_settings() const { return snap_; }
    void set_snapping(bool enabled);
    void set_snap_to_frames(bool enabled);
    void set_snap_to_keys(bool enabled);
    void set_snap_threshold_px(float px);  // clamped to [0, 64]

    // Snap a raw time, using the keys of the active clip as candidates.
    float snap_time(float time) const;

    // ─── View ────────────────────────────────────────────────────────────

    float zoom() const { return zoom_; }
    void  set_zoom(float pixels_per_second);  // clamped to the configured limits
    float pan() const { return pan_; }
    void  set_pan(float seconds);

    // ─── Playback ────────────────────────────────────────────────────────

    void play();
    // Freezes the playhead; valid from any state, including Stopped.
    void pause();
    // Rewinds to the active clip's start.
    void stop();
    void toggle_play();
    // Toggles looping on the active clip.
    void toggle_loop();

    PlaybackState playback_state() const { return state_; }
    bool is_playing() const { return state_ == PlaybackState::Playing; }

    float playhead() const { return playhead_; }

    // Clamp into the active clip's window; no snapping.
    void set_playhead(float time);

    // Clamp, then snap through the resolver.
    void seek_seconds(float time);
    void seek_frame(int64_t frame);

    void step_forward();
    void step_backward();

    // Jump to the nearest key time strictly before/after the playhead inside
    // the active clip's window, across all tracks.
    void prev_key();
    void next_key();

    // Advance the playhead by dt seconds of wall time scaled by clip speed.
    // Wraps when looping, otherwise clamps to the end and pauses. The result is
    // quantized to a frame. Returns true while still playing.
    bool advance(float dt);

    int  fps() const { return fps_; }
    void set_fps(float fps);  // rounded, clamped to [1, 240]

    int    last_used_fps() const { return last_used_fps_; }
    ClipId last_used_clip() const { return last_used_clip_; }

    void set_on_playback_change(PlaybackCallback cb) { on_playback_change_ = std::move(cb); }

    // ─── Sampling ────────────────────────────────────────────────────────

    // Evaluate every active track of the active clip at `time` (clamped into
    // the clip window). Solo overrides mute. Empty without an active clip.
    std::vector<SampleUpdate> sample_at(float time) const;

    // Sample and write the values to the scene sink, one batch per target.
    // Auto-key is suppressed for the duration.
    void apply_sample_at(float time);

    // The sink must outlive the engine or be detached first.
    void       set_scene_sink(SceneSink* sink) { scene_sink_ = sink; }
    SceneSink* scene_sink() const { return scene_sink_; }

    bool is_sampling() const { return sampling_; }

    // ─── Auto-key ────────────────────────────────────────────────────────

    bool auto_key() const { return auto_key_; }
    void set_auto_key(bool enabled) { auto_key_ = enabled; }
    void toggle_auto_key() { auto_key_ = !auto_key_; }

    // Called by the scene when the user edits an animatable property. With
    // auto-key on and no sample application in flight, keys the value at the
    // playhead. Returns the key id, or INVALID_ID when nothing was recorded.
    KeyId notify_property_edited(const std::string& target_id,
                                 const std::string& property,
                                 float              value);

    // ─── Undo ────────────────────────────────────────────────────────────

    // The manager must outlive the engine or be detached first; its actions
    // refer back to this engine.
    void         set_undo_manager(UndoManager* undo) { undo_ = undo; }
    UndoManager* undo_manager() const { return undo_; }

    // ─── Persistence ─────────────────────────────────────────────────────

    AnimationDocument capture_document() const;

    // Replaces clips, tracks and markers. Dangling references, duplicate
    // tracks and out-of-range values are repaired. Playback stops and the
    // selection, solo set and undo history references are reset.
    void restore_document(const AnimationDocument& doc);

   private:
    // Tracks an edit touches; channel contents are captured only while an
    // undo manager is attached.
    struct ChannelSnapshot
    {
        std::vector<TrackId>                     track_ids;
        std::vector<std::pair<TrackId, Channel>> channels;
    };

    EngineConfig config_;

    std::map<ClipId, Clip>  clips_;
    std::vector<ClipId>     clip_order_;
    ClipId                  active_clip_id_ = INVALID_ID;
    std::map<TrackId, Track> tracks_;
    std::set<TrackId>       solo_track_ids_;
    std::vector<Marker>     markers_;
    Selection               selection_;

    mutable std::map<TrackId, std::vector<float>> sorted_cache_;

    PlaybackState state_    = PlaybackState::Stopped;
    float         playhead_ = 0.0f;
    int           fps_      = 30;
    int           last_used_fps_  = 30;
    ClipId        last_used_clip_ = INVALID_ID;

    SnapSettings snap_;
    float        zoom_ = 100.0f;
    float        pan_  = 0.0f;

    bool auto_key_ = false;
    bool sampling_ = false;

    SceneSink*      scene_sink_ = nullptr;
    ClipboardSink*  clipboard_  = nullptr;
    MemoryClipboard default_clipboard_;
    UndoManager*    undo_ = nullptr;

    PlaybackCallback on_playback_change_;

    uint32_t next_clip_id_    = 1;
    uint32_t next_track_id_   = 1;
    uint32_t next_channel_id_ = 1;
    uint32_t next_key_id_     = 1;
    uint32_t next_marker_id_  = 1;

    Clip*  active_clip_mut();
    Track* track_mut(TrackId track_id);

    // Track that accepts key edits: exists and is not locked.
    Track* editable_track(TrackId track_id, const char* op);

    void  clamp_playhead();
    void  set_state(PlaybackState state);
    std::pair<float, float> playback_window() const;

    void invalidate_cache(TrackId track_id);
    void prune_selection(TrackId track_id);
    void drop_track_references(TrackId track_id);

    // Undo support: snapshot the channels an edit will touch, then commit.
    ChannelSnapshot snapshot_channels(const std::vector<TrackId>& track_ids) const;
    void commit_edit(const std::string& description, ChannelSnapshot before);
    void restore_channels(const ChannelSnapshot& snapshot);

    std::vector<TrackId> key_track_ids(const std::vector<KeyRef>& keys) const;
    void nudge_keys(const std::map<TrackId, std::set<KeyId>>& keys,
                    float                                     dt,
                    std::optional<float>                      dv,
                    bool                                      snap_to_fps,
                    const std::string&                        description);
};

}  // namespace keyforge
