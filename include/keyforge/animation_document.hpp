#pragma once

#include <cstdint>
#include <keyforge/animation_types.hpp>
#include <string>
#include <vector>

namespace keyforge
{

// Persisted state of an AnimationEngine: the animation graph plus the view
// and playback preferences that travel with it. Runtime state (playhead,
// playback state, selection, solo set) is not part of a document.
struct AnimationDocument
{
    static constexpr uint32_t FORMAT_VERSION = 1;

    uint32_t version = FORMAT_VERSION;

    std::vector<Clip>   clips;  // in clip order
    std::vector<Track>  tracks;
    std::vector<Marker> markers;

    ClipId active_clip_id = INVALID_ID;
    int    fps            = 30;

    // View state
    float zoom = 100.0f;
    float pan  = 0.0f;

    int    last_used_fps  = 30;
    ClipId last_used_clip = INVALID_ID;

    SnapSettings snap;
    bool         auto_key = false;
};

// JSON persistence for AnimationDocument. All methods are static.
class AnimationSerializer
{
   public:
    // Returns true on success.
    static bool save(const std::string& path, const AnimationDocument& doc);

    // Returns false when the file is missing, malformed, or written by a
    // newer format version. `doc` is left untouched on failure.
    static bool load(const std::string& path, AnimationDocument& doc);

    static std::string serialize_json(const AnimationDocument& doc);
    static bool        deserialize_json(const std::string& json, AnimationDocument& doc);
};

}  // namespace keyforge
