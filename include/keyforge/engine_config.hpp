#pragma once

#include <keyforge/animation_types.hpp>
#include <keyforge/logger.hpp>
#include <optional>
#include <string>

namespace keyforge
{

// Construction-time settings for an AnimationEngine, persisted as JSON.
// Missing or unknown fields keep their defaults; out-of-range values are
// clamped on load.
struct EngineConfig
{
    int   default_fps         = 30;    // [MIN_FPS, MAX_FPS]
    float default_clip_length = 5.0f;  // seconds, > 0
    bool  default_clip_loop   = true;

    float default_zoom = 100.0f;  // timeline pixels per second
    float min_zoom     = 10.0f;
    float max_zoom     = 1000.0f;

    // Minimum interval between playhead sync notifications while playing.
    float ui_sync_interval = 0.1f;

    SnapSettings snap;
    bool         auto_key = false;

    // Process-wide logger level applied when an engine is constructed. Unset
    // leaves the host's level alone.
    std::optional<LogLevel> log_level;

    // Clamp every field into its valid range.
    void sanitize();

    std::string serialize() const;

    // Returns false when `json` is not an object; fields are applied otherwise.
    bool deserialize(const std::string& json);

    // Returns true on success.
    bool save(const std::string& path) const;
    bool load(const std::string& path);

    // ~/.config/keyforge/engine.json
    static std::string default_path();
};

}  // namespace keyforge
