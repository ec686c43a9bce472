#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <keyforge/engine_config.hpp>
#include <keyforge/frame_time.hpp>
#include <sstream>

#include "io/json_util.hpp"

namespace keyforge
{

void EngineConfig::sanitize()
{
    default_fps = clamp_fps(static_cast<float>(default_fps));
    if (!(default_clip_length > 0.0f))
        default_clip_length = 5.0f;

    min_zoom = std::max(1.0f, min_zoom);
    max_zoom = std::max(min_zoom, max_zoom);
    default_zoom = std::clamp(default_zoom, min_zoom, max_zoom);

    ui_sync_interval = std::max(0.0f, ui_sync_interval);
    snap.threshold_px = std::clamp(snap.threshold_px, 0.0f, 64.0f);
}

// ─── JSON ────────────────────────────────────────────────────────────────────

std::string EngineConfig::serialize() const
{
    std::ostringstream os;
    os << "{\n";
    os << "  \"default_fps\": " << default_fps << ",\n";
    os << "  \"default_clip_length\": " << json::number(default_clip_length) << ",\n";
    os << "  \"default_clip_loop\": " << json::boolean(default_clip_loop) << ",\n";
    os << "  \"default_zoom\": " << json::number(default_zoom) << ",\n";
    os << "  \"min_zoom\": " << json::number(min_zoom) << ",\n";
    os << "  \"max_zoom\": " << json::number(max_zoom) << ",\n";
    os << "  \"ui_sync_interval\": " << json::number(ui_sync_interval) << ",\n";
    os << "  \"snap\": {\n";
    os << "    \"enabled\": " << json::boolean(snap.enabled) << ",\n";
    os << "    \"to_frames\": " << json::boolean(snap.to_frames) << ",\n";
    os << "    \"to_keys\": " << json::boolean(snap.to_keys) << ",\n";
    os << "    \"threshold_px\": " << json::number(snap.threshold_px) << "\n";
    os << "  },\n";
    os << "  \"auto_key\": " << json::boolean(auto_key);
    if (log_level)
        os << ",\n  \"log_level\": " << json::quote(Logger::level_to_string(*log_level));
    os << "\n";
    os << "}\n";
    return os.str();
}

bool EngineConfig::deserialize(const std::string& text)
{
    auto f = json::parse_object(text);
    if (!f)
    {
        KEYFORGE_LOG_WARN("anim.config", "config is not a JSON object");
        return false;
    }

    default_fps =
        json::to_int_clamped(json::read_number(*f, "default_fps", default_fps), MIN_FPS, MAX_FPS);
    default_clip_length = json::read_float(*f, "default_clip_length", default_clip_length);
    default_clip_loop = json::read_bool(*f, "default_clip_loop", default_clip_loop);
    default_zoom      = json::read_float(*f, "default_zoom", default_zoom);
    min_zoom          = json::read_float(*f, "min_zoom", min_zoom);
    max_zoom          = json::read_float(*f, "max_zoom", max_zoom);
    ui_sync_interval  = json::read_float(*f, "ui_sync_interval", ui_sync_interval);
    auto_key = json::read_bool(*f, "auto_key", auto_key);

    if (auto raw = json::read_raw(*f, "snap"))
    {
        if (auto sf = json::parse_object(*raw))
        {
            snap.enabled   = json::read_bool(*sf, "enabled", snap.enabled);
            snap.to_frames = json::read_bool(*sf, "to_frames", snap.to_frames);
            snap.to_keys   = json::read_bool(*sf, "to_keys", snap.to_keys);
            snap.threshold_px = json::read_float(*sf, "threshold_px", snap.threshold_px);
        }
    }

    if (auto level = Logger::parse_level(json::read_string(*f, "log_level")))
        log_level = *level;

    sanitize();
    return true;
}

// ─── File I/O ────────────────────────────────────────────────────────────────

bool EngineConfig::save(const std::string& path) const
{
    auto dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
    {
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec)
            KEYFORGE_LOG_WARN("anim.config", "cannot create {}: {}", dir.string(), ec.message());
    }

    std::ofstream out(path);
    if (!out.is_open())
    {
        KEYFORGE_LOG_ERROR("anim.config", "cannot open {} for writing", path);
        return false;
    }
    out << serialize();
    return out.good();
}

bool EngineConfig::load(const std::string& path)
{
    std::ifstream in(path);
    if (!in.is_open())
    {
        KEYFORGE_LOG_DEBUG("anim.config", "no config at {}", path);
        return false;
    }
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    return deserialize(text);
}

std::string EngineConfig::default_path()
{
    const char* home = std::getenv("HOME");
    if (!home)
        home = std::getenv("USERPROFILE");
    if (!home)
        return "engine.json";

    std::filesystem::path dir = std::filesystem::path(home) / ".config" / "keyforge";
    return (dir / "engine.json").string();
}

}  // namespace keyforge
