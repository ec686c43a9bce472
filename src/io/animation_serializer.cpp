#include <algorithm>
#include <filesystem>
#include <fstream>
#include <keyforge/animation_document.hpp>
#include <keyforge/frame_time.hpp>
#include <keyforge/logger.hpp>
#include <keyforge/property_path.hpp>
#include <sstream>

#include "io/json_util.hpp"
#include "io/key_codec.hpp"

namespace keyforge
{

// ─── File I/O ────────────────────────────────────────────────────────────────

bool AnimationSerializer::save(const std::string& path, const AnimationDocument& doc)
{
    auto dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
    {
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec)
            KEYFORGE_LOG_WARN("anim.io", "cannot create {}: {}", dir.string(), ec.message());
    }

    std::ofstream file(path);
    if (!file.is_open())
    {
        KEYFORGE_LOG_ERROR("anim.io", "cannot open {} for writing", path);
        return false;
    }
    file << serialize_json(doc);
    if (!file.good())
    {
        KEYFORGE_LOG_ERROR("anim.io", "write to {} failed", path);
        return false;
    }
    KEYFORGE_LOG_INFO("anim.io",
                      "saved {} clips, {} tracks to {}",
                      doc.clips.size(),
                      doc.tracks.size(),
                      path);
    return true;
}

bool AnimationSerializer::load(const std::string& path, AnimationDocument& doc)
{
    std::ifstream file(path);
    if (!file.is_open())
    {
        KEYFORGE_LOG_WARN("anim.io", "cannot open {}", path);
        return false;
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    std::string json = ss.str();

    if (json.empty())
        return false;
    return deserialize_json(json, doc);
}

// ─── Writer ──────────────────────────────────────────────────────────────────

std::string AnimationSerializer::serialize_json(const AnimationDocument& doc)
{
    std::ostringstream os;
    os << "{\n";
    os << "  \"version\": " << doc.version << ",\n";
    os << "  \"fps\": " << doc.fps << ",\n";
    os << "  \"active_clip_id\": " << doc.active_clip_id << ",\n";
    os << "  \"zoom\": " << json::number(doc.zoom) << ",\n";
    os << "  \"pan\": " << json::number(doc.pan) << ",\n";
    os << "  \"last_used_fps\": " << doc.last_used_fps << ",\n";
    os << "  \"last_used_clip\": " << doc.last_used_clip << ",\n";
    os << "  \"auto_key\": " << json::boolean(doc.auto_key) << ",\n";

    os << "  \"snap\": {\n";
    os << "    \"enabled\": " << json::boolean(doc.snap.enabled) << ",\n";
    os << "    \"to_frames\": " << json::boolean(doc.snap.to_frames) << ",\n";
    os << "    \"to_keys\": " << json::boolean(doc.snap.to_keys) << ",\n";
    os << "    \"threshold_px\": " << json::number(doc.snap.threshold_px) << "\n";
    os << "  },\n";

    // Clips
    os << "  \"clips\": [\n";
    for (size_t ci = 0; ci < doc.clips.size(); ++ci)
    {
        const auto& clip = doc.clips[ci];
        os << "    {\n";
        os << "      \"id\": " << clip.id << ",\n";
        os << "      \"name\": " << json::quote(clip.name) << ",\n";
        os << "      \"start\": " << json::number(clip.start) << ",\n";
        os << "      \"end\": " << json::number(clip.end) << ",\n";
        os << "      \"loop\": " << json::boolean(clip.loop) << ",\n";
        os << "      \"speed\": " << json::number(clip.speed) << ",\n";
        os << "      \"track_ids\": [";
        for (size_t i = 0; i < clip.track_ids.size(); ++i)
        {
            if (i > 0)
                os << ", ";
            os << clip.track_ids[i];
        }
        os << "]\n";
        os << "    }";
        if (ci + 1 < doc.clips.size())
            os << ",";
        os << "\n";
    }
    os << "  ],\n";

    // Tracks
    os << "  \"tracks\": [\n";
    for (size_t ti = 0; ti < doc.tracks.size(); ++ti)
    {
        const auto& tr = doc.tracks[ti];
        os << "    {\n";
        os << "      \"id\": " << tr.id << ",\n";
        os << "      \"target_id\": " << json::quote(tr.target_id) << ",\n";
        os << "      \"property\": " << json::quote(tr.property) << ",\n";
        os << "      \"channel_id\": " << tr.channel.id << ",\n";
        os << "      \"muted\": " << json::boolean(tr.muted) << ",\n";
        os << "      \"locked\": " << json::boolean(tr.locked) << ",\n";
        os << "      \"keys\": [";
        for (size_t ki = 0; ki < tr.channel.keys.size(); ++ki)
        {
            os << (ki == 0 ? "\n" : ",\n");
            os << "        " << key_to_json(tr.channel.keys[ki]);
        }
        if (!tr.channel.keys.empty())
            os << "\n      ";
        os << "]\n";
        os << "    }";
        if (ti + 1 < doc.tracks.size())
            os << ",";
        os << "\n";
    }
    os << "  ],\n";

    // Markers
    os << "  \"markers\": [\n";
    for (size_t mi = 0; mi < doc.markers.size(); ++mi)
    {
        const auto& m = doc.markers[mi];
        os << "    {\"id\": " << m.id << ", \"t\": " << json::number(m.time)
           << ", \"label\": " << json::quote(m.label) << ", \"color\": " << json::quote(m.color)
           << "}";
        if (mi + 1 < doc.markers.size())
            os << ",";
        os << "\n";
    }
    os << "  ]\n";

    os << "}\n";
    return os.str();
}

// ─── Reader ──────────────────────────────────────────────────────────────────

namespace
{

uint32_t read_id(const json::Fields& f, std::string_view key)
{
    return json::read_id(f, key).value_or(INVALID_ID);
}

bool read_clip(const std::string& text, Clip& clip)
{
    auto f = json::parse_object(text);
    if (!f)
        return false;

    clip.id    = read_id(*f, "id");
    clip.name  = json::read_string(*f, "name", "Clip");
    clip.start = json::read_float(*f, "start", 0.0f);
    clip.end   = json::read_float(*f, "end", 5.0f);
    clip.loop  = json::read_bool(*f, "loop", true);
    clip.speed = json::read_float(*f, "speed", 1.0f);

    if (auto raw = json::read_raw(*f, "track_ids"))
    {
        auto items = json::parse_array(*raw);
        if (!items)
            return false;
        for (const auto& item : *items)
        {
            auto num = json::as_number(item);
            if (auto id = num ? json::to_id(*num) : std::nullopt)
                clip.track_ids.push_back(*id);
        }
    }
    return clip.id != INVALID_ID;
}

bool read_track(const std::string& text, Track& track)
{
    auto f = json::parse_object(text);
    if (!f)
        return false;

    track.id         = read_id(*f, "id");
    track.target_id  = json::read_string(*f, "target_id");
    track.property   = json::read_string(*f, "property");
    track.sink       = parse_property_path(track.property);
    track.channel.id = read_id(*f, "channel_id");
    track.muted      = json::read_bool(*f, "muted", false);
    track.locked     = json::read_bool(*f, "locked", false);

    if (auto raw = json::read_raw(*f, "keys"))
    {
        auto items = json::parse_array(*raw);
        if (!items)
            return false;
        for (const auto& item : *items)
        {
            auto key = key_from_json(item);
            if (!key)
            {
                KEYFORGE_LOG_WARN("anim.io", "track {}: skipping malformed key", track.id);
                continue;
            }
            track.channel.keys.push_back(std::move(*key));
        }
        track.channel.sort();
    }
    return track.id != INVALID_ID;
}

bool read_marker(const std::string& text, Marker& marker)
{
    auto f = json::parse_object(text);
    if (!f)
        return false;

    marker.id    = read_id(*f, "id");
    marker.time  = std::max(0.0f, json::read_float(*f, "t", 0.0f));
    marker.label = json::read_string(*f, "label");
    marker.color = json::read_string(*f, "color");
    return marker.id != INVALID_ID;
}

}  // anonymous namespace

bool AnimationSerializer::deserialize_json(const std::string& json, AnimationDocument& doc)
{
    auto f = json::parse_object(json);
    if (!f)
    {
        KEYFORGE_LOG_WARN("anim.io", "document is not a JSON object");
        return false;
    }

    AnimationDocument out;
    // Anything past FORMAT_VERSION is rejected below, so clamping one above it
    // keeps huge values out of the cast.
    out.version = static_cast<uint32_t>(json::to_int_clamped(
        json::read_number(*f, "version", 0.0), 0, static_cast<int>(AnimationDocument::FORMAT_VERSION) + 1));
    if (out.version == 0 || out.version > AnimationDocument::FORMAT_VERSION)
    {
        KEYFORGE_LOG_WARN("anim.io", "unsupported document version {}", out.version);
        return false;
    }

    out.fps            = json::to_int_clamped(json::read_number(*f, "fps", 30.0), MIN_FPS, MAX_FPS);
    out.active_clip_id = read_id(*f, "active_clip_id");
    out.zoom           = json::read_float(*f, "zoom", 100.0f);
    out.pan            = json::read_float(*f, "pan", 0.0f);
    out.last_used_fps  = json::to_int_clamped(
        json::read_number(*f, "last_used_fps", out.fps), MIN_FPS, MAX_FPS);
    out.last_used_clip = read_id(*f, "last_used_clip");
    out.auto_key       = json::read_bool(*f, "auto_key", false);

    if (auto raw = json::read_raw(*f, "snap"))
    {
        if (auto sf = json::parse_object(*raw))
        {
            out.snap.enabled   = json::read_bool(*sf, "enabled", true);
            out.snap.to_frames = json::read_bool(*sf, "to_frames", true);
            out.snap.to_keys   = json::read_bool(*sf, "to_keys", true);
            out.snap.threshold_px = json::read_float(*sf, "threshold_px", 8.0f);
        }
    }

    auto read_list = [&](std::string_view key, auto&& read_one) -> bool
    {
        auto raw = json::read_raw(*f, key);
        if (!raw)
            return true;
        auto items = json::parse_array(*raw);
        if (!items)
            return false;
        for (const auto& item : *items)
            read_one(item);
        return true;
    };

    bool ok = read_list("clips",
                        [&](const std::string& item)
                        {
                            Clip clip;
                            if (read_clip(item, clip))
                                out.clips.push_back(std::move(clip));
                            else
                                KEYFORGE_LOG_WARN("anim.io", "skipping malformed clip");
                        })
              && read_list("tracks",
                           [&](const std::string& item)
                           {
                               Track track;
                               if (read_track(item, track))
                                   out.tracks.push_back(std::move(track));
                               else
                                   KEYFORGE_LOG_WARN("anim.io", "skipping malformed track");
                           })
              && read_list("markers",
                           [&](const std::string& item)
                           {
                               Marker marker;
                               if (read_marker(item, marker))
                                   out.markers.push_back(std::move(marker));
                           });
    if (!ok)
    {
        KEYFORGE_LOG_WARN("anim.io", "malformed document array");
        return false;
    }

    doc = std::move(out);
    return true;
}

}  // namespace keyforge
