#pragma once

#include <keyforge/animation_types.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace keyforge
{

// One copied key with the track it came from.
struct ClipboardEntry
{
    TrackId track_id = INVALID_ID;
    Key     key;
};

// Single-line JSON object for a key:
//   {"id":3,"t":1.5,"v":2,"interp":"bezier","tanIn":0,"tanOut":1.2,
//    "segEase":{"type":"bounce","mode":"out","strength":1}}
// Absent tangents and segment easing are omitted.
std::string key_to_json(const Key& key);

// nullopt when the object is malformed or lacks "t" or "v". Negative times
// are clamped to 0; an unknown interpolation falls back to Linear.
std::optional<Key> key_from_json(std::string_view text);

// Clipboard payload: a JSON array of {"trackId":N,"key":{...}}.
std::string encode_key_clipboard(const std::vector<ClipboardEntry>& entries);

// nullopt for anything that is not a well-formed payload. Entries with a
// malformed key are skipped.
std::optional<std::vector<ClipboardEntry>> decode_key_clipboard(std::string_view text);

}  // namespace keyforge
