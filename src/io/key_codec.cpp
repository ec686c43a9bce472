#include "io/key_codec.hpp"

#include <algorithm>
#include <keyforge/easing.hpp>
#include <sstream>

#include "io/json_util.hpp"

namespace keyforge
{

std::string key_to_json(const Key& key)
{
    std::ostringstream os;
    os << "{\"id\":" << key.id;
    os << ",\"t\":" << json::number(key.time);
    os << ",\"v\":" << json::number(key.value);
    os << ",\"interp\":" << json::quote(interpolation_name(key.interp));
    if (key.tangent_in)
        os << ",\"tanIn\":" << json::number(*key.tangent_in);
    if (key.tangent_out)
        os << ",\"tanOut\":" << json::number(*key.tangent_out);
    if (key.seg_ease)
    {
        os << ",\"segEase\":{\"type\":" << json::quote(segment_ease_kind_name(key.seg_ease->kind))
           << ",\"mode\":" << json::quote(segment_ease_mode_name(key.seg_ease->mode))
           << ",\"strength\":" << json::number(key.seg_ease->strength) << "}";
    }
    os << "}";
    return os.str();
}

std::optional<Key> key_from_json(std::string_view text)
{
    auto fields = json::parse_object(text);
    if (!fields)
        return std::nullopt;

    auto t = json::read_optional_number(*fields, "t");
    auto v = json::read_optional_number(*fields, "v");
    if (!t || !v)
        return std::nullopt;

    // Values outside the float range reject the whole key.
    auto time  = json::to_float(*t);
    auto value = json::to_float(*v);
    if (!time || !value)
        return std::nullopt;

    Key key;
    key.id    = json::read_id(*fields, "id").value_or(INVALID_ID);
    key.time  = std::max(0.0f, *time);
    key.value = *value;
    key.interp =
        parse_interpolation(json::read_string(*fields, "interp")).value_or(Interpolation::Linear);

    if (auto tan = json::read_optional_number(*fields, "tanIn"))
    {
        key.tangent_in = json::to_float(*tan);
        if (!key.tangent_in)
            return std::nullopt;
    }
    if (auto tan = json::read_optional_number(*fields, "tanOut"))
    {
        key.tangent_out = json::to_float(*tan);
        if (!key.tangent_out)
            return std::nullopt;
    }

    if (auto raw = json::read_raw(*fields, "segEase"); raw && !json::is_null(*raw))
    {
        auto ease_fields = json::parse_object(*raw);
        if (!ease_fields)
            return std::nullopt;
        auto kind = parse_segment_ease_kind(json::read_string(*ease_fields, "type"));
        if (kind)
        {
            SegmentEase seg;
            seg.kind = *kind;
            seg.mode = parse_segment_ease_mode(json::read_string(*ease_fields, "mode"))
                           .value_or(SegmentEaseMode::Out);
            seg.strength = static_cast<float>(std::clamp(
                json::read_number(*ease_fields, "strength", 1.0), 0.0, double{ease::MAX_STRENGTH}));
            key.seg_ease = seg;
        }
    }
    return key;
}

std::string encode_key_clipboard(const std::vector<ClipboardEntry>& entries)
{
    std::string out = "[";
    for (size_t i = 0; i < entries.size(); ++i)
    {
        if (i > 0)
            out += ",";
        out += "{\"trackId\":" + std::to_string(entries[i].track_id);
        out += ",\"key\":" + key_to_json(entries[i].key) + "}";
    }
    out += "]";
    return out;
}

std::optional<std::vector<ClipboardEntry>> decode_key_clipboard(std::string_view text)
{
    auto items = json::parse_array(text);
    if (!items)
        return std::nullopt;

    std::vector<ClipboardEntry> entries;
    entries.reserve(items->size());
    for (const auto& item : *items)
    {
        auto fields = json::parse_object(item);
        if (!fields)
            return std::nullopt;
        auto track = json::read_id(*fields, "trackId");
        auto raw   = json::read_raw(*fields, "key");
        if (!track || !raw)
            continue;
        auto key = key_from_json(*raw);
        if (!key)
            continue;
        entries.push_back({*track, std::move(*key)});
    }
    return entries;
}

}  // namespace keyforge
