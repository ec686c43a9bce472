#include <gtest/gtest.h>

#include <clocale>
#include <cmath>
#include <filesystem>
#include <keyforge/animation_document.hpp>
#include <keyforge/animation_engine.hpp>
#include <string>
#include <vector>

#include "io/json_util.hpp"
#include "io/key_codec.hpp"

using namespace keyforge;

namespace
{

// Engine with one clip, two tracks, eased keys and a marker.
void build_scene(AnimationEngine& engine)
{
    engine.create_clip("Walk");
    engine.set_clip_range(0.5f, 4.0f);
    engine.set_clip_speed(1.5f);
    TrackId px = engine.ensure_track("cube", "position.x");
    TrackId md = engine.ensure_track("cube", "mod.bend1.angle");

    KeyId a = engine.insert_key(px, 0.5f, 0.0f, Interpolation::Bezier);
    engine.insert_key(px, 2.0f, 10.0f, Interpolation::Bezier);
    engine.set_key_tangent_out(px, a, 2.5f);
    KeyId c = engine.insert_key(md, 1.0f, 90.0f);
    engine.insert_key(md, 3.0f, 0.0f);
    engine.set_segment_ease(md, c, SegmentEase{SegmentEaseKind::Elastic, SegmentEaseMode::InOut, 2.0f});
    engine.set_track_muted(md, true);

    engine.add_marker(1.25f, "Contact \"left\"", "#ff0000");
    engine.set_fps(24.0f);
    engine.set_zoom(250.0f);
    engine.set_pan(0.75f);
    engine.set_snap_to_keys(false);
    engine.set_auto_key(true);
}

std::filesystem::path temp_file(const std::string& name)
{
    return std::filesystem::temp_directory_path() / "keyforge_test" / name;
}

}  // anonymous namespace

// ─── Round trip ──────────────────────────────────────────────────────────────

TEST(AnimationSerializer, RoundTripThroughEngine)
{
    AnimationEngine src;
    build_scene(src);
    std::string json = AnimationSerializer::serialize_json(src.capture_document());

    AnimationDocument doc;
    ASSERT_TRUE(AnimationSerializer::deserialize_json(json, doc));
    AnimationEngine dst;
    dst.restore_document(doc);

    ASSERT_EQ(dst.clip_count(), 1u);
    const Clip* clip = dst.active_clip();
    ASSERT_NE(clip, nullptr);
    EXPECT_EQ(clip->name, "Walk");
    EXPECT_FLOAT_EQ(clip->start, 0.5f);
    EXPECT_FLOAT_EQ(clip->end, 4.0f);
    EXPECT_FLOAT_EQ(clip->speed, 1.5f);
    EXPECT_EQ(clip->track_ids.size(), 2u);

    TrackId px = dst.track_id_for("cube", "position.x");
    TrackId md = dst.track_id_for("cube", "mod.bend1.angle");
    ASSERT_NE(px, INVALID_ID);
    ASSERT_NE(md, INVALID_ID);
    EXPECT_EQ(dst.track(px)->channel, src.track(px)->channel);
    EXPECT_EQ(dst.track(md)->channel, src.track(md)->channel);
    EXPECT_TRUE(dst.track(md)->muted);
    ASSERT_TRUE(dst.track(md)->sink.has_value());
    EXPECT_TRUE(std::holds_alternative<ModifierTarget>(*dst.track(md)->sink));

    ASSERT_EQ(dst.markers().size(), 1u);
    EXPECT_EQ(dst.markers()[0].label, "Contact \"left\"");
    EXPECT_EQ(dst.markers()[0].color, "#ff0000");
    EXPECT_FLOAT_EQ(dst.markers()[0].time, 1.25f);

    EXPECT_EQ(dst.fps(), 24);
    EXPECT_FLOAT_EQ(dst.zoom(), 250.0f);
    EXPECT_FLOAT_EQ(dst.pan(), 0.75f);
    EXPECT_FALSE(dst.snap_settings().to_keys);
    EXPECT_TRUE(dst.auto_key());
    EXPECT_EQ(dst.playback_state(), PlaybackState::Stopped);
    EXPECT_FLOAT_EQ(dst.playhead(), 0.5f);
}

TEST(AnimationSerializer, SaveAndLoadFile)
{
    auto path = temp_file("roundtrip.json");
    std::filesystem::remove_all(path.parent_path());

    AnimationEngine src;
    build_scene(src);
    ASSERT_TRUE(AnimationSerializer::save(path.string(), src.capture_document()));

    AnimationDocument doc;
    ASSERT_TRUE(AnimationSerializer::load(path.string(), doc));
    EXPECT_EQ(doc.clips.size(), 1u);
    EXPECT_EQ(doc.tracks.size(), 2u);
    EXPECT_EQ(doc.fps, 24);

    std::filesystem::remove_all(path.parent_path());
}

TEST(AnimationSerializer, MissingFileFails)
{
    AnimationDocument doc;
    doc.fps = 12;
    EXPECT_FALSE(AnimationSerializer::load(temp_file("does_not_exist.json").string(), doc));
    EXPECT_EQ(doc.fps, 12);
}

// ─── Rejection ───────────────────────────────────────────────────────────────

TEST(AnimationSerializer, RejectsNewerVersion)
{
    AnimationDocument doc;
    doc.fps = 12;
    EXPECT_FALSE(AnimationSerializer::deserialize_json("{\"version\": 2, \"fps\": 60}", doc));
    EXPECT_EQ(doc.fps, 12);
}

TEST(AnimationSerializer, RejectsOutOfRangeVersion)
{
    AnimationDocument doc;
    EXPECT_FALSE(AnimationSerializer::deserialize_json("{\"version\": 1e20}", doc));
    EXPECT_FALSE(AnimationSerializer::deserialize_json("{\"version\": -1}", doc));
    EXPECT_FALSE(AnimationSerializer::deserialize_json("{\"version\": 0.5}", doc));
}

TEST(AnimationSerializer, RejectsMissingVersion)
{
    AnimationDocument doc;
    EXPECT_FALSE(AnimationSerializer::deserialize_json("{\"fps\": 60}", doc));
}

TEST(AnimationSerializer, RejectsNonObject)
{
    AnimationDocument doc;
    EXPECT_FALSE(AnimationSerializer::deserialize_json("", doc));
    EXPECT_FALSE(AnimationSerializer::deserialize_json("[1, 2]", doc));
    EXPECT_FALSE(AnimationSerializer::deserialize_json("{\"version\": 1", doc));
}

TEST(AnimationSerializer, RejectsMalformedArray)
{
    AnimationDocument doc;
    EXPECT_FALSE(AnimationSerializer::deserialize_json("{\"version\": 1, \"clips\": {}}", doc));
}

TEST(AnimationSerializer, SkipsMalformedEntries)
{
    const std::string json = R"({
        "version": 1,
        "clips": [{"id": 0, "name": "bad"}, {"id": 3, "name": "good", "track_ids": [7]}],
        "tracks": [
            {"id": 7, "target_id": "cube", "property": "scale.x",
             "keys": [{"id": 1, "t": 0, "v": 1}, {"id": 2, "v": 5}, {"id": 3, "t": 2, "v": 3}]},
            {"target_id": "orphan", "property": "scale.y"}
        ],
        "markers": [{"id": 1, "t": -3, "label": "start"}]
    })";

    AnimationDocument doc;
    ASSERT_TRUE(AnimationSerializer::deserialize_json(json, doc));
    ASSERT_EQ(doc.clips.size(), 1u);
    EXPECT_EQ(doc.clips[0].name, "good");
    ASSERT_EQ(doc.tracks.size(), 1u);
    EXPECT_EQ(doc.tracks[0].channel.size(), 2u);
    ASSERT_EQ(doc.markers.size(), 1u);
    EXPECT_FLOAT_EQ(doc.markers[0].time, 0.0f);
}

TEST(AnimationSerializer, OutOfRangeNumbersFallBack)
{
    const std::string json = R"({
        "version": 1, "fps": 1e12, "last_used_fps": -1e12,
        "zoom": 1e300, "pan": -1e39, "active_clip_id": 1e20,
        "snap": {"threshold_px": 1e300},
        "clips": [
            {"id": 1e20, "name": "huge"},
            {"id": -1, "name": "negative"},
            {"id": 2.5, "name": "fraction"},
            {"id": 4, "name": "ok", "start": 1e300, "end": 2, "speed": -1e300,
             "track_ids": [1e20, 7, 2.5, -3]}
        ],
        "tracks": [
            {"id": 7, "channel_id": 1e20, "target_id": "cube", "property": "position.x",
             "keys": [{"id": 1e20, "t": 0, "v": 1}, {"id": 2, "t": 1e300, "v": 0},
                      {"id": 3, "t": 1, "v": 2, "tanOut": 1e39}]}
        ],
        "markers": [{"id": 5, "t": 1e300}]
    })";

    AnimationDocument doc;
    ASSERT_TRUE(AnimationSerializer::deserialize_json(json, doc));
    EXPECT_EQ(doc.fps, 240);
    EXPECT_EQ(doc.last_used_fps, 1);
    EXPECT_FLOAT_EQ(doc.zoom, 100.0f);
    EXPECT_FLOAT_EQ(doc.pan, 0.0f);
    EXPECT_EQ(doc.active_clip_id, INVALID_ID);
    EXPECT_FLOAT_EQ(doc.snap.threshold_px, 8.0f);

    ASSERT_EQ(doc.clips.size(), 1u);
    EXPECT_EQ(doc.clips[0].id, 4u);
    EXPECT_FLOAT_EQ(doc.clips[0].start, 0.0f);
    EXPECT_FLOAT_EQ(doc.clips[0].speed, 1.0f);
    EXPECT_EQ(doc.clips[0].track_ids, std::vector<TrackId>{7});

    ASSERT_EQ(doc.tracks.size(), 1u);
    EXPECT_EQ(doc.tracks[0].channel.id, INVALID_ID);
    ASSERT_EQ(doc.tracks[0].channel.size(), 1u);
    EXPECT_EQ(doc.tracks[0].channel.keys[0].id, INVALID_ID);

    ASSERT_EQ(doc.markers.size(), 1u);
    EXPECT_FLOAT_EQ(doc.markers[0].time, 0.0f);

    AnimationEngine engine;
    engine.restore_document(doc);
    const Track* tr = engine.track(7);
    ASSERT_NE(tr, nullptr);
    EXPECT_NE(tr->channel.id, INVALID_ID);
    EXPECT_NE(tr->channel.keys[0].id, INVALID_ID);
}

TEST(AnimationSerializer, SortsKeysOnLoad)
{
    const std::string json = R"({"version": 1, "tracks": [{"id": 1, "target_id": "a",
        "property": "position.x", "keys": [{"id": 2, "t": 3, "v": 0}, {"id": 1, "t": 1, "v": 0}]}]})";

    AnimationDocument doc;
    ASSERT_TRUE(AnimationSerializer::deserialize_json(json, doc));
    ASSERT_EQ(doc.tracks.size(), 1u);
    EXPECT_TRUE(doc.tracks[0].channel.is_sorted());
    EXPECT_EQ(doc.tracks[0].channel.keys[0].id, 1u);
}

// ─── Restore repair ──────────────────────────────────────────────────────────

TEST(RestoreDocument, RepairsDanglingAndDuplicateReferences)
{
    AnimationDocument doc;
    Track a;
    a.id        = 1;
    a.target_id = "cube";
    a.property  = "position.x";
    a.channel.keys.push_back(Key{.id = 5, .time = 0.0f, .value = 1.0f});
    Track dup = a;
    dup.id    = 2;  // same (target, property)
    Track b;
    b.id        = 3;
    b.target_id = "ball";
    b.property  = "position.y";
    b.channel.keys.push_back(Key{.id = 5, .time = -1.0f, .value = 2.0f});  // duplicate key id
    doc.tracks = {a, dup, b};

    Clip c;
    c.id        = 4;
    c.start     = 2.0f;
    c.end       = 1.0f;
    c.track_ids = {1, 2, 3, 99, 3};
    doc.clips   = {c};
    doc.active_clip_id = 77;

    AnimationEngine engine;
    engine.restore_document(doc);

    EXPECT_EQ(engine.track_count(), 2u);
    EXPECT_EQ(engine.track(2), nullptr);
    ASSERT_NE(engine.active_clip(), nullptr);
    EXPECT_EQ(engine.active_clip_id(), 4u);
    std::vector<TrackId> expected = {1, 3};
    EXPECT_EQ(engine.active_clip()->track_ids, expected);
    EXPECT_LE(engine.active_clip()->start, engine.active_clip()->end);

    KeyId ka = engine.track(1)->channel.keys[0].id;
    KeyId kb = engine.track(3)->channel.keys[0].id;
    EXPECT_NE(ka, kb);
    EXPECT_FLOAT_EQ(engine.track(3)->channel.keys[0].time, 0.0f);
}

TEST(RestoreDocument, IdCountersResumeAfterMaximum)
{
    AnimationDocument doc;
    Track t;
    t.id         = 40;
    t.target_id  = "cube";
    t.property   = "position.x";
    t.channel.id = 9;
    t.channel.keys.push_back(Key{.id = 100, .time = 0.0f, .value = 0.0f});
    doc.tracks = {t};
    Clip c;
    c.id        = 12;
    c.track_ids = {40};
    doc.clips   = {c};

    AnimationEngine engine;
    engine.restore_document(doc);
    EXPECT_GT(engine.ensure_track("ball", "scale.x"), 40u);
    EXPECT_GT(engine.insert_key(40, 1.0f, 0.0f), 100u);
    EXPECT_GT(engine.create_clip(), 12u);
}

TEST(RestoreDocument, ResetsRuntimeState)
{
    AnimationEngine engine;
    build_scene(engine);
    engine.select_all_keys();
    engine.toggle_track_solo(engine.track_id_for("cube", "position.x"));
    engine.play();

    engine.restore_document(engine.capture_document());
    EXPECT_TRUE(engine.selection().empty());
    EXPECT_TRUE(engine.solo_track_ids().empty());
    EXPECT_EQ(engine.playback_state(), PlaybackState::Stopped);
}

// ─── Key codec ───────────────────────────────────────────────────────────────

TEST(KeyCodec, OmitsAbsentFields)
{
    Key k;
    k.id    = 3;
    k.time  = 1.5f;
    k.value = 2.0f;
    std::string text = key_to_json(k);
    EXPECT_EQ(text, R"({"id":3,"t":1.5,"v":2,"interp":"linear"})");
}

TEST(KeyCodec, FullKeyRoundTrips)
{
    Key k;
    k.id          = 8;
    k.time        = 0.1f;
    k.value       = -3.25f;
    k.interp      = Interpolation::Bezier;
    k.tangent_in  = 0.0f;
    k.tangent_out = 1.2f;
    k.seg_ease    = SegmentEase{SegmentEaseKind::Bounce, SegmentEaseMode::In, 0.5f};

    auto back = key_from_json(key_to_json(k));
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(*back, k);
}

TEST(KeyCodec, RequiresTimeAndValue)
{
    EXPECT_FALSE(key_from_json(R"({"id":1,"v":2})").has_value());
    EXPECT_FALSE(key_from_json(R"({"id":1,"t":2})").has_value());
    EXPECT_FALSE(key_from_json("nope").has_value());
}

TEST(KeyCodec, LenientFields)
{
    auto k = key_from_json(R"({"t":-1,"v":2,"interp":"cubic","tanIn":null})");
    ASSERT_TRUE(k.has_value());
    EXPECT_FLOAT_EQ(k->time, 0.0f);
    EXPECT_EQ(k->interp, Interpolation::Linear);
    EXPECT_FALSE(k->tangent_in.has_value());
}

TEST(KeyCodec, RejectsValuesOutsideFloatRange)
{
    EXPECT_FALSE(key_from_json(R"({"t":1e300,"v":1})").has_value());
    EXPECT_FALSE(key_from_json(R"({"t":1,"v":-1e300})").has_value());
    EXPECT_FALSE(key_from_json(R"({"t":1,"v":1,"tanIn":1e39})").has_value());
    EXPECT_FALSE(key_from_json(R"({"t":1,"v":1,"tanOut":-1e39})").has_value());

    auto k = key_from_json(R"({"t":3e38,"v":-3e38})");
    ASSERT_TRUE(k.has_value());
    EXPECT_TRUE(std::isfinite(k->time));
    EXPECT_TRUE(std::isfinite(k->value));
}

TEST(KeyCodec, InvalidIdsAndStrengthAreNormalised)
{
    auto k = key_from_json(
        R"({"id":1e20,"t":0,"v":0,"segEase":{"type":"elastic","mode":"out","strength":1e300}})");
    ASSERT_TRUE(k.has_value());
    EXPECT_EQ(k->id, INVALID_ID);
    ASSERT_TRUE(k->seg_ease.has_value());
    EXPECT_FLOAT_EQ(k->seg_ease->strength, 3.0f);

    EXPECT_EQ(key_from_json(R"({"id":2.5,"t":0,"v":0})")->id, INVALID_ID);
    EXPECT_EQ(key_from_json(R"({"id":-4,"t":0,"v":0})")->id, INVALID_ID);
    EXPECT_EQ(key_from_json(R"({"id":12,"t":0,"v":0})")->id, 12u);
}

TEST(KeyCodec, ClipboardPayload)
{
    Key k;
    k.id    = 1;
    k.time  = 2.0f;
    k.value = 4.0f;
    std::string payload = encode_key_clipboard({{7, k}, {9, k}});

    auto entries = decode_key_clipboard(payload);
    ASSERT_TRUE(entries.has_value());
    ASSERT_EQ(entries->size(), 2u);
    EXPECT_EQ((*entries)[0].track_id, 7u);
    EXPECT_EQ((*entries)[1].track_id, 9u);
    EXPECT_EQ((*entries)[1].key, k);
}

TEST(KeyCodec, ClipboardSkipsBadEntries)
{
    auto entries = decode_key_clipboard(
        R"([{"trackId":1,"key":{"t":0,"v":1}},{"trackId":0,"key":{"t":0,"v":1}},{"trackId":2,"key":{"v":1}}])");
    ASSERT_TRUE(entries.has_value());
    ASSERT_EQ(entries->size(), 1u);
    EXPECT_EQ((*entries)[0].track_id, 1u);

    auto odd_ids = decode_key_clipboard(
        R"([{"trackId":1e20,"key":{"t":0,"v":1}},{"trackId":-1,"key":{"t":0,"v":1}},)"
        R"({"trackId":2.5,"key":{"t":0,"v":1}},{"trackId":4294967295,"key":{"t":0,"v":1}}])");
    ASSERT_TRUE(odd_ids.has_value());
    EXPECT_TRUE(odd_ids->empty());

    EXPECT_FALSE(decode_key_clipboard("[1, 2]").has_value());
    EXPECT_FALSE(decode_key_clipboard("{}").has_value());
    EXPECT_TRUE(decode_key_clipboard("[]")->empty());
}

// ─── JSON helpers ────────────────────────────────────────────────────────────

TEST(JsonUtil, QuoteEscapesAndUnescapes)
{
    std::string raw    = "line\n\"quoted\"\\tab\t";
    std::string quoted = json::quote(raw);
    EXPECT_EQ(quoted, "\"line\\n\\\"quoted\\\"\\\\tab\\t\"");
    EXPECT_EQ(json::as_string(quoted), raw);
}

TEST(JsonUtil, NumbersUseShortestForm)
{
    EXPECT_EQ(json::number(0.1f), "0.1");
    EXPECT_EQ(json::number(2.0f), "2");
    EXPECT_EQ(json::number(NAN), "0");
}

TEST(JsonUtil, ParseObjectKeepsNestedValuesRaw)
{
    auto f = json::parse_object(R"( { "a": [1, {"b": "}"}], "c": "x,y", "d": true } )");
    ASSERT_TRUE(f.has_value());
    EXPECT_EQ(json::read_raw(*f, "a"), std::string(R"([1, {"b": "}"}])"));
    EXPECT_EQ(json::read_string(*f, "c"), "x,y");
    EXPECT_TRUE(json::read_bool(*f, "d"));
    EXPECT_DOUBLE_EQ(json::read_number(*f, "missing", 7.0), 7.0);
}

TEST(JsonUtil, NarrowingRejectsUnrepresentableValues)
{
    EXPECT_EQ(json::to_id(1.0), 1u);
    EXPECT_EQ(json::to_id(4294967294.0), 4294967294u);
    EXPECT_FALSE(json::to_id(0.0).has_value());
    EXPECT_FALSE(json::to_id(-1.0).has_value());
    EXPECT_FALSE(json::to_id(1.5).has_value());
    EXPECT_FALSE(json::to_id(4294967295.0).has_value());
    EXPECT_FALSE(json::to_id(1e20).has_value());
    EXPECT_FALSE(json::to_id(NAN).has_value());

    EXPECT_FLOAT_EQ(*json::to_float(0.25), 0.25f);
    EXPECT_TRUE(json::to_float(3e38).has_value());
    EXPECT_FALSE(json::to_float(1e39).has_value());
    EXPECT_FALSE(json::to_float(-1e300).has_value());

    EXPECT_EQ(json::to_int_clamped(1e12, 1, 240), 240);
    EXPECT_EQ(json::to_int_clamped(-1e12, 1, 240), 1);
    EXPECT_EQ(json::to_int_clamped(60.7, 1, 240), 60);
    EXPECT_EQ(json::to_int_clamped(NAN, 1, 240), 1);
}

TEST(JsonUtil, NumberParsingRejectsNonFinite)
{
    EXPECT_DOUBLE_EQ(*json::as_number(" -2.5e3 "), -2500.0);
    EXPECT_FALSE(json::as_number("1e400").has_value());
    EXPECT_FALSE(json::as_number("inf").has_value());
    EXPECT_FALSE(json::as_number("nan").has_value());
    EXPECT_FALSE(json::as_number("1,5").has_value());
}

TEST(JsonUtil, NumberParsingIgnoresLocale)
{
    std::string previous = std::setlocale(LC_NUMERIC, nullptr);
    if (!std::setlocale(LC_NUMERIC, "de_DE.UTF-8") && !std::setlocale(LC_NUMERIC, "fr_FR.UTF-8"))
        GTEST_SKIP() << "no comma-decimal locale installed";

    auto v = json::as_number("1.5");
    std::setlocale(LC_NUMERIC, previous.c_str());
    ASSERT_TRUE(v.has_value());
    EXPECT_DOUBLE_EQ(*v, 1.5);
}

TEST(JsonUtil, RejectsMalformed)
{
    EXPECT_FALSE(json::parse_object(R"({"a" 1})").has_value());
    EXPECT_FALSE(json::parse_object(R"({"a": 1,})").has_value());
    EXPECT_FALSE(json::parse_array("[1, 2").has_value());
    EXPECT_FALSE(json::as_number("12abc").has_value());
}
