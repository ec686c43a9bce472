#include <gtest/gtest.h>

#include <functional>
#include <keyforge/animation_engine.hpp>
#include <keyforge/scene_sink.hpp>
#include <string>
#include <vector>

#include "engine/sampling_bridge.hpp"

using namespace keyforge;

namespace
{

// Records every write in call order as "<kind>:<target>".
class RecordingSink : public SceneSink
{
   public:
    void set_transform(const std::string& target_id, const TransformPatch& patch) override
    {
        calls.push_back("transform:" + target_id);
        transforms.push_back(patch);
        on_write();
    }
    void set_modifier_settings(const std::string& target_id, const ModifierPatch& patch) override
    {
        calls.push_back("modifier:" + target_id);
        modifiers.push_back(patch);
        on_write();
    }
    void set_simulation_parameters(const std::string&     target_id,
                                   const SimulationPatch& patch) override
    {
        calls.push_back("simulation:" + target_id);
        simulations.push_back(patch);
        on_write();
    }

    std::vector<std::string>     calls;
    std::vector<TransformPatch>  transforms;
    std::vector<ModifierPatch>   modifiers;
    std::vector<SimulationPatch> simulations;

    std::function<void()> on_write = [] {};
};

Track make_track(TrackId id, const std::string& target, const std::string& property)
{
    Track tr;
    tr.id        = id;
    tr.target_id = target;
    tr.property  = property;
    tr.sink      = parse_property_path(property);
    return tr;
}

}  // anonymous namespace

// ─── Batching ────────────────────────────────────────────────────────────────

TEST(SampleBatching, GroupsByTargetInFirstSeenOrder)
{
    Track a = make_track(1, "cube", "position.x");
    Track b = make_track(2, "sphere", "scale.y");
    Track c = make_track(3, "cube", "rotation.z");

    auto batches = batch_samples({{&a, 1.0f}, {&b, 2.0f}, {&c, 3.0f}});
    ASSERT_EQ(batches.size(), 2u);
    EXPECT_EQ(batches[0].target_id, "cube");
    EXPECT_EQ(batches[1].target_id, "sphere");
    EXPECT_EQ(batches[0].transform.position.x, 1.0f);
    EXPECT_EQ(batches[0].transform.rotation.z, 3.0f);
    EXPECT_FALSE(batches[0].transform.position.y.has_value());
    EXPECT_EQ(batches[1].transform.scale.y, 2.0f);
}

TEST(SampleBatching, ModifiersGroupedById)
{
    Track a = make_track(1, "cube", "mod.bend.angle");
    Track b = make_track(2, "cube", "mod.twist.amount");
    Track c = make_track(3, "cube", "mod.bend.offset.x");

    auto batches = batch_samples({{&a, 10.0f}, {&b, 20.0f}, {&c, 30.0f}});
    ASSERT_EQ(batches.size(), 1u);
    const auto& mods = batches[0].modifiers;
    ASSERT_EQ(mods.size(), 2u);
    EXPECT_EQ(mods[0].modifier_id, "bend");
    ASSERT_EQ(mods[0].settings.size(), 2u);
    EXPECT_EQ(mods[0].settings[0].first, "angle");
    EXPECT_EQ(mods[0].settings[1].first, "offset.x");
    EXPECT_FLOAT_EQ(mods[0].settings[1].second, 30.0f);
    EXPECT_EQ(mods[1].modifier_id, "twist");
}

TEST(SampleBatching, SimulationValuesAreClamped)
{
    Track a = make_track(1, "smoke", "fluid.damping");
    Track b = make_track(2, "smoke", "fluid.emissionRate");
    Track c = make_track(3, "smoke", "fluid.gravityY");

    auto batches = batch_samples({{&a, 0.9f}, {&b, -4.0f}, {&c, -9.8f}});
    ASSERT_EQ(batches.size(), 1u);
    const auto& sim = batches[0].simulation;
    EXPECT_EQ(sim.get(SimulationParam::Damping), 0.5f);
    EXPECT_EQ(sim.get(SimulationParam::EmissionRate), 0.0f);
    EXPECT_EQ(sim.get(SimulationParam::GravityY), -9.8f);
    EXPECT_FALSE(sim.get(SimulationParam::Size).has_value());
}

TEST(SampleBatching, UnknownPropertiesAreDropped)
{
    Track a = make_track(1, "cube", "opacity");
    auto  batches = batch_samples({{&a, 1.0f}});
    EXPECT_TRUE(batches.empty());
}

// ─── Dispatch ────────────────────────────────────────────────────────────────

TEST(SampleDispatch, OrderWithinTarget)
{
    Track sim = make_track(1, "cube", "fluid.size");
    Track mod = make_track(2, "cube", "mod.bend.angle");
    Track pos = make_track(3, "cube", "position.x");

    RecordingSink sink;
    dispatch_batches(batch_samples({{&sim, 1.0f}, {&mod, 2.0f}, {&pos, 3.0f}}), sink);

    std::vector<std::string> expected = {"transform:cube", "modifier:cube", "simulation:cube"};
    EXPECT_EQ(sink.calls, expected);
}

TEST(SampleDispatch, EmptyPartsAreSkipped)
{
    Track mod = make_track(1, "cube", "mod.bend.angle");
    RecordingSink sink;
    dispatch_batches(batch_samples({{&mod, 2.0f}}), sink);
    ASSERT_EQ(sink.calls.size(), 1u);
    EXPECT_EQ(sink.calls[0], "modifier:cube");
}

// ─── Engine sampling ─────────────────────────────────────────────────────────

TEST(EngineSampling, SampleAtEvaluatesActiveClip)
{
    AnimationEngine engine;
    engine.create_clip();
    TrackId t = engine.ensure_track("cube", "position.x");
    engine.insert_key(t, 0.0f, 0.0f);
    engine.insert_key(t, 1.0f, 10.0f);

    auto updates = engine.sample_at(0.5f);
    ASSERT_EQ(updates.size(), 1u);
    EXPECT_EQ(updates[0].target_id, "cube");
    EXPECT_EQ(updates[0].property, "position.x");
    EXPECT_FLOAT_EQ(updates[0].value, 5.0f);
}

TEST(EngineSampling, NoActiveClipNoSamples)
{
    AnimationEngine engine;
    engine.create_clip();
    TrackId t = engine.ensure_track("cube", "position.x");
    engine.insert_key(t, 0.0f, 1.0f);
    engine.set_active_clip(INVALID_ID);
    EXPECT_TRUE(engine.sample_at(0.0f).empty());
}

TEST(EngineSampling, TimeIsClampedToClip)
{
    AnimationEngine engine;
    engine.create_clip();
    engine.set_clip_range(0.0f, 1.0f);
    TrackId t = engine.ensure_track("cube", "position.x");
    engine.insert_key(t, 0.0f, 0.0f);
    engine.insert_key(t, 2.0f, 20.0f);

    auto updates = engine.sample_at(5.0f);
    ASSERT_EQ(updates.size(), 1u);
    EXPECT_FLOAT_EQ(updates[0].value, 10.0f);
}

TEST(EngineSampling, EmptyTracksAreSkipped)
{
    AnimationEngine engine;
    engine.create_clip();
    engine.ensure_track("cube", "position.x");
    EXPECT_TRUE(engine.sample_at(0.0f).empty());
}

TEST(EngineSampling, MutedTracksAreSkipped)
{
    AnimationEngine engine;
    engine.create_clip();
    TrackId a = engine.ensure_track("cube", "position.x");
    TrackId b = engine.ensure_track("cube", "position.y");
    engine.insert_key(a, 0.0f, 1.0f);
    engine.insert_key(b, 0.0f, 2.0f);
    engine.set_track_muted(a, true);

    auto updates = engine.sample_at(0.0f);
    ASSERT_EQ(updates.size(), 1u);
    EXPECT_EQ(updates[0].property, "position.y");
}

TEST(EngineSampling, SoloOverridesMute)
{
    AnimationEngine engine;
    engine.create_clip();
    TrackId a = engine.ensure_track("cube", "position.x");
    TrackId b = engine.ensure_track("cube", "position.y");
    engine.insert_key(a, 0.0f, 1.0f);
    engine.insert_key(b, 0.0f, 2.0f);
    engine.set_track_muted(a, true);
    engine.toggle_track_solo(a);

    auto updates = engine.sample_at(0.0f);
    ASSERT_EQ(updates.size(), 1u);
    EXPECT_EQ(updates[0].property, "position.x");

    engine.toggle_track_solo(a);
    EXPECT_FALSE(engine.is_track_soloed(a));
    updates = engine.sample_at(0.0f);
    ASSERT_EQ(updates.size(), 1u);
    EXPECT_EQ(updates[0].property, "position.y");
}

TEST(EngineSampling, OnlyTracksOfActiveClip)
{
    AnimationEngine engine;
    engine.create_clip("One");
    TrackId a = engine.ensure_track("cube", "position.x");
    engine.insert_key(a, 0.0f, 1.0f);
    engine.create_clip("Two");
    TrackId b = engine.ensure_track("cube", "position.y");
    engine.insert_key(b, 0.0f, 2.0f);

    auto updates = engine.sample_at(0.0f);
    ASSERT_EQ(updates.size(), 1u);
    EXPECT_EQ(updates[0].property, "position.y");
}

TEST(EngineSampling, ApplyMergesWritesPerTarget)
{
    AnimationEngine engine;
    RecordingSink   sink;
    engine.set_scene_sink(&sink);
    engine.create_clip();
    for (const char* p : {"position.x", "position.y", "scale.z"})
        engine.insert_key(engine.ensure_track("cube", p), 0.0f, 1.0f);
    engine.insert_key(engine.ensure_track("ball", "rotation.x"), 0.0f, 2.0f);

    engine.apply_sample_at(0.0f);
    std::vector<std::string> expected = {"transform:cube", "transform:ball"};
    EXPECT_EQ(sink.calls, expected);
    EXPECT_EQ(sink.transforms[0].position.x, 1.0f);
    EXPECT_EQ(sink.transforms[0].position.y, 1.0f);
    EXPECT_EQ(sink.transforms[0].scale.z, 1.0f);
    EXPECT_FALSE(sink.transforms[0].rotation.x.has_value());
    engine.set_scene_sink(nullptr);
}

// ─── Auto-key guard ──────────────────────────────────────────────────────────

TEST(AutoKeyGuard, SamplingWritesAreNotRecorded)
{
    AnimationEngine engine;
    RecordingSink   sink;
    engine.set_scene_sink(&sink);
    engine.create_clip();
    TrackId t = engine.ensure_track("cube", "position.x");
    engine.insert_key(t, 0.0f, 0.0f);
    engine.insert_key(t, 1.0f, 10.0f);
    engine.set_auto_key(true);
    engine.set_playhead(0.5f);

    bool  sampling_seen = false;
    KeyId recorded      = 1234;
    sink.on_write       = [&]
    {
        sampling_seen = engine.is_sampling();
        recorded      = engine.notify_property_edited("cube", "position.x", 5.0f);
    };

    engine.apply_sample_at(0.5f);
    EXPECT_TRUE(sampling_seen);
    EXPECT_EQ(recorded, INVALID_ID);
    EXPECT_EQ(engine.track(t)->channel.size(), 2u);
    EXPECT_FALSE(engine.is_sampling());

    // Outside sampling the same edit is keyed.
    EXPECT_NE(engine.notify_property_edited("cube", "position.x", 5.0f), INVALID_ID);
    EXPECT_EQ(engine.track(t)->channel.size(), 3u);
    engine.set_scene_sink(nullptr);
}

TEST(AutoKeyGuard, GuardRestoresPreviousValue)
{
    bool flag = false;
    {
        SamplingGuard outer(flag);
        EXPECT_TRUE(flag);
        {
            SamplingGuard inner(flag);
            EXPECT_TRUE(flag);
        }
        EXPECT_TRUE(flag);
    }
    EXPECT_FALSE(flag);
}
