// Bouncing Cube Demo
// Drives an AnimationEngine headlessly and prints the sampled transform.
//
// This example shows:
// - Creating a clip and keyframing a position track
// - Applying an easing preset to a key
// - Ticking a PlaybackDriver from a fixed-step frame loop
// - Receiving sampled values through a SceneSink

#include <iostream>
#include <keyforge/keyforge.hpp>

namespace
{

class PrintingSink : public keyforge::SceneSink
{
   public:
    void set_transform(const std::string& target_id, const keyforge::TransformPatch& patch) override
    {
        if (patch.position.y)
            std::cout << "  " << target_id << ".position.y = " << *patch.position.y << "\n";
    }

    void set_modifier_settings(const std::string&, const keyforge::ModifierPatch&) override {}

    void set_simulation_parameters(const std::string&, const keyforge::SimulationPatch&) override
    {
    }
};

}   // namespace

int main()
{
    keyforge::Logger::instance().add_sink(keyforge::sinks::console_sink());

    keyforge::AnimationEngine engine;
    keyforge::UndoManager     undo;
    PrintingSink              sink;
    engine.set_undo_manager(&undo);
    engine.set_scene_sink(&sink);

    auto clip = engine.create_clip("Bounce");
    engine.set_clip_range(0.0f, 2.0f);
    engine.set_clip_loop(clip, false);

    auto track = engine.ensure_track("cube", "position.y");
    engine.insert_key(track, 0.0f, 0.0f, keyforge::Interpolation::Bezier);
    auto top = engine.insert_key(track, 1.0f, 3.0f, keyforge::Interpolation::Bezier);
    engine.insert_key(track, 2.0f, 0.0f, keyforge::Interpolation::Bezier);

    engine.apply_easing_preset({{track, top}}, keyforge::EasingPreset::Bounce, 1.0f);

    std::cout << "=== Bouncing Cube Demo ===\n";
    std::cout << "Undo steps recorded: " << undo.undo_count() << "\n";

    keyforge::PlaybackDriver driver(engine);
    driver.set_on_playhead_sync([](float t) { std::cout << "playhead " << t << "s\n"; });

    engine.play();
    while (engine.is_playing())
        driver.tick(1.0f / 30.0f);

    return 0;
}
