#pragma once

#include <array>
#include <keyforge/property_path.hpp>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace keyforge
{

// Per-axis partial update; unset axes keep the scene object's current value.
struct Vec3Patch
{
    std::optional<float> x;
    std::optional<float> y;
    std::optional<float> z;

    bool empty() const { return !x && !y && !z; }
    void set(Axis axis, float value);
};

struct TransformPatch
{
    Vec3Patch position;
    Vec3Patch rotation;
    Vec3Patch scale;

    bool empty() const { return position.empty() && rotation.empty() && scale.empty(); }
};

// Settings of one modifier, in the order the tracks were sampled.
struct ModifierPatch
{
    std::string                                modifier_id;
    std::vector<std::pair<std::string, float>> settings;  // setting path -> value
};

// Simulation parameters indexed by SimulationParam. Values are already
// clamped to the simulator's valid ranges.
struct SimulationPatch
{
    std::array<std::optional<float>, SIMULATION_PARAM_COUNT> values{};

    bool empty() const;
    void set(SimulationParam param, float value);
    std::optional<float> get(SimulationParam param) const;
};

// Scene-side receiver of sampled animation values. Implemented by the host's
// object store. For each target the engine calls set_transform() first, then
// set_modifier_settings() once per modifier, then set_simulation_parameters().
class SceneSink
{
   public:
    virtual ~SceneSink() = default;

    virtual void set_transform(const std::string& target_id, const TransformPatch& patch) = 0;

    virtual void set_modifier_settings(const std::string&   target_id,
                                       const ModifierPatch& patch) = 0;

    virtual void set_simulation_parameters(const std::string&     target_id,
                                           const SimulationPatch& patch) = 0;
};

}  // namespace keyforge
