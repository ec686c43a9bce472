#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace keyforge
{

enum class TransformComponent : uint8_t
{
    Position,
    Rotation,
    Scale,
};

enum class Axis : uint8_t
{
    X,
    Y,
    Z,
};

// Particle/fluid simulation parameters that can be animated.
enum class SimulationParam : uint8_t
{
    EmissionRate,
    GravityY,
    Size,
    Speed,
    Damping,
    Bounce,
    InitialVelX,
    InitialVelY,
    InitialVelZ,
};

inline constexpr size_t SIMULATION_PARAM_COUNT = 9;

// "position.x", "rotation.y", "scale.z"
struct TransformTarget
{
    TransformComponent component = TransformComponent::Position;
    Axis               axis      = Axis::X;

    bool operator==(const TransformTarget&) const = default;
};

// "mod.<modifierId>.<settingPath...>", e.g. "mod.bend1.offset.x"
struct ModifierTarget
{
    std::string modifier_id;
    std::string setting_path;

    bool operator==(const ModifierTarget&) const = default;
};

// "fluid.<param>", e.g. "fluid.emissionRate"
struct SimulationTarget
{
    SimulationParam param = SimulationParam::EmissionRate;

    bool operator==(const SimulationTarget&) const = default;
};

// Typed destination of an animated value. Adding an alternative here makes
// every std::visit over it fail to compile until the new kind is routed.
using PropertyTarget = std::variant<TransformTarget, ModifierTarget, SimulationTarget>;

// Parse a property path. Returns nullopt for unknown prefixes, unknown axes or
// simulation parameters, and for modifier paths missing an id or setting.
std::optional<PropertyTarget> parse_property_path(std::string_view path);

// Inverse of parse_property_path().
std::string format_property_path(const PropertyTarget& target);

const char* transform_component_name(TransformComponent component);
const char* axis_name(Axis axis);
const char* simulation_param_name(SimulationParam param);

std::optional<SimulationParam> parse_simulation_param(std::string_view name);

// Clamp a simulation value into the range the simulator accepts.
float clamp_simulation_value(SimulationParam param, float value);

}  // namespace keyforge
