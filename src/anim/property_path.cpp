#include <algorithm>
#include <array>
#include <keyforge/property_path.hpp>

namespace keyforge
{

namespace
{

constexpr std::array<SimulationParam, SIMULATION_PARAM_COUNT> ALL_SIMULATION_PARAMS = {
    SimulationParam::EmissionRate,
    SimulationParam::GravityY,
    SimulationParam::Size,
    SimulationParam::Speed,
    SimulationParam::Damping,
    SimulationParam::Bounce,
    SimulationParam::InitialVelX,
    SimulationParam::InitialVelY,
    SimulationParam::InitialVelZ,
};

std::optional<TransformComponent> parse_component(std::string_view name)
{
    if (name == "position")
        return TransformComponent::Position;
    if (name == "rotation")
        return TransformComponent::Rotation;
    if (name == "scale")
        return TransformComponent::Scale;
    return std::nullopt;
}

std::optional<Axis> parse_axis(std::string_view name)
{
    if (name == "x")
        return Axis::X;
    if (name == "y")
        return Axis::Y;
    if (name == "z")
        return Axis::Z;
    return std::nullopt;
}

}  // anonymous namespace

std::optional<PropertyTarget> parse_property_path(std::string_view path)
{
    auto dot = path.find('.');
    if (dot == std::string_view::npos || dot == 0 || dot + 1 >= path.size())
        return std::nullopt;

    std::string_view head = path.substr(0, dot);
    std::string_view rest = path.substr(dot + 1);

    if (auto component = parse_component(head))
    {
        auto axis = parse_axis(rest);
        if (!axis)
            return std::nullopt;
        return TransformTarget{*component, *axis};
    }

    if (head == "mod")
    {
        auto sep = rest.find('.');
        if (sep == std::string_view::npos || sep == 0 || sep + 1 >= rest.size())
            return std::nullopt;
        return ModifierTarget{std::string(rest.substr(0, sep)), std::string(rest.substr(sep + 1))};
    }

    if (head == "fluid")
    {
        // Only the first segment names the parameter; any scoping suffix is ignored.
        auto param = parse_simulation_param(rest.substr(0, rest.find('.')));
        if (!param)
            return std::nullopt;
        return SimulationTarget{*param};
    }

    return std::nullopt;
}

std::string format_property_path(const PropertyTarget& target)
{
    struct Formatter
    {
        std::string operator()(const TransformTarget& t) const
        {
            return std::string(transform_component_name(t.component)) + "." + axis_name(t.axis);
        }
        std::string operator()(const ModifierTarget& m) const
        {
            return "mod." + m.modifier_id + "." + m.setting_path;
        }
        std::string operator()(const SimulationTarget& s) const
        {
            return std::string("fluid.") + simulation_param_name(s.param);
        }
    };
    return std::visit(Formatter{}, target);
}

const char* transform_component_name(TransformComponent component)
{
    switch (component)
    {
        case TransformComponent::Position:
            return "position";
        case TransformComponent::Rotation:
            return "rotation";
        case TransformComponent::Scale:
            return "scale";
    }
    return "unknown";
}

const char* axis_name(Axis axis)
{
    switch (axis)
    {
        case Axis::X:
            return "x";
        case Axis::Y:
            return "y";
        case Axis::Z:
            return "z";
    }
    return "?";
}

const char* simulation_param_name(SimulationParam param)
{
    switch (param)
    {
        case SimulationParam::EmissionRate:
            return "emissionRate";
        case SimulationParam::GravityY:
            return "gravityY";
        case SimulationParam::Size:
            return "size";
        case SimulationParam::Speed:
            return "speed";
        case SimulationParam::Damping:
            return "damping";
        case SimulationParam::Bounce:
            return "bounce";
        case SimulationParam::InitialVelX:
            return "initialVelX";
        case SimulationParam::InitialVelY:
            return "initialVelY";
        case SimulationParam::InitialVelZ:
            return "initialVelZ";
    }
    return "unknown";
}

std::optional<SimulationParam> parse_simulation_param(std::string_view name)
{
    auto it = std::find_if(ALL_SIMULATION_PARAMS.begin(),
                           ALL_SIMULATION_PARAMS.end(),
                           [name](SimulationParam p) { return name == simulation_param_name(p); });
    if (it == ALL_SIMULATION_PARAMS.end())
        return std::nullopt;
    return *it;
}

float clamp_simulation_value(SimulationParam param, float value)
{
    switch (param)
    {
        case SimulationParam::EmissionRate:
            return std::max(0.0f, value);
        case SimulationParam::Size:
            return std::max(0.0001f, value);
        case SimulationParam::Speed:
            return std::max(0.001f, value);
        case SimulationParam::Damping:
            return std::clamp(value, 0.0f, 0.5f);
        case SimulationParam::Bounce:
            return std::clamp(value, 0.0f, 1.0f);
        case SimulationParam::GravityY:
        case SimulationParam::InitialVelX:
        case SimulationParam::InitialVelY:
        case SimulationParam::InitialVelZ:
            return value;
    }
    return value;
}

}  // namespace keyforge
