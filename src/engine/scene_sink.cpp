#include <keyforge/scene_sink.hpp>

namespace keyforge
{

void Vec3Patch::set(Axis axis, float value)
{
    switch (axis)
    {
        case Axis::X:
            x = value;
            break;
        case Axis::Y:
            y = value;
            break;
        case Axis::Z:
            z = value;
            break;
    }
}

bool SimulationPatch::empty() const
{
    for (const auto& v : values)
    {
        if (v)
            return false;
    }
    return true;
}

void SimulationPatch::set(SimulationParam param, float value)
{
    values[static_cast<size_t>(param)] = value;
}

std::optional<float> SimulationPatch::get(SimulationParam param) const
{
    return values[static_cast<size_t>(param)];
}

}  // namespace keyforge
