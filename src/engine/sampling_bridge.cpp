#include "engine/sampling_bridge.hpp"

#include <keyforge/logger.hpp>
#include <type_traits>
#include <variant>

namespace keyforge
{

namespace
{

TargetBatch& batch_for(std::vector<TargetBatch>& batches, const std::string& target_id)
{
    for (auto& b : batches)
    {
        if (b.target_id == target_id)
            return b;
    }
    batches.push_back({});
    batches.back().target_id = target_id;
    return batches.back();
}

ModifierPatch& modifier_for(TargetBatch& batch, const std::string& modifier_id)
{
    for (auto& m : batch.modifiers)
    {
        if (m.modifier_id == modifier_id)
            return m;
    }
    batch.modifiers.push_back({});
    batch.modifiers.back().modifier_id = modifier_id;
    return batch.modifiers.back();
}

Vec3Patch& component_for(TransformPatch& patch, TransformComponent component)
{
    switch (component)
    {
        case TransformComponent::Rotation:
            return patch.rotation;
        case TransformComponent::Scale:
            return patch.scale;
        case TransformComponent::Position:
            break;
    }
    return patch.position;
}

}  // anonymous namespace

std::vector<TargetBatch> batch_samples(const std::vector<TrackSample>& samples)
{
    std::vector<TargetBatch> batches;
    for (const auto& s : samples)
    {
        if (!s.track)
            continue;
        if (!s.track->sink)
        {
            KEYFORGE_LOG_TRACE("anim.sample",
                               "track {}: no sink for '{}'",
                               s.track->id,
                               s.track->property);
            continue;
        }

        TargetBatch& batch = batch_for(batches, s.track->target_id);
        std::visit(
            [&](const auto& target)
            {
                using T = std::decay_t<decltype(target)>;
                if constexpr (std::is_same_v<T, TransformTarget>)
                {
                    component_for(batch.transform, target.component).set(target.axis, s.value);
                }
                else if constexpr (std::is_same_v<T, ModifierTarget>)
                {
                    modifier_for(batch, target.modifier_id)
                        .settings.emplace_back(target.setting_path, s.value);
                }
                else if constexpr (std::is_same_v<T, SimulationTarget>)
                {
                    batch.simulation.set(target.param,
                                         clamp_simulation_value(target.param, s.value));
                }
                else
                {
                    static_assert(sizeof(T) == 0, "unhandled PropertyTarget alternative");
                }
            },
            *s.track->sink);
    }
    return batches;
}

void dispatch_batches(const std::vector<TargetBatch>& batches, SceneSink& sink)
{
    for (const auto& b : batches)
    {
        if (!b.transform.empty())
            sink.set_transform(b.target_id, b.transform);
        for (const auto& m : b.modifiers)
            sink.set_modifier_settings(b.target_id, m);
        if (!b.simulation.empty())
            sink.set_simulation_parameters(b.target_id, b.simulation);
    }
}

}  // namespace keyforge
