#include "preset_factory.hpp"

#include <string>
#include <unordered_map>

#include "motion_presets.hpp"
#include "periodic_presets.hpp"
#include "transition_presets.hpp"
#include "utils/log.hpp"

namespace tumble::presets {

std::unique_ptr<PresetStrategy> PresetFactory::create(TemplateId id) const {
    switch (id) {
    case TemplateId::Roll:
        return std::make_unique<RollPreset>();
    case TemplateId::Jump:
        return std::make_unique<JumpPreset>();
    case TemplateId::Pop:
        return std::make_unique<PopPreset>();
    case TemplateId::Shake:
        return std::make_unique<ShakePreset>();
    case TemplateId::Pulse:
        return std::make_unique<PulsePreset>();
    case TemplateId::Spin:
        return std::make_unique<SpinPreset>();
    case TemplateId::Path:
        return std::make_unique<PathPreset>();
    case TemplateId::Unknown:
        return nullptr;
    default:
        break;
    }
    if (is_in_out(id)) {
        return std::make_unique<TransitionPreset>(id);
    }
    return nullptr;
}

const PresetStrategy* PresetFactory::lookup(TemplateId id) {
    static const auto registry = [] {
        std::unordered_map<TemplateId, std::unique_ptr<PresetStrategy>> built;
        PresetFactory factory;
        for (TemplateId known : known_templates()) {
            if (auto strategy = factory.create(known)) {
                built.emplace(known, std::move(strategy));
            }
        }
        return built;
    }();
    auto it = registry.find(id);
    return it == registry.end() ? nullptr : it->second.get();
}

PresetResult generate_preset(TemplateId id, const TemplateParameters& params, std::optional<double> target_duration) {
    const PresetStrategy* strategy = PresetFactory::lookup(id);
    if (!strategy) {
        tumble::log::debug(std::string("[Presets] no generator for template ") + template_key(id));
        return PresetResult{};
    }
    return strategy->generate(params, target_duration);
}

double natural_duration(TemplateId id, const TemplateParameters& params) {
    return generate_preset(id, params).duration;
}

}
