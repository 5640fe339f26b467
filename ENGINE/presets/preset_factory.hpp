#pragma once

#include <memory>
#include <optional>

#include "preset_strategy.hpp"

namespace tumble::presets {

class PresetFactory {

public:
    PresetFactory() = default;
    ~PresetFactory() = default;

    // Returns nullptr for TemplateId::Unknown.
    std::unique_ptr<PresetStrategy> create(TemplateId id) const;

    // Shared, lazily built strategies; safe to call from any thread once built.
    static const PresetStrategy* lookup(TemplateId id);
};

// Generates the local curve for `id`. Unknown templates produce an empty
// result with zero duration.
PresetResult generate_preset(TemplateId id,
                             const TemplateParameters& params,
                             std::optional<double> target_duration = std::nullopt);

// The duration a template would take if applied without a target, before the
// template speed is applied.
double natural_duration(TemplateId id, const TemplateParameters& params);

}
