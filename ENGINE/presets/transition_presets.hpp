#pragma once

#include "preset_strategy.hpp"

namespace tumble::presets {

inline constexpr double kTransitionDefaultDurationMs = 600.0;

// Entrance and exit templates. Every "in" variant ends on the layer's base
// state and every "out" variant starts from it; the opposite boundary is an
// explicit offset (off-screen nudge, zero scale, zero opacity, ...).
class TransitionPreset : public PresetStrategy {

public:
    explicit TransitionPreset(TemplateId id);

    TemplateId id() const override { return id_; }
    PresetResult generate(const TemplateParameters& params, std::optional<double> target_duration) const override;

private:
    TemplateId id_;
};

}
