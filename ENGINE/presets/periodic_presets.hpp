#pragma once

#include "preset_strategy.hpp"

namespace tumble::presets {

inline constexpr double kShakeDefaultDurationMs = 500.0;
inline constexpr double kShakeHalfPeriodMs      = 60.0;
inline constexpr double kPulseDefaultDurationMs = 1200.0;
inline constexpr double kPulsePeriodMs          = 600.0;
inline constexpr double kSpinDefaultDurationMs  = 1000.0;
// Upper bound on shake swings and pulse cycles; very long clips get wider
// periods instead of more keys.
inline constexpr int kMaxPeriodicCycles         = 4096;

// Periodic templates are stretched to whatever length the clip was authored
// with: the target duration decides how many cycles fit.

class ShakePreset : public PresetStrategy {

public:
    TemplateId id() const override { return TemplateId::Shake; }
    PresetResult generate(const TemplateParameters& params, std::optional<double> target_duration) const override;
};

class PulsePreset : public PresetStrategy {

public:
    TemplateId id() const override { return TemplateId::Pulse; }
    PresetResult generate(const TemplateParameters& params, std::optional<double> target_duration) const override;
};

class SpinPreset : public PresetStrategy {

public:
    TemplateId id() const override { return TemplateId::Spin; }
    PresetResult generate(const TemplateParameters& params, std::optional<double> target_duration) const override;
};

}
