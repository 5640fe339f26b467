#pragma once

#include "preset_strategy.hpp"

namespace tumble::presets {

inline constexpr double kRollBaseDistance   = 0.2;
inline constexpr double kRollBaseDurationMs = 1200.0;
inline constexpr double kRollBaseSpeed      = 1.0;
inline constexpr double kRollMinDurationMs  = 300.0;
inline constexpr double kRollMinDistance    = 0.05;
inline constexpr double kRollMinSpeed       = 0.1;

inline constexpr double kGravity            = 9.8; // normalized units / s^2
inline constexpr double kJumpMinDurationMs  = 300.0;
inline constexpr double kJumpMaxDurationMs  = 2400.0;
inline constexpr double kJumpMinHeight      = 0.05;
inline constexpr double kJumpMinVelocity    = 0.2;

inline constexpr double kPopBaseDurationMs  = 1000.0;
inline constexpr double kPopMinSpeed        = 0.2;

// Calibration curve for roll: how long a roll of `distance` takes at `speed`.
// roll_distance_for_duration is its exact inverse; the generated clip is
// additionally floored at kRollMinDurationMs.
double roll_duration_for_distance(double distance = kRollBaseDistance, double speed = kRollBaseSpeed);
double roll_distance_for_duration(double duration_ms = kRollBaseDurationMs, double speed = kRollBaseSpeed);

double jump_duration_for(double height, double velocity);
double jump_height_for_duration(double duration_ms, double velocity = 1.5);

double pop_duration_for_speed(double speed);
double pop_speed_for_duration(double duration_ms);

class RollPreset : public PresetStrategy {

public:
    TemplateId id() const override { return TemplateId::Roll; }
    PresetResult generate(const TemplateParameters& params, std::optional<double> target_duration) const override;
};

class JumpPreset : public PresetStrategy {

public:
    TemplateId id() const override { return TemplateId::Jump; }
    PresetResult generate(const TemplateParameters& params, std::optional<double> target_duration) const override;
};

class PopPreset : public PresetStrategy {

public:
    TemplateId id() const override { return TemplateId::Pop; }
    PresetResult generate(const TemplateParameters& params, std::optional<double> target_duration) const override;
};

// Freehand paths carry no keys of their own; the compiler turns the points into
// a PathClip. Only the duration is decided here.
class PathPreset : public PresetStrategy {

public:
    TemplateId id() const override { return TemplateId::Path; }
    PresetResult generate(const TemplateParameters& params, std::optional<double> target_duration) const override;
};

}
