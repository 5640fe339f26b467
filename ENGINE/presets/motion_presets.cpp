#include "motion_presets.hpp"

#include <algorithm>
#include <cmath>

#include "timeline/path_smoothing.hpp"

namespace tumble::presets {

using timeline::Easing;
using timeline::Vec2;

namespace {

constexpr double kPi = 3.14159265358979323846;
constexpr double kRollTurns = 2.0; // 4*pi radians over the roll
constexpr double kPathMsPerUnit = 2000.0;
constexpr double kPathMinDurationMs = 600.0;

double finite_or(double value, double fallback) {
    return std::isfinite(value) ? value : fallback;
}

}

double roll_duration_for_distance(double distance, double speed) {
    const double d = std::max(kRollMinDistance, finite_or(distance, kRollBaseDistance));
    const double s = std::max(kRollMinSpeed, finite_or(speed, kRollBaseSpeed));
    return ((d / kRollBaseDistance) / s) * kRollBaseDurationMs;
}

double roll_distance_for_duration(double duration_ms, double speed) {
    const double d = std::max(0.0, finite_or(duration_ms, kRollBaseDurationMs));
    const double s = std::max(kRollMinSpeed, finite_or(speed, kRollBaseSpeed));
    return ((d / kRollBaseDurationMs) * s) * kRollBaseDistance;
}

double jump_duration_for(double height, double velocity) {
    const double h = std::max(kJumpMinHeight, finite_or(height, 0.25));
    const double v = std::max(kJumpMinVelocity, finite_or(velocity, 1.5));
    // The launch velocity is raised to the minimum that still reaches h.
    const double v0 = std::max(v, std::sqrt(2.0 * kGravity * h));
    const double under_root = std::max(0.0, v0 * v0 - 2.0 * kGravity * h);
    const double time_up_sec = (v0 - std::sqrt(under_root)) / kGravity;
    return std::clamp(time_up_sec * 2.0 * 1000.0, kJumpMinDurationMs, kJumpMaxDurationMs);
}

double jump_height_for_duration(double duration_ms, double velocity) {
    const double time_up_sec = std::max(0.15, finite_or(duration_ms, 0.0) / 2000.0);
    const double v = std::max(kJumpMinVelocity, finite_or(velocity, 1.5));
    const double height = v * time_up_sec - 0.5 * kGravity * time_up_sec * time_up_sec;
    return std::max(kJumpMinHeight, height);
}

double pop_duration_for_speed(double speed) {
    return kPopBaseDurationMs / std::max(kPopMinSpeed, finite_or(speed, 1.0));
}

double pop_speed_for_duration(double duration_ms) {
    return std::max(kPopMinSpeed, kPopBaseDurationMs / std::max(100.0, finite_or(duration_ms, kPopBaseDurationMs)));
}

PresetResult RollPreset::generate(const TemplateParameters& params, std::optional<double>) const {
    const double distance = std::max(kRollMinDistance, finite_or(params.roll_distance, kRollBaseDistance));
    const double duration = std::max(kRollMinDurationMs, roll_duration_for_distance(distance, kRollBaseSpeed));

    PresetResult result;
    result.duration = duration;
    result.position = {
        key_at(0.0, Vec2{0.0, 0.0}),
        key_at(duration, Vec2{distance, 0.0}),
    };
    result.rotation = {
        key_at(0.0, 0.0),
        key_at(duration, kPi * 2.0 * kRollTurns),
    };
    result.meta.roll_distance = distance;
    return result;
}

PresetResult JumpPreset::generate(const TemplateParameters& params, std::optional<double>) const {
    const double height = std::max(kJumpMinHeight, finite_or(params.jump_height, 0.25));
    const double duration = jump_duration_for(height, params.jump_velocity);

    PresetResult result;
    result.duration = duration;
    result.position = {
        key_at(0.0, Vec2{0.0, 0.0}),
        key_at(duration * 0.5, Vec2{0.0, -height}, Easing::EaseOutQuad),
        key_at(duration, Vec2{0.0, 0.0}, Easing::EaseInQuad),
    };
    // Anticipation squash, stretch at the apex, landing squish.
    result.scale = {
        key_at(0.0, 1.0),
        key_at(duration * 0.2, 0.95, Easing::EaseOutQuad),
        key_at(duration * 0.5, 1.05, Easing::EaseOutQuad),
        key_at(duration * 0.85, 0.93, Easing::EaseInQuad),
        key_at(duration, 1.0, Easing::EaseOutQuad),
    };
    result.meta.jump_height = height;
    return result;
}

PresetResult PopPreset::generate(const TemplateParameters& params, std::optional<double>) const {
    const double duration = pop_duration_for_speed(params.pop_speed);
    const double peak = std::max(0.0, finite_or(params.pop_scale, 1.6));
    const double burst_start = duration * 0.52;
    const double burst_end = duration * 0.62;
    const double wobble_scale = peak * 0.92;

    PresetResult result;
    result.duration = duration;
    result.scale = {
        key_at(0.0, 1.0),
        key_at(duration * 0.5, peak, Easing::EaseOutQuad),
        params.pop_wobble ? key_at(burst_start, wobble_scale, Easing::EaseOutBack)
                          : key_at(burst_start, peak, Easing::EaseOutQuad),
        params.pop_collapse ? key_at(burst_end, 0.0, Easing::EaseInQuad)
                            : key_at(burst_end, peak, Easing::Linear),
    };
    result.opacity = {
        key_at(0.0, 1.0),
        key_at(burst_start, 1.0),
        key_at(burst_end, 0.0, Easing::EaseInQuad),
    };
    result.meta.pop_scale = peak;
    result.meta.wobble = params.pop_wobble;
    result.meta.collapse = params.pop_collapse;
    return result;
}

PresetResult PathPreset::generate(const TemplateParameters& params, std::optional<double> target_duration) const {
    PresetResult result;
    if (target_duration && *target_duration > 0.0) {
        result.duration = *target_duration;
    } else {
        const double length = timeline::calculate_path_length(timeline::finite_points(params.path_points));
        result.duration = std::max(kPathMinDurationMs, length * kPathMsPerUnit);
    }
    return result;
}

}
