#include "periodic_presets.hpp"

#include <algorithm>
#include <cmath>

namespace tumble::presets {

using timeline::Easing;
using timeline::Vec2;

namespace {

constexpr double kPi = 3.14159265358979323846;

double target_or(std::optional<double> target, double fallback) {
    if (target && std::isfinite(*target) && *target > 0.0) {
        return *target;
    }
    return fallback;
}

double positive_or(double value, double fallback, double minimum) {
    if (!std::isfinite(value)) {
        return fallback;
    }
    return std::max(minimum, value);
}

int cycle_count(double duration, double period, int minimum) {
    const double cycles = std::round(duration / period);
    if (!(cycles < kMaxPeriodicCycles)) {
        return kMaxPeriodicCycles;
    }
    return std::max(minimum, static_cast<int>(cycles));
}

}

PresetResult ShakePreset::generate(const TemplateParameters& params, std::optional<double> target_duration) const {
    const double duration = target_or(target_duration, kShakeDefaultDurationMs);
    const double amplitude = positive_or(params.shake_distance, 0.02, 0.0);
    const double half_period = kShakeHalfPeriodMs / positive_or(params.template_speed, 1.0, 0.1);
    const int swings = cycle_count(duration, half_period, 2);

    PresetResult result;
    result.duration = duration;
    result.position.reserve(static_cast<std::size_t>(swings) + 1);
    result.position.push_back(key_at(0.0, Vec2{0.0, 0.0}));
    for (int i = 1; i < swings; ++i) {
        const double decay = 1.0 - static_cast<double>(i) / swings;
        const double side = (i % 2 == 1) ? -1.0 : 1.0;
        result.position.push_back(key_at(duration * i / swings, Vec2{side * amplitude * decay, 0.0}, Easing::EaseInOutQuad));
    }
    result.position.push_back(key_at(duration, Vec2{0.0, 0.0}, Easing::EaseInOutQuad));
    return result;
}

PresetResult PulsePreset::generate(const TemplateParameters& params, std::optional<double> target_duration) const {
    const double duration = target_or(target_duration, kPulseDefaultDurationMs);
    const double amount = positive_or(params.pulse_scale, 0.2, 0.0);
    const double period = kPulsePeriodMs / positive_or(params.pulse_speed, 1.0, 0.1);
    const int cycles = cycle_count(duration, period, 1);

    PresetResult result;
    result.duration = duration;
    result.scale.reserve(static_cast<std::size_t>(cycles) * 2 + 1);
    result.scale.push_back(key_at(0.0, 1.0));
    for (int c = 0; c < cycles; ++c) {
        result.scale.push_back(key_at(duration * (c + 0.5) / cycles, 1.0 + amount, Easing::EaseInOutQuad));
        result.scale.push_back(key_at(duration * (c + 1.0) / cycles, 1.0, Easing::EaseInOutQuad));
    }
    return result;
}

PresetResult SpinPreset::generate(const TemplateParameters& params, std::optional<double> target_duration) const {
    const double duration = target_or(target_duration, kSpinDefaultDurationMs);
    const double turns = std::max(0.25, duration / 1000.0 * positive_or(params.spin_speed, 1.0, 0.1));
    const double direction = params.spin_direction < 0 ? -1.0 : 1.0;

    PresetResult result;
    result.duration = duration;
    result.rotation = {
        key_at(0.0, 0.0),
        key_at(duration, direction * 2.0 * kPi * turns),
    };
    return result;
}

}
