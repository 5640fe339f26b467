#include "transition_presets.hpp"

#include <cmath>
#include <string>
#include <vector>

#include "utils/log.hpp"

namespace tumble::presets {

using timeline::Easing;
using timeline::Vec2;

namespace {

constexpr double kPi = 3.14159265358979323846;
constexpr double kSlideDistance = 0.3;
constexpr double kMoveScaleDistance = 0.15;
constexpr double kGrowOvershoot = 1.6;
constexpr double kMoveScaleFactor = 0.5;

// Opacity rising from 0 to the base level by `fraction` of the clip.
std::vector<PresetKey<double>> fade_up_by(double duration, double fraction) {
    return {
        key_at(0.0, 0.0),
        base_key_at<double>(duration * fraction, Easing::EaseOutQuad),
    };
}

// Opacity holding the base level until `fraction`, then dropping to 0.
std::vector<PresetKey<double>> fade_down_after(double duration, double fraction) {
    return {
        base_key_at<double>(0.0),
        base_key_at<double>(duration * fraction),
        key_at(duration, 0.0, Easing::EaseInQuad),
    };
}

}

TransitionPreset::TransitionPreset(TemplateId id) : id_(id) {
    if (!is_in_out(id)) {
        tumble::log::warn(std::string("[Presets] transition preset built for non-transition template ") + template_key(id));
    }
}

PresetResult TransitionPreset::generate(const TemplateParameters&, std::optional<double> target_duration) const {
    const double d = (target_duration && std::isfinite(*target_duration) && *target_duration > 0.0)
                         ? *target_duration
                         : kTransitionDefaultDurationMs;
    PresetResult result;
    result.duration = d;

    switch (id_) {
    case TemplateId::FadeIn:
        result.opacity = {key_at(0.0, 0.0), base_key_at<double>(d, Easing::EaseOutQuad)};
        break;
    case TemplateId::FadeOut:
        result.opacity = {base_key_at<double>(0.0), key_at(d, 0.0, Easing::EaseInQuad)};
        break;
    case TemplateId::SlideIn:
        result.position = {key_at(0.0, Vec2{-kSlideDistance, 0.0}), base_key_at<Vec2>(d, Easing::EaseOutQuad)};
        result.opacity = fade_up_by(d, 0.4);
        break;
    case TemplateId::SlideOut:
        result.position = {base_key_at<Vec2>(0.0), key_at(d, Vec2{kSlideDistance, 0.0}, Easing::EaseInQuad)};
        result.opacity = fade_down_after(d, 0.6);
        break;
    case TemplateId::GrowIn:
        result.scale = {key_at(0.0, 0.0), base_key_at<double>(d, Easing::EaseOutBack)};
        result.opacity = fade_up_by(d, 0.3);
        break;
    case TemplateId::GrowOut:
        result.scale = {base_key_at<double>(0.0), key_at(d, kGrowOvershoot, Easing::EaseInQuad)};
        result.opacity = {base_key_at<double>(0.0), key_at(d, 0.0, Easing::EaseInQuad)};
        break;
    case TemplateId::ShrinkIn:
        result.scale = {key_at(0.0, kGrowOvershoot), base_key_at<double>(d, Easing::EaseOutQuad)};
        result.opacity = fade_up_by(d, 0.5);
        break;
    case TemplateId::ShrinkOut:
        result.scale = {base_key_at<double>(0.0), key_at(d, 0.0, Easing::EaseInQuad)};
        break;
    case TemplateId::SpinIn:
        result.rotation = {key_at(0.0, -2.0 * kPi), base_key_at<double>(d, Easing::EaseOutQuad)};
        result.scale = {key_at(0.0, 0.0), base_key_at<double>(d, Easing::EaseOutQuad)};
        break;
    case TemplateId::SpinOut:
        result.rotation = {base_key_at<double>(0.0), key_at(d, 2.0 * kPi, Easing::EaseInQuad)};
        result.scale = {base_key_at<double>(0.0), key_at(d, 0.0, Easing::EaseInQuad)};
        break;
    case TemplateId::TwistIn:
        result.rotation = {key_at(0.0, -kPi / 2.0), base_key_at<double>(d, Easing::EaseOutBack)};
        result.opacity = fade_up_by(d, 0.5);
        break;
    case TemplateId::TwistOut:
        result.rotation = {base_key_at<double>(0.0), key_at(d, kPi / 2.0, Easing::EaseInQuad)};
        result.opacity = fade_down_after(d, 0.5);
        break;
    case TemplateId::MoveScaleIn:
        result.position = {key_at(0.0, Vec2{0.0, kMoveScaleDistance}), base_key_at<Vec2>(d, Easing::EaseOutQuad)};
        result.scale = {key_at(0.0, kMoveScaleFactor), base_key_at<double>(d, Easing::EaseOutQuad)};
        result.opacity = fade_up_by(d, 0.4);
        break;
    case TemplateId::MoveScaleOut:
        result.position = {base_key_at<Vec2>(0.0), key_at(d, Vec2{0.0, -kMoveScaleDistance}, Easing::EaseInQuad)};
        result.scale = {base_key_at<double>(0.0), key_at(d, kMoveScaleFactor, Easing::EaseInQuad)};
        result.opacity = fade_down_after(d, 0.6);
        break;
    default:
        break;
    }
    return result;
}

}
