#pragma once

#include <optional>
#include <vector>

#include "timeline/timeline_types.hpp"

namespace tumble::presets {

struct TemplateParameters {
    double template_speed = 1.0;

    double roll_distance = 0.2;

    double jump_height = 0.25;
    double jump_velocity = 1.5;

    double pop_scale = 1.6;
    bool pop_wobble = false;
    double pop_speed = 1.0;
    bool pop_collapse = true;
    bool pop_reappear = false;

    double shake_distance = 0.02;

    double pulse_scale = 0.2;
    double pulse_speed = 1.0;

    double spin_speed = 1.0;
    int spin_direction = 1;

    std::vector<timeline::Vec2> path_points;
    timeline::Easing path_easing = timeline::Easing::Linear;

    // Anchor for entrance/exit clips when the layer's resting transform should
    // not come from the clip chain.
    std::optional<timeline::SampledLayerState> layer_base;
};

inline bool operator==(const TemplateParameters& a, const TemplateParameters& b) {
    return a.template_speed == b.template_speed && a.roll_distance == b.roll_distance &&
           a.jump_height == b.jump_height && a.jump_velocity == b.jump_velocity &&
           a.pop_scale == b.pop_scale && a.pop_wobble == b.pop_wobble && a.pop_speed == b.pop_speed &&
           a.pop_collapse == b.pop_collapse && a.pop_reappear == b.pop_reappear &&
           a.shake_distance == b.shake_distance && a.pulse_scale == b.pulse_scale &&
           a.pulse_speed == b.pulse_speed && a.spin_speed == b.spin_speed &&
           a.spin_direction == b.spin_direction && a.path_points == b.path_points &&
           a.path_easing == b.path_easing && a.layer_base == b.layer_base;
}

}
