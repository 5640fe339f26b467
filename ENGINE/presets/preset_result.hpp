#pragma once

#include <optional>
#include <utility>
#include <variant>
#include <vector>

#include "timeline/timeline_types.hpp"

namespace tumble::presets {

template <typename T>
struct PresetValue {
    // Resolve to the caller-supplied base state for this channel.
    struct UseBase {
};

    struct Offset {
        T value{};
};

    using Variant = std::variant<Offset, UseBase>;

    PresetValue() = default;
    explicit PresetValue(Variant data) : data(std::move(data)) {}

    static PresetValue make_offset(T value) { return PresetValue{Variant{Offset{value}}}; }
    static PresetValue make_use_base() { return PresetValue{Variant{UseBase{}}}; }

    bool uses_base() const { return std::holds_alternative<UseBase>(data); }

    const Offset* as_offset() const { return std::get_if<Offset>(&data); }

    // Offset value, or `base` when the key anchors to the base state.
    T resolve_or(const T& base) const {
        if (const auto* offset = as_offset()) {
            return offset->value;
        }
        return base;
    }

    Variant data{Offset{}};
};

template <typename T>
struct PresetKey {
    double time = 0.0;
    PresetValue<T> value;
    timeline::Easing easing = timeline::Easing::Linear;
};

template <typename T>
PresetKey<T> key_at(double time, T offset, timeline::Easing easing = timeline::Easing::Linear) {
    return PresetKey<T>{time, PresetValue<T>::make_offset(offset), easing};
}

template <typename T>
PresetKey<T> base_key_at(double time, timeline::Easing easing = timeline::Easing::Linear) {
    return PresetKey<T>{time, PresetValue<T>::make_use_base(), easing};
}

struct PresetMeta {
    std::optional<double> roll_distance;
    std::optional<double> jump_height;
    std::optional<double> pop_scale;
    bool wobble = false;
    bool collapse = false;
};

struct PresetResult {
    std::vector<PresetKey<timeline::Vec2>> position;
    std::vector<PresetKey<double>> scale;
    std::vector<PresetKey<double>> rotation;
    std::vector<PresetKey<double>> opacity;
    double duration = 0.0;
    PresetMeta meta;

    bool empty() const {
        return position.empty() && scale.empty() && rotation.empty() && opacity.empty();
    }

    // Stretches local key times so the curve spans `target_duration`.
    void rescale_to(double target_duration) {
        if (!(target_duration > 0.0)) {
            return;
        }
        if (duration > 0.0 && duration != target_duration) {
            const double factor = target_duration / duration;
            for (auto& key : position) key.time *= factor;
            for (auto& key : scale) key.time *= factor;
            for (auto& key : rotation) key.time *= factor;
            for (auto& key : opacity) key.time *= factor;
        }
        duration = target_duration;
    }
};

}
