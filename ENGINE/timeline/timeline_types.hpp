#pragma once

#include <string>
#include <vector>

namespace tumble::timeline {

struct Vec2 {
    double x = 0.0;
    double y = 0.0;
};

inline Vec2 operator+(const Vec2& a, const Vec2& b) { return Vec2{a.x + b.x, a.y + b.y}; }
inline Vec2 operator-(const Vec2& a, const Vec2& b) { return Vec2{a.x - b.x, a.y - b.y}; }
inline bool operator==(const Vec2& a, const Vec2& b) { return a.x == b.x && a.y == b.y; }
inline bool operator!=(const Vec2& a, const Vec2& b) { return !(a == b); }

enum class Easing {
    Linear,
    EaseInQuad,
    EaseOutQuad,
    EaseInOutQuad,
    EaseOutBack,
    Step,
};

template <typename T>
struct Keyframe {
    double time = 0.0;
    T value{};
    Easing easing = Easing::Linear;
    // Id of the clip that produced this keyframe, empty when authored by hand.
    std::string clip_id;

    bool tagged() const { return !clip_id.empty(); }
};

template <typename T>
inline bool operator==(const Keyframe<T>& a, const Keyframe<T>& b) {
    return a.time == b.time && a.value == b.value && a.easing == b.easing && a.clip_id == b.clip_id;
}

using Vec2Channel   = std::vector<Keyframe<Vec2>>;
using NumberChannel = std::vector<Keyframe<double>>;

struct PathClip {
    std::string id;
    double start_time = 0.0;
    double duration = 0.0;
    std::vector<Vec2> points;
    Easing easing = Easing::Linear;

    double end_time() const { return start_time + duration; }
};

inline bool operator==(const PathClip& a, const PathClip& b) {
    return a.id == b.id && a.start_time == b.start_time && a.duration == b.duration &&
           a.points == b.points && a.easing == b.easing;
}

enum class Channel {
    Position,
    Scale,
    Rotation,
    Opacity,
};

struct LayerTrack {
    std::string layer_id;
    Vec2Channel position;
    NumberChannel scale;
    NumberChannel rotation; // radians
    NumberChannel opacity;  // 0..1
    std::vector<PathClip> paths;
};

inline bool operator==(const LayerTrack& a, const LayerTrack& b) {
    return a.layer_id == b.layer_id && a.position == b.position && a.scale == b.scale &&
           a.rotation == b.rotation && a.opacity == b.opacity && a.paths == b.paths;
}

struct SampledLayerState {
    Vec2 position{0.5, 0.5};
    double scale = 1.0;
    double rotation = 0.0;
    double opacity = 1.0;
    std::string active_path_id;
};

inline bool operator==(const SampledLayerState& a, const SampledLayerState& b) {
    return a.position == b.position && a.scale == b.scale && a.rotation == b.rotation &&
           a.opacity == b.opacity && a.active_path_id == b.active_path_id;
}

inline const SampledLayerState& default_layer_state() {
    static const SampledLayerState state{};
    return state;
}

inline constexpr double kDefaultTimelineDurationMs = 4000.0;

}
