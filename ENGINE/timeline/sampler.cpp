#include "sampler.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>

#include "easing.hpp"
#include "keyframes.hpp"

namespace tumble::timeline {

namespace {

double clamp01(double v) {
    return std::min(1.0, std::max(0.0, v));
}

double lerp(double a, double b, double t) {
    return a + (b - a) * t;
}

Vec2 lerp(const Vec2& a, const Vec2& b, double t) {
    return Vec2{lerp(a.x, b.x, t), lerp(a.y, b.y, t)};
}

template <typename T>
T sample_frames(const std::vector<Keyframe<T>>& frames, double time, const T& fallback) {
    if (frames.empty()) {
        return fallback;
    }
    if (frames.size() == 1 || std::isnan(time) || time <= frames.front().time) {
        return frames.front().value;
    }
    if (time >= frames.back().time) {
        return frames.back().value;
    }

    auto next = std::upper_bound(frames.begin(), frames.end(), time,
                                 [](double t, const Keyframe<T>& frame) { return t < frame.time; });
    auto prev = std::prev(next);
    if (same_time(prev->time, time)) {
        return prev->value;
    }
    const double span = next->time - prev->time;
    if (span <= 0.0) {
        return next->value;
    }
    const double t = clamp01((time - prev->time) / span);
    return lerp(prev->value, next->value, apply_easing(t, next->easing));
}

void apply_active_path(const LayerTrack& track, double time, SampledLayerState& state) {
    for (const auto& clip : track.paths) {
        if (auto point = sample_path_clip(clip, time)) {
            state.position = *point;
            state.active_path_id = clip.id;
            return;
        }
    }
}

}

double sample_channel(const NumberChannel& frames, double time, double fallback) {
    return sample_frames(frames, time, fallback);
}

Vec2 sample_channel(const Vec2Channel& frames, double time, const Vec2& fallback) {
    return sample_frames(frames, time, fallback);
}

Vec2 sample_path_point(const std::vector<Vec2>& points, double fraction) {
    if (points.empty()) {
        return Vec2{};
    }
    if (points.size() == 1) {
        return points.front();
    }

    std::vector<double> distances;
    distances.reserve(points.size());
    distances.push_back(0.0);
    double total = 0.0;
    for (std::size_t i = 1; i < points.size(); ++i) {
        total += std::hypot(points[i].x - points[i - 1].x, points[i].y - points[i - 1].y);
        distances.push_back(total);
    }

    const double target = clamp01(fraction) * total;
    for (std::size_t i = 1; i < points.size(); ++i) {
        if (distances[i] >= target) {
            const double segment = distances[i] - distances[i - 1];
            const double local = segment == 0.0 ? 0.0 : (target - distances[i - 1]) / segment;
            return lerp(points[i - 1], points[i], local);
        }
    }
    return points.back();
}

std::optional<Vec2> sample_path_clip(const PathClip& clip, double time) {
    if (clip.points.size() < 2) {
        return std::nullopt;
    }
    if (!(time >= clip.start_time) || time > clip.end_time()) {
        return std::nullopt;
    }
    const double fraction = clip.duration > 0.0 ? clamp01((time - clip.start_time) / clip.duration) : 1.0;
    return sample_path_point(clip.points, apply_easing(fraction, clip.easing));
}

SampledLayerState sample_layer_tracks(const LayerTrack& track, double time, const SampledLayerState& defaults) {
    SampledLayerState state;
    state.position = sample_channel(track.position, time, defaults.position);
    state.scale    = sample_channel(track.scale, time, defaults.scale);
    state.rotation = sample_channel(track.rotation, time, defaults.rotation);
    state.opacity  = sample_channel(track.opacity, time, defaults.opacity);
    return state;
}

SampledLayerState sample_layer_state(const LayerTrack& track, double time, const SampledLayerState& defaults) {
    SampledLayerState state = sample_layer_tracks(track, time, defaults);
    apply_active_path(track, time, state);
    return state;
}

SampledTimeline sample_timeline(const std::vector<LayerTrack>& tracks, double time, const SampledLayerState& defaults) {
    SampledTimeline result;
    result.reserve(tracks.size());
    for (const auto& track : tracks) {
        result[track.layer_id] = sample_layer_state(track, time, defaults);
    }
    return result;
}

SampledTimeline sample_timeline(const std::vector<LayerTrack>& tracks, double time,
                                const std::unordered_map<std::string, SampledLayerState>& layer_defaults) {
    SampledTimeline result;
    result.reserve(tracks.size());
    for (const auto& track : tracks) {
        auto it = layer_defaults.find(track.layer_id);
        const SampledLayerState& defaults = it != layer_defaults.end() ? it->second : default_layer_state();
        result[track.layer_id] = sample_layer_state(track, time, defaults);
    }
    return result;
}

}
