#pragma once

#include <algorithm>
#include <cmath>
#include <iterator>
#include <string>
#include <vector>

#include "timeline_types.hpp"

namespace tumble::timeline {

// Keyframes closer than this are the same timestamp.
inline constexpr double kTimeEpsilonMs = 1e-6;

inline bool same_time(double a, double b) {
    return std::fabs(a - b) <= kTimeEpsilonMs;
}

template <typename T>
void sort_keyframes(std::vector<Keyframe<T>>& frames) {
    std::stable_sort(frames.begin(), frames.end(),
                     [](const Keyframe<T>& a, const Keyframe<T>& b) { return a.time < b.time; });
}

// Inserts in time order, replacing any keyframe already at that timestamp.
template <typename T>
void upsert_keyframe(std::vector<Keyframe<T>>& frames, Keyframe<T> frame) {
    frames.erase(std::remove_if(frames.begin(), frames.end(),
                                [&](const Keyframe<T>& existing) { return same_time(existing.time, frame.time); }),
                 frames.end());
    auto it = std::upper_bound(frames.begin(), frames.end(), frame.time,
                               [](double time, const Keyframe<T>& existing) { return time < existing.time; });
    frames.insert(it, std::move(frame));
}

template <typename T>
std::vector<Keyframe<T>> untagged_keyframes(const std::vector<Keyframe<T>>& frames) {
    std::vector<Keyframe<T>> result;
    std::copy_if(frames.begin(), frames.end(), std::back_inserter(result),
                 [](const Keyframe<T>& frame) { return !frame.tagged(); });
    return result;
}

template <typename T>
double last_keyframe_time(const std::vector<Keyframe<T>>& frames) {
    return frames.empty() ? 0.0 : frames.back().time;
}

inline double track_end_time(const LayerTrack& track) {
    double end = std::max({last_keyframe_time(track.position), last_keyframe_time(track.scale),
                           last_keyframe_time(track.rotation), last_keyframe_time(track.opacity)});
    for (const auto& path : track.paths) {
        end = std::max(end, path.end_time());
    }
    return end;
}

}
