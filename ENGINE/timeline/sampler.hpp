#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "timeline_types.hpp"

namespace tumble::timeline {

double sample_channel(const NumberChannel& frames, double time, double fallback);
Vec2 sample_channel(const Vec2Channel& frames, double time, const Vec2& fallback);

// Point at `fraction` of the polyline's total arc length.
Vec2 sample_path_point(const std::vector<Vec2>& points, double fraction);

// Empty when `time` is outside the clip window or the clip has fewer than two points.
std::optional<Vec2> sample_path_clip(const PathClip& clip, double time);

// Samples the four channels independently; `defaults` fills empty channels.
SampledLayerState sample_layer_tracks(const LayerTrack& track, double time, const SampledLayerState& defaults = default_layer_state());

// sample_layer_tracks plus the active path clip overriding position.
SampledLayerState sample_layer_state(const LayerTrack& track, double time, const SampledLayerState& defaults = default_layer_state());

using SampledTimeline = std::unordered_map<std::string, SampledLayerState>;

SampledTimeline sample_timeline(const std::vector<LayerTrack>& tracks, double time, const SampledLayerState& defaults = default_layer_state());
SampledTimeline sample_timeline(const std::vector<LayerTrack>& tracks, double time,
                                const std::unordered_map<std::string, SampledLayerState>& layer_defaults);

}
