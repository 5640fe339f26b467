#pragma once

#include <array>
#include <string>
#include <vector>

#include "template_clip.hpp"
#include "timeline_types.hpp"

namespace tumble::timeline {

struct CompileResult {
    LayerTrack track;
    double duration = kDefaultTimelineDurationMs;
    // Indexed by Channel; true when at least one clip writes keys to it.
    std::array<bool, 4> animated{{false, false, false, false}};

    bool animates(Channel channel) const { return animated[static_cast<std::size_t>(channel)]; }
};

// Rebuilds a layer's channels from its clip list.
//
// `authored` holds the layer's hand-placed keyframes. It is read, never
// modified, so compiling the same inputs twice yields identical tracks.
// Clips belonging to other layers are ignored.
class TrackCompiler {

public:
    TrackCompiler() = default;

    CompileResult compile(const std::string& layer_id,
                          const std::vector<TemplateClip>& clips,
                          const SampledLayerState& declared_base,
                          const LayerTrack& authored) const;

    CompileResult compile(const std::string& layer_id,
                          const std::vector<TemplateClip>& clips,
                          const SampledLayerState& declared_base) const;
};

// max(last keyframe, clip ends, path ends, kDefaultTimelineDurationMs).
double compiled_duration(const LayerTrack& track, const std::vector<TemplateClip>& clips);

}
