#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "presets/template_parameters.hpp"
#include "timeline/template_clip.hpp"
#include "timeline/timeline_types.hpp"

namespace tumble::editor {

struct Layer {
    std::string id;
    std::string kind = "shape";
    double x = 0.5;
    double y = 0.5;
    double width = 0.2;
    double height = 0.2;
    // Layer-level scale, applied by the renderer on top of the scale channel.
    double scale = 1.0;
    double rotation = 0.0;
    double opacity = 1.0;
    std::uint32_t fill_color = 0xffffff;
};

inline bool operator==(const Layer& a, const Layer& b) {
    return a.id == b.id && a.kind == b.kind && a.x == b.x && a.y == b.y && a.width == b.width &&
           a.height == b.height && a.scale == b.scale && a.rotation == b.rotation &&
           a.opacity == b.opacity && a.fill_color == b.fill_color;
}

inline timeline::SampledLayerState declared_base(const Layer& layer) {
    timeline::SampledLayerState base;
    base.position = timeline::Vec2{layer.x, layer.y};
    base.scale = 1.0;
    base.rotation = layer.rotation;
    base.opacity = layer.opacity;
    return base;
}

enum class BackgroundMode {
    Solid,
    Gradient,
};

struct BackgroundSettings {
    BackgroundMode mode = BackgroundMode::Solid;
    std::string solid = "#0f172a";
    std::string from = "#0f172a";
    std::string to = "#1e293b";
    double opacity = 1.0;
};

inline bool operator==(const BackgroundSettings& a, const BackgroundSettings& b) {
    return a.mode == b.mode && a.solid == b.solid && a.from == b.from && a.to == b.to && a.opacity == b.opacity;
}

// Complete editable state. Every member is a value type, so a copy shares
// nothing with the document it came from.
struct DocumentSnapshot {
    std::vector<Layer> layers;
    std::vector<std::string> layer_order;
    BackgroundSettings background;
    presets::TemplateParameters parameters;
    std::vector<timeline::TemplateClip> clips;
    // Hand-placed keyframes per layer; compiled tracks are derived from these plus clips.
    std::vector<timeline::LayerTrack> authored;
};

inline bool operator==(const DocumentSnapshot& a, const DocumentSnapshot& b) {
    return a.layers == b.layers && a.layer_order == b.layer_order && a.background == b.background &&
           a.parameters == b.parameters && a.clips == b.clips && a.authored == b.authored;
}

}
