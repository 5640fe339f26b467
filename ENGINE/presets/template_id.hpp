#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace tumble::presets {

enum class TemplateId {
    Roll,
    Jump,
    Pop,
    Shake,
    Pulse,
    Spin,
    FadeIn,
    FadeOut,
    SlideIn,
    SlideOut,
    GrowIn,
    GrowOut,
    ShrinkIn,
    ShrinkOut,
    SpinIn,
    SpinOut,
    TwistIn,
    TwistOut,
    MoveScaleIn,
    MoveScaleOut,
    Path,
    Unknown,
};

const char* template_key(TemplateId id);
TemplateId template_from_key(std::string_view key);

// Entrance/exit templates whose boundary keys resolve to the layer's base state.
bool is_in_out(TemplateId id);
bool is_in_variant(TemplateId id);
bool is_out_variant(TemplateId id);

const std::vector<TemplateId>& known_templates();

}
