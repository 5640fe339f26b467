#pragma once

#include <string>

#include "presets/template_id.hpp"
#include "presets/template_parameters.hpp"

namespace tumble::timeline {

inline constexpr double kMinClipDurationMs = 80.0;

struct TemplateClip {
    std::string id;
    std::string layer_id;
    presets::TemplateId template_id = presets::TemplateId::Unknown;
    // Raw name for templates this build cannot generate; written back verbatim.
    std::string unrecognized_template;
    double start = 0.0;
    double duration = kMinClipDurationMs;
    presets::TemplateParameters parameters;

    double end() const { return start + duration; }

    std::string template_name() const {
        if (template_id == presets::TemplateId::Unknown && !unrecognized_template.empty()) {
            return unrecognized_template;
        }
        return presets::template_key(template_id);
    }
};

inline bool operator==(const TemplateClip& a, const TemplateClip& b) {
    return a.id == b.id && a.layer_id == b.layer_id && a.template_id == b.template_id &&
           a.unrecognized_template == b.unrecognized_template && a.start == b.start &&
           a.duration == b.duration && a.parameters == b.parameters;
}

// Clamps start to a finite non-negative time and duration to at least kMinClipDurationMs.
TemplateClip sanitize_clip(TemplateClip clip);

}
