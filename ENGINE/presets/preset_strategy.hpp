#pragma once

#include <optional>

#include "preset_result.hpp"
#include "template_id.hpp"
#include "template_parameters.hpp"

namespace tumble::presets {

class PresetStrategy {

public:
    PresetStrategy() = default;
    virtual ~PresetStrategy() = default;

    virtual TemplateId id() const = 0;

    // Local curve starting at time 0. Physically derived templates ignore
    // `target_duration`; the compiler stretches their result afterwards.
    virtual PresetResult generate(const TemplateParameters& params, std::optional<double> target_duration) const = 0;
};

}
