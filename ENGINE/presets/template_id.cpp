#include "template_id.hpp"

#include <array>
#include <utility>

#include "utils/string_utils.hpp"

namespace tumble::presets {

namespace {

constexpr std::array<std::pair<TemplateId, const char*>, 21> kTemplateKeys{{
    {TemplateId::Roll, "roll"},
    {TemplateId::Jump, "jump"},
    {TemplateId::Pop, "pop"},
    {TemplateId::Shake, "shake"},
    {TemplateId::Pulse, "pulse"},
    {TemplateId::Spin, "spin"},
    {TemplateId::FadeIn, "fade_in"},
    {TemplateId::FadeOut, "fade_out"},
    {TemplateId::SlideIn, "slide_in"},
    {TemplateId::SlideOut, "slide_out"},
    {TemplateId::GrowIn, "grow_in"},
    {TemplateId::GrowOut, "grow_out"},
    {TemplateId::ShrinkIn, "shrink_in"},
    {TemplateId::ShrinkOut, "shrink_out"},
    {TemplateId::SpinIn, "spin_in"},
    {TemplateId::SpinOut, "spin_out"},
    {TemplateId::TwistIn, "twist_in"},
    {TemplateId::TwistOut, "twist_out"},
    {TemplateId::MoveScaleIn, "move_scale_in"},
    {TemplateId::MoveScaleOut, "move_scale_out"},
    {TemplateId::Path, "path"},
}};

}

const char* template_key(TemplateId id) {
    for (const auto& entry : kTemplateKeys) {
        if (entry.first == id) {
            return entry.second;
        }
    }
    return "unknown";
}

TemplateId template_from_key(std::string_view key) {
    const std::string normalized = strings::normalize_key(key);
    for (const auto& entry : kTemplateKeys) {
        if (normalized == entry.second) {
            return entry.first;
        }
    }
    return TemplateId::Unknown;
}

bool is_in_variant(TemplateId id) {
    switch (id) {
    case TemplateId::FadeIn:
    case TemplateId::SlideIn:
    case TemplateId::GrowIn:
    case TemplateId::ShrinkIn:
    case TemplateId::SpinIn:
    case TemplateId::TwistIn:
    case TemplateId::MoveScaleIn:
        return true;
    default:
        return false;
    }
}

bool is_out_variant(TemplateId id) {
    switch (id) {
    case TemplateId::FadeOut:
    case TemplateId::SlideOut:
    case TemplateId::GrowOut:
    case TemplateId::ShrinkOut:
    case TemplateId::SpinOut:
    case TemplateId::TwistOut:
    case TemplateId::MoveScaleOut:
        return true;
    default:
        return false;
    }
}

bool is_in_out(TemplateId id) {
    return is_in_variant(id) || is_out_variant(id);
}

const std::vector<TemplateId>& known_templates() {
    static const std::vector<TemplateId> templates = [] {
        std::vector<TemplateId> ids;
        ids.reserve(kTemplateKeys.size());
        for (const auto& entry : kTemplateKeys) {
            ids.push_back(entry.first);
        }
        return ids;
    }();
    return templates;
}

}
