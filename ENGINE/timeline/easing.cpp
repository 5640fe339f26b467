#include "easing.hpp"

#include <cmath>

#include "utils/string_utils.hpp"

namespace tumble::timeline {

double apply_easing(double t, Easing easing) {
    switch (easing) {
    case Easing::EaseInQuad:
        return t * t;
    case Easing::EaseOutQuad:
        return 1.0 - (1.0 - t) * (1.0 - t);
    case Easing::EaseInOutQuad:
        return t < 0.5 ? 2.0 * t * t : 1.0 - std::pow(-2.0 * t + 2.0, 2.0) / 2.0;
    case Easing::EaseOutBack: {
        constexpr double c1 = 1.70158;
        constexpr double c3 = c1 + 1.0;
        return 1.0 + c3 * std::pow(t - 1.0, 3.0) + c1 * std::pow(t - 1.0, 2.0);
    }
    case Easing::Step:
        return t >= 1.0 ? 1.0 : 0.0;
    case Easing::Linear:
    default:
        return t;
    }
}

const char* easing_name(Easing easing) {
    switch (easing) {
    case Easing::EaseInQuad:    return "easeInQuad";
    case Easing::EaseOutQuad:   return "easeOutQuad";
    case Easing::EaseInOutQuad: return "easeInOutQuad";
    case Easing::EaseOutBack:   return "easeOutBack";
    case Easing::Step:          return "step";
    case Easing::Linear:
    default:                    return "linear";
    }
}

Easing easing_from_name(std::string_view name) {
    const std::string lowered = strings::to_lower_copy(strings::trim_copy(name));
    if (lowered == "easeinquad" || lowered == "ease_in" || lowered == "ease-in") return Easing::EaseInQuad;
    if (lowered == "easeoutquad" || lowered == "ease_out" || lowered == "ease-out") return Easing::EaseOutQuad;
    if (lowered == "easeinoutquad" || lowered == "ease_in_out" || lowered == "ease-in-out") return Easing::EaseInOutQuad;
    if (lowered == "easeoutback" || lowered == "back") return Easing::EaseOutBack;
    if (lowered == "step" || lowered == "stepped" || lowered == "hold") return Easing::Step;
    return Easing::Linear;
}

}
