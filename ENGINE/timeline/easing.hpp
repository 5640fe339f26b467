#pragma once

#include <string>
#include <string_view>

#include "timeline_types.hpp"

namespace tumble::timeline {

// Maps a linear fraction in [0,1] through the easing curve. EaseOutBack
// overshoots past 1 before settling; Step holds 0 until the fraction reaches 1.
double apply_easing(double t, Easing easing);

const char* easing_name(Easing easing);
Easing easing_from_name(std::string_view name);

}
