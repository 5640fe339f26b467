#pragma once

#include <vector>

#include "timeline_types.hpp"

namespace tumble::timeline {

inline constexpr int    kDefaultChaikinIterations = 2;
inline constexpr double kDefaultChaikinTension    = 0.25;

// Chaikin corner cutting. Endpoints are kept exactly; each pass turns n points
// into 2n - 1. Inputs with fewer than three points come back unchanged.
std::vector<Vec2> chaikin_smooth(const std::vector<Vec2>& points,
                                 int iterations = kDefaultChaikinIterations,
                                 double tension = kDefaultChaikinTension);

double calculate_path_length(const std::vector<Vec2>& points);

// Drops points with non-finite coordinates.
std::vector<Vec2> finite_points(const std::vector<Vec2>& points);

}
