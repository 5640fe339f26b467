#include "path_smoothing.hpp"

#include <algorithm>
#include <cmath>
#include <string>

#include "utils/log.hpp"

namespace tumble::timeline {

namespace {

Vec2 along(const Vec2& from, const Vec2& to, double t) {
    return Vec2{from.x + t * (to.x - from.x), from.y + t * (to.y - from.y)};
}

}

std::vector<Vec2> finite_points(const std::vector<Vec2>& points) {
    std::vector<Vec2> result;
    result.reserve(points.size());
    for (const auto& p : points) {
        if (std::isfinite(p.x) && std::isfinite(p.y)) {
            result.push_back(p);
        }
    }
    if (result.size() != points.size()) {
        log::debug("[PathSmoothing] dropped " + std::to_string(points.size() - result.size()) + " non-finite point(s)");
    }
    return result;
}

std::vector<Vec2> chaikin_smooth(const std::vector<Vec2>& points, int iterations, double tension) {
    if (points.size() < 3 || iterations <= 0) {
        return points;
    }

    std::vector<Vec2> result = finite_points(points);
    if (result.size() < 3) {
        return result;
    }
    if (!std::isfinite(tension)) {
        tension = kDefaultChaikinTension;
    }
    tension = std::clamp(tension, 0.0, 0.5);

    for (int iter = 0; iter < iterations; ++iter) {
        std::vector<Vec2> smoothed;
        smoothed.reserve(result.size() * 2);
        smoothed.push_back(result.front());

        for (std::size_t i = 0; i + 1 < result.size(); ++i) {
            const Vec2& p0 = result[i];
            const Vec2& p1 = result[i + 1];
            if (i > 0) {
                smoothed.push_back(along(p0, p1, tension));
            }
            smoothed.push_back(along(p0, p1, 1.0 - tension));
        }

        smoothed.push_back(result.back());
        result = std::move(smoothed);
    }

    return result;
}

double calculate_path_length(const std::vector<Vec2>& points) {
    double length = 0.0;
    for (std::size_t i = 1; i < points.size(); ++i) {
        length += std::hypot(points[i].x - points[i - 1].x, points[i].y - points[i - 1].y);
    }
    return length;
}

}
