#include "doctest/doctest.h"

#include <limits>
#include <vector>

#include "timeline/path_smoothing.hpp"

using namespace tumble::timeline;

TEST_CASE("Chaikin smoothing keeps the endpoints") {
    const std::vector<Vec2> stroke{Vec2{0.0, 0.0}, Vec2{1.0, 0.0}, Vec2{1.0, 1.0}};
    const std::vector<Vec2> smoothed = chaikin_smooth(stroke, 1);
    REQUIRE(smoothed.size() == 5);
    CHECK(smoothed.front() == stroke.front());
    CHECK(smoothed.back() == stroke.back());
    CHECK(smoothed[1].x == doctest::Approx(0.75));
    CHECK(smoothed[2].x == doctest::Approx(1.0));
    CHECK(smoothed[2].y == doctest::Approx(0.25));

    CHECK(chaikin_smooth(stroke).size() == 9);
}

TEST_CASE("Chaikin smoothing shortens a corner") {
    const std::vector<Vec2> stroke{Vec2{0.0, 0.0}, Vec2{1.0, 0.0}, Vec2{1.0, 1.0}};
    CHECK(calculate_path_length(chaikin_smooth(stroke)) < calculate_path_length(stroke));
}

TEST_CASE("Short or degenerate strokes pass through") {
    const std::vector<Vec2> two{Vec2{0.0, 0.0}, Vec2{1.0, 1.0}};
    CHECK(chaikin_smooth(two) == two);
    CHECK(chaikin_smooth(std::vector<Vec2>{}).empty());

    const std::vector<Vec2> three{Vec2{0.0, 0.0}, Vec2{0.5, 0.5}, Vec2{1.0, 0.0}};
    CHECK(chaikin_smooth(three, 0) == three);
}

TEST_CASE("Non-finite points are dropped") {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const std::vector<Vec2> stroke{Vec2{0.0, 0.0}, Vec2{nan, 0.5}, Vec2{1.0, 0.0}, Vec2{1.0, 1.0}};
    CHECK(finite_points(stroke).size() == 3);
    CHECK(chaikin_smooth(stroke, 1).size() == 5);
}

TEST_CASE("Path length sums the segments") {
    const std::vector<Vec2> stroke{Vec2{0.0, 0.0}, Vec2{0.3, 0.4}, Vec2{0.3, 1.4}};
    CHECK(calculate_path_length(stroke) == doctest::Approx(1.5));
    CHECK(calculate_path_length({Vec2{0.2, 0.2}}) == doctest::Approx(0.0));
}
