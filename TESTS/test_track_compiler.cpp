#include "doctest/doctest.h"

#include <algorithm>
#include <string>
#include <vector>

#include "presets/periodic_presets.hpp"
#include "presets/preset_factory.hpp"
#include "timeline/keyframes.hpp"
#include "timeline/sampler.hpp"
#include "timeline/track_compiler.hpp"

using namespace tumble::timeline;
using tumble::presets::TemplateId;
using tumble::presets::TemplateParameters;

namespace {

constexpr double kPi = 3.14159265358979323846;

TemplateClip make_clip(const std::string& id,
                       TemplateId template_id,
                       double start,
                       double duration,
                       TemplateParameters params = {}) {
    TemplateClip clip;
    clip.id = id;
    clip.layer_id = "ball";
    clip.template_id = template_id;
    clip.start = start;
    clip.duration = duration;
    clip.parameters = std::move(params);
    return clip;
}

SampledLayerState centered_base() {
    SampledLayerState base;
    base.position = Vec2{0.5, 0.5};
    return base;
}

double natural(TemplateId id, const TemplateParameters& params = {}) {
    return tumble::presets::natural_duration(id, params);
}

}

TEST_CASE("Jump from rest reaches its apex halfway") {
    TemplateParameters params;
    params.jump_height = 0.25;
    params.jump_velocity = 1.5;
    const double d = natural(TemplateId::Jump, params);
    CHECK(d == doctest::Approx(451.76).epsilon(0.001));

    const TrackCompiler compiler;
    const CompileResult result = compiler.compile("ball", {make_clip("c1", TemplateId::Jump, 0.0, d, params)}, centered_base());

    const SampledLayerState apex = sample_layer_state(result.track, d / 2.0);
    CHECK(apex.position.x == doctest::Approx(0.5));
    CHECK(apex.position.y == doctest::Approx(0.25));

    const SampledLayerState landed = sample_layer_state(result.track, d);
    CHECK(landed.position.y == doctest::Approx(0.5));
    CHECK(landed.scale == doctest::Approx(1.0));

    CHECK(result.animates(Channel::Position));
    CHECK(result.animates(Channel::Scale));
    CHECK_FALSE(result.animates(Channel::Rotation));
    CHECK(result.duration == doctest::Approx(kDefaultTimelineDurationMs));
}

TEST_CASE("Pop after roll starts from the rolled-to position") {
    const TrackCompiler compiler;
    const std::vector<TemplateClip> clips{
        make_clip("roll", TemplateId::Roll, 0.0, 1200.0),
        make_clip("pop", TemplateId::Pop, 1200.0, 1000.0),
    };
    const CompileResult result = compiler.compile("ball", clips, centered_base());

    const SampledLayerState at_pop = sample_layer_state(result.track, 1200.0);
    CHECK(at_pop.position.x == doctest::Approx(0.7));
    CHECK(at_pop.rotation == doctest::Approx(4.0 * kPi));
    CHECK(at_pop.scale == doctest::Approx(1.0));

    const SampledLayerState during = sample_layer_state(result.track, 1700.0);
    CHECK(during.position.x == doctest::Approx(0.7));
    CHECK(during.scale == doctest::Approx(1.6));

    // Continuous across the clip boundary.
    const SampledLayerState before = sample_layer_state(result.track, 1199.9);
    CHECK(before.position.x == doctest::Approx(0.7).epsilon(0.001));
    CHECK(before.scale == doctest::Approx(1.0));
}

TEST_CASE("Compiling is idempotent") {
    const TrackCompiler compiler;
    TemplateParameters pop;
    pop.pop_reappear = true;
    const std::vector<TemplateClip> clips{
        make_clip("a", TemplateId::Jump, 200.0, 450.0),
        make_clip("b", TemplateId::Pop, 900.0, 1000.0, pop),
        make_clip("c", TemplateId::SlideOut, 2400.0, 600.0),
    };
    LayerTrack authored;
    authored.layer_id = "ball";
    authored.rotation.push_back(Keyframe<double>{0.0, 0.2});

    const CompileResult first = compiler.compile("ball", clips, centered_base(), authored);
    const CompileResult second = compiler.compile("ball", clips, centered_base(), authored);
    CHECK(first.track == second.track);
    CHECK(first.duration == doctest::Approx(second.duration));
    CHECK(first.animated == second.animated);
}

TEST_CASE("Gaps between clips hold the previous end state") {
    const TrackCompiler compiler;
    const double jump = natural(TemplateId::Jump);
    const std::vector<TemplateClip> clips{
        make_clip("roll", TemplateId::Roll, 0.0, 1200.0),
        make_clip("jump", TemplateId::Jump, 2000.0, jump),
    };
    const CompileResult result = compiler.compile("ball", clips, centered_base());

    for (double t : {1300.0, 1600.0, 1999.0}) {
        const SampledLayerState held = sample_layer_state(result.track, t);
        CHECK(held.position.x == doctest::Approx(0.7));
        CHECK(held.position.y == doctest::Approx(0.5));
        CHECK(held.rotation == doctest::Approx(4.0 * kPi));
    }

    const SampledLayerState apex = sample_layer_state(result.track, 2000.0 + jump / 2.0);
    CHECK(apex.position.x == doctest::Approx(0.7));
    CHECK(apex.position.y == doctest::Approx(0.25));

    auto hold = std::find_if(result.track.position.begin(), result.track.position.end(),
                             [](const Keyframe<Vec2>& frame) { return same_time(frame.time, 1999.0); });
    REQUIRE(hold != result.track.position.end());
    CHECK(hold->clip_id == "jump");
}

TEST_CASE("Time before the first clip shows the base state") {
    const TrackCompiler compiler;
    const CompileResult result = compiler.compile("ball", {make_clip("roll", TemplateId::Roll, 500.0, 1200.0)}, centered_base());

    REQUIRE_FALSE(result.track.position.empty());
    CHECK(result.track.position.front().time == doctest::Approx(0.0));
    CHECK_FALSE(result.track.position.front().tagged());
    for (double t : {0.0, 250.0, 499.0, 500.0}) {
        CHECK(sample_layer_state(result.track, t).position.x == doctest::Approx(0.5));
    }
    CHECK(sample_layer_state(result.track, 1700.0).position.x == doctest::Approx(0.7));
}

TEST_CASE("Reappearing pop restores scale and opacity at the next clip") {
    TemplateParameters pop;
    pop.pop_collapse = true;
    pop.pop_reappear = true;
    const TrackCompiler compiler;
    const std::vector<TemplateClip> clips{
        make_clip("pop", TemplateId::Pop, 0.0, 1000.0, pop),
        make_clip("roll", TemplateId::Roll, 1500.0, 1200.0),
    };
    const CompileResult result = compiler.compile("ball", clips, centered_base());

    const SampledLayerState collapsed = sample_layer_state(result.track, 1499.5);
    CHECK(collapsed.scale == doctest::Approx(0.0));
    CHECK(collapsed.opacity == doctest::Approx(0.0));

    const SampledLayerState restored = sample_layer_state(result.track, 1500.0);
    CHECK(restored.scale == doctest::Approx(1.0));
    CHECK(restored.opacity == doctest::Approx(1.0));
    CHECK(sample_layer_state(result.track, 2200.0).scale == doctest::Approx(1.0));
}

TEST_CASE("Pop following a reappearing pop grows from the restored scale") {
    TemplateParameters pop;
    pop.pop_reappear = true;
    const TrackCompiler compiler;
    const std::vector<TemplateClip> clips{
        make_clip("first", TemplateId::Pop, 0.0, 1000.0, pop),
        make_clip("second", TemplateId::Pop, 1500.0, 1000.0, pop),
    };
    const CompileResult result = compiler.compile("ball", clips, centered_base());

    CHECK(sample_layer_state(result.track, 1499.5).scale == doctest::Approx(0.0));
    CHECK(sample_layer_state(result.track, 1500.0).scale == doctest::Approx(1.0));
    CHECK(sample_layer_state(result.track, 2000.0).scale == doctest::Approx(1.6));
    CHECK(sample_layer_state(result.track, 2000.0).opacity == doctest::Approx(1.0));
}

TEST_CASE("Unknown templates contribute no keys") {
    TemplateClip clip = make_clip("mystery", TemplateId::Unknown, 0.0, 300.0);
    clip.unrecognized_template = "wiggle";
    const TrackCompiler compiler;
    const CompileResult result = compiler.compile("ball", {clip}, centered_base());

    CHECK_FALSE(result.animates(Channel::Position));
    CHECK_FALSE(result.animates(Channel::Opacity));
    REQUIRE(result.track.position.size() == 1);
    CHECK(result.track.position.front().value == Vec2{0.5, 0.5});
    CHECK(sample_layer_state(result.track, 150.0) == sample_layer_state(result.track, 0.0));
    CHECK(result.duration == doctest::Approx(kDefaultTimelineDurationMs));
}

TEST_CASE("Path clips follow the stroke relative to the base position") {
    TemplateParameters params;
    params.path_points = {Vec2{0.0, 0.0}, Vec2{0.1, 0.0}, Vec2{0.1, 0.1}};
    const TrackCompiler compiler;
    const CompileResult result = compiler.compile("ball", {make_clip("path", TemplateId::Path, 0.0, 1000.0, params)}, centered_base());

    REQUIRE(result.track.paths.size() == 1);
    const SampledLayerState mid = sample_layer_state(result.track, 500.0);
    CHECK(mid.active_path_id == "path");
    CHECK(mid.position.x == doctest::Approx(0.6));
    CHECK(mid.position.y == doctest::Approx(0.5));

    const SampledLayerState after = sample_layer_state(result.track, 1500.0);
    CHECK(after.active_path_id.empty());
    CHECK(after.position.x == doctest::Approx(0.6));
    CHECK(after.position.y == doctest::Approx(0.6));
}

TEST_CASE("Entrance clips end on the declared base") {
    SampledLayerState base = centered_base();
    base.opacity = 0.8;
    const TrackCompiler compiler;
    const CompileResult result = compiler.compile("ball", {make_clip("in", TemplateId::FadeIn, 0.0, 600.0)}, base);

    CHECK(sample_layer_state(result.track, 0.0).opacity == doctest::Approx(0.0));
    CHECK(sample_layer_state(result.track, 600.0).opacity == doctest::Approx(0.8));
    CHECK(result.animates(Channel::Opacity));
    CHECK_FALSE(result.animates(Channel::Position));
}

TEST_CASE("Layer base override anchors a transition anywhere in the chain") {
    TemplateParameters params;
    SampledLayerState anchor = centered_base();
    anchor.position = Vec2{0.2, 0.2};
    params.layer_base = anchor;
    const TrackCompiler compiler;
    const std::vector<TemplateClip> clips{
        make_clip("roll", TemplateId::Roll, 0.0, 1200.0),
        make_clip("out", TemplateId::SlideOut, 1200.0, 600.0, params),
    };
    const CompileResult result = compiler.compile("ball", clips, centered_base());
    CHECK(sample_layer_state(result.track, 1200.0).position.x == doctest::Approx(0.2));
    CHECK(sample_layer_state(result.track, 1800.0).position.x == doctest::Approx(0.5));
}

TEST_CASE("Hand-placed keys survive on channels no clip animates") {
    LayerTrack authored;
    authored.layer_id = "ball";
    authored.rotation = {Keyframe<double>{0.0, 0.0}, Keyframe<double>{1000.0, 1.0}};
    const TrackCompiler compiler;
    const CompileResult result =
        compiler.compile("ball", {make_clip("jump", TemplateId::Jump, 0.0, 450.0)}, centered_base(), authored);

    CHECK_FALSE(result.animates(Channel::Rotation));
    CHECK(result.track.rotation == authored.rotation);
    CHECK(sample_layer_state(result.track, 500.0).rotation == doctest::Approx(0.5));
}

TEST_CASE("Clips are sanitized and filtered by layer") {
    TemplateClip other = make_clip("other", TemplateId::Roll, 0.0, 1200.0);
    other.layer_id = "box";
    TemplateClip tiny = make_clip("tiny", TemplateId::Spin, -50.0, 10.0);

    const TemplateClip clean = sanitize_clip(tiny);
    CHECK(clean.start == doctest::Approx(0.0));
    CHECK(clean.duration == doctest::Approx(kMinClipDurationMs));

    const TrackCompiler compiler;
    const CompileResult result = compiler.compile("ball", {other, tiny}, centered_base());
    CHECK_FALSE(result.animates(Channel::Position));
    CHECK(result.animates(Channel::Rotation));
    CHECK(result.track.rotation.back().time == doctest::Approx(kMinClipDurationMs));
}

TEST_CASE("Compiled duration grows past the default timeline") {
    const TrackCompiler compiler;
    const CompileResult result = compiler.compile("ball", {make_clip("spin", TemplateId::Spin, 4500.0, 1000.0)}, centered_base());
    CHECK(result.duration == doctest::Approx(5500.0));
    CHECK(compiled_duration(LayerTrack{}, {}) == doctest::Approx(kDefaultTimelineDurationMs));
}

TEST_CASE("A shake spanning an enormous clip still compiles") {
    const TrackCompiler compiler;
    CompileResult result;
    CHECK_NOTHROW(result = compiler.compile("ball", {make_clip("c1", TemplateId::Shake, 0.0, 1.0e11)}, centered_base()));
    CHECK(result.duration == doctest::Approx(1.0e11));
    CHECK(result.track.position.size() <= static_cast<std::size_t>(tumble::presets::kMaxPeriodicCycles) + 2);
    CHECK(sample_layer_state(result.track, 1.0e11).position.x == doctest::Approx(0.5));
}
