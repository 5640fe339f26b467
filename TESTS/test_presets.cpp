#include "doctest/doctest.h"

#include <cmath>
#include <string>

#include "presets/motion_presets.hpp"
#include "presets/periodic_presets.hpp"
#include "presets/preset_factory.hpp"
#include "presets/template_id.hpp"
#include "presets/transition_presets.hpp"

using namespace tumble::presets;

namespace {
constexpr double kPi = 3.14159265358979323846;
}

TEST_CASE("Template keys accept display spellings") {
    CHECK(template_from_key("roll") == TemplateId::Roll);
    CHECK(template_from_key("Fade In") == TemplateId::FadeIn);
    CHECK(template_from_key("move-scale-out") == TemplateId::MoveScaleOut);
    CHECK(template_from_key("  SPIN_IN ") == TemplateId::SpinIn);
    CHECK(template_from_key("wiggle") == TemplateId::Unknown);
    CHECK(std::string(template_key(TemplateId::ShrinkOut)) == "shrink_out");
    CHECK(is_in_variant(TemplateId::GrowIn));
    CHECK(is_out_variant(TemplateId::TwistOut));
    CHECK_FALSE(is_in_out(TemplateId::Pop));
}

TEST_CASE("Roll calibration inverts exactly") {
    CHECK(roll_duration_for_distance(0.2, 1.0) == doctest::Approx(1200.0));
    CHECK(roll_distance_for_duration(1200.0, 1.0) == doctest::Approx(0.2));
    for (double speed : {0.1, 0.5, 1.0, 2.5, 4.0}) {
        for (double distance : {0.05, 0.2, 0.35, 0.8, 1.0}) {
            CAPTURE(speed);
            CAPTURE(distance);
            const double duration = roll_duration_for_distance(distance, speed);
            CHECK(roll_distance_for_duration(duration, speed) == doctest::Approx(distance).epsilon(1e-6));
        }
    }

    TemplateParameters params;
    params.roll_distance = 0.3;
    const PresetResult roll = RollPreset{}.generate(params, std::nullopt);
    CHECK(roll.duration == doctest::Approx(1800.0));
    REQUIRE(roll.position.size() == 2);
    CHECK(roll.position.back().value.resolve_or({}).x == doctest::Approx(0.3));
    CHECK(roll.rotation.back().value.resolve_or(0.0) == doctest::Approx(4.0 * kPi));
    REQUIRE(roll.meta.roll_distance);
    CHECK(*roll.meta.roll_distance == doctest::Approx(0.3));
}

TEST_CASE("Short rolls are floored at the minimum duration") {
    TemplateParameters params;
    params.roll_distance = 0.01;
    const PresetResult roll = RollPreset{}.generate(params, std::nullopt);
    CHECK(roll.duration == doctest::Approx(kRollMinDurationMs));
}

TEST_CASE("Jump duration follows ballistic flight") {
    const double expected = std::sqrt(2.0 * kGravity * 0.25) / kGravity * 2.0 * 1000.0;
    CHECK(jump_duration_for(0.25, 1.5) == doctest::Approx(expected));
    CHECK(jump_duration_for(0.25, 1.5) == doctest::Approx(451.76).epsilon(0.001));
    // A faster launch reaches the same height sooner.
    CHECK(jump_duration_for(0.25, 4.0) < jump_duration_for(0.25, 1.5));
    CHECK(jump_duration_for(5.0, 1.5) == doctest::Approx(kJumpMaxDurationMs));

    TemplateParameters params;
    const PresetResult jump = JumpPreset{}.generate(params, std::nullopt);
    REQUIRE(jump.position.size() == 3);
    CHECK(jump.position[1].time == doctest::Approx(jump.duration * 0.5));
    CHECK(jump.position[1].value.resolve_or({}).y == doctest::Approx(-0.25));
    CHECK(jump.position.back().value.resolve_or({}).y == doctest::Approx(0.0));
    CHECK(jump.scale.front().value.resolve_or(0.0) == doctest::Approx(1.0));
    CHECK(jump.scale.back().value.resolve_or(0.0) == doctest::Approx(1.0));
}

TEST_CASE("Jump height from duration stays above the minimum") {
    CHECK(jump_height_for_duration(0.0, 0.2) == doctest::Approx(kJumpMinHeight));
    CHECK(jump_height_for_duration(600.0, 3.0) == doctest::Approx(3.0 * 0.3 - 0.5 * kGravity * 0.09));
}

TEST_CASE("Pop collapses unless told otherwise") {
    TemplateParameters params;
    const PresetResult pop = PopPreset{}.generate(params, std::nullopt);
    CHECK(pop.duration == doctest::Approx(kPopBaseDurationMs));
    REQUIRE(pop.scale.size() == 4);
    CHECK(pop.scale[1].value.resolve_or(0.0) == doctest::Approx(1.6));
    CHECK(pop.scale.back().time == doctest::Approx(620.0));
    CHECK(pop.scale.back().value.resolve_or(1.0) == doctest::Approx(0.0));
    CHECK(pop.opacity.back().value.resolve_or(1.0) == doctest::Approx(0.0));
    CHECK(pop.meta.collapse);

    params.pop_collapse = false;
    params.pop_wobble = true;
    params.pop_speed = 2.0;
    const PresetResult held = PopPreset{}.generate(params, std::nullopt);
    CHECK(held.duration == doctest::Approx(500.0));
    CHECK(held.scale[2].easing == tumble::timeline::Easing::EaseOutBack);
    CHECK(held.scale.back().value.resolve_or(0.0) == doctest::Approx(1.6));
    CHECK(pop_speed_for_duration(pop_duration_for_speed(2.0)) == doctest::Approx(2.0));
}

TEST_CASE("Periodic presets fill the requested duration") {
    TemplateParameters params;

    const PresetResult shake = ShakePreset{}.generate(params, 600.0);
    CHECK(shake.duration == doctest::Approx(600.0));
    CHECK(shake.position.front().value.resolve_or({1.0, 1.0}).x == doctest::Approx(0.0));
    CHECK(shake.position.back().time == doctest::Approx(600.0));
    CHECK(shake.position.back().value.resolve_or({1.0, 1.0}).x == doctest::Approx(0.0));
    CHECK(shake.position.size() == 11);

    const PresetResult pulse = PulsePreset{}.generate(params, 1200.0);
    CHECK(pulse.scale.size() == 5);
    CHECK(pulse.scale[1].value.resolve_or(0.0) == doctest::Approx(1.2));
    CHECK(pulse.scale.back().value.resolve_or(0.0) == doctest::Approx(1.0));

    params.spin_direction = -1;
    const PresetResult spin = SpinPreset{}.generate(params, 2000.0);
    CHECK(spin.rotation.back().value.resolve_or(0.0) == doctest::Approx(-4.0 * kPi));

    const PresetResult fallback = SpinPreset{}.generate(params, std::nullopt);
    CHECK(fallback.duration == doctest::Approx(kSpinDefaultDurationMs));
}

TEST_CASE("Periodic presets bound their key count on very long clips") {
    TemplateParameters params;

    const PresetResult shake = ShakePreset{}.generate(params, 1.0e11);
    CHECK(shake.duration == doctest::Approx(1.0e11));
    CHECK(shake.position.size() == static_cast<std::size_t>(kMaxPeriodicCycles) + 1);
    CHECK(shake.position.back().time == doctest::Approx(1.0e11));

    const PresetResult pulse = PulsePreset{}.generate(params, 1.0e300);
    CHECK(pulse.scale.size() == static_cast<std::size_t>(kMaxPeriodicCycles) * 2 + 1);
    CHECK(pulse.scale.back().value.resolve_or(0.0) == doctest::Approx(1.0));
}

TEST_CASE("Transitions resolve their resting boundary to the base state") {
    TemplateParameters params;
    const PresetResult fade_in = TransitionPreset(TemplateId::FadeIn).generate(params, 400.0);
    REQUIRE(fade_in.opacity.size() == 2);
    CHECK_FALSE(fade_in.opacity.front().value.uses_base());
    CHECK(fade_in.opacity.front().value.resolve_or(1.0) == doctest::Approx(0.0));
    CHECK(fade_in.opacity.back().value.uses_base());
    CHECK(fade_in.opacity.back().time == doctest::Approx(400.0));

    const PresetResult slide_out = TransitionPreset(TemplateId::SlideOut).generate(params, std::nullopt);
    CHECK(slide_out.duration == doctest::Approx(kTransitionDefaultDurationMs));
    CHECK(slide_out.position.front().value.uses_base());
    CHECK(slide_out.position.back().value.resolve_or({}).x == doctest::Approx(0.3));

    // Explicit zero is an offset, not the base.
    const PresetResult shrink_out = TransitionPreset(TemplateId::ShrinkOut).generate(params, 300.0);
    CHECK(shrink_out.scale.back().value.as_offset() != nullptr);
    CHECK(shrink_out.scale.back().value.resolve_or(1.0) == doctest::Approx(0.0));
}

TEST_CASE("Preset factory covers every named template") {
    PresetFactory factory;
    for (TemplateId id : known_templates()) {
        auto strategy = factory.create(id);
        REQUIRE(strategy);
        CHECK(strategy->id() == id);
        CHECK(PresetFactory::lookup(id) != nullptr);
    }
    CHECK(factory.create(TemplateId::Unknown) == nullptr);
    CHECK(PresetFactory::lookup(TemplateId::Unknown) == nullptr);

    const PresetResult unknown = generate_preset(TemplateId::Unknown, TemplateParameters{});
    CHECK(unknown.empty());
    CHECK(unknown.duration == doctest::Approx(0.0));
    CHECK(natural_duration(TemplateId::Roll, TemplateParameters{}) == doctest::Approx(1200.0));
}

TEST_CASE("Rescaling stretches every channel") {
    PresetResult pop = generate_preset(TemplateId::Pop, TemplateParameters{});
    pop.rescale_to(500.0);
    CHECK(pop.duration == doctest::Approx(500.0));
    CHECK(pop.scale.back().time == doctest::Approx(310.0));
    CHECK(pop.opacity.back().time == doctest::Approx(310.0));

    pop.rescale_to(-1.0);
    CHECK(pop.duration == doctest::Approx(500.0));
}
