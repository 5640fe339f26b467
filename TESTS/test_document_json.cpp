#include "doctest/doctest.h"

#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

#include <nlohmann/json.hpp>

#include "editor/document_json.hpp"
#include "editor/json_file_store.hpp"
#include "editor/motion_document.hpp"

namespace fs = std::filesystem;
using namespace tumble::editor;
using tumble::presets::TemplateId;
using tumble::timeline::Channel;
using tumble::timeline::Easing;
using tumble::timeline::Keyframe;
using tumble::timeline::Vec2;

static fs::path test_root() {
#ifdef PROJECT_ROOT
    return fs::path(PROJECT_ROOT) / "TEST_TMP";
#else
    return fs::current_path() / "TEST_TMP";
#endif
}

namespace {

DocumentSnapshot busy_document() {
    MotionDocument document;
    Layer ball;
    ball.id = "ball";
    ball.x = 0.25;
    ball.fill_color = 0xff8800;
    document.add_layer(ball);
    Layer label;
    label.id = "label";
    label.kind = "text";
    label.opacity = 0.6;
    document.add_layer(label);

    ApplyTemplateOptions append;
    append.append = true;
    document.apply_template("ball", TemplateId::Jump, append);
    document.apply_template("ball", std::string("wiggle"), append);

    ApplyTemplateOptions anchored;
    anchored.parameters = document.default_parameters();
    tumble::timeline::SampledLayerState base;
    base.position = Vec2{0.1, 0.9};
    base.opacity = 0.5;
    anchored.parameters->layer_base = base;
    anchored.parameters->pop_reappear = true;
    anchored.start_at = 3000.0;
    document.apply_template("ball", TemplateId::SlideIn, anchored);

    ApplyTemplateOptions path;
    path.target_duration = 900.0;
    document.add_path_clip("label", {Vec2{0.0, 0.0}, Vec2{0.1, 0.3}, Vec2{0.4, 0.2}}, path);
    document.set_keyframe("label", Channel::Rotation, Keyframe<double>{250.0, 0.3, Easing::EaseInOutQuad});

    BackgroundSettings background;
    background.mode = BackgroundMode::Gradient;
    background.to = "#334155";
    document.set_background(background);
    return document.snapshot();
}

}

TEST_CASE("Documents survive a save and load unchanged") {
    const fs::path root = test_root();
    std::error_code ec;
    fs::create_directories(root, ec);
    const fs::path file = root / "document_roundtrip.json";

    const DocumentSnapshot original = busy_document();
    REQUIRE(original.clips.size() == 4);
    REQUIRE(save_document(file, original));
    CHECK_FALSE(fs::exists(file.string() + ".tmp"));

    JsonFileStore::instance().clear_cache();
    const auto loaded = load_document(file);
    REQUIRE(loaded);
    CHECK(loaded->layers == original.layers);
    CHECK(loaded->layer_order == original.layer_order);
    CHECK(loaded->background == original.background);
    CHECK(loaded->parameters == original.parameters);
    CHECK(loaded->clips == original.clips);
    CHECK(loaded->authored == original.authored);
    CHECK(*loaded == original);

    MotionDocument reopened(*loaded);
    CHECK(reopened.find_clip("clip-2")->template_name() == "wiggle");
    fs::remove(file, ec);
}

TEST_CASE("Loose JSON is read leniently") {
    const nlohmann::json root = nlohmann::json::parse(R"({
        "version": 7,
        "layers": [{"id": "a", "x": "0.3", "opacity": 0.5}, {"x": 0.1}],
        "clips": [
            {"id": "c1", "layer_id": "a", "template": "Fade In", "start": "100", "duration": 400},
            {"id": "c2", "layer_id": "a", "template": "teleport"},
            {"layer_id": "a", "template": "roll"}
        ],
        "parameters": {"roll_distance": 0.4, "spin_direction": -3, "path_easing": "easeOutBack"}
    })");
    const DocumentSnapshot document = document_from_json(root);

    REQUIRE(document.layers.size() == 1);
    CHECK(document.layers.front().x == doctest::Approx(0.3));
    CHECK(document.layers.front().kind == "shape");
    REQUIRE(document.clips.size() == 2);
    CHECK(document.clips[0].template_id == TemplateId::FadeIn);
    CHECK(document.clips[0].start == doctest::Approx(100.0));
    CHECK(document.clips[1].template_id == TemplateId::Unknown);
    CHECK(document.clips[1].unrecognized_template == "teleport");
    CHECK(document.clips[1].duration == doctest::Approx(tumble::timeline::kMinClipDurationMs));
    CHECK(document.parameters.roll_distance == doctest::Approx(0.4));
    CHECK(document.parameters.spin_direction == -1);
    CHECK(document.parameters.path_easing == Easing::EaseOutBack);
    CHECK(document_to_json(document)["clips"][1]["template"] == "teleport");
}

TEST_CASE("Field readers fall back on wrong types") {
    const nlohmann::json obj = {{"n", "abc"}, {"b", 1}, {"s", 4}, {"i", 2.9}};
    CHECK(detail::read_number(obj, "n", 1.5) == doctest::Approx(1.5));
    CHECK(detail::read_number(obj, "missing", 2.0) == doctest::Approx(2.0));
    CHECK(detail::read_bool(obj, "b", false));
    CHECK(detail::read_string(obj, "s", "x") == "x");
    CHECK(detail::read_int(obj, "i", 0) == 2);
    CHECK(detail::read_number(nlohmann::json::array(), "n", 3.0) == doctest::Approx(3.0));
}

TEST_CASE("Missing and malformed documents do not load") {
    const fs::path root = test_root();
    std::error_code ec;
    fs::create_directories(root, ec);

    CHECK_FALSE(load_document(root / "does_not_exist.json"));

    const fs::path broken = root / "broken_document.json";
    {
        std::ofstream out(broken);
        REQUIRE(out.is_open());
        out << "{ \"layers\": [";
    }
    JsonFileStore::instance().clear_cache();
    CHECK_FALSE(load_document(broken));
    fs::remove(broken, ec);
}

TEST_CASE("Sampled states serialize the active path only when present") {
    tumble::timeline::SampledLayerState state;
    state.position = Vec2{0.2, 0.4};
    nlohmann::json out = sampled_state_to_json(state);
    CHECK(out["position"]["y"].get<double>() == doctest::Approx(0.4));
    CHECK_FALSE(out.contains("active_path_id"));

    state.active_path_id = "clip-3";
    out = sampled_state_to_json(state);
    CHECK(out["active_path_id"] == "clip-3");
}
