#include "main.hpp"

#include <SDL.h>

#include <cstdlib>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "editor/document_json.hpp"
#include "editor/preset_settings.hpp"
#include "timeline/transport.hpp"
#include "utils/log.hpp"

namespace {

constexpr Uint32 kFrameDelayMs = 16;

void print_usage() {
        std::cerr << "usage: tumble_preview [document.json] [--demo] [--time MS] [--step MS]\n"
                     "                      [--play] [--loop] [--rate R] [--settings PATH] [--save PATH] [-v]\n";
}

bool parse_number(const char* text, double& out) {
        if (!text || !*text) {
                return false;
        }
        char* end = nullptr;
        const double value = std::strtod(text, &end);
        if (*end != '\0') {
                return false;
        }
        out = value;
        return true;
}

}

std::optional<PreviewOptions> parse_preview_args(int argc, char* argv[]) {
        PreviewOptions options;
        options.settings_path = tumble::editor::preset_settings::kDefaultSettingsFile;
        for (int i = 1; i < argc; ++i) {
                const std::string arg = argv[i] ? argv[i] : "";
                const char* next = (i + 1 < argc) ? argv[i + 1] : nullptr;
                double number = 0.0;
                if (arg == "--demo") {
                        options.demo = true;
                } else if (arg == "--play") {
                        options.play = true;
                } else if (arg == "--loop") {
                        options.loop = true;
                } else if (arg == "-v") {
                        tumble::log::set_level(tumble::log::Level::Debug);
                } else if (arg == "--time" && parse_number(next, number)) {
                        options.time = number;
                        ++i;
                } else if (arg == "--step" && parse_number(next, number) && number > 0.0) {
                        options.step = number;
                        ++i;
                } else if (arg == "--rate" && parse_number(next, number)) {
                        options.rate = number;
                        ++i;
                } else if (arg == "--settings" && next) {
                        options.settings_path = next;
                        ++i;
                } else if (arg == "--save" && next) {
                        options.save_path = std::filesystem::path(next);
                        ++i;
                } else if (!arg.empty() && arg[0] != '-' && options.document_path.empty()) {
                        options.document_path = arg;
                } else {
                        tumble::log::error("[Main] unrecognised argument '" + arg + "'");
                        return std::nullopt;
                }
        }
        if (options.document_path.empty() && !options.demo) {
                return std::nullopt;
        }
        return options;
}

PreviewApp::PreviewApp(PreviewOptions options)
: options_(std::move(options)) {}

int PreviewApp::run() {
        tumble::editor::preset_settings::set_settings_path(options_.settings_path);
        const std::string level_name = tumble::editor::preset_settings::load_string("log.level", "");
        if (!level_name.empty() && !std::getenv("TUMBLE_LOG_LEVEL")) {
                if (auto level = tumble::log::parse_level(level_name)) {
                        tumble::log::set_level(*level);
                }
        }

        if (options_.demo) {
                build_demo_document();
        } else if (!load_document()) {
                return 1;
        }
        tumble::log::info("[Main] " + std::to_string(document_.layers().size()) + " layer(s), " +
                          std::to_string(document_.clips().size()) + " clip(s), duration " +
                          std::to_string(document_.duration()) + " ms");

        if (options_.save_path) {
                if (!tumble::editor::save_document(*options_.save_path, document_.snapshot())) {
                        tumble::log::error("[Main] failed to save '" + options_.save_path->string() + "'");
                        return 1;
                }
        }
        return options_.play ? play_realtime() : print_samples();
}

bool PreviewApp::load_document() {
        auto snapshot = tumble::editor::load_document(options_.document_path);
        if (!snapshot) {
                return false;
        }
        document_.apply_snapshot(*snapshot);
        return true;
}

void PreviewApp::build_demo_document() {
        tumble::editor::DocumentSnapshot snapshot;
        snapshot.parameters = tumble::editor::preset_settings::load_default_parameters();
        document_.apply_snapshot(snapshot);

        tumble::editor::Layer ball;
        ball.id = "ball";
        ball.x = 0.3;
        ball.y = 0.6;
        document_.add_layer(ball);

        tumble::editor::ApplyTemplateOptions append;
        append.append = true;
        document_.apply_template("ball", tumble::presets::TemplateId::Jump, append);
        document_.apply_template("ball", tumble::presets::TemplateId::Roll, append);
        document_.apply_template("ball", tumble::presets::TemplateId::Pop, append);
}

nlohmann::json PreviewApp::sample_frame(double time) const {
        nlohmann::json layers = nlohmann::json::object();
        for (const auto& id : document_.layer_order()) {
                if (auto state = document_.sample_layer(id, time)) {
                        layers[id] = tumble::editor::sampled_state_to_json(*state);
                }
        }
        return nlohmann::json{{"time", time}, {"layers", std::move(layers)}};
}

int PreviewApp::print_samples() const {
        nlohmann::json frames = nlohmann::json::array();
        if (options_.time) {
                frames.push_back(sample_frame(*options_.time));
        } else {
                const double duration = document_.duration();
                for (double t = 0.0; t < duration; t += options_.step) {
                        frames.push_back(sample_frame(t));
                }
                frames.push_back(sample_frame(duration));
        }
        const nlohmann::json out{{"duration", document_.duration()}, {"frames", std::move(frames)}};
        std::cout << out.dump(2) << std::endl;
        return 0;
}

int PreviewApp::play_realtime() {
        if (SDL_Init(SDL_INIT_TIMER) < 0) {
                tumble::log::error(std::string("SDL_Init failed: ") + SDL_GetError());
                return 1;
        }
        tumble::timeline::Transport transport(document_.duration());
        transport.set_loop(options_.loop);
        transport.set_playback_rate(options_.rate);
        transport.play();
        transport.update();

        std::cout << sample_frame(transport.current_time()).dump() << std::endl;
        while (transport.is_playing()) {
                SDL_Delay(kFrameDelayMs);
                if (transport.update()) {
                        std::cout << sample_frame(transport.current_time()).dump() << std::endl;
                }
        }
        SDL_Quit();
        return 0;
}

int main(int argc, char* argv[]) {
        auto options = parse_preview_args(argc, argv);
        if (!options) {
                print_usage();
                return 2;
        }
        tumble::log::info("[Main] Starting tumble preview...");
        PreviewApp app(std::move(*options));
        return app.run();
}
