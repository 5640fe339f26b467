#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "editor/motion_document.hpp"

struct PreviewOptions {
    std::filesystem::path document_path;
    std::filesystem::path settings_path;
    std::optional<std::filesystem::path> save_path;
    std::optional<double> time;
    double step = 100.0;
    bool play = false;
    bool loop = false;
    double rate = 1.0;
    bool demo = false;
};

// Command-line host: loads a document, compiles every layer and prints the
// sampled transforms as JSON on stdout.
class PreviewApp {

        public:
    explicit PreviewApp(PreviewOptions options);
    int run();

        private:
    bool load_document();
    void build_demo_document();
    nlohmann::json sample_frame(double time) const;
    int print_samples() const;
    int play_realtime();

        private:
    PreviewOptions options_;
    tumble::editor::MotionDocument document_;
};

std::optional<PreviewOptions> parse_preview_args(int argc, char* argv[]);
