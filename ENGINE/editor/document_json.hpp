#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "document_types.hpp"

namespace tumble::editor {

inline constexpr int kDocumentVersion = 1;

namespace detail {

std::string read_string(const nlohmann::json& obj, const char* key, const std::string& fallback = {});
double read_number(const nlohmann::json& obj, const char* key, double fallback);
int read_int(const nlohmann::json& obj, const char* key, int fallback);
bool read_bool(const nlohmann::json& obj, const char* key, bool fallback);

}

timeline::Vec2 vec2_from_json(const nlohmann::json& value, const timeline::Vec2& fallback = {});
nlohmann::json vec2_to_json(const timeline::Vec2& value);

presets::TemplateParameters parameters_from_json(const nlohmann::json& obj,
                                                 const presets::TemplateParameters& fallback = {});
nlohmann::json parameters_to_json(const presets::TemplateParameters& params);

timeline::TemplateClip clip_from_json(const nlohmann::json& obj);
nlohmann::json clip_to_json(const timeline::TemplateClip& clip);

timeline::LayerTrack track_from_json(const nlohmann::json& obj);
nlohmann::json track_to_json(const timeline::LayerTrack& track);

Layer layer_from_json(const nlohmann::json& obj);
nlohmann::json layer_to_json(const Layer& layer);

BackgroundSettings background_from_json(const nlohmann::json& obj);
nlohmann::json background_to_json(const BackgroundSettings& background);

nlohmann::json sampled_state_to_json(const timeline::SampledLayerState& state);

DocumentSnapshot document_from_json(const nlohmann::json& root);
nlohmann::json document_to_json(const DocumentSnapshot& document);

// Missing or malformed files yield std::nullopt; the reason is logged.
std::optional<DocumentSnapshot> load_document(const std::filesystem::path& path);
bool save_document(const std::filesystem::path& path, const DocumentSnapshot& document);

}
