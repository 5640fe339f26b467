#include "document_json.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "editor/json_file_store.hpp"
#include "timeline/easing.hpp"
#include "timeline/keyframes.hpp"
#include "utils/log.hpp"

namespace tumble::editor {

using nlohmann::json;

namespace detail {

namespace {

bool parse_double(const std::string& text, double& out) {
    if (text.empty()) {
        return false;
    }
    char* end = nullptr;
    const double parsed = std::strtod(text.c_str(), &end);
    if (end != text.c_str() + text.size() || !std::isfinite(parsed)) {
        return false;
    }
    out = parsed;
    return true;
}

}

std::string read_string(const json& obj, const char* key, const std::string& fallback) {
    if (!obj.is_object()) return fallback;
    const auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return fallback;
    return it->get<std::string>();
}

double read_number(const json& obj, const char* key, double fallback) {
    if (!obj.is_object()) return fallback;
    const auto it = obj.find(key);
    if (it == obj.end()) return fallback;
    if (it->is_number()) {
        const double value = it->get<double>();
        return std::isfinite(value) ? value : fallback;
    }
    if (it->is_string()) {
        double parsed = fallback;
        if (parse_double(it->get<std::string>(), parsed)) {
            return parsed;
        }
    }
    return fallback;
}

int read_int(const json& obj, const char* key, int fallback) {
    if (!obj.is_object()) return fallback;
    const auto it = obj.find(key);
    if (it == obj.end()) return fallback;
    if (it->is_number_integer()) return it->get<int>();
    return static_cast<int>(read_number(obj, key, static_cast<double>(fallback)));
}

bool read_bool(const json& obj, const char* key, bool fallback) {
    if (!obj.is_object()) return fallback;
    const auto it = obj.find(key);
    if (it == obj.end()) return fallback;
    if (it->is_boolean()) return it->get<bool>();
    if (it->is_number()) return it->get<double>() != 0.0;
    return fallback;
}

}

namespace {

timeline::Easing read_easing(const json& obj, const char* key, timeline::Easing fallback) {
    const std::string name = detail::read_string(obj, key);
    if (name.empty()) {
        return fallback;
    }
    return timeline::easing_from_name(name);
}

template <typename T, typename ReadValue>
std::vector<timeline::Keyframe<T>> keyframes_from_json(const json& obj, const char* key, ReadValue read_value) {
    std::vector<timeline::Keyframe<T>> frames;
    if (!obj.is_object()) return frames;
    const auto it = obj.find(key);
    if (it == obj.end() || !it->is_array()) return frames;
    for (const auto& entry : *it) {
        if (!entry.is_object()) continue;
        timeline::Keyframe<T> frame;
        frame.time = std::max(0.0, detail::read_number(entry, "time", 0.0));
        frame.value = read_value(entry);
        frame.easing = read_easing(entry, "easing", timeline::Easing::Linear);
        frame.clip_id = detail::read_string(entry, "clip_id");
        frames.push_back(std::move(frame));
    }
    timeline::sort_keyframes(frames);
    return frames;
}

template <typename T, typename WriteValue>
json keyframes_to_json(const std::vector<timeline::Keyframe<T>>& frames, WriteValue write_value) {
    json out = json::array();
    for (const auto& frame : frames) {
        json entry = json::object();
        entry["time"] = frame.time;
        entry["value"] = write_value(frame.value);
        entry["easing"] = timeline::easing_name(frame.easing);
        if (frame.tagged()) {
            entry["clip_id"] = frame.clip_id;
        }
        out.push_back(std::move(entry));
    }
    return out;
}

json number_channel_to_json(const timeline::NumberChannel& frames) {
    return keyframes_to_json(frames, [](double value) { return json(value); });
}

timeline::NumberChannel number_channel_from_json(const json& obj, const char* key) {
    return keyframes_from_json<double>(obj, key, [](const json& entry) { return detail::read_number(entry, "value", 0.0); });
}

std::vector<timeline::Vec2> points_from_json(const json& value) {
    std::vector<timeline::Vec2> points;
    if (!value.is_array()) return points;
    points.reserve(value.size());
    for (const auto& entry : value) {
        if (entry.is_object()) {
            points.push_back(vec2_from_json(entry));
        }
    }
    return points;
}

json points_to_json(const std::vector<timeline::Vec2>& points) {
    json out = json::array();
    for (const auto& point : points) {
        out.push_back(vec2_to_json(point));
    }
    return out;
}

}

timeline::Vec2 vec2_from_json(const json& value, const timeline::Vec2& fallback) {
    if (!value.is_object()) {
        return fallback;
    }
    return timeline::Vec2{detail::read_number(value, "x", fallback.x), detail::read_number(value, "y", fallback.y)};
}

json vec2_to_json(const timeline::Vec2& value) {
    return json{{"x", value.x}, {"y", value.y}};
}

presets::TemplateParameters parameters_from_json(const json& obj, const presets::TemplateParameters& fallback) {
    presets::TemplateParameters params = fallback;
    if (!obj.is_object()) {
        return params;
    }
    params.template_speed = detail::read_number(obj, "template_speed", fallback.template_speed);
    params.roll_distance  = detail::read_number(obj, "roll_distance", fallback.roll_distance);
    params.jump_height    = detail::read_number(obj, "jump_height", fallback.jump_height);
    params.jump_velocity  = detail::read_number(obj, "jump_velocity", fallback.jump_velocity);
    params.pop_scale      = detail::read_number(obj, "pop_scale", fallback.pop_scale);
    params.pop_wobble     = detail::read_bool(obj, "pop_wobble", fallback.pop_wobble);
    params.pop_speed      = detail::read_number(obj, "pop_speed", fallback.pop_speed);
    params.pop_collapse   = detail::read_bool(obj, "pop_collapse", fallback.pop_collapse);
    params.pop_reappear   = detail::read_bool(obj, "pop_reappear", fallback.pop_reappear);
    params.shake_distance = detail::read_number(obj, "shake_distance", fallback.shake_distance);
    params.pulse_scale    = detail::read_number(obj, "pulse_scale", fallback.pulse_scale);
    params.pulse_speed    = detail::read_number(obj, "pulse_speed", fallback.pulse_speed);
    params.spin_speed     = detail::read_number(obj, "spin_speed", fallback.spin_speed);
    params.spin_direction = detail::read_int(obj, "spin_direction", fallback.spin_direction) < 0 ? -1 : 1;
    params.path_easing    = read_easing(obj, "path_easing", fallback.path_easing);

    const auto points_it = obj.find("path_points");
    if (points_it != obj.end()) {
        params.path_points = points_from_json(*points_it);
    }

    const auto base_it = obj.find("layer_base");
    if (base_it != obj.end() && base_it->is_object()) {
        timeline::SampledLayerState base;
        const auto position_it = base_it->find("position");
        if (position_it != base_it->end()) {
            base.position = vec2_from_json(*position_it, base.position);
        }
        base.scale = detail::read_number(*base_it, "scale", base.scale);
        base.rotation = detail::read_number(*base_it, "rotation", base.rotation);
        base.opacity = detail::read_number(*base_it, "opacity", base.opacity);
        params.layer_base = base;
    }
    return params;
}

json parameters_to_json(const presets::TemplateParameters& params) {
    json out = json::object();
    out["template_speed"] = params.template_speed;
    out["roll_distance"] = params.roll_distance;
    out["jump_height"] = params.jump_height;
    out["jump_velocity"] = params.jump_velocity;
    out["pop_scale"] = params.pop_scale;
    out["pop_wobble"] = params.pop_wobble;
    out["pop_speed"] = params.pop_speed;
    out["pop_collapse"] = params.pop_collapse;
    out["pop_reappear"] = params.pop_reappear;
    out["shake_distance"] = params.shake_distance;
    out["pulse_scale"] = params.pulse_scale;
    out["pulse_speed"] = params.pulse_speed;
    out["spin_speed"] = params.spin_speed;
    out["spin_direction"] = params.spin_direction;
    out["path_easing"] = timeline::easing_name(params.path_easing);
    if (!params.path_points.empty()) {
        out["path_points"] = points_to_json(params.path_points);
    }
    if (params.layer_base) {
        out["layer_base"] = json{
            {"position", vec2_to_json(params.layer_base->position)},
            {"scale", params.layer_base->scale},
            {"rotation", params.layer_base->rotation},
            {"opacity", params.layer_base->opacity},
        };
    }
    return out;
}

timeline::TemplateClip clip_from_json(const json& obj) {
    timeline::TemplateClip clip;
    if (!obj.is_object()) {
        return clip;
    }
    clip.id = detail::read_string(obj, "id");
    clip.layer_id = detail::read_string(obj, "layer_id");
    const std::string name = detail::read_string(obj, "template");
    clip.template_id = presets::template_from_key(name);
    if (clip.template_id == presets::TemplateId::Unknown) {
        clip.unrecognized_template = name;
        tumble::log::debug("[DocumentJson] clip " + clip.id + " uses unsupported template '" + name + "'");
    }
    clip.start = detail::read_number(obj, "start", 0.0);
    clip.duration = detail::read_number(obj, "duration", timeline::kMinClipDurationMs);
    const auto params_it = obj.find("parameters");
    if (params_it != obj.end()) {
        clip.parameters = parameters_from_json(*params_it);
    }
    return clip;
}

json clip_to_json(const timeline::TemplateClip& clip) {
    json out = json::object();
    out["id"] = clip.id;
    out["layer_id"] = clip.layer_id;
    out["template"] = clip.template_name();
    out["start"] = clip.start;
    out["duration"] = clip.duration;
    out["parameters"] = parameters_to_json(clip.parameters);
    return out;
}

timeline::LayerTrack track_from_json(const json& obj) {
    timeline::LayerTrack track;
    if (!obj.is_object()) {
        return track;
    }
    track.layer_id = detail::read_string(obj, "layer_id");
    track.position = keyframes_from_json<timeline::Vec2>(obj, "position", [](const json& entry) {
        const auto it = entry.find("value");
        return it == entry.end() ? timeline::Vec2{} : vec2_from_json(*it);
    });
    track.scale = number_channel_from_json(obj, "scale");
    track.rotation = number_channel_from_json(obj, "rotation");
    track.opacity = number_channel_from_json(obj, "opacity");

    const auto paths_it = obj.find("paths");
    if (paths_it != obj.end() && paths_it->is_array()) {
        for (const auto& entry : *paths_it) {
            if (!entry.is_object()) continue;
            timeline::PathClip path;
            path.id = detail::read_string(entry, "id");
            path.start_time = detail::read_number(entry, "start_time", 0.0);
            path.duration = std::max(0.0, detail::read_number(entry, "duration", 0.0));
            path.easing = read_easing(entry, "easing", timeline::Easing::Linear);
            const auto points_it = entry.find("points");
            if (points_it != entry.end()) {
                path.points = points_from_json(*points_it);
            }
            track.paths.push_back(std::move(path));
        }
    }
    return track;
}

json track_to_json(const timeline::LayerTrack& track) {
    json out = json::object();
    out["layer_id"] = track.layer_id;
    out["position"] = keyframes_to_json(track.position, [](const timeline::Vec2& value) { return vec2_to_json(value); });
    out["scale"] = number_channel_to_json(track.scale);
    out["rotation"] = number_channel_to_json(track.rotation);
    out["opacity"] = number_channel_to_json(track.opacity);
    json paths = json::array();
    for (const auto& path : track.paths) {
        paths.push_back(json{
            {"id", path.id},
            {"start_time", path.start_time},
            {"duration", path.duration},
            {"points", points_to_json(path.points)},
            {"easing", timeline::easing_name(path.easing)},
        });
    }
    out["paths"] = std::move(paths);
    return out;
}

Layer layer_from_json(const json& obj) {
    Layer layer;
    if (!obj.is_object()) {
        return layer;
    }
    layer.id = detail::read_string(obj, "id");
    layer.kind = detail::read_string(obj, "kind", layer.kind);
    layer.x = detail::read_number(obj, "x", layer.x);
    layer.y = detail::read_number(obj, "y", layer.y);
    layer.width = detail::read_number(obj, "width", layer.width);
    layer.height = detail::read_number(obj, "height", layer.height);
    layer.scale = detail::read_number(obj, "scale", layer.scale);
    layer.rotation = detail::read_number(obj, "rotation", layer.rotation);
    layer.opacity = detail::read_number(obj, "opacity", layer.opacity);
    const auto color_it = obj.find("fill_color");
    if (color_it != obj.end() && color_it->is_number_unsigned()) {
        layer.fill_color = color_it->get<std::uint32_t>();
    } else if (color_it != obj.end() && color_it->is_number()) {
        layer.fill_color = static_cast<std::uint32_t>(std::max(0.0, color_it->get<double>()));
    }
    return layer;
}

json layer_to_json(const Layer& layer) {
    return json{
        {"id", layer.id},
        {"kind", layer.kind},
        {"x", layer.x},
        {"y", layer.y},
        {"width", layer.width},
        {"height", layer.height},
        {"scale", layer.scale},
        {"rotation", layer.rotation},
        {"opacity", layer.opacity},
        {"fill_color", layer.fill_color},
    };
}

BackgroundSettings background_from_json(const json& obj) {
    BackgroundSettings background;
    if (!obj.is_object()) {
        return background;
    }
    background.mode = detail::read_string(obj, "mode") == "gradient" ? BackgroundMode::Gradient : BackgroundMode::Solid;
    background.solid = detail::read_string(obj, "solid", background.solid);
    background.from = detail::read_string(obj, "from", background.from);
    background.to = detail::read_string(obj, "to", background.to);
    background.opacity = detail::read_number(obj, "opacity", background.opacity);
    return background;
}

json background_to_json(const BackgroundSettings& background) {
    return json{
        {"mode", background.mode == BackgroundMode::Gradient ? "gradient" : "solid"},
        {"solid", background.solid},
        {"from", background.from},
        {"to", background.to},
        {"opacity", background.opacity},
    };
}

json sampled_state_to_json(const timeline::SampledLayerState& state) {
    json out = json{
        {"position", vec2_to_json(state.position)},
        {"scale", state.scale},
        {"rotation", state.rotation},
        {"opacity", state.opacity},
    };
    if (!state.active_path_id.empty()) {
        out["active_path_id"] = state.active_path_id;
    }
    return out;
}

DocumentSnapshot document_from_json(const json& root) {
    DocumentSnapshot document;
    if (!root.is_object()) {
        tumble::log::error("[DocumentJson] document root is not an object");
        return document;
    }
    const int version = detail::read_int(root, "version", kDocumentVersion);
    if (version != kDocumentVersion) {
        tumble::log::warn("[DocumentJson] reading document version " + std::to_string(version) +
                          " as version " + std::to_string(kDocumentVersion));
    }

    const auto layers_it = root.find("layers");
    if (layers_it != root.end() && layers_it->is_array()) {
        for (const auto& entry : *layers_it) {
            Layer layer = layer_from_json(entry);
            if (layer.id.empty()) {
                tumble::log::debug("[DocumentJson] skipping layer without id");
                continue;
            }
            document.layers.push_back(std::move(layer));
        }
    }

    const auto order_it = root.find("layer_order");
    if (order_it != root.end() && order_it->is_array()) {
        for (const auto& entry : *order_it) {
            if (entry.is_string()) {
                document.layer_order.push_back(entry.get<std::string>());
            }
        }
    }

    const auto background_it = root.find("background");
    if (background_it != root.end()) {
        document.background = background_from_json(*background_it);
    }

    const auto params_it = root.find("parameters");
    if (params_it != root.end()) {
        document.parameters = parameters_from_json(*params_it);
    }

    const auto clips_it = root.find("clips");
    if (clips_it != root.end() && clips_it->is_array()) {
        for (const auto& entry : *clips_it) {
            timeline::TemplateClip clip = clip_from_json(entry);
            if (clip.id.empty() || clip.layer_id.empty()) {
                tumble::log::debug("[DocumentJson] skipping clip without id or layer");
                continue;
            }
            document.clips.push_back(std::move(clip));
        }
    }

    const auto authored_it = root.find("authored");
    if (authored_it != root.end() && authored_it->is_array()) {
        for (const auto& entry : *authored_it) {
            timeline::LayerTrack track = track_from_json(entry);
            if (!track.layer_id.empty()) {
                document.authored.push_back(std::move(track));
            }
        }
    }
    return document;
}

json document_to_json(const DocumentSnapshot& document) {
    json root = json::object();
    root["version"] = kDocumentVersion;

    json layers = json::array();
    for (const auto& layer : document.layers) {
        layers.push_back(layer_to_json(layer));
    }
    root["layers"] = std::move(layers);
    root["layer_order"] = document.layer_order;
    root["background"] = background_to_json(document.background);
    root["parameters"] = parameters_to_json(document.parameters);

    json clips = json::array();
    for (const auto& clip : document.clips) {
        clips.push_back(clip_to_json(clip));
    }
    root["clips"] = std::move(clips);

    json authored = json::array();
    for (const auto& track : document.authored) {
        authored.push_back(track_to_json(track));
    }
    root["authored"] = std::move(authored);
    return root;
}

std::optional<DocumentSnapshot> load_document(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        tumble::log::error("[DocumentJson] document '" + path.string() + "' does not exist");
        return std::nullopt;
    }
    const json root = JsonFileStore::instance().load(path);
    if (root.empty()) {
        tumble::log::error("[DocumentJson] document '" + path.string() + "' is empty or unreadable");
        return std::nullopt;
    }
    return document_from_json(root);
}

bool save_document(const std::filesystem::path& path, const DocumentSnapshot& document) {
    return JsonFileStore::instance().save(path, document_to_json(document), 2);
}

}
