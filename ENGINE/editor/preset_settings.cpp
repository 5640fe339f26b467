#include "preset_settings.hpp"

#include <algorithm>
#include <cmath>
#include <mutex>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "editor/json_file_store.hpp"
#include "timeline/easing.hpp"
#include "utils/log.hpp"

namespace tumble::editor::preset_settings {

namespace {

struct SettingsState {
    std::filesystem::path path{kDefaultSettingsFile};
    nlohmann::json cache = nlohmann::json::object();
    bool loaded = false;
};

SettingsState& state() {
    static SettingsState settings;
    return settings;
}

std::mutex& settings_mutex() {
    static std::mutex mutex;
    return mutex;
}

void ensure_loaded() {
    auto& settings = state();
    if (settings.loaded) {
        return;
    }
    settings.loaded = true;

    auto loaded = JsonFileStore::instance().load(settings.path);
    if (!loaded.is_object()) {
        loaded = nlohmann::json::object();
    }
    settings.cache = std::move(loaded);
}

std::vector<std::string> split_key(std::string_view key) {
    std::vector<std::string> parts;
    std::string current;
    for (char ch : key) {
        if (ch == '.') {
            if (!current.empty()) {
                parts.push_back(current);
                current.clear();
            }
        } else {
            current.push_back(ch);
        }
    }
    if (!current.empty()) {
        parts.push_back(current);
    }
    return parts;
}

const nlohmann::json* find_node(std::string_view key) {
    const auto parts = split_key(key);
    if (parts.empty()) {
        return nullptr;
    }
    const nlohmann::json* node = &state().cache;
    for (const auto& part : parts) {
        if (!node->is_object()) {
            return nullptr;
        }
        auto it = node->find(part);
        if (it == node->end()) {
            return nullptr;
        }
        node = &(*it);
    }
    return node;
}

void store_value(std::string_view key, nlohmann::json value) {
    const auto parts = split_key(key);
    if (parts.empty()) {
        return;
    }
    nlohmann::json* node = &state().cache;
    for (size_t i = 0; i + 1 < parts.size(); ++i) {
        nlohmann::json& next = (*node)[parts[i]];
        if (!next.is_object()) {
            next = nlohmann::json::object();
        }
        node = &next;
    }
    (*node)[parts.back()] = std::move(value);
    JsonFileStore::instance().save(state().path, state().cache, 4);
}

double clamp_or(double value, double lo, double hi, double fallback) {
    if (!std::isfinite(value)) {
        return fallback;
    }
    return std::clamp(value, lo, hi);
}

}

void set_settings_path(const std::filesystem::path& path) {
    std::lock_guard<std::mutex> lock(settings_mutex());
    state().path = path;
    state().cache = nlohmann::json::object();
    state().loaded = false;
}

std::filesystem::path settings_path() {
    std::lock_guard<std::mutex> lock(settings_mutex());
    return state().path;
}

bool load_bool(std::string_view key, bool default_value) {
    std::lock_guard<std::mutex> lock(settings_mutex());
    ensure_loaded();
    const nlohmann::json* node = find_node(key);
    if (!node || !node->is_boolean()) {
        return default_value;
    }
    return node->get<bool>();
}

void save_bool(std::string_view key, bool value) {
    std::lock_guard<std::mutex> lock(settings_mutex());
    ensure_loaded();
    store_value(key, value);
}

double load_number(std::string_view key, double default_value) {
    std::lock_guard<std::mutex> lock(settings_mutex());
    ensure_loaded();
    const nlohmann::json* node = find_node(key);
    if (!node || !node->is_number()) {
        return default_value;
    }
    const double value = node->get<double>();
    return std::isfinite(value) ? value : default_value;
}

void save_number(std::string_view key, double value) {
    std::lock_guard<std::mutex> lock(settings_mutex());
    ensure_loaded();
    store_value(key, value);
}

std::string load_string(std::string_view key, const std::string& default_value) {
    std::lock_guard<std::mutex> lock(settings_mutex());
    ensure_loaded();
    const nlohmann::json* node = find_node(key);
    if (!node || !node->is_string()) {
        return default_value;
    }
    return node->get<std::string>();
}

void save_string(std::string_view key, const std::string& value) {
    std::lock_guard<std::mutex> lock(settings_mutex());
    ensure_loaded();
    store_value(key, value);
}

presets::TemplateParameters sanitized(const presets::TemplateParameters& params) {
    const presets::TemplateParameters defaults{};
    presets::TemplateParameters result = params;
    result.template_speed = clamp_or(result.template_speed, 0.1, 4.0, defaults.template_speed);
    result.roll_distance  = clamp_or(result.roll_distance, 0.01, 1.0, defaults.roll_distance);
    result.jump_height    = clamp_or(result.jump_height, 0.05, 1.0, defaults.jump_height);
    result.jump_velocity  = clamp_or(result.jump_velocity, 0.2, 6.0, defaults.jump_velocity);
    result.pop_scale      = clamp_or(result.pop_scale, 1.0, 3.0, defaults.pop_scale);
    result.pop_speed      = clamp_or(result.pop_speed, 0.25, 3.0, defaults.pop_speed);
    result.shake_distance = clamp_or(result.shake_distance, 0.0, 0.25, defaults.shake_distance);
    result.pulse_scale    = clamp_or(result.pulse_scale, 0.05, 1.0, defaults.pulse_scale);
    result.pulse_speed    = clamp_or(result.pulse_speed, 0.1, 4.0, defaults.pulse_speed);
    result.spin_speed     = clamp_or(result.spin_speed, 0.1, 4.0, defaults.spin_speed);
    result.spin_direction = result.spin_direction < 0 ? -1 : 1;
    return result;
}

presets::TemplateParameters load_default_parameters() {
    const presets::TemplateParameters defaults{};
    presets::TemplateParameters params = defaults;

    params.template_speed = load_number("presets.template_speed", defaults.template_speed);
    params.roll_distance  = load_number("presets.roll.distance", defaults.roll_distance);
    params.jump_height    = load_number("presets.jump.height", defaults.jump_height);
    params.jump_velocity  = load_number("presets.jump.velocity", defaults.jump_velocity);
    params.pop_scale      = load_number("presets.pop.scale", defaults.pop_scale);
    params.pop_speed      = load_number("presets.pop.speed", defaults.pop_speed);
    params.pop_wobble     = load_bool("presets.pop.wobble", defaults.pop_wobble);
    params.pop_collapse   = load_bool("presets.pop.collapse", defaults.pop_collapse);
    params.pop_reappear   = load_bool("presets.pop.reappear", defaults.pop_reappear);
    params.shake_distance = load_number("presets.shake.distance", defaults.shake_distance);
    params.pulse_scale    = load_number("presets.pulse.scale", defaults.pulse_scale);
    params.pulse_speed    = load_number("presets.pulse.speed", defaults.pulse_speed);
    params.spin_speed     = load_number("presets.spin.speed", defaults.spin_speed);
    params.spin_direction = static_cast<int>(load_number("presets.spin.direction", defaults.spin_direction));
    params.path_easing    = timeline::easing_from_name(
        load_string("presets.path.easing", timeline::easing_name(defaults.path_easing)));

    const presets::TemplateParameters clean = sanitized(params);
    if (!(clean == params)) {
        tumble::log::info("[PresetSettings] out-of-range defaults in " + settings_path().string() + " were clamped");
    }
    return clean;
}

void save_default_parameters(const presets::TemplateParameters& input) {
    const presets::TemplateParameters params = sanitized(input);
    save_number("presets.template_speed", params.template_speed);
    save_number("presets.roll.distance", params.roll_distance);
    save_number("presets.jump.height", params.jump_height);
    save_number("presets.jump.velocity", params.jump_velocity);
    save_number("presets.pop.scale", params.pop_scale);
    save_number("presets.pop.speed", params.pop_speed);
    save_bool("presets.pop.wobble", params.pop_wobble);
    save_bool("presets.pop.collapse", params.pop_collapse);
    save_bool("presets.pop.reappear", params.pop_reappear);
    save_number("presets.shake.distance", params.shake_distance);
    save_number("presets.pulse.scale", params.pulse_scale);
    save_number("presets.pulse.speed", params.pulse_speed);
    save_number("presets.spin.speed", params.spin_speed);
    save_number("presets.spin.direction", params.spin_direction);
    save_string("presets.path.easing", timeline::easing_name(params.path_easing));
}

void reload() {
    std::lock_guard<std::mutex> lock(settings_mutex());
    state().loaded = false;
    state().cache = nlohmann::json::object();
    JsonFileStore::instance().clear_cache();
}

}
