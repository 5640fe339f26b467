#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include "presets/template_parameters.hpp"

namespace tumble::editor::preset_settings {

inline constexpr const char* kDefaultSettingsFile = "tumble_settings.json";

// Points the settings layer at another file and drops the cached contents.
void set_settings_path(const std::filesystem::path& path);
std::filesystem::path settings_path();

// Dotted keys address nested objects: "presets.roll.distance".
bool load_bool(std::string_view key, bool default_value);
void save_bool(std::string_view key, bool value);
double load_number(std::string_view key, double default_value);
void save_number(std::string_view key, double value);
std::string load_string(std::string_view key, const std::string& default_value);
void save_string(std::string_view key, const std::string& value);

// Clamps every parameter into the range the editor exposes.
presets::TemplateParameters sanitized(const presets::TemplateParameters& params);

presets::TemplateParameters load_default_parameters();
void save_default_parameters(const presets::TemplateParameters& params);

void reload();

}
