#include "motion_document.hpp"

#include <algorithm>
#include <cmath>
#include <unordered_set>

#include "editor/preset_settings.hpp"
#include "presets/motion_presets.hpp"
#include "presets/preset_factory.hpp"
#include "timeline/keyframes.hpp"
#include "timeline/path_smoothing.hpp"
#include "utils/log.hpp"

namespace tumble::editor {

using presets::TemplateId;
using timeline::Channel;
using timeline::TemplateClip;

namespace {

constexpr double kSameStartToleranceMs = 1.0;

void normalize_layer_order(DocumentSnapshot& state) {
    std::unordered_set<std::string> known;
    for (const auto& layer : state.layers) {
        known.insert(layer.id);
    }
    std::vector<std::string> order;
    std::unordered_set<std::string> seen;
    for (const auto& id : state.layer_order) {
        if (known.count(id) && seen.insert(id).second) {
            order.push_back(id);
        }
    }
    for (const auto& layer : state.layers) {
        if (seen.insert(layer.id).second) {
            order.push_back(layer.id);
        }
    }
    state.layer_order = std::move(order);
}

double finite_start(double start) {
    return std::isfinite(start) ? std::max(0.0, start) : 0.0;
}

}

MotionDocument::MotionDocument(std::size_t history_capacity)
    : history_(history_capacity)
{
    history_.push(state_);
}

MotionDocument::MotionDocument(DocumentSnapshot initial, std::size_t history_capacity)
    : state_(std::move(initial)),
      history_(history_capacity)
{
    normalize_layer_order(state_);
    recompile_all();
    history_.push(state_);
}

bool MotionDocument::add_layer(Layer layer) {
    if (layer.id.empty() || find_layer(layer.id)) {
        tumble::log::warn("[MotionDocument] add_layer: missing or duplicate id '" + layer.id + "'");
        return false;
    }
    const std::string id = layer.id;
    state_.layers.push_back(std::move(layer));
    state_.layer_order.push_back(id);
    recompile_layer(id);
    commit();
    return true;
}

bool MotionDocument::remove_layer(const std::string& layer_id) {
    auto it = std::find_if(state_.layers.begin(), state_.layers.end(),
                           [&](const Layer& layer) { return layer.id == layer_id; });
    if (it == state_.layers.end()) {
        tumble::log::warn("[MotionDocument] remove_layer: unknown layer '" + layer_id + "'");
        return false;
    }
    state_.layers.erase(it);
    state_.layer_order.erase(std::remove(state_.layer_order.begin(), state_.layer_order.end(), layer_id),
                             state_.layer_order.end());
    state_.clips.erase(std::remove_if(state_.clips.begin(), state_.clips.end(),
                                      [&](const TemplateClip& clip) { return clip.layer_id == layer_id; }),
                       state_.clips.end());
    state_.authored.erase(std::remove_if(state_.authored.begin(), state_.authored.end(),
                                         [&](const timeline::LayerTrack& track) { return track.layer_id == layer_id; }),
                          state_.authored.end());
    compiled_.erase(layer_id);
    commit();
    return true;
}

bool MotionDocument::update_layer(const Layer& layer) {
    auto it = std::find_if(state_.layers.begin(), state_.layers.end(),
                           [&](const Layer& existing) { return existing.id == layer.id; });
    if (it == state_.layers.end()) {
        tumble::log::warn("[MotionDocument] update_layer: unknown layer '" + layer.id + "'");
        return false;
    }
    *it = layer;
    recompile_layer(layer.id);
    commit();
    return true;
}

bool MotionDocument::move_layer(const std::string& layer_id, std::size_t index) {
    auto it = std::find(state_.layer_order.begin(), state_.layer_order.end(), layer_id);
    if (it == state_.layer_order.end()) {
        tumble::log::warn("[MotionDocument] move_layer: unknown layer '" + layer_id + "'");
        return false;
    }
    state_.layer_order.erase(it);
    const std::size_t target = std::min(index, state_.layer_order.size());
    state_.layer_order.insert(state_.layer_order.begin() + static_cast<std::ptrdiff_t>(target), layer_id);
    commit();
    return true;
}

bool MotionDocument::set_layer_order(const std::vector<std::string>& order) {
    for (const auto& id : order) {
        if (!find_layer(id)) {
            tumble::log::warn("[MotionDocument] set_layer_order: unknown layer '" + id + "'");
            return false;
        }
    }
    state_.layer_order = order;
    normalize_layer_order(state_);
    commit();
    return true;
}

const Layer* MotionDocument::find_layer(const std::string& layer_id) const {
    for (const auto& layer : state_.layers) {
        if (layer.id == layer_id) {
            return &layer;
        }
    }
    return nullptr;
}

std::optional<std::string> MotionDocument::apply_template(const std::string& layer_id,
                                                          TemplateId template_id,
                                                          const ApplyTemplateOptions& options) {
    if (!find_layer(layer_id)) {
        tumble::log::warn("[MotionDocument] apply_template: unknown layer '" + layer_id + "'");
        return std::nullopt;
    }

    TemplateClip clip;
    clip.layer_id = layer_id;
    clip.template_id = template_id;
    clip.parameters = options.parameters.value_or(state_.parameters);

    if (options.target_duration) {
        clip.duration = *options.target_duration;
    } else {
        const double speed = std::max(0.1, clip.parameters.template_speed);
        clip.duration = presets::natural_duration(template_id, clip.parameters) / speed;
    }
    if (options.start_at) {
        clip.start = *options.start_at;
    } else {
        clip.start = options.append ? layer_clips_end(layer_id) : 0.0;
    }
    return insert_clip(std::move(clip));
}

std::optional<std::string> MotionDocument::apply_template(const std::string& layer_id,
                                                          const std::string& template_name,
                                                          const ApplyTemplateOptions& options) {
    const TemplateId id = presets::template_from_key(template_name);
    if (id != TemplateId::Unknown) {
        return apply_template(layer_id, id, options);
    }
    if (!find_layer(layer_id)) {
        tumble::log::warn("[MotionDocument] apply_template: unknown layer '" + layer_id + "'");
        return std::nullopt;
    }
    tumble::log::info("[MotionDocument] template '" + template_name + "' is not generated; clip kept without motion");

    TemplateClip clip;
    clip.layer_id = layer_id;
    clip.template_id = TemplateId::Unknown;
    clip.unrecognized_template = template_name;
    clip.parameters = options.parameters.value_or(state_.parameters);
    clip.duration = options.target_duration.value_or(timeline::kMinClipDurationMs);
    if (options.start_at) {
        clip.start = *options.start_at;
    } else {
        clip.start = options.append ? layer_clips_end(layer_id) : 0.0;
    }
    return insert_clip(std::move(clip));
}

std::optional<std::string> MotionDocument::add_path_clip(const std::string& layer_id,
                                                         std::vector<timeline::Vec2> points,
                                                         const ApplyTemplateOptions& options,
                                                         bool smooth) {
    ApplyTemplateOptions path_options = options;
    presets::TemplateParameters params = options.parameters.value_or(state_.parameters);
    params.path_points = smooth ? timeline::chaikin_smooth(points) : timeline::finite_points(points);
    if (params.path_points.size() < 2) {
        tumble::log::debug("[MotionDocument] path clip on '" + layer_id + "' has fewer than two points");
    }
    path_options.parameters = std::move(params);
    return apply_template(layer_id, TemplateId::Path, path_options);
}

std::optional<std::string> MotionDocument::insert_clip(TemplateClip clip) {
    clip = timeline::sanitize_clip(std::move(clip));

    auto existing = std::find_if(state_.clips.begin(), state_.clips.end(), [&](const TemplateClip& other) {
        return other.layer_id == clip.layer_id && other.template_id == clip.template_id &&
               other.unrecognized_template == clip.unrecognized_template &&
               std::fabs(other.start - clip.start) < kSameStartToleranceMs;
    });
    if (existing != state_.clips.end()) {
        clip.id = existing->id;
        *existing = clip;
    } else {
        clip.id = next_clip_id();
        state_.clips.push_back(clip);
    }
    recompile_layer(clip.layer_id);
    commit();
    return clip.id;
}

bool MotionDocument::update_clip(const std::string& clip_id, const presets::TemplateParameters& parameters) {
    TemplateClip* clip = find_clip_mut(clip_id);
    if (!clip) {
        tumble::log::warn("[MotionDocument] update_clip: unknown clip '" + clip_id + "'");
        return false;
    }
    clip->parameters = parameters;
    recompile_layer(clip->layer_id);
    commit();
    return true;
}

bool MotionDocument::move_clip(const std::string& clip_id, double start) {
    TemplateClip* clip = find_clip_mut(clip_id);
    if (!clip) {
        tumble::log::warn("[MotionDocument] move_clip: unknown clip '" + clip_id + "'");
        return false;
    }
    clip->start = finite_start(start);
    recompile_layer(clip->layer_id);
    commit();
    return true;
}

bool MotionDocument::resize_clip(const std::string& clip_id, double duration) {
    TemplateClip* clip = find_clip_mut(clip_id);
    if (!clip) {
        tumble::log::warn("[MotionDocument] resize_clip: unknown clip '" + clip_id + "'");
        return false;
    }
    if (!std::isfinite(duration) || duration < timeline::kMinClipDurationMs) {
        duration = timeline::kMinClipDurationMs;
    }
    clip->duration = duration;

    // Physical templates keep their parameters consistent with the new length.
    // The clip length is the natural duration divided by template_speed, so
    // the inverses see the length at speed 1.
    presets::TemplateParameters& params = clip->parameters;
    const double natural = duration * std::max(0.1, params.template_speed);
    switch (clip->template_id) {
    case TemplateId::Roll:
        params.roll_distance = presets::roll_distance_for_duration(natural);
        break;
    case TemplateId::Jump:
        params.jump_height = presets::jump_height_for_duration(natural, params.jump_velocity);
        break;
    case TemplateId::Pop:
        params.pop_speed = presets::pop_speed_for_duration(natural);
        break;
    default:
        break;
    }
    recompile_layer(clip->layer_id);
    commit();
    return true;
}

bool MotionDocument::remove_clip(const std::string& clip_id) {
    auto it = std::find_if(state_.clips.begin(), state_.clips.end(),
                           [&](const TemplateClip& clip) { return clip.id == clip_id; });
    if (it == state_.clips.end()) {
        tumble::log::warn("[MotionDocument] remove_clip: unknown clip '" + clip_id + "'");
        return false;
    }
    const std::string layer_id = it->layer_id;
    state_.clips.erase(it);

    // The compiler starts from untagged keys only, so none of the clip's keys survive.
    recompile_layer(layer_id);
    commit();
    return true;
}

bool MotionDocument::reorder_clips(const std::string& layer_id, const std::vector<std::string>& ordered_ids) {
    std::vector<TemplateClip*> ordered;
    ordered.reserve(ordered_ids.size());
    for (const auto& id : ordered_ids) {
        TemplateClip* clip = find_clip_mut(id);
        if (!clip || clip->layer_id != layer_id) {
            tumble::log::warn("[MotionDocument] reorder_clips: clip '" + id + "' is not on layer '" + layer_id + "'");
            return false;
        }
        if (std::find(ordered.begin(), ordered.end(), clip) != ordered.end()) {
            tumble::log::warn("[MotionDocument] reorder_clips: clip '" + id + "' listed twice");
            return false;
        }
        ordered.push_back(clip);
    }
    if (ordered.empty()) {
        return false;
    }

    double cursor = ordered.front()->start;
    for (const TemplateClip* clip : ordered) {
        cursor = std::min(cursor, clip->start);
    }
    for (TemplateClip* clip : ordered) {
        clip->start = cursor;
        cursor += clip->duration;
    }
    recompile_layer(layer_id);
    commit();
    return true;
}

const TemplateClip* MotionDocument::find_clip(const std::string& clip_id) const {
    for (const auto& clip : state_.clips) {
        if (clip.id == clip_id) {
            return &clip;
        }
    }
    return nullptr;
}

bool MotionDocument::set_keyframe(const std::string& layer_id, const timeline::Keyframe<timeline::Vec2>& keyframe) {
    if (!find_layer(layer_id)) {
        tumble::log::warn("[MotionDocument] set_keyframe: unknown layer '" + layer_id + "'");
        return false;
    }
    if (animates(layer_id, Channel::Position)) {
        tumble::log::warn("[MotionDocument] set_keyframe: position of '" + layer_id + "' is driven by clips");
        return false;
    }
    timeline::Keyframe<timeline::Vec2> frame = keyframe;
    frame.time = finite_start(frame.time);
    frame.clip_id.clear();
    timeline::upsert_keyframe(authored_for(layer_id).position, std::move(frame));
    recompile_layer(layer_id);
    commit();
    return true;
}

bool MotionDocument::set_keyframe(const std::string& layer_id, Channel channel, const timeline::Keyframe<double>& keyframe) {
    if (!find_layer(layer_id)) {
        tumble::log::warn("[MotionDocument] set_keyframe: unknown layer '" + layer_id + "'");
        return false;
    }
    if (channel == Channel::Position) {
        tumble::log::warn("[MotionDocument] set_keyframe: position takes a Vec2 keyframe");
        return false;
    }
    if (animates(layer_id, channel)) {
        tumble::log::warn("[MotionDocument] set_keyframe: channel of '" + layer_id + "' is driven by clips");
        return false;
    }
    timeline::Keyframe<double> frame = keyframe;
    frame.time = finite_start(frame.time);
    frame.clip_id.clear();
    if (channel == Channel::Opacity) {
        frame.value = std::min(1.0, std::max(0.0, frame.value));
    }
    timeline::LayerTrack& authored = authored_for(layer_id);
    timeline::NumberChannel& target = channel == Channel::Scale      ? authored.scale
                                      : channel == Channel::Rotation ? authored.rotation
                                                                     : authored.opacity;
    timeline::upsert_keyframe(target, std::move(frame));
    recompile_layer(layer_id);
    commit();
    return true;
}

bool MotionDocument::animates(const std::string& layer_id, Channel channel) const {
    auto it = compiled_.find(layer_id);
    return it != compiled_.end() && it->second.animates(channel);
}

void MotionDocument::set_default_parameters(const presets::TemplateParameters& parameters) {
    state_.parameters = preset_settings::sanitized(parameters);
    commit();
}

void MotionDocument::set_background(const BackgroundSettings& background) {
    state_.background = background;
    state_.background.opacity = std::min(1.0, std::max(0.0, background.opacity));
    commit();
}

const timeline::LayerTrack* MotionDocument::track(const std::string& layer_id) const {
    auto it = compiled_.find(layer_id);
    return it == compiled_.end() ? nullptr : &it->second.track;
}

std::vector<timeline::LayerTrack> MotionDocument::tracks() const {
    std::vector<timeline::LayerTrack> result;
    result.reserve(state_.layer_order.size());
    for (const auto& id : state_.layer_order) {
        if (const auto* compiled = track(id)) {
            result.push_back(*compiled);
        }
    }
    return result;
}

std::vector<TemplateClip> MotionDocument::clips_for_layer(const std::string& layer_id) const {
    std::vector<TemplateClip> result;
    for (const auto& clip : state_.clips) {
        if (clip.layer_id == layer_id) {
            result.push_back(clip);
        }
    }
    std::stable_sort(result.begin(), result.end(),
                     [](const TemplateClip& a, const TemplateClip& b) { return a.start < b.start; });
    return result;
}

double MotionDocument::duration() const {
    double duration = timeline::kDefaultTimelineDurationMs;
    for (const auto& entry : compiled_) {
        duration = std::max(duration, entry.second.duration);
    }
    return duration;
}

timeline::SampledTimeline MotionDocument::sample(double time) const {
    timeline::SampledTimeline result;
    result.reserve(state_.layers.size());
    for (const auto& layer : state_.layers) {
        if (auto state = sample_layer(layer.id, time)) {
            result[layer.id] = std::move(*state);
        }
    }
    return result;
}

std::optional<timeline::SampledLayerState> MotionDocument::sample_layer(const std::string& layer_id, double time) const {
    const Layer* layer = find_layer(layer_id);
    if (!layer) {
        return std::nullopt;
    }
    const timeline::SampledLayerState base = declared_base(*layer);
    const timeline::LayerTrack* compiled = track(layer_id);
    if (!compiled) {
        return base;
    }
    return timeline::sample_layer_state(*compiled, time, base);
}

MotionDocument::ListenerId MotionDocument::subscribe(Listener listener) {
    const ListenerId id = next_listener_id_++;
    listeners_.emplace_back(id, std::move(listener));
    return id;
}

bool MotionDocument::unsubscribe(ListenerId id) {
    auto it = std::find_if(listeners_.begin(), listeners_.end(),
                           [id](const std::pair<ListenerId, Listener>& entry) { return entry.first == id; });
    if (it == listeners_.end()) {
        return false;
    }
    listeners_.erase(it);
    return true;
}

void MotionDocument::apply_snapshot(const DocumentSnapshot& snapshot) {
    state_ = snapshot;
    normalize_layer_order(state_);
    recompile_all();
    notify();
}

bool MotionDocument::undo() {
    auto snapshot = history_.undo();
    if (!snapshot) {
        return false;
    }
    apply_snapshot(*snapshot);
    return true;
}

bool MotionDocument::redo() {
    auto snapshot = history_.redo();
    if (!snapshot) {
        return false;
    }
    apply_snapshot(*snapshot);
    return true;
}

void MotionDocument::clear() {
    state_ = DocumentSnapshot{};
    compiled_.clear();
    history_.clear();
    history_.push(state_);
    notify();
}

void MotionDocument::commit() {
    history_.push(state_);
    notify();
}

void MotionDocument::notify() {
    // Listeners may unsubscribe while being called.
    const auto listeners = listeners_;
    for (const auto& entry : listeners) {
        if (entry.second) {
            entry.second(*this);
        }
    }
}

void MotionDocument::recompile_layer(const std::string& layer_id) {
    const Layer* layer = find_layer(layer_id);
    if (!layer) {
        compiled_.erase(layer_id);
        return;
    }
    const timeline::SampledLayerState base = declared_base(*layer);
    if (const timeline::LayerTrack* authored = authored_track(layer_id)) {
        compiled_[layer_id] = compiler_.compile(layer_id, state_.clips, base, *authored);
    } else {
        compiled_[layer_id] = compiler_.compile(layer_id, state_.clips, base);
    }
}

void MotionDocument::recompile_all() {
    compiled_.clear();
    for (const auto& layer : state_.layers) {
        recompile_layer(layer.id);
    }
}

std::string MotionDocument::next_clip_id() {
    std::string id;
    do {
        id = "clip-" + std::to_string(next_clip_serial_++);
    } while (find_clip(id));
    return id;
}

TemplateClip* MotionDocument::find_clip_mut(const std::string& clip_id) {
    for (auto& clip : state_.clips) {
        if (clip.id == clip_id) {
            return &clip;
        }
    }
    return nullptr;
}

timeline::LayerTrack& MotionDocument::authored_for(const std::string& layer_id) {
    for (auto& track : state_.authored) {
        if (track.layer_id == layer_id) {
            return track;
        }
    }
    timeline::LayerTrack track;
    track.layer_id = layer_id;
    state_.authored.push_back(std::move(track));
    return state_.authored.back();
}

const timeline::LayerTrack* MotionDocument::authored_track(const std::string& layer_id) const {
    for (const auto& track : state_.authored) {
        if (track.layer_id == layer_id) {
            return &track;
        }
    }
    return nullptr;
}

double MotionDocument::layer_clips_end(const std::string& layer_id) const {
    double end = 0.0;
    for (const auto& clip : state_.clips) {
        if (clip.layer_id == layer_id) {
            end = std::max(end, clip.end());
        }
    }
    return end;
}

}
