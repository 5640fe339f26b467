#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "document_types.hpp"
#include "history_manager.hpp"
#include "timeline/sampler.hpp"
#include "timeline/track_compiler.hpp"

namespace tumble::editor {

struct ApplyTemplateOptions {
    std::optional<double> start_at;
    // Starts after the layer's last clip when no explicit start is given.
    bool append = false;
    std::optional<double> target_duration;
    // Falls back to the document defaults.
    std::optional<presets::TemplateParameters> parameters;
};

// Owns the editable document: layers, clips, hand-placed keyframes and the
// tracks compiled from them. Every mutating command recompiles what it
// touched, records a history snapshot and notifies subscribers.
class MotionDocument {
public:
    using Listener = std::function<void(const MotionDocument&)>;
    using ListenerId = std::size_t;

    explicit MotionDocument(std::size_t history_capacity = kDefaultHistoryCapacity);
    explicit MotionDocument(DocumentSnapshot initial, std::size_t history_capacity = kDefaultHistoryCapacity);

    bool add_layer(Layer layer);
    bool remove_layer(const std::string& layer_id);
    bool update_layer(const Layer& layer);
    bool move_layer(const std::string& layer_id, std::size_t index);
    bool set_layer_order(const std::vector<std::string>& order);
    const std::vector<Layer>& layers() const { return state_.layers; }
    const std::vector<std::string>& layer_order() const { return state_.layer_order; }
    const Layer* find_layer(const std::string& layer_id) const;

    std::optional<std::string> apply_template(const std::string& layer_id,
                                              presets::TemplateId template_id,
                                              const ApplyTemplateOptions& options = {});
    // Names this build cannot generate are kept on the clip verbatim.
    std::optional<std::string> apply_template(const std::string& layer_id,
                                              const std::string& template_name,
                                              const ApplyTemplateOptions& options = {});
    // Freehand strokes are Chaikin-smoothed unless `smooth` is false.
    std::optional<std::string> add_path_clip(const std::string& layer_id,
                                             std::vector<timeline::Vec2> points,
                                             const ApplyTemplateOptions& options = {},
                                             bool smooth = true);
    bool update_clip(const std::string& clip_id, const presets::TemplateParameters& parameters);
    bool move_clip(const std::string& clip_id, double start);
    bool resize_clip(const std::string& clip_id, double duration);
    bool remove_clip(const std::string& clip_id);
    bool reorder_clips(const std::string& layer_id, const std::vector<std::string>& ordered_ids);
    const timeline::TemplateClip* find_clip(const std::string& clip_id) const;

    // Refused on channels a clip animates.
    bool set_keyframe(const std::string& layer_id, const timeline::Keyframe<timeline::Vec2>& keyframe);
    bool set_keyframe(const std::string& layer_id, timeline::Channel channel, const timeline::Keyframe<double>& keyframe);
    bool animates(const std::string& layer_id, timeline::Channel channel) const;

    void set_default_parameters(const presets::TemplateParameters& parameters);
    const presets::TemplateParameters& default_parameters() const { return state_.parameters; }

    void set_background(const BackgroundSettings& background);
    const BackgroundSettings& background() const { return state_.background; }

    const timeline::LayerTrack* track(const std::string& layer_id) const;
    std::vector<timeline::LayerTrack> tracks() const;
    const std::vector<timeline::TemplateClip>& clips() const { return state_.clips; }
    std::vector<timeline::TemplateClip> clips_for_layer(const std::string& layer_id) const;
    double duration() const;
    timeline::SampledTimeline sample(double time) const;
    std::optional<timeline::SampledLayerState> sample_layer(const std::string& layer_id, double time) const;

    ListenerId subscribe(Listener listener);
    bool unsubscribe(ListenerId id);

    DocumentSnapshot snapshot() const { return state_; }
    // Replaces the whole document without recording history.
    void apply_snapshot(const DocumentSnapshot& snapshot);
    bool undo();
    bool redo();
    bool can_undo() const { return history_.can_undo(); }
    bool can_redo() const { return history_.can_redo(); }
    const HistoryManager& history() const { return history_; }

    // Empties the document and restarts history from the empty state.
    void clear();

private:
    void commit();
    void notify();
    void recompile_layer(const std::string& layer_id);
    void recompile_all();
    std::string next_clip_id();
    timeline::TemplateClip* find_clip_mut(const std::string& clip_id);
    timeline::LayerTrack& authored_for(const std::string& layer_id);
    const timeline::LayerTrack* authored_track(const std::string& layer_id) const;
    double layer_clips_end(const std::string& layer_id) const;
    std::optional<std::string> insert_clip(timeline::TemplateClip clip);

private:
    DocumentSnapshot state_;
    std::unordered_map<std::string, timeline::CompileResult> compiled_;
    HistoryManager history_;
    timeline::TrackCompiler compiler_;
    std::vector<std::pair<ListenerId, Listener>> listeners_;
    ListenerId next_listener_id_ = 1;
    std::size_t next_clip_serial_ = 1;
};

}
