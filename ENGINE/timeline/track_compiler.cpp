#include "track_compiler.hpp"

#include <algorithm>
#include <cmath>
#include <optional>
#include <string>

#include "keyframes.hpp"
#include "path_smoothing.hpp"
#include "sampler.hpp"
#include "presets/preset_factory.hpp"
#include "utils/log.hpp"

namespace tumble::timeline {

using presets::PresetKey;
using presets::PresetValue;
using presets::TemplateId;

namespace {

constexpr double kHoldLeadMs = 1.0;

using ChannelFlags = std::array<bool, 4>;

std::size_t index_of(Channel channel) {
    return static_cast<std::size_t>(channel);
}

double clamp01(double v) {
    return std::min(1.0, std::max(0.0, v));
}

struct PopCapture {
    double scale = 1.0;
    double opacity = 1.0;
};

// Per channel: the track under construction once a clip has written to it,
// otherwise the authored keys, otherwise the declared base.
SampledLayerState chained_base(const LayerTrack& track,
                               const ChannelFlags& touched,
                               const LayerTrack& authored,
                               double time,
                               const SampledLayerState& declared) {
    SampledLayerState state = sample_layer_tracks(authored, time, declared);
    if (touched[index_of(Channel::Position)] && !track.position.empty()) {
        state.position = sample_channel(track.position, time, state.position);
    }
    if (touched[index_of(Channel::Scale)] && !track.scale.empty()) {
        state.scale = sample_channel(track.scale, time, state.scale);
    }
    if (touched[index_of(Channel::Rotation)] && !track.rotation.empty()) {
        state.rotation = sample_channel(track.rotation, time, state.rotation);
    }
    if (touched[index_of(Channel::Opacity)] && !track.opacity.empty()) {
        state.opacity = sample_channel(track.opacity, time, state.opacity);
    }
    return state;
}

template <typename T, typename MapFn>
bool merge_keys(std::vector<Keyframe<T>>& frames,
                const std::vector<PresetKey<T>>& keys,
                double start,
                const std::string& clip_id,
                MapFn map) {
    for (const auto& key : keys) {
        upsert_keyframe(frames, Keyframe<T>{start + std::max(0.0, key.time), map(key.value), key.easing, clip_id});
    }
    return !keys.empty();
}

template <typename T>
void hold_before(std::vector<Keyframe<T>>& frames, double start, double floor, const T& value, const std::string& clip_id) {
    const double time = start - kHoldLeadMs;
    const double last = frames.empty() ? 0.0 : frames.back().time;
    if (time > std::max(floor, last) + kTimeEpsilonMs) {
        upsert_keyframe(frames, Keyframe<T>{time, value, Easing::Linear, clip_id});
    }
}

template <typename T>
void anchor_at_zero(std::vector<Keyframe<T>>& frames, const T& value, double first_start) {
    if (frames.empty()) {
        return;
    }
    const double lead = first_start - kHoldLeadMs;
    auto first_after_zero = std::find_if(frames.begin(), frames.end(),
                                         [](const Keyframe<T>& frame) { return frame.time > kTimeEpsilonMs; });
    if (lead > kTimeEpsilonMs && (first_after_zero == frames.end() || first_after_zero->time > lead + kTimeEpsilonMs)) {
        upsert_keyframe(frames, Keyframe<T>{lead, value, Easing::Linear, std::string{}});
    }
    if (!same_time(frames.front().time, 0.0)) {
        upsert_keyframe(frames, Keyframe<T>{0.0, value, Easing::Linear, std::string{}});
    }
}

template <typename T>
void settle_unanimated(std::vector<Keyframe<T>>& frames, const std::vector<Keyframe<T>>& authored, const T& fallback) {
    frames = untagged_keyframes(authored);
    if (frames.empty()) {
        frames.push_back(Keyframe<T>{0.0, fallback, Easing::Linear, std::string{}});
    }
}

// Reappear after a collapsing pop: hold the collapsed values, then restore
// the pop's starting scale and opacity at `start`.
void restore_after_pop(LayerTrack& track, double start, const PopCapture& capture, const std::string& clip_id) {
    const double collapsed_scale = sample_channel(track.scale, start, capture.scale);
    const double collapsed_opacity = sample_channel(track.opacity, start, capture.opacity);
    hold_before(track.scale, start, 0.0, collapsed_scale, clip_id);
    hold_before(track.opacity, start, 0.0, collapsed_opacity, clip_id);
    upsert_keyframe(track.scale, Keyframe<double>{start, capture.scale, Easing::Step, clip_id});
    upsert_keyframe(track.opacity, Keyframe<double>{start, capture.opacity, Easing::Step, clip_id});
}

// Restore keys must stay a jump even when the next clip's first key lands on them.
void force_step_at(NumberChannel& frames, double start) {
    for (auto& frame : frames) {
        if (same_time(frame.time, start)) {
            frame.easing = Easing::Step;
        }
    }
}

}

TemplateClip sanitize_clip(TemplateClip clip) {
    if (!std::isfinite(clip.start) || clip.start < 0.0) {
        tumble::log::debug("[TrackCompiler] clip " + clip.id + " start clamped to 0");
        clip.start = 0.0;
    }
    if (!std::isfinite(clip.duration) || clip.duration < kMinClipDurationMs) {
        tumble::log::debug("[TrackCompiler] clip " + clip.id + " duration raised to minimum");
        clip.duration = kMinClipDurationMs;
    }
    return clip;
}

double compiled_duration(const LayerTrack& track, const std::vector<TemplateClip>& clips) {
    double duration = std::max(kDefaultTimelineDurationMs, track_end_time(track));
    for (const auto& clip : clips) {
        const TemplateClip safe = sanitize_clip(clip);
        duration = std::max(duration, safe.end());
    }
    return duration;
}

CompileResult TrackCompiler::compile(const std::string& layer_id,
                                     const std::vector<TemplateClip>& clips,
                                     const SampledLayerState& declared_base) const {
    LayerTrack authored;
    authored.layer_id = layer_id;
    return compile(layer_id, clips, declared_base, authored);
}

CompileResult TrackCompiler::compile(const std::string& layer_id,
                                     const std::vector<TemplateClip>& clips,
                                     const SampledLayerState& declared_base,
                                     const LayerTrack& authored) const {
    std::vector<TemplateClip> ordered;
    ordered.reserve(clips.size());
    for (const auto& clip : clips) {
        if (clip.layer_id == layer_id) {
            ordered.push_back(sanitize_clip(clip));
        }
    }
    std::stable_sort(ordered.begin(), ordered.end(),
                     [](const TemplateClip& a, const TemplateClip& b) { return a.start < b.start; });

    CompileResult result;
    LayerTrack& track = result.track;
    track.layer_id = layer_id;
    ChannelFlags& touched = result.animated;

    SampledLayerState first_base = declared_base;
    std::optional<PopCapture> pending_restore;
    double prev_end = 0.0;

    for (std::size_t i = 0; i < ordered.size(); ++i) {
        const TemplateClip& clip = ordered[i];
        const TemplateId id = clip.template_id;
        const bool in_out = presets::is_in_out(id);
        const presets::TemplateParameters& params = clip.parameters;

        SampledLayerState base;
        if (in_out && params.layer_base) {
            base = *params.layer_base;
        } else if (i == 0) {
            if (in_out) {
                base = declared_base;
            } else {
                base = sample_layer_tracks(authored, clip.start, declared_base);
                base.scale = std::fabs(base.scale);
            }
        } else {
            base = chained_base(track, touched, authored, prev_end, declared_base);
        }
        base.active_path_id.clear();
        if (pending_restore) {
            base.scale = pending_restore->scale;
            base.opacity = pending_restore->opacity;
        }
        if (i == 0) {
            first_base = base;
        }

        presets::PresetResult preset = presets::generate_preset(id, params, clip.duration);
        preset.rescale_to(clip.duration);

        const bool is_path = id == TemplateId::Path;
        if (i > 0) {
            const bool gapped = clip.start > prev_end + kTimeEpsilonMs;
            const double floor = gapped ? prev_end : 0.0;
            if (gapped || !preset.position.empty() || is_path) {
                hold_before(track.position, clip.start, floor, base.position, clip.id);
            }
            if (gapped || !preset.rotation.empty()) {
                hold_before(track.rotation, clip.start, floor, base.rotation, clip.id);
            }
            if (!pending_restore) {
                if (gapped || !preset.scale.empty()) {
                    hold_before(track.scale, clip.start, floor, base.scale, clip.id);
                }
                if (gapped || !preset.opacity.empty()) {
                    hold_before(track.opacity, clip.start, floor, base.opacity, clip.id);
                }
            }
        }
        if (pending_restore) {
            restore_after_pop(track, clip.start, *pending_restore, clip.id);
            touched[index_of(Channel::Scale)] = true;
            touched[index_of(Channel::Opacity)] = true;
        }

        const auto map_position = [&](const PresetValue<Vec2>& v) {
            if (const auto* offset = v.as_offset()) {
                return base.position + offset->value;
            }
            return base.position;
        };
        const auto map_rotation = [&](const PresetValue<double>& v) {
            if (const auto* offset = v.as_offset()) {
                return base.rotation + offset->value;
            }
            return base.rotation;
        };
        const auto map_scale = [&](const PresetValue<double>& v) { return v.resolve_or(base.scale); };
        const auto map_opacity = [&](const PresetValue<double>& v) {
            if (const auto* offset = v.as_offset()) {
                return clamp01(in_out ? offset->value : base.opacity * offset->value);
            }
            return clamp01(base.opacity);
        };

        touched[index_of(Channel::Position)] |= merge_keys(track.position, preset.position, clip.start, clip.id, map_position);
        touched[index_of(Channel::Scale)]    |= merge_keys(track.scale, preset.scale, clip.start, clip.id, map_scale);
        touched[index_of(Channel::Rotation)] |= merge_keys(track.rotation, preset.rotation, clip.start, clip.id, map_rotation);
        touched[index_of(Channel::Opacity)]  |= merge_keys(track.opacity, preset.opacity, clip.start, clip.id, map_opacity);

        if (pending_restore) {
            force_step_at(track.scale, clip.start);
            force_step_at(track.opacity, clip.start);
        }

        if (is_path) {
            const std::vector<Vec2> points = finite_points(params.path_points);
            if (points.size() >= 2) {
                PathClip path;
                path.id = clip.id;
                path.start_time = clip.start;
                path.duration = clip.duration;
                path.easing = params.path_easing;
                path.points.reserve(points.size());
                const Vec2 origin = points.front();
                for (const auto& point : points) {
                    path.points.push_back(base.position + (point - origin));
                }
                upsert_keyframe(track.position,
                                Keyframe<Vec2>{clip.end(), base.position + (points.back() - origin), Easing::Linear, clip.id});
                track.paths.push_back(std::move(path));
            } else {
                tumble::log::debug("[TrackCompiler] path clip " + clip.id + " has fewer than two points");
                upsert_keyframe(track.position, Keyframe<Vec2>{clip.end(), base.position, Easing::Linear, clip.id});
            }
            touched[index_of(Channel::Position)] = true;
        }

        pending_restore.reset();
        if (id == TemplateId::Pop && params.pop_collapse && params.pop_reappear) {
            pending_restore = PopCapture{base.scale, base.opacity};
        }
        prev_end = std::max(prev_end, clip.end());
    }

    const double first_start = ordered.empty() ? 0.0 : ordered.front().start;
    if (touched[index_of(Channel::Position)]) {
        anchor_at_zero(track.position, first_base.position, first_start);
    } else {
        settle_unanimated(track.position, authored.position, declared_base.position);
    }
    if (touched[index_of(Channel::Scale)]) {
        anchor_at_zero(track.scale, first_base.scale, first_start);
    } else {
        settle_unanimated(track.scale, authored.scale, declared_base.scale);
    }
    if (touched[index_of(Channel::Rotation)]) {
        anchor_at_zero(track.rotation, first_base.rotation, first_start);
    } else {
        settle_unanimated(track.rotation, authored.rotation, declared_base.rotation);
    }
    if (touched[index_of(Channel::Opacity)]) {
        anchor_at_zero(track.opacity, first_base.opacity, first_start);
    } else {
        settle_unanimated(track.opacity, authored.opacity, declared_base.opacity);
    }

    result.duration = compiled_duration(track, ordered);
    tumble::log::debug("[TrackCompiler] layer " + layer_id + " compiled from " + std::to_string(ordered.size()) + " clips");
    return result;
}

}
