#pragma once

#include <optional>

#include <SDL.h>

#include "timeline_types.hpp"

namespace tumble::timeline {

inline constexpr double kMinPlaybackRate = 0.1;

// Playhead clock driven by host timestamps in milliseconds.
class Transport {
public:
    Transport() = default;
    explicit Transport(double duration_ms);

    void set_duration(double duration_ms);
    double duration() const { return duration_; }

    // Scrubbing clamps into [0, duration] and pauses playback.
    void set_current_time(double time_ms);
    double current_time() const { return current_time_; }

    void set_loop(bool loop) { loop_ = loop; }
    bool loop() const { return loop_; }

    void set_playback_rate(double rate);
    double playback_rate() const { return rate_; }

    void play();
    void pause();
    void toggle();
    bool is_playing() const { return playing_; }

    // Returns true when the playhead moved.
    bool tick(double timestamp_ms);
    bool update();

private:
    double duration_ = kDefaultTimelineDurationMs;
    double current_time_ = 0.0;
    double rate_ = 1.0;
    bool loop_ = false;
    bool playing_ = false;
    std::optional<double> last_tick_;
};

}
