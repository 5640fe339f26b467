#include <algorithm>
#include <cmath>

#include "transport.hpp"

namespace tumble::timeline {

namespace {

double clamp_time(double time, double duration) {
    if (!std::isfinite(time)) {
        return 0.0;
    }
    return std::max(0.0, std::min(duration, time));
}

}

Transport::Transport(double duration_ms)
{
    set_duration(duration_ms);
}

void Transport::set_duration(double duration_ms) {
    duration_ = std::isfinite(duration_ms) ? std::max(0.0, duration_ms) : 0.0;
    current_time_ = clamp_time(current_time_, duration_);
}

void Transport::set_current_time(double time_ms) {
    current_time_ = clamp_time(time_ms, duration_);
    playing_ = false;
    last_tick_.reset();
}

void Transport::set_playback_rate(double rate) {
    rate_ = std::isfinite(rate) ? std::max(kMinPlaybackRate, rate) : 1.0;
}

void Transport::play() {
    if (playing_) return;
    if (!loop_ && current_time_ >= duration_) {
        current_time_ = 0.0;
    }
    playing_ = true;
    last_tick_.reset();
}

void Transport::pause() {
    playing_ = false;
}

void Transport::toggle() {
    if (playing_) {
        pause();
    } else {
        play();
    }
}

bool Transport::tick(double timestamp_ms) {
    if (!playing_) {
        return false;
    }
    const double last = last_tick_.value_or(timestamp_ms);
    last_tick_ = timestamp_ms;
    const double previous = current_time_;
    double next = current_time_ + std::max(0.0, timestamp_ms - last) * rate_;

    if (next >= duration_) {
        if (loop_ && duration_ > 0.0) {
            next = std::fmod(next, duration_);
        } else {
            next = duration_;
            playing_ = false;
        }
    }
    current_time_ = next;
    return current_time_ != previous;
}

bool Transport::update() {
    return tick(static_cast<double>(SDL_GetTicks()));
}

}
