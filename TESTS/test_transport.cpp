#include "doctest/doctest.h"

#include "timeline/transport.hpp"

using tumble::timeline::Transport;

TEST_CASE("Transport advances by elapsed time times rate") {
    Transport transport(1000.0);
    transport.play();
    CHECK_FALSE(transport.tick(5000.0));
    CHECK(transport.tick(5100.0));
    CHECK(transport.current_time() == doctest::Approx(100.0));

    transport.set_playback_rate(2.0);
    transport.tick(5200.0);
    CHECK(transport.current_time() == doctest::Approx(300.0));
}

TEST_CASE("Transport stops at the end unless looping") {
    Transport transport(1000.0);
    transport.play();
    transport.tick(0.0);
    transport.tick(1500.0);
    CHECK(transport.current_time() == doctest::Approx(1000.0));
    CHECK_FALSE(transport.is_playing());

    // Playing again from the end restarts.
    transport.play();
    CHECK(transport.current_time() == doctest::Approx(0.0));

    transport.set_loop(true);
    transport.tick(0.0);
    transport.tick(1250.0);
    CHECK(transport.is_playing());
    CHECK(transport.current_time() == doctest::Approx(250.0));
}

TEST_CASE("Scrubbing clamps and pauses") {
    Transport transport(2000.0);
    transport.play();
    transport.set_current_time(5000.0);
    CHECK(transport.current_time() == doctest::Approx(2000.0));
    CHECK_FALSE(transport.is_playing());
    transport.set_current_time(-10.0);
    CHECK(transport.current_time() == doctest::Approx(0.0));
    CHECK_FALSE(transport.tick(100.0));
}

TEST_CASE("Playback rate has a floor") {
    Transport transport;
    transport.set_playback_rate(0.0);
    CHECK(transport.playback_rate() == doctest::Approx(0.1));
    transport.set_playback_rate(-3.0);
    CHECK(transport.playback_rate() == doctest::Approx(0.1));
    transport.toggle();
    CHECK(transport.is_playing());
    transport.toggle();
    CHECK_FALSE(transport.is_playing());
}

TEST_CASE("Shrinking the duration pulls the playhead back") {
    Transport transport(4000.0);
    transport.set_current_time(3000.0);
    transport.set_duration(1000.0);
    CHECK(transport.current_time() == doctest::Approx(1000.0));
}
