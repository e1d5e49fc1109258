/**
 * Segue Engine - Mixer Tests
 * Tests for crossfade curves, fade sessions, decks and the mix bus
 */

#include "segue/types.h"
#include "../src/mixer/crossfader.h"
#include "../src/mixer/deck.h"
#include "../src/mixer/mix_bus.h"
#include "../src/core/utils.h"

#include <iostream>
#include <cassert>
#include <cmath>
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace segue;

/* ============================================================================
 * Test Utilities
 * ============================================================================ */

#define TEST(name) void test_##name()
#define RUN_TEST(name) do { \
    std::cout << "Test: " #name "... "; \
    try { \
        test_##name(); \
        std::cout << "PASSED\n"; \
    } catch (const std::exception& e) { \
        std::cout << "FAILED: " << e.what() << "\n"; \
        failed_tests++; \
    } \
} while(0)

static int failed_tests = 0;

void assert_near(float actual, float expected, float tolerance, const char* msg = "") {
    if (std::abs(actual - expected) > tolerance) {
        throw std::runtime_error(std::string(msg) +
            " Expected: " + std::to_string(expected) +
            ", Actual: " + std::to_string(actual));
    }
}

static constexpr int kSampleRate = 44100;

static const CrossfadeCurve kAllCurves[] = {
    CrossfadeCurve::Linear,
    CrossfadeCurve::EqualPower,
    CrossfadeCurve::SCurve,
    CrossfadeCurve::Logarithmic,
    CrossfadeCurve::Exponential
};

static AudioBuffer make_constant(float value, float duration, int channels = 2, int sample_rate = kSampleRate) {
    AudioBuffer buf;
    buf.sample_rate = sample_rate;
    buf.channels = channels;
    buf.samples.assign(static_cast<size_t>(duration * sample_rate) * channels, value);
    return buf;
}

/**
 * Loader keyed by locator:
 *   "const:<v>"  1 s stereo at v
 *   "slow:<v>"   as const, after 300 ms
 *   "mono"       1 s mono, sample i = i / frames
 *   "surround"   1 s, 3 channels valued 0.1, 0.2, 0.3
 *   "ramp"       1 s stereo, L = 0.5 * i / frames, R = -L
 *   "rate"       48 kHz stereo
 *   "fail"       loader error
 *   "throw"      loader exception
 */
static Result<AudioBuffer> test_loader(const std::string& locator) {
    if (locator.rfind("const:", 0) == 0) {
        return make_constant(std::stof(locator.substr(6)), 1.0f);
    }
    if (locator.rfind("slow:", 0) == 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        return make_constant(std::stof(locator.substr(5)), 1.0f);
    }
    if (locator == "mono") {
        AudioBuffer buf = make_constant(0.0f, 1.0f, 1);
        for (size_t i = 0; i < buf.samples.size(); ++i) {
            buf.samples[i] = static_cast<float>(i) / buf.samples.size();
        }
        return buf;
    }
    if (locator == "surround") {
        AudioBuffer buf = make_constant(0.0f, 1.0f, 3);
        for (size_t i = 0; i < buf.frame_count(); ++i) {
            buf.samples[i * 3] = 0.1f;
            buf.samples[i * 3 + 1] = 0.2f;
            buf.samples[i * 3 + 2] = 0.3f;
        }
        return buf;
    }
    if (locator == "ramp") {
        AudioBuffer buf = make_constant(0.0f, 1.0f);
        size_t frames = buf.frame_count();
        for (size_t i = 0; i < frames; ++i) {
            buf.samples[i * 2] = 0.5f * i / frames;
            buf.samples[i * 2 + 1] = -0.5f * i / frames;
        }
        return buf;
    }
    if (locator == "rate") {
        return make_constant(0.2f, 1.0f, 2, 48000);
    }
    if (locator == "throw") {
        throw std::runtime_error("decoder crashed");
    }
    return "No such track";
}

static TrackRef track(int64_t id, const std::string& locator) {
    TrackRef t;
    t.id = id;
    t.locator = locator;
    return t;
}

// Poll until the output leaves Loading (loads run on background threads)
static LoadState wait_loaded(const VoiceOutput& output, int timeout_ms = 3000) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (output.load_state() == LoadState::Loading &&
           std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return output.load_state();
}

/* ============================================================================
 * Curves
 * ============================================================================ */

TEST(curves_boundary_values) {
    for (CrossfadeCurve curve : kAllCurves) {
        CurveGains start = crossfade_gains(curve, 0.0f);
        assert(start.fade_out == 1.0f);
        assert(start.fade_in == 0.0f);

        CurveGains end = crossfade_gains(curve, 1.0f);
        assert(end.fade_out == 0.0f);
        assert(end.fade_in == 1.0f);
    }
}

TEST(curves_clamp_progress) {
    for (CrossfadeCurve curve : kAllCurves) {
        CurveGains before = crossfade_gains(curve, -0.5f);
        assert(before.fade_out == 1.0f && before.fade_in == 0.0f);

        CurveGains after = crossfade_gains(curve, 3.0f);
        assert(after.fade_out == 0.0f && after.fade_in == 1.0f);
    }
}

TEST(curves_monotonic_and_bounded) {
    for (CrossfadeCurve curve : kAllCurves) {
        CurveGains prev = crossfade_gains(curve, 0.0f);
        for (int i = 1; i <= 100; ++i) {
            CurveGains g = crossfade_gains(curve, i / 100.0f);
            assert(g.fade_out >= 0.0f && g.fade_out <= 1.0f);
            assert(g.fade_in >= 0.0f && g.fade_in <= 1.0f);
            assert(g.fade_out <= prev.fade_out + 1e-6f);
            assert(g.fade_in >= prev.fade_in - 1e-6f);
            prev = g;
        }
    }
}

TEST(curves_shapes) {
    CurveGains linear = crossfade_gains(CrossfadeCurve::Linear, 0.25f);
    assert_near(linear.fade_out, 0.75f, 1e-6f, "linear out");
    assert_near(linear.fade_in, 0.25f, 1e-6f, "linear in");

    // Constant power through the fade
    for (float p : {0.1f, 0.3f, 0.5f, 0.8f}) {
        CurveGains g = crossfade_gains(CrossfadeCurve::EqualPower, p);
        assert_near(g.fade_out * g.fade_out + g.fade_in * g.fade_in, 1.0f, 1e-5f, "equal power");
    }

    CurveGains s = crossfade_gains(CrossfadeCurve::SCurve, 0.5f);
    assert_near(s.fade_in, 0.5f, 1e-6f, "s-curve midpoint");
    assert(crossfade_gains(CrossfadeCurve::SCurve, 0.1f).fade_in < 0.1f);

    // Logarithmic rises fast, exponential rises slow
    assert(crossfade_gains(CrossfadeCurve::Logarithmic, 0.2f).fade_in > 0.4f);
    assert(crossfade_gains(CrossfadeCurve::Exponential, 0.2f).fade_in < 0.1f);
}

TEST(curve_names_round_trip) {
    for (CrossfadeCurve curve : kAllCurves) {
        auto parsed = utils::parse_curve(utils::curve_name(curve));
        assert(parsed.has_value());
        assert(*parsed == curve);
    }
    assert(!utils::parse_curve("wobble").has_value());
}

/* ============================================================================
 * Sessions
 * ============================================================================ */

TEST(session_progress) {
    CrossfadeSession session;
    session.duration = 4.0;
    assert(session.progress(100.0) == 0.0f);

    session.phase = TransitionPhase::Active;
    session.start_time = 10.0;
    assert_near(session.progress(10.0), 0.0f, 1e-6f, "at start");
    assert_near(session.progress(11.0), 0.25f, 1e-6f, "quarter");
    assert_near(session.progress(20.0), 1.0f, 1e-6f, "clamped");

    session.curve = CrossfadeCurve::Linear;
    CurveGains g = session.gains(12.0);
    assert_near(g.fade_out, 0.5f, 1e-6f, "gains follow progress");

    session.phase = TransitionPhase::Handoff;
    assert(session.progress(10.0) == 1.0f);
}

TEST(session_pause_freezes_progress) {
    CrossfadeSession session;
    session.phase = TransitionPhase::Active;
    session.duration = 4.0;
    session.start_time = 10.0;
    session.ready_deadline = 15.0;

    session.pause(12.0);
    assert_near(session.progress(13.0), 0.5f, 1e-6f, "frozen");
    session.pause(13.0);                    // Second pause keeps the first instant
    assert(session.paused_at == 12.0);

    session.resume(14.0);
    assert(session.paused_at < 0.0);
    assert_near(session.progress(14.0), 0.5f, 1e-6f, "resumed where it stopped");
    assert_near(session.progress(16.0), 1.0f, 1e-6f, "completes later");
    assert(session.ready_deadline == 17.0);

    session.resume(20.0);                   // Not paused: no shift
    assert(session.start_time == 12.0);
}

TEST(session_zero_duration) {
    CrossfadeSession session;
    session.phase = TransitionPhase::Active;
    session.duration = 0.0;
    assert(session.progress(0.0) == 1.0f);
}

/* ============================================================================
 * Deck
 * ============================================================================ */

TEST(deck_load_and_render) {
    Deck deck(test_loader, kSampleRate);
    assert(deck.load_state() == LoadState::Idle);
    assert(!deck.play());

    assert(deck.bind(track(7, "const:0.25")));
    assert(wait_loaded(deck) == LoadState::Ready);
    assert(deck.track_id() == 7);
    assert_near(static_cast<float>(deck.duration()), 1.0f, 1e-4f, "duration");

    assert(deck.play());
    assert(deck.is_playing());

    std::vector<float> out(200);
    assert(deck.render(out.data(), 100) == 100);
    for (float v : out) assert_near(v, 0.25f, 1e-6f, "sample");
    assert_near(static_cast<float>(deck.position()), 100.0f / kSampleRate, 1e-6f, "position");

    deck.pause();
    assert(!deck.is_playing());
    assert(deck.render(out.data(), 100) == 0);
    for (float v : out) assert(v == 0.0f);
}

TEST(deck_rejects_empty_locator) {
    Deck deck(test_loader, kSampleRate);
    assert(!deck.bind(track(1, "")));
    assert(deck.load_state() == LoadState::Idle);

    Deck no_loader(PcmLoader(), kSampleRate);
    assert(!no_loader.bind(track(1, "const:0.1")));
}

TEST(deck_load_failures) {
    Deck failing(test_loader, kSampleRate);
    assert(failing.bind(track(1, "fail")));
    assert(wait_loaded(failing) == LoadState::Failed);
    assert(!failing.load_error().empty());
    assert(!failing.play());

    Deck throwing(test_loader, kSampleRate);
    assert(throwing.bind(track(2, "throw")));
    assert(wait_loaded(throwing) == LoadState::Failed);
    assert(throwing.load_error().find("decoder crashed") != std::string::npos);

    Deck wrong_rate(test_loader, kSampleRate);
    assert(wrong_rate.bind(track(3, "rate")));
    assert(wait_loaded(wrong_rate) == LoadState::Failed);
}

TEST(deck_channel_conversion) {
    Deck mono(test_loader, kSampleRate);
    assert(mono.bind(track(1, "mono")));
    assert(wait_loaded(mono) == LoadState::Ready);
    assert(mono.play());

    std::vector<float> out(2 * 64);
    mono.render(out.data(), 64);
    for (int i = 0; i < 64; ++i) {
        assert(out[i * 2] == out[i * 2 + 1]);
    }
    assert(out[2 * 10] > out[2 * 5]);

    Deck surround(test_loader, kSampleRate);
    assert(surround.bind(track(2, "surround")));
    assert(wait_loaded(surround) == LoadState::Ready);
    assert(surround.play());
    surround.render(out.data(), 64);
    assert_near(out[0], 0.1f, 1e-6f, "left");
    assert_near(out[1], 0.2f, 1e-6f, "right");
}

TEST(deck_gain_ramp) {
    Deck deck(test_loader, kSampleRate);
    assert(deck.bind(track(1, "const:0.5")));
    assert(wait_loaded(deck) == LoadState::Ready);
    assert(deck.play());

    std::vector<float> out(2 * 11);
    deck.render(out.data(), 10);
    assert_near(out[0], 0.5f, 1e-6f, "unity gain");

    deck.set_gain(0.0f);
    deck.render(out.data(), 11);
    assert_near(out[0], 0.5f, 1e-6f, "ramp starts at previous gain");
    assert_near(out[2 * 5], 0.25f, 1e-6f, "ramp midpoint");
    assert_near(out[2 * 10], 0.0f, 1e-6f, "ramp ends at new gain");

    deck.set_gain(100.0f);
    assert(deck.gain() == Deck::kMaxGain);
    deck.set_gain(-3.0f);
    assert(deck.gain() == 0.0f);
}

TEST(deck_end_of_track) {
    Deck deck(test_loader, kSampleRate);
    assert(deck.bind(track(1, "const:0.5")));
    assert(wait_loaded(deck) == LoadState::Ready);

    deck.seek(0.999);
    assert(deck.play());

    std::vector<float> out(2 * 512);
    int rendered = deck.render(out.data(), 512);
    assert(rendered < 512);
    assert(out[2 * 511] == 0.0f);
    assert(deck.has_ended());
    assert(!deck.is_playing());

    // Playing again restarts from the top
    assert(deck.play());
    assert(!deck.has_ended());
    assert(deck.position() == 0.0);
}

TEST(deck_seek_clamps) {
    Deck deck(test_loader, kSampleRate);
    assert(deck.bind(track(1, "const:0.5")));
    assert(wait_loaded(deck) == LoadState::Ready);

    deck.seek(-4.0);
    assert(deck.position() == 0.0);
    deck.seek(1000.0);
    assert_near(static_cast<float>(deck.position()), 1.0f, 1e-4f, "clamped to end");
    deck.seek(0.5);
    assert_near(static_cast<float>(deck.position()), 0.5f, 1e-4f, "mid");
}

TEST(deck_stale_load_discarded) {
    Deck deck(test_loader, kSampleRate);
    assert(deck.bind(track(1, "slow:0.9")));
    assert(deck.load_state() == LoadState::Loading);
    deck.unbind();
    assert(deck.load_state() == LoadState::Idle);

    std::this_thread::sleep_for(std::chrono::milliseconds(500));
    assert(deck.load_state() == LoadState::Idle);
    assert(deck.track_id() == 0);

    // A newer bind wins over an older slow one
    assert(deck.bind(track(2, "slow:0.9")));
    assert(deck.bind(track(3, "const:0.1")));
    assert(wait_loaded(deck) == LoadState::Ready);
    std::this_thread::sleep_for(std::chrono::milliseconds(500));
    assert(deck.track_id() == 3);

    assert(deck.play());
    std::vector<float> out(2 * 4);
    deck.render(out.data(), 4);
    assert_near(out[0], 0.1f, 1e-6f, "newest track");
}

TEST(deck_destroyed_while_loading) {
    {
        Deck deck(test_loader, kSampleRate);
        assert(deck.bind(track(1, "slow:0.5")));
    }
    // The worker finishes against its own reference
    std::this_thread::sleep_for(std::chrono::milliseconds(500));
}

/* ============================================================================
 * Mix Bus
 * ============================================================================ */

TEST(mix_bus_sums_playing_decks) {
    MixBus bus(test_loader, kSampleRate);
    auto a = bus.create_output();
    auto b = bus.create_output();
    auto idle = bus.create_output();
    assert(bus.live_outputs() == 3);

    assert(a->bind(track(1, "const:0.3")));
    assert(b->bind(track(2, "const:0.4")));
    assert(idle->bind(track(3, "const:0.2")));
    assert(wait_loaded(*a) == LoadState::Ready);
    assert(wait_loaded(*b) == LoadState::Ready);
    assert(wait_loaded(*idle) == LoadState::Ready);
    assert(a->play());
    assert(b->play());

    std::vector<float> out(2 * 100);
    assert(bus.render(out.data(), 100) == 100);
    for (float v : out) assert_near(v, 0.7f, 1e-5f, "sum");

    b->set_gain(0.5f);
    bus.render(out.data(), 100);
    assert_near(out[2 * 99], 0.5f, 1e-5f, "gain applied");
}

TEST(mix_bus_clips) {
    MixBus bus(test_loader, kSampleRate);
    auto a = bus.create_output();
    auto b = bus.create_output();
    assert(a->bind(track(1, "const:0.8")));
    assert(b->bind(track(2, "const:0.7")));
    assert(wait_loaded(*a) == LoadState::Ready);
    assert(wait_loaded(*b) == LoadState::Ready);
    assert(a->play());
    assert(b->play());

    std::vector<float> out(2 * 32);
    bus.render(out.data(), 32);
    for (float v : out) assert(v == 1.0f);
}

TEST(mix_bus_chunks_large_requests) {
    MixBus bus(test_loader, kSampleRate, 64);
    auto deck = bus.create_output();
    assert(deck->bind(track(1, "ramp")));
    assert(wait_loaded(*deck) == LoadState::Ready);
    assert(deck->play());

    std::vector<float> out(2 * 200);
    assert(bus.render(out.data(), 200) == 200);
    for (int i = 0; i < 200; ++i) {
        float expected = 0.5f * i / kSampleRate;
        assert_near(out[i * 2], expected, 1e-6f, "left");
        assert_near(out[i * 2 + 1], -expected, 1e-6f, "right");
    }
}

TEST(mix_bus_clock_and_lifetime) {
    MixBus bus(test_loader, kSampleRate);
    assert(bus.clock() == 0.0);

    std::vector<float> out(2 * 441);
    bus.render(out.data(), 441);
    assert_near(static_cast<float>(bus.clock()), 0.01f, 1e-7f, "one tick rendered");
    bus.render(out.data(), 441);
    assert_near(static_cast<float>(bus.clock()), 0.02f, 1e-7f, "two ticks rendered");

    OutputFactory factory = bus.factory();
    auto kept = factory();
    {
        auto dropped = factory();
        assert(bus.live_outputs() == 2);
    }
    assert(bus.live_outputs() == 1);
    assert(kept != nullptr);
}

/* ============================================================================
 * Main
 * ============================================================================ */

int main() {
    std::cout << "Segue Engine - Mixer Tests\n";
    std::cout << "==========================\n\n";

    std::cout << "--- Curves ---\n";
    RUN_TEST(curves_boundary_values);
    RUN_TEST(curves_clamp_progress);
    RUN_TEST(curves_monotonic_and_bounded);
    RUN_TEST(curves_shapes);
    RUN_TEST(curve_names_round_trip);

    std::cout << "\n--- Sessions ---\n";
    RUN_TEST(session_progress);
    RUN_TEST(session_pause_freezes_progress);
    RUN_TEST(session_zero_duration);

    std::cout << "\n--- Deck ---\n";
    RUN_TEST(deck_load_and_render);
    RUN_TEST(deck_rejects_empty_locator);
    RUN_TEST(deck_load_failures);
    RUN_TEST(deck_channel_conversion);
    RUN_TEST(deck_gain_ramp);
    RUN_TEST(deck_end_of_track);
    RUN_TEST(deck_seek_clamps);
    RUN_TEST(deck_stale_load_discarded);
    RUN_TEST(deck_destroyed_while_loading);

    std::cout << "\n--- Mix Bus ---\n";
    RUN_TEST(mix_bus_sums_playing_decks);
    RUN_TEST(mix_bus_clips);
    RUN_TEST(mix_bus_chunks_large_requests);
    RUN_TEST(mix_bus_clock_and_lifetime);

    std::cout << "\n";
    if (failed_tests > 0) {
        std::cout << failed_tests << " test(s) FAILED\n";
        return 1;
    }
    std::cout << "All mixer tests passed!\n";
    return 0;
}
