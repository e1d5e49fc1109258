/**
 * Segue Engine - C API Tests
 * Exercises the public C interface without real media files
 */

#include "segue/segue.h"

#include <iostream>
#include <cassert>
#include <cmath>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

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

// A file that no demuxer will accept
static std::string write_garbage(const std::string& name) {
    fs::path path = fs::temp_directory_path() / name;
    std::ofstream out(path, std::ios::binary);
    out << "this is definitely not an audio stream, just some text\n";
    return path.string();
}

struct ErrorLog {
    int count = 0;
    SegueEngineErrorKind last_kind = SEGUE_ENGINE_ERROR_TRANSITION;
    int64_t last_track = 0;
};

static void record_error(SegueEngineErrorKind kind, const char*, int64_t track_id, void* user_data) {
    auto* log = static_cast<ErrorLog*>(user_data);
    log->count++;
    log->last_kind = kind;
    log->last_track = track_id;
}

/* ============================================================================
 * Lifecycle & Configuration
 * ============================================================================ */

TEST(create_without_cache) {
    SegueEngine* engine = segue_create(nullptr);
    assert(engine != nullptr);
    assert(segue_get_sample_rate(engine) == 44100);
    assert(segue_is_playing(engine) == 0);
    assert(segue_is_transitioning(engine) == 0);
    assert(segue_get_current_time(engine) == 0.0);

    SegueCacheStats stats;
    assert(segue_get_cache_stats(engine, &stats) == SEGUE_OK);
    assert(stats.entries == 0);
    assert(segue_clear_cache(engine) == SEGUE_OK);

    segue_destroy(engine);
    segue_destroy(nullptr);
}

TEST(create_with_cache) {
    SegueEngine* engine = segue_create(":memory:");
    assert(engine != nullptr);
    segue_destroy(engine);

    assert(segue_create("/nonexistent-dir/segue/cache.db") == nullptr);
}

TEST(default_options) {
    SegueOptions options = segue_default_options();
    assert_near(options.crossfade_duration, 5.0f, 1e-6f, "crossfade");
    assert(options.curve == SEGUE_CURVE_S_CURVE);
    assert_near(options.target_loudness, -16.0f, 1e-6f, "target");
    assert(options.true_peak_limiting == 1);
    assert(options.beat_matching == 0);
    assert_near(options.gapless_threshold_ms, 50.0f, 1e-6f, "gapless threshold");
    assert(options.tick_interval_ms == 10);
    assert(options.crossfade_enabled == 1);
    assert(options.normalization_enabled == 1);
    assert(options.trim_silence == 1);
}

TEST(set_options_validation) {
    SegueEngine* engine = segue_create(nullptr);

    SegueOptions options = segue_default_options();
    options.curve = SEGUE_CURVE_LINEAR;
    options.crossfade_duration = 8.0f;
    assert(segue_set_options(engine, &options) == SEGUE_OK);

    options.curve = static_cast<SegueCurve>(7);
    assert(segue_set_options(engine, &options) == SEGUE_ERROR_INVALID_ARGUMENT);
    assert(std::strlen(segue_get_error(engine)) > 0);

    assert(segue_set_options(engine, nullptr) == SEGUE_ERROR_INVALID_ARGUMENT);
    assert(segue_set_options(nullptr, &options) == SEGUE_ERROR_INVALID_ARGUMENT);

    segue_destroy(engine);
}

/* ============================================================================
 * Analysis
 * ============================================================================ */

TEST(analyze_missing_file) {
    SegueEngine* engine = segue_create(nullptr);
    SegueAnalysis analysis;
    assert(segue_analyze(engine, "/nonexistent/segue/track.flac", &analysis) == SEGUE_ERROR_FILE_NOT_FOUND);
    assert(segue_analyze(engine, nullptr, &analysis) == SEGUE_ERROR_INVALID_ARGUMENT);
    segue_destroy(engine);
}

TEST(analyze_undecodable_file) {
    std::string path = write_garbage("segue_api_garbage.flac");
    SegueEngine* engine = segue_create(":memory:");

    SegueAnalysis analysis;
    assert(segue_analyze(engine, path.c_str(), &analysis) == SEGUE_ERROR_DECODE_FAILED);
    assert(analysis.is_default == 1);
    assert_near(analysis.integrated_lufs, -23.0f, 1e-6f, "default loudness");
    assert_near(analysis.bpm, 120.0f, 1e-6f, "default bpm");
    assert(std::string(analysis.time_signature) == "4/4");
    assert(analysis.trim_start == 0.0f);

    SegueCacheStats stats;
    assert(segue_get_cache_stats(engine, &stats) == SEGUE_OK);
    assert(stats.entries == 0);

    segue_destroy(engine);
    fs::remove(path);
}

/* ============================================================================
 * Playback
 * ============================================================================ */

TEST(transport_argument_checks) {
    SegueEngine* engine = segue_create(nullptr);

    SegueTrack track{1, "/music/a.flac", 0.0f};
    SegueTrack no_path{2, nullptr, 0.0f};

    assert(segue_load_track(engine, nullptr, 1) == SEGUE_ERROR_INVALID_ARGUMENT);
    assert(segue_load_track(engine, &no_path, 1) == SEGUE_ERROR_INVALID_ARGUMENT);
    assert(segue_schedule_crossfade(engine, &track) == SEGUE_ERROR_TRANSITION_REJECTED);
    assert(segue_schedule_gapless(engine, &track) == SEGUE_ERROR_TRANSITION_REJECTED);
    assert(segue_schedule_crossfade(engine, nullptr) == SEGUE_ERROR_INVALID_ARGUMENT);

    assert(segue_set_next_track(engine, &track) == SEGUE_OK);
    assert(segue_set_next_track(engine, nullptr) == SEGUE_OK);

    assert(segue_play(engine) == SEGUE_OK);
    assert(segue_pause(engine) == SEGUE_OK);
    assert(segue_seek(engine, 10.0) == SEGUE_OK);
    assert(segue_set_volume(engine, 0.5f) == SEGUE_OK);
    assert(segue_set_muted(engine, 1) == SEGUE_OK);
    assert(segue_abort_crossfade(engine) == SEGUE_OK);
    assert(segue_is_next_ready(engine) == 0);

    assert(segue_play(nullptr) == SEGUE_ERROR_INVALID_ARGUMENT);

    segue_destroy(engine);
}

TEST(load_failure_reported_on_tick) {
    std::string path = write_garbage("segue_api_broken.mp3");
    SegueEngine* engine = segue_create(nullptr);

    ErrorLog log;
    SegueCallbacks callbacks{};
    callbacks.on_error = record_error;
    callbacks.user_data = &log;
    segue_set_callbacks(engine, &callbacks);

    SegueTrack track{7, path.c_str(), 0.0f};
    assert(segue_load_track(engine, &track, 1) == SEGUE_OK);

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (log.count == 0 && std::chrono::steady_clock::now() < deadline) {
        segue_tick(engine);
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    assert(log.count == 1);
    assert(log.last_kind == SEGUE_ENGINE_ERROR_LOAD);
    assert(log.last_track == 7);
    assert(segue_is_playing(engine) == 0);

    segue_destroy(engine);
    fs::remove(path);
}

TEST(render_without_tracks_is_silent) {
    SegueEngine* engine = segue_create(nullptr);

    std::vector<float> buffer(2 * 441, 0.5f);
    assert(segue_render(engine, buffer.data(), 441) == 441);
    for (float v : buffer) assert(v == 0.0f);

    assert(segue_render(engine, nullptr, 441) == 0);
    assert(segue_render(engine, buffer.data(), 0) == 0);
    assert(segue_render(nullptr, buffer.data(), 441) == 0);

    segue_destroy(engine);
}

/* ============================================================================
 * Main
 * ============================================================================ */

int main() {
    std::cout << "Segue Engine - C API Tests\n";
    std::cout << "==========================\n\n";

    std::cout << "--- Lifecycle & Configuration ---\n";
    RUN_TEST(create_without_cache);
    RUN_TEST(create_with_cache);
    RUN_TEST(default_options);
    RUN_TEST(set_options_validation);

    std::cout << "\n--- Analysis ---\n";
    RUN_TEST(analyze_missing_file);
    RUN_TEST(analyze_undecodable_file);

    std::cout << "\n--- Playback ---\n";
    RUN_TEST(transport_argument_checks);
    RUN_TEST(load_failure_reported_on_tick);
    RUN_TEST(render_without_tracks_is_silent);

    std::cout << "\n";
    if (failed_tests > 0) {
        std::cout << failed_tests << " test(s) FAILED\n";
        return 1;
    }
    std::cout << "All C API tests passed!\n";
    return 0;
}
