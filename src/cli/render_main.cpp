/**
 * Segue CLI - Transition Renderer
 *
 * Renders the transition from one track into another to a WAV file, so a
 * crossfade or gapless hand-off can be checked without listening to both
 * tracks in full.
 *
 * Usage: segue-render [options] <track_a> <track_b> [output.wav]
 */

#include "segue/segue.h"
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

// Simple WAV header structure
#pragma pack(push, 1)
struct WAVHeader {
    char riff[4] = {'R', 'I', 'F', 'F'};
    uint32_t chunk_size;
    char wave[4] = {'W', 'A', 'V', 'E'};
    char fmt[4] = {'f', 'm', 't', ' '};
    uint32_t fmt_size = 16;
    uint16_t audio_format = 1; // PCM
    uint16_t num_channels = 2;
    uint32_t sample_rate = 44100;
    uint32_t byte_rate;
    uint16_t block_align;
    uint16_t bits_per_sample = 16;
    char data[4] = {'d', 'a', 't', 'a'};
    uint32_t data_size;
};
#pragma pack(pop)

bool write_wav(const std::string& filename, const std::vector<float>& samples, int sample_rate) {
    WAVHeader header;
    header.sample_rate = sample_rate;
    header.byte_rate = sample_rate * 2 * 2;
    header.block_align = 4;
    header.data_size = static_cast<uint32_t>(samples.size() * 2);
    header.chunk_size = header.data_size + 36;

    std::ofstream file(filename, std::ios::binary);
    if (!file) return false;
    file.write(reinterpret_cast<char*>(&header), sizeof(header));

    for (float s : samples) {
        // Clamp and convert to int16
        if (s > 1.0f) s = 1.0f;
        if (s < -1.0f) s = -1.0f;
        int16_t pcm = static_cast<int16_t>(s * 32767.0f);
        file.write(reinterpret_cast<char*>(&pcm), sizeof(pcm));
    }
    return static_cast<bool>(file);
}

struct RenderProgress {
    bool started = false;
    bool finished = false;
    bool track_ended = false;
    bool failed = false;
};

void on_crossfade_start(int64_t next_track_id, void* user_data) {
    auto* progress = static_cast<RenderProgress*>(user_data);
    progress->started = true;
    std::cout << "Transition into track " << next_track_id << " started...\n";
}

void on_crossfade_complete(int64_t current_track_id, void* user_data) {
    auto* progress = static_cast<RenderProgress*>(user_data);
    progress->finished = true;
    std::cout << "Transition finished, track " << current_track_id << " is active.\n";
}

void on_track_end(int64_t track_id, void* user_data) {
    auto* progress = static_cast<RenderProgress*>(user_data);
    progress->track_ended = true;
    std::cout << "Track " << track_id << " ended without a transition.\n";
}

void on_error(SegueEngineErrorKind kind, const char* message, int64_t track_id, void* user_data) {
    auto* progress = static_cast<RenderProgress*>(user_data);
    progress->failed = true;
    std::cerr << "Engine error (" << static_cast<int>(kind) << ") on track " << track_id
              << ": " << message << "\n";
}

bool parse_curve(const char* name, SegueCurve& curve) {
    if (strcmp(name, "linear") == 0) curve = SEGUE_CURVE_LINEAR;
    else if (strcmp(name, "equalPower") == 0) curve = SEGUE_CURVE_EQUAL_POWER;
    else if (strcmp(name, "sCurve") == 0) curve = SEGUE_CURVE_S_CURVE;
    else if (strcmp(name, "logarithmic") == 0) curve = SEGUE_CURVE_LOGARITHMIC;
    else if (strcmp(name, "exponential") == 0) curve = SEGUE_CURVE_EXPONENTIAL;
    else return false;
    return true;
}

// Tick the engine without rendering until `done` holds or `seconds` of wall time pass
template<typename Pred>
bool wait_for(SegueEngine* engine, Pred done, int seconds) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(seconds);
    while (std::chrono::steady_clock::now() < deadline) {
        segue_tick(engine);
        if (done()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return false;
}

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [options] <track_a> <track_b> [output.wav]\n"
              << "\nOptions:\n"
              << "  -d, --database <path>  Cache database path (default: segue_cache.db)\n"
              << "  -c, --crossfade <sec>  Crossfade duration (default: 5)\n"
              << "      --curve <name>     linear, equalPower, sCurve, logarithmic, exponential\n"
              << "      --gapless          Gapless hand-off instead of a crossfade\n"
              << "  -h, --help             Show this help\n";
}

int main(int argc, char* argv[]) {
    std::string db_path = "segue_cache.db";
    std::vector<std::string> positional;
    SegueOptions options = segue_default_options();

    // Parse arguments
    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (strcmp(argv[i], "-d") == 0 || strcmp(argv[i], "--database") == 0) {
            if (i + 1 >= argc) {
                std::cerr << "Error: -d requires a path argument\n";
                return 1;
            }
            db_path = argv[++i];
        } else if (strcmp(argv[i], "-c") == 0 || strcmp(argv[i], "--crossfade") == 0) {
            if (i + 1 >= argc) {
                std::cerr << "Error: -c requires a duration\n";
                return 1;
            }
            options.crossfade_duration = static_cast<float>(std::atof(argv[++i]));
        } else if (strcmp(argv[i], "--curve") == 0) {
            if (i + 1 >= argc || !parse_curve(argv[i + 1], options.curve)) {
                std::cerr << "Error: --curve requires one of linear, equalPower, sCurve, "
                             "logarithmic, exponential\n";
                return 1;
            }
            ++i;
        } else if (strcmp(argv[i], "--gapless") == 0) {
            options.crossfade_enabled = 0;
        } else if (argv[i][0] != '-') {
            positional.push_back(argv[i]);
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (positional.size() < 2) {
        print_usage(argv[0]);
        return 1;
    }
    std::string output_file = positional.size() > 2 ? positional[2] : "transition_preview.wav";

    SegueEngine* engine = segue_create(db_path.c_str());
    if (!engine) {
        std::cerr << "Error: Failed to create engine\n";
        return 1;
    }

    RenderProgress progress;
    SegueCallbacks callbacks = {};
    callbacks.on_crossfade_start = on_crossfade_start;
    callbacks.on_crossfade_complete = on_crossfade_complete;
    callbacks.on_track_end = on_track_end;
    callbacks.on_error = on_error;
    callbacks.user_data = &progress;
    segue_set_callbacks(engine, &callbacks);

    if (segue_set_options(engine, &options) != SEGUE_OK) {
        std::cerr << "Error: " << segue_get_error(engine) << "\n";
        segue_destroy(engine);
        return 1;
    }

    SegueTrack track_a = {1, positional[0].c_str(), 0.0f};
    SegueTrack track_b = {2, positional[1].c_str(), 0.0f};

    // Load both tracks before the mix clock starts so that decoding time
    // does not count against the engine's timeouts
    std::cout << "Loading " << track_a.path << "...\n";
    if (segue_load_track(engine, &track_a, 1) != SEGUE_OK ||
        !wait_for(engine, [&]() { return segue_is_playing(engine) != 0 || progress.failed; }, 60) ||
        progress.failed) {
        std::cerr << "Error: Failed to load " << track_a.path << ": " << segue_get_error(engine) << "\n";
        segue_destroy(engine);
        return 1;
    }

    std::cout << "Loading " << track_b.path << "...\n";
    if (segue_preload_next_track(engine, &track_b) != SEGUE_OK ||
        !wait_for(engine, [&]() { return segue_is_next_ready(engine) != 0 || progress.failed; }, 60) ||
        progress.failed) {
        std::cerr << "Error: Failed to load " << track_b.path << ": " << segue_get_error(engine) << "\n";
        segue_destroy(engine);
        return 1;
    }

    // Start 10 seconds before the transition begins
    double duration = segue_get_current_duration(engine);
    double lead = 10.0 + (options.crossfade_enabled ? options.crossfade_duration : 0.0);
    segue_seek(engine, duration > lead ? duration - lead : 0.0);
    segue_set_next_track(engine, &track_b);

    int sample_rate = segue_get_sample_rate(engine);
    int chunk = sample_rate * options.tick_interval_ms / 1000;
    if (chunk <= 0) chunk = 441;

    std::vector<float> captured_audio;
    std::vector<float> buffer(static_cast<size_t>(chunk) * 2);

    int frames_after_transition = 0;
    const int max_frames_after = 10 * sample_rate;
    const long long timeout_frames = 180LL * sample_rate;
    long long total_rendered = 0;

    std::cout << "Rendering transition...\n";
    while (total_rendered < timeout_frames) {
        segue_tick(engine);
        if (progress.failed || progress.track_ended) break;

        int rendered = segue_render(engine, buffer.data(), chunk);
        if (rendered <= 0) break;
        captured_audio.insert(captured_audio.end(), buffer.begin(), buffer.begin() + rendered * 2);
        total_rendered += rendered;

        if (progress.finished) {
            frames_after_transition += rendered;
            if (frames_after_transition >= max_frames_after) break;
        }
    }

    int status = 0;
    if (!progress.finished) {
        std::cerr << "Warning: the transition did not complete\n";
        status = 1;
    }

    if (captured_audio.empty()) {
        std::cerr << "Error: No audio captured.\n";
        status = 1;
    } else {
        std::cout << "Writing " << captured_audio.size() / (2.0 * sample_rate) << " seconds to "
                  << output_file << "\n";
        if (!write_wav(output_file, captured_audio, sample_rate)) {
            std::cerr << "Error: Failed to write " << output_file << "\n";
            status = 1;
        }
    }

    segue_destroy(engine);
    return status;
}
