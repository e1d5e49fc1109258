/**
 * Segue Engine - C API Implementation
 */

#include "segue/segue.h"
#include "../core/analysis_service.h"
#include "../core/utils.h"
#include "../decoder/decoder.h"
#include "../analyzer/silence_detector.h"
#include "../mixer/crossfade_engine.h"
#include "../mixer/mix_bus.h"
#include <algorithm>
#include <cstring>
#include <memory>
#include <optional>
#include <string>

using namespace segue;

/* ============================================================================
 * Internal Structures
 * ============================================================================ */

struct SegueEngine {
    std::shared_ptr<Decoder> decoder;
    std::shared_ptr<AnalysisService> analysis;
    std::unique_ptr<MixBus> mix_bus;
    std::unique_ptr<CrossfadeEngine> engine;

    std::optional<TrackRef> next_track;
    SegueCallbacks callbacks{};
    std::string last_error;
};

namespace {

constexpr int kSampleRate = 44100;

TrackRef to_track_ref(const SegueTrack& track) {
    TrackRef ref;
    ref.id = track.id;
    ref.locator = track.path ? track.path : "";
    ref.duration = track.duration;
    return ref;
}

bool valid_track(const SegueTrack* track) {
    return track && track->path && track->path[0] != '\0';
}

SegueError check_engine(SegueEngine* engine) {
    if (!engine || !engine->engine) return SEGUE_ERROR_INVALID_ARGUMENT;
    if (engine->engine->is_destroyed()) return SEGUE_ERROR_DESTROYED;
    return SEGUE_OK;
}

void install_callbacks(SegueEngine* handle) {
    EngineCallbacks callbacks;

    callbacks.on_track_end = [handle](const TrackRef& track) {
        if (handle->callbacks.on_track_end) {
            handle->callbacks.on_track_end(track.id, handle->callbacks.user_data);
        }
    };
    callbacks.on_time_update = [handle](double time, double duration) {
        if (handle->callbacks.on_time_update) {
            handle->callbacks.on_time_update(time, duration, handle->callbacks.user_data);
        }
    };
    callbacks.on_crossfade_start = [handle](const TrackRef& next) {
        if (handle->callbacks.on_crossfade_start) {
            handle->callbacks.on_crossfade_start(next.id, handle->callbacks.user_data);
        }
    };
    callbacks.on_crossfade_complete = [handle](const TrackRef& current) {
        if (handle->callbacks.on_crossfade_complete) {
            handle->callbacks.on_crossfade_complete(current.id, handle->callbacks.user_data);
        }
    };
    callbacks.on_error = [handle](const EngineError& error) {
        handle->last_error = error.message;
        if (handle->callbacks.on_error) {
            handle->callbacks.on_error(static_cast<SegueEngineErrorKind>(error.kind),
                                       error.message.c_str(), error.track_id,
                                       handle->callbacks.user_data);
        }
    };

    handle->engine->set_callbacks(std::move(callbacks));
}

} // anonymous namespace

/* ============================================================================
 * Engine Lifecycle
 * ============================================================================ */

SegueEngine* segue_create(const char* cache_db_path) {
    auto handle = new SegueEngine();
    handle->decoder = std::make_shared<Decoder>();

    std::shared_ptr<Decoder> decoder = handle->decoder;

    AnalysisServiceConfig config;
    config.cache_path = cache_db_path ? cache_db_path : "";
    handle->analysis = std::make_shared<AnalysisService>(config, [decoder](const std::string& path) {
        return decoder->decode(path);
    });

    handle->mix_bus = std::make_unique<MixBus>([decoder](const std::string& path) {
        DecodeOptions options;
        options.sample_rate = kSampleRate;
        options.channels = 2;
        return decoder->decode(path, options);
    }, kSampleRate);

    MixBus* bus = handle->mix_bus.get();
    handle->engine = std::make_unique<CrossfadeEngine>(bus->factory(), [bus]() { return bus->clock(); });

    std::weak_ptr<AnalysisService> weak_analysis = handle->analysis;
    handle->engine->set_enhancement_provider([weak_analysis](const TrackRef& track) {
        if (auto service = weak_analysis.lock()) {
            return service->analyze_async(track.locator);
        }
        return std::shared_future<AnalysisResult>();
    });
    handle->engine->set_next_track_provider([handle]() {
        std::optional<TrackRef> next = handle->next_track;
        handle->next_track.reset();
        return next;
    });
    install_callbacks(handle);

    if (cache_db_path && !handle->analysis->has_store()) {
        handle->last_error = std::string("Failed to open cache database: ") + cache_db_path;
        delete handle;
        return nullptr;
    }

    return handle;
}

void segue_destroy(SegueEngine* engine) {
    if (!engine) return;
    if (engine->engine) {
        engine->engine->destroy();
    }
    delete engine;
}

const char* segue_get_error(SegueEngine* engine) {
    if (!engine) return "Invalid engine";
    return engine->last_error.c_str();
}

/* ============================================================================
 * Analysis
 * ============================================================================ */

SegueError segue_analyze(SegueEngine* engine, const char* path, SegueAnalysis* out) {
    if (!engine || !engine->analysis || !path || !out) return SEGUE_ERROR_INVALID_ARGUMENT;

    if (!utils::file_identity(path)) {
        engine->last_error = std::string("File not found: ") + path;
        return SEGUE_ERROR_FILE_NOT_FOUND;
    }

    AnalysisResult result = engine->analysis->analyze(path);

    float duration = 0.0f;
    auto info = engine->decoder->probe(path);
    if (info.ok()) {
        duration = info.value().duration;
    }
    TrimPoints trim = compute_trim_points(result.silence, duration);

    std::memset(out, 0, sizeof(SegueAnalysis));
    out->integrated_lufs = result.loudness.integrated;
    out->short_term_lufs = result.loudness.short_term;
    out->momentary_lufs = result.loudness.momentary;
    out->loudness_range = result.loudness.loudness_range;
    out->true_peak_db = result.loudness.true_peak;
    out->gain_adjustment_db = result.loudness.gain_adjustment;

    out->start_silence = result.silence.start_silence;
    out->end_silence = result.silence.end_silence;
    out->start_fade = result.silence.start_fade;
    out->end_fade = result.silence.end_fade;
    out->has_gapless_markers = result.silence.has_gapless_markers ? 1 : 0;
    out->encoder_delay = result.silence.encoder_delay;
    out->encoder_padding = result.silence.encoder_padding;

    out->bpm = result.beats.bpm;
    out->beat_confidence = result.beats.confidence;
    out->beat_count = static_cast<int>(result.beats.beats.size());
    out->downbeat_count = static_cast<int>(result.beats.downbeats.size());
    std::strncpy(out->time_signature, result.beats.time_signature.c_str(),
                 sizeof(out->time_signature) - 1);
    out->first_downbeat = result.beats.first_downbeat;

    out->trim_start = trim.start;
    out->trim_end = trim.end;

    out->is_default = result.is_default() ? 1 : 0;
    out->computed_at = result.computed_at;

    if (result.is_default()) {
        engine->last_error = std::string("Analysis failed, defaults returned: ") + path;
        return SEGUE_ERROR_DECODE_FAILED;
    }
    return SEGUE_OK;
}

SegueError segue_clear_cache(SegueEngine* engine) {
    if (!engine || !engine->analysis) return SEGUE_ERROR_INVALID_ARGUMENT;
    if (!engine->analysis->clear_cache()) {
        engine->last_error = "Failed to clear analysis cache";
        return SEGUE_ERROR_DATABASE_ERROR;
    }
    return SEGUE_OK;
}

SegueError segue_get_cache_stats(SegueEngine* engine, SegueCacheStats* out) {
    if (!engine || !engine->analysis || !out) return SEGUE_ERROR_INVALID_ARGUMENT;

    CacheStats stats = engine->analysis->cache_stats();
    out->entries = stats.entries;
    out->total_size_bytes = stats.total_size_bytes;
    out->oldest = stats.oldest;
    out->newest = stats.newest;
    return SEGUE_OK;
}

/* ============================================================================
 * Configuration
 * ============================================================================ */

SegueOptions segue_default_options(void) {
    EngineOptions defaults;

    SegueOptions options;
    options.crossfade_duration = defaults.crossfade_duration;
    options.curve = static_cast<SegueCurve>(defaults.curve);
    options.target_loudness = defaults.target_loudness;
    options.true_peak_limiting = defaults.true_peak_limiting ? 1 : 0;
    options.beat_matching = defaults.beat_matching ? 1 : 0;
    options.gapless_threshold_ms = defaults.gapless_threshold_ms;
    options.tick_interval_ms = defaults.tick_interval_ms;
    options.crossfade_enabled = defaults.crossfade_enabled ? 1 : 0;
    options.normalization_enabled = defaults.normalization_enabled ? 1 : 0;
    options.trim_silence = defaults.trim_silence ? 1 : 0;
    return options;
}

SegueError segue_set_options(SegueEngine* engine, const SegueOptions* options) {
    SegueError status = check_engine(engine);
    if (status != SEGUE_OK) return status;
    if (!options) return SEGUE_ERROR_INVALID_ARGUMENT;
    if (options->curve < SEGUE_CURVE_LINEAR || options->curve > SEGUE_CURVE_EXPONENTIAL) {
        engine->last_error = "Unknown crossfade curve";
        return SEGUE_ERROR_INVALID_ARGUMENT;
    }

    EngineOptions cpp_options = engine->engine->options();
    cpp_options.crossfade_duration = options->crossfade_duration;
    cpp_options.curve = static_cast<CrossfadeCurve>(options->curve);
    cpp_options.target_loudness = options->target_loudness;
    cpp_options.true_peak_limiting = options->true_peak_limiting != 0;
    cpp_options.beat_matching = options->beat_matching != 0;
    cpp_options.gapless_threshold_ms = options->gapless_threshold_ms;
    cpp_options.tick_interval_ms = options->tick_interval_ms;
    cpp_options.crossfade_enabled = options->crossfade_enabled != 0;
    cpp_options.normalization_enabled = options->normalization_enabled != 0;
    cpp_options.trim_silence = options->trim_silence != 0;

    engine->engine->set_options(cpp_options);
    return SEGUE_OK;
}

void segue_set_callbacks(SegueEngine* engine, const SegueCallbacks* callbacks) {
    if (!engine) return;
    if (callbacks) {
        engine->callbacks = *callbacks;
    } else {
        engine->callbacks = SegueCallbacks{};
    }
}

/* ============================================================================
 * Playback Control
 * ============================================================================ */

SegueError segue_load_track(SegueEngine* engine, const SegueTrack* track, int autoplay) {
    SegueError status = check_engine(engine);
    if (status != SEGUE_OK) return status;
    if (!valid_track(track)) return SEGUE_ERROR_INVALID_ARGUMENT;

    LoadOptions options;
    options.autoplay = autoplay != 0;
    if (!engine->engine->load_track(to_track_ref(*track), options)) {
        engine->last_error = std::string("Failed to load ") + track->path;
        return SEGUE_ERROR_PLAYBACK_ERROR;
    }
    return SEGUE_OK;
}

SegueError segue_preload_next_track(SegueEngine* engine, const SegueTrack* track) {
    SegueError status = check_engine(engine);
    if (status != SEGUE_OK) return status;
    if (!valid_track(track)) return SEGUE_ERROR_INVALID_ARGUMENT;

    if (!engine->engine->preload_next_track(to_track_ref(*track))) {
        engine->last_error = std::string("Failed to preload ") + track->path;
        return SEGUE_ERROR_PLAYBACK_ERROR;
    }
    return SEGUE_OK;
}

SegueError segue_set_next_track(SegueEngine* engine, const SegueTrack* track) {
    SegueError status = check_engine(engine);
    if (status != SEGUE_OK) return status;

    if (!track) {
        engine->next_track.reset();
        return SEGUE_OK;
    }
    if (!valid_track(track)) return SEGUE_ERROR_INVALID_ARGUMENT;
    engine->next_track = to_track_ref(*track);
    return SEGUE_OK;
}

SegueError segue_schedule_crossfade(SegueEngine* engine, const SegueTrack* next) {
    SegueError status = check_engine(engine);
    if (status != SEGUE_OK) return status;
    if (!valid_track(next)) return SEGUE_ERROR_INVALID_ARGUMENT;

    auto result = engine->engine->schedule_crossfade(to_track_ref(*next));
    if (result.failed()) {
        engine->last_error = result.error();
        return SEGUE_ERROR_TRANSITION_REJECTED;
    }
    return SEGUE_OK;
}

SegueError segue_schedule_gapless(SegueEngine* engine, const SegueTrack* next) {
    SegueError status = check_engine(engine);
    if (status != SEGUE_OK) return status;
    if (!valid_track(next)) return SEGUE_ERROR_INVALID_ARGUMENT;

    auto result = engine->engine->schedule_gapless_transition(to_track_ref(*next));
    if (result.failed()) {
        engine->last_error = result.error();
        return SEGUE_ERROR_TRANSITION_REJECTED;
    }
    return SEGUE_OK;
}

SegueError segue_abort_crossfade(SegueEngine* engine) {
    SegueError status = check_engine(engine);
    if (status != SEGUE_OK) return status;
    engine->engine->abort_crossfade();
    return SEGUE_OK;
}

SegueError segue_play(SegueEngine* engine) {
    SegueError status = check_engine(engine);
    if (status != SEGUE_OK) return status;
    engine->engine->play();
    return SEGUE_OK;
}

SegueError segue_pause(SegueEngine* engine) {
    SegueError status = check_engine(engine);
    if (status != SEGUE_OK) return status;
    engine->engine->pause();
    return SEGUE_OK;
}

SegueError segue_seek(SegueEngine* engine, double position_seconds) {
    SegueError status = check_engine(engine);
    if (status != SEGUE_OK) return status;
    engine->engine->seek(position_seconds);
    return SEGUE_OK;
}

SegueError segue_set_volume(SegueEngine* engine, float volume) {
    SegueError status = check_engine(engine);
    if (status != SEGUE_OK) return status;
    engine->engine->set_volume(volume);
    return SEGUE_OK;
}

SegueError segue_set_muted(SegueEngine* engine, int muted) {
    SegueError status = check_engine(engine);
    if (status != SEGUE_OK) return status;
    engine->engine->set_muted(muted != 0);
    return SEGUE_OK;
}

double segue_get_current_time(SegueEngine* engine) {
    if (check_engine(engine) != SEGUE_OK) return 0.0;
    return engine->engine->current_time();
}

double segue_get_current_duration(SegueEngine* engine) {
    if (check_engine(engine) != SEGUE_OK) return 0.0;
    return engine->engine->current_duration();
}

int segue_is_playing(SegueEngine* engine) {
    if (check_engine(engine) != SEGUE_OK) return 0;
    return engine->engine->is_playing() ? 1 : 0;
}

int segue_is_transitioning(SegueEngine* engine) {
    if (check_engine(engine) != SEGUE_OK) return 0;
    return engine->engine->is_transitioning() ? 1 : 0;
}

int segue_is_next_ready(SegueEngine* engine) {
    if (check_engine(engine) != SEGUE_OK) return 0;
    int next = 1 - engine->engine->active_voice();
    return engine->engine->voice_state(next) == VoiceState::Ready ? 1 : 0;
}

void segue_tick(SegueEngine* engine) {
    if (check_engine(engine) != SEGUE_OK) return;
    engine->engine->tick();
}

/* ============================================================================
 * Audio Rendering
 * ============================================================================ */

int segue_render(SegueEngine* engine, float* buffer, int frames) {
    if (!engine || !engine->mix_bus || !buffer || frames <= 0) return 0;
    return engine->mix_bus->render(buffer, frames);
}

int segue_get_sample_rate(SegueEngine* engine) {
    if (!engine || !engine->mix_bus) return kSampleRate;
    return engine->mix_bus->sample_rate();
}
