/**
 * Segue Engine - Public C API
 *
 * Crossfading and gapless playback between consecutive tracks, with
 * cached loudness, silence/fade and tempo analysis driving normalization
 * gain and trim points.
 */

#ifndef SEGUE_H
#define SEGUE_H

#ifdef __cplusplus
extern "C" {
#endif

#include <stdint.h>
#include <stddef.h>

/* ============================================================================
 * Types
 * ============================================================================ */

typedef struct SegueEngine SegueEngine;

typedef enum {
    SEGUE_OK = 0,
    SEGUE_ERROR_INVALID_ARGUMENT = -1,
    SEGUE_ERROR_FILE_NOT_FOUND = -2,
    SEGUE_ERROR_DECODE_FAILED = -3,
    SEGUE_ERROR_DATABASE_ERROR = -4,
    SEGUE_ERROR_PLAYBACK_ERROR = -5,
    SEGUE_ERROR_TRANSITION_REJECTED = -6,
    SEGUE_ERROR_DESTROYED = -7,
} SegueError;

typedef enum {
    SEGUE_CURVE_LINEAR = 0,
    SEGUE_CURVE_EQUAL_POWER = 1,
    SEGUE_CURVE_S_CURVE = 2,
    SEGUE_CURVE_LOGARITHMIC = 3,
    SEGUE_CURVE_EXPONENTIAL = 4,
} SegueCurve;

typedef enum {
    SEGUE_ENGINE_ERROR_LOAD = 0,
    SEGUE_ENGINE_ERROR_TRANSITION = 1,
    SEGUE_ENGINE_ERROR_PLAYBACK = 2,
} SegueEngineErrorKind;

/* Track reference */
typedef struct {
    int64_t id;
    const char* path;
    float duration;             /* seconds, 0 if unknown */
} SegueTrack;

/* Analysis result for one file */
typedef struct {
    float integrated_lufs;
    float short_term_lufs;
    float momentary_lufs;
    float loudness_range;
    float true_peak_db;
    float gain_adjustment_db;

    float start_silence;        /* seconds */
    float end_silence;
    float start_fade;
    float end_fade;
    int has_gapless_markers;
    int encoder_delay;          /* samples at 44.1 kHz */
    int encoder_padding;

    float bpm;
    float beat_confidence;
    int beat_count;
    int downbeat_count;
    char time_signature[8];     /* e.g. "4/4" */
    float first_downbeat;

    float trim_start;           /* seconds skipped at playback */
    float trim_end;

    int is_default;             /* analysis failed, defaults returned */
    int64_t computed_at;        /* Unix time, ms */
} SegueAnalysis;

typedef struct {
    int entries;
    int64_t total_size_bytes;
    int64_t oldest;             /* Unix time, ms */
    int64_t newest;
} SegueCacheStats;

/* Engine options; see segue_default_options() */
typedef struct {
    float crossfade_duration;   /* seconds */
    SegueCurve curve;
    float target_loudness;      /* LUFS */
    int true_peak_limiting;
    int beat_matching;
    float gapless_threshold_ms;
    int tick_interval_ms;
    int crossfade_enabled;      /* auto-advance crossfades, else gapless */
    int normalization_enabled;
    int trim_silence;
} SegueOptions;

/* Playback callbacks, invoked from segue_tick() */
typedef struct {
    void (*on_track_end)(int64_t track_id, void* user_data);
    void (*on_time_update)(double time, double duration, void* user_data);
    void (*on_crossfade_start)(int64_t next_track_id, void* user_data);
    void (*on_crossfade_complete)(int64_t current_track_id, void* user_data);
    void (*on_error)(SegueEngineErrorKind kind, const char* message, int64_t track_id, void* user_data);
    void* user_data;
} SegueCallbacks;

/* ============================================================================
 * Engine Lifecycle
 * ============================================================================ */

/**
 * Create a new engine instance.
 *
 * @param cache_db_path Path to the analysis cache database (created if
 *        missing), or NULL to run without a persistent cache
 * @return Engine instance, or NULL on failure
 */
SegueEngine* segue_create(const char* cache_db_path);

/**
 * Destroy an engine instance and free all resources.
 */
void segue_destroy(SegueEngine* engine);

/**
 * Get the last error message.
 */
const char* segue_get_error(SegueEngine* engine);

/* ============================================================================
 * Analysis
 * ============================================================================ */

/**
 * Analyze a file (or fetch it from the cache). Blocks until done.
 * A file that cannot be decoded yields defaults with is_default set.
 */
SegueError segue_analyze(SegueEngine* engine, const char* path, SegueAnalysis* out);

/**
 * Remove every cached analysis.
 */
SegueError segue_clear_cache(SegueEngine* engine);

SegueError segue_get_cache_stats(SegueEngine* engine, SegueCacheStats* out);

/* ============================================================================
 * Configuration
 * ============================================================================ */

SegueOptions segue_default_options(void);

SegueError segue_set_options(SegueEngine* engine, const SegueOptions* options);

void segue_set_callbacks(SegueEngine* engine, const SegueCallbacks* callbacks);

/* ============================================================================
 * Playback Control
 * ============================================================================ */

/**
 * Load a track into the active voice.
 * @param autoplay Start playing as soon as the track is ready
 */
SegueError segue_load_track(SegueEngine* engine, const SegueTrack* track, int autoplay);

/**
 * Prepare a track silently in the inactive voice.
 */
SegueError segue_preload_next_track(SegueEngine* engine, const SegueTrack* track);

/**
 * Set the track auto-advance moves to when the current one nears its end.
 * Pass NULL to clear it.
 */
SegueError segue_set_next_track(SegueEngine* engine, const SegueTrack* track);

/**
 * Start a crossfade into a track.
 * Returns SEGUE_ERROR_TRANSITION_REJECTED if a transition is in progress.
 */
SegueError segue_schedule_crossfade(SegueEngine* engine, const SegueTrack* next);

/**
 * Start a gapless transition into a track.
 */
SegueError segue_schedule_gapless(SegueEngine* engine, const SegueTrack* next);

SegueError segue_abort_crossfade(SegueEngine* engine);

SegueError segue_play(SegueEngine* engine);
SegueError segue_pause(SegueEngine* engine);
SegueError segue_seek(SegueEngine* engine, double position_seconds);
SegueError segue_set_volume(SegueEngine* engine, float volume);
SegueError segue_set_muted(SegueEngine* engine, int muted);

double segue_get_current_time(SegueEngine* engine);
double segue_get_current_duration(SegueEngine* engine);
int segue_is_playing(SegueEngine* engine);
int segue_is_transitioning(SegueEngine* engine);

/**
 * Whether the inactive voice holds a loaded track ready to start.
 */
int segue_is_next_ready(SegueEngine* engine);

/**
 * Run scheduled work: load completion, fades, auto-advance, callbacks.
 * Call from the control thread every tick_interval_ms.
 */
void segue_tick(SegueEngine* engine);

/* ============================================================================
 * Audio Rendering
 * ============================================================================ */

/**
 * Render audio frames to a buffer. May be called from an audio thread.
 *
 * @param engine Engine instance
 * @param buffer Output buffer (interleaved stereo float32)
 * @param frames Number of frames to render
 * @return Number of frames rendered
 */
int segue_render(SegueEngine* engine, float* buffer, int frames);

/**
 * Get the sample rate used by the engine.
 */
int segue_get_sample_rate(SegueEngine* engine);

#ifdef __cplusplus
}
#endif

#endif /* SEGUE_H */
