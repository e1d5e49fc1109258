/**
 * Segue Engine - Dual-Voice Crossfade Engine
 */

#ifndef SEGUE_CROSSFADE_ENGINE_H
#define SEGUE_CROSSFADE_ENGINE_H

#include "segue/types.h"
#include "voice_output.h"
#include "crossfader.h"
#include <array>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>

namespace segue {

/**
 * Playback-path failure, reported once through EngineCallbacks::on_error.
 */
struct EngineError {
    enum class Kind {
        Load,           // A track could not be loaded
        Transition,     // The next track was not ready in time or refused to play
        Playback        // The active voice refused to play
    };

    Kind kind = Kind::Load;
    std::string message;
    int64_t track_id = 0;
};

/**
 * Callbacks are invoked from tick() and the control methods, never from
 * the audio thread. They are dropped by destroy().
 */
struct EngineCallbacks {
    std::function<void(const TrackRef& track)> on_track_end;
    std::function<void(double time, double duration)> on_time_update;
    std::function<void(const TrackRef& next)> on_crossfade_start;
    std::function<void(const TrackRef& current)> on_crossfade_complete;
    std::function<void(const EngineError& error)> on_error;
};

struct LoadOptions {
    bool autoplay = false;
    bool enhance = true;                // Request analysis for gain and trim
};

/**
 * Monotonic time source in seconds.
 */
using Clock = std::function<double()>;

/**
 * Supplies analysis for a track. The engine waits for the result at most
 * EngineOptions::analysis_wait seconds after the voice becomes ready.
 */
using EnhancementProvider = std::function<std::shared_future<AnalysisResult>(const TrackRef& track)>;

/**
 * Supplies the upcoming queue item for auto-advance, or nothing at the
 * end of the queue. Called once per track boundary.
 */
using NextTrackProvider = std::function<std::optional<TrackRef>()>;

/**
 * Two playback voices and the transitions between them.
 *
 * Exactly one voice is active at any time; only the active voice is
 * audible outside a transition and only it reports transport position.
 * The inactive voice preloads silently and becomes active when a
 * crossfade or gapless transition completes.
 *
 * The engine is single-threaded: every method, including tick(), must be
 * called from the same control thread. tick() should run every
 * tick_interval_ms; it resolves loads, advances the fade, drives
 * auto-advance and emits time updates.
 */
class CrossfadeEngine {
public:
    CrossfadeEngine(OutputFactory factory, Clock clock, EngineOptions options = EngineOptions());
    ~CrossfadeEngine();

    // Non-copyable
    CrossfadeEngine(const CrossfadeEngine&) = delete;
    CrossfadeEngine& operator=(const CrossfadeEngine&) = delete;

    /* ========================================================================
     * Configuration
     * ======================================================================== */

    void set_callbacks(EngineCallbacks callbacks);
    void set_enhancement_provider(EnhancementProvider provider);
    void set_next_track_provider(NextTrackProvider provider);

    void set_options(const EngineOptions& options);
    const EngineOptions& options() const { return options_; }

    /* ========================================================================
     * Tracks and Transitions
     * ======================================================================== */

    /**
     * Load a track into the active voice, replacing what it held.
     * Loading the track that is already loaded is a no-op. A track already
     * preloaded in the inactive voice is promoted instead of reloaded.
     * Any transition in progress is aborted.
     * @return false if the engine is destroyed or the load was refused
     */
    bool load_track(const TrackRef& track, const LoadOptions& options = LoadOptions());

    /**
     * Prepare the inactive voice with gain held at zero.
     * Skipped (returns true) when the voice already holds the track.
     * @return false during a transition, after destroy(), or on refusal
     */
    bool preload_next_track(const TrackRef& track);

    /**
     * Start a crossfade into `next`. Rejected while another transition is
     * in progress; the existing one is left untouched.
     *
     * The fade starts on the first tick where the incoming voice is ready.
     * If that does not happen within preload_timeout the transition is
     * abandoned and a Transition error is reported.
     */
    Result<bool> schedule_crossfade(const TrackRef& next);

    /**
     * As schedule_crossfade(), with a fade of a few milliseconds.
     */
    Result<bool> schedule_gapless_transition(const TrackRef& next);

    /**
     * Cancel any transition, tear down the inactive voice and restore the
     * active voice's gain. Safe to call at any time.
     */
    void abort_crossfade();

    /* ========================================================================
     * Transport
     * ======================================================================== */

    void play();
    void pause();

    /**
     * Seek the active voice. A transition in progress is aborted first.
     */
    void seek(double seconds);

    /**
     * Master volume in [0, 1], applied on top of normalization and fades.
     */
    void set_volume(float volume);
    void set_muted(bool muted);

    float volume() const { return volume_; }
    bool muted() const { return muted_; }

    double current_time() const;
    double current_duration() const;
    bool is_playing() const;

    /* ========================================================================
     * Scheduling
     * ======================================================================== */

    /**
     * Advance the engine to the clock's current time.
     */
    void tick();

    /**
     * Release both voices, drop callbacks and providers. Idempotent; every
     * later call is ignored.
     */
    void destroy();
    bool is_destroyed() const { return destroyed_; }

    /* ========================================================================
     * Observers
     * ======================================================================== */

    bool is_transitioning() const { return session_.has_value(); }
    TransitionPhase transition_phase() const;

    int active_voice() const { return active_; }
    VoiceState voice_state(int index) const;
    bool voice_bound(int index) const;
    std::optional<TrackRef> voice_track(int index) const;

private:
    struct Voice {
        std::shared_ptr<VoiceOutput> output;
        std::optional<TrackRef> track;
        VoiceState state = VoiceState::Empty;

        double load_deadline = 0.0;
        double ready_since = -1.0;      // Clock time the output reported ready
        bool play_when_ready = false;

        std::shared_future<AnalysisResult> analysis;
        float norm_gain = 1.0f;
        TrimPoints trim;
        float bpm = 0.0f;
        float beat_confidence = 0.0f;

        bool end_reported = false;
    };

    double now() const;
    float master_gain() const { return muted_ ? 0.0f : volume_; }

    Voice& active() { return voices_[active_]; }
    const Voice& active() const { return voices_[active_]; }
    Voice& inactive() { return voices_[1 - active_]; }

    bool prepare_voice(int index, const TrackRef& track, bool enhance);
    void release_voice(int index);
    void resolve_loading(int index, double now);
    void finish_loading(int index);
    void handle_load_failure(int index, const std::string& message);
    bool start_active();

    Result<bool> begin_transition(const TrackRef& next, CrossfadeSession::Kind kind);
    void advance_transition(double now);
    void complete_transition();
    void fail_transition(const std::string& message);
    void apply_gains(double now);

    void auto_advance();
    void detect_track_end();
    void reset_boundary_flags();

    float effective_end(const Voice& voice) const;
    float normalization_gain(const AnalysisResult& analysis) const;

    void emit_error(EngineError::Kind kind, const std::string& message, int64_t track_id);
    bool ignored_after_destroy(const char* operation) const;

    OutputFactory factory_;
    Clock clock_;
    EngineOptions options_;

    EngineCallbacks callbacks_;
    EnhancementProvider enhancement_provider_;
    NextTrackProvider next_track_provider_;

    std::array<Voice, 2> voices_;
    int active_ = 0;
    std::optional<CrossfadeSession> session_;

    float volume_ = 1.0f;
    bool muted_ = false;
    bool destroyed_ = false;

    // Single-shot flags for the current track boundary
    bool preload_fired_ = false;
    bool advance_fired_ = false;
    std::optional<TrackRef> pending_next_;
};

} // namespace segue

#endif // SEGUE_CROSSFADE_ENGINE_H
