/**
 * Segue Engine - Dual-Voice Crossfade Engine Implementation
 *
 * Every state change happens on the control thread, either inside a
 * public method or inside tick(). Loads complete in the background but are
 * only observed by polling the output's load state, so a voice released
 * before its load finished never sees the result.
 */

#include "crossfade_engine.h"
#include "../analyzer/silence_detector.h"
#include "../core/utils.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <exception>

namespace segue {

namespace {

constexpr double kGaplessFadeSeconds = 0.005;
constexpr double kMinCrossfadeRemaining = 0.1;  // Too late to start a crossfade

const char* error_kind_name(EngineError::Kind kind) {
    switch (kind) {
        case EngineError::Kind::Load:       return "load";
        case EngineError::Kind::Transition: return "transition";
        case EngineError::Kind::Playback:   return "playback";
    }
    return "unknown";
}

bool same_track(const std::optional<TrackRef>& bound, const TrackRef& track) {
    return bound && bound->id == track.id && bound->locator == track.locator;
}

bool future_ready(const std::shared_future<AnalysisResult>& future) {
    return future.valid() &&
           future.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

} // anonymous namespace

CrossfadeEngine::CrossfadeEngine(OutputFactory factory, Clock clock, EngineOptions options)
    : factory_(std::move(factory))
    , clock_(std::move(clock)) {
    set_options(options);
}

CrossfadeEngine::~CrossfadeEngine() {
    destroy();
}

/* ============================================================================
 * Configuration
 * ============================================================================ */

void CrossfadeEngine::set_callbacks(EngineCallbacks callbacks) {
    if (ignored_after_destroy("set_callbacks")) return;
    callbacks_ = std::move(callbacks);
}

void CrossfadeEngine::set_enhancement_provider(EnhancementProvider provider) {
    if (ignored_after_destroy("set_enhancement_provider")) return;
    enhancement_provider_ = std::move(provider);
}

void CrossfadeEngine::set_next_track_provider(NextTrackProvider provider) {
    if (ignored_after_destroy("set_next_track_provider")) return;
    next_track_provider_ = std::move(provider);
}

void CrossfadeEngine::set_options(const EngineOptions& options) {
    options_ = options;
    options_.crossfade_duration = std::max(0.0f, options_.crossfade_duration);
    options_.gapless_threshold_ms = std::max(0.0f, options_.gapless_threshold_ms);
    options_.tick_interval_ms = std::max(1, options_.tick_interval_ms);
    options_.load_timeout = std::max(0.0f, options_.load_timeout);
    options_.preload_timeout = std::max(0.0f, options_.preload_timeout);
    options_.analysis_wait = std::max(0.0f, options_.analysis_wait);
    options_.preload_lookahead = std::max(0.0f, options_.preload_lookahead);
}

/* ============================================================================
 * Tracks and Transitions
 * ============================================================================ */

bool CrossfadeEngine::load_track(const TrackRef& track, const LoadOptions& options) {
    if (ignored_after_destroy("load_track")) return false;

    if (track.locator.empty()) {
        std::fprintf(stderr, "[CrossfadeEngine] Refusing to load track %lld without a locator\n",
                     static_cast<long long>(track.id));
        return false;
    }

    Voice& current = active();
    if (same_track(current.track, track) && current.state != VoiceState::Empty) {
        if (options.autoplay && current.state != VoiceState::Playing) {
            play();
        }
        return true;
    }

    if (session_) {
        abort_crossfade();
    }
    reset_boundary_flags();

    // Promote a preloaded inactive voice instead of loading again
    if (same_track(inactive().track, track) && inactive().state != VoiceState::Empty) {
        release_voice(active_);
        active_ = 1 - active_;

        Voice& promoted = active();
        promoted.end_reported = false;
        apply_gains(now());

        if (options.autoplay) {
            if (promoted.state == VoiceState::Loading) {
                promoted.play_when_ready = true;
            } else {
                start_active();
            }
        }
        return true;
    }

    release_voice(active_);
    if (!prepare_voice(active_, track, options.enhance)) {
        emit_error(EngineError::Kind::Load, "Output refused track " + track.locator, track.id);
        return false;
    }
    active().play_when_ready = options.autoplay;
    return true;
}

bool CrossfadeEngine::preload_next_track(const TrackRef& track) {
    if (ignored_after_destroy("preload_next_track")) return false;

    if (session_) {
        std::fprintf(stderr, "[CrossfadeEngine] Preload of track %lld skipped: transition in progress\n",
                     static_cast<long long>(track.id));
        return false;
    }

    Voice& next = inactive();
    if (same_track(next.track, track) &&
        (next.state == VoiceState::Loading || next.state == VoiceState::Ready)) {
        return true;
    }

    return prepare_voice(1 - active_, track, true);
}

Result<bool> CrossfadeEngine::schedule_crossfade(const TrackRef& next) {
    return begin_transition(next, CrossfadeSession::Kind::Crossfade);
}

Result<bool> CrossfadeEngine::schedule_gapless_transition(const TrackRef& next) {
    return begin_transition(next, CrossfadeSession::Kind::Gapless);
}

void CrossfadeEngine::abort_crossfade() {
    if (ignored_after_destroy("abort_crossfade")) return;

    session_.reset();
    release_voice(1 - active_);
    apply_gains(now());
}

/* ============================================================================
 * Transport
 * ============================================================================ */

void CrossfadeEngine::play() {
    if (ignored_after_destroy("play")) return;

    Voice& v = active();
    switch (v.state) {
        case VoiceState::Empty:
            return;
        case VoiceState::Loading:
            v.play_when_ready = true;
            return;
        case VoiceState::Ready:
        case VoiceState::Paused:
            if (!start_active()) return;
            break;
        case VoiceState::Playing:
            break;
    }

    if (session_) {
        Voice& incoming = inactive();
        if (session_->phase == TransitionPhase::Active && incoming.state == VoiceState::Paused) {
            if (incoming.output->play()) {
                incoming.state = VoiceState::Playing;
            }
        }
        session_->resume(now());
        apply_gains(now());
    }
}

void CrossfadeEngine::pause() {
    if (ignored_after_destroy("pause")) return;

    Voice& v = active();
    v.play_when_ready = false;
    if (v.state == VoiceState::Playing) {
        v.output->pause();
        v.state = VoiceState::Paused;
    }

    if (session_) {
        Voice& incoming = inactive();
        if (session_->phase == TransitionPhase::Active && incoming.state == VoiceState::Playing) {
            incoming.output->pause();
            incoming.state = VoiceState::Paused;
        }
        session_->pause(now());
    }
}

void CrossfadeEngine::seek(double seconds) {
    if (ignored_after_destroy("seek")) return;

    Voice& v = active();
    if (!v.output || v.state == VoiceState::Empty || v.state == VoiceState::Loading) {
        return;
    }

    if (session_) {
        std::fprintf(stderr, "[CrossfadeEngine] Seek during transition, aborting it\n");
        abort_crossfade();
    }

    double duration = v.output->duration();
    double target = std::max(0.0, seconds);
    if (duration > 0.0) {
        target = std::min(target, duration);
    }
    v.output->seek(target);
    v.end_reported = false;

    // Same boundary: re-arm the triggers but keep the track already handed over
    advance_fired_ = false;
    preload_fired_ = pending_next_.has_value();
}

void CrossfadeEngine::set_volume(float volume) {
    if (ignored_after_destroy("set_volume")) return;
    volume_ = utils::clamp(volume, 0.0f, 1.0f);
    apply_gains(now());
}

void CrossfadeEngine::set_muted(bool muted) {
    if (ignored_after_destroy("set_muted")) return;
    muted_ = muted;
    apply_gains(now());
}

double CrossfadeEngine::current_time() const {
    const Voice& v = active();
    if (!v.output || v.state == VoiceState::Empty || v.state == VoiceState::Loading) {
        return 0.0;
    }
    return v.output->position();
}

double CrossfadeEngine::current_duration() const {
    const Voice& v = active();
    if (v.output && v.state != VoiceState::Loading && v.state != VoiceState::Empty) {
        double duration = v.output->duration();
        if (duration > 0.0) return duration;
    }
    return v.track ? v.track->duration : 0.0;
}

bool CrossfadeEngine::is_playing() const {
    return active().state == VoiceState::Playing;
}

/* ============================================================================
 * Scheduling
 * ============================================================================ */

void CrossfadeEngine::tick() {
    if (destroyed_) return;

    double t = now();
    for (int i = 0; i < 2; ++i) {
        if (voices_[i].state == VoiceState::Loading) {
            resolve_loading(i, t);
            if (destroyed_) return;
        }
    }

    advance_transition(t);
    if (destroyed_) return;

    auto_advance();
    if (destroyed_) return;

    const Voice& v = active();
    if (v.state == VoiceState::Playing) {
        auto on_time_update = callbacks_.on_time_update;
        if (on_time_update) {
            on_time_update(current_time(), current_duration());
            if (destroyed_) return;
        }
    }

    detect_track_end();
}

void CrossfadeEngine::destroy() {
    if (destroyed_) return;
    destroyed_ = true;

    session_.reset();
    release_voice(0);
    release_voice(1);

    callbacks_ = EngineCallbacks();
    enhancement_provider_ = nullptr;
    next_track_provider_ = nullptr;
    pending_next_.reset();
}

/* ============================================================================
 * Observers
 * ============================================================================ */

TransitionPhase CrossfadeEngine::transition_phase() const {
    return session_ ? session_->phase : TransitionPhase::None;
}

VoiceState CrossfadeEngine::voice_state(int index) const {
    if (index < 0 || index > 1) return VoiceState::Empty;
    return voices_[index].state;
}

bool CrossfadeEngine::voice_bound(int index) const {
    if (index < 0 || index > 1) return false;
    return voices_[index].output != nullptr;
}

std::optional<TrackRef> CrossfadeEngine::voice_track(int index) const {
    if (index < 0 || index > 1) return std::nullopt;
    return voices_[index].track;
}

/* ============================================================================
 * Voices
 * ============================================================================ */

double CrossfadeEngine::now() const {
    return clock_ ? clock_() : 0.0;
}

bool CrossfadeEngine::prepare_voice(int index, const TrackRef& track, bool enhance) {
    release_voice(index);

    std::shared_ptr<VoiceOutput> output = factory_ ? factory_() : nullptr;
    if (!output) {
        std::fprintf(stderr, "[CrossfadeEngine] No output available for track %lld\n",
                     static_cast<long long>(track.id));
        return false;
    }

    output->set_gain(0.0f);
    if (!output->bind(track)) {
        std::fprintf(stderr, "[CrossfadeEngine] Output refused %s\n", track.locator.c_str());
        return false;
    }

    Voice& v = voices_[index];
    v.output = std::move(output);
    v.track = track;
    v.state = VoiceState::Loading;
    v.load_deadline = now() + options_.load_timeout;

    if (enhance && enhancement_provider_) {
        try {
            v.analysis = enhancement_provider_(track);
        } catch (const std::exception& e) {
            std::fprintf(stderr, "[CrossfadeEngine] Enhancement request failed for %s: %s\n",
                         track.locator.c_str(), e.what());
        }
    }
    return true;
}

void CrossfadeEngine::release_voice(int index) {
    Voice& v = voices_[index];
    if (v.output) {
        v.output->pause();
        v.output->unbind();
    }
    v = Voice();
}

void CrossfadeEngine::resolve_loading(int index, double now) {
    Voice& v = voices_[index];
    if (!v.output) return;

    switch (v.output->load_state()) {
        case LoadState::Failed:
            handle_load_failure(index, v.output->load_error());
            return;

        case LoadState::Ready:
            if (v.ready_since < 0.0) {
                v.ready_since = now;
            }
            // Give analysis a short grace period to supply gain and trim
            if (v.analysis.valid() && !future_ready(v.analysis) &&
                now - v.ready_since < options_.analysis_wait) {
                return;
            }
            finish_loading(index);
            return;

        case LoadState::Idle:
        case LoadState::Loading:
            if (now > v.load_deadline) {
                handle_load_failure(index, "Timed out loading track");
            }
            return;
    }
}

void CrossfadeEngine::finish_loading(int index) {
    Voice& v = voices_[index];

    if (future_ready(v.analysis)) {
        try {
            const AnalysisResult& analysis = v.analysis.get();
            if (!analysis.is_default()) {
                if (options_.normalization_enabled) {
                    v.norm_gain = normalization_gain(analysis);
                }
                if (options_.trim_silence) {
                    v.trim = compute_trim_points(analysis.silence,
                                                 static_cast<float>(v.output->duration()));
                }
                v.bpm = analysis.beats.bpm;
                v.beat_confidence = analysis.beats.confidence;
            }
        } catch (const std::exception& e) {
            std::fprintf(stderr, "[CrossfadeEngine] Analysis unavailable for track %lld: %s\n",
                         static_cast<long long>(v.track ? v.track->id : 0), e.what());
        }
    } else if (v.analysis.valid()) {
        std::fprintf(stderr, "[CrossfadeEngine] Analysis not ready for track %lld, playing unprocessed\n",
                     static_cast<long long>(v.track ? v.track->id : 0));
    }
    v.analysis = std::shared_future<AnalysisResult>();

    if (v.trim.start > 0.0f) {
        v.output->seek(v.trim.start);
    }
    v.state = VoiceState::Ready;
    apply_gains(now());

    if (index == active_ && v.play_when_ready) {
        start_active();
    }
}

void CrossfadeEngine::handle_load_failure(int index, const std::string& message) {
    if (index != active_ && session_) {
        fail_transition("Next track failed to load: " + message);
        return;
    }

    int64_t track_id = voices_[index].track ? voices_[index].track->id : 0;
    release_voice(index);
    emit_error(EngineError::Kind::Load, message, track_id);
}

bool CrossfadeEngine::start_active() {
    Voice& v = active();
    v.play_when_ready = false;

    apply_gains(now());
    if (!v.output->play()) {
        v.state = VoiceState::Paused;
        emit_error(EngineError::Kind::Playback, "Output refused to play",
                   v.track ? v.track->id : 0);
        return false;
    }
    v.state = VoiceState::Playing;
    v.end_reported = false;
    return true;
}

/* ============================================================================
 * Transitions
 * ============================================================================ */

Result<bool> CrossfadeEngine::begin_transition(const TrackRef& next, CrossfadeSession::Kind kind) {
    if (destroyed_) {
        return "Engine destroyed";
    }
    if (session_) {
        return "A transition is already in progress";
    }
    if (next.locator.empty()) {
        return "Next track has no locator";
    }

    Voice& current = active();
    if (current.state == VoiceState::Empty || current.state == VoiceState::Loading) {
        return "No loaded track to transition from";
    }

    int incoming = 1 - active_;
    const Voice& next_voice = voices_[incoming];
    bool reuse = same_track(next_voice.track, next) &&
                 (next_voice.state == VoiceState::Loading || next_voice.state == VoiceState::Ready);
    if (!reuse && !prepare_voice(incoming, next, true)) {
        return "Output refused next track " + next.locator;
    }

    CrossfadeSession session;
    session.kind = kind;
    session.next = next;
    session.curve = options_.curve;
    session.ready_deadline = now() + options_.preload_timeout;

    if (kind == CrossfadeSession::Kind::Gapless) {
        session.duration = kGaplessFadeSeconds;
    } else {
        session.duration = options_.crossfade_duration;
        // Stretch the fade to end on a beat of the outgoing track
        if (options_.beat_matching && current.bpm > 0.0f && current.beat_confidence > 0.0f &&
            session.duration > 0.0) {
            double beat = 60.0 / current.bpm;
            double beats = std::ceil(session.duration / beat - 1e-6);
            session.duration = std::max(1.0, beats) * beat;
        }
    }

    session_ = session;
    if (current.state != VoiceState::Playing) {
        session_->pause(now());
    }
    return true;
}

void CrossfadeEngine::advance_transition(double now) {
    if (!session_ || session_->paused_at >= 0.0) return;

    Voice& incoming = inactive();

    if (session_->phase == TransitionPhase::None) {
        if (incoming.state != VoiceState::Ready) {
            if (now > session_->ready_deadline) {
                fail_transition("Next track not ready in time");
            }
            return;
        }

        incoming.output->set_gain(0.0f);
        if (!incoming.output->play()) {
            fail_transition("Next track refused to play");
            return;
        }
        incoming.state = VoiceState::Playing;
        incoming.end_reported = false;

        session_->phase = TransitionPhase::Active;
        session_->start_time = now;
        apply_gains(now);

        auto on_crossfade_start = callbacks_.on_crossfade_start;
        if (on_crossfade_start) {
            on_crossfade_start(session_->next);
        }
        return;
    }

    if (session_->phase == TransitionPhase::Active) {
        apply_gains(now);
        if (session_->progress(now) >= 1.0f) {
            complete_transition();
        }
    }
}

void CrossfadeEngine::complete_transition() {
    session_->phase = TransitionPhase::Handoff;
    TrackRef next = session_->next;

    Voice& outgoing = active();
    if (outgoing.output) {
        outgoing.output->pause();
        outgoing.output->set_gain(0.0f);
        outgoing.output->seek(outgoing.trim.start);
        outgoing.state = VoiceState::Paused;
    }
    outgoing.play_when_ready = false;

    active_ = 1 - active_;
    active().end_reported = false;

    session_.reset();
    reset_boundary_flags();
    apply_gains(now());

    auto on_crossfade_complete = callbacks_.on_crossfade_complete;
    if (on_crossfade_complete) {
        on_crossfade_complete(next);
    }
}

void CrossfadeEngine::fail_transition(const std::string& message) {
    int64_t track_id = session_ ? session_->next.id : 0;

    session_.reset();
    release_voice(1 - active_);
    apply_gains(now());

    emit_error(EngineError::Kind::Transition, message, track_id);
}

void CrossfadeEngine::apply_gains(double now) {
    Voice& current = active();
    Voice& other = inactive();
    float master = master_gain();

    if (session_ && session_->phase == TransitionPhase::Active) {
        CurveGains g = session_->gains(now);
        if (current.output) current.output->set_gain(g.fade_out * current.norm_gain * master);
        if (other.output) other.output->set_gain(g.fade_in * other.norm_gain * master);
        return;
    }

    if (current.output) current.output->set_gain(current.norm_gain * master);
    if (other.output) other.output->set_gain(0.0f);
}

/* ============================================================================
 * Auto-advance
 * ============================================================================ */

void CrossfadeEngine::auto_advance() {
    if (session_ || !next_track_provider_) return;

    Voice& v = active();
    if (v.state != VoiceState::Playing || !v.output) return;

    double duration = v.output->duration();
    if (duration <= 0.0) return;

    double remaining = effective_end(v) - v.output->position();
    double lookahead = std::min(static_cast<double>(options_.preload_lookahead), duration / 2.0);

    bool crossfade = options_.crossfade_enabled && options_.crossfade_duration > 0.0f &&
                     remaining <= options_.crossfade_duration &&
                     remaining > kMinCrossfadeRemaining;
    bool gapless = !crossfade && remaining <= options_.gapless_threshold_ms / 1000.0;

    if (!preload_fired_ && (remaining <= lookahead || crossfade || gapless)) {
        preload_fired_ = true;
        NextTrackProvider provider = next_track_provider_;
        pending_next_ = provider();
        if (destroyed_) return;
        if (pending_next_) {
            preload_next_track(*pending_next_);
        }
    }

    if (advance_fired_ || (!crossfade && !gapless)) return;
    advance_fired_ = true;

    if (!pending_next_) return;  // End of queue; the track plays out

    TrackRef next = *pending_next_;
    Result<bool> started = crossfade ? schedule_crossfade(next) : schedule_gapless_transition(next);
    if (started.failed()) {
        emit_error(EngineError::Kind::Transition, started.error(), next.id);
    }
}

void CrossfadeEngine::detect_track_end() {
    if (session_) return;

    Voice& v = active();
    if (v.state != VoiceState::Playing || !v.output) return;

    bool ended = v.output->has_ended();
    if (!ended && v.trim.end > 0.0f && v.output->position() >= effective_end(v)) {
        ended = true;
    }
    if (!ended) return;

    v.output->pause();
    v.state = VoiceState::Paused;
    if (v.end_reported || !v.track) return;
    v.end_reported = true;

    TrackRef track = *v.track;
    auto on_track_end = callbacks_.on_track_end;
    if (on_track_end) {
        on_track_end(track);
    }
}

void CrossfadeEngine::reset_boundary_flags() {
    preload_fired_ = false;
    advance_fired_ = false;
    pending_next_.reset();
}

float CrossfadeEngine::effective_end(const Voice& voice) const {
    double duration = voice.output ? voice.output->duration() : 0.0;
    return static_cast<float>(std::max(0.0, duration - voice.trim.end));
}

float CrossfadeEngine::normalization_gain(const AnalysisResult& analysis) const {
    float gain_db = utils::clamp(options_.target_loudness - analysis.loudness.integrated, -20.0f, 20.0f);
    if (options_.true_peak_limiting) {
        // Keep the boosted peak at or below -1 dBFS
        gain_db = std::min(gain_db, -1.0f - analysis.loudness.true_peak);
    }
    return utils::db_to_linear(gain_db);
}

/* ============================================================================
 * Errors
 * ============================================================================ */

void CrossfadeEngine::emit_error(EngineError::Kind kind, const std::string& message, int64_t track_id) {
    std::fprintf(stderr, "[CrossfadeEngine] %s error (track %lld): %s\n",
                 error_kind_name(kind), static_cast<long long>(track_id), message.c_str());

    auto on_error = callbacks_.on_error;
    if (on_error) {
        EngineError error;
        error.kind = kind;
        error.message = message;
        error.track_id = track_id;
        on_error(error);
    }
}

bool CrossfadeEngine::ignored_after_destroy(const char* operation) const {
    if (destroyed_) {
        std::fprintf(stderr, "[CrossfadeEngine] %s ignored: engine destroyed\n", operation);
        return true;
    }
    return false;
}

} // namespace segue
