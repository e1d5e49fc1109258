/**
 * Segue Engine - Voice Output Interface
 */

#ifndef SEGUE_VOICE_OUTPUT_H
#define SEGUE_VOICE_OUTPUT_H

#include "segue/types.h"
#include <functional>
#include <memory>
#include <string>

namespace segue {

enum class LoadState {
    Idle,
    Loading,
    Ready,
    Failed
};

/**
 * Transport handle behind one engine voice.
 *
 * bind() starts loading a track and returns immediately; the engine polls
 * load_state() on its tick. Positions and durations are in seconds and are
 * expected to be accurate to about one tick (10 ms).
 */
class VoiceOutput {
public:
    virtual ~VoiceOutput() = default;

    /**
     * Begin loading a track. Returns false if the request is rejected
     * outright (nothing to load, no decoder).
     */
    virtual bool bind(const TrackRef& track) = 0;

    /**
     * Drop the bound track. A load still in progress is discarded.
     */
    virtual void unbind() = 0;

    virtual LoadState load_state() const = 0;
    virtual std::string load_error() const = 0;

    /**
     * Start playback. Returns false if the output refuses (not loaded).
     */
    virtual bool play() = 0;
    virtual void pause() = 0;
    virtual void seek(double seconds) = 0;

    virtual double position() const = 0;
    virtual double duration() const = 0;

    /**
     * Linear gain applied to the output; changes are smoothed.
     */
    virtual void set_gain(float gain) = 0;
    virtual float gain() const = 0;

    virtual bool is_playing() const = 0;

    /**
     * True once playback has reached the end of the track.
     */
    virtual bool has_ended() const = 0;
};

/**
 * Creates a fresh, unbound output for a voice.
 */
using OutputFactory = std::function<std::shared_ptr<VoiceOutput>()>;

} // namespace segue

#endif // SEGUE_VOICE_OUTPUT_H
