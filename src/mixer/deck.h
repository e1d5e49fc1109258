/**
 * Segue Engine - Deck (PCM-backed voice output)
 */

#ifndef SEGUE_DECK_H
#define SEGUE_DECK_H

#include "segue/types.h"
#include "voice_output.h"
#include <atomic>
#include <functional>
#include <memory>

namespace segue {

/**
 * Loads stereo PCM at the deck's sample rate for a locator.
 */
using PcmLoader = std::function<Result<AudioBuffer>(const std::string& locator)>;

/**
 * A voice output that plays a decoded track from memory.
 *
 * bind() decodes on a background thread. A load that completes after
 * unbind(), a newer bind() or destruction is discarded.
 *
 * render() is called from the audio thread; everything else from the
 * control thread.
 */
class Deck : public VoiceOutput {
public:
    static constexpr float kMaxGain = 10.0f;    // +20 dB

    Deck(PcmLoader loader, int sample_rate);
    ~Deck() override;

    // Non-copyable
    Deck(const Deck&) = delete;
    Deck& operator=(const Deck&) = delete;

    bool bind(const TrackRef& track) override;
    void unbind() override;

    LoadState load_state() const override;
    std::string load_error() const override;

    bool play() override;
    void pause() override;
    void seek(double seconds) override;

    double position() const override;
    double duration() const override;

    void set_gain(float gain) override;
    float gain() const override;

    bool is_playing() const override;
    bool has_ended() const override;

    /**
     * Bound track id, 0 when unbound.
     */
    int64_t track_id() const;

    /**
     * Render audio frames to output buffer.
     * Gain changes since the previous call are ramped across the block.
     *
     * @param output Output buffer (interleaved stereo)
     * @param frames Number of frames to render
     * @return Number of frames actually rendered (the rest is zero-filled)
     */
    int render(float* output, int frames);

private:
    class Impl;
    std::shared_ptr<Impl> impl_;        // Shared with in-flight load workers
    std::atomic<float> gain_{1.0f};
};

} // namespace segue

#endif // SEGUE_DECK_H
