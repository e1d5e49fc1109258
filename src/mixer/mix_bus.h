/**
 * Segue Engine - Mix Bus
 */

#ifndef SEGUE_MIX_BUS_H
#define SEGUE_MIX_BUS_H

#include "deck.h"
#include <atomic>
#include <memory>
#include <mutex>
#include <vector>

namespace segue {

/**
 * Sums every live deck into one interleaved stereo stream and keeps the
 * playback clock.
 *
 * Thread model:
 *   - render() is called from the audio thread (or an offline render loop).
 *   - create_output() and clock() may be called from the control thread.
 *   - The clock advances only as frames are rendered, so an engine driven
 *     by it stays in step with what has actually been heard.
 */
class MixBus {
public:
    /**
     * @param max_buffer_frames  Maximum frames mixed per internal pass.
     *        Larger render() requests are processed in chunks.
     */
    explicit MixBus(PcmLoader loader, int sample_rate = 44100, int max_buffer_frames = 4096);
    ~MixBus();

    // Non-copyable
    MixBus(const MixBus&) = delete;
    MixBus& operator=(const MixBus&) = delete;

    /**
     * Create a deck attached to this bus. The bus holds a weak reference;
     * a deck dropped by its owner stops contributing.
     */
    std::shared_ptr<VoiceOutput> create_output();

    /**
     * Factory suitable for CrossfadeEngine.
     */
    OutputFactory factory();

    /**
     * Render mixed audio, clipped to [-1, 1].
     * @return Number of frames written (always `frames`)
     */
    int render(float* output, int frames);

    /**
     * Seconds of audio rendered so far.
     */
    double clock() const;

    int sample_rate() const { return sample_rate_; }

    /**
     * Number of decks still alive.
     */
    int live_outputs() const;

private:
    PcmLoader loader_;
    int sample_rate_;
    int max_buffer_frames_;

    mutable std::mutex decks_mutex_;
    std::vector<std::weak_ptr<Deck>> decks_;

    // Pre-allocated scratch buffer (max_buffer_frames * 2 channels)
    std::vector<float> scratch_;
    std::atomic<int64_t> frames_rendered_{0};
};

} // namespace segue

#endif // SEGUE_MIX_BUS_H
