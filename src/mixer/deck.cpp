/**
 * Segue Engine - Deck Implementation
 *
 * Features:
 *   - Background loading with generation checks (stale loads are dropped)
 *   - Gain smoothing (linear ramp per render call to prevent clicks)
 */

#include "deck.h"
#include "../core/utils.h"

#include <mutex>
#include <thread>
#include <cstring>
#include <cstdio>
#include <algorithm>
#include <exception>

namespace segue {

// =============================================================================
// Deck::Impl
// =============================================================================

class Deck::Impl {
public:
    Impl(PcmLoader loader, int sample_rate)
        : loader_(std::move(loader))
        , sample_rate_(sample_rate > 0 ? sample_rate : 44100) {}

    // Returns the generation the new load belongs to
    uint64_t begin_load(int64_t track_id) {
        std::lock_guard<std::mutex> lock(mutex_);
        reset_locked();
        track_id_ = track_id;
        state_ = LoadState::Loading;
        return generation_;
    }

    void complete_load(uint64_t generation, Result<AudioBuffer> result) {
        // Convert before taking the lock; the audio thread may be rendering
        if (result.ok()) {
            result = to_stereo(std::move(result.value()));
        }

        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != generation_) {
            return;  // Unbound or rebound while loading
        }

        if (result.ok()) {
            buffer_ = std::move(result.value());
            state_ = LoadState::Ready;
        } else {
            error_ = result.error();
            state_ = LoadState::Failed;
        }
    }

    void unload() {
        std::lock_guard<std::mutex> lock(mutex_);
        reset_locked();
    }

    bool play() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != LoadState::Ready) return false;

        if (position_ >= buffer_.frame_count()) {
            position_ = 0;
        }
        playing_ = true;
        ended_ = false;
        return true;
    }

    void pause() {
        std::lock_guard<std::mutex> lock(mutex_);
        playing_ = false;
    }

    void seek(double seconds) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != LoadState::Ready) return;

        double clamped = std::max(0.0, seconds);
        size_t frame = static_cast<size_t>(clamped * sample_rate_);
        position_ = std::min(frame, buffer_.frame_count());
        ended_ = false;
    }

    double position() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<double>(position_) / sample_rate_;
    }

    double duration() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<double>(buffer_.frame_count()) / sample_rate_;
    }

    int render(float* output, int frames, float gain) {
        std::lock_guard<std::mutex> lock(mutex_);

        if (!playing_ || state_ != LoadState::Ready) {
            std::memset(output, 0, frames * 2 * sizeof(float));
            return 0;
        }

        // Setup gain ramp
        float gain_start = (prev_gain_ < 0.0f) ? gain : prev_gain_;
        float gain_end = gain;
        prev_gain_ = gain;

        const size_t total = buffer_.frame_count();
        int rendered = 0;
        while (rendered < frames && position_ < total) {
            float t = (frames > 1) ? static_cast<float>(rendered) / (frames - 1) : 1.0f;
            float g = gain_start + t * (gain_end - gain_start);

            output[rendered * 2]     = buffer_.samples[position_ * 2] * g;
            output[rendered * 2 + 1] = buffer_.samples[position_ * 2 + 1] * g;

            position_++;
            rendered++;
        }

        // Zero-fill remaining
        for (int i = rendered; i < frames; ++i) {
            output[i * 2]     = 0.0f;
            output[i * 2 + 1] = 0.0f;
        }

        if (position_ >= total) {
            playing_ = false;
            ended_ = true;
        }
        return rendered;
    }

    LoadState state() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return state_;
    }

    std::string error() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return error_;
    }

    bool playing() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return playing_;
    }

    bool ended() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return ended_;
    }

    int64_t track_id() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return track_id_;
    }

    const PcmLoader& loader() const { return loader_; }

private:
    void reset_locked() {
        generation_++;
        buffer_.samples.clear();
        buffer_.samples.shrink_to_fit();
        position_ = 0;
        track_id_ = 0;
        state_ = LoadState::Idle;
        error_.clear();
        playing_ = false;
        ended_ = false;
        prev_gain_ = -1.0f;  // signal "no previous gain"
    }

    // The mix bus renders interleaved stereo at a fixed rate
    Result<AudioBuffer> to_stereo(AudioBuffer audio) const {
        if (audio.sample_rate != sample_rate_) {
            return ResultError("Sample rate " + std::to_string(audio.sample_rate) +
                               " does not match output rate " + std::to_string(sample_rate_));
        }
        if (audio.channels == 2) {
            return audio;
        }
        if (audio.channels <= 0) {
            return "Invalid channel count";
        }

        AudioBuffer stereo;
        stereo.sample_rate = audio.sample_rate;
        stereo.channels = 2;
        size_t frames = audio.frame_count();
        stereo.samples.resize(frames * 2);
        for (size_t i = 0; i < frames; ++i) {
            float l = audio.samples[i * audio.channels];
            float r = audio.channels > 1 ? audio.samples[i * audio.channels + 1] : l;
            stereo.samples[i * 2]     = l;
            stereo.samples[i * 2 + 1] = r;
        }
        return stereo;
    }

    mutable std::mutex mutex_;
    PcmLoader loader_;
    int sample_rate_;

    AudioBuffer buffer_;
    size_t position_{0};                // Frames
    uint64_t generation_{0};
    int64_t track_id_{0};
    LoadState state_{LoadState::Idle};
    std::string error_;
    bool playing_{false};
    bool ended_{false};
    float prev_gain_{-1.0f};
};

// =============================================================================
// Deck public interface
// =============================================================================

Deck::Deck(PcmLoader loader, int sample_rate)
    : impl_(std::make_shared<Impl>(std::move(loader), sample_rate)) {}

Deck::~Deck() {
    impl_->unload();
}

bool Deck::bind(const TrackRef& track) {
    if (!impl_->loader() || track.locator.empty()) {
        return false;
    }

    uint64_t generation = impl_->begin_load(track.id);

    std::shared_ptr<Impl> impl = impl_;
    std::string locator = track.locator;
    std::thread([impl, locator, generation]() {
        Result<AudioBuffer> result = ResultError("Load did not run");
        try {
            result = impl->loader()(locator);
        } catch (const std::exception& e) {
            result = ResultError(std::string("Loader threw: ") + e.what());
        }
        if (result.failed()) {
            std::fprintf(stderr, "[Deck] Failed to load %s: %s\n", locator.c_str(), result.error().c_str());
        }
        impl->complete_load(generation, std::move(result));
    }).detach();

    return true;
}

void Deck::unbind() {
    impl_->unload();
}

LoadState Deck::load_state() const {
    return impl_->state();
}

std::string Deck::load_error() const {
    return impl_->error();
}

bool Deck::play() {
    return impl_->play();
}

void Deck::pause() {
    impl_->pause();
}

void Deck::seek(double seconds) {
    impl_->seek(seconds);
}

double Deck::position() const {
    return impl_->position();
}

double Deck::duration() const {
    return impl_->duration();
}

void Deck::set_gain(float gain) {
    gain_ = utils::clamp(gain, 0.0f, kMaxGain);
}

float Deck::gain() const {
    return gain_;
}

bool Deck::is_playing() const {
    return impl_->playing();
}

bool Deck::has_ended() const {
    return impl_->ended();
}

int64_t Deck::track_id() const {
    return impl_->track_id();
}

int Deck::render(float* output, int frames) {
    return impl_->render(output, frames, gain_);
}

} // namespace segue
