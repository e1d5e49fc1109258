/**
 * Segue Engine - Mix Bus Implementation
 */

#include "mix_bus.h"
#include "../core/utils.h"
#include <algorithm>
#include <cstring>

namespace segue {

MixBus::MixBus(PcmLoader loader, int sample_rate, int max_buffer_frames)
    : loader_(std::move(loader))
    , sample_rate_(sample_rate > 0 ? sample_rate : 44100)
    , max_buffer_frames_(max_buffer_frames > 0 ? max_buffer_frames : 4096)
    , scratch_(static_cast<size_t>(max_buffer_frames_) * 2, 0.0f) {}

MixBus::~MixBus() = default;

std::shared_ptr<VoiceOutput> MixBus::create_output() {
    auto deck = std::make_shared<Deck>(loader_, sample_rate_);

    std::lock_guard<std::mutex> lock(decks_mutex_);
    // Forget decks whose owners have released them
    decks_.erase(std::remove_if(decks_.begin(), decks_.end(),
                                [](const std::weak_ptr<Deck>& d) { return d.expired(); }),
                 decks_.end());
    decks_.push_back(deck);
    return deck;
}

OutputFactory MixBus::factory() {
    return [this]() { return create_output(); };
}

int MixBus::render(float* output, int frames) {
    if (frames <= 0) return 0;

    std::memset(output, 0, static_cast<size_t>(frames) * 2 * sizeof(float));

    std::vector<std::shared_ptr<Deck>> live;
    {
        std::lock_guard<std::mutex> lock(decks_mutex_);
        live.reserve(decks_.size());
        for (const auto& weak : decks_) {
            if (auto deck = weak.lock()) {
                live.push_back(std::move(deck));
            }
        }
    }

    int offset = 0;
    while (offset < frames) {
        int chunk = std::min(max_buffer_frames_, frames - offset);
        float* out = output + static_cast<size_t>(offset) * 2;

        for (auto& deck : live) {
            if (!deck->is_playing()) continue;

            deck->render(scratch_.data(), chunk);
            for (int i = 0; i < chunk * 2; ++i) {
                out[i] += scratch_[i];
            }
        }

        // Clip
        for (int i = 0; i < chunk * 2; ++i) {
            out[i] = utils::clamp(out[i], -1.0f, 1.0f);
        }
        offset += chunk;
    }

    frames_rendered_ += frames;
    return frames;
}

double MixBus::clock() const {
    return static_cast<double>(frames_rendered_.load()) / sample_rate_;
}

int MixBus::live_outputs() const {
    std::lock_guard<std::mutex> lock(decks_mutex_);
    return static_cast<int>(std::count_if(decks_.begin(), decks_.end(),
                                          [](const std::weak_ptr<Deck>& d) { return !d.expired(); }));
}

} // namespace segue
