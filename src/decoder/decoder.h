/**
 * Segue Engine - Audio Decoder
 */

#ifndef SEGUE_DECODER_H
#define SEGUE_DECODER_H

#include "segue/types.h"
#include <string>
#include <memory>

namespace segue {

/**
 * Output format for a full decode. Zero keeps the source value.
 */
struct DecodeOptions {
    int sample_rate = 0;
    int channels = 0;
};

/**
 * Audio decoder that converts container/codec formats to float PCM.
 * Supported formats: anything FFmpeg can open (MP3, FLAC, AAC, M4A, OGG,
 * Opus, WAV, AIFF, DSD).
 */
class Decoder {
public:
    Decoder();
    ~Decoder();

    // Non-copyable
    Decoder(const Decoder&) = delete;
    Decoder& operator=(const Decoder&) = delete;

    /**
     * Read stream properties without decoding any audio.
     */
    Result<AudioInfo> probe(const std::string& path);

    /**
     * Decode an audio file to an interleaved float buffer.
     *
     * @param path    Path to audio file
     * @param options Target sample rate / channel count (0 = keep original)
     * @return AudioBuffer or error
     */
    Result<AudioBuffer> decode(const std::string& path, const DecodeOptions& options = {});

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace segue

#endif // SEGUE_DECODER_H
