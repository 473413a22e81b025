#pragma once

#include <cstdint>
#include <memory>
#include <vector>

namespace montage {

// Forward declaration for implementation
class AudioBufferImpl;

/**
 * Decoded PCM audio, interleaved float32
 *
 * Immutable; copies share sample storage. Cutting operations return new buffers.
 */
class AudioBuffer
{
public:
    AudioBuffer();
    AudioBuffer(int32_t sampleRate, int32_t channels, std::vector<float> interleaved);

    // Silent buffer of frames sample-frames
    static AudioBuffer silence(int32_t sampleRate, int32_t channels, int64_t frames);

    bool isNull() const;
    int32_t sampleRate() const;
    int32_t channels() const;

    // Number of sample-frames (samples per channel)
    int64_t frames() const;
    double durationMs() const;

    // Interleaved data, frames() * channels() floats
    const float* data() const;
    float sample(int64_t frame, int32_t channel) const;

    /**
     * Samples in [floor(startSec*rate), ceil(endSec*rate)), clamped to the buffer
     */
    AudioBuffer segment(double startSec, double endSec) const;

    /**
     * Buffer with [startSec, endSec) cut out
     * A cut covering every sample yields a one-sample silent buffer
     */
    AudioBuffer removeInterval(double startSec, double endSec) const;

private:
    int64_t clampedSample(double seconds, bool roundUp) const;

    std::shared_ptr<const AudioBufferImpl> m_impl;
};

} // namespace montage
