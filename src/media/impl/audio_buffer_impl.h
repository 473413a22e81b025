#pragma once

#include <montage/media/audio_buffer.h>

#include <vector>

namespace montage {

// Internal storage of AudioBuffer
class AudioBufferImpl {
public:
    AudioBufferImpl(int32_t sample_rate, int32_t channels, std::vector<float> data);

    int32_t sample_rate;
    int32_t channels;
    std::vector<float> data;  // Interleaved float32
};

} // namespace montage
