#pragma once

#include <montage/common/errors.h>
#include <montage/media/audio_buffer.h>

namespace montage {

struct AudioSourceMetadata {
    double totalDurationMs = 0.0;
    int32_t sampleRate = 0;
    int32_t channels = 0;
};

// Decoded audio provider; the buffer is shared by clones and split halves
class AudioFrameSource
{
public:
    virtual ~AudioFrameSource() = default;

    virtual AudioSourceMetadata metadata() const = 0;
    virtual AudioBuffer audioBuffer() const = 0;
    virtual void cleanup() = 0;
};

/**
 * Pitch-preserving time stretch
 * speed > 1 shortens the buffer, speed < 1 lengthens it.
 */
class TimeStretcher
{
public:
    virtual ~TimeStretcher() = default;

    virtual Result<AudioBuffer> stretch(const AudioBuffer& buffer, double speed) = 0;
};

/**
 * Audio output device shared by every audio clip of a session
 * schedule() plays buffer from offsetSec at device time whenSec and returns
 * a handle for stop().
 */
class AudioSink
{
public:
    virtual ~AudioSink() = default;

    virtual Result<int> schedule(const AudioBuffer& buffer, double whenSec, double offsetSec) = 0;
    virtual void stop(int handle) = 0;
    virtual double currentTimeSec() const = 0;
};

} // namespace montage
