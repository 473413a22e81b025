#pragma once

#include <montage/common/engine_settings.h>

namespace montage {

class AudioSink;
class TimeStretcher;

/**
 * Session-owned services handed to clips
 * The pointers are not owned and may be null when no audio output exists.
 */
struct EngineContext {
    EngineSettings settings;
    AudioSink* audioSink = nullptr;
    TimeStretcher* timeStretcher = nullptr;
};

} // namespace montage
