#pragma once

#include <montage/common/errors.h>

#include <memory>

namespace montage {

class AbstractClip;
class AudioBuffer;
class RenderSurface;
struct EngineContext;

// Draws itself onto a composition target for a timeline time
class Renderable
{
public:
    virtual ~Renderable() = default;
    virtual void render(RenderSurface& out, double currentTime, bool playing) = 0;
};

// Cuts itself in two at a timeline time; the receiver keeps the second half
class Splittable
{
public:
    virtual ~Splittable() = default;
    virtual Result<std::unique_ptr<AbstractClip>> split(double splitTime) = 0;
};

// Ripple-deletes a clip-local range given in seconds
class IntervalEditable
{
public:
    virtual ~IntervalEditable() = default;
    virtual Result<void> removeInterval(double startSec, double endSec) = 0;
};

// Audio playback through the session's AudioSink
class AudioCapable
{
public:
    virtual ~AudioCapable() = default;

    virtual void init(const EngineContext& context) = 0;
    virtual Result<void> scheduleStart(double whenSec, double offsetSec) = 0;
    virtual Result<void> playStart(double currentTime) = 0;
    virtual void disconnect() = 0;
    virtual bool isConnected() const = 0;
    virtual AudioBuffer audioBuffer() const = 0;
};

} // namespace montage
