#include <montage/clips/audio_clip.h>
#include <montage/session/engine_context.h>

#include <QLoggingCategory>

#include <algorithm>
#include <cmath>

Q_LOGGING_CATEGORY(montageAudioClip, "montage.clip.audio")

namespace montage {

namespace {

double sourceDurationOf(const std::shared_ptr<AudioFrameSource>& source)
{
    if (!source) {
        return 0.0;
    }
    const AudioBuffer buffer = source->audioBuffer();
    return buffer.isNull() ? source->metadata().totalDurationMs : buffer.durationMs();
}

} // namespace

AudioClip::AudioClip(const QString& name, std::shared_ptr<AudioFrameSource> source,
                     const EngineSettings& settings)
    : AbstractClip(ClipKind::Audio, name, settings, sourceDurationOf(source))
    , m_source(std::move(source))
{
    if (m_source) {
        m_buffer = m_source->audioBuffer();
    }

    if (!m_buffer.isNull()) {
        syncDurationFromBuffer();
        setReady(true);
    } else {
        qCWarning(montageAudioClip) << "Audio clip" << name << "has no decoded buffer";
    }
}

AudioClip::~AudioClip()
{
    disconnect();
}

void AudioClip::render(RenderSurface& out, double currentTime, bool playing)
{
    Q_UNUSED(out)
    // Algorithm: Gate on ready/visible/playing → Reconnect on speed change → Start playback
    if (!isReady() || !isLayerVisible(currentTime) || !playing) {
        return;
    }

    if (isConnected() && m_connectedSpeed != speed()) {
        qCDebug(montageAudioClip) << "Speed changed; reconnecting" << name();
        disconnect();
    }

    if (!isConnected()) {
        Result<void> started = playStart(currentTime);
        if (started.is_error()) {
            qCDebug(montageAudioClip) << "Playback of" << name() << "not started:"
                                      << started.error().message.c_str();
            return;
        }
    }

    if (shouldReRender(currentTime)) {
        updateRenderCache(currentTime);
    }
}

Result<void> AudioClip::validateSplit(double splitTime) const
{
    if (m_buffer.isNull()) {
        return Error::source_missing("Audio clip has no buffer: " + name().toStdString());
    }
    return AbstractClip::validateSplit(splitTime);
}

Result<void> AudioClip::removeInterval(double startSec, double endSec)
{
    // Algorithm: Require buffer → Cut frame slots → Cut samples → Resync duration
    if (m_buffer.isNull()) {
        qCWarning(montageAudioClip) << "Cannot cut" << name() << ": no audio buffer";
        return Error::source_missing("Audio clip has no buffer: " + name().toStdString());
    }

    Result<void> removed = AbstractClip::removeInterval(startSec, endSec);
    if (removed.is_error()) {
        return removed;
    }

    const double sourceStartSec = toSourceMs(startSec * 1000.0) / 1000.0;
    const double sourceEndSec = toSourceMs(endSec * 1000.0) / 1000.0;
    m_buffer = m_buffer.removeInterval(sourceStartSec, sourceEndSec);
    syncDurationFromBuffer();

    disconnect();
    m_playbackBuffer = AudioBuffer();
    m_playbackSpeed = 0.0;
    return Result<void>();
}

Result<void> AudioClip::adjustTotalTime(double diffMs)
{
    Q_UNUSED(diffMs)
    qCWarning(montageAudioClip) << "Duration of audio clip" << name() << "follows its samples";
    return Error::unsupported("Audio clip duration cannot be adjusted");
}

Result<void> AudioClip::setSpeed(double speed)
{
    Result<void> applied = AbstractClip::setSpeed(speed);
    if (applied.is_error()) {
        return applied;
    }
    m_playbackBuffer = AudioBuffer();
    m_playbackSpeed = 0.0;
    return Result<void>();
}

void AudioClip::init(const EngineContext& context)
{
    if (isConnected() && m_sink != context.audioSink) {
        disconnect();
    }
    m_sink = context.audioSink;
    m_stretcher = context.timeStretcher;
}

Result<void> AudioClip::scheduleStart(double whenSec, double offsetSec)
{
    if (!isReady()) {
        return Error::not_ready("Audio clip is not ready: " + name().toStdString());
    }
    if (!m_sink) {
        return Error::source_missing("No audio output for " + name().toStdString());
    }

    Result<void> prepared = preparePlaybackBuffer();
    if (prepared.is_error()) {
        return prepared;
    }

    disconnect();
    Result<int> handle = m_sink->schedule(m_playbackBuffer, whenSec, std::max(0.0, offsetSec));
    if (handle.is_error()) {
        qCWarning(montageAudioClip) << "Audio output refused" << name() << ":"
                                    << handle.error().message.c_str();
        return handle.error();
    }

    m_playbackHandle = handle.value();
    m_connectedSpeed = speed();
    qCDebug(montageAudioClip) << "Scheduled" << name() << "at" << whenSec << "offset" << offsetSec;
    return Result<void>();
}

Result<void> AudioClip::playStart(double currentTime)
{
    if (!m_sink) {
        return Error::source_missing("No audio output for " + name().toStdString());
    }
    const double offsetSec = (currentTime - startTime()) / 1000.0;
    return scheduleStart(m_sink->currentTimeSec(), offsetSec);
}

void AudioClip::disconnect()
{
    if (m_playbackHandle >= 0 && m_sink) {
        m_sink->stop(m_playbackHandle);
    }
    m_playbackHandle = -1;
    m_connectedSpeed = 0.0;
}

void AudioClip::cleanup()
{
    disconnect();
    if (m_source && m_source.use_count() == 1) {
        m_source->cleanup();
    }
    m_source.reset();
    AbstractClip::cleanup();
}

std::unique_ptr<AbstractClip> AudioClip::createCloneInstance() const
{
    auto copy = std::make_unique<AudioClip>(name(), m_source, m_settings);
    copy->m_buffer = m_buffer;
    copy->m_sink = m_sink;
    copy->m_stretcher = m_stretcher;
    return copy;
}

Result<void> AudioClip::performSplit(AbstractClip& firstHalf, double localMs)
{
    // Algorithm: Cut buffer at the source-time sample boundary → Split frame slots → Drop playback
    auto& first = static_cast<AudioClip&>(firstHalf);

    const int32_t rate = m_buffer.sampleRate();
    const double boundarySec = std::llround(toSourceMs(localMs) / 1000.0 * rate) / static_cast<double>(rate);
    const double endSec = m_buffer.durationMs() / 1000.0;

    const AudioBuffer front = m_buffer.segment(0.0, boundarySec);
    const AudioBuffer back = m_buffer.segment(boundarySec, endSec);

    Result<void> split = AbstractClip::performSplit(firstHalf, localMs);
    if (split.is_error()) {
        return split;
    }

    disconnect();
    first.m_buffer = front;
    m_buffer = back;
    m_playbackBuffer = AudioBuffer();
    m_playbackSpeed = 0.0;
    return Result<void>();
}

Result<void> AudioClip::preparePlaybackBuffer()
{
    if (!m_playbackBuffer.isNull() && m_playbackSpeed == speed()) {
        return Result<void>();
    }

    if (m_speed.isNormalSpeed()) {
        m_playbackBuffer = m_buffer;
    } else {
        if (!m_stretcher) {
            qCWarning(montageAudioClip) << "No time stretcher for" << name() << "at speed" << speed();
            return Error::unsupported("Playback at speed " + std::to_string(speed()) +
                                      " needs a time stretcher");
        }
        Result<AudioBuffer> stretched = m_stretcher->stretch(m_buffer, speed());
        if (stretched.is_error()) {
            qCWarning(montageAudioClip) << "Time stretch of" << name() << "failed:"
                                        << stretched.error().message.c_str();
            return stretched.error();
        }
        m_playbackBuffer = stretched.value();
    }
    m_playbackSpeed = speed();
    return Result<void>();
}

void AudioClip::syncDurationFromBuffer()
{
    m_frameService.setTotalDurationMs(std::max(m_buffer.durationMs(), m_frameService.frameDurationMs()));
    syncDurationFromFrames();
}

} // namespace montage
