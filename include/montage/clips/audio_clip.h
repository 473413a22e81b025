#pragma once

#include <montage/clips/abstract_clip.h>
#include <montage/media/audio_buffer.h>
#include <montage/media/audio_source.h>

#include <memory>

namespace montage {

/**
 * AudioClip - PCM from an AudioFrameSource played through the session's AudioSink
 *
 * The clip keeps its own edited copy of the source buffer (source time, 1x).
 * Playback at another speed uses a buffer re-derived by the TimeStretcher,
 * rebuilt whenever the speed differs from the one it was made for.
 */
class AudioClip : public AbstractClip, public AudioCapable
{
public:
    AudioClip(const QString& name, std::shared_ptr<AudioFrameSource> source, const EngineSettings& settings);
    ~AudioClip() override;

    void render(RenderSurface& out, double currentTime, bool playing) override;

    Result<void> validateSplit(double splitTime) const override;
    Result<void> removeInterval(double startSec, double endSec) override;

    // Duration follows the audio buffer; refused
    Result<void> adjustTotalTime(double diffMs) override;
    Result<void> setSpeed(double speed) override;

    // AudioCapable
    void init(const EngineContext& context) override;
    Result<void> scheduleStart(double whenSec, double offsetSec) override;
    Result<void> playStart(double currentTime) override;
    void disconnect() override;
    bool isConnected() const override { return m_playbackHandle >= 0; }
    AudioBuffer audioBuffer() const override { return m_buffer; }

    AudioCapable* asAudioCapable() override { return this; }

    double originalDurationMs() const { return m_buffer.durationMs(); }

    void cleanup() override;

protected:
    std::unique_ptr<AbstractClip> createCloneInstance() const override;
    Result<void> performSplit(AbstractClip& firstHalf, double localMs) override;

private:
    // Rebuild m_playbackBuffer for the current speed
    Result<void> preparePlaybackBuffer();
    void syncDurationFromBuffer();

    std::shared_ptr<AudioFrameSource> m_source;
    AudioBuffer m_buffer;
    AudioBuffer m_playbackBuffer;
    double m_playbackSpeed = 0.0;

    AudioSink* m_sink = nullptr;
    TimeStretcher* m_stretcher = nullptr;
    int m_playbackHandle = -1;
    double m_connectedSpeed = 0.0;
};

} // namespace montage
