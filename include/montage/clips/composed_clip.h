#pragma once

#include <montage/clips/abstract_clip.h>
#include <montage/clips/audio_clip.h>
#include <montage/clips/video_clip.h>

#include <QSet>
#include <QString>

#include <memory>

namespace montage {

/**
 * ComposedClip - a video clip and its audio kept in sync
 *
 * Every edit is forwarded to both inner clips; placement is taken from the
 * video clip, duration is the longer of the two. A removeInterval already
 * applied with the same bounds is acknowledged without being applied again,
 * until another kind of structural edit happens.
 */
class ComposedClip : public AbstractClip, public AudioCapable
{
public:
    static Result<std::unique_ptr<ComposedClip>> create(std::unique_ptr<VideoClip> video,
                                                        std::unique_ptr<AudioClip> audio,
                                                        const EngineSettings& settings);
    ~ComposedClip() override;

    VideoClip* video() const { return m_video.get(); }
    AudioClip* audio() const { return m_audio.get(); }

    void setStartTime(double startTime) override;
    std::optional<Frame> getFrame(double referenceTime) const override;
    void update(const LayerChange& change, double referenceTime) override;
    void render(RenderSurface& out, double currentTime, bool playing) override;

    Result<void> validateSplit(double splitTime) const override;
    Result<std::unique_ptr<AbstractClip>> split(double splitTime) override;
    Result<void> removeInterval(double startSec, double endSec) override;
    Result<void> adjustTotalTime(double diffMs) override;
    Result<void> setSpeed(double speed) override;

    QJsonObject dump() const override;
    void cleanup() override;

    // AudioCapable
    void init(const EngineContext& context) override;
    Result<void> scheduleStart(double whenSec, double offsetSec) override;
    Result<void> playStart(double currentTime) override;
    void disconnect() override;
    bool isConnected() const override;
    AudioBuffer audioBuffer() const override;

    AudioCapable* asAudioCapable() override { return this; }

protected:
    std::unique_ptr<AbstractClip> createCloneInstance() const override;

private:
    ComposedClip(std::unique_ptr<VideoClip> video, std::unique_ptr<AudioClip> audio,
                 const EngineSettings& settings);

    void watchInnerClips();
    void syncFromInner();
    void clearEditGuard();

    std::unique_ptr<VideoClip> m_video;
    std::unique_ptr<AudioClip> m_audio;
    QSet<QString> m_processedEdits;
};

} // namespace montage
