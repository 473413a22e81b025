#pragma once

#include <montage/clips/abstract_clip.h>
#include <montage/common/errors.h>
#include <montage/session/engine_context.h>

#include <QList>
#include <QObject>
#include <QString>

#include <memory>
#include <vector>

namespace montage {

enum class PlaybackState {
    Stopped,
    Playing,
    Paused
};

/**
 * Timeline: the editing session
 *
 * Owns every clip and the EngineContext they share, holds the playback
 * clock, and performs ripple edits: when a clip's duration changes, clips that
 * started at or after its old end move by the same amount.
 * Clips are rendered in insertion order, later clips on top.
 */
class Timeline : public QObject
{
    Q_OBJECT

public:
    explicit Timeline(const EngineContext& context, QObject* parent = nullptr);
    ~Timeline() override;

    const EngineContext& context() const { return m_context; }
    const EngineSettings& settings() const { return m_context.settings; }

    // Clip management
    AbstractClip* addClip(std::unique_ptr<AbstractClip> clip);
    bool removeClip(const QString& clipId);
    AbstractClip* clip(const QString& clipId) const;
    QList<AbstractClip*> clips() const;
    QList<AbstractClip*> clipsOfKind(ClipKind kind) const;
    int clipCount() const { return static_cast<int>(m_clips.size()); }
    double totalDurationMs() const;

    // Playback clock
    void play();
    void pause();
    void stop();
    void seek(double timeMs);
    double currentTime() const { return m_currentTime; }
    PlaybackState playbackState() const { return m_playbackState; }
    bool isPlaying() const { return m_playbackState == PlaybackState::Playing; }

    // Compose every visible clip onto out
    void render(RenderSurface& out, double currentTime, bool playing);
    void renderCurrent(RenderSurface& out);

    /**
     * Split a clip; the first half is inserted just before the receiver
     * Algorithm: Find clip → Split → Insert first half → Notify
     */
    Result<AbstractClip*> splitClip(const QString& clipId, double splitTime);

    /**
     * Ripple-delete a clip-local range and close the gap downstream
     * Algorithm: Find clip → Remember end → Cut → Shift later clips by the duration change
     */
    Result<void> removeInterval(const QString& clipId, double startSec, double endSec);
    Result<void> setClipSpeed(const QString& clipId, double speed);
    Result<void> adjustClipDuration(const QString& clipId, double diffMs);

signals:
    void clipAdded(const QString& clipId);
    void clipRemoved(const QString& clipId);
    void clipLoadUpdated(const QString& clipId, int progress);
    void timelineChanged();
    void playbackStateChanged(PlaybackState state);
    void currentTimeChanged(double timeMs);

private:
    template<typename Edit>
    Result<void> applyRippleEdit(const QString& clipId, const char* operation, Edit edit);

    void shiftClipsAfterPosition(double position, double offset, const AbstractClip* edited);
    void disconnectAudio();
    std::vector<std::unique_ptr<AbstractClip>>::iterator findClip(const QString& clipId);

    EngineContext m_context;
    std::vector<std::unique_ptr<AbstractClip>> m_clips;

    PlaybackState m_playbackState = PlaybackState::Stopped;
    double m_currentTime = 0.0;
};

} // namespace montage

Q_DECLARE_METATYPE(montage::PlaybackState)
