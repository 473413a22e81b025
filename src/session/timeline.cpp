#include <montage/session/timeline.h>

#include <QLoggingCategory>

#include <algorithm>
#include <cmath>

Q_LOGGING_CATEGORY(montageTimeline, "montage.timeline")

namespace montage {

namespace {
// Sub-millisecond gaps left by frame rounding still count as adjacent
constexpr double kPositionToleranceMs = 0.5;
} // namespace

Timeline::Timeline(const EngineContext& context, QObject* parent)
    : QObject(parent)
    , m_context(context)
{
    qCDebug(montageTimeline, "Initializing Timeline at %.3f fps", m_context.settings.fps);
}

Timeline::~Timeline()
{
    for (auto& clip : m_clips) {
        clip->cleanup();
    }
}

AbstractClip* Timeline::addClip(std::unique_ptr<AbstractClip> clip)
{
    // Algorithm: Attach audio output → Watch loading → Store → Notify
    if (!clip) {
        qCWarning(montageTimeline, "Ignoring null clip");
        return nullptr;
    }

    if (AudioCapable* audio = clip->asAudioCapable()) {
        audio->init(m_context);
    }

    const QString clipId = clip->id();
    clip->setLoadUpdateListener([this, clipId](int progress, AbstractClip*) {
        emit clipLoadUpdated(clipId, progress);
    });

    AbstractClip* added = clip.get();
    m_clips.push_back(std::move(clip));

    qCDebug(montageTimeline, "Added %s clip %s at %.1fms", qPrintable(clipKindToString(added->kind())),
            qPrintable(added->name()), added->startTime());
    emit clipAdded(clipId);
    emit timelineChanged();
    return added;
}

bool Timeline::removeClip(const QString& clipId)
{
    auto it = findClip(clipId);
    if (it == m_clips.end()) {
        qCWarning(montageTimeline, "Cannot remove unknown clip %s", qPrintable(clipId));
        return false;
    }

    (*it)->cleanup();
    m_clips.erase(it);

    emit clipRemoved(clipId);
    emit timelineChanged();
    return true;
}

AbstractClip* Timeline::clip(const QString& clipId) const
{
    for (const auto& clip : m_clips) {
        if (clip->id() == clipId) {
            return clip.get();
        }
    }
    return nullptr;
}

QList<AbstractClip*> Timeline::clips() const
{
    QList<AbstractClip*> result;
    result.reserve(static_cast<qsizetype>(m_clips.size()));
    for (const auto& clip : m_clips) {
        result.append(clip.get());
    }
    return result;
}

QList<AbstractClip*> Timeline::clipsOfKind(ClipKind kind) const
{
    QList<AbstractClip*> result;
    for (const auto& clip : m_clips) {
        if (clip->kind() == kind) {
            result.append(clip.get());
        }
    }
    return result;
}

double Timeline::totalDurationMs() const
{
    double end = 0.0;
    for (const auto& clip : m_clips) {
        end = std::max(end, clip->endTime());
    }
    return end;
}

void Timeline::play()
{
    if (m_playbackState == PlaybackState::Playing) return;
    m_playbackState = PlaybackState::Playing;
    emit playbackStateChanged(m_playbackState);
}

void Timeline::pause()
{
    if (m_playbackState != PlaybackState::Playing) return;
    m_playbackState = PlaybackState::Paused;
    disconnectAudio();
    emit playbackStateChanged(m_playbackState);
}

void Timeline::stop()
{
    disconnectAudio();
    m_currentTime = 0.0;
    if (m_playbackState != PlaybackState::Stopped) {
        m_playbackState = PlaybackState::Stopped;
        emit playbackStateChanged(m_playbackState);
    }
    emit currentTimeChanged(m_currentTime);
}

void Timeline::seek(double timeMs)
{
    const double clamped = std::max(0.0, timeMs);
    if (clamped == m_currentTime) return;

    // Audio restarts at the new offset on the next playing render
    disconnectAudio();
    m_currentTime = clamped;
    emit currentTimeChanged(m_currentTime);
}

void Timeline::render(RenderSurface& out, double currentTime, bool playing)
{
    for (const auto& clip : m_clips) {
        clip->render(out, currentTime, playing);
    }
}

void Timeline::renderCurrent(RenderSurface& out)
{
    render(out, m_currentTime, isPlaying());
}

Result<AbstractClip*> Timeline::splitClip(const QString& clipId, double splitTime)
{
    // Algorithm: Find clip → Split → Insert first half → Notify
    auto it = findClip(clipId);
    if (it == m_clips.end()) {
        return Error::invalid_arg("Unknown clip: " + clipId.toStdString());
    }

    Result<std::unique_ptr<AbstractClip>> split = (*it)->split(splitTime);
    if (split.is_error()) {
        return split.error();
    }

    std::unique_ptr<AbstractClip> firstHalf = std::move(split.value());
    if (AudioCapable* audio = firstHalf->asAudioCapable()) {
        audio->init(m_context);
    }
    const QString firstId = firstHalf->id();
    firstHalf->setLoadUpdateListener([this, firstId](int progress, AbstractClip*) {
        emit clipLoadUpdated(firstId, progress);
    });

    AbstractClip* inserted = firstHalf.get();
    m_clips.insert(it, std::move(firstHalf));

    qCInfo(montageTimeline, "Split clip %s at %.1fms", qPrintable(clipId), splitTime);
    emit clipAdded(firstId);
    emit timelineChanged();
    return inserted;
}

Result<void> Timeline::removeInterval(const QString& clipId, double startSec, double endSec)
{
    return applyRippleEdit(clipId, "removeInterval", [startSec, endSec](AbstractClip& clip) {
        return clip.removeInterval(startSec, endSec);
    });
}

Result<void> Timeline::setClipSpeed(const QString& clipId, double speed)
{
    return applyRippleEdit(clipId, "setSpeed", [speed](AbstractClip& clip) {
        return clip.setSpeed(speed);
    });
}

Result<void> Timeline::adjustClipDuration(const QString& clipId, double diffMs)
{
    return applyRippleEdit(clipId, "adjustTotalTime", [diffMs](AbstractClip& clip) {
        return clip.adjustTotalTime(diffMs);
    });
}

template<typename Edit>
Result<void> Timeline::applyRippleEdit(const QString& clipId, const char* operation, Edit edit)
{
    // Algorithm: Find clip → Remember end → Edit → Shift later clips by the duration change
    auto it = findClip(clipId);
    if (it == m_clips.end()) {
        return Error::invalid_arg("Unknown clip: " + clipId.toStdString());
    }

    AbstractClip& target = **it;
    const double oldEnd = target.endTime();
    const double oldDuration = target.totalDurationMs();

    Result<void> result = edit(target);
    if (result.is_error()) {
        qCWarning(montageTimeline, "%s on %s rejected: %s", operation, qPrintable(clipId),
                  result.error().message.c_str());
        return result;
    }

    const double offset = target.totalDurationMs() - oldDuration;
    if (offset != 0.0) {
        shiftClipsAfterPosition(oldEnd, offset, &target);
    }

    qCDebug(montageTimeline, "%s on %s rippled by %.1fms", operation, qPrintable(clipId), offset);
    emit timelineChanged();
    return Result<void>();
}

void Timeline::shiftClipsAfterPosition(double position, double offset, const AbstractClip* edited)
{
    for (auto& clip : m_clips) {
        if (clip.get() == edited) {
            continue;
        }
        // Shift clips that start at or after the position
        if (clip->startTime() >= position - kPositionToleranceMs) {
            clip->setStartTime(std::max(0.0, clip->startTime() + offset));
        }
    }
}

void Timeline::disconnectAudio()
{
    for (auto& clip : m_clips) {
        if (AudioCapable* audio = clip->asAudioCapable()) {
            audio->disconnect();
        }
    }
}

std::vector<std::unique_ptr<AbstractClip>>::iterator Timeline::findClip(const QString& clipId)
{
    return std::find_if(m_clips.begin(), m_clips.end(), [&clipId](const std::unique_ptr<AbstractClip>& clip) {
        return clip->id() == clipId;
    });
}

} // namespace montage
