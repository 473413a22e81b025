#include <montage/clips/composed_clip.h>

#include <QLoggingCategory>

#include <algorithm>

Q_LOGGING_CATEGORY(montageComposed, "montage.clip.composed")

namespace montage {

namespace {

// Split and clone keep the concrete type of the clip they are called on
template<typename T>
std::unique_ptr<T> downcastClip(std::unique_ptr<AbstractClip> clip)
{
    return std::unique_ptr<T>(static_cast<T*>(clip.release()));
}

} // namespace

Result<std::unique_ptr<ComposedClip>> ComposedClip::create(std::unique_ptr<VideoClip> video,
                                                           std::unique_ptr<AudioClip> audio,
                                                           const EngineSettings& settings)
{
    if (!video || !audio) {
        return Error::invalid_arg("Composed clip needs both a video and an audio clip");
    }
    std::unique_ptr<ComposedClip> clip(new ComposedClip(std::move(video), std::move(audio), settings));
    return Result<std::unique_ptr<ComposedClip>>(std::move(clip));
}

ComposedClip::ComposedClip(std::unique_ptr<VideoClip> video, std::unique_ptr<AudioClip> audio,
                           const EngineSettings& settings)
    : AbstractClip(ClipKind::Composed, video->name(), settings,
                   std::max(video->totalDurationMs(), audio->totalDurationMs()))
    , m_video(std::move(video))
    , m_audio(std::move(audio))
{
    m_audio->setStartTime(m_video->startTime());
    setSize(m_video->width(), m_video->height());
    syncFromInner();
    watchInnerClips();
}

ComposedClip::~ComposedClip() = default;

void ComposedClip::watchInnerClips()
{
    auto onInnerUpdate = [this](int progress, AbstractClip* inner) {
        if (progress < 0) {
            reportSourceFailure(Error::source_missing("Source of " + inner->name().toStdString() + " failed"));
            return;
        }
        syncFromInner();
    };
    m_video->setLoadUpdateListener(onInnerUpdate);
    m_audio->setLoadUpdateListener(onInnerUpdate);
}

void ComposedClip::syncFromInner()
{
    m_startTime = m_video->startTime();
    m_totalDurationMs = std::max(m_video->totalDurationMs(), m_audio->totalDurationMs());
    setReady(m_video->isReady() && m_audio->isReady());
}

void ComposedClip::clearEditGuard()
{
    m_processedEdits.clear();
}

void ComposedClip::setStartTime(double startTime)
{
    m_video->setStartTime(startTime);
    m_audio->setStartTime(startTime);
    syncFromInner();
}

std::optional<Frame> ComposedClip::getFrame(double referenceTime) const
{
    return m_video->getFrame(referenceTime);
}

void ComposedClip::update(const LayerChange& change, double referenceTime)
{
    m_video->update(change, referenceTime);
    m_audio->update(change, referenceTime);
}

void ComposedClip::render(RenderSurface& out, double currentTime, bool playing)
{
    m_video->render(out, currentTime, playing);
    m_audio->render(out, currentTime, playing);
}

Result<void> ComposedClip::validateSplit(double splitTime) const
{
    Result<void> own = AbstractClip::validateSplit(splitTime);
    if (own.is_error()) {
        return own;
    }
    Result<void> video = m_video->validateSplit(splitTime);
    if (video.is_error()) {
        return video;
    }
    return m_audio->validateSplit(splitTime);
}

Result<std::unique_ptr<AbstractClip>> ComposedClip::split(double splitTime)
{
    // Algorithm: Validate both tracks → Split video → Split audio → Re-derive placement from video
    Result<void> valid = validateSplit(splitTime);
    if (valid.is_error()) {
        qCWarning(montageComposed) << "Cannot split" << name() << "at" << splitTime << ":"
                                   << valid.error().message.c_str();
        return valid.error();
    }

    Result<std::unique_ptr<AbstractClip>> videoHalf = m_video->split(splitTime);
    if (videoHalf.is_error()) {
        return videoHalf.error();
    }
    Result<std::unique_ptr<AbstractClip>> audioHalf = m_audio->split(splitTime);
    if (audioHalf.is_error()) {
        qCCritical(montageComposed) << "Audio split failed after video split of" << name() << ":"
                                    << audioHalf.error().message.c_str();
        return Error::internal("Audio track could not follow video split: " + audioHalf.error().message);
    }

    auto firstVideo = downcastClip<VideoClip>(std::move(videoHalf.value()));
    auto firstAudio = downcastClip<AudioClip>(std::move(audioHalf.value()));
    firstAudio->setStartTime(firstVideo->startTime());
    m_audio->setStartTime(m_video->startTime());

    std::unique_ptr<AbstractClip> firstHalf(
        new ComposedClip(std::move(firstVideo), std::move(firstAudio), m_settings));
    firstHalf->setName(name() + " [Split]");

    syncFromInner();
    clearEditGuard();
    markStructuralEdit();

    qCInfo(montageComposed) << "Split" << name() << "at" << splitTime;
    return Result<std::unique_ptr<AbstractClip>>(std::move(firstHalf));
}

Result<void> ComposedClip::removeInterval(double startSec, double endSec)
{
    // Algorithm: Check edit guard → Cut video → Cut audio → Record edit → AND of both results
    const QString key = QString("removeInterval:%1:%2").arg(startSec, 0, 'g', 12).arg(endSec, 0, 'g', 12);
    if (m_processedEdits.contains(key)) {
        qCInfo(montageComposed) << "Ignoring repeated" << key << "on" << name();
        return Result<void>();
    }

    Result<void> video = m_video->removeInterval(startSec, endSec);
    Result<void> audio = m_audio->removeInterval(startSec, endSec);

    if (video.is_ok() || audio.is_ok()) {
        m_processedEdits.insert(key);
        syncFromInner();
        markStructuralEdit();
    }

    if (video.is_error()) {
        qCWarning(montageComposed) << "Video cut failed on" << name() << ":" << video.error().message.c_str();
        return video;
    }
    if (audio.is_error()) {
        qCWarning(montageComposed) << "Audio cut failed on" << name() << ":" << audio.error().message.c_str();
        return audio;
    }
    return Result<void>();
}

Result<void> ComposedClip::adjustTotalTime(double diffMs)
{
    Q_UNUSED(diffMs)
    return Error::unsupported("Composed clip duration follows its tracks");
}

Result<void> ComposedClip::setSpeed(double speed)
{
    Result<void> video = m_video->setSpeed(speed);
    if (video.is_error()) {
        return video;
    }
    Result<void> audio = m_audio->setSpeed(speed);

    clearEditGuard();
    syncFromInner();
    markStructuralEdit();
    return audio;
}

QJsonObject ComposedClip::dump() const
{
    QJsonObject json = AbstractClip::dump();
    json["speed"] = m_video->speed();
    json["video"] = m_video->dump();
    json["audio"] = m_audio->dump();
    return json;
}

void ComposedClip::cleanup()
{
    m_video->cleanup();
    m_audio->cleanup();
    AbstractClip::cleanup();
}

void ComposedClip::init(const EngineContext& context)
{
    m_audio->init(context);
}

Result<void> ComposedClip::scheduleStart(double whenSec, double offsetSec)
{
    return m_audio->scheduleStart(whenSec, offsetSec);
}

Result<void> ComposedClip::playStart(double currentTime)
{
    return m_audio->playStart(currentTime);
}

void ComposedClip::disconnect()
{
    m_audio->disconnect();
}

bool ComposedClip::isConnected() const
{
    return m_audio->isConnected();
}

AudioBuffer ComposedClip::audioBuffer() const
{
    return m_audio->audioBuffer();
}

std::unique_ptr<AbstractClip> ComposedClip::createCloneInstance() const
{
    auto video = downcastClip<VideoClip>(m_video->clone());
    auto audio = downcastClip<AudioClip>(m_audio->clone());
    return std::unique_ptr<AbstractClip>(new ComposedClip(std::move(video), std::move(audio), m_settings));
}

} // namespace montage
