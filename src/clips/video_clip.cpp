#include <montage/clips/video_clip.h>

#include <QLoggingCategory>

Q_LOGGING_CATEGORY(montageVideo, "montage.clip.video")

namespace montage {

namespace {

FrameSourceMetadata metadataOf(const std::shared_ptr<FrameSource>& source)
{
    return source ? source->metadata() : FrameSourceMetadata();
}

} // namespace

VideoClip::VideoClip(const QString& name, std::shared_ptr<FrameSource> source,
                     const EngineSettings& settings)
    : AbstractClip(ClipKind::Video, name, settings, metadataOf(source).totalDurationMs,
                   metadataOf(source).timestamps)
    , m_source(std::move(source))
{
    const FrameSourceMetadata metadata = metadataOf(m_source);
    setSize(metadata.width, metadata.height);

    if (m_source && metadata.totalDurationMs > 0.0) {
        setReady(true);
    } else {
        qCWarning(montageVideo) << "Video clip" << name << "created without a usable source";
    }
}

VideoClip::~VideoClip() = default;

Result<QImage> VideoClip::frameAtIndex(int index, bool prefetch)
{
    if (!m_source) {
        return Error::source_missing("Video clip has no source: " + name().toStdString());
    }
    return m_source->frameAtIndex(index, prefetch);
}

void VideoClip::replaceSource(std::shared_ptr<FrameSource> source)
{
    m_source = std::move(source);
    if (!m_source) {
        return;
    }
    const FrameSourceMetadata metadata = m_source->metadata();
    setSize(metadata.width, metadata.height);
    markStructuralEdit();
    setReady(true);
    qCInfo(montageVideo) << "Relinked source of" << name();
}

void VideoClip::cleanup()
{
    // Clones and split halves share the source; the last holder releases it
    if (m_source && m_source.use_count() == 1) {
        m_source->cleanup();
    }
    m_source.reset();
    AbstractClip::cleanup();
}

std::unique_ptr<AbstractClip> VideoClip::createCloneInstance() const
{
    return std::make_unique<VideoClip>(name(), m_source, m_settings);
}

bool VideoClip::drawContent(const Frame& frame, double currentTime, bool playing)
{
    Q_UNUSED(currentTime)
    // Algorithm: Fetch source frame → Drop if clip changed meanwhile → Draw into surface
    if (!m_source) {
        return false;
    }

    const int index = frame.sourceIndex().value_or(0);
    const quint64 generation = editGeneration();
    Result<QImage> fetched = m_source->frameAtIndex(index, playing);

    if (fetched.is_error()) {
        if (fetched.error().code == ErrorCode::DecodeFailed) {
            reportSourceFailure(fetched.error());
        } else {
            qCDebug(montageVideo) << "Frame" << index << "of" << name() << "unavailable:"
                                  << fetched.error().message.c_str();
        }
        return false;
    }
    if (generation != editGeneration() || !isReady()) {
        return false;
    }
    if (fetched.value().isNull()) {
        // Still decoding
        return false;
    }

    m_surface.clearRect();
    m_surface.drawImage(fetched.value());
    return true;
}

} // namespace montage
