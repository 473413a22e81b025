#include <montage/clips/image_clip.h>

#include <QLoggingCategory>

Q_LOGGING_CATEGORY(montageImage, "montage.clip.image")

namespace montage {

ImageClip::ImageClip(const QString& name, std::shared_ptr<FrameSource> source,
                     const EngineSettings& settings)
    : AbstractClip(ClipKind::Image, name, settings, settings.flexibleDurationMs)
    , m_source(std::move(source))
{
    if (!m_source) {
        qCWarning(montageImage) << "Image clip" << name << "created without a source";
        return;
    }

    Result<QImage> decoded = m_source->frameAtIndex(0, false);
    if (decoded.is_error()) {
        reportSourceFailure(decoded.error());
        return;
    }
    if (decoded.value().isNull()) {
        qCDebug(montageImage) << "Image" << name << "not decoded yet";
        return;
    }
    attachImage(decoded.value());
}

ImageClip::ImageClip(const QString& name, std::shared_ptr<FrameSource> source, const QImage& image,
                     const EngineSettings& settings)
    : AbstractClip(ClipKind::Image, name, settings, settings.flexibleDurationMs)
    , m_source(std::move(source))
{
    if (!image.isNull()) {
        attachImage(image);
    }
}

ImageClip::~ImageClip() = default;

void ImageClip::attachImage(const QImage& image)
{
    m_image = image;
    for (int i = 0; i < m_frameService.length(); ++i) {
        Frame frame = *m_frameService.frameAt(i);
        frame.setData(image);
        m_frameService.update(i, frame);
    }
    setSize(image.width(), image.height());
    m_surface.drawImage(image);
    setReady(true);
}

std::unique_ptr<AbstractClip> ImageClip::createCloneInstance() const
{
    return std::unique_ptr<AbstractClip>(new ImageClip(name(), m_source, m_image, m_settings));
}

bool ImageClip::drawContent(const Frame& frame, double currentTime, bool playing)
{
    Q_UNUSED(currentTime)
    Q_UNUSED(playing)
    const QImage& pixels = frame.hasData() ? frame.data() : m_image;
    if (pixels.isNull()) {
        return false;
    }
    m_surface.clearRect();
    m_surface.drawImage(pixels);
    return true;
}

} // namespace montage
