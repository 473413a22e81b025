#include <montage/render/render_surface.h>
#include <montage/frame/frame.h>

#include <QLoggingCategory>
#include <QPainter>

#include <algorithm>

Q_LOGGING_CATEGORY(montageRender, "montage.render")

namespace montage {

RenderSurface::RenderSurface(int width, int height)
{
    setSize(width, height);
}

void RenderSurface::setSize(int width, int height)
{
    if (width <= 0 || height <= 0) {
        m_image = QImage();
        return;
    }
    if (m_image.width() == width && m_image.height() == height) {
        return;
    }
    m_image = QImage(width, height, QImage::Format_ARGB32_Premultiplied);
    m_image.fill(Qt::transparent);
}

void RenderSurface::clearRect()
{
    if (!m_image.isNull()) {
        m_image.fill(Qt::transparent);
    }
}

void RenderSurface::clearRect(const QRectF& rect)
{
    if (m_image.isNull()) return;

    QPainter painter(&m_image);
    painter.setCompositionMode(QPainter::CompositionMode_Clear);
    painter.fillRect(rect, Qt::transparent);
}

void RenderSurface::fill(const QColor& color)
{
    if (!m_image.isNull()) {
        m_image.fill(color);
    }
}

void RenderSurface::drawImage(const QImage& image)
{
    if (m_image.isNull() || image.isNull()) return;

    QPainter painter(&m_image);
    painter.setRenderHint(QPainter::SmoothPixmapTransform);
    painter.drawImage(QRectF(0, 0, width(), height()), image);
}

void RenderSurface::drawImage(const QImage& image, const QRectF& target, const QRectF& source)
{
    if (m_image.isNull() || image.isNull()) return;

    QPainter painter(&m_image);
    painter.setRenderHint(QPainter::SmoothPixmapTransform);
    painter.drawImage(target, image, source);
}

void RenderSurface::putImageData(const QImage& image, const QPoint& position)
{
    if (m_image.isNull() || image.isNull()) return;

    // Replaces pixels, including alpha, like a raw copy
    QPainter painter(&m_image);
    painter.setCompositionMode(QPainter::CompositionMode_Source);
    painter.drawImage(position, image);
}

MediaBounds RenderSurface::calculateMediaBounds(int sourceWidth, int sourceHeight,
                                                int targetWidth, int targetHeight,
                                                const Frame& frame)
{
    MediaBounds bounds;
    if (sourceWidth <= 0 || sourceHeight <= 0 || targetWidth <= 0 || targetHeight <= 0) {
        return bounds;
    }

    // Letterbox with source aspect
    const double ratio = std::min(static_cast<double>(targetWidth) / sourceWidth,
                                  static_cast<double>(targetHeight) / sourceHeight);
    double baseWidth = sourceWidth * ratio;
    double baseHeight = sourceHeight * ratio;
    const double offsetX = (targetWidth - baseWidth) / 2.0;
    const double offsetY = (targetHeight - baseHeight) / 2.0;

    if (sourceWidth < targetWidth || sourceHeight < targetHeight) {
        baseWidth = sourceWidth;
        baseHeight = sourceHeight;
    }

    const double centerX = offsetX + (sourceWidth * ratio) / 2.0 + frame.x() * ratio;
    const double centerY = offsetY + (sourceHeight * ratio) / 2.0 + frame.y() * ratio;
    const double scaledWidth = baseWidth * frame.scale();
    const double scaledHeight = baseHeight * frame.scale();

    bounds.ratio = ratio;
    bounds.center = QPointF(centerX, centerY);
    bounds.rect = QRectF(centerX - scaledWidth / 2.0, centerY - scaledHeight / 2.0,
                         scaledWidth, scaledHeight);
    return bounds;
}

void RenderSurface::drawTransformed(const RenderSurface& from, RenderSurface& to, const Frame& frame)
{
    // Algorithm: Compute bounds → Translate to center → Rotate → Draw scaled
    if (from.isNull() || to.isNull()) {
        qCDebug(montageRender) << "Skipping composite onto/from empty surface";
        return;
    }

    const MediaBounds bounds = calculateMediaBounds(from.width(), from.height(),
                                                    to.width(), to.height(), frame);

    QPainter painter(&to.m_image);
    painter.setRenderHint(QPainter::SmoothPixmapTransform);
    painter.translate(bounds.center);
    if (frame.rotation() != 0.0) {
        painter.rotate(frame.rotation());
    }

    const QRectF target(-bounds.rect.width() / 2.0, -bounds.rect.height() / 2.0,
                        bounds.rect.width(), bounds.rect.height());
    painter.drawImage(target, from.m_image, QRectF(0, 0, from.width(), from.height()));
}

} // namespace montage
