#pragma once

#include <QColor>
#include <QImage>
#include <QPoint>
#include <QPointF>
#include <QRect>
#include <QRectF>

namespace montage {

class Frame;

// Placement of a source image on a destination surface
struct MediaBounds {
    QRectF rect;       // scaled, untransformed placement
    QPointF center;    // rotation pivot
    double ratio = 1.0;
};

/**
 * RenderSurface - 2D raster canvas backed by a QImage
 *
 * Each clip owns one surface holding its current content; the host passes
 * another surface as the composition target of render().
 */
class RenderSurface
{
public:
    RenderSurface() = default;
    RenderSurface(int width, int height);

    void setSize(int width, int height);
    int width() const { return m_image.width(); }
    int height() const { return m_image.height(); }
    bool isNull() const { return m_image.isNull(); }

    void clearRect();
    void clearRect(const QRectF& rect);
    void fill(const QColor& color);

    // Stretch image over the whole surface
    void drawImage(const QImage& image);
    void drawImage(const QImage& image, const QRectF& target, const QRectF& source);

    QImage getImageData() const { return m_image.copy(); }
    QImage getImageData(const QRect& rect) const { return m_image.copy(rect); }
    void putImageData(const QImage& image, const QPoint& position = QPoint());

    QImage& image() { return m_image; }
    const QImage& image() const { return m_image; }

    /**
     * Letterbox sourceWidth x sourceHeight into the destination and apply
     * the frame's offset and scale. Sources smaller than the destination keep
     * their native size.
     */
    static MediaBounds calculateMediaBounds(int sourceWidth, int sourceHeight,
                                            int targetWidth, int targetHeight,
                                            const Frame& frame);

    /**
     * Composite from onto to through the frame transform
     * Algorithm: Compute bounds → Translate to center → Rotate → Draw scaled
     */
    static void drawTransformed(const RenderSurface& from, RenderSurface& to, const Frame& frame);

private:
    QImage m_image;
};

} // namespace montage
