// RenderSurface: pixel access, letterboxing and transformed compositing

#include <QtTest>

#include <montage/frame/frame.h>
#include <montage/render/render_surface.h>

using namespace montage;

class TestRenderSurface : public QObject
{
    Q_OBJECT

private:
    static QImage solid(int w, int h, const QColor& color) {
        QImage image(w, h, QImage::Format_ARGB32_Premultiplied);
        image.fill(color);
        return image;
    }

private slots:
    void test_size_and_clear() {
        RenderSurface surface(8, 6);
        QCOMPARE(surface.width(), 8);
        QCOMPARE(surface.height(), 6);
        QVERIFY(!surface.isNull());
        QCOMPARE(qAlpha(surface.image().pixel(0, 0)), 0);

        surface.fill(Qt::blue);
        QCOMPARE(QColor(surface.image().pixel(3, 3)), QColor(Qt::blue));

        surface.clearRect(QRectF(0, 0, 4, 6));
        QCOMPARE(qAlpha(surface.image().pixel(1, 1)), 0);
        QCOMPARE(QColor(surface.image().pixel(6, 1)), QColor(Qt::blue));

        surface.clearRect();
        QCOMPARE(qAlpha(surface.image().pixel(6, 1)), 0);
    }

    void test_invalid_size_is_null() {
        RenderSurface surface(0, 10);
        QVERIFY(surface.isNull());
        surface.fill(Qt::red);
        surface.drawImage(solid(2, 2, Qt::red));
        QVERIFY(surface.isNull());
    }

    void test_draw_image_stretches() {
        RenderSurface surface(10, 10);
        surface.drawImage(solid(2, 2, Qt::red));
        QCOMPARE(QColor(surface.image().pixel(2, 2)), QColor(Qt::red));
        QCOMPARE(QColor(surface.image().pixel(7, 7)), QColor(Qt::red));
    }

    void test_get_and_put_image_data() {
        RenderSurface surface(10, 10);
        surface.fill(Qt::white);
        surface.putImageData(solid(3, 3, QColor(0, 0, 0, 0)), QPoint(2, 2));
        QCOMPARE(qAlpha(surface.image().pixel(3, 3)), 0);
        QCOMPARE(QColor(surface.image().pixel(6, 6)), QColor(Qt::white));

        QImage region = surface.getImageData(QRect(2, 2, 3, 3));
        QCOMPARE(region.size(), QSize(3, 3));
        QCOMPARE(qAlpha(region.pixel(0, 0)), 0);

        QImage copy = surface.getImageData();
        surface.fill(Qt::black);
        QCOMPARE(QColor(copy.pixel(9, 9)), QColor(Qt::white));
    }

    void test_media_bounds_letterbox() {
        Frame identity;
        MediaBounds bounds = RenderSurface::calculateMediaBounds(1920, 1080, 960, 960, identity);
        QCOMPARE(bounds.ratio, 0.5);
        QCOMPARE(bounds.rect, QRectF(0, 210, 960, 540));
        QCOMPARE(bounds.center, QPointF(480, 480));
    }

    void test_media_bounds_applies_offset_and_scale() {
        Frame frame(QImage(), 100, -50, 2.0, 0, false);
        MediaBounds bounds = RenderSurface::calculateMediaBounds(1920, 1080, 960, 540, frame);
        QCOMPARE(bounds.center, QPointF(480 + 50, 270 - 25));
        QCOMPARE(bounds.rect.size(), QSizeF(1920, 1080));
    }

    void test_media_bounds_small_source_keeps_native_size() {
        Frame identity;
        MediaBounds bounds = RenderSurface::calculateMediaBounds(100, 50, 400, 400, identity);
        QCOMPARE(bounds.rect.size(), QSizeF(100, 50));
        QCOMPARE(bounds.center, QPointF(200, 200));
    }

    void test_draw_transformed_composites_centered() {
        RenderSurface content(40, 40);
        content.fill(Qt::red);
        RenderSurface target(100, 100);

        Frame identity;
        RenderSurface::drawTransformed(content, target, identity);
        QCOMPARE(QColor(target.image().pixel(50, 50)), QColor(Qt::red));
        QCOMPARE(qAlpha(target.image().pixel(5, 5)), 0);
    }

    void test_draw_transformed_moves_with_frame() {
        RenderSurface content(20, 20);
        content.fill(Qt::green);
        RenderSurface target(100, 100);

        // Offset is in source pixels, scaled by the 5x fit ratio
        Frame moved(QImage(), 6, 0, 1.0, 0, false);
        RenderSurface::drawTransformed(content, target, moved);
        QCOMPARE(qAlpha(target.image().pixel(50, 50)), 0);
        QCOMPARE(QColor(target.image().pixel(80, 50)), QColor(Qt::green));
    }
};

QTEST_MAIN(TestRenderSurface)
#include "test_render_surface.moc"
