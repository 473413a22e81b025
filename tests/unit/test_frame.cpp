// Frame: construction, array encoding, interpolation and scale clamping

#include <QtTest>

#include <montage/frame/frame.h>

using namespace montage;

class TestFrame : public QObject
{
    Q_OBJECT

private slots:
    void test_default_frame() {
        Frame frame;
        QCOMPARE(frame.x(), 0.0);
        QCOMPARE(frame.y(), 0.0);
        QCOMPARE(frame.scale(), 1.0);
        QCOMPARE(frame.rotation(), 0.0);
        QVERIFY(!frame.anchor());
        QVERIFY(!frame.hasData());
        QVERIFY(!frame.sourceIndex().has_value());
    }

    void test_non_positive_scale_is_replaced() {
        Frame frame(QImage(), 0, 0, 0.0, 0, false);
        QCOMPARE(frame.scale(), Frame::DefaultMinScale);
    }

    void test_array_round_trip() {
        Frame frame(QImage(), 12.5, -4.0, 1.5, 90.0, true, 7);
        const Frame::RawArray raw = frame.toArray();
        QCOMPARE(raw[0], 12.5);
        QCOMPARE(raw[1], -4.0);
        QCOMPARE(raw[2], 1.5);
        QCOMPARE(raw[3], 90.0);
        QCOMPARE(raw[4], 1.0);

        Frame decoded = Frame::fromArray(raw);
        QVERIFY(decoded.sameTransform(frame));
        QVERIFY(decoded.anchor());
        // The array carries no source frame
        QVERIFY(!decoded.sourceIndex().has_value());
    }

    void test_from_short_array_uses_defaults() {
        Frame frame = Frame::fromArray(std::vector<double>{3.0, 4.0});
        QCOMPARE(frame.x(), 3.0);
        QCOMPARE(frame.y(), 4.0);
        QCOMPARE(frame.scale(), 1.0);
        QCOMPARE(frame.rotation(), 0.0);
        QVERIFY(!frame.anchor());
    }

    void test_from_array_zero_scale_reads_as_one() {
        Frame frame = Frame::fromArray(Frame::RawArray{0, 0, 0, 0, 0});
        QCOMPARE(frame.scale(), 1.0);
    }

    void test_interpolate_endpoints() {
        Frame a(QImage(), 0, 0, 1.0, 0, true, 1);
        Frame b(QImage(), 100, 50, 2.0, 90, false, 2);

        Frame atZero = a.interpolate(b, 0.0);
        QVERIFY(atZero.sameTransform(a));

        Frame atOne = a.interpolate(b, 1.0);
        QVERIFY(atOne.sameTransform(b));
        // Receiver keeps its own identity
        QCOMPARE(atOne.sourceIndex().value(), 1);
        QVERIFY(atOne.anchor());
    }

    void test_interpolate_midpoint_and_clamp() {
        Frame a(QImage(), 0, 0, 1.0, 0, false);
        Frame b(QImage(), 10, 20, 3.0, 40, false);

        Frame mid = a.interpolate(b, 0.5);
        QCOMPARE(mid.x(), 5.0);
        QCOMPARE(mid.y(), 10.0);
        QCOMPARE(mid.scale(), 2.0);
        QCOMPARE(mid.rotation(), 20.0);

        QVERIFY(a.interpolate(b, 2.0).sameTransform(b));
        QVERIFY(a.interpolate(b, -1.0).sameTransform(a));
    }

    void test_set_scale_clamps_to_minimum() {
        Frame frame;
        frame.setScale(0.01, 0.1);
        QCOMPARE(frame.scale(), 0.1);
        frame.setScale(2.0, 0.1);
        QCOMPARE(frame.scale(), 2.0);
    }

    void test_clone_shares_pixels_until_written() {
        QImage image(4, 4, QImage::Format_ARGB32_Premultiplied);
        image.fill(Qt::red);
        Frame frame(image, 0, 0, 1, 0, false, 0);
        Frame copy = frame.clone();
        QCOMPARE(copy.data().constBits(), frame.data().constBits());

        copy.setPosition(5, 6);
        QCOMPARE(frame.x(), 0.0);
        QCOMPARE(copy.x(), 5.0);
    }

    void test_to_string_mentions_fields() {
        Frame frame(QImage(), 1, 2, 1, 0, true, 3);
        const QString text = frame.toString();
        QVERIFY(text.contains("anchor=true"));
        QVERIFY(text.contains("index=3"));
    }
};

QTEST_MAIN(TestFrame)
#include "test_frame.moc"
