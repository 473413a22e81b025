// SpeedController: clamping, rejection and time mapping

#include <QtTest>

#include <montage/timing/speed_controller.h>

#include <limits>

using namespace montage;

class TestSpeedController : public QObject
{
    Q_OBJECT

private slots:
    void test_default_is_normal_speed() {
        SpeedController speed;
        QCOMPARE(speed.speed(), 1.0);
        QVERIFY(speed.isNormalSpeed());
        QCOMPARE(speed.getEffectiveDuration(10000.0), 10000.0);
    }

    void test_effective_duration() {
        SpeedController speed;
        QVERIFY(speed.setSpeed(2.0).is_ok());
        QCOMPARE(speed.getEffectiveDuration(10000.0), 5000.0);
        QVERIFY(speed.setSpeed(0.5).is_ok());
        QCOMPARE(speed.getEffectiveDuration(10000.0), 20000.0);
        QCOMPARE(speed.toSourceDuration(20000.0), 10000.0);
    }

    void test_map_reference_time() {
        SpeedController speed;
        QVERIFY(speed.setSpeed(2.0).is_ok());
        QCOMPARE(speed.mapReferenceTime(1500.0, 1000.0), 2000.0);
        QCOMPARE(speed.mapReferenceTime(1000.0, 1000.0), 1000.0);
    }

    void test_clamps_into_range() {
        SpeedController speed(0.25, 4.0);
        QVERIFY(speed.setSpeed(100.0).is_ok());
        QCOMPARE(speed.speed(), 4.0);
        QVERIFY(speed.setSpeed(0.01).is_ok());
        QCOMPARE(speed.speed(), 0.25);
    }

    void test_rejects_invalid_speed() {
        SpeedController speed;
        QVERIFY(speed.setSpeed(3.0).is_ok());

        QCOMPARE(speed.setSpeed(0.0).error().code, ErrorCode::InvalidArg);
        QCOMPARE(speed.setSpeed(-2.0).error().code, ErrorCode::InvalidArg);
        QCOMPARE(speed.setSpeed(std::numeric_limits<double>::quiet_NaN()).error().code, ErrorCode::InvalidArg);
        QCOMPARE(speed.setSpeed(std::numeric_limits<double>::infinity()).error().code, ErrorCode::InvalidArg);
        QCOMPARE(speed.speed(), 3.0);
    }
};

QTEST_MAIN(TestSpeedController)
#include "test_speed_controller.moc"
