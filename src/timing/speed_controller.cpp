#include <montage/timing/speed_controller.h>

#include <QLoggingCategory>
#include <QtGlobal>

#include <cmath>

Q_LOGGING_CATEGORY(montageSpeed, "montage.speed")

namespace montage {

SpeedController::SpeedController(double minSpeed, double maxSpeed)
    : m_minSpeed(minSpeed > 0.0 ? minSpeed : DefaultMinSpeed)
    , m_maxSpeed(maxSpeed >= m_minSpeed ? maxSpeed : m_minSpeed)
{
}

Result<void> SpeedController::setSpeed(double speed)
{
    if (!std::isfinite(speed) || speed <= 0.0) {
        qCWarning(montageSpeed) << "Rejected playback speed" << speed;
        return Error::invalid_arg("Speed must be a positive number");
    }

    const double clamped = qBound(m_minSpeed, speed, m_maxSpeed);
    if (clamped != speed) {
        qCWarning(montageSpeed) << "Clamped playback speed" << speed << "to" << clamped;
    }
    m_speed = clamped;
    qCDebug(montageSpeed) << "Speed set to" << m_speed;
    return Result<void>();
}

bool SpeedController::isNormalSpeed() const
{
    return qFuzzyCompare(m_speed, 1.0);
}

double SpeedController::getEffectiveDuration(double originalMs) const
{
    return originalMs / m_speed;
}

double SpeedController::mapReferenceTime(double referenceTime, double startTime) const
{
    return startTime + (referenceTime - startTime) * m_speed;
}

} // namespace montage
