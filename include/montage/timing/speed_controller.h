#pragma once

#include <montage/common/errors.h>

namespace montage {

/**
 * Playback speed multiplier of one clip
 *
 * Owns only the numeric mapping between timeline time and source time;
 * audio pitch preservation is done by a TimeStretcher elsewhere.
 */
class SpeedController
{
public:
    static constexpr double DefaultMinSpeed = 0.1;
    static constexpr double DefaultMaxSpeed = 10.0;

    explicit SpeedController(double minSpeed = DefaultMinSpeed, double maxSpeed = DefaultMaxSpeed);

    // Clamps into [minSpeed, maxSpeed]; rejects non-finite and non-positive input
    Result<void> setSpeed(double speed);
    double speed() const { return m_speed; }
    bool isNormalSpeed() const;

    // originalMs / speed
    double getEffectiveDuration(double originalMs) const;

    // startTime + (t - startTime) * speed
    double mapReferenceTime(double referenceTime, double startTime) const;

    // Inverse of getEffectiveDuration, for edits expressed in timeline time
    double toSourceDuration(double timelineMs) const { return timelineMs * m_speed; }

    double minSpeed() const { return m_minSpeed; }
    double maxSpeed() const { return m_maxSpeed; }

private:
    double m_speed = 1.0;
    double m_minSpeed;
    double m_maxSpeed;
};

} // namespace montage
