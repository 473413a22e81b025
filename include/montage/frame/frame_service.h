#pragma once

#include <montage/common/errors.h>
#include <montage/frame/frame.h>

#include <QJsonArray>

#include <optional>
#include <vector>

namespace montage {

/**
 * FrameService - ordered frame slots of one clip
 *
 * Maps clip-local time to slot indices, either on a fixed fps grid or by
 * searching exact capture timestamps (variable frame rate sources).
 * All times passed in are milliseconds unless the name says Sec.
 * Index lookups tolerate out-of-range values: they return nullopt or do
 * nothing, because scrubbing routinely asks for times the clip does not cover.
 */
class FrameService
{
public:
    /**
     * Create slots for a clip of totalDurationMs
     * Algorithm: Count slots (timestamps or duration x fps) → Default transforms → Anchor slot 0
     */
    FrameService(double totalDurationMs, double fps, std::vector<double> timestamps = {});

    FrameService(const FrameService&) = default;
    FrameService& operator=(const FrameService&) = default;
    FrameService(FrameService&&) noexcept = default;
    FrameService& operator=(FrameService&&) noexcept = default;

    // Frame at referenceTime, blended toward the following slot by time distance
    std::optional<Frame> getFrame(double referenceTime, double startTime) const;

    // Slot index for currentTime; may be out of range in fixed-fps mode
    int getIndex(double currentTime, double startTime) const;

    // Slot showing currentTime, nullopt outside [0, total)
    std::optional<int> slotAt(double currentTime, double startTime) const;

    // Timeline time at which slot index begins
    double getTime(int index, double startTime) const;

    // First slot starting at or after clip-local localMs
    int indexAtOrAfter(double localMs) const;

    Result<void> adjustTotalTime(double diffMs);
    Result<void> removeInterval(double startSec, double endSec);

    // Slot editing
    void push(const Frame& frame);
    void push(const Frame::RawArray& values);
    void update(int index, const Frame& frame);
    void update(int index, const Frame::RawArray& values);
    void slice(int start, int count);
    void setAnchor(int index);
    bool isAnchor(int index) const;

    std::optional<Frame> frameAt(int index) const;
    const std::vector<Frame>& frames() const { return m_frames; }
    int length() const { return static_cast<int>(m_frames.size()); }

    /**
     * Move the slots before index into a new service covering frontDurationMs
     * Algorithm: Clamp index so both halves keep a slot → Move front slots → Rebase timestamps
     */
    FrameService splitFront(int index, double frontDurationMs);

    double totalDurationMs() const { return m_totalDurationMs; }
    void setTotalDurationMs(double durationMs) { m_totalDurationMs = durationMs; }
    double frameDurationMs() const { return 1000.0 / m_fps; }
    double fps() const { return m_fps; }

    bool hasTimestamps() const { return !m_timestamps.empty(); }
    const std::vector<double>& timestamps() const { return m_timestamps; }

    // Transform-only snapshot for undo; restore requires a matching slot count
    QJsonArray toJson() const;
    Result<void> restoreFromJson(const QJsonArray& frames);

private:
    friend class FrameAdjustHandler;

    FrameService() = default;

    std::vector<Frame> m_frames;
    std::vector<double> m_timestamps; // seconds, one per slot when present
    double m_totalDurationMs = 0.0;
    double m_fps = 30.0;
};

} // namespace montage
