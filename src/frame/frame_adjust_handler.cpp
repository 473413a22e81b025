#include <montage/frame/frame_adjust_handler.h>
#include <montage/frame/frame_service.h>

#include <QLoggingCategory>
#include <QtGlobal>

#include <algorithm>
#include <cmath>

Q_LOGGING_CATEGORY(montageFrameAdjust, "montage.frame.adjust")

namespace montage {

namespace {
constexpr double kIndexEpsilon = 1e-6;
} // namespace

FrameAdjustHandler::FrameAdjustHandler(FrameService& service)
    : m_service(service)
{
}

Result<void> FrameAdjustHandler::adjustTotalTime(double diffMs)
{
    // Algorithm: Clamp new duration to one frame → Compute target count → Grow or shrink slots
    if (!std::isfinite(diffMs)) {
        return Error::invalid_arg("Duration change is not finite");
    }

    const double oneFrameMs = m_service.frameDurationMs();
    const double oldTotalMs = m_service.m_totalDurationMs;
    const double newTotalMs = std::max(oneFrameMs, oldTotalMs + diffMs);
    const int oldCount = m_service.length();
    const int newCount = targetFrameCount(newTotalMs);
    const int frameDiff = newCount - oldCount;

    m_service.m_totalDurationMs = newTotalMs;

    if (frameDiff > 0) {
        grow(frameDiff);
    } else if (frameDiff < 0) {
        if (-frameDiff >= oldCount) {
            collapseToSingleFrame();
        } else {
            shrink(-frameDiff);
        }
    }

    qCDebug(montageFrameAdjust) << "Adjusted duration" << oldTotalMs << "->"
                                << m_service.m_totalDurationMs << "ms, frames" << oldCount << "->"
                                << m_service.length();
    return Result<void>();
}

Result<void> FrameAdjustHandler::removeInterval(double startSec, double endSec)
{
    // Algorithm: Validate → Clamp to duration → Convert to indices → Splice → Reduce duration
    if (!std::isfinite(startSec) || !std::isfinite(endSec) || startSec < 0.0 || startSec >= endSec) {
        qCWarning(montageFrameAdjust) << "Invalid interval" << startSec << "-" << endSec;
        return Error::invalid_arg("Invalid interval: start must be >= 0 and before end");
    }

    const double totalSec = m_service.m_totalDurationMs / 1000.0;
    const double start = qBound(0.0, startSec, totalSec);
    const double end = qBound(0.0, endSec, totalSec);
    const int count = m_service.length();
    const double fps = m_service.m_fps;
    auto& timestamps = m_service.m_timestamps;

    int startIdx = 0;
    int endIdx = 0;
    if (timestamps.empty()) {
        startIdx = static_cast<int>(std::floor(start * fps + kIndexEpsilon));
        endIdx = static_cast<int>(std::ceil(end * fps - kIndexEpsilon));
    } else {
        // First slot captured at or after each bound
        const double slack = kIndexEpsilon / fps;
        startIdx = static_cast<int>(std::lower_bound(timestamps.begin(), timestamps.end(), start - slack)
                                    - timestamps.begin());
        endIdx = static_cast<int>(std::lower_bound(timestamps.begin(), timestamps.end(), end - slack)
                                  - timestamps.begin());
    }
    startIdx = qBound(0, startIdx, count);
    endIdx = qBound(0, endIdx, count);

    const int framesToRemove = endIdx - startIdx;
    if (framesToRemove <= 0) {
        qCDebug(montageFrameAdjust) << "Interval" << startSec << "-" << endSec << "covers no frames";
        return Error::empty_interval(startSec, endSec);
    }

    if (framesToRemove >= count) {
        collapseToSingleFrame();
        qCInfo(montageFrameAdjust) << "Interval removed every frame; kept one frame";
        return Result<void>();
    }

    double removedMs = 0.0;
    if (timestamps.empty()) {
        removedMs = (end - start) * 1000.0;
    } else {
        const double fromSec = timestamps[startIdx];
        const double toSec = endIdx < static_cast<int>(timestamps.size()) ? timestamps[endIdx] : totalSec;
        const double removedSec = std::max(0.0, toSec - fromSec);
        for (size_t i = endIdx; i < timestamps.size(); ++i) {
            timestamps[i] -= removedSec;
        }
        removedMs = removedSec * 1000.0;
    }

    m_service.slice(startIdx, framesToRemove);
    m_service.m_totalDurationMs = std::max(m_service.frameDurationMs(),
                                           m_service.m_totalDurationMs - removedMs);
    m_service.m_frames.front().setAnchor(true);

    qCInfo(montageFrameAdjust) << "Removed" << framesToRemove << "frames [" << startIdx << ","
                               << endIdx << ") duration now" << m_service.m_totalDurationMs << "ms";
    return Result<void>();
}

int FrameAdjustHandler::targetFrameCount(double newTotalMs) const
{
    const auto& timestamps = m_service.m_timestamps;
    const double fps = m_service.m_fps;

    if (timestamps.empty()) {
        // A trailing partial frame keeps its slot
        return std::max(1, static_cast<int>(std::ceil(newTotalMs / 1000.0 * fps - kIndexEpsilon)));
    }

    const double newTotalSec = newTotalMs / 1000.0;
    if (newTotalMs >= m_service.m_totalDurationMs) {
        // Extend the tail on the fps grid after the last capture time
        const double tailSec = newTotalSec - timestamps.back();
        const int extra = static_cast<int>(std::floor(tailSec * fps + kIndexEpsilon)) - 1;
        return static_cast<int>(timestamps.size()) + std::max(0, extra);
    }

    // Slots captured before the new end survive
    return static_cast<int>(std::lower_bound(timestamps.begin(), timestamps.end(), newTotalSec)
                            - timestamps.begin());
}

void FrameAdjustHandler::grow(int frameDiff)
{
    auto& frames = m_service.m_frames;
    auto& timestamps = m_service.m_timestamps;
    const Frame last = frames.back();

    for (int i = 0; i < frameDiff; ++i) {
        if (last.hasData()) {
            Frame copy = last.clone();
            copy.setAnchor(false);
            frames.push_back(copy);
        } else {
            // Default transform; hold the last source frame
            frames.emplace_back(QImage(), 0.0, 0.0, 1.0, 0.0, false, last.sourceIndex());
        }
        if (!timestamps.empty()) {
            timestamps.push_back(timestamps.back() + 1.0 / m_service.m_fps);
        }
    }
}

void FrameAdjustHandler::shrink(int framesToRemove)
{
    const int start = m_service.length() - framesToRemove;
    m_service.slice(start, framesToRemove);
}

void FrameAdjustHandler::collapseToSingleFrame()
{
    auto& frames = m_service.m_frames;
    frames.erase(frames.begin() + 1, frames.end());
    frames.front().setAnchor(true);

    auto& timestamps = m_service.m_timestamps;
    if (!timestamps.empty()) {
        timestamps.assign(1, 0.0);
    }
    m_service.m_totalDurationMs = m_service.frameDurationMs();
}

} // namespace montage
