#include <montage/frame/frame_service.h>
#include <montage/frame/frame_adjust_handler.h>

#include <QLoggingCategory>
#include <QtGlobal>

#include <algorithm>
#include <cmath>

Q_LOGGING_CATEGORY(montageFrames, "montage.frames")

namespace montage {

namespace {

// Absorbs binary rounding in time x fps products (0.7 * 30 = 20.999...)
constexpr double kIndexEpsilon = 1e-6;

} // namespace

FrameService::FrameService(double totalDurationMs, double fps, std::vector<double> timestamps)
    : m_timestamps(std::move(timestamps))
    , m_totalDurationMs(totalDurationMs)
    , m_fps(fps > 0.0 ? fps : 30.0)
{
    // Algorithm: Count slots (timestamps or duration x fps) → Default transforms → Anchor slot 0
    int count = 0;
    if (!m_timestamps.empty()) {
        count = static_cast<int>(m_timestamps.size());
    } else {
        count = static_cast<int>(std::ceil(totalDurationMs / 1000.0 * m_fps - kIndexEpsilon));
    }
    count = std::max(count, 1);

    m_frames.reserve(count);
    for (int i = 0; i < count; ++i) {
        m_frames.emplace_back(QImage(), 0.0, 0.0, 1.0, 0.0, false, i);
    }
    m_frames.front().setAnchor(true);

    if (m_totalDurationMs <= 0.0) {
        m_totalDurationMs = frameDurationMs();
    }

    qCDebug(montageFrames) << "Created" << count << "frames for" << m_totalDurationMs << "ms at"
                           << m_fps << "fps" << (hasTimestamps() ? "(timestamped)" : "");
}

std::optional<Frame> FrameService::getFrame(double referenceTime, double startTime) const
{
    const std::optional<int> slot = slotAt(referenceTime, startTime);
    if (!slot) {
        return std::nullopt;
    }

    const int index = *slot;

    Frame frame = m_frames[index].clone();
    if (index + 1 < length()) {
        const double current = getTime(index, startTime);
        const double next = getTime(index + 1, startTime);
        const double span = next - current;
        const double weight = span > 0.0 ? (referenceTime - current) / span : 0.0;
        frame = frame.interpolate(m_frames[index + 1], weight);
    }
    return frame;
}

int FrameService::getIndex(double currentTime, double startTime) const
{
    const double localSec = (currentTime - startTime) / 1000.0;

    if (m_timestamps.empty()) {
        return static_cast<int>(std::floor(localSec * m_fps + kIndexEpsilon));
    }

    if (localSec <= m_timestamps.front()) {
        return 0;
    }
    if (localSec >= m_timestamps.back()) {
        return static_cast<int>(m_timestamps.size()) - 1;
    }

    // Last timestamp <= localSec
    auto it = std::upper_bound(m_timestamps.begin(), m_timestamps.end(), localSec + kIndexEpsilon / m_fps);
    return static_cast<int>(std::distance(m_timestamps.begin(), it)) - 1;
}

std::optional<int> FrameService::slotAt(double currentTime, double startTime) const
{
    const double localMs = currentTime - startTime;
    if (localMs < 0.0 || localMs >= m_totalDurationMs || m_frames.empty()) {
        return std::nullopt;
    }
    // The last slot also covers a trailing partial frame
    return qBound(0, getIndex(currentTime, startTime), length() - 1);
}

double FrameService::getTime(int index, double startTime) const
{
    if (!m_timestamps.empty() && index >= 0 && index < static_cast<int>(m_timestamps.size())) {
        return m_timestamps[index] * 1000.0 + startTime;
    }
    if (!m_timestamps.empty() && index >= static_cast<int>(m_timestamps.size())) {
        // Past the last capture time: continue on the fps grid
        const int extra = index - static_cast<int>(m_timestamps.size()) + 1;
        return (m_timestamps.back() + extra / m_fps) * 1000.0 + startTime;
    }
    return index / m_fps * 1000.0 + startTime;
}

int FrameService::indexAtOrAfter(double localMs) const
{
    const double localSec = localMs / 1000.0;
    if (m_timestamps.empty()) {
        return static_cast<int>(std::ceil(localSec * m_fps - kIndexEpsilon));
    }
    auto it = std::lower_bound(m_timestamps.begin(), m_timestamps.end(), localSec - kIndexEpsilon / m_fps);
    return static_cast<int>(std::distance(m_timestamps.begin(), it));
}

Result<void> FrameService::adjustTotalTime(double diffMs)
{
    return FrameAdjustHandler(*this).adjustTotalTime(diffMs);
}

Result<void> FrameService::removeInterval(double startSec, double endSec)
{
    return FrameAdjustHandler(*this).removeInterval(startSec, endSec);
}

void FrameService::push(const Frame& frame)
{
    m_frames.push_back(frame);
}

void FrameService::push(const Frame::RawArray& values)
{
    Frame frame = Frame::fromArray(values);
    frame.setSourceIndex(length());
    m_frames.push_back(frame);
}

void FrameService::update(int index, const Frame& frame)
{
    if (index < 0 || index >= length()) {
        qCDebug(montageFrames) << "Ignoring update of frame" << index << "of" << length();
        return;
    }
    m_frames[index] = frame;
}

void FrameService::update(int index, const Frame::RawArray& values)
{
    if (index < 0 || index >= length()) {
        qCDebug(montageFrames) << "Ignoring update of frame" << index << "of" << length();
        return;
    }
    Frame replacement = Frame::fromArray(values);
    replacement.setData(m_frames[index].data());
    replacement.setSourceIndex(m_frames[index].sourceIndex());
    m_frames[index] = replacement;
}

void FrameService::slice(int start, int count)
{
    if (start < 0 || start >= length() || count <= 0) {
        return;
    }
    const int end = std::min(start + count, length());
    m_frames.erase(m_frames.begin() + start, m_frames.begin() + end);
    if (start < static_cast<int>(m_timestamps.size())) {
        const int tsEnd = std::min(end, static_cast<int>(m_timestamps.size()));
        m_timestamps.erase(m_timestamps.begin() + start, m_timestamps.begin() + tsEnd);
    }
}

void FrameService::setAnchor(int index)
{
    if (index < 0 || index >= length()) {
        return;
    }
    m_frames[index].setAnchor(true);
}

bool FrameService::isAnchor(int index) const
{
    if (index < 0 || index >= length()) {
        return false;
    }
    return m_frames[index].anchor();
}

std::optional<Frame> FrameService::frameAt(int index) const
{
    if (index < 0 || index >= length()) {
        return std::nullopt;
    }
    return m_frames[index];
}

FrameService FrameService::splitFront(int index, double frontDurationMs)
{
    // Algorithm: Clamp index so both halves keep a slot → Move front slots → Rebase timestamps
    FrameService front;
    front.m_fps = m_fps;
    front.m_totalDurationMs = frontDurationMs;

    if (length() < 2) {
        front.m_frames = m_frames;
        front.m_timestamps = m_timestamps;
    } else {
        const int splitIndex = qBound(1, index, length() - 1);
        front.m_frames.assign(m_frames.begin(), m_frames.begin() + splitIndex);
        m_frames.erase(m_frames.begin(), m_frames.begin() + splitIndex);

        if (!m_timestamps.empty()) {
            front.m_timestamps.assign(m_timestamps.begin(), m_timestamps.begin() + splitIndex);
            m_timestamps.erase(m_timestamps.begin(), m_timestamps.begin() + splitIndex);
            const double offsetSec = frontDurationMs / 1000.0;
            for (double& ts : m_timestamps) {
                ts = std::max(0.0, ts - offsetSec);
            }
        }
    }

    m_totalDurationMs = std::max(m_totalDurationMs - frontDurationMs, frameDurationMs());
    m_frames.front().setAnchor(true);

    qCDebug(montageFrames) << "Split frames:" << front.length() << "front," << length() << "back";
    return front;
}

QJsonArray FrameService::toJson() const
{
    QJsonArray result;
    for (const Frame& frame : m_frames) {
        QJsonArray values;
        for (double value : frame.toArray()) {
            values.append(value);
        }
        result.append(values);
    }
    return result;
}

Result<void> FrameService::restoreFromJson(const QJsonArray& frames)
{
    if (frames.size() != length()) {
        return Error::invalid_arg("Snapshot has " + std::to_string(frames.size()) +
                                  " frames, service has " + std::to_string(length()));
    }

    for (int i = 0; i < frames.size(); ++i) {
        if (!frames.at(i).isArray()) {
            return Error::invalid_arg("Snapshot frame " + std::to_string(i) + " is not an array");
        }
    }

    for (int i = 0; i < frames.size(); ++i) {
        const QJsonArray values = frames.at(i).toArray();
        std::vector<double> raw;
        raw.reserve(values.size());
        for (const QJsonValue& value : values) {
            raw.push_back(value.toDouble());
        }
        Frame restored = Frame::fromArray(raw);
        restored.setData(m_frames[i].data());
        restored.setSourceIndex(m_frames[i].sourceIndex());
        m_frames[i] = restored;
    }
    return Result<void>();
}

} // namespace montage
