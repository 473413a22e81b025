#include <montage/frame/frame.h>

#include <QLoggingCategory>
#include <QtGlobal>

#include <algorithm>

Q_LOGGING_CATEGORY(montageFrame, "montage.frame")

namespace montage {

Frame::Frame(const QImage& data, double x, double y, double scale, double rotation,
             bool anchor, std::optional<int> sourceIndex)
    : m_data(data)
    , m_x(x)
    , m_y(y)
    , m_scale(scale > 0.0 ? scale : DefaultMinScale)
    , m_rotation(rotation)
    , m_anchor(anchor)
    , m_sourceIndex(sourceIndex)
{
}

Frame Frame::fromArray(const std::vector<double>& values)
{
    RawArray raw = {0.0, 0.0, 1.0, 0.0, 0.0};
    const size_t count = std::min(values.size(), raw.size());
    for (size_t i = 0; i < count; ++i) {
        raw[i] = values[i];
    }
    return fromArray(raw);
}

Frame Frame::fromArray(const RawArray& values)
{
    double scale = values[2] > 0.0 ? values[2] : 1.0;
    // Transform only; the owning service assigns the source index
    return Frame(QImage(), values[0], values[1], scale, values[3], values[4] != 0.0);
}

Frame::RawArray Frame::toArray() const
{
    return {m_x, m_y, m_scale, m_rotation, m_anchor ? 1.0 : 0.0};
}

Frame Frame::interpolate(const Frame& other, double weight) const
{
    // Algorithm: Clamp weight → Lerp x/y/scale/rotation → Keep receiver's anchor, data and index
    const double w = qBound(0.0, weight, 1.0);

    Frame result(*this);
    result.m_x = m_x + (other.m_x - m_x) * w;
    result.m_y = m_y + (other.m_y - m_y) * w;
    result.m_scale = m_scale + (other.m_scale - m_scale) * w;
    result.m_rotation = m_rotation + (other.m_rotation - m_rotation) * w;
    return result;
}

QString Frame::toString() const
{
    return QString("Frame(x=%1, y=%2, scale=%3, rotation=%4, anchor=%5, index=%6)")
        .arg(m_x)
        .arg(m_y)
        .arg(m_scale)
        .arg(m_rotation)
        .arg(m_anchor ? QStringLiteral("true") : QStringLiteral("false"))
        .arg(m_sourceIndex ? QString::number(*m_sourceIndex) : QStringLiteral("none"));
}

void Frame::setPosition(double x, double y)
{
    m_x = x;
    m_y = y;
}

void Frame::setScale(double scale, double minScale)
{
    if (scale < minScale) {
        qCDebug(montageFrame) << "Clamping scale" << scale << "to" << minScale;
        scale = minScale;
    }
    m_scale = scale;
}

bool Frame::sameTransform(const Frame& other) const
{
    return qFuzzyCompare(1.0 + m_x, 1.0 + other.m_x)
        && qFuzzyCompare(1.0 + m_y, 1.0 + other.m_y)
        && qFuzzyCompare(m_scale, other.m_scale)
        && qFuzzyCompare(1.0 + m_rotation, 1.0 + other.m_rotation);
}

} // namespace montage
