#pragma once

#include <QImage>
#include <QString>

#include <array>
#include <optional>
#include <vector>

namespace montage {

/**
 * Frame - one time-addressable slot of a clip
 *
 * Holds the spatial transform of the slot, the anchor (keyframe) flag, an
 * optional pixel payload and the index of the source frame it displays.
 * The payload is a QImage, so copies share pixel storage until written.
 */
class Frame
{
public:
    // Layout of the persisted numeric encoding
    static constexpr int ArraySize = 5;
    using RawArray = std::array<double, ArraySize>;

    Frame() = default;
    Frame(const QImage& data, double x, double y, double scale, double rotation,
          bool anchor, std::optional<int> sourceIndex = std::nullopt);

    /**
     * Decode the 5-slot layout [x, y, scale, rotation, anchorFlag]
     * Missing trailing slots take defaults; a zero or negative scale reads as 1
     */
    static Frame fromArray(const std::vector<double>& values);
    static Frame fromArray(const RawArray& values);
    RawArray toArray() const;

    Frame clone() const { return *this; }

    /**
     * Blend the transform toward other
     * Algorithm: Clamp weight → Lerp x/y/scale/rotation → Keep receiver's anchor, data and index
     */
    Frame interpolate(const Frame& other, double weight) const;

    QString toString() const;

    // Transform
    double x() const { return m_x; }
    double y() const { return m_y; }
    double scale() const { return m_scale; }
    double rotation() const { return m_rotation; }
    void setPosition(double x, double y);
    void setScale(double scale, double minScale);
    void setRotation(double degrees) { m_rotation = degrees; }

    bool anchor() const { return m_anchor; }
    void setAnchor(bool anchor) { m_anchor = anchor; }

    const QImage& data() const { return m_data; }
    bool hasData() const { return !m_data.isNull(); }
    void setData(const QImage& data) { m_data = data; }

    std::optional<int> sourceIndex() const { return m_sourceIndex; }
    void setSourceIndex(std::optional<int> index) { m_sourceIndex = index; }

    // Transform-only equality
    bool sameTransform(const Frame& other) const;

    static constexpr double DefaultMinScale = 0.1;

private:
    QImage m_data;
    double m_x = 0.0;
    double m_y = 0.0;
    double m_scale = 1.0;
    double m_rotation = 0.0;
    bool m_anchor = false;
    std::optional<int> m_sourceIndex;
};

} // namespace montage
