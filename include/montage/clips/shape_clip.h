#pragma once

#include <montage/clips/abstract_clip.h>

#include <QColor>
#include <QSize>

#include <optional>

class QPainter;

namespace montage {

enum class ShapeType {
    Ellipse,
    Square,
    Line,
    Arrow
};

struct ShapeStyle {
    QColor fillColor = QColor(0x4a, 0x90, 0xd9);
    QColor strokeColor = QColor(0x2c, 0x5a, 0xa0);
    double strokeWidth = 2.0;
    double opacity = 1.0;
};

struct ShapeConfig {
    ShapeStyle style;
    QSize size;
};

// Default style and size of each shape type
ShapeConfig shapePreset(ShapeType type);
QString shapeTypeName(ShapeType type);

/**
 * ShapeClip - vector shape drawn with QPainter
 * A transparent fill colour leaves the shape outlined only.
 */
class ShapeClip : public AbstractClip
{
public:
    ShapeClip(ShapeType type, const EngineSettings& settings,
              const std::optional<ShapeConfig>& config = std::nullopt);
    ~ShapeClip() override;

    ShapeType shapeType() const { return m_type; }
    const ShapeStyle& style() const { return m_style; }

    void setFillColor(const QColor& color);
    void setStrokeColor(const QColor& color);
    void setStrokeWidth(double width);
    void setOpacity(double opacity);

protected:
    std::unique_ptr<AbstractClip> createCloneInstance() const override;
    bool drawContent(const Frame& frame, double currentTime, bool playing) override;
    bool includesFramesInDump() const override { return true; }

private:
    void drawShape();
    void drawEllipse(QPainter& painter);
    void drawSquare(QPainter& painter);
    void drawLine(QPainter& painter);
    void drawArrow(QPainter& painter);

    ShapeType m_type;
    ShapeStyle m_style;
};

} // namespace montage
