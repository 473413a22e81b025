#include <montage/clips/shape_clip.h>

#include <QLoggingCategory>
#include <QPainter>
#include <QPolygonF>
#include <QtGlobal>

#include <algorithm>

Q_LOGGING_CATEGORY(montageShape, "montage.clip.shape")

namespace montage {

ShapeConfig shapePreset(ShapeType type)
{
    ShapeConfig config;
    switch (type) {
        case ShapeType::Ellipse:
        case ShapeType::Square:
            config.size = QSize(200, 200);
            break;
        case ShapeType::Line:
            config.style.fillColor = Qt::transparent;
            config.style.strokeWidth = 4.0;
            config.size = QSize(200, 4);
            break;
        case ShapeType::Arrow:
            config.style.strokeWidth = 4.0;
            config.size = QSize(200, 40);
            break;
    }
    return config;
}

QString shapeTypeName(ShapeType type)
{
    switch (type) {
        case ShapeType::Ellipse: return QStringLiteral("Ellipse");
        case ShapeType::Square:  return QStringLiteral("Square");
        case ShapeType::Line:    return QStringLiteral("Line");
        case ShapeType::Arrow:   return QStringLiteral("Arrow");
    }
    return QStringLiteral("Shape");
}

ShapeClip::ShapeClip(ShapeType type, const EngineSettings& settings,
                     const std::optional<ShapeConfig>& config)
    : AbstractClip(ClipKind::Shape, shapeTypeName(type), settings, settings.flexibleDurationMs)
    , m_type(type)
{
    const ShapeConfig effective = config.value_or(shapePreset(type));
    m_style = effective.style;
    m_style.opacity = qBound(0.0, m_style.opacity, 1.0);
    setSize(effective.size.width(), effective.size.height());
    drawShape();
    setReady(true);
}

ShapeClip::~ShapeClip() = default;

void ShapeClip::setFillColor(const QColor& color)
{
    if (m_style.fillColor == color) return;
    m_style.fillColor = color;
    drawShape();
}

void ShapeClip::setStrokeColor(const QColor& color)
{
    if (m_style.strokeColor == color) return;
    m_style.strokeColor = color;
    drawShape();
}

void ShapeClip::setStrokeWidth(double width)
{
    if (qFuzzyCompare(m_style.strokeWidth, width) || width < 0.0) return;
    m_style.strokeWidth = width;
    drawShape();
}

void ShapeClip::setOpacity(double opacity)
{
    const double clamped = qBound(0.0, opacity, 1.0);
    if (qFuzzyCompare(m_style.opacity, clamped)) return;
    m_style.opacity = clamped;
    drawShape();
}

std::unique_ptr<AbstractClip> ShapeClip::createCloneInstance() const
{
    ShapeConfig config;
    config.style = m_style;
    config.size = QSize(width(), height());
    return std::make_unique<ShapeClip>(m_type, m_settings, config);
}

bool ShapeClip::drawContent(const Frame& frame, double currentTime, bool playing)
{
    Q_UNUSED(frame)
    Q_UNUSED(currentTime)
    Q_UNUSED(playing)
    drawShape();
    return !m_surface.isNull();
}

void ShapeClip::drawShape()
{
    invalidateRenderCache();
    if (m_surface.isNull()) {
        qCDebug(montageShape) << "Shape" << name() << "has no area";
        return;
    }

    m_surface.clearRect();
    QPainter painter(&m_surface.image());
    painter.setRenderHint(QPainter::Antialiasing);
    painter.setOpacity(m_style.opacity);

    switch (m_type) {
        case ShapeType::Ellipse: drawEllipse(painter); break;
        case ShapeType::Square:  drawSquare(painter); break;
        case ShapeType::Line:    drawLine(painter); break;
        case ShapeType::Arrow:   drawArrow(painter); break;
    }
}

void ShapeClip::drawEllipse(QPainter& painter)
{
    const double inset = m_style.strokeWidth / 2.0;
    const QRectF bounds = QRectF(0, 0, width(), height()).adjusted(inset, inset, -inset, -inset);

    painter.setBrush(m_style.fillColor.alpha() == 0 ? QBrush(Qt::NoBrush) : QBrush(m_style.fillColor));
    painter.setPen(QPen(m_style.strokeColor, m_style.strokeWidth));
    painter.drawEllipse(bounds);
}

void ShapeClip::drawSquare(QPainter& painter)
{
    const double inset = m_style.strokeWidth / 2.0;
    const QRectF bounds = QRectF(0, 0, width(), height()).adjusted(inset, inset, -inset, -inset);

    painter.setBrush(m_style.fillColor.alpha() == 0 ? QBrush(Qt::NoBrush) : QBrush(m_style.fillColor));
    painter.setPen(QPen(m_style.strokeColor, m_style.strokeWidth));
    painter.drawRect(bounds);
}

void ShapeClip::drawLine(QPainter& painter)
{
    const double y = height() / 2.0;
    const double padding = m_style.strokeWidth;

    painter.setPen(QPen(m_style.strokeColor, m_style.strokeWidth, Qt::SolidLine, Qt::RoundCap));
    painter.drawLine(QPointF(padding, y), QPointF(width() - padding, y));
}

void ShapeClip::drawArrow(QPainter& painter)
{
    const double padding = m_style.strokeWidth * 2.0;
    const double headLength = std::min(height() * 0.8, width() * 0.15);
    const double headWidth = height() * 0.4;
    const double y = height() / 2.0;
    const double startX = padding;
    const double endX = width() - padding;

    painter.setPen(QPen(m_style.strokeColor, m_style.strokeWidth, Qt::SolidLine, Qt::RoundCap));
    painter.drawLine(QPointF(startX, y), QPointF(endX - headLength, y));

    QPolygonF head;
    head << QPointF(endX, y)
         << QPointF(endX - headLength, y - headWidth)
         << QPointF(endX - headLength, y + headWidth);
    painter.setPen(Qt::NoPen);
    painter.setBrush(m_style.strokeColor);
    painter.drawPolygon(head);
}

} // namespace montage
