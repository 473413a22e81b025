#include <montage/clips/text_clip.h>

#include <QFontMetrics>
#include <QLoggingCategory>
#include <QPainter>

#include <algorithm>

Q_LOGGING_CATEGORY(montageText, "montage.clip.text")

namespace montage {

namespace {
constexpr int kShadowOffset = 2;
constexpr int kPadding = 8;
} // namespace

QFont TextStyle::font(bool bold) const
{
    QFont result(QStringLiteral("sans-serif"));
    result.setStyleHint(QFont::SansSerif);
    result.setPixelSize(std::max(1, fontSize));
    result.setBold(bold);
    return result;
}

TextClip::TextClip(const QString& text, const EngineSettings& settings)
    : AbstractClip(ClipKind::Text, text, settings, settings.flexibleDurationMs)
    , m_text(text)
{
    measure();
    setReady(true);
}

TextClip::~TextClip() = default;

void TextClip::setText(const QString& text)
{
    if (text == m_text) return;
    m_text = text;
    measure();
}

void TextClip::setFontSize(int fontSize)
{
    if (fontSize == m_style.fontSize || fontSize <= 0) return;
    m_style.fontSize = fontSize;
    measure();
}

void TextClip::setColor(const QColor& color)
{
    if (color == m_style.color) return;
    m_style.color = color;
    invalidateRenderCache();
}

void TextClip::setShadow(bool shadow)
{
    if (shadow == m_style.shadow) return;
    m_style.shadow = shadow;
    invalidateRenderCache();
}

void TextClip::measure()
{
    const QFontMetrics metrics(m_style.font());
    const int textWidth = std::max(1, metrics.horizontalAdvance(m_text));
    const int textHeight = std::max(1, metrics.height());
    setSize(textWidth + 2 * kPadding, textHeight + 2 * kPadding);
    invalidateRenderCache();
    qCDebug(montageText) << "Measured" << m_text << "as" << width() << "x" << height();
}

std::unique_ptr<AbstractClip> TextClip::createCloneInstance() const
{
    auto copy = std::make_unique<TextClip>(m_text, m_settings);
    copy->m_style = m_style;
    copy->measure();
    return copy;
}

bool TextClip::drawContent(const Frame& frame, double currentTime, bool playing)
{
    Q_UNUSED(frame)
    Q_UNUSED(currentTime)
    Q_UNUSED(playing)
    if (m_surface.isNull()) {
        return false;
    }

    m_surface.clearRect();
    QPainter painter(&m_surface.image());
    painter.setRenderHint(QPainter::TextAntialiasing);
    painter.setFont(m_style.font());

    const QRect area(0, 0, width(), height());
    if (m_style.shadow) {
        painter.setPen(Qt::black);
        painter.drawText(area.translated(kShadowOffset, kShadowOffset), Qt::AlignCenter, m_text);
    }
    painter.setPen(m_style.color);
    painter.drawText(area, Qt::AlignCenter, m_text);
    return true;
}

} // namespace montage
