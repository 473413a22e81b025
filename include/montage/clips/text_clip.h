#pragma once

#include <montage/clips/abstract_clip.h>

#include <QColor>
#include <QFont>

namespace montage {

// Typography shared by text and caption clips
struct TextStyle {
    int fontSize = 30;
    QColor color = Qt::white;
    bool shadow = true;

    QFont font(bool bold = false) const;
};

/**
 * TextClip - a single line of text, centred on its own surface
 * The clip is named after its text when created; renaming leaves the text alone.
 */
class TextClip : public AbstractClip
{
public:
    TextClip(const QString& text, const EngineSettings& settings);
    ~TextClip() override;

    QString text() const { return m_text; }
    void setText(const QString& text);

    const TextStyle& style() const { return m_style; }
    void setFontSize(int fontSize);
    void setColor(const QColor& color);
    void setShadow(bool shadow);

protected:
    std::unique_ptr<AbstractClip> createCloneInstance() const override;
    bool drawContent(const Frame& frame, double currentTime, bool playing) override;
    bool includesFramesInDump() const override { return true; }

private:
    // Resize the surface to the measured text
    void measure();

    QString m_text;
    TextStyle m_style;
};

} // namespace montage
