#include <montage/clips/caption_clip.h>

#include <QFontMetrics>
#include <QLoggingCategory>
#include <QPainter>
#include <QStringList>

#include <algorithm>

Q_LOGGING_CATEGORY(montageCaption, "montage.clip.caption")

namespace montage {

namespace {

constexpr int kCaptionWidth = 600;
constexpr int kShadowOffset = 2;

bool endsSentence(const QString& text)
{
    const QString trimmed = text.trimmed();
    return trimmed.endsWith('.') || trimmed.endsWith('!') || trimmed.endsWith('?');
}

bool endsWithComma(const QString& text)
{
    return text.trimmed().endsWith(',');
}

} // namespace

CaptionClip::CaptionClip(const QString& name, std::vector<TranscriptionChunk> transcription,
                         const EngineSettings& settings)
    : AbstractClip(ClipKind::Caption, name, settings, durationOf(transcription))
    , m_chunks(std::move(transcription))
{
    buildScenes();
    layout();
    setReady(true);
    qCDebug(montageCaption) << "Caption" << name << "with" << m_chunks.size() << "words in"
                            << m_scenes.size() << "scenes";
}

CaptionClip::~CaptionClip() = default;

double CaptionClip::durationOf(const std::vector<TranscriptionChunk>& chunks)
{
    if (chunks.empty()) {
        return 0.0;
    }
    return chunks.back().endSec * 1000.0;
}

void CaptionClip::buildScenes()
{
    // Algorithm: Accumulate words → Close scene on punctuation or limits → Map words to scenes
    m_scenes.clear();
    m_chunkToScene.assign(m_chunks.size(), -1);

    int sceneStart = 0;
    int charLength = -1;
    for (int i = 0; i < static_cast<int>(m_chunks.size()); ++i) {
        const QString& text = m_chunks[i].text;
        charLength += text.trimmed().length() + 1;
        const int wordCount = i - sceneStart + 1;

        const bool shouldClose = endsSentence(text)
            || wordCount >= m_settings.captionMaxWords
            || charLength >= m_settings.captionMaxChars
            || (endsWithComma(text) && wordCount >= m_settings.captionMinWords);
        const bool isLast = i == static_cast<int>(m_chunks.size()) - 1;

        if (shouldClose || isLast) {
            const int sceneIndex = static_cast<int>(m_scenes.size());
            m_scenes.push_back({sceneStart, i});
            for (int j = sceneStart; j <= i; ++j) {
                m_chunkToScene[j] = sceneIndex;
            }
            sceneStart = i + 1;
            charLength = -1;
        }
    }
}

void CaptionClip::layout()
{
    const QFontMetrics metrics(m_style.font(true));
    setSize(kCaptionWidth, metrics.height() * 2);
}

int CaptionClip::chunkIndexAt(double localSec) const
{
    for (int i = 0; i < static_cast<int>(m_chunks.size()); ++i) {
        if (localSec >= m_chunks[i].startSec && localSec <= m_chunks[i].endSec) {
            return i;
        }
    }
    return -1;
}

int CaptionClip::sceneIndexForChunk(int chunkIndex) const
{
    if (chunkIndex < 0 || chunkIndex >= static_cast<int>(m_chunkToScene.size())) {
        return -1;
    }
    return m_chunkToScene[chunkIndex];
}

QString CaptionClip::sceneText(int sceneIndex) const
{
    if (sceneIndex < 0 || sceneIndex >= static_cast<int>(m_scenes.size())) {
        return QString();
    }
    QStringList words;
    const CaptionScene& scene = m_scenes[sceneIndex];
    for (int i = scene.startIndex; i <= scene.endIndex; ++i) {
        words << m_chunks[i].text.trimmed();
    }
    return words.join(' ');
}

void CaptionClip::setHighlightColor(const QColor& color)
{
    m_highlightColor = color;
    invalidateRenderCache();
}

void CaptionClip::setStyle(const TextStyle& style)
{
    m_style = style;
    layout();
    invalidateRenderCache();
}

Result<void> CaptionClip::removeInterval(double startSec, double endSec)
{
    // Algorithm: Cut frame slots → Drop words inside the cut → Pull later words left → Rebuild scenes
    const double sourceBefore = m_frameService.totalDurationMs();
    Result<void> removed = AbstractClip::removeInterval(startSec, endSec);
    if (removed.is_error()) {
        return removed;
    }

    const double cutStart = toSourceMs(startSec * 1000.0) / 1000.0;
    const double removedSec = (sourceBefore - m_frameService.totalDurationMs()) / 1000.0;
    const double cutEnd = cutStart + removedSec;

    std::vector<TranscriptionChunk> kept;
    for (TranscriptionChunk chunk : m_chunks) {
        if (chunk.endSec <= cutStart) {
            kept.push_back(chunk);
        } else if (chunk.startSec >= cutEnd) {
            chunk.startSec -= removedSec;
            chunk.endSec -= removedSec;
            kept.push_back(chunk);
        }
    }
    m_chunks = std::move(kept);
    buildScenes();
    return Result<void>();
}

std::unique_ptr<AbstractClip> CaptionClip::createCloneInstance() const
{
    auto copy = std::make_unique<CaptionClip>(name(), m_chunks, m_settings);
    copy->m_style = m_style;
    copy->m_highlightColor = m_highlightColor;
    copy->layout();
    return copy;
}

Result<void> CaptionClip::performSplit(AbstractClip& firstHalf, double localMs)
{
    auto& first = static_cast<CaptionClip&>(firstHalf);
    const double splitSec = toSourceMs(localMs) / 1000.0;

    Result<void> split = AbstractClip::performSplit(firstHalf, localMs);
    if (split.is_error()) {
        return split;
    }

    std::vector<TranscriptionChunk> front;
    std::vector<TranscriptionChunk> back;
    for (const TranscriptionChunk& chunk : m_chunks) {
        if (chunk.startSec < splitSec) {
            front.push_back(chunk);
        }
        if (chunk.endSec > splitSec) {
            TranscriptionChunk rebased = chunk;
            rebased.startSec = std::max(0.0, chunk.startSec - splitSec);
            rebased.endSec = chunk.endSec - splitSec;
            back.push_back(rebased);
        }
    }

    first.m_chunks = std::move(front);
    first.buildScenes();
    m_chunks = std::move(back);
    buildScenes();
    return Result<void>();
}

double CaptionClip::localSecondsAt(double currentTime) const
{
    return (m_speed.mapReferenceTime(currentTime, m_startTime) - m_startTime) / 1000.0;
}

int CaptionClip::renderCacheKey(double currentTime) const
{
    const int chunk = chunkIndexAt(localSecondsAt(currentTime));
    if (chunk < 0) {
        return -1;
    }
    return sceneIndexForChunk(chunk) * 1024 + (chunk - m_scenes[sceneIndexForChunk(chunk)].startIndex);
}

bool CaptionClip::drawContent(const Frame& frame, double currentTime, bool playing)
{
    Q_UNUSED(frame)
    Q_UNUSED(playing)
    // Algorithm: Find spoken word → Lay out its scene centred → Highlight the word
    const int chunkIndex = chunkIndexAt(localSecondsAt(currentTime));
    const int sceneIndex = sceneIndexForChunk(chunkIndex);
    if (sceneIndex < 0 || m_surface.isNull()) {
        return false;
    }

    const CaptionScene& scene = m_scenes[sceneIndex];
    const QFont font = m_style.font(true);
    const QFontMetrics metrics(font);
    const QString space = QStringLiteral(" ");

    m_surface.clearRect();
    QPainter painter(&m_surface.image());
    painter.setRenderHint(QPainter::TextAntialiasing);
    painter.setFont(font);

    const int totalWidth = metrics.horizontalAdvance(sceneText(sceneIndex));
    int x = (width() - totalWidth) / 2;
    const int baseline = (height() + metrics.ascent() - metrics.descent()) / 2;

    for (int i = scene.startIndex; i <= scene.endIndex; ++i) {
        const QString word = m_chunks[i].text.trimmed();
        if (m_style.shadow) {
            painter.setPen(Qt::black);
            painter.drawText(x + kShadowOffset, baseline + kShadowOffset, word);
        }
        painter.setPen(i == chunkIndex ? m_highlightColor : m_style.color);
        painter.drawText(x, baseline, word);
        x += metrics.horizontalAdvance(word) + metrics.horizontalAdvance(space);
    }
    return true;
}

} // namespace montage
