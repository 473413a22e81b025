#pragma once

#include <montage/clips/text_clip.h>

#include <QColor>
#include <QString>

#include <vector>

namespace montage {

// One transcribed word with its clip-local time span in seconds
struct TranscriptionChunk {
    QString text;
    double startSec = 0.0;
    double endSec = 0.0;
};

// Run of consecutive chunks shown together; indices into the chunk list
struct CaptionScene {
    int startIndex = 0;
    int endIndex = 0;
};

/**
 * CaptionClip - word-timed captions grouped into short scenes
 *
 * Scenes close at sentence punctuation, at a word or character limit, or at
 * a comma once enough words were collected. The word being spoken is drawn in
 * the highlight colour.
 */
class CaptionClip : public AbstractClip
{
public:
    CaptionClip(const QString& name, std::vector<TranscriptionChunk> transcription,
                const EngineSettings& settings);
    ~CaptionClip() override;

    const std::vector<TranscriptionChunk>& transcription() const { return m_chunks; }
    const std::vector<CaptionScene>& scenes() const { return m_scenes; }

    // Chunk spoken at clip-local localSec, or -1
    int chunkIndexAt(double localSec) const;
    int sceneIndexForChunk(int chunkIndex) const;
    QString sceneText(int sceneIndex) const;

    QColor highlightColor() const { return m_highlightColor; }
    void setHighlightColor(const QColor& color);
    const TextStyle& style() const { return m_style; }
    void setStyle(const TextStyle& style);

    Result<void> removeInterval(double startSec, double endSec) override;

protected:
    std::unique_ptr<AbstractClip> createCloneInstance() const override;
    Result<void> performSplit(AbstractClip& firstHalf, double localMs) override;
    bool drawContent(const Frame& frame, double currentTime, bool playing) override;
    int renderCacheKey(double currentTime) const override;
    bool includesFramesInDump() const override { return true; }

private:
    static double durationOf(const std::vector<TranscriptionChunk>& chunks);
    double localSecondsAt(double currentTime) const;
    void buildScenes();
    void layout();

    std::vector<TranscriptionChunk> m_chunks;
    std::vector<CaptionScene> m_scenes;
    std::vector<int> m_chunkToScene;
    TextStyle m_style;
    QColor m_highlightColor = QColor(0xff, 0xcc, 0x00);
};

} // namespace montage
