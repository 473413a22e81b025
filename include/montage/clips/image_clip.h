#pragma once

#include <montage/clips/abstract_clip.h>
#include <montage/media/frame_source.h>

#include <memory>

namespace montage {

/**
 * ImageClip - one still image held for a flexible duration
 * Every frame slot carries the decoded image, so growing the clip repeats it.
 */
class ImageClip : public AbstractClip
{
public:
    ImageClip(const QString& name, std::shared_ptr<FrameSource> source, const EngineSettings& settings);
    ~ImageClip() override;

    const QImage& image() const { return m_image; }

protected:
    std::unique_ptr<AbstractClip> createCloneInstance() const override;
    bool drawContent(const Frame& frame, double currentTime, bool playing) override;
    bool includesFramesInDump() const override { return true; }

private:
    // Clone path: reuses the decoded image
    ImageClip(const QString& name, std::shared_ptr<FrameSource> source, const QImage& image,
              const EngineSettings& settings);

    void attachImage(const QImage& image);

    std::shared_ptr<FrameSource> m_source;
    QImage m_image;
};

} // namespace montage
