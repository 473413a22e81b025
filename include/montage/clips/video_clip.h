#pragma once

#include <montage/clips/abstract_clip.h>
#include <montage/media/frame_source.h>

#include <memory>

namespace montage {

/**
 * VideoClip - decoded frames from a FrameSource
 *
 * Each frame slot names the source frame it shows (sourceIndex); ripple
 * edits move slots, never source indices. Frames with capture timestamps use
 * timestamp addressing.
 */
class VideoClip : public AbstractClip
{
public:
    VideoClip(const QString& name, std::shared_ptr<FrameSource> source, const EngineSettings& settings);
    ~VideoClip() override;

    Result<QImage> frameAtIndex(int index, bool prefetch = false);

    // Relink after a source failure; the clip becomes ready again
    void replaceSource(std::shared_ptr<FrameSource> source);
    bool hasSource() const { return static_cast<bool>(m_source); }

    void cleanup() override;

protected:
    std::unique_ptr<AbstractClip> createCloneInstance() const override;
    bool drawContent(const Frame& frame, double currentTime, bool playing) override;

private:
    std::shared_ptr<FrameSource> m_source;
};

} // namespace montage
