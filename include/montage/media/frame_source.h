#pragma once

#include <montage/common/errors.h>

#include <QImage>

#include <vector>

namespace montage {

struct FrameSourceMetadata {
    int width = 0;
    int height = 0;
    double totalDurationMs = 0.0;
    std::vector<double> timestamps; // capture time of each frame, seconds; empty for fixed fps
};

/**
 * Decoded pixel provider for video and image clips
 *
 * Implemented outside the engine (demuxer/decoder). frameAtIndex may block
 * on decode; a null image means the frame is not available yet and the
 * caller skips it. Sources are shared by clones and split halves.
 */
class FrameSource
{
public:
    virtual ~FrameSource() = default;

    virtual FrameSourceMetadata metadata() const = 0;

    // prefetch hints that the following frames will be requested next
    virtual Result<QImage> frameAtIndex(int index, bool prefetch) = 0;

    // Release decoder resources; later requests fail with SourceMissing
    virtual void cleanup() = 0;
};

} // namespace montage
