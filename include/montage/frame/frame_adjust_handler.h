#pragma once

#include <montage/common/errors.h>

namespace montage {

class FrameService;

/**
 * Duration and interval edits over one FrameService
 *
 * Grow appends slots (duplicating the last pixel payload when there is one),
 * shrink drops trailing slots, removeInterval ripple-deletes a range.
 * An edit never leaves the service empty: the degenerate case keeps slot 0
 * and one frame of duration. Shifting downstream clips is left to the caller.
 */
class FrameAdjustHandler
{
public:
    explicit FrameAdjustHandler(FrameService& service);

    Result<void> adjustTotalTime(double diffMs);
    Result<void> removeInterval(double startSec, double endSec);

private:
    int targetFrameCount(double newTotalMs) const;
    void grow(int frameDiff);
    void shrink(int framesToRemove);
    void collapseToSingleFrame();

    FrameService& m_service;
};

} // namespace montage
