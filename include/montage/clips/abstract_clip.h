#pragma once

#include <montage/clips/capabilities.h>
#include <montage/clips/clip_kind.h>
#include <montage/common/engine_settings.h>
#include <montage/common/errors.h>
#include <montage/frame/frame_service.h>
#include <montage/render/render_surface.h>
#include <montage/timing/speed_controller.h>

#include <QJsonArray>
#include <QJsonObject>
#include <QString>

#include <functional>
#include <memory>
#include <optional>

namespace montage {

/**
 * Transform edit applied at one timeline time.
 * x/y are absolute, scale multiplies the current scale, rotation is added.
 */
struct LayerChange {
    std::optional<double> x;
    std::optional<double> y;
    std::optional<double> scale;
    std::optional<double> rotation;
};

/**
 * AbstractClip - one media item placed on the timeline
 *
 * Composes a FrameService (source-time frame slots), a RenderSurface holding
 * the clip's current content and a SpeedController. Timeline time is mapped
 * to source time by the speed controller before any frame lookup, and edits
 * given in timeline time are converted to source time before they reach the
 * FrameService, so totalDurationMs() == frames' duration / speed always holds.
 *
 * Failed edits return an Error and leave the clip untouched.
 */
class AbstractClip : public Renderable, public Splittable, public IntervalEditable
{
public:
    // progress is 100 when the clip becomes ready, -1 on source failure
    using LoadUpdateListener = std::function<void(int progress, AbstractClip* clip)>;

    ~AbstractClip() override;

    AbstractClip(const AbstractClip&) = delete;
    AbstractClip& operator=(const AbstractClip&) = delete;

    // Identity
    ClipKind kind() const { return m_kind; }
    QString id() const { return m_id; }
    QString name() const { return m_name; }
    void setName(const QString& name) { m_name = name; }

    // Timeline placement
    double startTime() const { return m_startTime; }
    virtual void setStartTime(double startTime);
    double totalDurationMs() const { return m_totalDurationMs; }
    double endTime() const { return m_startTime + m_totalDurationMs; }
    int width() const { return m_width; }
    int height() const { return m_height; }

    bool isReady() const { return m_ready; }

    // startTime <= t < startTime + totalDurationMs
    bool isLayerVisible(double currentTime) const;

    /**
     * True when the content must be redrawn for currentTime: first render,
     * a different source frame than last time, or a transform edit since.
     * Records currentTime as rendered when it answers true.
     */
    bool shouldReRender(double currentTime);
    void updateRenderCache(double currentTime);
    void invalidateRenderCache();

    // Interpolated frame at a timeline time, after the speed remap
    virtual std::optional<Frame> getFrame(double referenceTime) const;

    /**
     * Apply change to the frame at referenceTime
     * Algorithm: Locate frame → Apply to it and following frames up to next anchor → Anchor it → Dirty cache
     */
    virtual void update(const LayerChange& change, double referenceTime);

    void render(RenderSurface& out, double currentTime, bool playing) override;

    // Checks a split point without changing anything
    virtual Result<void> validateSplit(double splitTime) const;
    Result<std::unique_ptr<AbstractClip>> split(double splitTime) override;
    Result<void> removeInterval(double startSec, double endSec) override;

    // Grow or shrink by diffMs of timeline time
    virtual Result<void> adjustTotalTime(double diffMs);

    virtual Result<void> setSpeed(double speed);
    double speed() const { return m_speed.speed(); }

    /**
     * Independent copy sharing the decoded source
     * Algorithm: Create same-kind instance → Copy frames, speed and placement → Rename
     */
    std::unique_ptr<AbstractClip> clone() const;

    // Persisted description; flexible clips include their frame transforms
    virtual QJsonObject dump() const;
    Result<void> restoreFrames(const QJsonArray& frames);

    virtual void cleanup();

    // Invoked at once with the current state when the clip is already ready or failed
    void setLoadUpdateListener(LoadUpdateListener listener);

    // Escalates a source failure once; the clip stays not ready
    void reportSourceFailure(const Error& error);
    bool hasSourceFailure() const { return m_sourceFailed; }

    virtual AudioCapable* asAudioCapable() { return nullptr; }

    const FrameService& frameService() const { return m_frameService; }
    const SpeedController& speedController() const { return m_speed; }
    const RenderSurface& surface() const { return m_surface; }
    const EngineSettings& settings() const { return m_settings; }

protected:
    AbstractClip(ClipKind kind, const QString& name, const EngineSettings& settings,
                 double durationMs, std::vector<double> timestamps = {});

    virtual std::unique_ptr<AbstractClip> createCloneInstance() const = 0;

    /**
     * Partition state at clip-local localMs; firstHalf already holds a copy of
     * the receiver's state. Overrides must fail before mutating anything.
     */
    virtual Result<void> performSplit(AbstractClip& firstHalf, double localMs);

    // Draw the clip's content for frame into m_surface; false if nothing to show
    virtual bool drawContent(const Frame& frame, double currentTime, bool playing);

    // Identifies what the content shows at currentTime
    virtual int renderCacheKey(double currentTime) const;

    virtual bool includesFramesInDump() const { return false; }

    void setReady(bool ready);
    void setSize(int width, int height);
    void replaceFrameService(FrameService service);
    void syncDurationFromFrames();

    // Bumped by every structural edit; pending fetches compare it
    void markStructuralEdit();
    quint64 editGeneration() const { return m_editGeneration; }

    double toSourceMs(double timelineMs) const { return m_speed.toSourceDuration(timelineMs); }

    EngineSettings m_settings;
    FrameService m_frameService;
    RenderSurface m_surface;
    SpeedController m_speed;
    double m_startTime = 0.0;
    double m_totalDurationMs = 0.0;

private:
    void copyStateTo(AbstractClip& other) const;
    void notifyLoadUpdate(int progress);

    struct RenderCache {
        bool valid = false;
        bool dirty = false;
        double time = -1.0;
        int key = -1;
    };

    ClipKind m_kind;
    QString m_id;
    QString m_name;
    int m_width = 0;
    int m_height = 0;
    bool m_ready = false;
    bool m_sourceFailed = false;
    RenderCache m_cache;
    quint64 m_editGeneration = 0;
    LoadUpdateListener m_loadListener;
};

} // namespace montage
