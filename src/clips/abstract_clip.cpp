#include <montage/clips/abstract_clip.h>

#include <QLoggingCategory>
#include <QUuid>

#include <cmath>

Q_LOGGING_CATEGORY(montageClip, "montage.clip")

namespace montage {

AbstractClip::AbstractClip(ClipKind kind, const QString& name, const EngineSettings& settings,
                           double durationMs, std::vector<double> timestamps)
    : m_settings(settings)
    , m_frameService(durationMs, settings.fps, std::move(timestamps))
    , m_speed(settings.minSpeed, settings.maxSpeed)
    , m_kind(kind)
    , m_id(QUuid::createUuid().toString(QUuid::WithoutBraces))
    , m_name(name)
{
    m_totalDurationMs = m_frameService.totalDurationMs();
    qCDebug(montageClip) << "Created" << clipKindToString(kind) << "clip" << name << "duration"
                         << m_totalDurationMs << "ms";
}

AbstractClip::~AbstractClip() = default;

void AbstractClip::setStartTime(double startTime)
{
    m_startTime = startTime;
}

bool AbstractClip::isLayerVisible(double currentTime) const
{
    return m_startTime <= currentTime && currentTime < m_startTime + m_totalDurationMs;
}

bool AbstractClip::shouldReRender(double currentTime)
{
    const int key = renderCacheKey(currentTime);
    if (m_cache.valid && !m_cache.dirty && m_cache.key == key) {
        return false;
    }
    updateRenderCache(currentTime);
    return true;
}

void AbstractClip::updateRenderCache(double currentTime)
{
    m_cache.valid = true;
    m_cache.dirty = false;
    m_cache.time = currentTime;
    m_cache.key = renderCacheKey(currentTime);
}

void AbstractClip::invalidateRenderCache()
{
    m_cache = RenderCache();
}

std::optional<Frame> AbstractClip::getFrame(double referenceTime) const
{
    const double sourceTime = m_speed.mapReferenceTime(referenceTime, m_startTime);
    return m_frameService.getFrame(sourceTime, m_startTime);
}

void AbstractClip::update(const LayerChange& change, double referenceTime)
{
    // Algorithm: Locate frame → Apply to it and following frames up to next anchor → Anchor it → Dirty cache
    const double sourceTime = m_speed.mapReferenceTime(referenceTime, m_startTime);
    const std::optional<int> slot = m_frameService.slotAt(sourceTime, m_startTime);
    if (!slot) {
        qCDebug(montageClip) << "Ignoring transform change outside" << m_name << "at" << referenceTime;
        return;
    }
    const int index = *slot;

    for (int i = index; i < m_frameService.length(); ++i) {
        if (i > index && m_frameService.isAnchor(i)) {
            break;
        }
        Frame frame = *m_frameService.frameAt(i);
        if (change.scale) {
            // Zoom about the canvas centre: offsets grow with the scale
            const double oldScale = frame.scale();
            frame.setScale(oldScale * *change.scale, m_settings.minScale);
            const double factor = frame.scale() / oldScale;
            frame.setPosition(frame.x() * factor, frame.y() * factor);
        }
        if (change.x || change.y) {
            frame.setPosition(change.x.value_or(frame.x()), change.y.value_or(frame.y()));
        }
        if (change.rotation) {
            frame.setRotation(frame.rotation() + *change.rotation);
        }
        m_frameService.update(i, frame);
    }
    m_frameService.setAnchor(index);
    m_cache.dirty = true;

    qCDebug(montageClip) << "Updated transform of" << m_name << "from frame" << index;
}

void AbstractClip::render(RenderSurface& out, double currentTime, bool playing)
{
    // Algorithm: Gate on ready/visible → Resolve frame → Redraw content if stale → Composite
    if (!m_ready || !isLayerVisible(currentTime)) {
        return;
    }

    const std::optional<Frame> frame = getFrame(currentTime);
    if (!frame) {
        return;
    }

    if (shouldReRender(currentTime)) {
        const quint64 generation = m_editGeneration;
        const bool drawn = drawContent(*frame, currentTime, playing);

        // Clip edited, unloaded or moved away while the content was produced
        if (generation != m_editGeneration || !m_ready || !isLayerVisible(currentTime)) {
            qCDebug(montageClip) << "Discarding stale render of" << m_name << "at" << currentTime;
            invalidateRenderCache();
            return;
        }
        if (!drawn) {
            invalidateRenderCache();
            return;
        }
        updateRenderCache(currentTime);
    }

    RenderSurface::drawTransformed(m_surface, out, *frame);
}

bool AbstractClip::drawContent(const Frame& frame, double currentTime, bool playing)
{
    Q_UNUSED(currentTime)
    Q_UNUSED(playing)
    // Surface prepared ahead of time; draw the frame's own payload when it carries one
    if (frame.hasData()) {
        m_surface.clearRect();
        m_surface.drawImage(frame.data());
    }
    return !m_surface.isNull();
}

int AbstractClip::renderCacheKey(double currentTime) const
{
    const double sourceTime = m_speed.mapReferenceTime(currentTime, m_startTime);
    const std::optional<int> slot = m_frameService.slotAt(sourceTime, m_startTime);
    if (!slot) {
        return -1;
    }
    return m_frameService.frameAt(*slot)->sourceIndex().value_or(*slot);
}

Result<void> AbstractClip::validateSplit(double splitTime) const
{
    if (!std::isfinite(splitTime) || splitTime <= m_startTime || splitTime >= endTime()) {
        return Error::invalid_split_point(splitTime);
    }
    return Result<void>();
}

Result<std::unique_ptr<AbstractClip>> AbstractClip::split(double splitTime)
{
    // Algorithm: Validate point → Copy receiver → Partition at local offset → Rename first half
    Result<void> valid = validateSplit(splitTime);
    if (valid.is_error()) {
        qCWarning(montageClip) << "Cannot split" << m_name << "at" << splitTime << ":"
                               << valid.error().message.c_str();
        return valid.error();
    }

    std::unique_ptr<AbstractClip> firstHalf = createCloneInstance();
    copyStateTo(*firstHalf);

    const double localMs = splitTime - m_startTime;
    Result<void> partitioned = performSplit(*firstHalf, localMs);
    if (partitioned.is_error()) {
        qCWarning(montageClip) << "Split of" << m_name << "failed:" << partitioned.error().message.c_str();
        return partitioned.error();
    }

    firstHalf->m_name = m_name + " [Split]";
    firstHalf->markStructuralEdit();
    markStructuralEdit();

    qCInfo(montageClip) << "Split" << m_name << "at" << splitTime << "into"
                        << firstHalf->m_totalDurationMs << "+" << m_totalDurationMs << "ms";
    return Result<std::unique_ptr<AbstractClip>>(std::move(firstHalf));
}

Result<void> AbstractClip::performSplit(AbstractClip& firstHalf, double localMs)
{
    const double sourceLocalMs = toSourceMs(localMs);
    const int index = m_frameService.indexAtOrAfter(sourceLocalMs);

    firstHalf.m_frameService = m_frameService.splitFront(index, sourceLocalMs);
    firstHalf.m_totalDurationMs = localMs;

    m_totalDurationMs -= localMs;
    m_startTime += localMs;
    return Result<void>();
}

Result<void> AbstractClip::removeInterval(double startSec, double endSec)
{
    if (!m_ready) {
        qCWarning(montageClip) << "Cannot remove interval from" << m_name << ": not ready";
        return Error::not_ready("Clip is not ready: " + m_name.toStdString());
    }

    Result<void> removed = m_frameService.removeInterval(toSourceMs(startSec * 1000.0) / 1000.0,
                                                         toSourceMs(endSec * 1000.0) / 1000.0);
    if (removed.is_error()) {
        return removed;
    }

    syncDurationFromFrames();
    markStructuralEdit();
    qCInfo(montageClip) << "Removed" << startSec << "-" << endSec << "s from" << m_name
                        << "duration now" << m_totalDurationMs << "ms";
    return Result<void>();
}

Result<void> AbstractClip::adjustTotalTime(double diffMs)
{
    if (!m_ready) {
        return Error::not_ready("Clip is not ready: " + m_name.toStdString());
    }

    Result<void> adjusted = m_frameService.adjustTotalTime(toSourceMs(diffMs));
    if (adjusted.is_error()) {
        return adjusted;
    }

    syncDurationFromFrames();
    markStructuralEdit();
    return Result<void>();
}

Result<void> AbstractClip::setSpeed(double speed)
{
    Result<void> applied = m_speed.setSpeed(speed);
    if (applied.is_error()) {
        return applied;
    }

    syncDurationFromFrames();
    markStructuralEdit();
    qCInfo(montageClip) << "Speed of" << m_name << "now" << m_speed.speed() << "duration"
                        << m_totalDurationMs << "ms";
    return Result<void>();
}

std::unique_ptr<AbstractClip> AbstractClip::clone() const
{
    // Algorithm: Create same-kind instance → Copy frames, speed and placement → Rename
    std::unique_ptr<AbstractClip> copy = createCloneInstance();
    copyStateTo(*copy);
    copy->m_name = m_name + " [Clone]";
    return copy;
}

QJsonObject AbstractClip::dump() const
{
    QJsonObject json;
    json["id"] = m_id;
    json["name"] = m_name;
    json["type"] = clipKindToString(m_kind);
    json["width"] = m_width;
    json["height"] = m_height;
    json["startTime"] = m_startTime;
    json["total_time"] = m_totalDurationMs;
    json["speed"] = m_speed.speed();
    if (includesFramesInDump()) {
        json["frames"] = m_frameService.toJson();
    }
    return json;
}

Result<void> AbstractClip::restoreFrames(const QJsonArray& frames)
{
    Result<void> restored = m_frameService.restoreFromJson(frames);
    if (restored.is_error()) {
        qCWarning(montageClip) << "Cannot restore frames of" << m_name << ":"
                               << restored.error().message.c_str();
        return restored;
    }
    m_cache.dirty = true;
    return Result<void>();
}

void AbstractClip::cleanup()
{
    m_ready = false;
    markStructuralEdit();
    m_surface.clearRect();
    qCDebug(montageClip) << "Cleaned up" << m_name;
}

void AbstractClip::setLoadUpdateListener(LoadUpdateListener listener)
{
    m_loadListener = std::move(listener);
    if (m_ready) {
        notifyLoadUpdate(100);
    } else if (m_sourceFailed) {
        notifyLoadUpdate(-1);
    }
}

void AbstractClip::reportSourceFailure(const Error& error)
{
    m_ready = false;
    if (m_sourceFailed) {
        return;
    }
    m_sourceFailed = true;
    markStructuralEdit();
    qCCritical(montageClip) << "Source of" << m_name << "failed:" << error_code_to_string(error.code)
                            << error.message.c_str();
    notifyLoadUpdate(-1);
}

void AbstractClip::setReady(bool ready)
{
    if (m_ready == ready) {
        return;
    }
    m_ready = ready;
    if (ready) {
        m_sourceFailed = false;
        notifyLoadUpdate(100);
    }
}

void AbstractClip::setSize(int width, int height)
{
    m_width = width;
    m_height = height;
    m_surface.setSize(width, height);
    m_cache.dirty = true;
}

void AbstractClip::replaceFrameService(FrameService service)
{
    m_frameService = std::move(service);
    syncDurationFromFrames();
    markStructuralEdit();
}

void AbstractClip::syncDurationFromFrames()
{
    m_totalDurationMs = m_speed.getEffectiveDuration(m_frameService.totalDurationMs());
}

void AbstractClip::markStructuralEdit()
{
    ++m_editGeneration;
    invalidateRenderCache();
}

void AbstractClip::copyStateTo(AbstractClip& other) const
{
    other.m_settings = m_settings;
    other.m_frameService = m_frameService;
    other.m_speed = m_speed;
    other.m_startTime = m_startTime;
    other.m_totalDurationMs = m_totalDurationMs;
    other.setSize(m_width, m_height);
    other.m_ready = m_ready;
    other.invalidateRenderCache();
}

void AbstractClip::notifyLoadUpdate(int progress)
{
    if (m_loadListener) {
        m_loadListener(progress, this);
    }
}

} // namespace montage
