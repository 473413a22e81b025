// VideoClip: frame fetching, render caching, transforms, edits and source lifecycle

#include <QtTest>

#include <montage/clips/video_clip.h>

#include "common/fake_sources.h"

using namespace montage;

class TestVideoClip : public QObject
{
    Q_OBJECT

private:
    EngineSettings m_settings;

    std::unique_ptr<VideoClip> makeClip(const std::shared_ptr<FakeFrameSource>& source,
                                        double startTime = 0.0) {
        auto clip = std::make_unique<VideoClip>("Interview", source, m_settings);
        clip->setStartTime(startTime);
        return clip;
    }

    static QColor centerColor(const RenderSurface& surface) {
        return QColor(surface.image().pixel(surface.width() / 2, surface.height() / 2));
    }

private slots:
    void test_created_from_source_metadata() {
        auto source = std::make_shared<FakeFrameSource>(64, 36, 10000.0);
        auto clip = makeClip(source);
        QCOMPARE(clip->kind(), ClipKind::Video);
        QVERIFY(clip->isReady());
        QCOMPARE(clip->width(), 64);
        QCOMPARE(clip->height(), 36);
        QCOMPARE(clip->totalDurationMs(), 10000.0);
        QCOMPARE(clip->frameService().length(), 300);
        QVERIFY(!clip->id().isEmpty());
    }

    void test_missing_source_is_not_ready() {
        VideoClip clip("Offline", nullptr, m_settings);
        QVERIFY(!clip.isReady());
        QCOMPARE(clip.frameAtIndex(0).error().code, ErrorCode::SourceMissing);
    }

    void test_timestamped_source() {
        auto source = std::make_shared<FakeFrameSource>(64, 36, 1000.0, std::vector<double>{0.0, 0.25, 0.5, 0.9});
        auto clip = makeClip(source);
        QVERIFY(clip->frameService().hasTimestamps());
        QCOMPARE(clip->frameService().length(), 4);
    }

    void test_render_draws_source_frame() {
        auto source = std::make_shared<FakeFrameSource>(64, 36, 10000.0);
        auto clip = makeClip(source, 2000.0);
        RenderSurface out(128, 72);

        clip->render(out, 3000.0, false);
        QCOMPARE(source->lastIndex, 30);
        QVERIFY(!source->lastPrefetch);
        QCOMPARE(centerColor(out), FakeFrameSource::colorForIndex(30));
    }

    void test_render_skips_invisible_times() {
        auto source = std::make_shared<FakeFrameSource>(64, 36, 10000.0);
        auto clip = makeClip(source, 2000.0);
        RenderSurface out(128, 72);

        clip->render(out, 1999.0, false);
        clip->render(out, 12000.0, false);
        QCOMPARE(source->requestCount, 0);
        QCOMPARE(qAlpha(out.image().pixel(64, 36)), 0);
    }

    void test_render_cache_avoids_refetch() {
        auto source = std::make_shared<FakeFrameSource>(64, 36, 10000.0);
        auto clip = makeClip(source);
        RenderSurface out(128, 72);

        clip->render(out, 1000.0, true);
        QCOMPARE(source->requestCount, 1);
        QVERIFY(source->lastPrefetch);

        // Same source frame
        clip->render(out, 1010.0, true);
        QCOMPARE(source->requestCount, 1);

        clip->render(out, 1040.0, true);
        QCOMPARE(source->requestCount, 2);
        QCOMPARE(source->lastIndex, 31);
    }

    void test_should_re_render_records_time() {
        auto source = std::make_shared<FakeFrameSource>(64, 36, 10000.0);
        auto clip = makeClip(source);
        QVERIFY(clip->shouldReRender(500.0));
        QVERIFY(!clip->shouldReRender(500.0));
        clip->invalidateRenderCache();
        QVERIFY(clip->shouldReRender(500.0));
    }

    void test_pending_frame_is_retried() {
        auto source = std::make_shared<FakeFrameSource>(64, 36, 10000.0);
        source->pending = true;
        auto clip = makeClip(source);
        RenderSurface out(128, 72);

        clip->render(out, 0.0, false);
        QCOMPARE(source->requestCount, 1);
        QCOMPARE(qAlpha(out.image().pixel(64, 36)), 0);
        QVERIFY(clip->isReady());

        source->pending = false;
        clip->render(out, 0.0, false);
        QCOMPARE(source->requestCount, 2);
        QCOMPARE(centerColor(out), FakeFrameSource::colorForIndex(0));
    }

    void test_decode_failure_escalates_once() {
        auto source = std::make_shared<FakeFrameSource>(64, 36, 10000.0);
        source->failDecode = true;
        auto clip = makeClip(source);

        QList<int> progress;
        clip->setLoadUpdateListener([&progress](int value, AbstractClip*) { progress.append(value); });
        QCOMPARE(progress, QList<int>({100}));

        RenderSurface out(128, 72);
        clip->render(out, 0.0, false);
        QVERIFY(!clip->isReady());
        QVERIFY(clip->hasSourceFailure());
        QCOMPARE(progress, QList<int>({100, -1}));

        // Not ready anymore: nothing is fetched
        clip->render(out, 100.0, false);
        QCOMPARE(source->requestCount, 1);
        QCOMPARE(progress.size(), 2);
    }

    void test_replace_source_recovers() {
        auto broken = std::make_shared<FakeFrameSource>(64, 36, 10000.0);
        broken->failDecode = true;
        auto clip = makeClip(broken);
        RenderSurface out(128, 72);
        clip->render(out, 0.0, false);
        QVERIFY(!clip->isReady());

        auto relinked = std::make_shared<FakeFrameSource>(64, 36, 10000.0);
        clip->replaceSource(relinked);
        QVERIFY(clip->isReady());
        clip->render(out, 0.0, false);
        QCOMPARE(relinked->requestCount, 1);
    }

    void test_speed_changes_duration_and_mapping() {
        auto source = std::make_shared<FakeFrameSource>(64, 36, 10000.0);
        auto clip = makeClip(source);

        QVERIFY(clip->setSpeed(2.0).is_ok());
        QCOMPARE(clip->totalDurationMs(), 5000.0);
        QCOMPARE(clip->frameService().length(), 300);
        QCOMPARE(clip->getFrame(1000.0)->sourceIndex().value(), 60);
        QVERIFY(!clip->getFrame(5000.0).has_value());

        QVERIFY(clip->setSpeed(0.5).is_ok());
        QCOMPARE(clip->totalDurationMs(), 20000.0);
        QCOMPARE(clip->getFrame(1000.0)->sourceIndex().value(), 15);

        QCOMPARE(clip->setSpeed(0.0).error().code, ErrorCode::InvalidArg);
        QCOMPARE(clip->speed(), 0.5);
    }

    void test_transform_update_holds_until_next_anchor() {
        auto source = std::make_shared<FakeFrameSource>(64, 36, 10000.0);
        auto clip = makeClip(source);

        LayerChange move;
        move.x = 10.0;
        clip->update(move, 1000.0);
        QVERIFY(clip->frameService().isAnchor(30));
        QCOMPARE(clip->frameService().frameAt(29)->x(), 0.0);
        QCOMPARE(clip->frameService().frameAt(30)->x(), 10.0);
        QCOMPARE(clip->frameService().frameAt(299)->x(), 10.0);

        LayerChange zoom;
        zoom.scale = 2.0;
        clip->update(zoom, 2000.0);
        QCOMPARE(clip->frameService().frameAt(59)->scale(), 1.0);
        QCOMPARE(clip->frameService().frameAt(60)->scale(), 2.0);
        // Zoom is about the canvas centre, so the offset doubles too
        QCOMPARE(clip->frameService().frameAt(59)->x(), 10.0);
        QCOMPARE(clip->frameService().frameAt(60)->x(), 20.0);
        QCOMPARE(clip->frameService().frameAt(299)->x(), 20.0);

        LayerChange turn;
        turn.rotation = 15.0;
        clip->update(turn, 1000.0);
        QCOMPARE(clip->frameService().frameAt(45)->rotation(), 15.0);
        QCOMPARE(clip->frameService().frameAt(60)->rotation(), 0.0);

        LayerChange shrink;
        shrink.scale = 0.01;
        clip->update(shrink, 2000.0);
        QCOMPARE(clip->frameService().frameAt(60)->scale(), m_settings.minScale);
        // Offset follows the clamped scale, not the requested one
        QCOMPARE(clip->frameService().frameAt(60)->x(), 1.0);

        LayerChange zoomAndPlace;
        zoomAndPlace.scale = 3.0;
        zoomAndPlace.x = -5.0;
        clip->update(zoomAndPlace, 3000.0);
        QCOMPARE(clip->frameService().frameAt(90)->x(), -5.0);
        QCOMPARE(clip->frameService().frameAt(90)->scale(), 3.0 * m_settings.minScale);
    }

    void test_update_invalidates_render_cache() {
        auto source = std::make_shared<FakeFrameSource>(64, 36, 10000.0);
        auto clip = makeClip(source);
        QVERIFY(clip->shouldReRender(1000.0));

        LayerChange move;
        move.y = 5.0;
        clip->update(move, 1000.0);
        QVERIFY(clip->shouldReRender(1000.0));
    }

    void test_split() {
        auto source = std::make_shared<FakeFrameSource>(64, 36, 10000.0);
        auto clip = makeClip(source);

        auto result = clip->split(4000.0);
        QVERIFY(result.is_ok());
        std::unique_ptr<AbstractClip> first = std::move(result.value());

        QCOMPARE(first->name(), QString("Interview [Split]"));
        QCOMPARE(first->startTime(), 0.0);
        QCOMPARE(first->totalDurationMs(), 4000.0);
        QCOMPARE(clip->startTime(), 4000.0);
        QCOMPARE(clip->totalDurationMs(), 6000.0);
        QCOMPARE(first->frameService().length(), 120);
        QCOMPARE(clip->frameService().frameAt(0)->sourceIndex().value(), 120);
        QVERIFY(first->id() != clip->id());
    }

    void test_split_rejects_boundaries() {
        auto source = std::make_shared<FakeFrameSource>(64, 36, 10000.0);
        auto clip = makeClip(source, 1000.0);
        QCOMPARE(clip->split(1000.0).error().code, ErrorCode::InvalidSplitPoint);
        QCOMPARE(clip->split(11000.0).error().code, ErrorCode::InvalidSplitPoint);
        QCOMPARE(clip->split(500.0).error().code, ErrorCode::InvalidSplitPoint);
        QCOMPARE(clip->totalDurationMs(), 10000.0);
    }

    void test_remove_interval_keeps_source_indices() {
        auto source = std::make_shared<FakeFrameSource>(64, 36, 10000.0);
        auto clip = makeClip(source);
        QVERIFY(clip->removeInterval(1.0, 2.0).is_ok());
        QCOMPARE(clip->totalDurationMs(), 9000.0);
        QCOMPARE(clip->getFrame(1000.0)->sourceIndex().value(), 60);

        QCOMPARE(clip->removeInterval(20.0, 30.0).error().code, ErrorCode::EmptyInterval);
        QCOMPARE(clip->totalDurationMs(), 9000.0);
    }

    void test_remove_interval_at_double_speed() {
        auto source = std::make_shared<FakeFrameSource>(64, 36, 10000.0);
        auto clip = makeClip(source);
        QVERIFY(clip->setSpeed(2.0).is_ok());

        // One second of timeline time is two seconds of source
        QVERIFY(clip->removeInterval(1.0, 2.0).is_ok());
        QCOMPARE(clip->totalDurationMs(), 4000.0);
        QCOMPARE(clip->frameService().totalDurationMs(), 8000.0);
    }

    void test_adjust_total_time() {
        auto source = std::make_shared<FakeFrameSource>(64, 36, 10000.0);
        auto clip = makeClip(source);
        QVERIFY(clip->adjustTotalTime(-4000.0).is_ok());
        QCOMPARE(clip->totalDurationMs(), 6000.0);
        QCOMPARE(clip->frameService().length(), 180);

        QVERIFY(clip->adjustTotalTime(-100000.0).is_ok());
        QCOMPARE(clip->frameService().length(), 1);
        QVERIFY(qFuzzyCompare(clip->totalDurationMs(), m_settings.frameDurationMs()));
    }

    void test_clone_shares_source_and_cleanup_releases_last() {
        auto source = std::make_shared<FakeFrameSource>(64, 36, 10000.0);
        auto clip = makeClip(source, 500.0);
        LayerChange move;
        move.x = 3.0;
        clip->update(move, 500.0);

        std::unique_ptr<AbstractClip> copy = clip->clone();
        QCOMPARE(copy->name(), QString("Interview [Clone]"));
        QCOMPARE(copy->startTime(), 500.0);
        QCOMPARE(copy->frameService().frameAt(0)->x(), 3.0);
        QVERIFY(copy->id() != clip->id());

        source.reset();
        clip->cleanup();
        QVERIFY(!clip->isReady());
        auto* copyVideo = static_cast<VideoClip*>(copy.get());
        QVERIFY(copyVideo->hasSource());
        QVERIFY(copyVideo->frameAtIndex(0).is_ok());

        copy->cleanup();
        QVERIFY(!copyVideo->hasSource());
    }

    void test_dump_describes_clip() {
        auto source = std::make_shared<FakeFrameSource>(64, 36, 10000.0);
        auto clip = makeClip(source, 250.0);
        const QJsonObject json = clip->dump();
        QCOMPARE(json["type"].toString(), QString("video"));
        QCOMPARE(json["name"].toString(), QString("Interview"));
        QCOMPARE(json["startTime"].toDouble(), 250.0);
        QCOMPARE(json["total_time"].toDouble(), 10000.0);
        QCOMPARE(json["width"].toInt(), 64);
        QVERIFY(!json.contains("frames"));
    }
};

QTEST_MAIN(TestVideoClip)
#include "test_video_clip.moc"
