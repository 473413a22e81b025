#pragma once

#include <montage/media/audio_source.h>
#include <montage/media/frame_source.h>

#include <QColor>
#include <QImage>

#include <algorithm>
#include <cmath>
#include <map>
#include <memory>
#include <vector>

// In-memory collaborators standing in for decoders and audio output

/**
 * Frame source producing solid-colour frames
 * Frame i has red channel i % 256, so a pixel read tells which frame was drawn.
 */
class FakeFrameSource : public montage::FrameSource
{
public:
    FakeFrameSource(int width, int height, double durationMs, std::vector<double> timestamps = {})
    {
        m_metadata.width = width;
        m_metadata.height = height;
        m_metadata.totalDurationMs = durationMs;
        m_metadata.timestamps = std::move(timestamps);
    }

    montage::FrameSourceMetadata metadata() const override { return m_metadata; }

    montage::Result<QImage> frameAtIndex(int index, bool prefetch) override {
        ++requestCount;
        lastIndex = index;
        lastPrefetch = prefetch;
        if (cleanedUp) {
            return montage::Error::source_missing("source released");
        }
        if (failDecode) {
            return montage::Error::decode_failed("corrupt frame " + std::to_string(index));
        }
        if (pending) {
            return QImage();
        }
        QImage image(m_metadata.width, m_metadata.height, QImage::Format_ARGB32_Premultiplied);
        image.fill(colorForIndex(index));
        return image;
    }

    void cleanup() override {
        cleanedUp = true;
        *cleanupProbe = true;
    }

    static QColor colorForIndex(int index) { return QColor(index % 256, 64, 128); }

    int requestCount = 0;
    int lastIndex = -1;
    bool lastPrefetch = false;
    bool failDecode = false;
    bool pending = false;
    bool cleanedUp = false;
    std::shared_ptr<bool> cleanupProbe = std::make_shared<bool>(false);

private:
    montage::FrameSourceMetadata m_metadata;
};

// Mono ramp: sample n of the source holds n / rate
class FakeAudioSource : public montage::AudioFrameSource
{
public:
    FakeAudioSource(double durationMs, int32_t sampleRate = 1000, int32_t channels = 1)
    {
        const int64_t frames = static_cast<int64_t>(std::llround(durationMs / 1000.0 * sampleRate));
        std::vector<float> samples(static_cast<size_t>(frames * channels));
        for (int64_t i = 0; i < frames; ++i) {
            for (int32_t c = 0; c < channels; ++c) {
                samples[static_cast<size_t>(i * channels + c)] = static_cast<float>(i) / sampleRate;
            }
        }
        m_buffer = montage::AudioBuffer(sampleRate, channels, std::move(samples));
    }

    montage::AudioSourceMetadata metadata() const override {
        montage::AudioSourceMetadata metadata;
        metadata.totalDurationMs = m_buffer.durationMs();
        metadata.sampleRate = m_buffer.sampleRate();
        metadata.channels = m_buffer.channels();
        return metadata;
    }

    montage::AudioBuffer audioBuffer() const override { return m_buffer; }
    void cleanup() override {
        cleanedUp = true;
        *cleanupProbe = true;
    }

    bool cleanedUp = false;
    // Outlives the source, for checks after the last owner released it
    std::shared_ptr<bool> cleanupProbe = std::make_shared<bool>(false);

private:
    montage::AudioBuffer m_buffer;
};

// Resamples by dropping or repeating frames; enough to check lengths
class FakeTimeStretcher : public montage::TimeStretcher
{
public:
    montage::Result<montage::AudioBuffer> stretch(const montage::AudioBuffer& buffer, double speed) override {
        ++calls;
        lastSpeed = speed;
        if (fail) {
            return montage::Error::internal("stretch failed");
        }
        const int64_t frames = std::max<int64_t>(1, static_cast<int64_t>(std::llround(buffer.frames() / speed)));
        std::vector<float> samples(static_cast<size_t>(frames * buffer.channels()));
        for (int64_t i = 0; i < frames; ++i) {
            const int64_t source = std::min<int64_t>(buffer.frames() - 1, static_cast<int64_t>(i * speed));
            for (int32_t c = 0; c < buffer.channels(); ++c) {
                samples[static_cast<size_t>(i * buffer.channels() + c)] = buffer.sample(source, c);
            }
        }
        return montage::AudioBuffer(buffer.sampleRate(), buffer.channels(), std::move(samples));
    }

    int calls = 0;
    double lastSpeed = 0.0;
    bool fail = false;
};

// Records scheduled playback instead of producing sound
class RecordingAudioSink : public montage::AudioSink
{
public:
    struct Scheduled {
        montage::AudioBuffer buffer;
        double whenSec = 0.0;
        double offsetSec = 0.0;
    };

    montage::Result<int> schedule(const montage::AudioBuffer& buffer, double whenSec, double offsetSec) override {
        if (refuse) {
            return montage::Error::internal("device unavailable");
        }
        const int handle = m_nextHandle++;
        active[handle] = Scheduled{buffer, whenSec, offsetSec};
        ++scheduleCount;
        return handle;
    }

    void stop(int handle) override {
        active.erase(handle);
        ++stopCount;
    }

    double currentTimeSec() const override { return deviceTimeSec; }

    std::map<int, Scheduled> active;
    int scheduleCount = 0;
    int stopCount = 0;
    double deviceTimeSec = 0.0;
    bool refuse = false;

private:
    int m_nextHandle = 1;
};
