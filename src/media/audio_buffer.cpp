#include <montage/media/audio_buffer.h>
#include "impl/audio_buffer_impl.h"

#include <QLoggingCategory>

#include <algorithm>
#include <cmath>

Q_LOGGING_CATEGORY(montageAudio, "montage.audio")

namespace montage {

namespace {
// Absorbs binary rounding in seconds x rate products (2.01 * 1000 = 2009.999...)
constexpr double kSampleEpsilon = 1e-6;
} // namespace

AudioBufferImpl::AudioBufferImpl(int32_t sample_rate_, int32_t channels_, std::vector<float> data_)
    : sample_rate(sample_rate_)
    , channels(channels_)
    , data(std::move(data_)) {
}

AudioBuffer::AudioBuffer() = default;

AudioBuffer::AudioBuffer(int32_t sampleRate, int32_t channels, std::vector<float> interleaved)
    : m_impl(std::make_shared<const AudioBufferImpl>(sampleRate, channels, std::move(interleaved)))
{
}

AudioBuffer AudioBuffer::silence(int32_t sampleRate, int32_t channels, int64_t frames)
{
    const int64_t count = std::max<int64_t>(0, frames) * std::max(0, channels);
    return AudioBuffer(sampleRate, channels, std::vector<float>(static_cast<size_t>(count), 0.0f));
}

bool AudioBuffer::isNull() const
{
    return !m_impl || m_impl->sample_rate <= 0 || m_impl->channels <= 0;
}

int32_t AudioBuffer::sampleRate() const
{
    return m_impl ? m_impl->sample_rate : 0;
}

int32_t AudioBuffer::channels() const
{
    return m_impl ? m_impl->channels : 0;
}

int64_t AudioBuffer::frames() const
{
    if (!m_impl || m_impl->channels <= 0) return 0;
    return static_cast<int64_t>(m_impl->data.size()) / m_impl->channels;
}

double AudioBuffer::durationMs() const
{
    if (isNull()) return 0.0;
    return static_cast<double>(frames()) / m_impl->sample_rate * 1000.0;
}

const float* AudioBuffer::data() const
{
    return m_impl ? m_impl->data.data() : nullptr;
}

float AudioBuffer::sample(int64_t frame, int32_t channel) const
{
    if (isNull() || frame < 0 || frame >= frames() || channel < 0 || channel >= m_impl->channels) {
        return 0.0f;
    }
    return m_impl->data[static_cast<size_t>(frame * m_impl->channels + channel)];
}

int64_t AudioBuffer::clampedSample(double seconds, bool roundUp) const
{
    const double position = seconds * m_impl->sample_rate;
    const int64_t index = static_cast<int64_t>(roundUp ? std::ceil(position - kSampleEpsilon)
                                                       : std::floor(position + kSampleEpsilon));
    return std::clamp<int64_t>(index, 0, frames());
}

AudioBuffer AudioBuffer::segment(double startSec, double endSec) const
{
    if (isNull()) return AudioBuffer();

    const int64_t first = clampedSample(startSec, false);
    const int64_t last = std::max(first, clampedSample(endSec, true));
    const int32_t channels = m_impl->channels;

    std::vector<float> data(m_impl->data.begin() + first * channels,
                            m_impl->data.begin() + last * channels);
    return AudioBuffer(m_impl->sample_rate, channels, std::move(data));
}

AudioBuffer AudioBuffer::removeInterval(double startSec, double endSec) const
{
    if (isNull()) return AudioBuffer();

    const int64_t first = clampedSample(startSec, false);
    const int64_t last = std::max(first, clampedSample(endSec, true));
    const int64_t remaining = frames() - (last - first);
    const int32_t channels = m_impl->channels;

    if (remaining <= 0) {
        qCWarning(montageAudio) << "Cut would empty the audio buffer; keeping one silent sample";
        return silence(m_impl->sample_rate, channels, 1);
    }

    std::vector<float> data;
    data.reserve(static_cast<size_t>(remaining * channels));
    data.insert(data.end(), m_impl->data.begin(), m_impl->data.begin() + first * channels);
    data.insert(data.end(), m_impl->data.begin() + last * channels, m_impl->data.end());

    qCDebug(montageAudio) << "Cut audio" << startSec << "-" << endSec << "s:" << frames()
                          << "->" << remaining << "frames";
    return AudioBuffer(m_impl->sample_rate, channels, std::move(data));
}

} // namespace montage
