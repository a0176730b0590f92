#include "AudioSource.h"
#include "AudioDecoder.h"
#include "Logging.h"

AudioSource::AudioSource(PlaybackClock* clock, int sampleRate, int channels)
    : MediaSource(clock, sampleRate, channels) {}

bool AudioSource::open(const QString& filePath) {
    AudioDecoder decoder;
    if (!decoder.open(filePath, m_sampleRate, m_channels)) {
        m_error = decoder.errorString();
        return false;
    }

    auto pcm = std::make_shared<std::vector<float>>();
    if (!decoder.decodeAll(*pcm)) {
        m_error = decoder.errorString();
        return false;
    }

    m_duration = static_cast<double>(pcm->size() / m_channels) / m_sampleRate;
    if (decoder.info().duration > 0.0)
        m_duration = qMin(m_duration, decoder.info().duration);
    setPcm(pcm);
    qCDebug(srMedia, "audio %s: %.3fs", qPrintable(filePath), m_duration);
    return true;
}
