#include "ExportAudioSink.h"
#include <QMutexLocker>

ExportAudioSink::ExportAudioSink(int channels) : m_channels(channels) {}

void ExportAudioSink::writeAudio(const float* interleaved, int frames) {
    QMutexLocker lock(&m_mutex);
    m_samples.insert(m_samples.end(), interleaved,
                     interleaved + static_cast<size_t>(frames) * m_channels);
}

void ExportAudioSink::flush() {
    QMutexLocker lock(&m_mutex);
    m_samples.clear();
}

std::vector<float> ExportAudioSink::takeSamples() {
    QMutexLocker lock(&m_mutex);
    std::vector<float> out;
    out.swap(m_samples);
    return out;
}

int ExportAudioSink::bufferedFrames() const {
    QMutexLocker lock(&m_mutex);
    return static_cast<int>(m_samples.size() / m_channels);
}
