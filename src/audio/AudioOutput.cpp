#include "AudioOutput.h"
#include "Logging.h"
#include <QAudioFormat>
#include <QAudioSink>
#include <QIODevice>
#include <QMediaDevices>
#include <QMutex>
#include <QMutexLocker>
#include <algorithm>
#include <cstring>
#include <vector>

class RingBuffer {
public:
    RingBuffer(size_t capacityFrames, int channels)
        : m_channels(channels)
        , m_capacity(capacityFrames * static_cast<size_t>(channels))
        , m_buffer(m_capacity) {}

    // Returns frames written; the overflow is dropped.
    int write(const float* data, int frames) {
        QMutexLocker lock(&m_mutex);
        size_t samples = static_cast<size_t>(frames) * m_channels;
        size_t toWrite = std::min(samples, m_capacity - m_count);
        if (toWrite == 0) return 0;

        size_t first = std::min(toWrite, m_capacity - m_writePos);
        std::memcpy(m_buffer.data() + m_writePos, data, first * sizeof(float));
        if (toWrite > first)
            std::memcpy(m_buffer.data(), data + first, (toWrite - first) * sizeof(float));

        m_writePos = (m_writePos + toWrite) % m_capacity;
        m_count += toWrite;
        return static_cast<int>(toWrite / m_channels);
    }

    // Fills the whole request; missing frames are silence.
    int read(float* data, int frames) {
        QMutexLocker lock(&m_mutex);
        size_t samples = static_cast<size_t>(frames) * m_channels;
        size_t toRead = std::min(samples, m_count);

        size_t first = std::min(toRead, m_capacity - m_readPos);
        std::memcpy(data, m_buffer.data() + m_readPos, first * sizeof(float));
        if (toRead > first)
            std::memcpy(data + first, m_buffer.data(), (toRead - first) * sizeof(float));
        if (toRead < samples)
            std::memset(data + toRead, 0, (samples - toRead) * sizeof(float));

        m_readPos = (m_readPos + toRead) % m_capacity;
        m_count -= toRead;
        return static_cast<int>(toRead / m_channels);
    }

    int availableFrames() const {
        QMutexLocker lock(&m_mutex);
        return static_cast<int>(m_count / m_channels);
    }

    void clear() {
        QMutexLocker lock(&m_mutex);
        m_readPos = m_writePos = m_count = 0;
    }

private:
    int m_channels;
    size_t m_capacity;
    std::vector<float> m_buffer;
    size_t m_readPos = 0;
    size_t m_writePos = 0;
    size_t m_count = 0;
    mutable QMutex m_mutex;
};

class RingBufferDevice : public QIODevice {
public:
    RingBufferDevice(RingBuffer* ring, int channels) : m_ring(ring), m_channels(channels) {}

    qint64 readData(char* data, qint64 maxlen) override {
        qint64 bytesPerFrame = static_cast<qint64>(m_channels) * sizeof(float);
        int frames = static_cast<int>(maxlen / bytesPerFrame);
        m_ring->read(reinterpret_cast<float*>(data), frames);
        return frames * bytesPerFrame;
    }

    qint64 writeData(const char*, qint64) override { return -1; }

    qint64 bytesAvailable() const override {
        return m_ring->availableFrames() * m_channels * static_cast<qint64>(sizeof(float))
               + QIODevice::bytesAvailable();
    }

private:
    RingBuffer* m_ring;
    int m_channels;
};

AudioOutput::AudioOutput(int sampleRate, int channels, int bufferMs, QObject* parent)
    : QObject(parent)
    , m_sampleRate(sampleRate)
    , m_channels(channels)
    , m_ring(std::make_unique<RingBuffer>(static_cast<size_t>(sampleRate) * bufferMs / 1000, channels))
    , m_device(std::make_unique<RingBufferDevice>(m_ring.get(), channels))
{}

AudioOutput::~AudioOutput() {
    stop();
}

bool AudioOutput::open() {
    QAudioFormat format;
    format.setSampleRate(m_sampleRate);
    format.setChannelCount(m_channels);
    format.setSampleFormat(QAudioFormat::Float);

    QAudioDevice device = QMediaDevices::defaultAudioOutput();
    if (device.isNull()) {
        m_error = tr("No audio output device");
        return false;
    }
    if (!device.isFormatSupported(format)) {
        m_error = tr("Audio device %1 does not accept %2 Hz float stereo")
                      .arg(device.description()).arg(m_sampleRate);
        return false;
    }

    m_sink = std::make_unique<QAudioSink>(device, format);
    qCInfo(srAudio) << "monitor output:" << device.description();
    return true;
}

void AudioOutput::start() {
    if (!m_sink || m_playing) return;
    if (!m_device->open(QIODevice::ReadOnly)) {
        qCWarning(srAudio) << "cannot open monitor ring device";
        return;
    }
    m_sink->start(m_device.get());
    m_playing = true;
}

void AudioOutput::stop() {
    if (!m_sink || !m_playing) return;
    m_sink->stop();
    m_device->close();
    m_playing = false;
}

void AudioOutput::writeAudio(const float* interleaved, int frames) {
    int written = m_ring->write(interleaved, frames);
    if (written < frames)
        qCDebug(srAudio) << "monitor buffer full, dropped" << (frames - written) << "frames";
}

void AudioOutput::flush() {
    m_ring->clear();
}

int AudioOutput::bufferedFrames() const {
    return m_ring->availableFrames();
}
