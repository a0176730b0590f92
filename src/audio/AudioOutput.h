#pragma once

#include <QObject>
#include <QString>
#include <memory>
#include "AudioEndpoint.h"

class QAudioSink;
class RingBuffer;
class RingBufferDevice;

// Monitor destination: speakers via QAudioSink, fed from a locked ring buffer
// the sink pulls on its own thread.
class AudioOutput : public QObject, public AudioEndpoint {
    Q_OBJECT
public:
    explicit AudioOutput(int sampleRate, int channels, int bufferMs = 250, QObject* parent = nullptr);
    ~AudioOutput();

    bool open();
    void start();
    void stop();
    bool isOpen() const { return m_sink != nullptr; }
    bool isPlaying() const { return m_playing; }

    void writeAudio(const float* interleaved, int frames) override;
    void flush() override;
    int bufferedFrames() const;

    QString errorString() const { return m_error; }

private:
    int m_sampleRate;
    int m_channels;
    std::unique_ptr<RingBuffer> m_ring;
    std::unique_ptr<RingBufferDevice> m_device;
    std::unique_ptr<QAudioSink> m_sink;
    bool m_playing = false;
    QString m_error;
};
