#pragma once

#include <QObject>
#include <QString>
#include <memory>
#include <vector>

struct AudioInfo {
    int sampleRate = 0;     // source rate
    int channels = 0;       // source channel count
    double duration = 0.0;
    QString codecName;
};

// Decodes the best audio stream of a file into interleaved float PCM,
// resampled to a fixed output rate/channel count.
class AudioDecoder : public QObject {
    Q_OBJECT
public:
    explicit AudioDecoder(QObject* parent = nullptr);
    ~AudioDecoder();

    bool open(const QString& filePath, int outSampleRate, int outChannels);
    void close();
    bool isOpen() const { return m_isOpen; }

    // Whole stream from the current position. maxSeconds < 0 = until EOF.
    bool decodeAll(std::vector<float>& pcm, double maxSeconds = -1.0);
    bool seek(double seconds);

    const AudioInfo& info() const { return m_info; }
    int outSampleRate() const { return m_outRate; }
    int outChannels() const { return m_outChannels; }
    QString errorString() const { return m_error; }

private:
    bool fail(const QString& message, int code = 0);

    bool m_isOpen = false;
    AudioInfo m_info;
    int m_outRate = 48000;
    int m_outChannels = 2;
    QString m_error;

    struct FFmpegAudioContext;
    std::unique_ptr<FFmpegAudioContext> m_ctx;
};
