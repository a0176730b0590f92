#pragma once

#include <QObject>
#include <QString>
#include <QImage>
#include <QByteArray>
#include "StreamRecorder.h"

struct AVFormatContext;
struct AVIOContext;
struct AVCodecContext;
struct AVStream;
struct AVFrame;
struct AVPacket;
struct SwsContext;
struct SwrContext;
struct AVAudioFifo;

// FFmpeg stream recorder. The muxer writes through custom AVIO callbacks
// into memory, so nothing touches disk until the artifact is assembled.
class MediaExporter : public QObject, public StreamRecorder {
    Q_OBJECT
public:
    explicit MediaExporter(QObject* parent = nullptr);
    ~MediaExporter();

    bool start(const RecorderSettings& settings) override;
    bool writeVideoFrame(const QImage& frame) override;
    bool writeAudio(const float* interleaved, int frames) override;
    bool finish(QByteArray& output) override;
    void abort() override;
    QString errorString() const override { return m_error; }

    bool isRecording() const { return m_recording; }
    int64_t videoFramesWritten() const { return m_videoFrames; }
    int64_t audioSamplesWritten() const { return m_audioSamples; }
    int64_t bytesWritten() const { return m_output.size(); }

private:
    bool openOutput();
    bool openVideoEncoder();
    bool openAudioEncoder();
    bool encodeAudioFromFifo(bool flush);
    bool sendFrame(AVCodecContext* enc, AVStream* stream, AVFrame* frame);
    bool fail(const QString& what, int err = 0);
    void release();

    friend struct ChunkWriter;

    RecorderSettings m_settings;
    bool m_recording = false;
    QString m_error;
    QByteArray m_output;
    int64_t m_writePos = 0;

    AVFormatContext* m_fmtCtx = nullptr;
    AVIOContext* m_ioCtx = nullptr;
    AVCodecContext* m_videoEnc = nullptr;
    AVCodecContext* m_audioEnc = nullptr;
    AVStream* m_videoStream = nullptr;
    AVStream* m_audioStream = nullptr;
    AVFrame* m_videoFrame = nullptr;
    AVFrame* m_audioFrame = nullptr;
    AVPacket* m_packet = nullptr;
    SwsContext* m_swsCtx = nullptr;
    SwrContext* m_swrCtx = nullptr;
    AVAudioFifo* m_fifo = nullptr;
    int m_audioFrameSize = 1024;

    int64_t m_videoFrames = 0;
    int64_t m_audioSamples = 0;
};
