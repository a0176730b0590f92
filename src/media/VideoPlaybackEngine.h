#pragma once

#include <QObject>
#include <QThread>
#include <QImage>
#include <QMutex>
#include <QWaitCondition>
#include <atomic>
#include <memory>
#include "FrameQueue.h"
#include "VideoDecoder.h"

// Background thread that decodes sequentially into a FrameQueue and seeks
// only on request. Every seek bumps the serial so stale frames can be dropped.
class DecodeThread : public QThread {
    Q_OBJECT
public:
    DecodeThread(VideoDecoder* decoder, FrameQueue* queue, QObject* parent = nullptr);

    int requestSeek(double seconds);
    void requestStop();
    bool isEof() const { return m_eof; }
    // The last requested seek could not be performed.
    bool seekFailed() const { return m_seekFailed; }
    int serial() const { return m_serial; }

protected:
    void run() override;

private:
    VideoDecoder* m_decoder;
    FrameQueue* m_queue;

    QMutex m_mutex;
    QWaitCondition m_wake;
    std::atomic<bool> m_stopRequested{false};
    std::atomic<bool> m_seekRequested{false};
    std::atomic<bool> m_eof{false};
    std::atomic<bool> m_seekFailed{false};
    std::atomic<int> m_serial{0};
    double m_seekTarget = 0.0;
};

// Owns decoder, decode thread and frame queue for one video file.
class VideoPlaybackEngine : public QObject {
    Q_OBJECT
public:
    explicit VideoPlaybackEngine(QObject* parent = nullptr);
    ~VideoPlaybackEngine();

    bool open(const QString& filePath);
    void close();
    bool isOpen() const;

    // Flushes queued frames and restarts decoding from the keyframe before seconds.
    void seek(double seconds);

    // Advances to the newest queued frame with pts <= target. Returns false
    // when nothing new at or before target is available yet.
    bool advanceTo(double target, TimedFrame& frame);

    bool isFinished() const;
    int serial() const;

    const VideoInfo& info() const;
    QString errorString() const { return m_decoder->errorString(); }

private:
    std::unique_ptr<VideoDecoder> m_decoder;
    std::unique_ptr<FrameQueue> m_frameQueue;
    std::unique_ptr<DecodeThread> m_decodeThread;
};
