#include "VideoPlaybackEngine.h"
#include "Logging.h"

namespace {
    constexpr int QueueDepth = 8;
}

// --- DecodeThread ---

DecodeThread::DecodeThread(VideoDecoder* decoder, FrameQueue* queue, QObject* parent)
    : QThread(parent), m_decoder(decoder), m_queue(queue) {}

int DecodeThread::requestSeek(double seconds) {
    QMutexLocker lock(&m_mutex);
    m_seekTarget = seconds;
    m_seekRequested = true;
    m_eof = false;
    m_seekFailed = false;
    int serial = ++m_serial;
    m_queue->clear();
    m_wake.wakeOne();
    return serial;
}

void DecodeThread::requestStop() {
    QMutexLocker lock(&m_mutex);
    m_stopRequested = true;
    m_wake.wakeOne();
}

void DecodeThread::run() {
    int serial = m_serial;

    while (!m_stopRequested) {
        if (m_seekRequested) {
            double target;
            {
                QMutexLocker lock(&m_mutex);
                target = m_seekTarget;
                serial = m_serial;
                m_seekRequested = false;
            }
            m_queue->clear();
            if (m_decoder->seek(target)) {
                m_eof = false;
            } else {
                // Nothing near the target will arrive; end the stream so waiters give up
                qCWarning(srMedia) << "decoder seek to" << target << "failed:" << m_decoder->errorString();
                m_seekFailed = true;
                m_eof = true;
            }
        }

        if (m_eof) {
            QMutexLocker lock(&m_mutex);
            if (!m_stopRequested && !m_seekRequested)
                m_wake.wait(&m_mutex, 100);
            continue;
        }

        TimedFrame tf;
        if (!m_decoder->decodeNextFrame(tf.image, tf.pts)) {
            m_eof = true;
            continue;
        }
        tf.serial = serial;

        // Backpressure: poll so seek/stop stay responsive
        while (!m_stopRequested && !m_seekRequested) {
            if (m_queue->tryPush(tf)) break;
            QThread::msleep(2);
        }
    }
}

// --- VideoPlaybackEngine ---

VideoPlaybackEngine::VideoPlaybackEngine(QObject* parent)
    : QObject(parent)
    , m_decoder(std::make_unique<VideoDecoder>())
    , m_frameQueue(std::make_unique<FrameQueue>(QueueDepth))
{}

VideoPlaybackEngine::~VideoPlaybackEngine() {
    close();
}

bool VideoPlaybackEngine::open(const QString& filePath) {
    close();

    if (!m_decoder->open(filePath))
        return false;

    m_decodeThread = std::make_unique<DecodeThread>(m_decoder.get(), m_frameQueue.get());
    m_decodeThread->start();
    return true;
}

void VideoPlaybackEngine::close() {
    if (m_decodeThread) {
        m_decodeThread->requestStop();
        m_decodeThread->wait(2000);
        m_decodeThread.reset();
    }
    m_frameQueue->clear();
    m_decoder->close();
}

bool VideoPlaybackEngine::isOpen() const {
    return m_decoder->isOpen();
}

void VideoPlaybackEngine::seek(double seconds) {
    if (!m_decodeThread) return;
    m_decodeThread->requestSeek(seconds);
}

bool VideoPlaybackEngine::advanceTo(double target, TimedFrame& frame) {
    if (!m_decodeThread) return false;
    int current = m_decodeThread->serial();
    bool advanced = false;

    TimedFrame next;
    while (m_frameQueue->peek(next)) {
        if (next.serial != current) {
            m_frameQueue->tryPop(next);    // decoded before the last seek
            continue;
        }
        if (next.pts > target) break;
        m_frameQueue->tryPop(frame);
        advanced = true;
    }
    return advanced;
}

bool VideoPlaybackEngine::isFinished() const {
    return m_decodeThread && m_decodeThread->isEof() && m_frameQueue->isEmpty();
}

int VideoPlaybackEngine::serial() const {
    return m_decodeThread ? m_decodeThread->serial() : 0;
}

const VideoInfo& VideoPlaybackEngine::info() const {
    return m_decoder->info();
}
