#pragma once

#include <QImage>
#include <QMutex>
#include <deque>

struct TimedFrame {
    QImage image;
    double pts = 0.0;   // presentation timestamp in seconds
    int serial = 0;     // seek generation the frame was decoded in
};

// Bounded hand-off between a decode thread and the main thread.
// Never blocks: the producer polls size() for backpressure.
class FrameQueue {
public:
    explicit FrameQueue(int maxSize = 8) : m_maxSize(maxSize) {}

    bool tryPush(const TimedFrame& frame) {
        QMutexLocker lock(&m_mutex);
        if (static_cast<int>(m_queue.size()) >= m_maxSize) return false;
        m_queue.push_back(frame);
        return true;
    }

    bool tryPop(TimedFrame& frame) {
        QMutexLocker lock(&m_mutex);
        if (m_queue.empty()) return false;
        frame = std::move(m_queue.front());
        m_queue.pop_front();
        return true;
    }

    bool peek(TimedFrame& frame) const {
        QMutexLocker lock(&m_mutex);
        if (m_queue.empty()) return false;
        frame = m_queue.front();
        return true;
    }

    void clear() {
        QMutexLocker lock(&m_mutex);
        m_queue.clear();
    }

    int size() const {
        QMutexLocker lock(&m_mutex);
        return static_cast<int>(m_queue.size());
    }

    bool isFull() const {
        QMutexLocker lock(&m_mutex);
        return static_cast<int>(m_queue.size()) >= m_maxSize;
    }

    bool isEmpty() const {
        QMutexLocker lock(&m_mutex);
        return m_queue.empty();
    }

private:
    mutable QMutex m_mutex;
    std::deque<TimedFrame> m_queue;
    int m_maxSize;
};
