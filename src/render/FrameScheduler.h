#pragma once

#include <QObject>
#include <functional>
#include <map>

class QTimer;

// Single-shot callback scheduling for the render loop.
class FrameScheduler {
public:
    virtual ~FrameScheduler() = default;

    // Returns a handle usable with cancel(); handles are never 0.
    virtual int schedule(int delayMs, std::function<void()> callback) = 0;
    // Unknown or already-fired handles are ignored.
    virtual void cancel(int handle) = 0;
};

// Event-loop backed scheduler built on single-shot QTimers.
class TimerFrameScheduler : public QObject, public FrameScheduler {
    Q_OBJECT
public:
    explicit TimerFrameScheduler(QObject* parent = nullptr);
    ~TimerFrameScheduler();

    int schedule(int delayMs, std::function<void()> callback) override;
    void cancel(int handle) override;

    int pendingCount() const { return static_cast<int>(m_timers.size()); }

private:
    std::map<int, QTimer*> m_timers;
    int m_nextHandle = 1;
};
