#include "FrameScheduler.h"
#include <QTimer>

TimerFrameScheduler::TimerFrameScheduler(QObject* parent) : QObject(parent) {}

TimerFrameScheduler::~TimerFrameScheduler() {
    for (auto& [handle, timer] : m_timers) timer->stop();
}

int TimerFrameScheduler::schedule(int delayMs, std::function<void()> callback) {
    int handle = m_nextHandle++;
    auto* timer = new QTimer(this);
    timer->setSingleShot(true);
    timer->setTimerType(Qt::PreciseTimer);

    connect(timer, &QTimer::timeout, this, [this, handle, timer, cb = std::move(callback)]() {
        m_timers.erase(handle);
        timer->deleteLater();
        cb();
    });

    m_timers[handle] = timer;
    timer->start(qMax(0, delayMs));
    return handle;
}

void TimerFrameScheduler::cancel(int handle) {
    auto it = m_timers.find(handle);
    if (it == m_timers.end()) return;
    it->second->stop();
    it->second->deleteLater();
    m_timers.erase(it);
}
