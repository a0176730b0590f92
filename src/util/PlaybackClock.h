#pragma once

#include <QElapsedTimer>

// Monotonic time source in seconds. The render loop, the media sources and
// the mixer pump all read the same clock.
class PlaybackClock {
public:
    virtual ~PlaybackClock() = default;
    virtual double now() const = 0;
};

class SteadyClock : public PlaybackClock {
public:
    SteadyClock();
    double now() const override;

private:
    QElapsedTimer m_timer;
};
