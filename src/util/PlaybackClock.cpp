#include "PlaybackClock.h"

SteadyClock::SteadyClock() {
    m_timer.start();
}

double SteadyClock::now() const {
    return static_cast<double>(m_timer.nsecsElapsed()) / 1e9;
}
