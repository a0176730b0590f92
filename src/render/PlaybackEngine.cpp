#include "PlaybackEngine.h"
#include "AudioMixer.h"
#include "TimelineModel.h"
#include "FrameScheduler.h"
#include "PlaybackClock.h"
#include "AppConstants.h"
#include "Logging.h"
#include <QtGlobal>

PlaybackEngine::PlaybackEngine(Compositor* compositor, AudioMixer* mixer, TimelineModel* timeline,
                               PlaybackClock* clock, FrameScheduler* scheduler, QObject* parent)
    : QObject(parent)
    , m_compositor(compositor)
    , m_mixer(mixer)
    , m_timeline(timeline)
    , m_clock(clock)
    , m_scheduler(scheduler)
{}

PlaybackEngine::~PlaybackEngine() {
    cancelPending();
}

double PlaybackEngine::duration() const {
    return m_timeline->totalDuration();
}

int PlaybackEngine::frameIntervalMs() const {
    double fps = m_compositor->config().fps;
    return fps > 0.0 ? qMax(1, qRound(1000.0 / fps)) : 33;
}

void PlaybackEngine::start(double fromTime, bool exportMode) {
    cancelPending();
    ++m_loopId;

    m_exportMode = exportMode;
    m_currentTime = qBound(0.0, fromTime, duration());
    m_anchor = m_clock->now() - m_currentTime;
    m_consecutiveFailures = 0;
    m_mixer->resetClock(m_clock->now());

    qCInfo(srRender) << "start at" << m_currentTime << (exportMode ? "(export)" : "");
    setState(PlaybackState::Playing);
    scheduleStep();
}

void PlaybackEngine::play() {
    double from = m_currentTime >= duration() ? 0.0 : m_currentTime;
    start(from, false);
}

void PlaybackEngine::pause() {
    if (m_state != PlaybackState::Playing) return;
    halt(PlaybackState::Paused);
}

void PlaybackEngine::stop() {
    halt(PlaybackState::Stopped);
}

void PlaybackEngine::togglePlayPause() {
    if (m_state == PlaybackState::Playing) pause();
    else play();
}

void PlaybackEngine::halt(PlaybackState newState) {
    cancelPending();
    ++m_loopId;
    m_exportMode = false;
    m_compositor->silenceAll();
    setState(newState);
}

void PlaybackEngine::cancelPending() {
    if (m_pendingStep) {
        m_scheduler->cancel(m_pendingStep);
        m_pendingStep = 0;
    }
    if (m_pendingSettle) {
        m_scheduler->cancel(m_pendingSettle);
        m_pendingSettle = 0;
    }
}

void PlaybackEngine::setState(PlaybackState state) {
    if (m_state == state) return;
    m_state = state;
    emit stateChanged(state);
}

void PlaybackEngine::scheduleStep() {
    int id = m_loopId;
    m_pendingStep = m_scheduler->schedule(frameIntervalMs(), [this, id]() {
        m_pendingStep = 0;
        step(id);
    });
}

void PlaybackEngine::step(int loopId) {
    if (loopId != m_loopId || m_state != PlaybackState::Playing) return;

    if (m_timeline->itemCount() == 0) {
        qCInfo(srRender) << "timeline emptied, stopping";
        stop();
        return;
    }

    double total = duration();
    double elapsed = m_clock->now() - m_anchor;

    if (elapsed >= total) {
        m_currentTime = total;
        bool exporting = m_exportMode;
        halt(PlaybackState::Stopped);
        FrameState last = m_compositor->render(m_currentTime, RenderMode::Exact, exporting);
        emit tick(m_currentTime);
        if (last.ok) emit frameRendered(m_currentTime, m_compositor->canvas());
        qCInfo(srRender) << "ended at" << total;
        emit ended();
        return;
    }

    m_currentTime = elapsed;
    FrameState frame = m_compositor->render(m_currentTime, RenderMode::Live, m_exportMode);
    m_mixer->process(m_clock->now());

    if (frame.ok) {
        m_consecutiveFailures = 0;
    } else if (++m_consecutiveFailures >= m_compositor->config().maxConsecutiveRenderFailures) {
        QString reason = tr("Rendering failed %1 times in a row: %2")
                             .arg(m_consecutiveFailures).arg(frame.error);
        qCWarning(srRender) << reason;
        stop();
        emit renderFailed(reason);
        return;
    }

    emit tick(m_currentTime);
    if (frame.ok) emit frameRendered(m_currentTime, m_compositor->canvas());

    // A slot above may have stopped or restarted the loop
    if (loopId == m_loopId && m_state == PlaybackState::Playing) scheduleStep();
}

void PlaybackEngine::seek(double seconds) {
    if (m_state == PlaybackState::Playing) pause();
    else cancelPending();

    m_currentTime = qBound(0.0, seconds, duration());
    FrameState frame = m_compositor->render(m_currentTime, RenderMode::Exact);

    emit seekPerformed(m_currentTime);
    emit tick(m_currentTime);
    if (frame.ok) emit frameRendered(m_currentTime, m_compositor->canvas());

    // The decoder may still be catching up with the new position
    if (frame.activeIndex >= 0 && !frame.drawn) {
        m_settleDeadline = m_clock->now() + AppConstants::SeekSettleTimeout;
        scheduleSettle();
    }
}

void PlaybackEngine::scheduleSettle() {
    int id = m_loopId;
    m_pendingSettle = m_scheduler->schedule(frameIntervalMs(), [this, id]() {
        m_pendingSettle = 0;
        if (id != m_loopId || m_state == PlaybackState::Playing) return;

        FrameState frame = m_compositor->render(m_currentTime, RenderMode::Exact);
        if (frame.ok) emit frameRendered(m_currentTime, m_compositor->canvas());
        if (frame.drawn || frame.activeIndex < 0) return;

        if (m_clock->now() < m_settleDeadline)
            scheduleSettle();
        else
            qCWarning(srRender) << "no frame at" << m_currentTime << "after seek, giving up";
    });
}
