#pragma once

#include <QObject>
#include <QImage>
#include "Compositor.h"

class AudioMixer;
class TimelineModel;
class PlaybackClock;
class FrameScheduler;

enum class PlaybackState {
    Stopped,
    Playing,
    Paused
};

// Cooperative render loop: a chain of single-shot steps anchored to the
// playback clock. A new start() always cancels the pending step first.
class PlaybackEngine : public QObject {
    Q_OBJECT
public:
    PlaybackEngine(Compositor* compositor, AudioMixer* mixer, TimelineModel* timeline,
                   PlaybackClock* clock, FrameScheduler* scheduler, QObject* parent = nullptr);
    ~PlaybackEngine();

    void start(double fromTime, bool exportMode = false);
    void play();
    void pause();
    void stop();
    void togglePlayPause();
    // Exact render at t; pauses if playing, never starts playback.
    void seek(double seconds);

    PlaybackState state() const { return m_state; }
    bool isPlaying() const { return m_state == PlaybackState::Playing; }
    bool isExporting() const { return m_exportMode; }
    double currentTime() const { return m_currentTime; }
    double duration() const;
    int loopId() const { return m_loopId; }
    int frameIntervalMs() const;

signals:
    void tick(double currentTime);
    void stateChanged(PlaybackState state);
    void frameRendered(double time, const QImage& canvas);
    void ended();
    void renderFailed(const QString& reason);
    void seekPerformed(double seconds);

private:
    void scheduleStep();
    void step(int loopId);
    void halt(PlaybackState newState);
    void cancelPending();
    void scheduleSettle();
    void setState(PlaybackState state);

    Compositor* m_compositor;
    AudioMixer* m_mixer;
    TimelineModel* m_timeline;
    PlaybackClock* m_clock;
    FrameScheduler* m_scheduler;

    PlaybackState m_state = PlaybackState::Stopped;
    bool m_exportMode = false;
    double m_currentTime = 0.0;
    double m_anchor = 0.0;
    int m_loopId = 0;
    int m_pendingStep = 0;
    int m_pendingSettle = 0;
    double m_settleDeadline = 0.0;
    int m_consecutiveFailures = 0;
};
