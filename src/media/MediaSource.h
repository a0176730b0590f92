#pragma once

#include <QImage>
#include <QSize>
#include <QString>
#include <memory>
#include <vector>

class PlaybackClock;

// Live handle to one decoded media file, the unit the compositor positions,
// plays, pauses and draws. Playback position runs off the shared clock while
// playing; audio is served from an in-memory PCM buffer at the mixer rate.
class MediaSource {
public:
    MediaSource(PlaybackClock* clock, int sampleRate, int channels);
    virtual ~MediaSource();

    MediaSource(const MediaSource&) = delete;
    MediaSource& operator=(const MediaSource&) = delete;

    // Metadata (duration, size) is known.
    virtual bool isReady() const = 0;
    // A frame for the current position can be drawn now.
    virtual bool hasFrame() = 0;
    virtual QImage currentFrame() = 0;
    virtual QSize naturalSize() const = 0;
    virtual double duration() const = 0;
    virtual QString errorString() const { return QString(); }

    double position() const;
    // False when the underlying seek could not be issued.
    virtual bool setPosition(double seconds);
    virtual void play();
    virtual void pause();
    bool isPaused() const { return !m_playing; }

    bool hasAudio() const { return m_pcm && !m_pcm->empty(); }
    // Copies frames of interleaved PCM from the current audio position.
    // Returns how many were real samples; the rest is zero-filled.
    virtual int readAudio(float* out, int frames);

protected:
    void setPcm(std::shared_ptr<const std::vector<float>> pcm);
    virtual void onPositionChanged(double seconds);

    PlaybackClock* m_clock;
    int m_sampleRate;
    int m_channels;

private:
    void resyncAudioCursor();

    bool m_playing = false;
    double m_anchorPosition = 0.0;
    double m_anchorClock = 0.0;

    std::shared_ptr<const std::vector<float>> m_pcm;
    int64_t m_audioCursor = 0;    // frames
};
