#pragma once

#include <QString>
#include <memory>
#include "MediaSource.h"
#include "VideoPlaybackEngine.h"

class VideoSource : public MediaSource {
public:
    VideoSource(PlaybackClock* clock, int sampleRate, int channels);
    ~VideoSource() override;

    bool open(const QString& filePath);

    bool isReady() const override;
    bool hasFrame() override;
    QImage currentFrame() override;
    QSize naturalSize() const override;
    double duration() const override;
    QString errorString() const override { return m_error; }

    // True while a seek has been issued but no frame at the target has arrived.
    bool isSeeking() const { return m_seeking; }

protected:
    void onPositionChanged(double seconds) override;

private:
    void pump();

    std::unique_ptr<VideoPlaybackEngine> m_engine;
    TimedFrame m_current;
    bool m_hasCurrent = false;
    bool m_seeking = false;
    double m_seekTarget = 0.0;
    QString m_error;
};
