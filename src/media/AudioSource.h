#pragma once

#include <QString>
#include "MediaSource.h"

// Music or narration file, fully decoded to PCM on open.
class AudioSource : public MediaSource {
public:
    AudioSource(PlaybackClock* clock, int sampleRate, int channels);

    bool open(const QString& filePath);

    bool isReady() const override { return m_duration > 0.0; }
    bool hasFrame() override { return false; }
    QImage currentFrame() override { return QImage(); }
    QSize naturalSize() const override { return QSize(); }
    double duration() const override { return m_duration; }
    QString errorString() const override { return m_error; }

private:
    double m_duration = 0.0;
    QString m_error;
};
