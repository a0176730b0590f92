#pragma once

#include <QImage>
#include <QString>
#include "MediaSource.h"

// Still image. Position/play state is tracked but has no visual effect.
class ImageSource : public MediaSource {
public:
    ImageSource(PlaybackClock* clock, int sampleRate, int channels);

    bool open(const QString& filePath);

    bool isReady() const override { return !m_image.isNull(); }
    bool hasFrame() override { return !m_image.isNull(); }
    QImage currentFrame() override { return m_image; }
    QSize naturalSize() const override { return m_image.size(); }
    double duration() const override { return 0.0; }
    QString errorString() const override { return m_error; }

private:
    QImage m_image;
    QString m_error;
};
