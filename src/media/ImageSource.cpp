#include "ImageSource.h"
#include <QImageReader>

ImageSource::ImageSource(PlaybackClock* clock, int sampleRate, int channels)
    : MediaSource(clock, sampleRate, channels) {}

bool ImageSource::open(const QString& filePath) {
    QImageReader reader(filePath);
    reader.setAutoTransform(true);   // honour EXIF orientation
    QImage img = reader.read();
    if (img.isNull()) {
        m_error = QString("Cannot read image %1: %2").arg(filePath, reader.errorString());
        return false;
    }
    m_image = img.convertToFormat(QImage::Format_ARGB32_Premultiplied);
    return true;
}
