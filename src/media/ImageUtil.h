#pragma once

#include <QImage>
#include <QRectF>
#include <QSizeF>

namespace ImageUtil {
    // Largest uniform scale that fits source inside target (letterbox/contain).
    double containScale(const QSizeF& source, const QSizeF& target);

    // Rect of a source drawn at scale * contain-fit, centered on the target
    // and shifted by (offsetX, offsetY).
    QRectF placedRect(const QSizeF& source, const QSizeF& target,
                      double scale, double offsetX, double offsetY);

    QImage createPlaceholder(int width, int height, const QString& text);
}
