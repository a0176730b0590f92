#include "ImageUtil.h"
#include <QPainter>

namespace ImageUtil {

double containScale(const QSizeF& source, const QSizeF& target) {
    if (source.isEmpty() || target.isEmpty()) return 0.0;
    return qMin(target.width() / source.width(), target.height() / source.height());
}

QRectF placedRect(const QSizeF& source, const QSizeF& target,
                  double scale, double offsetX, double offsetY) {
    double s = containScale(source, target) * scale;
    double w = source.width() * s;
    double h = source.height() * s;
    double cx = target.width() / 2.0 + offsetX;
    double cy = target.height() / 2.0 + offsetY;
    return QRectF(cx - w / 2.0, cy - h / 2.0, w, h);
}

QImage createPlaceholder(int width, int height, const QString& text) {
    QImage img(width, height, QImage::Format_RGB32);
    img.fill(QColor(30, 30, 30));

    QPainter p(&img);
    p.setPen(QColor(100, 100, 100));
    QFont font = p.font();
    font.setPointSize(14);
    p.setFont(font);
    p.drawText(img.rect(), Qt::AlignCenter, text);
    p.end();

    return img;
}

} // namespace ImageUtil
