#pragma once

#include <QString>
#include <QDateTime>

namespace TimeUtil {

inline QString secondsToHMSms(double totalSeconds) {
    if (totalSeconds < 0) totalSeconds = 0;
    int hours = static_cast<int>(totalSeconds) / 3600;
    int minutes = (static_cast<int>(totalSeconds) % 3600) / 60;
    int seconds = static_cast<int>(totalSeconds) % 60;
    int millis = static_cast<int>((totalSeconds - static_cast<int>(totalSeconds)) * 1000);

    return QString("%1:%2:%3.%4")
        .arg(hours, 2, 10, QChar('0'))
        .arg(minutes, 2, 10, QChar('0'))
        .arg(seconds, 2, 10, QChar('0'))
        .arg(millis, 3, 10, QChar('0'));
}

inline QString secondsToMMSS(double totalSeconds) {
    if (totalSeconds < 0) totalSeconds = 0;
    int minutes = static_cast<int>(totalSeconds) / 60;
    int seconds = static_cast<int>(totalSeconds) % 60;
    return QString("%1:%2")
        .arg(minutes)
        .arg(seconds, 2, 10, QChar('0'));
}

// "storyreel_20261019_143005.mp4"
inline QString exportFileName(const QDateTime& when, const QString& extension) {
    return QString("storyreel_%1.%2")
        .arg(when.toString("yyyyMMdd_HHmmss"))
        .arg(extension);
}

} // namespace TimeUtil
