#include "Logging.h"
#include <QDateTime>
#include <QMutex>
#include <QMutexLocker>
#include <cstdio>

Q_LOGGING_CATEGORY(srTimeline, "storyreel.timeline")
Q_LOGGING_CATEGORY(srMedia, "storyreel.media")
Q_LOGGING_CATEGORY(srRender, "storyreel.render")
Q_LOGGING_CATEGORY(srAudio, "storyreel.audio")
Q_LOGGING_CATEGORY(srExport, "storyreel.export")
Q_LOGGING_CATEGORY(srApp, "storyreel.app")

namespace {

QMutex g_linesMutex;
QStringList g_lines;

const char* levelTag(QtMsgType type) {
    switch (type) {
        case QtDebugMsg:    return "DEBUG";
        case QtInfoMsg:     return "INFO";
        case QtWarningMsg:  return "WARN";
        case QtCriticalMsg: return "ERROR";
        case QtFatalMsg:    return "FATAL";
    }
    return "?";
}

void messageHandler(QtMsgType type, const QMessageLogContext& context, const QString& msg) {
    QString line = QString("%1 [%2] %3: %4")
        .arg(QDateTime::currentDateTime().toString(Qt::ISODateWithMs))
        .arg(QLatin1String(levelTag(type)))
        .arg(QLatin1String(context.category ? context.category : "default"))
        .arg(msg);

    {
        QMutexLocker lock(&g_linesMutex);
        g_lines.append(line);
        while (g_lines.size() > Logging::MaxRecentLines)
            g_lines.removeFirst();
    }

    fprintf(stderr, "%s\n", line.toLocal8Bit().constData());
    fflush(stderr);
}

} // namespace

namespace Logging {

void install(const QString& filterRules) {
    if (!filterRules.isEmpty())
        QLoggingCategory::setFilterRules(filterRules);
    qInstallMessageHandler(messageHandler);
}

QStringList recentLines() {
    QMutexLocker lock(&g_linesMutex);
    return g_lines;
}

void clearRecentLines() {
    QMutexLocker lock(&g_linesMutex);
    g_lines.clear();
}

} // namespace Logging
