#pragma once

#include <QLoggingCategory>
#include <QStringList>

Q_DECLARE_LOGGING_CATEGORY(srTimeline)
Q_DECLARE_LOGGING_CATEGORY(srMedia)
Q_DECLARE_LOGGING_CATEGORY(srRender)
Q_DECLARE_LOGGING_CATEGORY(srAudio)
Q_DECLARE_LOGGING_CATEGORY(srExport)
Q_DECLARE_LOGGING_CATEGORY(srApp)

namespace Logging {
    // Installs the timestamped message handler and applies category filter rules
    // (QLoggingCategory::setFilterRules syntax). Empty rules keep Qt's defaults.
    void install(const QString& filterRules = QString());

    // Most recent formatted lines, oldest first.
    QStringList recentLines();
    void clearRecentLines();

    inline constexpr int MaxRecentLines = 500;
}
