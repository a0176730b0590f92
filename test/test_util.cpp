#include <cassert>
#include <cstdio>
#include <QDate>
#include <QDateTime>
#include <QTime>
#include "util/TimeUtil.h"
#include "util/Logging.h"

void test_time_formatting() {
    assert(TimeUtil::secondsToHMSms(0.0) == "00:00:00.000");
    assert(TimeUtil::secondsToHMSms(3661.5) == "01:01:01.500");
    assert(TimeUtil::secondsToHMSms(-4.0) == "00:00:00.000");

    assert(TimeUtil::secondsToMMSS(0.0) == "0:00");
    assert(TimeUtil::secondsToMMSS(125.9) == "2:05");
    assert(TimeUtil::secondsToMMSS(3600.0) == "60:00");
    printf("PASS: test_time_formatting\n");
}

void test_export_file_name() {
    QDateTime when(QDate(2026, 10, 19), QTime(14, 30, 5));
    assert(TimeUtil::exportFileName(when, "mp4") == "storyreel_20261019_143005.mp4");
    assert(TimeUtil::exportFileName(when, "webm") == "storyreel_20261019_143005.webm");
    printf("PASS: test_export_file_name\n");
}

void test_log_lines_recorded() {
    Logging::install("storyreel.render.warning=false");
    Logging::clearRecentLines();

    qCWarning(srApp) << "config missing";
    qCWarning(srRender) << "filtered out";

    QStringList lines = Logging::recentLines();
    assert(lines.size() == 1);
    assert(lines[0].contains("[WARN] storyreel.app"));
    assert(lines[0].contains("config missing"));

    for (int i = 0; i < Logging::MaxRecentLines + 20; ++i)
        qCWarning(srExport, "line %d", i);
    lines = Logging::recentLines();
    assert(lines.size() == Logging::MaxRecentLines);
    assert(lines.last().endsWith(QString("line %1").arg(Logging::MaxRecentLines + 19)));

    Logging::clearRecentLines();
    assert(Logging::recentLines().isEmpty());
    printf("PASS: test_log_lines_recorded\n");
}

int main() {
    test_time_formatting();
    test_export_file_name();
    test_log_lines_recorded();
    printf("All util tests passed.\n");
    return 0;
}
