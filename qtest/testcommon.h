#ifndef TESTCOMMON_H
#define TESTCOMMON_H

#include <QtTest>
#include <deque>
#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QSettings>
#include <QSqlDatabase>
#include <QSqlQuery>
#include <QTemporaryDir>
#include <QtDebug>

#include "types.h"
#include "helpers.h"
#include "settings.h"
#include "activityrecords.h"

namespace TestCommon {

// Fixed day all test timestamps are relative to: 2024-03-04 00:00:00 UTC
qint64 dayMs();

// Millisecond timestamp of hh:mm on the test day
qint64 at(int hours, int minutes = 0);

QDateTime dt(int hours, int minutes = 0);

// Factory function for creating closed intervals from millisecond timestamps
ActivityInterval mk(qint64 id, SourceType source, qint64 startMs, qint64 endMs, const QString& label);

// Creates a test settings file, extra values override the defaults
QString createSettingsFile(const QString& dirPath, const QVariantMap& values = QVariantMap());

// Total length of the gaps in seconds
qint64 sumGaps(const std::deque<TimeGap>& gaps);

} // namespace TestCommon

#endif // TESTCOMMON_H
