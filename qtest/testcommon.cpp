#include "testcommon.h"

namespace TestCommon {

qint64 dayMs()
{
    return QDateTime(QDate(2024, 3, 4), QTime(0, 0), Qt::UTC).toMSecsSinceEpoch();
}

qint64 at(int hours, int minutes)
{
    return dayMs() + (qint64(hours) * 60 + minutes) * 60'000;
}

QDateTime dt(int hours, int minutes)
{
    return QDateTime::fromMSecsSinceEpoch(at(hours, minutes), Qt::UTC);
}

ActivityInterval mk(qint64 id, SourceType source, qint64 startMs, qint64 endMs, const QString& label)
{
    QDateTime start = QDateTime::fromMSecsSinceEpoch(startMs, Qt::UTC);
    QDateTime end = QDateTime::fromMSecsSinceEpoch(endMs, Qt::UTC);
    return ActivityInterval(id, source, start, end, label);
}

QString createSettingsFile(const QString& dirPath, const QVariantMap& values)
{
    QString settingsPath = QDir(dirPath).filePath("user-settings.ini");
    QSettings seed(settingsPath, QSettings::IniFormat);
    seed.setValue("uReconcile/debug_log_to_file", false);
    seed.setValue("uReconcile/database_file", QDir(dirPath).filePath("ureconcile.sqlite"));
    for (auto it = values.constBegin(); it != values.constEnd(); ++it)
        seed.setValue("uReconcile/" + it.key(), it.value());
    seed.sync();
    return settingsPath;
}

qint64 sumGaps(const std::deque<TimeGap>& gaps)
{
    qint64 total = 0;
    for (const auto& g : gaps) {
        total += g.durationSeconds;
    }
    return total;
}

} // namespace TestCommon
