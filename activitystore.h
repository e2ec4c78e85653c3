#ifndef ACTIVITYSTORE_H
#define ACTIVITYSTORE_H

#include <QObject>
#include <QSqlDatabase>
#include <QDateTime>
#include <QSet>
#include <deque>
#include "settings.h"
#include "types.h"
#include "activityrecords.h"

class ActivityStore : public QObject
{
    Q_OBJECT
public:
    explicit ActivityStore(const Settings& settings, QObject *parent = nullptr);
    ActivityStore(const Settings& settings, const QString& databaseFile, QObject *parent = nullptr);
    ~ActivityStore();

    // Every row whose span intersects [startDate, endDate), plus rows that start inside the
    // window with a broken end so the cleanup pass gets to see them
    ReconcileError loadRecords(const QDateTime& startDate, const QDateTime& endDate, ActivityRecordBundle* pBundle);
    bool loadCategoryIds(QSet<qint64>* pIds);

    bool insertTimeEntry(TimeEntryRecord* pRecord);
    // All or nothing: on failure no entry is kept and every id is reset to -1
    ReconcileError insertTimeEntries(std::deque<TimeEntryRecord>* pRecords);
    bool insertAppUsage(AppUsageRecord* pRecord);
    bool insertPomodoroSession(PomodoroSessionRecord* pRecord);
    qint64 insertCategory(const QString& name);
    bool exists(const ActivityRef& ref);

    // Each of these runs as one transaction: all ids are re-checked first and the whole plan
    // is rolled back with StaleConflict if any of them vanished since detection.
    // A merge plan that discards its own survivor is refused with InvalidSelection.
    ReconcileError applyMergeDecision(const MergeDecision& decision);
    ReconcileError applyDefectFixes(const std::deque<Defect>& defects);
    ReconcileError applyIntervalUpdates(const std::deque<ActivityInterval>& intervals);
    ReconcileError deleteRecords(const std::deque<ActivityRef>& refs);

    QString databaseFile() const;

private:
    const Settings& settings_;
    QSqlDatabase db;
    bool schema_ready_;

    bool lazyOpen();
    void lazyClose();
    bool createSchema();
    bool beginTransaction(const QString& purpose);
    ReconcileError rollbackWith(ReconcileError error, const QString& reason);
    bool refExists(const ActivityRef& ref, bool* pExists);
    bool updateSpan(const ActivityInterval& interval);
    bool deleteRef(const ActivityRef& ref);
    bool execInsertTimeEntry(TimeEntryRecord* pRecord);
};

#endif // ACTIVITYSTORE_H
