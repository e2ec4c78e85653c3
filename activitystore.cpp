#include "activitystore.h"
#include <QSqlQuery>
#include <QSqlError>
#include <QVariant>
#include <QUuid>
#include <set>
#include "logger.h"
#include "helpers.h"

namespace {

QString tableFor(const SourceType type)
{
    switch (type) {
    case SourceType::Manual: return "time_entries";
    case SourceType::Automatic: return "app_usage";
    case SourceType::Pomodoro: return "pomodoro_sessions";
    }
    return "time_entries";
}

QVariant timeOrNull(const QDateTime& time)
{
    if (!time.isValid())
        return QVariant(QVariant::String);
    return convDateTimeToIsoStr(time);
}

QVariant durationOrNull(const qint64 duration)
{
    if (duration < 0)
        return QVariant(QVariant::LongLong);
    return duration;
}

QVariant idOrNull(const qint64 id)
{
    if (id <= 0)
        return QVariant(QVariant::LongLong);
    return id;
}

qint64 durationValue(const QVariant& value)
{
    return value.isNull() ? -1 : value.toLongLong();
}

} // namespace

ActivityStore::ActivityStore(const Settings& settings, QObject *parent)
    : ActivityStore(settings, settings.getDatabaseFile(), parent)
{ }

ActivityStore::ActivityStore(const Settings& settings, const QString& databaseFile, QObject *parent)
    : QObject(parent), settings_(settings), schema_ready_(false)
{
    // Each store gets its own connection so several can be open against different files
    db = QSqlDatabase::addDatabase("QSQLITE", "ureconcile_" + QUuid::createUuid().toString(QUuid::WithoutBraces));
    db.setDatabaseName(databaseFile);
}

ActivityStore::~ActivityStore()
{
    lazyClose();
    const QString name = db.connectionName();
    db = QSqlDatabase();
    QSqlDatabase::removeDatabase(name);
}

QString ActivityStore::databaseFile() const
{
    return db.databaseName();
}

bool ActivityStore::lazyOpen()
{
    if (db.isOpen() && schema_ready_) {
        return true;
    }
    if (!db.isOpen() && !db.open()) {
        if (settings_.logToFile())
            Logger::Log("[DB] Error opening database: " + db.lastError().text());
        return false;
    }

    schema_ready_ = createSchema();
    return schema_ready_;
}

void ActivityStore::lazyClose()
{
    if (db.isOpen()) {
        db.close();
    }
    schema_ready_ = false;
}

bool ActivityStore::createSchema()
{
    const char* statements[] = {
        "CREATE TABLE IF NOT EXISTS categories ("
        "id INTEGER PRIMARY KEY AUTOINCREMENT,"
        "name TEXT NOT NULL"
        ")",
        "CREATE TABLE IF NOT EXISTS time_entries ("
        "id INTEGER PRIMARY KEY AUTOINCREMENT,"
        "task TEXT NOT NULL DEFAULT '',"
        "start_time TEXT,"
        "end_time TEXT,"
        "duration INTEGER,"
        "category_id INTEGER,"
        "todo_id INTEGER"
        ")",
        "CREATE TABLE IF NOT EXISTS app_usage ("
        "id INTEGER PRIMARY KEY AUTOINCREMENT,"
        "app_name TEXT NOT NULL DEFAULT '',"
        "window_title TEXT NOT NULL DEFAULT '',"
        "domain TEXT NOT NULL DEFAULT '',"
        "is_browser INTEGER NOT NULL DEFAULT 0,"
        "is_idle INTEGER NOT NULL DEFAULT 0,"
        "start_time TEXT,"
        "end_time TEXT,"
        "duration INTEGER,"
        "category_id INTEGER"
        ")",
        "CREATE TABLE IF NOT EXISTS pomodoro_sessions ("
        "id INTEGER PRIMARY KEY AUTOINCREMENT,"
        "task TEXT NOT NULL DEFAULT '',"
        "session_type INTEGER NOT NULL DEFAULT 0,"
        "start_time TEXT,"
        "end_time TEXT,"
        "duration INTEGER,"
        "completed INTEGER NOT NULL DEFAULT 0,"
        "interrupted INTEGER NOT NULL DEFAULT 0,"
        "category_id INTEGER"
        ")"
    };

    QSqlQuery query(db);
    for (const char* statement : statements) {
        if (!query.exec(statement)) {
            if (settings_.logToFile())
                Logger::Log("[DB] Error creating schema: " + query.lastError().text());
            return false;
        }
    }
    return true;
}

bool ActivityStore::beginTransaction(const QString& purpose)
{
    if (!lazyOpen()) {
        if (settings_.logToFile())
            Logger::Log("[DB] Could not lazy open DB to " + purpose);
        return false;
    }
    if (!db.transaction()) {
        if (settings_.logToFile())
            Logger::Log("[DB] Error starting transaction to " + purpose + ": " + db.lastError().text());
        return false;
    }
    return true;
}

ReconcileError ActivityStore::rollbackWith(ReconcileError error, const QString& reason)
{
    db.rollback();
    if (settings_.logToFile())
        Logger::Log("[DB] Rolled back (" + errorName(error) + "): " + reason);
    return error;
}

bool ActivityStore::refExists(const ActivityRef& ref, bool* pExists)
{
    QSqlQuery query(db);
    query.prepare("SELECT COUNT(*) FROM " + tableFor(ref.sourceType) + " WHERE id = :id");
    query.bindValue(":id", ref.id);
    if (!query.exec() || !query.next()) {
        if (settings_.logToFile())
            Logger::Log("[DB] Error looking up " + refToStr(ref) + ": " + query.lastError().text());
        return false;
    }
    *pExists = (query.value(0).toInt() > 0);
    return true;
}

bool ActivityStore::updateSpan(const ActivityInterval& interval)
{
    QSqlQuery query(db);
    query.prepare("UPDATE " + tableFor(interval.sourceType) +
                  " SET start_time = :start_time, end_time = :end_time, duration = :duration WHERE id = :id");
    query.bindValue(":start_time", timeOrNull(interval.start));
    query.bindValue(":end_time", timeOrNull(interval.end));
    query.bindValue(":duration", durationOrNull(interval.storedDurationSeconds));
    query.bindValue(":id", interval.id);
    if (!query.exec()) {
        if (settings_.logToFile())
            Logger::Log("[DB] Error updating " + refToStr(interval.ref()) + ": " + query.lastError().text());
        return false;
    }
    return true;
}

bool ActivityStore::deleteRef(const ActivityRef& ref)
{
    QSqlQuery query(db);
    query.prepare("DELETE FROM " + tableFor(ref.sourceType) + " WHERE id = :id");
    query.bindValue(":id", ref.id);
    if (!query.exec()) {
        if (settings_.logToFile())
            Logger::Log("[DB] Error deleting " + refToStr(ref) + ": " + query.lastError().text());
        return false;
    }
    return true;
}

ReconcileError ActivityStore::loadRecords(const QDateTime& startDate, const QDateTime& endDate, ActivityRecordBundle* pBundle)
{
    if (!startDate.isValid() || !endDate.isValid() || (startDate >= endDate)) {
        if (settings_.logToFile())
            Logger::Log("[DB] Refusing to load records for an empty or invalid window");
        return ReconcileError::InvalidWindow;
    }

    if (!lazyOpen()) {
        if (settings_.logToFile())
            Logger::Log("[DB] Could not lazy open DB to load records");
        return ReconcileError::StorageFailure;
    }

    // Rows with a start are picked by overlap with the window or by starting inside it.
    // Rows without a start are picked by their end so a derivable start is not lost.
    const QString where =
        " WHERE (start_time IS NOT NULL AND start_time < :end_a"
        " AND (end_time IS NULL OR end_time > :start_a OR start_time >= :start_b))"
        " OR (start_time IS NULL AND (end_time IS NULL OR (end_time > :start_c AND end_time <= :end_b)))"
        " ORDER BY start_time, id";
    const QString window_start = convDateTimeToIsoStr(startDate);
    const QString window_end = convDateTimeToIsoStr(endDate);
    auto bindWindow = [&](QSqlQuery& q) {
        q.bindValue(":start_a", window_start);
        q.bindValue(":start_b", window_start);
        q.bindValue(":start_c", window_start);
        q.bindValue(":end_a", window_end);
        q.bindValue(":end_b", window_end);
    };

    ActivityRecordBundle bundle;

    QSqlQuery query(db);
    query.prepare("SELECT id, task, start_time, end_time, duration, category_id, todo_id FROM time_entries" + where);
    bindWindow(query);
    if (!query.exec()) {
        if (settings_.logToFile())
            Logger::Log("[DB] Error loading time entries: " + query.lastError().text());
        return ReconcileError::StorageFailure;
    }
    while (query.next()) {
        TimeEntryRecord r;
        r.id = query.value(0).toLongLong();
        r.task = query.value(1).toString();
        r.startTime = convIsoStrToDateTime(query.value(2).toString());
        r.endTime = convIsoStrToDateTime(query.value(3).toString());
        r.duration = durationValue(query.value(4));
        r.categoryId = query.value(5).toLongLong();
        r.todoId = query.value(6).toLongLong();
        bundle.timeEntries.push_back(r);
    }

    query.prepare("SELECT id, app_name, window_title, domain, is_browser, is_idle, start_time, end_time, duration, category_id "
                  "FROM app_usage" + where);
    bindWindow(query);
    if (!query.exec()) {
        if (settings_.logToFile())
            Logger::Log("[DB] Error loading app usage: " + query.lastError().text());
        return ReconcileError::StorageFailure;
    }
    while (query.next()) {
        AppUsageRecord r;
        r.id = query.value(0).toLongLong();
        r.appName = query.value(1).toString();
        r.windowTitle = query.value(2).toString();
        r.domain = query.value(3).toString();
        r.isBrowser = query.value(4).toBool();
        r.isIdle = query.value(5).toBool();
        r.startTime = convIsoStrToDateTime(query.value(6).toString());
        r.endTime = convIsoStrToDateTime(query.value(7).toString());
        r.duration = durationValue(query.value(8));
        r.categoryId = query.value(9).toLongLong();
        bundle.appUsages.push_back(r);
    }

    query.prepare("SELECT id, task, session_type, start_time, end_time, duration, completed, interrupted, category_id "
                  "FROM pomodoro_sessions" + where);
    bindWindow(query);
    if (!query.exec()) {
        if (settings_.logToFile())
            Logger::Log("[DB] Error loading pomodoro sessions: " + query.lastError().text());
        return ReconcileError::StorageFailure;
    }
    while (query.next()) {
        PomodoroSessionRecord r;
        r.id = query.value(0).toLongLong();
        r.task = query.value(1).toString();
        r.sessionType = static_cast<PomodoroSessionType>(qBound(0, query.value(2).toInt(), 2));
        r.startTime = convIsoStrToDateTime(query.value(3).toString());
        r.endTime = convIsoStrToDateTime(query.value(4).toString());
        r.duration = durationValue(query.value(5));
        r.completed = query.value(6).toBool();
        r.interrupted = query.value(7).toBool();
        r.categoryId = query.value(8).toLongLong();
        bundle.pomodoroSessions.push_back(r);
    }

    if (settings_.logToFile()) {
        Logger::Log(QString("[DB] Loaded %1 time entries, %2 app usages, %3 pomodoro sessions for %4 - %5")
            .arg(bundle.timeEntries.size()).arg(bundle.appUsages.size()).arg(bundle.pomodoroSessions.size())
            .arg(window_start).arg(window_end));
    }

    *pBundle = bundle;
    return ReconcileError::None;
}

bool ActivityStore::loadCategoryIds(QSet<qint64>* pIds)
{
    if (!lazyOpen()) {
        if (settings_.logToFile())
            Logger::Log("[DB] Could not lazy open DB to load categories");
        return false;
    }

    QSqlQuery query(db);
    if (!query.exec("SELECT id FROM categories")) {
        if (settings_.logToFile())
            Logger::Log("[DB] Error loading categories: " + query.lastError().text());
        return false;
    }
    pIds->clear();
    while (query.next())
        pIds->insert(query.value(0).toLongLong());
    return true;
}

bool ActivityStore::insertTimeEntry(TimeEntryRecord* pRecord)
{
    if (!lazyOpen())
        return false;
    return execInsertTimeEntry(pRecord);
}

ReconcileError ActivityStore::insertTimeEntries(std::deque<TimeEntryRecord>* pRecords)
{
    if (pRecords->empty())
        return ReconcileError::None;

    if (!beginTransaction("insert time entries"))
        return ReconcileError::StorageFailure;

    for (auto& r : *pRecords) {
        if (!execInsertTimeEntry(&r)) {
            for (auto& inserted : *pRecords)
                inserted.id = -1;
            return rollbackWith(ReconcileError::StorageFailure, "insert of time entry '" + r.task + "' failed");
        }
    }

    if (!db.commit()) {
        for (auto& inserted : *pRecords)
            inserted.id = -1;
        return rollbackWith(ReconcileError::StorageFailure, "commit failed: " + db.lastError().text());
    }

    if (settings_.logToFile())
        Logger::Log(QString("[DB] Inserted %1 time entries").arg(pRecords->size()));
    return ReconcileError::None;
}

bool ActivityStore::execInsertTimeEntry(TimeEntryRecord* pRecord)
{
    QSqlQuery query(db);
    query.prepare("INSERT INTO time_entries (task, start_time, end_time, duration, category_id, todo_id) "
                  "VALUES (:task, :start_time, :end_time, :duration, :category_id, :todo_id)");
    query.bindValue(":task", pRecord->task);
    query.bindValue(":start_time", timeOrNull(pRecord->startTime));
    query.bindValue(":end_time", timeOrNull(pRecord->endTime));
    query.bindValue(":duration", durationOrNull(pRecord->duration));
    query.bindValue(":category_id", idOrNull(pRecord->categoryId));
    query.bindValue(":todo_id", idOrNull(pRecord->todoId));
    if (!query.exec()) {
        if (settings_.logToFile())
            Logger::Log("[DB] Error inserting time entry: " + query.lastError().text());
        return false;
    }
    pRecord->id = query.lastInsertId().toLongLong();
    return true;
}

bool ActivityStore::insertAppUsage(AppUsageRecord* pRecord)
{
    if (!lazyOpen())
        return false;

    QSqlQuery query(db);
    query.prepare("INSERT INTO app_usage (app_name, window_title, domain, is_browser, is_idle, start_time, end_time, duration, category_id) "
                  "VALUES (:app_name, :window_title, :domain, :is_browser, :is_idle, :start_time, :end_time, :duration, :category_id)");
    query.bindValue(":app_name", pRecord->appName);
    query.bindValue(":window_title", pRecord->windowTitle);
    query.bindValue(":domain", pRecord->domain);
    query.bindValue(":is_browser", pRecord->isBrowser ? 1 : 0);
    query.bindValue(":is_idle", pRecord->isIdle ? 1 : 0);
    query.bindValue(":start_time", timeOrNull(pRecord->startTime));
    query.bindValue(":end_time", timeOrNull(pRecord->endTime));
    query.bindValue(":duration", durationOrNull(pRecord->duration));
    query.bindValue(":category_id", idOrNull(pRecord->categoryId));
    if (!query.exec()) {
        if (settings_.logToFile())
            Logger::Log("[DB] Error inserting app usage: " + query.lastError().text());
        return false;
    }
    pRecord->id = query.lastInsertId().toLongLong();
    return true;
}

bool ActivityStore::insertPomodoroSession(PomodoroSessionRecord* pRecord)
{
    if (!lazyOpen())
        return false;

    QSqlQuery query(db);
    query.prepare("INSERT INTO pomodoro_sessions (task, session_type, start_time, end_time, duration, completed, interrupted, category_id) "
                  "VALUES (:task, :session_type, :start_time, :end_time, :duration, :completed, :interrupted, :category_id)");
    query.bindValue(":task", pRecord->task);
    query.bindValue(":session_type", int(pRecord->sessionType));
    query.bindValue(":start_time", timeOrNull(pRecord->startTime));
    query.bindValue(":end_time", timeOrNull(pRecord->endTime));
    query.bindValue(":duration", durationOrNull(pRecord->duration));
    query.bindValue(":completed", pRecord->completed ? 1 : 0);
    query.bindValue(":interrupted", pRecord->interrupted ? 1 : 0);
    query.bindValue(":category_id", idOrNull(pRecord->categoryId));
    if (!query.exec()) {
        if (settings_.logToFile())
            Logger::Log("[DB] Error inserting pomodoro session: " + query.lastError().text());
        return false;
    }
    pRecord->id = query.lastInsertId().toLongLong();
    return true;
}

qint64 ActivityStore::insertCategory(const QString& name)
{
    if (!lazyOpen())
        return -1;

    QSqlQuery query(db);
    query.prepare("INSERT INTO categories (name) VALUES (:name)");
    query.bindValue(":name", name);
    if (!query.exec()) {
        if (settings_.logToFile())
            Logger::Log("[DB] Error inserting category: " + query.lastError().text());
        return -1;
    }
    return query.lastInsertId().toLongLong();
}

bool ActivityStore::exists(const ActivityRef& ref)
{
    if (!lazyOpen())
        return false;
    bool found = false;
    if (!refExists(ref, &found))
        return false;
    return found;
}

ReconcileError ActivityStore::applyMergeDecision(const MergeDecision& decision)
{
    for (const auto& ref : decision.discard) {
        if (ref == decision.survivor.ref()) {
            if (settings_.logToFile())
                Logger::Log("[DB] Refusing merge plan that discards its own survivor " + refToStr(ref));
            return ReconcileError::InvalidSelection;
        }
    }

    if (!beginTransaction("apply merge"))
        return ReconcileError::StorageFailure;

    std::deque<ActivityRef> refs = decision.discard;
    refs.push_front(decision.survivor.ref());
    for (const auto& ref : refs) {
        bool found = false;
        if (!refExists(ref, &found))
            return rollbackWith(ReconcileError::StorageFailure, "lookup of " + refToStr(ref) + " failed");
        if (!found)
            return rollbackWith(ReconcileError::StaleConflict, refToStr(ref) + " no longer exists");
    }

    if (decision.survivorChanged && !updateSpan(decision.survivor))
        return rollbackWith(ReconcileError::StorageFailure, "survivor update failed");

    for (const auto& ref : decision.discard) {
        if (!deleteRef(ref))
            return rollbackWith(ReconcileError::StorageFailure, "delete of " + refToStr(ref) + " failed");
    }

    if (!db.commit())
        return rollbackWith(ReconcileError::StorageFailure, "commit failed: " + db.lastError().text());

    if (settings_.logToFile())
        Logger::Log(QString("[DB] Merged into %1, %2 activities deleted").arg(refToStr(decision.survivor.ref())).arg(decision.discard.size()));
    return ReconcileError::None;
}

ReconcileError ActivityStore::applyDefectFixes(const std::deque<Defect>& defects)
{
    if (defects.empty())
        return ReconcileError::None;

    if (!beginTransaction("apply fixes"))
        return ReconcileError::StorageFailure;

    for (const auto& d : defects) {
        bool found = false;
        if (!refExists(d.ref, &found))
            return rollbackWith(ReconcileError::StorageFailure, "lookup of " + refToStr(d.ref) + " failed");
        if (!found)
            return rollbackWith(ReconcileError::StaleConflict, refToStr(d.ref) + " no longer exists");
    }

    // A record can carry several defects, once deleted the remaining fixes for it are moot
    std::set<std::pair<int, qint64>> deleted;
    int deleted_count = 0;
    int repaired_count = 0;
    for (const auto& d : defects) {
        const auto key = std::make_pair(int(d.ref.sourceType), d.ref.id);
        if (deleted.count(key) > 0)
            continue;

        if (d.fix == FixAction::Delete) {
            if (!deleteRef(d.ref))
                return rollbackWith(ReconcileError::StorageFailure, "delete of " + refToStr(d.ref) + " failed");
            deleted.insert(key);
            ++deleted_count;
            continue;
        }

        QSqlQuery query(db);
        const QString table = tableFor(d.ref.sourceType);
        switch (d.kind) {
        case DefectKind::MissingEnd:
        case DefectKind::NegativeDuration:
            query.prepare("UPDATE " + table + " SET end_time = :value WHERE id = :id");
            query.bindValue(":value", timeOrNull(d.repairValue.toDateTime()));
            break;
        case DefectKind::DurationMismatch:
            query.prepare("UPDATE " + table + " SET duration = :value WHERE id = :id");
            query.bindValue(":value", d.repairValue.toLongLong());
            break;
        case DefectKind::OrphanedReference:
            query.prepare("UPDATE " + table + " SET category_id = :value WHERE id = :id");
            query.bindValue(":value", idOrNull(d.repairValue.toLongLong()));
            break;
        case DefectKind::ZeroDuration:
            // Zero length records are only ever deleted
            continue;
        }
        query.bindValue(":id", d.ref.id);
        if (!query.exec())
            return rollbackWith(ReconcileError::StorageFailure, "repair of " + refToStr(d.ref) + " failed: " + query.lastError().text());
        ++repaired_count;
    }

    if (!db.commit())
        return rollbackWith(ReconcileError::StorageFailure, "commit failed: " + db.lastError().text());

    if (settings_.logToFile())
        Logger::Log(QString("[DB] Applied fixes: %1 deleted, %2 repaired").arg(deleted_count).arg(repaired_count));
    return ReconcileError::None;
}

ReconcileError ActivityStore::applyIntervalUpdates(const std::deque<ActivityInterval>& intervals)
{
    if (intervals.empty())
        return ReconcileError::None;

    if (!beginTransaction("update intervals"))
        return ReconcileError::StorageFailure;

    for (const auto& i : intervals) {
        bool found = false;
        if (!refExists(i.ref(), &found))
            return rollbackWith(ReconcileError::StorageFailure, "lookup of " + refToStr(i.ref()) + " failed");
        if (!found)
            return rollbackWith(ReconcileError::StaleConflict, refToStr(i.ref()) + " no longer exists");
        if (!updateSpan(i))
            return rollbackWith(ReconcileError::StorageFailure, "update of " + refToStr(i.ref()) + " failed");
    }

    if (!db.commit())
        return rollbackWith(ReconcileError::StorageFailure, "commit failed: " + db.lastError().text());

    if (settings_.logToFile())
        Logger::Log(QString("[DB] Updated %1 activities").arg(intervals.size()));
    return ReconcileError::None;
}

ReconcileError ActivityStore::deleteRecords(const std::deque<ActivityRef>& refs)
{
    if (refs.empty())
        return ReconcileError::None;

    if (!beginTransaction("delete records"))
        return ReconcileError::StorageFailure;

    for (const auto& ref : refs) {
        bool found = false;
        if (!refExists(ref, &found))
            return rollbackWith(ReconcileError::StorageFailure, "lookup of " + refToStr(ref) + " failed");
        if (!found)
            return rollbackWith(ReconcileError::StaleConflict, refToStr(ref) + " no longer exists");
    }

    for (const auto& ref : refs) {
        if (!deleteRef(ref))
            return rollbackWith(ReconcileError::StorageFailure, "delete of " + refToStr(ref) + " failed");
    }

    if (!db.commit())
        return rollbackWith(ReconcileError::StorageFailure, "commit failed: " + db.lastError().text());

    if (settings_.logToFile())
        Logger::Log(QString("[DB] Deleted %1 activities").arg(refs.size()));
    return ReconcileError::None;
}
