#ifndef ACTIVITYRECORDS_H
#define ACTIVITYRECORDS_H

#include <QtGlobal>
#include <QDateTime>
#include <QString>
#include <deque>
#include "types.h"

// Row shapes as the store hands them over. A duration of -1 means the column was NULL.

struct TimeEntryRecord {
	qint64 id = -1;
	QString task;
	QDateTime startTime;
	QDateTime endTime;
	qint64 duration = -1;
	qint64 categoryId = 0;
	qint64 todoId = 0;
};

struct AppUsageRecord {
	qint64 id = -1;
	QString appName;
	QString windowTitle;
	QString domain;
	bool isBrowser = false;
	bool isIdle = false;
	QDateTime startTime;
	QDateTime endTime;
	qint64 duration = -1;
	qint64 categoryId = 0;
};

struct PomodoroSessionRecord {
	qint64 id = -1;
	QString task;
	PomodoroSessionType sessionType = PomodoroSessionType::Focus;
	QDateTime startTime;
	QDateTime endTime;
	qint64 duration = -1;
	bool completed = false;
	bool interrupted = false;
	qint64 categoryId = 0;
};

struct ActivityRecordBundle {
	std::deque<TimeEntryRecord> timeEntries;
	std::deque<AppUsageRecord> appUsages;
	std::deque<PomodoroSessionRecord> pomodoroSessions;

	size_t size() const { return timeEntries.size() + appUsages.size() + pomodoroSessions.size(); }
};

bool normalizeTimeEntry(const TimeEntryRecord &record, ActivityInterval *pInterval, RecordDiagnostic *pDiagnostic);

bool normalizeAppUsage(const AppUsageRecord &record, ActivityInterval *pInterval, RecordDiagnostic *pDiagnostic);

bool normalizePomodoroSession(const PomodoroSessionRecord &record, ActivityInterval *pInterval, RecordDiagnostic *pDiagnostic);

// Normalizes every record of the bundle. Rejected records end up in pDiagnostics,
// the accepted ones in pIntervals ordered by start, end, source and id.
// Both outputs are cleared first.
void normalizeRecords(const ActivityRecordBundle &bundle, std::deque<ActivityInterval> *pIntervals,
	std::deque<RecordDiagnostic> *pDiagnostics);

#endif // ACTIVITYRECORDS_H
