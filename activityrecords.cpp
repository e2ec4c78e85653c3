#include "activityrecords.h"
#include "helpers.h"

namespace {

// Shared part of the three normalizers: identity and start/end resolution.
// A missing start can be recovered from end and duration, a missing end cannot,
// since an open end is how in-progress records look.
bool resolveSpan(qint64 id, SourceType source, const QDateTime &start, const QDateTime &end, qint64 duration,
	ActivityInterval *pInterval, RecordDiagnostic *pDiagnostic)
{
	const ActivityRef ref(id, source);

	if (id <= 0) {
		pDiagnostic->ref = ref;
		pDiagnostic->reason = "record has no valid id";
		return false;
	}

	QDateTime resolved_start = start;
	if (!resolved_start.isValid()) {
		if (end.isValid() && (duration >= 0)) {
			resolved_start = end.addSecs(-duration);
		}
		else {
			pDiagnostic->ref = ref;
			pDiagnostic->reason = "record has no start time and none can be derived";
			return false;
		}
	}

	pInterval->id = id;
	pInterval->sourceType = source;
	pInterval->start = resolved_start;
	pInterval->end = end;
	pInterval->storedDurationSeconds = duration;
	return true;
}

} // namespace

bool normalizeTimeEntry(const TimeEntryRecord &record, ActivityInterval *pInterval, RecordDiagnostic *pDiagnostic)
{
	if (!resolveSpan(record.id, SourceType::Manual, record.startTime, record.endTime, record.duration, pInterval, pDiagnostic))
		return false;

	pInterval->label = record.task.trimmed();
	pInterval->categoryId = record.categoryId;
	// A manual entry without end is a running timer unless the row already carries its duration
	pInterval->completed = record.endTime.isValid() || (record.duration > 0);
	ManualMetadata meta;
	meta.todoId = record.todoId;
	pInterval->metadata = meta;
	return true;
}

bool normalizeAppUsage(const AppUsageRecord &record, ActivityInterval *pInterval, RecordDiagnostic *pDiagnostic)
{
	if (!resolveSpan(record.id, SourceType::Automatic, record.startTime, record.endTime, record.duration, pInterval, pDiagnostic))
		return false;

	if (!record.windowTitle.trimmed().isEmpty())
		pInterval->label = record.windowTitle.trimmed();
	else if (record.isBrowser && !record.domain.trimmed().isEmpty())
		pInterval->label = record.domain.trimmed();
	else
		pInterval->label = record.appName.trimmed();

	pInterval->categoryId = record.categoryId;
	pInterval->completed = record.endTime.isValid() || (record.duration > 0);
	AutomaticMetadata meta;
	meta.appName = record.appName;
	meta.windowTitle = record.windowTitle;
	meta.domain = record.domain;
	meta.isBrowser = record.isBrowser;
	meta.isIdle = record.isIdle;
	pInterval->metadata = meta;
	return true;
}

bool normalizePomodoroSession(const PomodoroSessionRecord &record, ActivityInterval *pInterval, RecordDiagnostic *pDiagnostic)
{
	if (!resolveSpan(record.id, SourceType::Pomodoro, record.startTime, record.endTime, record.duration, pInterval, pDiagnostic))
		return false;

	if (!record.task.trimmed().isEmpty())
		pInterval->label = record.task.trimmed();
	else
		pInterval->label = (record.sessionType == PomodoroSessionType::Focus) ? "Focus Session" : "Break";

	pInterval->categoryId = record.categoryId;
	pInterval->completed = record.completed || record.interrupted || record.endTime.isValid();
	PomodoroMetadata meta;
	meta.sessionType = record.sessionType;
	meta.completed = record.completed;
	meta.interrupted = record.interrupted;
	pInterval->metadata = meta;
	return true;
}

void normalizeRecords(const ActivityRecordBundle &bundle, std::deque<ActivityInterval> *pIntervals,
	std::deque<RecordDiagnostic> *pDiagnostics)
{
	pIntervals->clear();
	if (pDiagnostics != nullptr)
		pDiagnostics->clear();

	auto collect = [&](bool ok, const ActivityInterval &interval, const RecordDiagnostic &diagnostic) {
		if (ok)
			pIntervals->push_back(interval);
		else if (pDiagnostics != nullptr)
			pDiagnostics->push_back(diagnostic);
	};

	for (const auto& r : bundle.timeEntries) {
		ActivityInterval interval;
		RecordDiagnostic diagnostic;
		collect(normalizeTimeEntry(r, &interval, &diagnostic), interval, diagnostic);
	}
	for (const auto& r : bundle.appUsages) {
		ActivityInterval interval;
		RecordDiagnostic diagnostic;
		collect(normalizeAppUsage(r, &interval, &diagnostic), interval, diagnostic);
	}
	for (const auto& r : bundle.pomodoroSessions) {
		ActivityInterval interval;
		RecordDiagnostic diagnostic;
		collect(normalizePomodoroSession(r, &interval, &diagnostic), interval, diagnostic);
	}

	sortIntervals(pIntervals);
}
