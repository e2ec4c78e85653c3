#ifndef TYPES_H
#define TYPES_H

#include <QtGlobal>
#include <QDateTime>
#include <QString>
#include <QVariant>
#include <deque>
#include <variant>

enum class SourceType { Manual, Automatic, Pomodoro };

enum class ConflictType { Overlap, Duplicate };

enum class Severity { Low, Medium, High };

enum class MergeStrategy { Longest, Earliest, Latest, ManualSelection };

enum class DefectKind { NegativeDuration, MissingEnd, OrphanedReference, ZeroDuration, DurationMismatch };

enum class FixAction { Delete, Repair };

enum class PomodoroSessionType { Focus, ShortBreak, LongBreak };

enum class ReconcileError {
	None,
	MalformedRecord,
	InvalidWindow,
	StaleConflict,
	StorageFailure,
	InvalidSelection,
	EmptyGroup
};

struct ManualMetadata {
	qint64 todoId = 0;
};

struct AutomaticMetadata {
	QString appName;
	QString windowTitle;
	QString domain;
	bool isBrowser = false;
	bool isIdle = false;
};

struct PomodoroMetadata {
	PomodoroSessionType sessionType = PomodoroSessionType::Focus;
	bool completed = false;
	bool interrupted = false;
};

using ActivityMetadata = std::variant<ManualMetadata, AutomaticMetadata, PomodoroMetadata>;

// Identifies a row in one of the three source tables
struct ActivityRef {
	qint64 id;
	SourceType sourceType;

	ActivityRef(qint64 id = -1, SourceType source = SourceType::Manual)
		: id(id), sourceType(source) {
	}

	bool operator==(const ActivityRef& other) const {
		return (id == other.id) && (sourceType == other.sourceType);
	}
	bool operator!=(const ActivityRef& other) const {
		return !(*this == other);
	}
};

struct ActivityInterval {
	qint64 id;
	SourceType sourceType;
	QDateTime start;
	QDateTime end;				// invalid while the record is in progress
	QString label;
	qint64 storedDurationSeconds;	// -1 when the source row has no duration column value
	qint64 categoryId;
	bool completed;
	ActivityMetadata metadata;

	ActivityInterval()
		: id(-1), sourceType(SourceType::Manual), storedDurationSeconds(-1), categoryId(0), completed(true) {
	}

	ActivityInterval(qint64 id, SourceType source, QDateTime start, QDateTime end, QString label)
		: id(id), sourceType(source), start(start), end(end), label(label),
		storedDurationSeconds(-1), categoryId(0), completed(true) {
		switch (source) {
		case SourceType::Manual: metadata = ManualMetadata(); break;
		case SourceType::Automatic: metadata = AutomaticMetadata(); break;
		case SourceType::Pomodoro: metadata = PomodoroMetadata(); break;
		}
	}

	ActivityRef ref() const { return ActivityRef(id, sourceType); }
	bool isClosed() const { return start.isValid() && end.isValid(); }
	qint64 durationMsec() const { return isClosed() ? start.msecsTo(end) : 0; }
	qint64 durationSeconds() const { return durationMsec() / 1000; }
};

struct TimeGap {
	QDateTime start;
	QDateTime end;
	qint64 durationSeconds;
	ActivityRef before;	// id -1 at the window start
	ActivityRef after;	// id -1 at the window end

	TimeGap(QDateTime start, QDateTime end, ActivityRef before = ActivityRef(), ActivityRef after = ActivityRef())
		: start(start), end(end), durationSeconds(start.msecsTo(end) / 1000), before(before), after(after) {
	}
};

struct GapStatistics {
	int totalGaps = 0;
	qint64 totalUntrackedSeconds = 0;
	double averageGapSeconds = 0.0;
	qint64 longestGapSeconds = 0;
	qint64 windowSeconds = 0;
};

struct ConflictPair {
	ActivityRef first;
	ActivityRef second;
	qint64 overlapSeconds;
	double overlapRatio;
	ConflictType type;
	Severity severity;
};

struct ConflictGroup {
	ConflictType conflictType = ConflictType::Overlap;
	Severity severity = Severity::Low;
	std::deque<ActivityRef> members;
	std::deque<ConflictPair> pairs;
	QString message;

	bool contains(const ActivityRef& ref) const {
		for (const auto& m : members) {
			if (m == ref) return true;
		}
		return false;
	}
};

struct MergeSuggestion {
	bool canMerge = false;
	int confidence = 0;
	QString reason;
};

struct MergeDecision {
	MergeStrategy strategy = MergeStrategy::Longest;
	ActivityInterval survivor;
	bool survivorChanged = false;
	std::deque<ActivityRef> discard;
};

struct Defect {
	ActivityRef ref;
	DefectKind kind;
	FixAction fix;
	QVariant repairValue;
	QString message;
};

struct RecordDiagnostic {
	ActivityRef ref;
	QString reason;
};

struct DataQualityReport {
	int totalActivities = 0;
	int defectiveActivities = 0;
	int negativeDurationCount = 0;
	int missingEndCount = 0;
	int orphanedCount = 0;
	int zeroDurationCount = 0;
	int durationMismatchCount = 0;
	int gapsCount = 0;
	int duplicateGroupsCount = 0;
	int overlapGroupsCount = 0;
	int qualityScore = 100;
};

#endif // TYPES_H
