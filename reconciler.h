#ifndef RECONCILER_H
#define RECONCILER_H

#include <QtGlobal>
#include <QDateTime>
#include <deque>
#include "settings.h"
#include "types.h"
#include "activitystore.h"
#include "gapdetector.h"
#include "conflictdetector.h"
#include "conflictresolver.h"
#include "cleanupvalidator.h"

struct ReconcileReport {
	QDateTime windowStart;
	QDateTime windowEnd;
	std::deque<ActivityInterval> intervals;
	std::deque<RecordDiagnostic> diagnostics;
	std::deque<TimeGap> gaps;
	GapStatistics gapStatistics;
	std::deque<ConflictGroup> conflicts;
	std::deque<std::deque<ActivityRef>> mergeableGroups;
	std::deque<Defect> defects;
	DataQualityReport quality;
};

class Reconciler
{
private:
	const Settings & settings_;
	ActivityStore & store_;
	GapDetector gap_detector_;
	ConflictDetector conflict_detector_;
	ConflictResolver resolver_;
	CleanupValidator validator_;

public:
	Reconciler(const Settings & settings, ActivityStore & store);

	// One read-only analysis of the window. Nothing is written.
	ReconcileError runPass(const QDateTime& startDate, const QDateTime& endDate, ReconcileReport* pReport);
	ReconcileError runPass(const QDateTime& startDate, const QDateTime& endDate, qint64 minGapSec, ReconcileReport* pReport);

	ReconcileError mergeGroup(const ReconcileReport& report, int groupIndex, MergeStrategy strategy,
		const ActivityRef& manualSurvivor, MergeDecision* pDecision);
	ReconcileError mergeMembers(const ReconcileReport& report, const std::deque<ActivityRef>& members, MergeStrategy strategy,
		const ActivityRef& manualSurvivor, MergeDecision* pDecision);

	ReconcileError applyFixes(const std::deque<Defect>& defects);
	ReconcileError fillGap(const TimeGap& gap, const QString& label, qint64* pId);
	// One manual entry per gap, inserted together or not at all
	ReconcileError fillGaps(const std::deque<TimeGap>& gaps, const QString& label, std::deque<qint64>* pIds);
	ReconcileError trimOverlaps(const ReconcileReport& report, int* pCount);
	ReconcileError recalculateDurations(const ReconcileReport& report, int* pCount);
};

#endif // RECONCILER_H
