#include "reconciler.h"
#include <QSet>
#include "logger.h"
#include "helpers.h"
#include "activityrecords.h"

Reconciler::Reconciler(const Settings &settings, ActivityStore &store)
	: settings_(settings), store_(store), gap_detector_(settings), conflict_detector_(settings),
	resolver_(settings), validator_(settings)
{ }

ReconcileError Reconciler::runPass(const QDateTime& startDate, const QDateTime& endDate, ReconcileReport* pReport)
{
	return runPass(startDate, endDate, settings_.getMinGapSec(), pReport);
}

ReconcileError Reconciler::runPass(const QDateTime& startDate, const QDateTime& endDate, qint64 minGapSec, ReconcileReport* pReport)
{
	if (!startDate.isValid() || !endDate.isValid() || (startDate >= endDate)) {
		if (settings_.logToFile())
			Logger::Log("[RECONCILE] Invalid window, pass not run");
		return ReconcileError::InvalidWindow;
	}

	ActivityRecordBundle bundle;
	ReconcileError err = store_.loadRecords(startDate, endDate, &bundle);
	if (err != ReconcileError::None)
		return err;

	QSet<qint64> categories;
	if (!store_.loadCategoryIds(&categories))
		return ReconcileError::StorageFailure;

	ReconcileReport report;
	report.windowStart = startDate;
	report.windowEnd = endDate;
	normalizeRecords(bundle, &report.intervals, &report.diagnostics);

	err = gap_detector_.detectGaps(report.intervals, startDate, endDate, minGapSec, &report.gaps);
	if (err != ReconcileError::None)
		return err;
	report.gapStatistics = gap_detector_.gapStatistics(report.gaps, startDate, endDate);

	report.conflicts = conflict_detector_.detectConflicts(report.intervals);
	report.mergeableGroups = conflict_detector_.findMergeableGroups(report.intervals);
	report.defects = validator_.validate(report.intervals, categories);
	report.quality = validator_.qualityReport(report.intervals, report.defects, report.gaps, report.conflicts);

	if (settings_.logToFile()) {
		Logger::Log(QString("[RECONCILE] %1 - %2: %3 activities (%4 rejected), %5 gaps, %6 conflict groups, %7 defects, score %8")
			.arg(convDateTimeToIsoStr(startDate)).arg(convDateTimeToIsoStr(endDate))
			.arg(report.intervals.size()).arg(report.diagnostics.size()).arg(report.gaps.size())
			.arg(report.conflicts.size()).arg(report.defects.size()).arg(report.quality.qualityScore));
	}

	*pReport = report;
	return ReconcileError::None;
}

ReconcileError Reconciler::mergeGroup(const ReconcileReport& report, int groupIndex, MergeStrategy strategy,
	const ActivityRef& manualSurvivor, MergeDecision* pDecision)
{
	if ((groupIndex < 0) || (groupIndex >= static_cast<int>(report.conflicts.size()))) {
		if (settings_.logToFile())
			Logger::Log(QString("[RECONCILE] No conflict group with index %1").arg(groupIndex));
		return ReconcileError::InvalidSelection;
	}
	return mergeMembers(report, report.conflicts[groupIndex].members, strategy, manualSurvivor, pDecision);
}

ReconcileError Reconciler::mergeMembers(const ReconcileReport& report, const std::deque<ActivityRef>& members, MergeStrategy strategy,
	const ActivityRef& manualSurvivor, MergeDecision* pDecision)
{
	MergeDecision decision;
	ReconcileError err = resolver_.resolveMembers(members, report.intervals, strategy, &decision, manualSurvivor);
	if (err != ReconcileError::None)
		return err;

	err = store_.applyMergeDecision(decision);
	if (err != ReconcileError::None)
		return err;

	if (pDecision != nullptr)
		*pDecision = decision;
	return ReconcileError::None;
}

ReconcileError Reconciler::applyFixes(const std::deque<Defect>& defects)
{
	return store_.applyDefectFixes(defects);
}

ReconcileError Reconciler::fillGap(const TimeGap& gap, const QString& label, qint64* pId)
{
	std::deque<qint64> ids;
	ReconcileError err = fillGaps({ gap }, label, &ids);
	if ((err == ReconcileError::None) && (pId != nullptr))
		*pId = ids.front();
	return err;
}

ReconcileError Reconciler::fillGaps(const std::deque<TimeGap>& gaps, const QString& label, std::deque<qint64>* pIds)
{
	const QString task = label.trimmed().isEmpty() ? QString("Untracked time") : label.trimmed();

	std::deque<TimeEntryRecord> entries;
	for (const auto& gap : gaps) {
		if (!gap.start.isValid() || !gap.end.isValid() || (gap.start >= gap.end)) {
			if (settings_.logToFile())
				Logger::Log("[RECONCILE] Refusing to fill an empty gap");
			return ReconcileError::InvalidWindow;
		}
		TimeEntryRecord entry;
		entry.task = task;
		entry.startTime = gap.start;
		entry.endTime = gap.end;
		entry.duration = gap.start.secsTo(gap.end);
		entries.push_back(entry);
	}

	ReconcileError err = store_.insertTimeEntries(&entries);
	if (err != ReconcileError::None)
		return err;

	if (settings_.logToFile())
		Logger::Log(QString("[RECONCILE] Filled %1 gaps with manual entries '%2'").arg(entries.size()).arg(task));

	if (pIds != nullptr) {
		pIds->clear();
		for (const auto& e : entries)
			pIds->push_back(e.id);
	}
	return ReconcileError::None;
}

ReconcileError Reconciler::trimOverlaps(const ReconcileReport& report, int* pCount)
{
	const std::deque<ActivityInterval> adjusted = resolver_.trimOverlaps(report.intervals);
	ReconcileError err = store_.applyIntervalUpdates(adjusted);
	if ((err == ReconcileError::None) && (pCount != nullptr))
		*pCount = static_cast<int>(adjusted.size());
	return err;
}

ReconcileError Reconciler::recalculateDurations(const ReconcileReport& report, int* pCount)
{
	std::deque<Defect> mismatches;
	for (const auto& d : report.defects) {
		if (d.kind == DefectKind::DurationMismatch)
			mismatches.push_back(d);
	}

	ReconcileError err = store_.applyDefectFixes(mismatches);
	if ((err == ReconcileError::None) && (pCount != nullptr))
		*pCount = static_cast<int>(mismatches.size());
	return err;
}
