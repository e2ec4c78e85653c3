#include "cleanupvalidator.h"
#include <QSet>
#include <QPair>
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include "logger.h"
#include "helpers.h"

namespace {

Defect makeDefect(const ActivityInterval& interval, DefectKind kind, FixAction fix, const QVariant& value, const QString& message)
{
	Defect d;
	d.ref = interval.ref();
	d.kind = kind;
	d.fix = fix;
	d.repairValue = value;
	d.message = message;
	return d;
}

} // namespace

CleanupValidator::CleanupValidator(const Settings &settings)
	: settings_(settings)
{ }

void CleanupValidator::checkInterval(const ActivityInterval& interval, const QSet<qint64>* pKnownCategories, std::deque<Defect>* pDefects) const
{
	const bool has_stored = (interval.storedDurationSeconds > 0);
	const QDateTime stored_end = has_stored ? interval.start.addSecs(interval.storedDurationSeconds) : QDateTime();

	if (!interval.end.isValid()) {
		// Open records that are still running are fine, completed ones lost their end
		if (interval.completed) {
			if (has_stored) {
				pDefects->push_back(makeDefect(interval, DefectKind::MissingEnd, FixAction::Repair, stored_end,
					"Completed activity has no end time, end derived from stored duration"));
			}
			else {
				pDefects->push_back(makeDefect(interval, DefectKind::MissingEnd, FixAction::Delete, QVariant(),
					"Completed activity has no end time and no duration to derive one"));
			}
		}
	}
	else if (interval.end < interval.start) {
		if (has_stored) {
			pDefects->push_back(makeDefect(interval, DefectKind::NegativeDuration, FixAction::Repair, stored_end,
				QString("End time lies %1s before start time").arg(interval.end.secsTo(interval.start))));
		}
		else {
			pDefects->push_back(makeDefect(interval, DefectKind::NegativeDuration, FixAction::Delete, QVariant(),
				QString("End time lies %1s before start time").arg(interval.end.secsTo(interval.start))));
		}
	}
	else if (interval.end == interval.start) {
		pDefects->push_back(makeDefect(interval, DefectKind::ZeroDuration, FixAction::Delete, QVariant(),
			"Activity has zero duration"));
	}
	else if (interval.storedDurationSeconds >= 0) {
		const qint64 computed = interval.durationSeconds();
		const qint64 diff = std::abs(computed - interval.storedDurationSeconds);
		if (diff > settings_.getDurationToleranceSec()) {
			pDefects->push_back(makeDefect(interval, DefectKind::DurationMismatch, FixAction::Repair, QVariant(computed),
				QString("Duration mismatch: stored %1s, calculated %2s (diff: %3s)")
					.arg(interval.storedDurationSeconds).arg(computed).arg(diff)));
		}
	}

	if ((pKnownCategories != nullptr) && (interval.categoryId > 0) && !pKnownCategories->contains(interval.categoryId)) {
		pDefects->push_back(makeDefect(interval, DefectKind::OrphanedReference, FixAction::Repair, QVariant(qint64(0)),
			QString("Category %1 does not exist").arg(interval.categoryId)));
	}
}

std::deque<Defect> CleanupValidator::validate(const std::deque<ActivityInterval>& intervals) const
{
	std::deque<Defect> defects;
	for (const auto& i : intervals)
		checkInterval(i, nullptr, &defects);

	if (settings_.logToFile())
		Logger::Log(QString("[CLEANUP] %1 defects in %2 activities (categories not checked)").arg(defects.size()).arg(intervals.size()));
	return defects;
}

std::deque<Defect> CleanupValidator::validate(const std::deque<ActivityInterval>& intervals, const QSet<qint64>& knownCategoryIds) const
{
	std::deque<Defect> defects;
	for (const auto& i : intervals)
		checkInterval(i, &knownCategoryIds, &defects);

	if (settings_.logToFile())
		Logger::Log(QString("[CLEANUP] %1 defects in %2 activities").arg(defects.size()).arg(intervals.size()));
	return defects;
}

DataQualityReport CleanupValidator::qualityReport(const std::deque<ActivityInterval>& intervals, const std::deque<Defect>& defects,
	const std::deque<TimeGap>& gaps, const std::deque<ConflictGroup>& conflicts) const
{
	DataQualityReport report;
	report.totalActivities = static_cast<int>(intervals.size());

	// Duration mismatches are cosmetic and do not count against the score
	QSet<QPair<int, qint64>> defective;
	for (const auto& d : defects) {
		switch (d.kind) {
		case DefectKind::NegativeDuration: ++report.negativeDurationCount; break;
		case DefectKind::MissingEnd: ++report.missingEndCount; break;
		case DefectKind::OrphanedReference: ++report.orphanedCount; break;
		case DefectKind::ZeroDuration: ++report.zeroDurationCount; break;
		case DefectKind::DurationMismatch: ++report.durationMismatchCount; break;
		}
		if (d.kind != DefectKind::DurationMismatch)
			defective.insert(qMakePair(int(d.ref.sourceType), d.ref.id));
	}
	report.defectiveActivities = defective.size();

	report.gapsCount = static_cast<int>(gaps.size());
	for (const auto& g : conflicts) {
		if (g.conflictType == ConflictType::Duplicate)
			++report.duplicateGroupsCount;
		else
			++report.overlapGroupsCount;
	}

	if (report.totalActivities > 0) {
		const double issue_pct = (static_cast<double>(report.defectiveActivities) / report.totalActivities) * 100.0;
		report.qualityScore = std::max(0, static_cast<int>(std::lround(100.0 - issue_pct)));
	}
	return report;
}
