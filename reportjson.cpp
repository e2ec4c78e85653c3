#include "reportjson.h"
#include "helpers.h"

namespace {

QJsonArray refsToJson(const std::deque<ActivityRef> &refs)
{
	QJsonArray array;
	for (const auto& r : refs)
		array.append(refToJson(r));
	return array;
}

QJsonValue timeOrNull(const QDateTime &time)
{
	if (!time.isValid())
		return QJsonValue();
	return convDateTimeToIsoStr(time);
}

} // namespace

QJsonObject refToJson(const ActivityRef &ref)
{
	QJsonObject obj;
	obj["id"] = ref.id;
	obj["source"] = sourceTypeName(ref.sourceType);
	return obj;
}

QJsonObject intervalToJson(const ActivityInterval &interval)
{
	QJsonObject obj = refToJson(interval.ref());
	obj["label"] = interval.label;
	obj["start"] = timeOrNull(interval.start);
	obj["end"] = timeOrNull(interval.end);
	if (interval.isClosed())
		obj["duration_seconds"] = interval.durationSeconds();
	if (interval.storedDurationSeconds >= 0)
		obj["stored_duration_seconds"] = interval.storedDurationSeconds;
	if (interval.categoryId > 0)
		obj["category_id"] = interval.categoryId;
	return obj;
}

QJsonObject gapToJson(const TimeGap &gap)
{
	QJsonObject obj;
	obj["start"] = timeOrNull(gap.start);
	obj["end"] = timeOrNull(gap.end);
	obj["duration_seconds"] = gap.durationSeconds;
	obj["duration"] = convSecToTimeStr(gap.durationSeconds);
	if (gap.before.id > 0)
		obj["before"] = refToJson(gap.before);
	if (gap.after.id > 0)
		obj["after"] = refToJson(gap.after);
	return obj;
}

QJsonObject gapStatisticsToJson(const GapStatistics &stats)
{
	QJsonObject obj;
	obj["total_gaps"] = stats.totalGaps;
	obj["total_untracked_seconds"] = stats.totalUntrackedSeconds;
	obj["average_gap_seconds"] = stats.averageGapSeconds;
	obj["longest_gap_seconds"] = stats.longestGapSeconds;
	obj["window_seconds"] = stats.windowSeconds;
	return obj;
}

QJsonObject conflictGroupToJson(const ConflictGroup &group)
{
	QJsonObject obj;
	obj["type"] = conflictTypeName(group.conflictType);
	obj["severity"] = severityName(group.severity);
	obj["message"] = group.message;
	obj["members"] = refsToJson(group.members);

	QJsonArray pairs;
	for (const auto& p : group.pairs) {
		QJsonObject pair;
		pair["first"] = refToJson(p.first);
		pair["second"] = refToJson(p.second);
		pair["overlap_seconds"] = p.overlapSeconds;
		pair["overlap_ratio"] = p.overlapRatio;
		pair["type"] = conflictTypeName(p.type);
		pair["severity"] = severityName(p.severity);
		pairs.append(pair);
	}
	obj["pairs"] = pairs;
	return obj;
}

QJsonObject mergeDecisionToJson(const MergeDecision &decision)
{
	QJsonObject obj;
	obj["strategy"] = mergeStrategyName(decision.strategy);
	obj["survivor"] = intervalToJson(decision.survivor);
	obj["survivor_changed"] = decision.survivorChanged;
	obj["discard"] = refsToJson(decision.discard);
	return obj;
}

QJsonObject defectToJson(const Defect &defect)
{
	QJsonObject obj;
	obj["activity"] = refToJson(defect.ref);
	obj["kind"] = defectKindName(defect.kind);
	obj["fix"] = (defect.fix == FixAction::Delete) ? "delete" : "repair";
	obj["message"] = defect.message;
	if (defect.repairValue.isValid()) {
		if (defect.repairValue.type() == QVariant::DateTime)
			obj["repair_value"] = convDateTimeToIsoStr(defect.repairValue.toDateTime());
		else
			obj["repair_value"] = defect.repairValue.toLongLong();
	}
	return obj;
}

QJsonObject qualityToJson(const DataQualityReport &quality)
{
	QJsonObject obj;
	obj["total_activities"] = quality.totalActivities;
	obj["defective_activities"] = quality.defectiveActivities;
	obj["negative_duration"] = quality.negativeDurationCount;
	obj["missing_end"] = quality.missingEndCount;
	obj["orphaned_reference"] = quality.orphanedCount;
	obj["zero_duration"] = quality.zeroDurationCount;
	obj["duration_mismatch"] = quality.durationMismatchCount;
	obj["gaps"] = quality.gapsCount;
	obj["duplicate_groups"] = quality.duplicateGroupsCount;
	obj["overlap_groups"] = quality.overlapGroupsCount;
	obj["quality_score"] = quality.qualityScore;
	return obj;
}

QJsonObject reportToJson(const ReconcileReport &report)
{
	QJsonObject obj;
	obj["window_start"] = timeOrNull(report.windowStart);
	obj["window_end"] = timeOrNull(report.windowEnd);

	QJsonArray intervals;
	for (const auto& i : report.intervals)
		intervals.append(intervalToJson(i));
	obj["activities"] = intervals;

	QJsonArray diagnostics;
	for (const auto& d : report.diagnostics) {
		QJsonObject diag = refToJson(d.ref);
		diag["reason"] = d.reason;
		diagnostics.append(diag);
	}
	obj["rejected"] = diagnostics;

	QJsonArray gaps;
	for (const auto& g : report.gaps)
		gaps.append(gapToJson(g));
	obj["gaps"] = gaps;
	obj["gap_statistics"] = gapStatisticsToJson(report.gapStatistics);

	QJsonArray conflicts;
	for (const auto& c : report.conflicts)
		conflicts.append(conflictGroupToJson(c));
	obj["conflicts"] = conflicts;

	QJsonArray mergeable;
	for (const auto& m : report.mergeableGroups)
		mergeable.append(refsToJson(m));
	obj["mergeable_groups"] = mergeable;

	QJsonArray defects;
	for (const auto& d : report.defects)
		defects.append(defectToJson(d));
	obj["defects"] = defects;

	obj["quality"] = qualityToJson(report.quality);
	return obj;
}
