#include "helpers.h"
#include <algorithm>
#include <cstdlib>


QString convSecToTimeStr(const qint64 &seconds)
{
	const qint64 abs_sec = std::abs(seconds);
	const QString sign = (seconds < 0) ? "-" : "";
	return (sign + QString("%1:%2:%3")
		.arg(abs_sec / 3600, 2, 10, QChar('0'))
		.arg((abs_sec / 60) % 60, 2, 10, QChar('0'))
		.arg(abs_sec % 60, 2, 10, QChar('0')));
}

QString convDateTimeToIsoStr(const QDateTime &time)
{
	if (!time.isValid())
		return QString();
	return time.toUTC().toString(Qt::ISODateWithMs);
}

QDateTime convIsoStrToDateTime(const QString &time_str)
{
	if (time_str.trimmed().isEmpty())
		return QDateTime();
	QDateTime time = QDateTime::fromString(time_str.trimmed(), Qt::ISODateWithMs);
	if (!time.isValid())
		time = QDateTime::fromString(time_str.trimmed(), Qt::ISODate);
	if (!time.isValid())
		return QDateTime();
	// Strings without an offset are taken as UTC, which is how the store writes them
	if (time.timeSpec() == Qt::LocalTime)
		time.setTimeSpec(Qt::UTC);
	return time.toUTC();
}

QString normalizeLabel(const QString &label)
{
	return label.simplified().toLower();
}

bool labelsSimilar(const QString &a, const QString &b, const bool allow_containment)
{
	const QString la = normalizeLabel(a);
	const QString lb = normalizeLabel(b);
	if (la.isEmpty() || lb.isEmpty())
		return false;
	if (la == lb)
		return true;
	return allow_containment && (la.contains(lb) || lb.contains(la));
}

qint64 overlapMsec(const ActivityInterval &a, const ActivityInterval &b)
{
	if (!a.isClosed() || !b.isClosed())
		return 0;
	const qint64 start = std::max(a.start.toMSecsSinceEpoch(), b.start.toMSecsSinceEpoch());
	const qint64 end = std::min(a.end.toMSecsSinceEpoch(), b.end.toMSecsSinceEpoch());
	return std::max<qint64>(0, end - start);
}

double overlapRatio(const ActivityInterval &a, const ActivityInterval &b)
{
	const qint64 shorter = std::min(a.durationMsec(), b.durationMsec());
	if (shorter <= 0)
		return 0.0;
	return (static_cast<double>(overlapMsec(a, b)) / static_cast<double>(shorter));
}

void sortIntervals(std::deque<ActivityInterval>* pIntervals)
{
	// Start, then end, then source and id so that equal spans still order deterministically.
	// Open intervals sort after closed ones with the same start.
	std::stable_sort(pIntervals->begin(), pIntervals->end(), [](const ActivityInterval& a, const ActivityInterval& b) {
		const qint64 a_start = a.start.toMSecsSinceEpoch();
		const qint64 b_start = b.start.toMSecsSinceEpoch();
		if (a_start != b_start) return a_start < b_start;
		if (a.end.isValid() != b.end.isValid()) return a.end.isValid();
		if (a.end.isValid()) {
			const qint64 a_end = a.end.toMSecsSinceEpoch();
			const qint64 b_end = b.end.toMSecsSinceEpoch();
			if (a_end != b_end) return a_end < b_end;
		}
		if (a.sourceType != b.sourceType) return int(a.sourceType) < int(b.sourceType);
		return a.id < b.id;
	});
}

const ActivityInterval* findInterval(const std::deque<ActivityInterval> &intervals, const ActivityRef &ref)
{
	for (const auto& i : intervals) {
		if (i.ref() == ref)
			return &i;
	}
	return nullptr;
}

QString sourceTypeName(const SourceType type)
{
	switch (type) {
	case SourceType::Manual: return "manual";
	case SourceType::Automatic: return "automatic";
	case SourceType::Pomodoro: return "pomodoro";
	}
	return "unknown";
}

bool parseSourceType(const QString &name, SourceType *pType)
{
	const QString n = name.trimmed().toLower();
	if (n == "manual")
		*pType = SourceType::Manual;
	else if (n == "automatic")
		*pType = SourceType::Automatic;
	else if (n == "pomodoro")
		*pType = SourceType::Pomodoro;
	else
		return false;
	return true;
}

QString conflictTypeName(const ConflictType type)
{
	return (type == ConflictType::Duplicate) ? "duplicate" : "overlap";
}

QString severityName(const Severity severity)
{
	switch (severity) {
	case Severity::Low: return "low";
	case Severity::Medium: return "medium";
	case Severity::High: return "high";
	}
	return "unknown";
}

QString mergeStrategyName(const MergeStrategy strategy)
{
	switch (strategy) {
	case MergeStrategy::Longest: return "longest";
	case MergeStrategy::Earliest: return "earliest";
	case MergeStrategy::Latest: return "latest";
	case MergeStrategy::ManualSelection: return "manual-selection";
	}
	return "unknown";
}

bool parseMergeStrategy(const QString &name, MergeStrategy *pStrategy)
{
	const QString n = name.trimmed().toLower();
	if (n == "longest")
		*pStrategy = MergeStrategy::Longest;
	else if (n == "earliest")
		*pStrategy = MergeStrategy::Earliest;
	else if (n == "latest")
		*pStrategy = MergeStrategy::Latest;
	else if (n == "manual" || n == "manual-selection")
		*pStrategy = MergeStrategy::ManualSelection;
	else
		return false;
	return true;
}

QString defectKindName(const DefectKind kind)
{
	switch (kind) {
	case DefectKind::NegativeDuration: return "negativeDuration";
	case DefectKind::MissingEnd: return "missingEnd";
	case DefectKind::OrphanedReference: return "orphanedReference";
	case DefectKind::ZeroDuration: return "zeroDuration";
	case DefectKind::DurationMismatch: return "durationMismatch";
	}
	return "unknown";
}

QString errorName(const ReconcileError error)
{
	switch (error) {
	case ReconcileError::None: return "None";
	case ReconcileError::MalformedRecord: return "MalformedRecord";
	case ReconcileError::InvalidWindow: return "InvalidWindow";
	case ReconcileError::StaleConflict: return "StaleConflict";
	case ReconcileError::StorageFailure: return "StorageFailure";
	case ReconcileError::InvalidSelection: return "InvalidSelection";
	case ReconcileError::EmptyGroup: return "EmptyGroup";
	}
	return "Unknown";
}

QString refToStr(const ActivityRef &ref)
{
	return sourceTypeName(ref.sourceType) + ":" + QString::number(ref.id);
}
