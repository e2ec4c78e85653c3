#ifndef CONFLICTRESOLVER_H
#define CONFLICTRESOLVER_H

#include <QtGlobal>
#include <QDateTime>
#include <deque>
#include "settings.h"
#include "types.h"

class ConflictResolver
{
private:
	const Settings & settings_;

public:
	explicit ConflictResolver(const Settings & settings);

	// Builds the merge plan for a conflict group. Storage is never touched here.
	// manualSurvivor is only read for MergeStrategy::ManualSelection.
	ReconcileError resolve(const ConflictGroup& group, const std::deque<ActivityInterval>& intervals,
		MergeStrategy strategy, MergeDecision* pDecision, const ActivityRef& manualSurvivor = ActivityRef()) const;

	// Same as resolve() for an arbitrary member list, e.g. a mergeable group
	ReconcileError resolveMembers(const std::deque<ActivityRef>& members, const std::deque<ActivityInterval>& intervals,
		MergeStrategy strategy, MergeDecision* pDecision, const ActivityRef& manualSurvivor = ActivityRef()) const;

	// Pulls each interval's end back to the start of the first later interval that
	// overlaps it and ends after it. Total covered time never changes.
	// Returns only the intervals that changed.
	std::deque<ActivityInterval> trimOverlaps(const std::deque<ActivityInterval>& intervals) const;

	// Splits at the given interior points. The first part keeps the id, later parts get id -1.
	std::deque<ActivityInterval> splitInterval(const ActivityInterval& interval, const std::deque<QDateTime>& splitPoints) const;
};

#endif // CONFLICTRESOLVER_H
