#ifndef CONFLICTDETECTOR_H
#define CONFLICTDETECTOR_H

#include <QtGlobal>
#include <deque>
#include "settings.h"
#include "types.h"

class ConflictDetector
{
private:
	const Settings & settings_;

	Severity severityForRatio(double ratio) const;

public:
	explicit ConflictDetector(const Settings & settings);

	// Classifies two closed intervals. Returns false when they do not overlap at all.
	bool classifyPair(const ActivityInterval& a, const ActivityInterval& b, ConflictPair* pPair) const;

	// Connected components of the overlap graph, ordered by their earliest member.
	// Open and zero-length intervals never take part.
	std::deque<ConflictGroup> detectConflicts(const std::deque<ActivityInterval>& intervals) const;

	// Runs of same-source intervals separated by at most maxGapSec
	std::deque<std::deque<ActivityRef>> findMergeableGroups(const std::deque<ActivityInterval>& intervals, qint64 maxGapSec) const;
	std::deque<std::deque<ActivityRef>> findMergeableGroups(const std::deque<ActivityInterval>& intervals) const;

	MergeSuggestion suggestMerge(const std::deque<ActivityInterval>& intervals) const;
};

#endif // CONFLICTDETECTOR_H
