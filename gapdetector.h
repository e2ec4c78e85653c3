#ifndef GAPDETECTOR_H
#define GAPDETECTOR_H

#include <QtGlobal>
#include <QDateTime>
#include <deque>
#include "settings.h"
#include "types.h"

// Maximal span of overlapping or touching intervals, clipped to the query window
struct BusyRun {
	QDateTime start;
	QDateTime end;
	ActivityRef first;	// interval that opens the run
	ActivityRef last;	// interval that reaches furthest
	int intervalCount;
};

class GapDetector
{
private:
	const Settings & settings_;

public:
	explicit GapDetector(const Settings & settings);

	// Busy runs within [windowStart, windowEnd), ordered by start.
	// Only closed intervals with positive length take part.
	ReconcileError busyRuns(const std::deque<ActivityInterval>& intervals, const QDateTime& windowStart,
		const QDateTime& windowEnd, std::deque<BusyRun>* pRuns) const;

	// Complement of the busy runs within the window, keeping spans of at least minGapSec.
	// An invalid or empty window yields InvalidWindow and leaves pGaps empty.
	ReconcileError detectGaps(const std::deque<ActivityInterval>& intervals, const QDateTime& windowStart,
		const QDateTime& windowEnd, qint64 minGapSec, std::deque<TimeGap>* pGaps) const;

	ReconcileError detectGaps(const std::deque<ActivityInterval>& intervals, const QDateTime& windowStart,
		const QDateTime& windowEnd, std::deque<TimeGap>* pGaps) const;

	GapStatistics gapStatistics(const std::deque<TimeGap>& gaps, const QDateTime& windowStart,
		const QDateTime& windowEnd) const;
};

#endif // GAPDETECTOR_H
