#include "gapdetector.h"
#include <algorithm>
#include "logger.h"
#include "helpers.h"

namespace {

struct ClippedSpan {
	qint64 start;
	qint64 end;
	ActivityRef ref;
};

bool isValidWindow(const QDateTime& windowStart, const QDateTime& windowEnd)
{
	return windowStart.isValid() && windowEnd.isValid() && (windowStart < windowEnd);
}

} // namespace

GapDetector::GapDetector(const Settings &settings)
	: settings_(settings)
{ }

ReconcileError GapDetector::busyRuns(const std::deque<ActivityInterval>& intervals, const QDateTime& windowStart,
	const QDateTime& windowEnd, std::deque<BusyRun>* pRuns) const
{
	pRuns->clear();

	if (!isValidWindow(windowStart, windowEnd)) {
		if (settings_.logToFile())
			Logger::Log("[GAPS] Invalid window " + convDateTimeToIsoStr(windowStart) + " - " + convDateTimeToIsoStr(windowEnd));
		return ReconcileError::InvalidWindow;
	}

	const qint64 w_start = windowStart.toMSecsSinceEpoch();
	const qint64 w_end = windowEnd.toMSecsSinceEpoch();

	// Half-open [start, end) everywhere: a span ending exactly at w_start does not intersect the window
	std::deque<ClippedSpan> spans;
	for (const auto& i : intervals) {
		if (!i.isClosed())
			continue;
		const qint64 s = i.start.toMSecsSinceEpoch();
		const qint64 e = i.end.toMSecsSinceEpoch();
		if (e <= s)
			continue;
		if ((e <= w_start) || (s >= w_end))
			continue;
		spans.push_back({ std::max(s, w_start), std::min(e, w_end), i.ref() });
	}

	std::sort(spans.begin(), spans.end(), [](const ClippedSpan& a, const ClippedSpan& b) {
		if (a.start != b.start) return a.start < b.start;
		if (a.end != b.end) return a.end < b.end;
		if (a.ref.sourceType != b.ref.sourceType) return int(a.ref.sourceType) < int(b.ref.sourceType);
		return a.ref.id < b.ref.id;
	});

	qint64 run_start = 0;
	qint64 run_end = 0;
	ActivityRef first_ref;
	ActivityRef last_ref;
	int count = 0;

	auto flush = [&]() {
		if (count > 0) {
			pRuns->push_back({ QDateTime::fromMSecsSinceEpoch(run_start, Qt::UTC),
				QDateTime::fromMSecsSinceEpoch(run_end, Qt::UTC), first_ref, last_ref, count });
		}
	};

	for (const auto& span : spans) {
		// Touching spans (span.start == run_end) continue the run
		if ((count > 0) && (span.start <= run_end)) {
			if (span.end > run_end) {
				run_end = span.end;
				last_ref = span.ref;
			}
			++count;
			continue;
		}
		flush();
		run_start = span.start;
		run_end = span.end;
		first_ref = span.ref;
		last_ref = span.ref;
		count = 1;
	}
	flush();

	return ReconcileError::None;
}

ReconcileError GapDetector::detectGaps(const std::deque<ActivityInterval>& intervals, const QDateTime& windowStart,
	const QDateTime& windowEnd, qint64 minGapSec, std::deque<TimeGap>* pGaps) const
{
	pGaps->clear();

	std::deque<BusyRun> runs;
	const ReconcileError error = busyRuns(intervals, windowStart, windowEnd, &runs);
	if (error != ReconcileError::None)
		return error;

	const qint64 min_gap_msec = std::max<qint64>(0, minGapSec) * 1000;

	auto emitGap = [&](const QDateTime& start, const QDateTime& end, const ActivityRef& before, const ActivityRef& after) {
		const qint64 length = start.msecsTo(end);
		// Zero-length spaces are never gaps, even with a zero minimum
		if ((length > 0) && (length >= min_gap_msec))
			pGaps->emplace_back(start, end, before, after);
	};

	QDateTime cursor = windowStart.toUTC();
	ActivityRef before;
	for (const auto& run : runs) {
		emitGap(cursor, run.start, before, run.first);
		cursor = run.end;
		before = run.last;
	}
	emitGap(cursor, windowEnd.toUTC(), before, ActivityRef());

	if (settings_.logToFile()) {
		Logger::Log(QString("[GAPS] %1 intervals, %2 busy runs, %3 gaps >= %4s in window %5 - %6")
			.arg(intervals.size()).arg(runs.size()).arg(pGaps->size()).arg(minGapSec)
			.arg(convDateTimeToIsoStr(windowStart)).arg(convDateTimeToIsoStr(windowEnd)));
	}

	return ReconcileError::None;
}

ReconcileError GapDetector::detectGaps(const std::deque<ActivityInterval>& intervals, const QDateTime& windowStart,
	const QDateTime& windowEnd, std::deque<TimeGap>* pGaps) const
{
	return detectGaps(intervals, windowStart, windowEnd, settings_.getMinGapSec(), pGaps);
}

GapStatistics GapDetector::gapStatistics(const std::deque<TimeGap>& gaps, const QDateTime& windowStart,
	const QDateTime& windowEnd) const
{
	GapStatistics stats;
	if (isValidWindow(windowStart, windowEnd))
		stats.windowSeconds = windowStart.secsTo(windowEnd);

	for (const auto& g : gaps) {
		stats.totalUntrackedSeconds += g.durationSeconds;
		stats.longestGapSeconds = std::max(stats.longestGapSeconds, g.durationSeconds);
	}
	stats.totalGaps = static_cast<int>(gaps.size());
	if (stats.totalGaps > 0)
		stats.averageGapSeconds = static_cast<double>(stats.totalUntrackedSeconds) / stats.totalGaps;
	return stats;
}
