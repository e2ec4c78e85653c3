#include "conflictresolver.h"
#include <algorithm>
#include "logger.h"
#include "helpers.h"

ConflictResolver::ConflictResolver(const Settings &settings)
	: settings_(settings)
{ }

ReconcileError ConflictResolver::resolve(const ConflictGroup& group, const std::deque<ActivityInterval>& intervals,
	MergeStrategy strategy, MergeDecision* pDecision, const ActivityRef& manualSurvivor) const
{
	return resolveMembers(group.members, intervals, strategy, pDecision, manualSurvivor);
}

ReconcileError ConflictResolver::resolveMembers(const std::deque<ActivityRef>& members, const std::deque<ActivityInterval>& intervals,
	MergeStrategy strategy, MergeDecision* pDecision, const ActivityRef& manualSurvivor) const
{
	if (members.size() < 2) {
		if (settings_.logToFile())
			Logger::Log(QString("[MERGE] Refusing to merge a group of %1 activities").arg(members.size()));
		return ReconcileError::EmptyGroup;
	}

	// A member listed twice would end up both kept and discarded
	for (size_t k = 0; k < members.size(); ++k) {
		if (std::find(members.begin() + k + 1, members.end(), members[k]) != members.end()) {
			if (settings_.logToFile())
				Logger::Log("[MERGE] Group lists " + refToStr(members[k]) + " more than once");
			return ReconcileError::InvalidSelection;
		}
	}

	std::deque<const ActivityInterval*> inputs;
	for (const auto& ref : members) {
		const ActivityInterval* interval = findInterval(intervals, ref);
		if ((interval == nullptr) || !interval->isClosed() || (interval->durationMsec() < 0)) {
			if (settings_.logToFile())
				Logger::Log("[MERGE] Group member " + refToStr(ref) + " is missing or not a closed interval");
			return ReconcileError::MalformedRecord;
		}
		inputs.push_back(interval);
	}

	QDateTime union_start = inputs.front()->start;
	QDateTime union_end = inputs.front()->end;
	qint64 longest_msec = 0;
	for (const auto* i : inputs) {
		union_start = std::min(union_start, i->start);
		union_end = std::max(union_end, i->end);
		longest_msec = std::max(longest_msec, i->durationMsec());
	}

	// Ties resolve towards the earlier member in group order, which is sort order
	size_t chosen = 0;
	bool widen = true;
	switch (strategy) {
	case MergeStrategy::Longest:
		for (size_t k = 1; k < inputs.size(); ++k) {
			const qint64 d = inputs[k]->durationMsec();
			const qint64 best = inputs[chosen]->durationMsec();
			if ((d > best) || ((d == best) && (inputs[k]->start < inputs[chosen]->start)))
				chosen = k;
		}
		widen = settings_.isWidenLongestSurvivorEnabled();
		break;
	case MergeStrategy::Earliest:
		for (size_t k = 1; k < inputs.size(); ++k) {
			if (inputs[k]->start < inputs[chosen]->start)
				chosen = k;
		}
		break;
	case MergeStrategy::Latest:
		for (size_t k = 1; k < inputs.size(); ++k) {
			if (inputs[k]->end > inputs[chosen]->end)
				chosen = k;
		}
		break;
	case MergeStrategy::ManualSelection: {
		auto it = std::find(members.begin(), members.end(), manualSurvivor);
		if (it == members.end()) {
			if (settings_.logToFile())
				Logger::Log("[MERGE] Selected survivor " + refToStr(manualSurvivor) + " is not a member of the group");
			return ReconcileError::InvalidSelection;
		}
		chosen = static_cast<size_t>(std::distance(members.begin(), it));
		// A selected record that already covers the longest member stays as it is
		widen = (inputs[chosen]->durationMsec() < longest_msec);
		break;
	}
	}

	MergeDecision decision;
	decision.strategy = strategy;
	decision.survivor = *inputs[chosen];
	if (widen) {
		decision.survivor.start = union_start;
		decision.survivor.end = union_end;
	}
	decision.survivorChanged = (decision.survivor.start != inputs[chosen]->start) || (decision.survivor.end != inputs[chosen]->end);
	if (decision.survivorChanged)
		decision.survivor.storedDurationSeconds = decision.survivor.durationSeconds();

	for (size_t k = 0; k < members.size(); ++k) {
		if (k != chosen)
			decision.discard.push_back(members[k]);
	}

	if (settings_.logToFile()) {
		Logger::Log(QString("[MERGE] Strategy %1 keeps %2 (%3 - %4%5), discards %6 activities")
			.arg(mergeStrategyName(strategy)).arg(refToStr(decision.survivor.ref()))
			.arg(convDateTimeToIsoStr(decision.survivor.start)).arg(convDateTimeToIsoStr(decision.survivor.end))
			.arg(decision.survivorChanged ? ", widened" : "").arg(decision.discard.size()));
	}

	*pDecision = decision;
	return ReconcileError::None;
}

std::deque<ActivityInterval> ConflictResolver::trimOverlaps(const std::deque<ActivityInterval>& intervals) const
{
	std::deque<ActivityInterval> sorted;
	for (const auto& i : intervals) {
		if (i.isClosed() && (i.durationMsec() > 0))
			sorted.push_back(i);
	}
	sortIntervals(&sorted);

	// The end is only pulled back to a later record that runs past it, so the cut off
	// part stays covered. Records nested inside the current one are skipped, and a
	// record starting at the same time is left alone instead of shrinking to nothing.
	std::deque<ActivityInterval> adjusted;
	for (size_t k = 0; k < sorted.size(); ++k) {
		ActivityInterval current = sorted[k];
		for (size_t n = k + 1; n < sorted.size(); ++n) {
			const ActivityInterval& next = sorted[n];
			if (next.start >= current.end)
				break;
			if (next.end <= current.end)
				continue;
			if (next.start > current.start) {
				current.end = next.start;
				current.storedDurationSeconds = current.durationSeconds();
				adjusted.push_back(current);
			}
			break;
		}
	}

	if (settings_.logToFile())
		Logger::Log(QString("[MERGE] Trimming overlaps adjusts %1 of %2 activities").arg(adjusted.size()).arg(sorted.size()));

	return adjusted;
}

std::deque<ActivityInterval> ConflictResolver::splitInterval(const ActivityInterval& interval, const std::deque<QDateTime>& splitPoints) const
{
	std::deque<ActivityInterval> parts;
	if (!interval.isClosed()) {
		parts.push_back(interval);
		return parts;
	}

	std::deque<QDateTime> points;
	for (const auto& p : splitPoints) {
		if (p.isValid() && (p > interval.start) && (p < interval.end))
			points.push_back(p);
	}
	std::sort(points.begin(), points.end());
	points.erase(std::unique(points.begin(), points.end()), points.end());

	if (points.empty()) {
		parts.push_back(interval);
		return parts;
	}

	points.push_front(interval.start);
	points.push_back(interval.end);
	for (size_t k = 0; k + 1 < points.size(); ++k) {
		ActivityInterval part = interval;
		part.id = (k == 0) ? interval.id : -1;
		part.start = points[k];
		part.end = points[k + 1];
		part.storedDurationSeconds = part.durationSeconds();
		part.label = QString("%1 (Part %2)").arg(interval.label).arg(k + 1);
		parts.push_back(part);
	}
	return parts;
}
