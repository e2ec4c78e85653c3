#include "conflictdetector.h"
#include <algorithm>
#include <map>
#include <numeric>
#include <vector>
#include "logger.h"
#include "helpers.h"

namespace {

const double RATIO_EPSILON = 1e-9;

bool ratioAtLeast(double ratio, double threshold)
{
	return (ratio + RATIO_EPSILON) >= threshold;
}

// Index-based union-find over positions in the sorted interval list
class DisjointSet
{
	std::vector<size_t> parent_;

public:
	explicit DisjointSet(size_t n) : parent_(n) {
		std::iota(parent_.begin(), parent_.end(), 0);
	}

	size_t find(size_t x) {
		while (parent_[x] != x) {
			parent_[x] = parent_[parent_[x]];
			x = parent_[x];
		}
		return x;
	}

	void unite(size_t a, size_t b) {
		a = find(a);
		b = find(b);
		if (a == b)
			return;
		// Keep the lower position as root so group order follows the sort order
		if (b < a)
			std::swap(a, b);
		parent_[b] = a;
	}
};

QString groupMessage(const ConflictGroup& group)
{
	if (group.conflictType == ConflictType::Duplicate)
		return QString("%1 activities appear to be the same activity logged twice").arg(group.members.size());
	return QString("%1 activities overlap in time (%2 severity)").arg(group.members.size()).arg(severityName(group.severity));
}

} // namespace

ConflictDetector::ConflictDetector(const Settings &settings)
	: settings_(settings)
{ }

Severity ConflictDetector::severityForRatio(double ratio) const
{
	if (ratioAtLeast(ratio, settings_.getHighSeverityRatio()))
		return Severity::High;
	if (ratioAtLeast(ratio, settings_.getMediumSeverityRatio()))
		return Severity::Medium;
	return Severity::Low;
}

bool ConflictDetector::classifyPair(const ActivityInterval& a, const ActivityInterval& b, ConflictPair* pPair) const
{
	const qint64 overlap = overlapMsec(a, b);
	if (overlap <= 0)
		return false;

	const double ratio = overlapRatio(a, b);
	pPair->first = a.ref();
	pPair->second = b.ref();
	pPair->overlapSeconds = overlap / 1000;
	pPair->overlapRatio = ratio;
	pPair->severity = severityForRatio(ratio);

	// First match wins: same source, near-total overlap and matching labels is a duplicate
	if ((a.sourceType == b.sourceType)
		&& ratioAtLeast(ratio, settings_.getDuplicateOverlapRatio())
		&& labelsSimilar(a.label, b.label, settings_.isLabelContainmentEnabled())) {
		pPair->type = ConflictType::Duplicate;
	}
	else {
		pPair->type = ConflictType::Overlap;
	}
	return true;
}

std::deque<ConflictGroup> ConflictDetector::detectConflicts(const std::deque<ActivityInterval>& intervals) const
{
	std::deque<ConflictGroup> groups;

	std::deque<ActivityInterval> sorted;
	for (const auto& i : intervals) {
		if (i.isClosed() && (i.durationMsec() > 0))
			sorted.push_back(i);
	}
	sortIntervals(&sorted);

	DisjointSet components(sorted.size());
	std::vector<std::pair<size_t, ConflictPair>> edges;
	std::vector<size_t> active;

	for (size_t cur = 0; cur < sorted.size(); ++cur) {
		const qint64 cur_start = sorted[cur].start.toMSecsSinceEpoch();

		// Drop everything that ended at or before the current start (touching is not overlapping)
		active.erase(std::remove_if(active.begin(), active.end(), [&](size_t idx) {
			return sorted[idx].end.toMSecsSinceEpoch() <= cur_start;
		}), active.end());

		for (const size_t other : active) {
			ConflictPair pair;
			if (classifyPair(sorted[other], sorted[cur], &pair)) {
				components.unite(other, cur);
				edges.emplace_back(other, pair);
			}
		}
		active.push_back(cur);
	}

	if (edges.empty())
		return groups;

	std::vector<bool> in_conflict(sorted.size(), false);
	for (const auto& e : edges) {
		in_conflict[components.find(e.first)] = true;
	}

	// Roots are the lowest member position, so first encounter in position order is group order
	std::map<size_t, size_t> group_of_root;
	for (size_t pos = 0; pos < sorted.size(); ++pos) {
		const size_t root = components.find(pos);
		if (!in_conflict[root])
			continue;
		auto it = group_of_root.find(root);
		if (it == group_of_root.end()) {
			it = group_of_root.emplace(root, groups.size()).first;
			groups.emplace_back();
		}
		groups[it->second].members.push_back(sorted[pos].ref());
	}

	for (const auto& e : edges) {
		ConflictGroup& group = groups[group_of_root[components.find(e.first)]];
		group.pairs.push_back(e.second);
	}

	for (auto& group : groups) {
		bool all_duplicates = true;
		Severity severity = Severity::Low;
		for (const auto& p : group.pairs) {
			if (p.type != ConflictType::Duplicate)
				all_duplicates = false;
			if (int(p.severity) > int(severity))
				severity = p.severity;
		}
		group.conflictType = all_duplicates ? ConflictType::Duplicate : ConflictType::Overlap;
		group.severity = severity;
		group.message = groupMessage(group);
	}

	if (settings_.logToFile()) {
		Logger::Log(QString("[CONFLICT] %1 closed intervals, %2 overlapping pairs, %3 groups")
			.arg(sorted.size()).arg(edges.size()).arg(groups.size()));
	}

	return groups;
}

std::deque<std::deque<ActivityRef>> ConflictDetector::findMergeableGroups(const std::deque<ActivityInterval>& intervals, qint64 maxGapSec) const
{
	std::deque<std::deque<ActivityRef>> groups;

	std::deque<ActivityInterval> sorted;
	for (const auto& i : intervals) {
		if (i.isClosed() && (i.durationMsec() > 0))
			sorted.push_back(i);
	}
	sortIntervals(&sorted);
	if (sorted.empty())
		return groups;

	const qint64 max_gap_msec = std::max<qint64>(0, maxGapSec) * 1000;
	std::deque<ActivityRef> current{ sorted.front().ref() };
	SourceType current_source = sorted.front().sourceType;
	qint64 current_end = sorted.front().end.toMSecsSinceEpoch();

	for (size_t i = 1; i < sorted.size(); ++i) {
		const qint64 start = sorted[i].start.toMSecsSinceEpoch();
		const qint64 gap = start - current_end;

		if ((sorted[i].sourceType == current_source) && (gap <= max_gap_msec)) {
			current.push_back(sorted[i].ref());
			current_end = std::max(current_end, sorted[i].end.toMSecsSinceEpoch());
			continue;
		}

		if (current.size() > 1)
			groups.push_back(current);
		current = { sorted[i].ref() };
		current_source = sorted[i].sourceType;
		current_end = sorted[i].end.toMSecsSinceEpoch();
	}
	if (current.size() > 1)
		groups.push_back(current);

	if (settings_.logToFile())
		Logger::Log(QString("[CONFLICT] %1 mergeable groups with gaps <= %2s").arg(groups.size()).arg(maxGapSec));

	return groups;
}

std::deque<std::deque<ActivityRef>> ConflictDetector::findMergeableGroups(const std::deque<ActivityInterval>& intervals) const
{
	return findMergeableGroups(intervals, settings_.getMergeableMaxGapSec());
}

MergeSuggestion ConflictDetector::suggestMerge(const std::deque<ActivityInterval>& intervals) const
{
	MergeSuggestion suggestion;

	if (intervals.size() < 2) {
		suggestion.reason = "Need at least 2 activities to merge";
		return suggestion;
	}

	for (const auto& i : intervals) {
		if (!i.isClosed()) {
			suggestion.reason = "Cannot merge activities that are still in progress";
			return suggestion;
		}
		if (i.sourceType != intervals.front().sourceType) {
			suggestion.reason = "Cannot merge activities from different sources";
			return suggestion;
		}
	}

	std::deque<ActivityInterval> sorted(intervals);
	sortIntervals(&sorted);

	qint64 max_gap_sec = 0;
	qint64 reach = sorted.front().end.toMSecsSinceEpoch();
	for (size_t i = 1; i < sorted.size(); ++i) {
		const qint64 gap_msec = sorted[i].start.toMSecsSinceEpoch() - reach;
		max_gap_sec = std::max(max_gap_sec, gap_msec / 1000);
		reach = std::max(reach, sorted[i].end.toMSecsSinceEpoch());
	}

	if (max_gap_sec == 0) {
		suggestion.confidence = 100;
		suggestion.reason = "Activities are consecutive with no gaps";
	}
	else if (max_gap_sec <= 60) {
		suggestion.confidence = 90;
		suggestion.reason = QString("Small gaps (max %1s) between activities").arg(max_gap_sec);
	}
	else if (max_gap_sec <= 300) {
		suggestion.confidence = 70;
		suggestion.reason = QString("Moderate gaps (max %1min) between activities").arg(qRound(max_gap_sec / 60.0));
	}
	else if (max_gap_sec <= 900) {
		suggestion.confidence = 50;
		suggestion.reason = QString("Large gaps (max %1min) between activities").arg(qRound(max_gap_sec / 60.0));
	}
	else {
		suggestion.confidence = 20;
		suggestion.reason = QString("Very large gaps (max %1min) - not recommended").arg(qRound(max_gap_sec / 60.0));
	}

	bool same_labels = true;
	for (const auto& i : sorted) {
		if (normalizeLabel(i.label) != normalizeLabel(sorted.front().label)) {
			same_labels = false;
			break;
		}
	}
	if (same_labels) {
		suggestion.confidence += 10;
		suggestion.reason += " and identical titles";
	}

	suggestion.confidence = std::min(suggestion.confidence, 100);
	suggestion.canMerge = (suggestion.confidence >= 50);
	return suggestion;
}
