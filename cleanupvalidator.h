#ifndef CLEANUPVALIDATOR_H
#define CLEANUPVALIDATOR_H

#include <QtGlobal>
#include <QSet>
#include <deque>
#include "settings.h"
#include "types.h"

class CleanupValidator
{
private:
	const Settings & settings_;

	void checkInterval(const ActivityInterval& interval, const QSet<qint64>* pKnownCategories, std::deque<Defect>* pDefects) const;

public:
	explicit CleanupValidator(const Settings & settings);

	// Structural defects only. Overlaps are the conflict detector's business.
	std::deque<Defect> validate(const std::deque<ActivityInterval>& intervals) const;
	std::deque<Defect> validate(const std::deque<ActivityInterval>& intervals, const QSet<qint64>& knownCategoryIds) const;

	DataQualityReport qualityReport(const std::deque<ActivityInterval>& intervals, const std::deque<Defect>& defects,
		const std::deque<TimeGap>& gaps, const std::deque<ConflictGroup>& conflicts) const;
};

#endif // CLEANUPVALIDATOR_H
