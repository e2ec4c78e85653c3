#ifndef HELPERS
#define HELPERS

#include <QtGlobal>
#include <QString>
#include <QDateTime>
#include <deque>
#include "types.h"


QString convSecToTimeStr(const qint64 &seconds);

QString convDateTimeToIsoStr(const QDateTime &time);

QDateTime convIsoStrToDateTime(const QString &time_str);

QString normalizeLabel(const QString &label);

bool labelsSimilar(const QString &a, const QString &b, const bool allow_containment);

qint64 overlapMsec(const ActivityInterval &a, const ActivityInterval &b);

double overlapRatio(const ActivityInterval &a, const ActivityInterval &b);

void sortIntervals(std::deque<ActivityInterval>* pIntervals);

const ActivityInterval* findInterval(const std::deque<ActivityInterval> &intervals, const ActivityRef &ref);

QString sourceTypeName(const SourceType type);

bool parseSourceType(const QString &name, SourceType *pType);

QString conflictTypeName(const ConflictType type);

QString severityName(const Severity severity);

QString mergeStrategyName(const MergeStrategy strategy);

bool parseMergeStrategy(const QString &name, MergeStrategy *pStrategy);

QString defectKindName(const DefectKind kind);

QString errorName(const ReconcileError error);

QString refToStr(const ActivityRef &ref);

#endif // HELPERS
