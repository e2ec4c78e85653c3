#ifndef REPORTJSON_H
#define REPORTJSON_H

#include <QJsonObject>
#include <QJsonArray>
#include <deque>
#include "types.h"
#include "reconciler.h"

QJsonObject refToJson(const ActivityRef &ref);

QJsonObject intervalToJson(const ActivityInterval &interval);

QJsonObject gapToJson(const TimeGap &gap);

QJsonObject gapStatisticsToJson(const GapStatistics &stats);

QJsonObject conflictGroupToJson(const ConflictGroup &group);

QJsonObject mergeDecisionToJson(const MergeDecision &decision);

QJsonObject defectToJson(const Defect &defect);

QJsonObject qualityToJson(const DataQualityReport &quality);

QJsonObject reportToJson(const ReconcileReport &report);

#endif // REPORTJSON_H
