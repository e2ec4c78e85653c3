#include "test_integration.h"
#include <QtTest>
#include <QJsonArray>
#include <QJsonObject>
#include "activitystore.h"
#include "reconciler.h"
#include "reportjson.h"

using TestCommon::dt;
using TestCommon::createSettingsFile;

QString IntegrationTest::nextDatabaseFile()
{
    return QDir(temp_dir_.path()).filePath(QString("integration_%1.sqlite").arg(++db_counter_));
}

void IntegrationTest::seedMessyDay(ActivityStore* pStore)
{
    const qint64 work = pStore->insertCategory("Work");
    QVERIFY(work > 0);

    TimeEntryRecord report;
    report.task = "Write report";
    report.startTime = dt(9);
    report.endTime = dt(10);
    report.duration = 3600;
    report.categoryId = work;
    QVERIFY(pStore->insertTimeEntry(&report));

    TimeEntryRecord report_again = report;
    report_again.task = "write report";
    report_again.categoryId = 0;
    QVERIFY(pStore->insertTimeEntry(&report_again));

    AppUsageRecord editor;
    editor.appName = "Editor";
    editor.startTime = dt(11);
    editor.endTime = dt(12);
    QVERIFY(pStore->insertAppUsage(&editor));

    PomodoroSessionRecord zero;
    zero.startTime = dt(13);
    zero.endTime = dt(13);
    zero.completed = true;
    QVERIFY(pStore->insertPomodoroSession(&zero));

    TimeEntryRecord negative;
    negative.task = "Backwards";
    negative.startTime = dt(14, 30);
    negative.endTime = dt(14);
    QVERIFY(pStore->insertTimeEntry(&negative));

    TimeEntryRecord orphan;
    orphan.task = "Review";
    orphan.startTime = dt(15);
    orphan.endTime = dt(16);
    orphan.categoryId = 77;
    QVERIFY(pStore->insertTimeEntry(&orphan));

    PomodoroSessionRecord nowhere;
    nowhere.completed = true;
    QVERIFY(pStore->insertPomodoroSession(&nowhere));
}

void IntegrationTest::test_integration_fullPass_reportsEverything()
{
    // Arrange
    Settings settings(createSettingsFile(temp_dir_.path()));
    ActivityStore store(settings, nextDatabaseFile());
    seedMessyDay(&store);
    Reconciler reconciler(settings, store);

    // Act
    ReconcileReport report;
    QVERIFY(reconciler.runPass(dt(9), dt(17), &report) == ReconcileError::None);

    // Assert
    QCOMPARE((int)report.intervals.size(), 6);
    QCOMPARE((int)report.diagnostics.size(), 1);
    QVERIFY(report.diagnostics[0].ref.sourceType == SourceType::Pomodoro);

    QCOMPARE((int)report.gaps.size(), 3);
    QCOMPARE(report.gaps[0].start, dt(10));
    QCOMPARE(report.gaps[1].start, dt(12));
    QCOMPARE(report.gaps[1].end, dt(15));
    QCOMPARE(report.gaps[2].end, dt(17));
    QCOMPARE(report.gapStatistics.totalUntrackedSeconds, (qint64)(5 * 3600));

    QCOMPARE((int)report.conflicts.size(), 1);
    QVERIFY(report.conflicts[0].conflictType == ConflictType::Duplicate);
    QVERIFY(report.conflicts[0].severity == Severity::High);
    QCOMPARE((int)report.mergeableGroups.size(), 1);

    QCOMPARE((int)report.defects.size(), 3);
    QCOMPARE(report.quality.zeroDurationCount, 1);
    QCOMPARE(report.quality.negativeDurationCount, 1);
    QCOMPARE(report.quality.orphanedCount, 1);
    QCOMPARE(report.quality.qualityScore, 50);
    QCOMPARE(report.quality.duplicateGroupsCount, 1);
    QCOMPARE(report.quality.gapsCount, 3);

    // Analysis is read only and repeatable
    ReconcileReport again;
    QVERIFY(reconciler.runPass(dt(9), dt(17), &again) == ReconcileError::None);
    QCOMPARE(again.intervals.size(), report.intervals.size());
    QCOMPARE(again.gaps.size(), report.gaps.size());
    QVERIFY(again.conflicts[0].members == report.conflicts[0].members);
}

void IntegrationTest::test_integration_invalidWindow()
{
    Settings settings(createSettingsFile(temp_dir_.path()));
    ActivityStore store(settings, nextDatabaseFile());
    Reconciler reconciler(settings, store);

    ReconcileReport report;
    QVERIFY(reconciler.runPass(dt(17), dt(9), &report) == ReconcileError::InvalidWindow);
    QVERIFY(reconciler.runPass(dt(9), dt(9), &report) == ReconcileError::InvalidWindow);
}

void IntegrationTest::test_integration_mergeDuplicates_thenCleanPass()
{
    // Arrange
    Settings settings(createSettingsFile(temp_dir_.path()));
    ActivityStore store(settings, nextDatabaseFile());
    seedMessyDay(&store);
    Reconciler reconciler(settings, store);
    ReconcileReport report;
    QVERIFY(reconciler.runPass(dt(9), dt(17), &report) == ReconcileError::None);
    const ActivityRef first = report.conflicts[0].members[0];
    const ActivityRef second = report.conflicts[0].members[1];

    // Act
    MergeDecision decision;
    QVERIFY(reconciler.mergeGroup(report, 0, MergeStrategy::Longest, ActivityRef(), &decision) == ReconcileError::None);

    // Assert
    QVERIFY(decision.survivor.ref() == first);
    QCOMPARE((int)decision.discard.size(), 1);
    QVERIFY(decision.discard[0] == second);
    QVERIFY(store.exists(first));
    QVERIFY(!store.exists(second));

    ReconcileReport after;
    QVERIFY(reconciler.runPass(dt(9), dt(17), &after) == ReconcileError::None);
    QVERIFY(after.conflicts.empty());
    QCOMPARE((int)after.intervals.size(), 5);
    QCOMPARE((int)after.gaps.size(), 3);
}

void IntegrationTest::test_integration_merge_invalidGroupIndex()
{
    Settings settings(createSettingsFile(temp_dir_.path()));
    ActivityStore store(settings, nextDatabaseFile());
    seedMessyDay(&store);
    Reconciler reconciler(settings, store);
    ReconcileReport report;
    QVERIFY(reconciler.runPass(dt(9), dt(17), &report) == ReconcileError::None);

    MergeDecision decision;
    QVERIFY(reconciler.mergeGroup(report, 1, MergeStrategy::Longest, ActivityRef(), &decision) == ReconcileError::InvalidSelection);
    QVERIFY(reconciler.mergeGroup(report, -1, MergeStrategy::Longest, ActivityRef(), &decision) == ReconcileError::InvalidSelection);

    // Manual survivor outside the group
    QVERIFY(reconciler.mergeGroup(report, 0, MergeStrategy::ManualSelection, ActivityRef(1, SourceType::Automatic), &decision)
        == ReconcileError::InvalidSelection);

    // A member listed twice is refused before the store is touched
    const ActivityRef first = report.conflicts[0].members[0];
    QVERIFY(reconciler.mergeMembers(report, { first, first }, MergeStrategy::Longest, ActivityRef(), &decision)
        == ReconcileError::InvalidSelection);
    QVERIFY(store.exists(first));

    // Nothing was touched
    ReconcileReport after;
    QVERIFY(reconciler.runPass(dt(9), dt(17), &after) == ReconcileError::None);
    QCOMPARE(after.intervals.size(), report.intervals.size());
}

void IntegrationTest::test_integration_merge_staleAfterOutOfBandDelete()
{
    // Description: a record removed between detection and merge aborts the merge without touching the rest

    // Arrange
    Settings settings(createSettingsFile(temp_dir_.path()));
    ActivityStore store(settings, nextDatabaseFile());
    seedMessyDay(&store);
    Reconciler reconciler(settings, store);
    ReconcileReport report;
    QVERIFY(reconciler.runPass(dt(9), dt(17), &report) == ReconcileError::None);
    const ActivityRef first = report.conflicts[0].members[0];
    const ActivityRef second = report.conflicts[0].members[1];
    QVERIFY(store.deleteRecords({ second }) == ReconcileError::None);

    // Act
    MergeDecision decision;
    ReconcileError err = reconciler.mergeGroup(report, 0, MergeStrategy::Earliest, ActivityRef(), &decision);

    // Assert
    QVERIFY(err == ReconcileError::StaleConflict);
    QVERIFY(store.exists(first));
    QVERIFY(decision.discard.empty());
}

void IntegrationTest::test_integration_applyFixes_thenPerfectScore()
{
    // Arrange
    Settings settings(createSettingsFile(temp_dir_.path()));
    ActivityStore store(settings, nextDatabaseFile());
    seedMessyDay(&store);
    Reconciler reconciler(settings, store);
    ReconcileReport report;
    QVERIFY(reconciler.runPass(dt(9), dt(17), &report) == ReconcileError::None);

    // Act
    QVERIFY(reconciler.applyFixes(report.defects) == ReconcileError::None);

    // Assert
    ReconcileReport after;
    QVERIFY(reconciler.runPass(dt(9), dt(17), &after) == ReconcileError::None);
    QVERIFY(after.defects.empty());
    QCOMPARE((int)after.intervals.size(), 4);
    QCOMPARE(after.quality.qualityScore, 100);

    // Applying the same plan twice finds its records gone
    QVERIFY(reconciler.applyFixes(report.defects) == ReconcileError::StaleConflict);
}

void IntegrationTest::test_integration_fillGaps_removesGaps()
{
    // Arrange
    Settings settings(createSettingsFile(temp_dir_.path()));
    ActivityStore store(settings, nextDatabaseFile());
    seedMessyDay(&store);
    Reconciler reconciler(settings, store);
    ReconcileReport report;
    QVERIFY(reconciler.runPass(dt(9), dt(17), &report) == ReconcileError::None);

    // Act
    std::deque<qint64> ids;
    QVERIFY(reconciler.fillGaps(report.gaps, "Untracked", &ids) == ReconcileError::None);
    QCOMPARE((int)ids.size(), 3);
    for (const auto id : ids)
        QVERIFY(id > 0);

    // Assert
    ReconcileReport after;
    QVERIFY(reconciler.runPass(dt(9), dt(17), &after) == ReconcileError::None);
    QVERIFY(after.gaps.empty());
    QCOMPARE((int)after.intervals.size(), 9);
    // Filled entries only touch their neighbours
    QCOMPARE((int)after.conflicts.size(), 1);

    QVERIFY(reconciler.fillGap(TimeGap(dt(10), dt(10)), "x", nullptr) == ReconcileError::InvalidWindow);

    // One empty gap in the list keeps the whole list out
    std::deque<TimeGap> mixed = { TimeGap(dt(17), dt(18)), TimeGap(dt(19), dt(19)) };
    QVERIFY(reconciler.fillGaps(mixed, "x", &ids) == ReconcileError::InvalidWindow);
    ReconcileReport evening;
    QVERIFY(reconciler.runPass(dt(17), dt(20), &evening) == ReconcileError::None);
    QVERIFY(evening.intervals.empty());

    qint64 single = -1;
    QVERIFY(reconciler.fillGap(TimeGap(dt(17), dt(18)), "", &single) == ReconcileError::None);
    QVERIFY(single > 0);
}

void IntegrationTest::test_integration_trimOverlaps()
{
    Settings settings(createSettingsFile(temp_dir_.path()));
    ActivityStore store(settings, nextDatabaseFile());
    TimeEntryRecord a;
    a.task = "Planning";
    a.startTime = dt(9);
    a.endTime = dt(10, 30);
    QVERIFY(store.insertTimeEntry(&a));
    AppUsageRecord b;
    b.appName = "Browser";
    b.startTime = dt(10);
    b.endTime = dt(11);
    QVERIFY(store.insertAppUsage(&b));
    Reconciler reconciler(settings, store);

    ReconcileReport report;
    QVERIFY(reconciler.runPass(dt(9), dt(17), &report) == ReconcileError::None);
    QCOMPARE((int)report.conflicts.size(), 1);

    int count = 0;
    QVERIFY(reconciler.trimOverlaps(report, &count) == ReconcileError::None);
    QCOMPARE(count, 1);

    ReconcileReport after;
    QVERIFY(reconciler.runPass(dt(9), dt(17), &after) == ReconcileError::None);
    QVERIFY(after.conflicts.empty());
    QCOMPARE(after.intervals[0].end, dt(10));
    QCOMPARE(after.intervals[0].storedDurationSeconds, (qint64)3600);
}

void IntegrationTest::test_integration_recalculateDurations()
{
    Settings settings(createSettingsFile(temp_dir_.path()));
    ActivityStore store(settings, nextDatabaseFile());
    TimeEntryRecord off;
    off.task = "Off";
    off.startTime = dt(9);
    off.endTime = dt(10);
    off.duration = 100;
    QVERIFY(store.insertTimeEntry(&off));
    TimeEntryRecord zero;
    zero.task = "Zero";
    zero.startTime = dt(11);
    zero.endTime = dt(11);
    QVERIFY(store.insertTimeEntry(&zero));
    Reconciler reconciler(settings, store);

    ReconcileReport report;
    QVERIFY(reconciler.runPass(dt(9), dt(17), &report) == ReconcileError::None);
    QCOMPARE((int)report.defects.size(), 2);

    int count = 0;
    QVERIFY(reconciler.recalculateDurations(report, &count) == ReconcileError::None);
    QCOMPARE(count, 1);

    // Only the duration was repaired, the zero-length record is still there
    ReconcileReport after;
    QVERIFY(reconciler.runPass(dt(9), dt(17), &after) == ReconcileError::None);
    QCOMPARE((int)after.defects.size(), 1);
    QVERIFY(after.defects[0].kind == DefectKind::ZeroDuration);
    QCOMPARE(after.quality.durationMismatchCount, 0);
}

void IntegrationTest::test_integration_reportJson()
{
    Settings settings(createSettingsFile(temp_dir_.path()));
    ActivityStore store(settings, nextDatabaseFile());
    seedMessyDay(&store);
    Reconciler reconciler(settings, store);
    ReconcileReport report;
    QVERIFY(reconciler.runPass(dt(9), dt(17), &report) == ReconcileError::None);

    QJsonObject json = reportToJson(report);
    QCOMPARE(json["window_start"].toString(), QString("2024-03-04T09:00:00.000Z"));
    QCOMPARE(json["activities"].toArray().size(), 6);
    QCOMPARE(json["rejected"].toArray().size(), 1);
    QCOMPARE(json["gaps"].toArray().size(), 3);
    QCOMPARE(json["gaps"].toArray()[0].toObject()["duration"].toString(), QString("01:00:00"));
    QCOMPARE(json["defects"].toArray().size(), 3);
    QCOMPARE(json["mergeable_groups"].toArray().size(), 1);

    QJsonObject group = json["conflicts"].toArray()[0].toObject();
    QCOMPARE(group["type"].toString(), QString("duplicate"));
    QCOMPARE(group["severity"].toString(), QString("high"));
    QCOMPARE(group["members"].toArray().size(), 2);
    QCOMPARE(group["members"].toArray()[0].toObject()["source"].toString(), QString("manual"));

    QJsonObject quality = json["quality"].toObject();
    QCOMPARE(quality["quality_score"].toInt(), 50);
    QCOMPARE(quality["total_activities"].toInt(), 6);
}
