#include "test_cleanupvalidator.h"
#include <QtTest>
#include "cleanupvalidator.h"
#include "gapdetector.h"

using TestCommon::at;
using TestCommon::dt;
using TestCommon::mk;
using TestCommon::createSettingsFile;

void CleanupValidatorTest::test_cleanup_zeroDuration_flaggedAndExcludedFromGaps()
{
    // Description: a zero-length activity covers no time and is proposed for deletion

    // Arrange
    Settings settings(createSettingsFile(temp_dir_.path()));
    CleanupValidator validator(settings);
    GapDetector gap_detector(settings);
    std::deque<ActivityInterval> d;
    d.push_back(mk(1, SourceType::Manual, at(10), at(10), "Nothing"));

    // Act
    std::deque<Defect> defects = validator.validate(d);
    std::deque<TimeGap> gaps;
    QVERIFY(gap_detector.detectGaps(d, dt(9), dt(17), &gaps) == ReconcileError::None);

    // Assert
    QCOMPARE((int)defects.size(), 1);
    QVERIFY(defects[0].kind == DefectKind::ZeroDuration);
    QVERIFY(defects[0].fix == FixAction::Delete);
    QVERIFY(defects[0].ref == ActivityRef(1, SourceType::Manual));
    QCOMPARE((int)gaps.size(), 1);
    QCOMPARE(gaps[0].start, dt(9));
    QCOMPARE(gaps[0].end, dt(17));
}

void CleanupValidatorTest::test_cleanup_negativeDuration_repairOrDelete()
{
    Settings settings(createSettingsFile(temp_dir_.path()));
    CleanupValidator validator(settings);

    // With a stored duration the end is rebuilt from it
    std::deque<ActivityInterval> d;
    ActivityInterval repairable = mk(1, SourceType::Automatic, at(10), at(9), "Editor");
    repairable.storedDurationSeconds = 1800;
    d.push_back(repairable);

    // Without one there is nothing to rebuild from
    d.push_back(mk(2, SourceType::Manual, at(12), at(11), "Broken"));

    std::deque<Defect> defects = validator.validate(d);
    QCOMPARE((int)defects.size(), 2);
    QVERIFY(defects[0].kind == DefectKind::NegativeDuration);
    QVERIFY(defects[0].fix == FixAction::Repair);
    QCOMPARE(defects[0].repairValue.toDateTime(), dt(10, 30));
    QVERIFY(defects[1].kind == DefectKind::NegativeDuration);
    QVERIFY(defects[1].fix == FixAction::Delete);
}

void CleanupValidatorTest::test_cleanup_missingEnd_completedOnly()
{
    Settings settings(createSettingsFile(temp_dir_.path()));
    CleanupValidator validator(settings);
    std::deque<ActivityInterval> d;

    // Still running: fine
    ActivityInterval running = mk(1, SourceType::Manual, at(9), at(9), "Running");
    running.end = QDateTime();
    running.completed = false;
    d.push_back(running);

    // Finished with a duration: end can be derived
    ActivityInterval derivable = mk(2, SourceType::Pomodoro, at(10), at(10), "Focus");
    derivable.end = QDateTime();
    derivable.storedDurationSeconds = 1500;
    d.push_back(derivable);

    // Finished without anything to go on
    ActivityInterval lost = mk(3, SourceType::Pomodoro, at(11), at(11), "Focus");
    lost.end = QDateTime();
    d.push_back(lost);

    std::deque<Defect> defects = validator.validate(d);
    QCOMPARE((int)defects.size(), 2);
    QVERIFY(defects[0].ref == ActivityRef(2, SourceType::Pomodoro));
    QVERIFY(defects[0].kind == DefectKind::MissingEnd);
    QVERIFY(defects[0].fix == FixAction::Repair);
    QCOMPARE(defects[0].repairValue.toDateTime(), dt(10, 25));
    QVERIFY(defects[1].ref == ActivityRef(3, SourceType::Pomodoro));
    QVERIFY(defects[1].fix == FixAction::Delete);
}

void CleanupValidatorTest::test_cleanup_durationMismatch_tolerance()
{
    Settings settings(createSettingsFile(temp_dir_.path()));
    CleanupValidator validator(settings);
    std::deque<ActivityInterval> d;

    ActivityInterval within = mk(1, SourceType::Manual, at(9), at(10), "ok");
    within.storedDurationSeconds = 3601;
    d.push_back(within);

    ActivityInterval off = mk(2, SourceType::Manual, at(10), at(11), "off");
    off.storedDurationSeconds = 3000;
    d.push_back(off);

    ActivityInterval no_column = mk(3, SourceType::Manual, at(11), at(12), "none");
    d.push_back(no_column);

    std::deque<Defect> defects = validator.validate(d);
    QCOMPARE((int)defects.size(), 1);
    QVERIFY(defects[0].ref == ActivityRef(2, SourceType::Manual));
    QVERIFY(defects[0].kind == DefectKind::DurationMismatch);
    QVERIFY(defects[0].fix == FixAction::Repair);
    QCOMPARE(defects[0].repairValue.toLongLong(), (qint64)3600);

    // A wider tolerance accepts it
    QTemporaryDir dir;
    Settings tolerant(createSettingsFile(dir.path(), {{"duration_tolerance_seconds", 600}}));
    QVERIFY(CleanupValidator(tolerant).validate(d).empty());
}

void CleanupValidatorTest::test_cleanup_orphanedReference()
{
    Settings settings(createSettingsFile(temp_dir_.path()));
    CleanupValidator validator(settings);
    std::deque<ActivityInterval> d;
    ActivityInterval known = mk(1, SourceType::Manual, at(9), at(10), "known");
    known.categoryId = 1;
    d.push_back(known);
    ActivityInterval orphan = mk(2, SourceType::Automatic, at(10), at(11), "orphan");
    orphan.categoryId = 7;
    d.push_back(orphan);
    d.push_back(mk(3, SourceType::Manual, at(11), at(12), "uncategorized"));

    QSet<qint64> categories;
    categories.insert(1);
    std::deque<Defect> defects = validator.validate(d, categories);
    QCOMPARE((int)defects.size(), 1);
    QVERIFY(defects[0].ref == ActivityRef(2, SourceType::Automatic));
    QVERIFY(defects[0].kind == DefectKind::OrphanedReference);
    QVERIFY(defects[0].fix == FixAction::Repair);
    QCOMPARE(defects[0].repairValue.toLongLong(), (qint64)0);

    // Without the category list references are not checked
    QVERIFY(validator.validate(d).empty());
}

void CleanupValidatorTest::test_cleanup_cleanDataHasNoDefects()
{
    Settings settings(createSettingsFile(temp_dir_.path()));
    CleanupValidator validator(settings);
    std::deque<ActivityInterval> d;
    d.push_back(mk(1, SourceType::Manual, at(9), at(10), "a"));
    d.push_back(mk(2, SourceType::Automatic, at(9, 30), at(11), "overlap is not a defect"));

    QVERIFY(validator.validate(d, QSet<qint64>()).empty());
}

void CleanupValidatorTest::test_cleanup_qualityReport()
{
    // Arrange
    Settings settings(createSettingsFile(temp_dir_.path()));
    CleanupValidator validator(settings);
    std::deque<ActivityInterval> d;
    d.push_back(mk(1, SourceType::Manual, at(9), at(10), "a"));
    d.push_back(mk(2, SourceType::Manual, at(10), at(10), "zero"));
    ActivityInterval both = mk(3, SourceType::Manual, at(12), at(11), "negative and orphaned");
    both.categoryId = 9;
    d.push_back(both);
    ActivityInterval mismatch = mk(4, SourceType::Manual, at(13), at(14), "mismatch");
    mismatch.storedDurationSeconds = 10;
    d.push_back(mismatch);

    std::deque<TimeGap> gaps;
    gaps.emplace_back(dt(14), dt(17));
    ConflictGroup duplicate;
    duplicate.conflictType = ConflictType::Duplicate;
    ConflictGroup overlap;
    std::deque<ConflictGroup> conflicts = { duplicate, overlap, overlap };

    // Act
    std::deque<Defect> defects = validator.validate(d, QSet<qint64>());
    DataQualityReport report = validator.qualityReport(d, defects, gaps, conflicts);

    // Assert
    QCOMPARE((int)defects.size(), 4);
    QCOMPARE(report.totalActivities, 4);
    QCOMPARE(report.zeroDurationCount, 1);
    QCOMPARE(report.negativeDurationCount, 1);
    QCOMPARE(report.orphanedCount, 1);
    QCOMPARE(report.durationMismatchCount, 1);
    QCOMPARE(report.missingEndCount, 0);
    // Activity 3 counts once, mismatches do not count
    QCOMPARE(report.defectiveActivities, 2);
    QCOMPARE(report.qualityScore, 50);
    QCOMPARE(report.gapsCount, 1);
    QCOMPARE(report.duplicateGroupsCount, 1);
    QCOMPARE(report.overlapGroupsCount, 2);

    // Empty input is perfect
    DataQualityReport empty = validator.qualityReport({}, {}, {}, {});
    QCOMPARE(empty.qualityScore, 100);
    QCOMPARE(empty.totalActivities, 0);
}

void CleanupValidatorTest::test_cleanup_qualityScore_neverNegative()
{
    Settings settings(createSettingsFile(temp_dir_.path()));
    CleanupValidator validator(settings);
    std::deque<ActivityInterval> d;
    d.push_back(mk(1, SourceType::Manual, at(9), at(9), "zero"));
    d.push_back(mk(2, SourceType::Manual, at(10), at(9), "negative"));
    d.push_back(mk(3, SourceType::Manual, at(11), at(12), "fine"));

    DataQualityReport report = validator.qualityReport(d, validator.validate(d), {}, {});
    QCOMPARE(report.defectiveActivities, 2);
    QCOMPARE(report.qualityScore, 33);

    std::deque<ActivityInterval> all_bad;
    all_bad.push_back(mk(1, SourceType::Manual, at(9), at(9), "zero"));
    QCOMPARE(validator.qualityReport(all_bad, validator.validate(all_bad), {}, {}).qualityScore, 0);
}
