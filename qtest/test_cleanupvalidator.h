#ifndef TEST_CLEANUPVALIDATOR_H
#define TEST_CLEANUPVALIDATOR_H

#include <QObject>
#include "testcommon.h"

class CleanupValidatorTest : public QObject
{
    Q_OBJECT

private:
    QTemporaryDir temp_dir_;

private slots:
    void test_cleanup_zeroDuration_flaggedAndExcludedFromGaps();
    void test_cleanup_negativeDuration_repairOrDelete();
    void test_cleanup_missingEnd_completedOnly();
    void test_cleanup_durationMismatch_tolerance();
    void test_cleanup_orphanedReference();
    void test_cleanup_cleanDataHasNoDefects();
    void test_cleanup_qualityReport();
    void test_cleanup_qualityScore_neverNegative();
};

#endif // TEST_CLEANUPVALIDATOR_H
