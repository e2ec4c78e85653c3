#include <QCoreApplication>
#include <QtTest>

// Forward declarations of all test classes
class SettingsTest;
class HelpersTest;
class ActivityRecordsTest;
class GapDetectorTest;
class ConflictDetectorTest;
class ConflictResolverTest;
class CleanupValidatorTest;
class ActivityStoreTest;
class IntegrationTest;

// Include test class headers
#include "test_settings.h"
#include "test_helpers.h"
#include "test_activityrecords.h"
#include "test_gapdetector.h"
#include "test_conflictdetector.h"
#include "test_conflictresolver.h"
#include "test_cleanupvalidator.h"
#include "test_activitystore.h"
#include "test_integration.h"

// Test runner main function
// Executes all test suites sequentially using QTest::qExec()
// Returns non-zero exit code if any test suite fails
int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    int status = 0;

    // Lambda to run a test suite and track failures
    auto runTest = [&](auto* test, const char* name) {
        qDebug() << "\n================" << name << "================";
        int result = QTest::qExec(test, argc, argv);
        delete test;
        if (result != 0) {
            status = result;
        }
        return result;
    };

    // Run test suites
    runTest(new SettingsTest, "SettingsTest");
    runTest(new HelpersTest, "HelpersTest");
    runTest(new ActivityRecordsTest, "ActivityRecordsTest");
    runTest(new GapDetectorTest, "GapDetectorTest");
    runTest(new ConflictDetectorTest, "ConflictDetectorTest");
    runTest(new ConflictResolverTest, "ConflictResolverTest");
    runTest(new CleanupValidatorTest, "CleanupValidatorTest");
    runTest(new ActivityStoreTest, "ActivityStoreTest");
    runTest(new IntegrationTest, "IntegrationTest");

    qDebug() << "\n================ All Tests Complete ================";
    return status;
}
