#include "test_suites.h"
#include "lookoutlogger.h"

int runAllTestSuites(int& totalTests, int& passedTests) {
    using SuiteRunner = int (*)(int&, int&);
    const SuiteRunner suites[] = {
        runCliArgumentTests,
        runPreviewProtocolTests,
        runTypeInferrerTests,
        runDetectionEngineTests,
        runPreviewControllerTests,
        runProjectWatcherTests,
        runServerInfoTests
    };

    totalTests = 0;
    passedTests = 0;
    int failedTests = 0;

    for (SuiteRunner suite : suites) {
        int suiteTotal = 0;
        int suitePassed = 0;
        failedTests += suite(suiteTotal, suitePassed);
        totalTests += suiteTotal;
        passedTests += suitePassed;
    }

    LookoutLogger::instance().info(QString("\nAll Tests: %1 passed, %2 failed")
        .arg(passedTests)
        .arg(failedTests));

    return failedTests;
}
