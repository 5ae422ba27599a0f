#ifndef LOOKOUT_TEST_SUITES_H
#define LOOKOUT_TEST_SUITES_H

// Each runner returns the number of failed tests
int runCliArgumentTests(int& totalTests, int& passedTests);
int runPreviewProtocolTests(int& totalTests, int& passedTests);
int runTypeInferrerTests(int& totalTests, int& passedTests);
int runDetectionEngineTests(int& totalTests, int& passedTests);
int runPreviewControllerTests(int& totalTests, int& passedTests);
int runProjectWatcherTests(int& totalTests, int& passedTests);
int runServerInfoTests(int& totalTests, int& passedTests);

// Runs every suite above and sums their counts
int runAllTestSuites(int& totalTests, int& passedTests);

#endif // LOOKOUT_TEST_SUITES_H
