#include <iostream>
#include <QCoreApplication>
#include "shared/lookoutlogger.h"
#include "shared/common.h"
#include "shared/qt_message_handler.h"
#include "shared/test_suites.h"

using namespace LookoutCommon;

int main(int argc, char *argv[]) {
    QCoreApplication app(argc, argv);
    app.setApplicationName("lookout-tests");

    setupConsoleOutput();
    LookoutLogger::initialize("tests");
    installQtMessageHandler();

    int totalTests = 0;
    int passedTests = 0;
    int failedTests = runAllTestSuites(totalTests, passedTests);

    std::cout << "lookout-tests: " << passedTests << "/" << totalTests << " passed";
    if (failedTests > 0) {
        std::cout << ", " << failedTests << " failed (see "
                  << LookoutLogger::instance().currentSessionPath().toStdString() << ")";
    }
    std::cout << "\n";

    LookoutLogger::instance().flush();
    return failedTests == 0 ? 0 : 1;
}
