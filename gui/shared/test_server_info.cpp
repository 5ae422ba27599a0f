#include "test_suites.h"
#include "test_support.h"
#include "server_info.h"
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

using namespace LookoutCommon;

static QList<TestResult> testResults;

namespace {

DevServer makeServer(ServerType type, quint16 port) {
    DevServer server;
    server.type = type;
    server.port = port;
    server.hmr = supportsHmr(type);
    server.healthy = true;
    server.lastSeen = 1700000000000LL;
    return server;
}

DetectionReport scanReport() {
    DetectionReport report;
    report.projectRoot = "/work/shop";
    report.projectRootExists = true;
    report.inference = TypeInference{ServerType::Vite, "vite.config.ts"};
    report.result.servers = {makeServer(ServerType::Vite, 5173), makeServer(ServerType::Angular, 4200)};
    report.result.scannedPorts = {3000, 5173, 4200};
    report.result.durationMs = 12;
    report.result.timestamp = 1700000000000LL;
    return report;
}

} // namespace

bool testServerLine(TestContext& ctx) {
    QString vite = formatServerLine(makeServer(ServerType::Vite, 5173));
    TEST_ASSERT(ctx, vite.contains("Vite"), "Line should carry the family label");
    TEST_ASSERT(ctx, vite.contains("http://localhost:5173/"), "Line should carry the preview URL");
    TEST_ASSERT(ctx, vite.endsWith("[HMR]"), "HMR servers are marked");

    QString angular = formatServerLine(makeServer(ServerType::Angular, 4200));
    TEST_ASSERT(ctx, angular.contains("Angular"), "Angular label expected");
    TEST_ASSERT(ctx, !angular.contains("[HMR]"), "Servers without HMR are not marked");
    return ctx.passed;
}

bool testServerIdentitiesSorted(TestContext& ctx) {
    DetectionResult result;
    result.servers = {makeServer(ServerType::Vite, 5173), makeServer(ServerType::Angular, 4200),
                      makeServer(ServerType::Custom, 8080)};

    QStringList identities = serverIdentities(result);
    TEST_ASSERT(ctx, identities == QStringList({"angular:4200", "custom:8080", "vite:5173"}),
                QString("Unexpected identities: %1").arg(identities.join(",")));

    DetectionResult reordered;
    reordered.servers = {result.servers[2], result.servers[0], result.servers[1]};
    reordered.servers[0].lastSeen += 5000;
    TEST_ASSERT(ctx, serverIdentities(reordered) == identities,
                "Order and timestamps do not change the identity set");

    TEST_ASSERT(ctx, serverIdentities(DetectionResult()).isEmpty(), "No servers, no identities");
    return ctx.passed;
}

bool testFullScanReport(TestContext& ctx) {
    DetectionReport report = scanReport();
    QString text = generateDetectionReport(report);

    TEST_ASSERT(ctx, text.contains("Lookout Dev Server Scan"), "Full scan title expected");
    TEST_ASSERT(ctx, text.contains("/work/shop"), "Project root expected");
    TEST_ASSERT(ctx, !text.contains("(not found)"), "Existing root is not flagged");
    TEST_ASSERT(ctx, text.contains("Vite (vite.config.ts)"), "Hinted family and marker expected");
    TEST_ASSERT(ctx, text.contains("http://localhost:5173/") && text.contains("http://localhost:4200/"),
                "Every server should be listed");
    TEST_ASSERT(ctx, text.contains("3 port(s) in 12ms"), "Scan size and duration expected");
    TEST_ASSERT(ctx, !text.contains("Ports:"), "Port list only in verbose mode");

    QString verbose = generateDetectionReport(report, true);
    TEST_ASSERT(ctx, verbose.contains("3000, 5173, 4200"), "Verbose report lists scanned ports");
    return ctx.passed;
}

bool testEmptyScanReport(TestContext& ctx) {
    DetectionReport report;
    report.projectRoot = "/missing";
    report.projectRootExists = false;
    report.result.scannedPorts = {3000};

    QString text = generateDetectionReport(report);
    TEST_ASSERT(ctx, text.contains("(not found)"), "Missing root is flagged");
    TEST_ASSERT(ctx, text.contains("no dev server detected"), "Empty scan says so");
    TEST_ASSERT(ctx, text.contains("unknown"), "No inference means unknown family");
    return ctx.passed;
}

bool testQuickReport(TestContext& ctx) {
    DetectionReport report;
    report.projectRoot = "/work/shop";
    report.projectRootExists = true;
    report.quick = true;

    QString miss = generateDetectionReport(report);
    TEST_ASSERT(ctx, miss.contains("Lookout Quick Detect"), "Quick title expected");
    TEST_ASSERT(ctx, miss.contains("no dev server detected"), "Quick miss says so");
    TEST_ASSERT(ctx, !miss.contains("Scanned:"), "Quick detect has no scan summary");

    report.quickHit = makeServer(ServerType::NextJs, 3000);
    QString hit = generateDetectionReport(report);
    TEST_ASSERT(ctx, hit.contains("Next.js") && hit.contains("http://localhost:3000/"), "Quick hit listed");
    return ctx.passed;
}

bool testJsonReport(TestContext& ctx) {
    DetectionReport report = scanReport();
    QJsonDocument doc = QJsonDocument::fromJson(generateJsonReport(report).toUtf8());
    TEST_REQUIRE(ctx, doc.isObject(), "Full scan JSON should be an object");

    QJsonObject obj = doc.object();
    TEST_ASSERT(ctx, obj["servers"].toArray().size() == 2, "Both servers serialized");
    TEST_ASSERT(ctx, obj["scannedPorts"].toArray().size() == 3, "Scanned ports serialized");
    TEST_ASSERT(ctx, obj["duration"].toInt() == 12, "Duration serialized");
    TEST_ASSERT(ctx, obj["servers"].toArray()[0].toObject()["type"].toString() == "vite", "Type id serialized");

    DetectionReport quick;
    quick.quick = true;
    TEST_ASSERT(ctx, generateJsonReport(quick) == "null", "Quick miss is null");

    quick.quickHit = makeServer(ServerType::Vite, 5173);
    QJsonDocument hit = QJsonDocument::fromJson(generateJsonReport(quick).toUtf8());
    TEST_REQUIRE(ctx, hit.isObject(), "Quick hit JSON should be an object");
    TEST_ASSERT(ctx, hit.object()["port"].toInt() == 5173, "Quick hit port serialized");
    TEST_ASSERT(ctx, hit.object()["hmr"].toBool(), "Quick hit HMR flag serialized");
    return ctx.passed;
}

int runServerInfoTests(int& totalTests, int& passedTests) {
    LookoutLogger::instance().info("\n[Report Tests]");

    testResults.clear();

    RUN_TEST(testServerLine);
    RUN_TEST(testServerIdentitiesSorted);
    RUN_TEST(testFullScanReport);
    RUN_TEST(testEmptyScanReport);
    RUN_TEST(testQuickReport);
    RUN_TEST(testJsonReport);

    return summarizeSuite("Report Tests", testResults, totalTests, passedTests);
}
