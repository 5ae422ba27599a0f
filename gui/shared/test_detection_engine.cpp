#include "test_suites.h"
#include "test_support.h"
#include "detection_engine.h"
#include "preview_types.h"
#include <QFile>
#include <QTemporaryDir>
#include <memory>

using namespace LookoutCommon;

static QList<TestResult> testResults;

namespace {

// Engine wired to a fake prober and a manual clock
struct EngineFixture {
    explicit EngineFixture(const QList<quint16>& ports,
                           const QList<quint16>& quickPorts = {3000, 5173, 8080, 4000}) {
        DetectionConfig config = DetectionConfig::defaults();
        config.ports = ports;
        config.quickPorts = quickPorts;

        auto fake = std::make_unique<FakeProber>(&clock);
        prober = fake.get();
        engine = std::make_unique<DetectionEngine>(config, std::move(fake), &clock);
        if (root.isValid()) {
            engine->setProjectRoot(root.path());
        }
    }

    bool addMarker(const QString& name) {
        QFile file(root.filePath(name));
        return file.open(QIODevice::WriteOnly);
    }

    ManualClock clock;
    QTemporaryDir root;
    FakeProber* prober = nullptr;
    std::unique_ptr<DetectionEngine> engine;
};

} // namespace

bool testFullScanCollectsHealthyPorts(TestContext& ctx) {
    EngineFixture fx({3000, 5173, 8080});
    TEST_REQUIRE(ctx, fx.root.isValid(), "Temporary directory required");
    fx.prober->setHealthy(5173, "Vite");
    fx.prober->setHealthy(8080);

    std::optional<DetectionResult> result;
    fx.engine->detectServers([&](const DetectionResult& r) { result = r; });

    TEST_REQUIRE(ctx, result.has_value(), "Callback should fire");
    TEST_ASSERT(ctx, fx.prober->probedPorts.size() == 3, "Every configured port is probed");
    TEST_ASSERT(ctx, result->scannedPorts == (QList<quint16>{3000, 5173, 8080}), "Scanned ports are the full list");
    TEST_REQUIRE(ctx, result->servers.size() == 2, "Two healthy servers expected");
    TEST_ASSERT(ctx, result->servers[0].port == 5173 && result->servers[0].type == ServerType::Vite,
                "Vite server from the header");
    TEST_ASSERT(ctx, result->servers[1].port == 8080 && result->servers[1].type == ServerType::Custom,
                "Unknown server is custom");
    TEST_ASSERT(ctx, result->servers[0].healthy && result->servers[0].path == "/", "Servers are healthy at /");
    return ctx.passed;
}

bool testScanWaitsForEveryProbe(TestContext& ctx) {
    EngineFixture fx({3000, 4000, 5000});
    TEST_REQUIRE(ctx, fx.root.isValid(), "Temporary directory required");
    fx.prober->deferred = true;
    fx.prober->setHealthy(4000);

    int firstCalls = 0;
    int secondCalls = 0;
    DetectionResult first;
    DetectionResult second;
    fx.engine->detectServers([&](const DetectionResult& r) { firstCalls++; first = r; });
    TEST_ASSERT(ctx, fx.engine->isScanning(), "Scan should be in flight");
    TEST_ASSERT(ctx, firstCalls == 0, "No result before probes settle");

    fx.engine->detectServers([&](const DetectionResult& r) { secondCalls++; second = r; });
    TEST_ASSERT(ctx, fx.prober->probedPorts.size() == 3, "A second caller joins the running scan");

    fx.prober->releaseAll();
    TEST_ASSERT(ctx, firstCalls == 1 && secondCalls == 1, "Both callers get exactly one result");
    TEST_ASSERT(ctx, first == second, "Joined callers share the result");
    TEST_ASSERT(ctx, first.servers.size() == 1 && first.servers[0].port == 4000, "Healthy port reported");
    TEST_ASSERT(ctx, !fx.engine->isScanning(), "Scan finished");
    return ctx.passed;
}

bool testResultCachedForFiveSeconds(TestContext& ctx) {
    EngineFixture fx({3000, 8080});
    TEST_REQUIRE(ctx, fx.root.isValid(), "Temporary directory required");
    fx.prober->setHealthy(3000);

    fx.engine->detectServers(nullptr);
    TEST_ASSERT(ctx, fx.engine->hasFreshCache(), "Result should be cached");

    fx.clock.advance(4999);
    int calls = 0;
    fx.engine->detectServers([&](const DetectionResult& r) {
        calls++;
        TEST_ASSERT(ctx, r.servers.size() == 1, "Cached result is served");
    });
    TEST_ASSERT(ctx, calls == 1, "Cache hit answers immediately");
    TEST_ASSERT(ctx, fx.prober->probedPorts.size() == 2, "Cache hit does not probe");

    fx.clock.advance(1);
    TEST_ASSERT(ctx, !fx.engine->hasFreshCache(), "Cache expires at five seconds");
    fx.engine->detectServers(nullptr);
    TEST_ASSERT(ctx, fx.prober->probedPorts.size() == 4, "Expired cache triggers a new scan");
    return ctx.passed;
}

bool testRefreshBypassesCache(TestContext& ctx) {
    EngineFixture fx({3000});
    TEST_REQUIRE(ctx, fx.root.isValid(), "Temporary directory required");

    fx.engine->detectServers(nullptr);
    TEST_ASSERT(ctx, fx.engine->cachedResult().has_value() && fx.engine->cachedResult()->servers.isEmpty(),
                "Empty result is cached");

    fx.prober->setHealthy(3000);
    std::optional<DetectionResult> refreshed;
    fx.engine->refresh([&](const DetectionResult& r) { refreshed = r; });
    TEST_ASSERT(ctx, fx.prober->probedPorts.size() == 2, "Refresh probes again");
    TEST_REQUIRE(ctx, refreshed.has_value(), "Refresh callback fires");
    TEST_ASSERT(ctx, refreshed->servers.size() == 1, "Refresh sees the new server");
    TEST_ASSERT(ctx, fx.engine->cachedResult() && fx.engine->cachedResult()->servers.size() == 1,
                "Refresh result replaces the cache");
    return ctx.passed;
}

bool testRefreshDuringScanSupersedes(TestContext& ctx) {
    EngineFixture fx({3000, 4000});
    TEST_REQUIRE(ctx, fx.root.isValid(), "Temporary directory required");
    fx.prober->deferred = true;

    int scanCalls = 0;
    int refreshCalls = 0;
    fx.engine->detectServers([&](const DetectionResult&) { scanCalls++; });
    fx.engine->refresh([&](const DetectionResult&) { refreshCalls++; });
    TEST_ASSERT(ctx, fx.prober->heldCount() == 4, "Refresh starts its own probes");

    fx.prober->releaseAll();
    TEST_ASSERT(ctx, scanCalls == 1, "Superseded scan still answers its caller");
    TEST_ASSERT(ctx, refreshCalls == 1, "Refresh answers its caller");
    TEST_ASSERT(ctx, !fx.engine->isScanning(), "Nothing left in flight");
    TEST_ASSERT(ctx, fx.engine->hasFreshCache(), "Newest scan is cached");
    return ctx.passed;
}

bool testHmrServersListedFirst(TestContext& ctx) {
    EngineFixture fx({8080, 3000, 9000, 5173});
    TEST_REQUIRE(ctx, fx.root.isValid(), "Temporary directory required");
    fx.prober->setHealthy(8080);
    fx.prober->setHealthy(3000, QString(), "Next.js");
    fx.prober->setHealthy(9000, "nginx");
    fx.prober->setHealthy(5173, "Vite");

    DetectionResult result;
    fx.engine->detectServers([&](const DetectionResult& r) { result = r; });
    TEST_REQUIRE(ctx, result.servers.size() == 4, "Four servers expected");
    TEST_ASSERT(ctx, result.servers[0].port == 3000 && result.servers[0].hmr, "Next.js first");
    TEST_ASSERT(ctx, result.servers[1].port == 5173 && result.servers[1].hmr, "Vite second");
    TEST_ASSERT(ctx, result.servers[2].port == 8080 && !result.servers[2].hmr, "Non-HMR keep scan order");
    TEST_ASSERT(ctx, result.servers[3].port == 9000 && !result.servers[3].hmr, "Non-HMR keep scan order");
    return ctx.passed;
}

bool testProjectMarkerOverridesHeaders(TestContext& ctx) {
    EngineFixture fx({3000, 4200});
    TEST_REQUIRE(ctx, fx.root.isValid(), "Temporary directory required");
    TEST_REQUIRE(ctx, fx.addMarker("angular.json"), "Marker should be written");
    fx.prober->setHealthy(4200, "Vite");

    DetectionResult result;
    fx.engine->detectServers([&](const DetectionResult& r) { result = r; });
    TEST_REQUIRE(ctx, result.servers.size() == 1, "One server expected");
    TEST_ASSERT(ctx, result.servers[0].type == ServerType::Angular, "Project marker decides the type");
    TEST_ASSERT(ctx, !result.servers[0].hmr, "HMR follows the decided type");

    auto inference = fx.engine->inspectProject();
    TEST_ASSERT(ctx, inference && inference->markerFile == "angular.json", "inspectProject reports the marker");
    return ctx.passed;
}

bool testMissingProjectRoot(TestContext& ctx) {
    EngineFixture fx({3000, 5173});
    fx.engine->setProjectRoot(QString());
    fx.prober->setHealthy(3000);

    std::optional<DetectionResult> result;
    fx.engine->detectServers([&](const DetectionResult& r) { result = r; });
    TEST_REQUIRE(ctx, result.has_value(), "Callback fires without a root");
    TEST_ASSERT(ctx, result->servers.isEmpty(), "No servers without a root");
    TEST_ASSERT(ctx, result->scannedPorts == (QList<quint16>{3000, 5173}), "Scanned ports still reported");
    TEST_ASSERT(ctx, fx.prober->probedPorts.isEmpty(), "Nothing is probed");
    TEST_ASSERT(ctx, !fx.engine->hasFreshCache(), "Empty answer is not cached");

    fx.engine->setProjectRoot("/nonexistent/lookout/project");
    result.reset();
    fx.engine->detectServers([&](const DetectionResult& r) { result = r; });
    TEST_ASSERT(ctx, result && result->servers.isEmpty(), "A missing directory behaves like no root");
    return ctx.passed;
}

bool testSetProjectRootClearsCache(TestContext& ctx) {
    EngineFixture fx({3000});
    TEST_REQUIRE(ctx, fx.root.isValid(), "Temporary directory required");
    QTemporaryDir other;
    TEST_REQUIRE(ctx, other.isValid(), "Second directory required");

    fx.engine->detectServers(nullptr);
    TEST_ASSERT(ctx, fx.engine->hasFreshCache(), "Cached after scan");

    fx.engine->setProjectRoot(fx.root.path());
    TEST_ASSERT(ctx, fx.engine->hasFreshCache(), "Same root keeps the cache");

    fx.engine->setProjectRoot(other.path());
    TEST_ASSERT(ctx, !fx.engine->hasFreshCache(), "New root drops the cache");
    return ctx.passed;
}

bool testQuickDetectStopsAtFirstHit(TestContext& ctx) {
    EngineFixture fx({3000, 5173, 8080, 4000});
    TEST_REQUIRE(ctx, fx.root.isValid(), "Temporary directory required");
    fx.prober->setHealthy(5173, "Vite");
    fx.prober->setHealthy(8080);

    std::optional<DevServer> hit;
    int calls = 0;
    fx.engine->quickDetect([&](const std::optional<DevServer>& server) { calls++; hit = server; });
    TEST_ASSERT(ctx, calls == 1, "Callback fires once");
    TEST_REQUIRE(ctx, hit.has_value(), "A server should be found");
    TEST_ASSERT(ctx, hit->port == 5173 && hit->type == ServerType::Vite, "First healthy quick port wins");
    TEST_ASSERT(ctx, fx.prober->probedPorts == (QList<quint16>{3000, 5173}), "Probing stops after the hit");
    TEST_ASSERT(ctx, !fx.engine->hasFreshCache(), "Quick detect leaves the cache alone");
    return ctx.passed;
}

bool testQuickDetectProbesSequentially(TestContext& ctx) {
    EngineFixture fx({3000}, {3000, 5173});
    TEST_REQUIRE(ctx, fx.root.isValid(), "Temporary directory required");
    fx.prober->deferred = true;

    std::optional<DevServer> hit;
    bool answered = false;
    fx.engine->quickDetect([&](const std::optional<DevServer>& server) { answered = true; hit = server; });
    TEST_ASSERT(ctx, fx.prober->heldCount() == 1, "Only one quick probe at a time");

    fx.prober->releaseAll();
    TEST_ASSERT(ctx, !answered && fx.prober->heldCount() == 1, "Next port probed after a miss");

    fx.prober->releaseAll();
    TEST_ASSERT(ctx, answered && !hit.has_value(), "All misses answer with no server");
    TEST_ASSERT(ctx, fx.prober->probedPorts == (QList<quint16>{3000, 5173}), "Quick ports in order");
    return ctx.passed;
}

bool testQuickDetectWithoutRoot(TestContext& ctx) {
    EngineFixture fx({3000});
    fx.engine->setProjectRoot(QString());
    fx.prober->setHealthy(3000);

    bool answered = false;
    std::optional<DevServer> hit;
    fx.engine->quickDetect([&](const std::optional<DevServer>& server) { answered = true; hit = server; });
    TEST_ASSERT(ctx, answered && !hit.has_value(), "No root means no server");
    TEST_ASSERT(ctx, fx.prober->probedPorts.isEmpty(), "Nothing is probed");
    return ctx.passed;
}

bool testDurationAndTimestamps(TestContext& ctx) {
    EngineFixture fx({3000});
    TEST_REQUIRE(ctx, fx.root.isValid(), "Temporary directory required");
    fx.prober->deferred = true;
    fx.prober->setHealthy(3000);
    fx.clock.set(1000);

    DetectionResult result;
    fx.engine->detectServers([&](const DetectionResult& r) { result = r; });
    fx.clock.advance(120);
    fx.prober->releaseAll();

    TEST_ASSERT(ctx, result.durationMs == 120, "Duration measured on the monotonic clock");
    TEST_ASSERT(ctx, result.timestamp == ManualClock::EPOCH_BASE + 1120, "Timestamp is wall clock at completion");
    TEST_REQUIRE(ctx, result.servers.size() == 1, "One server expected");
    TEST_ASSERT(ctx, result.servers[0].lastSeen == ManualClock::EPOCH_BASE + 1120, "lastSeen is the probe time");
    return ctx.passed;
}

bool testDetectionSignals(TestContext& ctx) {
    EngineFixture fx({3000, 4000, 5000});
    TEST_REQUIRE(ctx, fx.root.isValid(), "Temporary directory required");

    int started = -1;
    int finished = 0;
    QObject::connect(fx.engine.get(), &DetectionEngine::scanStarted, [&](int count) { started = count; });
    QObject::connect(fx.engine.get(), &DetectionEngine::detectionFinished,
                     [&](const DetectionResult&) { finished++; });

    fx.engine->detectServers(nullptr);
    TEST_ASSERT(ctx, started == 3, "scanStarted carries the port count");
    TEST_ASSERT(ctx, finished == 1, "detectionFinished fires once per scan");

    fx.engine->detectServers(nullptr);
    TEST_ASSERT(ctx, finished == 1, "Cache hits do not signal");
    return ctx.passed;
}

bool testEmptyPortList(TestContext& ctx) {
    EngineFixture fx({}, {});
    TEST_REQUIRE(ctx, fx.root.isValid(), "Temporary directory required");

    std::optional<DetectionResult> result;
    fx.engine->detectServers([&](const DetectionResult& r) { result = r; });
    TEST_ASSERT(ctx, result && result->servers.isEmpty() && result->scannedPorts.isEmpty(),
                "Nothing to scan completes at once");
    TEST_ASSERT(ctx, !fx.engine->isScanning(), "No scan left running");

    std::optional<DevServer> hit = DevServer();
    fx.engine->quickDetect([&](const std::optional<DevServer>& server) { hit = server; });
    TEST_ASSERT(ctx, !hit.has_value(), "Empty quick list finds nothing");
    return ctx.passed;
}

int runDetectionEngineTests(int& totalTests, int& passedTests) {
    LookoutLogger::instance().info("\n[Detection Engine Tests]");

    testResults.clear();

    RUN_TEST(testFullScanCollectsHealthyPorts);
    RUN_TEST(testScanWaitsForEveryProbe);
    RUN_TEST(testResultCachedForFiveSeconds);
    RUN_TEST(testRefreshBypassesCache);
    RUN_TEST(testRefreshDuringScanSupersedes);
    RUN_TEST(testHmrServersListedFirst);
    RUN_TEST(testProjectMarkerOverridesHeaders);
    RUN_TEST(testMissingProjectRoot);
    RUN_TEST(testSetProjectRootClearsCache);
    RUN_TEST(testQuickDetectStopsAtFirstHit);
    RUN_TEST(testQuickDetectProbesSequentially);
    RUN_TEST(testQuickDetectWithoutRoot);
    RUN_TEST(testDurationAndTimestamps);
    RUN_TEST(testDetectionSignals);
    RUN_TEST(testEmptyPortList);

    return summarizeSuite("Detection Engine Tests", testResults, totalTests, passedTests);
}
