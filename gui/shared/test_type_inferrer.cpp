#include "test_suites.h"
#include "test_support.h"
#include "type_inferrer.h"
#include "preview_types.h"
#include <QDir>
#include <QFile>
#include <QTemporaryDir>

using namespace LookoutCommon;

static QList<TestResult> testResults;

namespace {

bool touch(const QTemporaryDir& dir, const QString& name, const QByteArray& content = QByteArray()) {
    QFile file(dir.filePath(name));
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return false;
    }
    return file.write(content) == content.size();
}

TypeInferrer defaultInferrer() {
    return TypeInferrer(DetectionConfig::defaultMarkerFiles());
}

} // namespace

bool testViteConfigMarker(TestContext& ctx) {
    QTemporaryDir dir;
    TEST_REQUIRE(ctx, dir.isValid(), "Temporary directory required");
    TEST_REQUIRE(ctx, touch(dir, "vite.config.ts"), "Marker should be written");

    auto inference = defaultInferrer().inspect(dir.path());
    TEST_REQUIRE(ctx, inference.has_value(), "Vite project should be recognized");
    TEST_ASSERT(ctx, inference->type == ServerType::Vite, "Type should be vite");
    TEST_ASSERT(ctx, inference->markerFile == "vite.config.ts", "Marker file should be reported");
    return ctx.passed;
}

bool testPriorityOrderWins(TestContext& ctx) {
    QTemporaryDir dir;
    TEST_REQUIRE(ctx, dir.isValid(), "Temporary directory required");
    TEST_REQUIRE(ctx, touch(dir, "svelte.config.js") && touch(dir, "vite.config.js") &&
                      touch(dir, "webpack.config.js"),
                 "Markers should be written");

    auto type = defaultInferrer().inferFromProject(dir.path());
    TEST_ASSERT(ctx, type == ServerType::Vite, "Vite outranks SvelteKit and Webpack");
    return ctx.passed;
}

bool testNextBeforeAngular(TestContext& ctx) {
    QTemporaryDir dir;
    TEST_REQUIRE(ctx, dir.isValid(), "Temporary directory required");
    TEST_REQUIRE(ctx, touch(dir, "angular.json") && touch(dir, "next.config.mjs"), "Markers should be written");

    TEST_ASSERT(ctx, defaultInferrer().inferFromProject(dir.path()) == ServerType::NextJs,
                "Next.js outranks Angular");
    return ctx.passed;
}

bool testPackageJsonNeedsMatchingScript(TestContext& ctx) {
    QTemporaryDir dir;
    TEST_REQUIRE(ctx, dir.isValid(), "Temporary directory required");
    TEST_REQUIRE(ctx, touch(dir, "package.json", R"({"scripts": {"dev": "node server.js", "test": "jest"}})"),
                 "package.json should be written");

    TEST_ASSERT(ctx, !defaultInferrer().inspect(dir.path()).has_value(),
                "A plain package.json says nothing about the family");
    return ctx.passed;
}

bool testPackageJsonReactScripts(TestContext& ctx) {
    QTemporaryDir dir;
    TEST_REQUIRE(ctx, dir.isValid(), "Temporary directory required");
    TEST_REQUIRE(ctx, touch(dir, "package.json", R"({"scripts": {"start": "react-scripts start"}})"),
                 "package.json should be written");

    auto inference = defaultInferrer().inspect(dir.path());
    TEST_REQUIRE(ctx, inference.has_value(), "react-scripts project should be recognized");
    TEST_ASSERT(ctx, inference->type == ServerType::ReactScripts, "Type should be react-scripts");
    TEST_ASSERT(ctx, inference->markerFile == "package.json", "package.json decided the match");
    return ctx.passed;
}

bool testPackageJsonParcel(TestContext& ctx) {
    QTemporaryDir dir;
    TEST_REQUIRE(ctx, dir.isValid(), "Temporary directory required");
    TEST_REQUIRE(ctx, touch(dir, "package.json", R"({"scripts": {"dev": "parcel src/index.html"}})"),
                 "package.json should be written");

    TEST_ASSERT(ctx, defaultInferrer().inferFromProject(dir.path()) == ServerType::Parcel,
                "parcel script should select Parcel");
    return ctx.passed;
}

bool testBrokenPackageJsonIgnored(TestContext& ctx) {
    QTemporaryDir dir;
    TEST_REQUIRE(ctx, dir.isValid(), "Temporary directory required");
    TEST_REQUIRE(ctx, touch(dir, "package.json", "{ \"scripts\": "), "package.json should be written");
    TEST_REQUIRE(ctx, touch(dir, "webpack.config.js"), "Marker should be written");

    TEST_ASSERT(ctx, defaultInferrer().inferFromProject(dir.path()) == ServerType::Webpack,
                "Unreadable package.json falls through to later families");
    TEST_ASSERT(ctx, !TypeInferrer::packageScriptsMatch(dir.filePath("package.json"), ServerType::ReactScripts),
                "Unparseable package.json never matches");
    TEST_ASSERT(ctx, !TypeInferrer::packageScriptsMatch(dir.filePath("missing.json"), ServerType::ReactScripts),
                "Missing package.json never matches");
    return ctx.passed;
}

bool testNoRootOrNoMarkers(TestContext& ctx) {
    TypeInferrer inferrer = defaultInferrer();
    TEST_ASSERT(ctx, !inferrer.inspect(QString()).has_value(), "Empty root has no family");
    TEST_ASSERT(ctx, !inferrer.inspect("/nonexistent/lookout/project").has_value(), "Missing root has no family");

    QTemporaryDir dir;
    TEST_REQUIRE(ctx, dir.isValid(), "Temporary directory required");
    TEST_REQUIRE(ctx, touch(dir, "README.md"), "File should be written");
    TEST_ASSERT(ctx, !inferrer.inspect(dir.path()).has_value(), "Unrelated files have no family");
    return ctx.passed;
}

bool testCustomMarkerTable(TestContext& ctx) {
    QTemporaryDir dir;
    TEST_REQUIRE(ctx, dir.isValid(), "Temporary directory required");
    TEST_REQUIRE(ctx, touch(dir, "astro.config.mts"), "Marker should be written");

    TEST_ASSERT(ctx, !defaultInferrer().inspect(dir.path()).has_value(), "Not a default Astro marker");

    QMap<ServerType, QStringList> markers = DetectionConfig::defaultMarkerFiles();
    markers[ServerType::Astro] << "astro.config.mts";
    TEST_ASSERT(ctx, TypeInferrer(markers).inferFromProject(dir.path()) == ServerType::Astro,
                "Configured markers extend the table");
    return ctx.passed;
}

bool testHeaderFallback(TestContext& ctx) {
    TEST_ASSERT(ctx, TypeInferrer::inferFromHeaders("Vite", QString()) == ServerType::Vite, "Server: Vite");
    TEST_ASSERT(ctx, TypeInferrer::inferFromHeaders(QString(), "Next.js") == ServerType::NextJs,
                "X-Powered-By: Next.js");
    TEST_ASSERT(ctx, TypeInferrer::inferFromHeaders("nginx", "Express") == ServerType::Custom, "Anything else");
    TEST_ASSERT(ctx, TypeInferrer::inferFromHeaders(QString(), QString()) == ServerType::Custom, "No headers");
    return ctx.passed;
}

int runTypeInferrerTests(int& totalTests, int& passedTests) {
    LookoutLogger::instance().info("\n[Type Inference Tests]");

    testResults.clear();

    RUN_TEST(testViteConfigMarker);
    RUN_TEST(testPriorityOrderWins);
    RUN_TEST(testNextBeforeAngular);
    RUN_TEST(testPackageJsonNeedsMatchingScript);
    RUN_TEST(testPackageJsonReactScripts);
    RUN_TEST(testPackageJsonParcel);
    RUN_TEST(testBrokenPackageJsonIgnored);
    RUN_TEST(testNoRootOrNoMarkers);
    RUN_TEST(testCustomMarkerTable);
    RUN_TEST(testHeaderFallback);

    return summarizeSuite("Type Inference Tests", testResults, totalTests, passedTests);
}
