#include "test_harness.h"
#include "test_suites.h"
#include "fakecdpserver.h"
#include "../cdp/targetresolver.h"
#include <QTcpServer>
#include <QHostAddress>

namespace {

CdpTarget makeTarget(const QString& id, const QString& type, const QString& title, const QString& url = QString()) {
    CdpTarget target;
    target.id = id;
    target.type = type;
    target.title = title;
    target.url = url;
    return target;
}

}

bool testSelectsProductWindow(TestContext& ctx) {
    QList<CdpTarget> targets = {
        makeTarget("1", "page", "Foo - Bar - x.ts"),
        makeTarget("2", "page", "Launchpad - Bar"),
        makeTarget("3", "devtools", "DevTools", "devtools://devtools/bundled/inspector.html")
    };

    auto selected = TargetResolver::selectEditorTarget(targets, "Bar");
    TEST_REQUIRE(ctx, selected.has_value(), "A target should be selected");
    TEST_ASSERT(ctx, selected->id == "1", "The editor window should win");

    for (int i = 0; i < 3; ++i) {
        auto again = TargetResolver::selectEditorTarget(targets, "Bar");
        TEST_ASSERT(ctx, again && again->id == "1", "Selection should be deterministic");
    }
    return ctx.passed;
}

bool testSkipsSecondaryWindowAndInspector(TestContext& ctx) {
    QList<CdpTarget> targets = {
        makeTarget("launch", "page", "Launchpad - Bar"),
        makeTarget("inspect", "page", "Bar inspector", "devtools://devtools/inspector.html"),
        makeTarget("editor", "page", "Demo - Bar - main.cpp")
    };

    auto selected = TargetResolver::selectEditorTarget(targets, "Bar");
    TEST_REQUIRE(ctx, selected.has_value(), "A target should be selected");
    TEST_ASSERT(ctx, selected->id == "editor", "Secondary and inspector windows should be skipped");
    return ctx.passed;
}

bool testFallsBackToFirstPage(TestContext& ctx) {
    QList<CdpTarget> targets = {
        makeTarget("worker", "service_worker", "Bar worker"),
        makeTarget("first", "page", "Untitled"),
        makeTarget("second", "page", "Other")
    };

    auto selected = TargetResolver::selectEditorTarget(targets, "Bar");
    TEST_REQUIRE(ctx, selected.has_value(), "A page should be selected");
    TEST_ASSERT(ctx, selected->id == "first", "First page should be the fallback");
    return ctx.passed;
}

bool testNoPageMeansNone(TestContext& ctx) {
    QList<CdpTarget> targets = {
        makeTarget("w", "service_worker", "Bar"),
        makeTarget("d", "devtools", "Bar")
    };
    TEST_ASSERT(ctx, !TargetResolver::selectEditorTarget(targets, "Bar").has_value(), "No page should yield none");
    TEST_ASSERT(ctx, !TargetResolver::selectEditorTarget({}, "Bar").has_value(), "Empty list should yield none");
    return ctx.passed;
}

bool testParseTargetList(TestContext& ctx) {
    QByteArray body = R"([{"id":"A","title":"Demo - Bar","url":"file:///w.html","type":"page",
                          "webSocketDebuggerUrl":"ws://127.0.0.1:9222/devtools/page/A"}])";
    QString error;
    QList<CdpTarget> targets = TargetResolver::parseTargetList(body, &error);
    TEST_ASSERT(ctx, error.isEmpty(), "Valid list should parse");
    TEST_REQUIRE(ctx, targets.size() == 1, "One target expected");
    TEST_ASSERT(ctx, targets.first().webSocketDebuggerUrl == "ws://127.0.0.1:9222/devtools/page/A",
                "Debugger URL should be read");

    QString badError;
    QList<CdpTarget> bad = TargetResolver::parseTargetList("{\"not\":\"a list\"}", &badError);
    TEST_ASSERT(ctx, bad.isEmpty(), "Non-array body should yield no targets");
    TEST_ASSERT(ctx, !badError.isEmpty(), "Non-array body should report an error");
    return ctx.passed;
}

bool testResolveAgainstEndpoint(TestContext& ctx) {
    FakeCdpServer server;
    TEST_REQUIRE(ctx, server.start(), "Fake endpoint should start");
    server.addPageTarget("launch", "Launchpad - Antigravity");
    server.addPageTarget("editor", "Demo - Antigravity - index.ts");

    TargetResolver resolver("127.0.0.1", server.httpPort(), "Antigravity");

    bool done = false;
    std::optional<CdpTarget> resolved;
    QString resolveError;
    resolver.resolveEditorTarget([&](const std::optional<CdpTarget>& target, const QString& error) {
        done = true;
        resolved = target;
        resolveError = error;
    });

    TEST_REQUIRE(ctx, waitFor([&]() { return done; }), "Resolution should complete");
    TEST_ASSERT(ctx, resolveError.isEmpty(), "No error expected");
    TEST_REQUIRE(ctx, resolved.has_value(), "Editor target should resolve");
    TEST_ASSERT(ctx, resolved->id == "editor", "Editor window should be chosen");
    TEST_ASSERT(ctx, resolved->webSocketDebuggerUrl == server.debuggerUrl("editor"), "Endpoint should be advertised");

    // Nothing is cached between resolutions
    done = false;
    resolver.resolveEditorTarget([&](const std::optional<CdpTarget>&, const QString&) { done = true; });
    TEST_REQUIRE(ctx, waitFor([&]() { return done; }), "Second resolution should complete");
    TEST_ASSERT(ctx, server.httpRequestCount() == 2, "Each resolution should fetch a fresh list");
    return ctx.passed;
}

bool testFetchVersion(TestContext& ctx) {
    FakeCdpServer server;
    TEST_REQUIRE(ctx, server.start(), "Fake endpoint should start");
    server.setVersion(QJsonObject{{"Browser", "Chrome/131.0.0.0"}});

    TargetResolver resolver("127.0.0.1", server.httpPort(), "Antigravity");
    bool done = false;
    QJsonObject version;
    resolver.fetchVersion([&](const QJsonObject& result, const QString&) {
        done = true;
        version = result;
    });

    TEST_REQUIRE(ctx, waitFor([&]() { return done; }), "Version fetch should complete");
    TEST_ASSERT(ctx, version["Browser"].toString() == "Chrome/131.0.0.0", "Browser should be reported");
    return ctx.passed;
}

bool testUnreachableEndpointReportsError(TestContext& ctx) {
    QTcpServer portFinder;
    TEST_REQUIRE(ctx, portFinder.listen(QHostAddress::LocalHost, 0), "Port finder should bind");
    quint16 unusedPort = portFinder.serverPort();
    portFinder.close();

    TargetResolver resolver("127.0.0.1", unusedPort, "Antigravity");
    bool done = false;
    std::optional<CdpTarget> resolved;
    QString resolveError;
    resolver.resolveEditorTarget([&](const std::optional<CdpTarget>& target, const QString& error) {
        done = true;
        resolved = target;
        resolveError = error;
    });

    TEST_REQUIRE(ctx, waitFor([&]() { return done; }), "Resolution should complete");
    TEST_ASSERT(ctx, !resolved.has_value(), "No target should resolve");
    TEST_ASSERT(ctx, !resolveError.isEmpty(), "Transport failure should carry an error");
    return ctx.passed;
}

int runTargetResolverTests(int& totalTests, int& passedTests) {
    BridgeLogger::instance().info("[Target Resolver]");

    testResults.clear();

    RUN_TEST(testSelectsProductWindow);
    RUN_TEST(testSkipsSecondaryWindowAndInspector);
    RUN_TEST(testFallsBackToFirstPage);
    RUN_TEST(testNoPageMeansNone);
    RUN_TEST(testParseTargetList);
    RUN_TEST(testResolveAgainstEndpoint);
    RUN_TEST(testFetchVersion);
    RUN_TEST(testUnreachableEndpointReportsError);

    return summarizeSuite("Target Resolver Tests", totalTests, passedTests);
}
