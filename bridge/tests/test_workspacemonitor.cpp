#include "test_harness.h"
#include "test_suites.h"
#include "fakescraper.h"
#include "../core/workspacemonitor.h"

namespace {

struct EventRecorder {
    QList<ChangeEvent> events;

    explicit EventRecorder(EventChannel& channel) {
        QObject::connect(&channel, &EventChannel::eventPosted, [this](const ChangeEvent& event) {
            events.append(event);
        });
    }

    int count(const QString& kind) const {
        int total = 0;
        for (const ChangeEvent& event : events) {
            if (event.kind == kind) {
                total++;
            }
        }
        return total;
    }
};

}

bool testFailedPollsKeepCurrentPath(TestContext& ctx) {
    FakeScraper scraper;
    EventChannel channel;
    EventRecorder recorder(channel);
    WorkspaceMonitor monitor(scraper, &channel, "/home/dev/initial");

    monitor.pollOnce();
    monitor.pollOnce();
    monitor.pollOnce();

    TEST_ASSERT(ctx, monitor.state().consecutiveFailureCount == 3, "Three failures should be counted");
    TEST_ASSERT(ctx, monitor.currentPath() == "/home/dev/initial", "Current path must not change on failure");
    TEST_ASSERT(ctx, monitor.state().lastKnownGoodPath == "/home/dev/initial", "Last known good path should stay");

    scraper.workspaceResults.append(FakeScraper::found("/home/dev/demo"));
    monitor.pollOnce();
    waitMs(20);

    TEST_ASSERT(ctx, monitor.state().consecutiveFailureCount == 0, "Success should reset the failure count");
    TEST_ASSERT(ctx, monitor.currentPath() == "/home/dev/demo", "Current path should move");
    TEST_ASSERT(ctx, monitor.state().lastKnownGoodPath == "/home/dev/demo", "Last known good path should move");
    TEST_ASSERT(ctx, recorder.count("workspace_changed") == 1, "Exactly one workspace_changed expected");
    TEST_REQUIRE(ctx, !recorder.events.isEmpty(), "An event should be recorded");
    TEST_ASSERT(ctx, recorder.events.first().payload["path"].toString() == "/home/dev/demo", "Payload should carry the path");
    TEST_ASSERT(ctx, recorder.events.first().payload["projectName"].toString() == "demo", "Payload should carry the project");
    return ctx.passed;
}

bool testUnchangedDetectionIsSilent(TestContext& ctx) {
    FakeScraper scraper;
    EventChannel channel;
    EventRecorder recorder(channel);
    WorkspaceMonitor monitor(scraper, &channel, "/home/dev/demo");

    scraper.workspaceResults.append(FakeScraper::notFound());
    scraper.workspaceResults.append(FakeScraper::found("/home/dev/demo"));
    monitor.pollOnce();
    monitor.pollOnce();
    waitMs(20);

    TEST_ASSERT(ctx, monitor.state().consecutiveFailureCount == 0, "Any successful detection resets the count");
    TEST_ASSERT(ctx, recorder.events.isEmpty(), "Same path should not emit");
    return ctx.passed;
}

bool testFailureAfterSuccessKeepsPath(TestContext& ctx) {
    FakeScraper scraper;
    EventChannel channel;
    WorkspaceMonitor monitor(scraper, &channel, QString());

    scraper.workspaceResults.append(FakeScraper::found("/home/dev/alpha"));
    scraper.workspaceResults.append(FakeScraper::notFound());
    monitor.pollOnce();
    monitor.pollOnce();

    TEST_ASSERT(ctx, monitor.currentPath() == "/home/dev/alpha", "Failure must not revert the path");
    TEST_ASSERT(ctx, monitor.state().lastKnownGoodPath == "/home/dev/alpha", "Last known good is sticky");
    TEST_ASSERT(ctx, monitor.state().consecutiveFailureCount == 1, "Failure should be counted");
    return ctx.passed;
}

bool testStartTwiceIsIdempotent(TestContext& ctx) {
    FakeScraper scraper;
    EventChannel channel;
    WorkspaceMonitor monitor(scraper, &channel, "/home/dev/demo");
    monitor.setInterval(60);

    monitor.start();
    monitor.start();
    TEST_ASSERT(ctx, monitor.isActive(), "Monitor should be active");
    TEST_ASSERT(ctx, scraper.workspaceCalls == 1, "Only one immediate poll should run");

    waitMs(200);
    int polls = scraper.workspaceCalls;
    TEST_ASSERT(ctx, polls >= 2 && polls <= 5, QString("A single timer should drive polling (saw %1)").arg(polls));

    monitor.stop();
    TEST_ASSERT(ctx, !monitor.isActive(), "Stop should cancel the timer");
    int afterStop = scraper.workspaceCalls;
    waitMs(150);
    TEST_ASSERT(ctx, scraper.workspaceCalls == afterStop, "No polls after stop");
    return ctx.passed;
}

bool testOverlappingPollSkipped(TestContext& ctx) {
    FakeScraper scraper;
    scraper.holdWorkspace = true;
    EventChannel channel;
    WorkspaceMonitor monitor(scraper, &channel, "/home/dev/demo");

    monitor.pollOnce();
    TEST_ASSERT(ctx, monitor.isPolling(), "First poll should be in flight");
    monitor.pollOnce();
    TEST_ASSERT(ctx, scraper.workspaceCalls == 1, "Overlapping poll should be skipped, not queued");

    scraper.workspaceResults.append(FakeScraper::found("/home/dev/next"));
    scraper.releaseWorkspace();
    TEST_ASSERT(ctx, !monitor.isPolling(), "Poll should finish once detection resolves");
    TEST_ASSERT(ctx, monitor.currentPath() == "/home/dev/next", "Held result should be applied");

    monitor.pollOnce();
    TEST_ASSERT(ctx, scraper.workspaceCalls == 2, "Next poll should run after the previous one resolved");
    scraper.releaseWorkspace();
    return ctx.passed;
}

bool testCaseSensitivity(TestContext& ctx) {
    FakeScraper scraper;
    EventChannel channel;
    EventRecorder recorder(channel);
    WorkspaceMonitor monitor(scraper, &channel, "C:\\Users\\A\\Demo");

    monitor.setCaseSensitive(false);
    scraper.workspaceResults.append(FakeScraper::found("c:\\users\\a\\demo"));
    monitor.pollOnce();
    waitMs(20);
    TEST_ASSERT(ctx, recorder.events.isEmpty(), "Case-only difference should be ignored when insensitive");
    TEST_ASSERT(ctx, monitor.currentPath() == "C:\\Users\\A\\Demo", "Path should be kept as is");

    monitor.setCaseSensitive(true);
    scraper.workspaceResults.append(FakeScraper::found("c:\\users\\a\\demo"));
    monitor.pollOnce();
    waitMs(20);
    TEST_ASSERT(ctx, recorder.count("workspace_changed") == 1, "Case difference should count when sensitive");
    return ctx.passed;
}

bool testDoubledBackslashesCollapsed(TestContext& ctx) {
    FakeScraper scraper;
    EventChannel channel;
    WorkspaceMonitor monitor(scraper, &channel, QString());

    scraper.workspaceResults.append(FakeScraper::found("C:\\\\Users\\\\a\\\\Demo"));
    monitor.pollOnce();
    TEST_ASSERT(ctx, monitor.currentPath() == "C:\\Users\\a\\Demo", "Escaped separators should be collapsed");
    return ctx.passed;
}

bool testFailureLogBackoff(TestContext& ctx) {
    TEST_ASSERT(ctx, WorkspaceMonitor::shouldLogFailure(1), "First failure is logged");
    TEST_ASSERT(ctx, WorkspaceMonitor::shouldLogFailure(3), "Third failure is logged");
    TEST_ASSERT(ctx, !WorkspaceMonitor::shouldLogFailure(4), "Fourth failure is quiet");
    TEST_ASSERT(ctx, !WorkspaceMonitor::shouldLogFailure(9), "Ninth failure is quiet");
    TEST_ASSERT(ctx, WorkspaceMonitor::shouldLogFailure(10), "Tenth failure is logged");
    TEST_ASSERT(ctx, WorkspaceMonitor::shouldLogFailure(30), "Every tenth failure is logged");
    return ctx.passed;
}

int runWorkspaceMonitorTests(int& totalTests, int& passedTests) {
    BridgeLogger::instance().info("[Workspace Monitor]");

    testResults.clear();

    RUN_TEST(testFailedPollsKeepCurrentPath);
    RUN_TEST(testUnchangedDetectionIsSilent);
    RUN_TEST(testFailureAfterSuccessKeepsPath);
    RUN_TEST(testStartTwiceIsIdempotent);
    RUN_TEST(testOverlappingPollSkipped);
    RUN_TEST(testCaseSensitivity);
    RUN_TEST(testDoubledBackslashesCollapsed);
    RUN_TEST(testFailureLogBackoff);

    return summarizeSuite("Workspace Monitor Tests", totalTests, passedTests);
}
