#include "test_harness.h"
#include "test_suites.h"
#include "../core/messagelog.h"
#include <QTemporaryDir>
#include <QFile>

bool testAppendPersists(TestContext& ctx) {
    QTemporaryDir dir;
    TEST_REQUIRE(ctx, dir.isValid(), "Temporary directory should be created");

    MessageLog log(dir.path());
    TEST_ASSERT(ctx, log.load(), "Missing file should load as empty");
    TEST_ASSERT(ctx, log.count() == 0, "Log should start empty");

    QJsonObject message = log.append(QString(), "Build finished", QJsonObject{{"source", "agent"}});
    TEST_ASSERT(ctx, message["type"].toString() == "agent", "Type should default to agent");
    TEST_ASSERT(ctx, !message["timestamp"].toString().isEmpty(), "Timestamp should be added");
    TEST_ASSERT(ctx, message["source"].toString() == "agent", "Extra fields should be kept");
    log.append("mobile_command", "run tests");

    MessageLog reloaded(dir.path());
    TEST_REQUIRE(ctx, reloaded.load(), "Saved log should load");
    TEST_ASSERT(ctx, reloaded.count() == 2, "Both messages should persist");
    TEST_ASSERT(ctx, reloaded.recent(1).first().toObject()["content"].toString() == "run tests",
                "Recent should return the newest messages");
    return ctx.passed;
}

bool testRecentLimits(TestContext& ctx) {
    QTemporaryDir dir;
    TEST_REQUIRE(ctx, dir.isValid(), "Temporary directory should be created");

    MessageLog log(dir.path());
    for (int i = 0; i < 5; ++i) {
        log.append("agent", QString("m%1").arg(i));
    }

    QJsonArray tail = log.recent(3);
    TEST_REQUIRE(ctx, tail.size() == 3, "Limit should be applied");
    TEST_ASSERT(ctx, tail.at(0).toObject()["content"].toString() == "m2", "Tail should start at the right message");
    TEST_ASSERT(ctx, tail.at(2).toObject()["content"].toString() == "m4", "Tail should end at the newest message");
    TEST_ASSERT(ctx, log.recent(0).size() == 5, "Non-positive limit returns everything");
    TEST_ASSERT(ctx, log.recent(50).size() == 5, "Large limit returns everything");
    return ctx.passed;
}

bool testCapAtMaxMessages(TestContext& ctx) {
    QTemporaryDir dir;
    TEST_REQUIRE(ctx, dir.isValid(), "Temporary directory should be created");

    MessageLog log(dir.path());
    for (int i = 0; i < MessageLog::MAX_MESSAGES + 5; ++i) {
        log.append("agent", QString("m%1").arg(i));
    }
    TEST_ASSERT(ctx, log.count() == MessageLog::MAX_MESSAGES, "Log should be capped");
    TEST_ASSERT(ctx, log.recent(MessageLog::MAX_MESSAGES).first().toObject()["content"].toString() == "m5",
                "Oldest messages should be dropped");
    return ctx.passed;
}

bool testMalformedFileIgnored(TestContext& ctx) {
    QTemporaryDir dir;
    TEST_REQUIRE(ctx, dir.isValid(), "Temporary directory should be created");

    QFile file(dir.filePath("messages.json"));
    TEST_REQUIRE(ctx, file.open(QIODevice::WriteOnly), "File should be created");
    file.write("{ not json");
    file.close();

    MessageLog log(dir.path());
    TEST_ASSERT(ctx, !log.load(), "Malformed file should be reported");
    TEST_ASSERT(ctx, log.count() == 0, "Malformed file should leave the log empty");
    return ctx.passed;
}

bool testClearPersists(TestContext& ctx) {
    QTemporaryDir dir;
    TEST_REQUIRE(ctx, dir.isValid(), "Temporary directory should be created");

    MessageLog log(dir.path());
    log.append("agent", "one");
    log.clear();
    TEST_ASSERT(ctx, log.count() == 0, "Clear should empty the log");

    MessageLog reloaded(dir.path());
    TEST_REQUIRE(ctx, reloaded.load(), "Cleared log should load");
    TEST_ASSERT(ctx, reloaded.count() == 0, "Clear should be persisted");
    return ctx.passed;
}

bool testInboxDrainsOnRead(TestContext& ctx) {
    QTemporaryDir dir;
    TEST_REQUIRE(ctx, dir.isValid(), "Temporary directory should be created");

    MessageLog log(dir.path());
    TEST_ASSERT(ctx, log.addToInbox("first") == 1, "Count should be returned");
    TEST_ASSERT(ctx, log.addToInbox("second") == 2, "Count should grow");

    QJsonArray inbox = log.readInbox();
    TEST_ASSERT(ctx, inbox.size() == 2, "All inbox messages should be returned");
    TEST_ASSERT(ctx, inbox.at(0).toObject()["from"].toString() == "mobile", "Inbox entries come from mobile");
    TEST_ASSERT(ctx, log.inboxCount() == 0, "Reading should empty the inbox");
    TEST_ASSERT(ctx, log.count() == 0, "Inbox should not touch the persisted log");
    return ctx.passed;
}

int runMessageLogTests(int& totalTests, int& passedTests) {
    BridgeLogger::instance().info("[Message Log]");

    testResults.clear();

    RUN_TEST(testAppendPersists);
    RUN_TEST(testRecentLimits);
    RUN_TEST(testCapAtMaxMessages);
    RUN_TEST(testMalformedFileIgnored);
    RUN_TEST(testClearPersists);
    RUN_TEST(testInboxDrainsOnRead);

    return summarizeSuite("Message Log Tests", totalTests, passedTests);
}
