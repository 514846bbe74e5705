#include "test_harness.h"
#include "test_suites.h"
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QUuid>

static QStringList readLines(const QString& path) {
    BridgeLogger::instance().flush();
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        return {};
    }
    return QString::fromUtf8(file.readAll()).split('\n', Qt::SkipEmptyParts);
}

static QString lineContaining(const QStringList& lines, const QString& marker) {
    for (const QString& line : lines) {
        if (line.contains(marker)) {
            return line;
        }
    }
    return QString();
}

static QString uniqueMarker() {
    return QUuid::createUuid().toString(QUuid::WithoutBraces);
}

bool testSessionFolderLayout(TestContext& ctx) {
    BridgeLogger& logger = BridgeLogger::instance();

    QFileInfo session(logger.currentSessionPath());
    TEST_REQUIRE(ctx, session.isDir(), "Session folder should exist");
    TEST_ASSERT(ctx, session.dir().dirName() == "bridge-tests", "Session should sit under the app name");
    TEST_ASSERT(ctx, session.fileName().contains("_p"), "Session name should carry the pid");

    QString appLog = logger.logFilePath("default");
    TEST_ASSERT(ctx, QFileInfo(appLog).fileName() == "app.log", "Default category should write app.log");
    TEST_ASSERT(ctx, QFileInfo(appLog).absolutePath() == session.absoluteFilePath(),
                "Log files should live in the session folder");
    TEST_ASSERT(ctx, QFileInfo(logger.logFilePath("cdp")).fileName() == "cdp.log", "cdp category should write cdp.log");
    TEST_ASSERT(ctx, logger.logFilePath("watcher").isEmpty(), "Unconfigured category has no file of its own");
    return ctx.passed;
}

bool testCdpCategoryWritesJsonLines(TestContext& ctx) {
    QString marker = uniqueMarker();
    BRIDGE_CDP_LOG(LogLevel::Info, QString("Runtime.evaluate %1").arg(marker),
                   QJsonObject({{"method", "Runtime.evaluate"}, {"contextId", 7}}));

    QString line = lineContaining(readLines(BridgeLogger::instance().logFilePath("cdp")), marker);
    TEST_REQUIRE(ctx, !line.isEmpty(), "Entry should be written to cdp.log");

    QJsonObject entry = QJsonDocument::fromJson(line.toUtf8()).object();
    TEST_ASSERT(ctx, entry["level"].toString() == "INFO", "Level should be recorded");
    TEST_ASSERT(ctx, entry["category"].toString() == "cdp", "Category should be recorded");
    TEST_ASSERT(ctx, entry["method"].toString() == "Runtime.evaluate", "Metadata should be merged into the entry");
    TEST_ASSERT(ctx, entry["contextId"].toInt() == 7, "Numeric metadata should keep its type");
    TEST_ASSERT(ctx, !entry["timestamp"].toString().isEmpty(), "Timestamp should be present");

    QString appLine = lineContaining(readLines(BridgeLogger::instance().logFilePath("default")), marker);
    TEST_ASSERT(ctx, appLine.isEmpty(), "Protocol traffic should stay out of app.log");
    return ctx.passed;
}

bool testUnknownCategoryFallsBackToDefault(TestContext& ctx) {
    QString marker = uniqueMarker();
    BridgeLogger::instance().log(LogLevel::Warning, "watcher", marker);

    QString line = lineContaining(readLines(BridgeLogger::instance().logFilePath("default")), marker);
    TEST_REQUIRE(ctx, !line.isEmpty(), "Unknown category should be written to the default file");
    TEST_ASSERT(ctx, line.contains(QString("[WARN] [watcher] %1").arg(marker)),
                "Plain-text line should carry level and category");
    return ctx.passed;
}

bool testPlainTextMetadataSuffix(TestContext& ctx) {
    QString marker = uniqueMarker();
    BridgeLogger::instance().log(LogLevel::Info, "default", marker, QJsonObject({{"path", "/tmp/ws"}}));

    QString line = lineContaining(readLines(BridgeLogger::instance().logFilePath("default")), marker);
    TEST_REQUIRE(ctx, !line.isEmpty(), "Entry should be written");
    TEST_ASSERT(ctx, line.endsWith(QString("%1 {\"path\":\"/tmp/ws\"}").arg(marker)),
                "Metadata should follow the message as compact JSON");
    TEST_ASSERT(ctx, !line.contains("[default]"), "Default category should not be prefixed");
    return ctx.passed;
}

bool testBelowMinLevelDropped(TestContext& ctx) {
    QString marker = uniqueMarker();
    BRIDGE_LOG_DEBUG(marker);
    BridgeLogger::instance().log(LogLevel::Debug, "cdp", marker);

    TEST_ASSERT(ctx, lineContaining(readLines(BridgeLogger::instance().logFilePath("default")), marker).isEmpty(),
                "Debug should be filtered from app.log at Info level");
    TEST_ASSERT(ctx, lineContaining(readLines(BridgeLogger::instance().logFilePath("cdp")), marker).isEmpty(),
                "Debug should be filtered from cdp.log at Info level");
    return ctx.passed;
}

int runBridgeLoggerTests(int& totalTests, int& passedTests) {
    BridgeLogger::instance().info("[Bridge Logger]");

    testResults.clear();

    RUN_TEST(testSessionFolderLayout);
    RUN_TEST(testCdpCategoryWritesJsonLines);
    RUN_TEST(testUnknownCategoryFallsBackToDefault);
    RUN_TEST(testPlainTextMetadataSuffix);
    RUN_TEST(testBelowMinLevelDropped);

    return summarizeSuite("Bridge Logger Tests", totalTests, passedTests);
}
