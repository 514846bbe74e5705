#ifndef BRIDGE_TEST_SUITES_H
#define BRIDGE_TEST_SUITES_H

// Each suite returns its failure count and reports totals through the out-params
int runBridgeLoggerTests(int& totalTests, int& passedTests);
int runCliArgumentTests(int& totalTests, int& passedTests);
int runCdpConnectionTests(int& totalTests, int& passedTests);
int runTargetResolverTests(int& totalTests, int& passedTests);
int runHeuristicsTests(int& totalTests, int& passedTests);
int runCdpSessionTests(int& totalTests, int& passedTests);
int runCdpScraperTests(int& totalTests, int& passedTests);
int runWorkspaceMonitorTests(int& totalTests, int& passedTests);
int runFileChangeWatcherTests(int& totalTests, int& passedTests);
int runBroadcastHubTests(int& totalTests, int& passedTests);
int runMessageLogTests(int& totalTests, int& passedTests);
int runBridgeServerTests(int& totalTests, int& passedTests);

#endif // BRIDGE_TEST_SUITES_H
