#include <iostream>
#include <memory>
#include <QCoreApplication>
#include <QDir>
#include <QHostAddress>
#include <QTimer>
#ifdef Q_OS_WIN
#include <windows.h>
#endif
#include "shared/bridgelogger.h"
#include "shared/common.h"
#include "shared/cli_args.h"
#include "shared/cli_help.h"
#include "shared/health_check.h"
#include "shared/qt_message_handler.h"
#include "shared/server_info.h"
#include "scraper/cdpscraper.h"
#include "core/eventchannel.h"
#include "core/broadcasthub.h"
#include "core/workspacemonitor.h"
#include "core/filechangewatcher.h"
#include "core/messagelog.h"
#include "core/collaborators.h"
#include "core/bridgeserver.h"

using namespace BridgeCommon;

static BridgeLoggerConfig makeLoggerConfig(bool console) {
    BridgeLoggerConfig logConfig;
    logConfig.appName = "bridge";
    logConfig.logFiles = {
        {"bridge.log", "bridge", false},
        {"cdp.log", "cdp", true}
    };
    logConfig.consoleEnabled = console;
    logConfig.consoleColors = true;
    logConfig.baseLogDir = BridgeLogger::getBaseLogDir();
    return logConfig;
}

static void reportError(bool verbose, const QString& message) {
    if (verbose) {
        BRIDGE_LOG_ERROR(message);
    } else {
        std::cerr << "Error: " << message.toStdString() << "\n";
    }
}

int main(int argc, char *argv[]) {
#ifdef Q_OS_WIN
    SetConsoleOutputCP(CP_UTF8);
    SetConsoleCP(CP_UTF8);
#endif

    BridgeCLI::CommonArgs args;

    BridgeCLI::applyEnvironmentDefaults(args);
    if (args.hasError) {
        std::cerr << "Error: " << args.errorMessage << "\n";
        return static_cast<int>(args.errorCode);
    }

    for (int i = 1; i < argc; ++i) {
        const char* nextArg = (i + 1 < argc) ? argv[i + 1] : nullptr;

        if (BridgeCLI::parseSharedArg(argv[i], nextArg, i, args)) {
            if (args.hasError) {
                std::cerr << "Error: " << args.errorMessage << "\n";
                std::cout << BridgeCLI::generateHelpText(argv[0]);
                return static_cast<int>(ExitCode::INVALID_ARGUMENTS);
            }
            if (args.showHelp) {
                std::cout << BridgeCLI::generateHelpText(argv[0]);
                return 0;
            }
            if (args.showVersion) {
                std::cout << BridgeCLI::generateVersionString() << "\n";
                return 0;
            }
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            std::cout << BridgeCLI::generateHelpText(argv[0]);
            return static_cast<int>(ExitCode::INVALID_ARGUMENTS);
        }
    }

    if (args.dryRun) {
        BridgeCLI::ServerConfig config(args);
        BridgeCLI::printDryRunConfig(config);
        return 0;
    }

    if (!BridgeCLI::validateArguments(args)) {
        std::cerr << "Error: " << args.errorMessage << "\n";
        return static_cast<int>(args.errorCode);
    }

    BridgeCLI::ServerConfig serverConfig(args);

    if (args.check) {
        QCoreApplication app(argc, argv);
        app.setApplicationName(Config::APP_NAME);
        BridgeLogger::initialize(makeLoggerConfig(true));

        BridgeHealthCheck::HealthCheckConfig checkConfig;
        checkConfig.binaryName = Config::APP_NAME;
        checkConfig.verbose = args.verbose;
        checkConfig.strictMode = false;
        checkConfig.serverConfig = &serverConfig;

        int checkResult = BridgeHealthCheck::runHealthCheck(checkConfig);
        return checkResult == 0 ? 0 : static_cast<int>(ExitCode::CHECK_FAILED);
    }

    setupSignalHandlers();

    QCoreApplication app(argc, argv);
    app.setApplicationName(Config::APP_NAME);
    app.setApplicationVersion(Config::APP_VERSION);
    setupSignalNotifier();

    BridgeLogger::initialize(makeLoggerConfig(args.verbose));
    installQtMessageHandler();

    if (!args.verbose) {
        std::cout << getBridgeLogo().toUtf8().constData();
        std::cout << "Starting Mobile Bridge...\n" << std::flush;
    } else {
        BRIDGE_LOG_INFO(getBridgeLogo());
        BRIDGE_LOG_INFO("Starting Mobile Bridge...");
    }

    const QString dataDir = serverConfig.getDataDir();
    if (!QDir().mkpath(dataDir)) {
        reportError(args.verbose, QString("Cannot create data directory: %1").arg(dataDir));
        return static_cast<int>(ExitCode::DATA_DIR_CREATE_FAILED);
    }

    QHostAddress bindAddress(serverConfig.getBindAddress());
    if (bindAddress.isNull()) {
        reportError(args.verbose, QString("Invalid bind address: %1").arg(serverConfig.getBindAddress()));
        return static_cast<int>(ExitCode::CONFIGURATION_ERROR);
    }

    if (!isPortAvailable(serverConfig.getPort(), bindAddress)) {
        reportError(args.verbose, QString("Port %1 is already in use").arg(serverConfig.getPort()));
        return static_cast<int>(ExitCode::PORT_IN_USE);
    }

    EventChannel channel;
    BroadcastHub hub;
    hub.drain(&channel);

    CdpScraper scraper(serverConfig.getCdpHost(), serverConfig.getCdpPort(), serverConfig.getProduct());

    MessageLog messages(dataDir);
    messages.load();

    WorkspaceMonitor workspace(scraper, &channel, serverConfig.getWorkspace());
    FileChangeWatcher watcher(&channel);
    ScraperChatStream chat(scraper);
    UnavailableQuotaService quota;

    BridgeServer::Services services;
    services.scraper = &scraper;
    services.chat = &chat;
    services.quota = &quota;
    services.workspace = &workspace;
    services.watcher = &watcher;
    services.messages = &messages;
    services.hub = &hub;
    services.channel = &channel;

    BridgeServer server(services);
    QString listenError;
    if (!server.listen(bindAddress, serverConfig.getPort(), &listenError)) {
        reportError(args.verbose, QString("Failed to listen on %1:%2: %3")
                    .arg(bindAddress.toString()).arg(serverConfig.getPort()).arg(listenError));
        return static_cast<int>(ExitCode::LISTEN_FAILED);
    }

    ServerInfo serverInfo;
    serverInfo.port = server.serverPort();
    serverInfo.bindAddress = bindAddress.toString();
    serverInfo.cdpUrl = serverConfig.getCdpBaseUrl();
    serverInfo.workspace = serverConfig.getWorkspace();
    serverInfo.pollingEnabled = serverConfig.isWorkspacePollingEnabled();
    serverInfo.dataDir = dataDir;
    serverInfo.pid = QCoreApplication::applicationPid();
    serverInfo.logPath = BridgeLogger::instance().currentSessionPath();

    // Probe the endpoint once the event loop is running, then start polling
    QTimer::singleShot(Config::STARTUP_DELAY_MS, &app, [&]() {
        scraper.checkAvailability([&](const AvailabilityResult& availability) {
            serverInfo.cdpAvailable = availability.available;
            serverInfo.browser = availability.browser;

            QString infoString = generateServerInfoString(serverInfo, args.verbose);
            if (args.verbose) {
                BRIDGE_LOG_INFO(infoString);
            } else {
                std::cout << infoString.toStdString() << "\n" << std::flush;
            }

            if (!availability.available) {
                BRIDGE_LOG_WARNING(QString("Debugging endpoint unavailable at %1: %2")
                                   .arg(serverInfo.cdpUrl, availability.error));
            }

            if (serverConfig.isWorkspacePollingEnabled()) {
                workspace.start();
            }
        });
    });

    QObject::connect(&app, &QCoreApplication::aboutToQuit, [&]() {
        if (args.verbose) {
            BRIDGE_LOG_INFO("Shutting down Mobile Bridge...");
        } else {
            std::cout << "\nShutting down Mobile Bridge... " << std::flush;
        }

        workspace.stop();
        watcher.unwatch();
        chat.stopChatStream();
        server.close();
        BridgeLogger::instance().flush();

        cleanupSignalHandlers();

        if (!args.verbose) {
            std::cout << "done\n" << std::flush;
        }
    });

    return app.exec();
}
