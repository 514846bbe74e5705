#include "common.h"
#include "bridgelogger.h"
#include <QTcpServer>
#include <QDir>
#include <QSocketNotifier>
#include <QCoreApplication>
#include <iostream>
#include <csignal>
#ifndef Q_OS_WIN
#include <unistd.h>
#include <errno.h>
#include <fcntl.h>
#include <cstring>
#endif

#ifdef Q_OS_WIN
#include <windows.h>
#endif

namespace BridgeCommon {

QString getBridgeLogo() {
    return R"(
     __  ___     __   _ __        ___      _     __
    /  |/  /__  / /  (_) /__     / _ )____(_)__/ /__ ____
   / /|_/ / _ \/ _ \/ / / -_)   / _  / __/ / _  / _ `/ -_)
  /_/  /_/\___/_.__/_/_/\__/   /____/_/ /_/\_,_/\_, /\__/
                                              /___/
)";
}

static volatile std::sig_atomic_t g_signalReceived = 0;

#ifndef Q_OS_WIN
static int signalPipeFd[2] = {-1, -1};
static QSocketNotifier* signalNotifier = nullptr;

static void signalHandler(int signal) {
    g_signalReceived = signal;
    char a = 1;
    if (signalPipeFd[1] != -1) {
        ssize_t result = ::write(signalPipeFd[1], &a, sizeof(a));
        (void)result;
    }
}
#else
static BOOL WINAPI consoleCtrlHandler(DWORD dwCtrlType) {
    switch (dwCtrlType) {
        case CTRL_C_EVENT:
        case CTRL_BREAK_EVENT:
        case CTRL_CLOSE_EVENT:
            g_signalReceived = SIGINT;
            if (qApp) {
                QMetaObject::invokeMethod(qApp, "quit", Qt::QueuedConnection);
            }
            return TRUE;
    }
    return FALSE;
}

static void signalHandler(int signal) {
    g_signalReceived = signal;
}
#endif

void setupSignalHandlers() {
#ifndef Q_OS_WIN
    if (::pipe(signalPipeFd) == -1) {
        std::cerr << "Failed to create signal pipe: " << strerror(errno) << std::endl;
        return;
    }

    for (int fd : signalPipeFd) {
        int flags = ::fcntl(fd, F_GETFL);
        if (flags != -1) {
            ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
        }
        int fdflags = ::fcntl(fd, F_GETFD);
        if (fdflags != -1) {
            ::fcntl(fd, F_SETFD, fdflags | FD_CLOEXEC);
        }
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
    std::signal(SIGHUP, signalHandler);
#else
    SetConsoleCtrlHandler(consoleCtrlHandler, TRUE);
    std::signal(SIGTERM, signalHandler);
#endif
}

void setupSignalNotifier() {
#ifndef Q_OS_WIN
    if (!qApp || signalPipeFd[0] == -1) {
        std::cerr << "setupSignalNotifier called out of order" << std::endl;
        return;
    }

    signalNotifier = new QSocketNotifier(signalPipeFd[0], QSocketNotifier::Read, qApp);
    QObject::connect(signalNotifier, &QSocketNotifier::activated, [](QSocketDescriptor, QSocketNotifier::Type) {
        char tmp;
        while (::read(signalPipeFd[0], &tmp, sizeof(tmp)) > 0) {}

        if (g_signalReceived != 0 && qApp) {
            if (BridgeLogger::isInitialized()) {
                BridgeLogger::instance().info(
                    QString("Received signal %1, shutting down").arg(static_cast<int>(g_signalReceived)));
            }
            qApp->quit();
        }
    });
#endif
}

void cleanupSignalHandlers() {
#ifndef Q_OS_WIN
    delete signalNotifier;
    signalNotifier = nullptr;

    for (int& fd : signalPipeFd) {
        if (fd != -1) {
            ::close(fd);
            fd = -1;
        }
    }
#endif
}

bool isPortAvailable(quint16 port, const QHostAddress& address) {
    QTcpServer testServer;
    bool available = testServer.listen(address, port);
    testServer.close();
    return available;
}

QString defaultDataDir() {
    return BridgeLogger::getDataPath();
}

} // namespace BridgeCommon
