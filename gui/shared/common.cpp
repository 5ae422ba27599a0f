#include "common.h"
#include <QTcpServer>
#include <QDir>
#include <QMetaObject>
#include <QSocketNotifier>
#include <QCoreApplication>
#include <iostream>
#include <random>
#include <csignal>
#ifndef Q_OS_WIN
#include <unistd.h>
#include <errno.h>
#include <fcntl.h>
#include <cstring>
#endif

#ifdef Q_OS_WIN
#include <windows.h>
#include <io.h>
#include <fcntl.h>
#endif

namespace LookoutCommon {

std::unique_ptr<QTcpServer> allocatePort(quint16& outPort, const QHostAddress& address) {
    auto server = std::make_unique<QTcpServer>();

    if (server->listen(address, 0)) {
        outPort = server->serverPort();
        return server;
    }

    outPort = 0;
    return nullptr;
}

QString resolveProjectRoot(const std::string& commandLineOverride) {
    // Priority 1: Command-line override
    if (!commandLineOverride.empty()) {
        QString overridePath = QString::fromStdString(commandLineOverride);
        return QDir(overridePath).absolutePath();
    }

    // Priority 2: Environment variable
    QString projectPath = qEnvironmentVariable(Config::PROJECT_PATH_ENV);
    if (!projectPath.isEmpty()) {
        return QDir(projectPath).absolutePath();
    }

    // Priority 3: wherever we were launched from
    return QDir::currentPath();
}

std::string generateSecureToken(size_t length) {
    const char charset[] = "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz";
    const size_t charset_size = sizeof(charset) - 1;

    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, charset_size - 1);

    std::string token;
    token.reserve(length);
    for (size_t i = 0; i < length; ++i) {
        token += charset[dis(gen)];
    }

    return token;
}

bool setupConsoleOutput() {
#if defined(Q_OS_WIN)
    if (AttachConsole(ATTACH_PARENT_PROCESS)) {
        SetConsoleOutputCP(CP_UTF8);
        SetConsoleCP(CP_UTF8);

        FILE* stream;
        freopen_s(&stream, "CONOUT$", "w", stdout);
        freopen_s(&stream, "CONOUT$", "w", stderr);
        freopen_s(&stream, "CONIN$", "r", stdin);

        // Enable ANSI color codes on Windows 10+
        HANDLE hOut = GetStdHandle(STD_OUTPUT_HANDLE);
        DWORD dwMode = 0;
        if (hOut != INVALID_HANDLE_VALUE && GetConsoleMode(hOut, &dwMode)) {
            dwMode |= ENABLE_VIRTUAL_TERMINAL_PROCESSING;
            SetConsoleMode(hOut, dwMode);
        }

        std::ios::sync_with_stdio();
        return true;
    }
    return false;
#else
    return true;  // Unix-like systems already have console output
#endif
}

QString getLookoutBanner() {
    return R"(
   _                 _              _
  | |    ___   ___  | | __ ___   _ | |_
  | |   / _ \ / _ \ | |/ // _ \ | | || __|
  | |__| (_) | (_) ||   <| (_) || |_|| |_
  |_____\___/ \___/ |_|\_\\___/  \__,_|\__|

       Watching your dev server.

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

    auto set_nb_cloexec = [](int fd) {
        int flags = ::fcntl(fd, F_GETFL);
        if (flags != -1) {
            ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
        }
        int fdflags = ::fcntl(fd, F_GETFD);
        if (fdflags != -1) {
            ::fcntl(fd, F_SETFD, fdflags | FD_CLOEXEC);
        }
    };

    set_nb_cloexec(signalPipeFd[0]);
    set_nb_cloexec(signalPipeFd[1]);

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
#else
    SetConsoleCtrlHandler(consoleCtrlHandler, TRUE);
    std::signal(SIGTERM, signalHandler);
#endif
}

void setupSignalNotifier() {
#ifndef Q_OS_WIN
    if (!qApp) {
        std::cerr << "setupSignalNotifier called before QCoreApplication creation!" << std::endl;
        return;
    }

    if (signalPipeFd[0] == -1) {
        std::cerr << "setupSignalNotifier called before setupSignalHandlers!" << std::endl;
        return;
    }

    signalNotifier = new QSocketNotifier(signalPipeFd[0], QSocketNotifier::Read, qApp);
    QObject::connect(signalNotifier, &QSocketNotifier::activated, [](QSocketDescriptor, QSocketNotifier::Type) {
        char tmp;
        while (::read(signalPipeFd[0], &tmp, sizeof(tmp)) > 0) {}

        if (g_signalReceived != 0 && qApp) {
            qApp->quit();
        }
    });
#endif
}

bool isTerminationRequested() {
    return g_signalReceived != 0;
}

void cleanupSignalHandlers() {
#ifndef Q_OS_WIN
    if (signalNotifier) {
        delete signalNotifier;
        signalNotifier = nullptr;
    }

    if (signalPipeFd[0] != -1) {
        ::close(signalPipeFd[0]);
        signalPipeFd[0] = -1;
    }

    if (signalPipeFd[1] != -1) {
        ::close(signalPipeFd[1]);
        signalPipeFd[1] = -1;
    }
#endif
}

} // namespace LookoutCommon
