#include "qt_message_handler.h"
#include "lookoutlogger.h"
#include <QString>
#include <cstring>

namespace LookoutCommon {

static QtMessageHandler previousMessageHandler = nullptr;

static LogLevel levelForType(QtMsgType type)
{
    switch (type) {
    case QtDebugMsg:
        return LogLevel::Debug;
    case QtInfoMsg:
        return LogLevel::Info;
    case QtWarningMsg:
        return LogLevel::Warning;
    case QtCriticalMsg:
    case QtFatalMsg:
        return LogLevel::Error;
    }
    return LogLevel::Info;
}

static void lookoutMessageHandler(QtMsgType type, const QMessageLogContext &context, const QString &msg)
{
    if (!LookoutLogger::isInitialized()) {
        if (previousMessageHandler) {
            previousMessageHandler(type, context, msg);
        }
        return;
    }

    bool fromPage = context.category && std::strcmp(context.category, "js") == 0;
    QString tagged = QString("%1 %2").arg(fromPage ? "[JS]" : "[Qt]", msg);

    // The logger already echoes to the console, so the previous handler is skipped
    LookoutLogger::instance().log(levelForType(type), QString(), tagged);
}

void installQtMessageHandler()
{
    previousMessageHandler = qInstallMessageHandler(lookoutMessageHandler);
}

} // namespace LookoutCommon
