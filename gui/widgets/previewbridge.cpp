#include "previewbridge.h"
#include "../shared/lookoutlogger.h"

PreviewBridge::PreviewBridge(QObject *parent)
    : QObject(parent)
{
}

void PreviewBridge::sendToPage(const QString &json)
{
    emit messageToPage(json);
}

void PreviewBridge::postMessage(const QString &json)
{
    LookoutLogger::instance().debug(QString("[PreviewBridge] From page: %1").arg(json.left(200)));
    emit messageFromPage(json);
}
