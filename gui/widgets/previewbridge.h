#ifndef LOOKOUT_PREVIEWBRIDGE_H
#define LOOKOUT_PREVIEWBRIDGE_H

#include <QObject>
#include <QString>

// Web channel object the preview page talks through; both directions carry JSON envelopes
class PreviewBridge : public QObject
{
    Q_OBJECT

public:
    explicit PreviewBridge(QObject *parent = nullptr);

    void sendToPage(const QString &json);

public slots:
    void postMessage(const QString &json);

signals:
    void messageToPage(const QString &json);
    void messageFromPage(const QString &json);
};

#endif // LOOKOUT_PREVIEWBRIDGE_H
