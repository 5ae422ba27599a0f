#ifndef LOOKOUT_SANDBOXEDWEBVIEW_H
#define LOOKOUT_SANDBOXEDWEBVIEW_H

#include <QWebEngineView>
#include <QWebEngineProfile>
#include <QWebEnginePage>
#include <QStringList>

class PreviewUrlInterceptor;

class SandboxedWebView : public QWebEngineView
{
    Q_OBJECT

public:
    explicit SandboxedWebView(bool allowRemoteAccess = false, QWidget *parent = nullptr);
    virtual ~SandboxedWebView() = default;

    void setAllowedOrigins(const QStringList &origins);
    void insertStyleSheet(const QString &name, const QString &source);

private:
    QWebEngineProfile *m_profile;
    QWebEnginePage *m_page;
    PreviewUrlInterceptor *m_interceptor;
};

#endif // LOOKOUT_SANDBOXEDWEBVIEW_H
