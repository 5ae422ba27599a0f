#include "sandboxedwebview.h"
#include "previewurlinterceptor.h"
#include <QWebEngineSettings>
#include <QWebEngineScript>
#include <QWebEngineScriptCollection>

SandboxedWebView::SandboxedWebView(bool allowRemoteAccess, QWidget *parent)
    : QWebEngineView(parent)
{
    // Off-the-record profile: previews never share cookies or storage with a browser session
    m_profile = new QWebEngineProfile();
    m_interceptor = new PreviewUrlInterceptor(allowRemoteAccess, m_profile);
    m_profile->setUrlRequestInterceptor(m_interceptor);

    // The page must be torn down before its profile
    m_page = new QWebEnginePage(m_profile);
    m_page->setParent(this);
    m_profile->setParent(this);

    setPage(m_page);
    setContextMenuPolicy(Qt::NoContextMenu);

    QWebEngineSettings *settings = m_page->settings();
    settings->setAttribute(QWebEngineSettings::JavascriptEnabled, true);
    settings->setAttribute(QWebEngineSettings::LocalStorageEnabled, true);
    settings->setAttribute(QWebEngineSettings::LocalContentCanAccessRemoteUrls, false);
    settings->setAttribute(QWebEngineSettings::JavascriptCanOpenWindows, false);

    insertStyleSheet("scrollbar",
                     QString("::-webkit-scrollbar {"
                             "  width: 8px;"
                             "  height: 8px;"
                             "}"
                             "::-webkit-scrollbar-thumb {"
                             "  background: #555;"
                             "  border-radius: 4px;"
                             "}"));
}

void SandboxedWebView::setAllowedOrigins(const QStringList &origins)
{
    m_interceptor->setAllowedOrigins(origins);
}

void SandboxedWebView::insertStyleSheet(const QString &name, const QString &source)
{
    QWebEngineScript script;
    QString s = QString::fromLatin1("(function() {"
                                    "    css = document.createElement('style');"
                                    "    css.type = 'text/css';"
                                    "    css.id = '%1';"
                                    "    document.head.appendChild(css);"
                                    "    css.innerText = '%2';"
                                    "})()")
                    .arg(name)
                    .arg(source.simplified());

    script.setName(name);
    script.setSourceCode(s);
    script.setInjectionPoint(QWebEngineScript::DocumentReady);
    script.setRunsOnSubFrames(false);
    script.setWorldId(QWebEngineScript::ApplicationWorld);
    this->page()->scripts().insert(script);
}
