#ifndef LOOKOUT_PREVIEWURLINTERCEPTOR_H
#define LOOKOUT_PREVIEWURLINTERCEPTOR_H

#include <QObject>
#include <QStringList>
#include <QUrl>
#include <QWebEngineUrlRequestInterceptor>
#include <QWebEngineUrlRequestInfo>

class PreviewUrlInterceptor : public QWebEngineUrlRequestInterceptor
{
  Q_OBJECT
public:
  PreviewUrlInterceptor(bool allowRemoteAccess = false, QObject *parent = nullptr)
    : QWebEngineUrlRequestInterceptor(parent), m_allowRemoteAccess(allowRemoteAccess)
  {
  }

  void interceptRequest(QWebEngineUrlRequestInfo &info) override;

  // Origins as scheme://host; ports are not compared
  void setAllowedOrigins(const QStringList &origins);
  bool isAllowedOrigin(const QUrl &url) const;

  void setAllowRemoteAccess(bool allow) { m_allowRemoteAccess = allow; }
  bool getAllowRemoteAccess() const { return m_allowRemoteAccess; }

private:
  bool m_allowRemoteAccess;
  QList<QUrl> m_allowedOrigins;
};

#endif // LOOKOUT_PREVIEWURLINTERCEPTOR_H
