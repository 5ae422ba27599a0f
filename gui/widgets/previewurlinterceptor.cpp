#include <QDesktopServices>
#include "previewurlinterceptor.h"
#include "../shared/lookoutlogger.h"

namespace {

// HMR sockets ride on the page's own origin
QString httpSchemeFor(const QString &scheme)
{
  if (scheme == "ws")
  {
    return "http";
  }
  if (scheme == "wss")
  {
    return "https";
  }
  return scheme;
}

} // namespace

void PreviewUrlInterceptor::setAllowedOrigins(const QStringList &origins)
{
  m_allowedOrigins.clear();
  for (const QString &origin : origins)
  {
    QUrl url(origin);
    if (url.isValid() && !url.host().isEmpty())
    {
      m_allowedOrigins.append(url);
    }
    else
    {
      LookoutLogger::instance().warning(QString("[PREVIEW] Ignoring malformed origin: %1").arg(origin));
    }
  }
}

bool PreviewUrlInterceptor::isAllowedOrigin(const QUrl &url) const
{
  const QString scheme = httpSchemeFor(url.scheme());
  for (const QUrl &origin : m_allowedOrigins)
  {
    if (origin.scheme() == scheme && origin.host() == url.host())
    {
      return true;
    }
  }
  return false;
}

void PreviewUrlInterceptor::interceptRequest(QWebEngineUrlRequestInfo &info)
{
  const QUrl url = info.requestUrl();
  const QString scheme = url.scheme();

  // The preview page itself and its embedded resources
  if (scheme == "data" || scheme == "qrc" || scheme == "blob" || scheme == "devtools")
  {
    return;
  }

  if (isAllowedOrigin(url))
  {
    return;
  }

  // Navigation away from the dev server goes to the system browser
  if (info.resourceType() == QWebEngineUrlRequestInfo::ResourceTypeMainFrame ||
      info.resourceType() == QWebEngineUrlRequestInfo::ResourceTypeSubFrame)
  {
    if (info.navigationType() == QWebEngineUrlRequestInfo::NavigationTypeLink &&
        (scheme == "http" || scheme == "https"))
    {
      LookoutLogger::instance().debug(QString("[PREVIEW] Opening external URL in browser: %1").arg(url.toString()));
      QDesktopServices::openUrl(url);
    }
    else
    {
      LookoutLogger::instance().debug(QString("[PREVIEW] Blocking navigation: %1").arg(url.toString()));
    }
    info.block(true);
    return;
  }

  if (m_allowRemoteAccess)
  {
    return;
  }

  LookoutLogger::instance().debug(QString("[PREVIEW] Blocking external request: %1 Type: %2")
                                    .arg(url.toString())
                                    .arg(info.resourceType()));
  info.block(true);
}
