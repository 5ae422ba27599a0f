#include "health_prober.h"
#include "timing.h"
#include "lookoutlogger.h"
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QTimer>
#include <QUrl>
#include <memory>
#if QT_CONFIG(ssl)
#include <QSslError>
#endif

namespace LookoutCommon {

HttpHealthProber::HttpHealthProber(const QString& scheme, int timeoutMs, Clock* clock, QObject* parent)
    : QObject(parent)
    , m_scheme(scheme.isEmpty() ? QStringLiteral("http") : scheme)
    , m_timeoutMs(timeoutMs)
    , m_clock(clock ? clock : SystemClock::shared())
    , m_networkManager(new QNetworkAccessManager(this))
{
}

HttpHealthProber::~HttpHealthProber()
{
}

void HttpHealthProber::probe(quint16 port, ProbeCallback callback)
{
    QUrl url(QString("%1://localhost:%2/").arg(m_scheme).arg(port));

    QNetworkRequest request(url);
    request.setRawHeader("User-Agent", "Lookout-HealthProber/1.0");
    // A redirect is an answer in its own right; only 200 and 304 count
    request.setAttribute(QNetworkRequest::RedirectPolicyAttribute, QNetworkRequest::ManualRedirectPolicy);

    const qint64 startedAt = m_clock->monotonicMs();
    QNetworkReply* reply = m_networkManager->get(request);
    QTimer* deadline = new QTimer(reply);
    deadline->setSingleShot(true);

    // Whichever of response, error or deadline comes first settles the probe
    auto settled = std::make_shared<bool>(false);
    Clock* clock = m_clock;

    auto settle = [settled, callback, clock, startedAt, port](QNetworkReply* r, bool timedOut) {
        if (*settled) {
            return;
        }
        *settled = true;

        ProbeResult result;
        result.timestamp = clock->epochMs();

        if (!timedOut) {
            QVariant statusAttr = r->attribute(QNetworkRequest::HttpStatusCodeAttribute);
            result.status = statusAttr.isValid() ? statusAttr.toInt() : 0;
            result.healthy = isHealthyStatus(result.status);
        }

        if (result.healthy) {
            result.latencyMs = clock->monotonicMs() - startedAt;
            result.serverHeader = QString::fromUtf8(r->rawHeader("Server"));
            result.poweredByHeader = QString::fromUtf8(r->rawHeader("X-Powered-By"));
        } else if (LookoutLogger::isInitialized()) {
            QString reason = timedOut ? QStringLiteral("timeout")
                           : result.status > 0 ? QString("status %1").arg(result.status)
                           : r->errorString();
            LOOKOUT_DETECT_LOG(LogLevel::Debug, QString("Probe localhost:%1 failed: %2").arg(port).arg(reason));
        }

        callback(result);
    };

    connect(reply, &QNetworkReply::metaDataChanged, this, [reply, deadline, settle, settled]() {
        if (*settled) {
            return;
        }
        if (!reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).isValid()) {
            return;
        }
        deadline->stop();
        settle(reply, false);
        // Headers are all we need; dev servers may stream long bodies
        reply->abort();
    });

    connect(reply, &QNetworkReply::finished, this, [reply, deadline, settle]() {
        deadline->stop();
        settle(reply, false);
        reply->deleteLater();
    });

    connect(deadline, &QTimer::timeout, this, [reply, settle]() {
        settle(reply, true);
        reply->abort();
    });

#if QT_CONFIG(ssl)
    // Local dev servers commonly use self-signed certificates
    connect(reply, &QNetworkReply::sslErrors, this, [reply](const QList<QSslError>&) {
        reply->ignoreSslErrors();
    });
#endif

    deadline->start(qMax(1, m_timeoutMs));
}

} // namespace LookoutCommon
