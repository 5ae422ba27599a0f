#ifndef LOOKOUT_HEALTH_PROBER_H
#define LOOKOUT_HEALTH_PROBER_H

#include <QObject>
#include <QString>
#include <functional>

class QNetworkAccessManager;

namespace LookoutCommon {

class Clock;

struct ProbeResult {
    bool healthy = false;
    int status = 0;           // 0 when no HTTP status was received
    qint64 latencyMs = 0;     // zero unless healthy
    qint64 timestamp = 0;     // epoch ms when the probe settled
    QString serverHeader;
    QString poweredByHeader;
};

/**
 * One bounded-time liveness probe per call. Implementations always invoke
 * the callback exactly once, on the caller's thread, and never throw.
 */
class HealthProber {
public:
    using ProbeCallback = std::function<void(const ProbeResult& result)>;

    virtual ~HealthProber() = default;
    virtual void probe(quint16 port, ProbeCallback callback) = 0;
};

class HttpHealthProber : public QObject, public HealthProber {
    Q_OBJECT

public:
    HttpHealthProber(const QString& scheme, int timeoutMs, Clock* clock, QObject* parent = nullptr);
    ~HttpHealthProber() override;

    void probe(quint16 port, ProbeCallback callback) override;

    static bool isHealthyStatus(int status) { return status == 200 || status == 304; }

private:
    QString m_scheme;
    int m_timeoutMs;
    Clock* m_clock;
    QNetworkAccessManager* m_networkManager;
};

} // namespace LookoutCommon

#endif // LOOKOUT_HEALTH_PROBER_H
