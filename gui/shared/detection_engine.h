#ifndef LOOKOUT_DETECTION_ENGINE_H
#define LOOKOUT_DETECTION_ENGINE_H

#include <QObject>
#include <QString>
#include <QList>
#include <functional>
#include <memory>
#include <optional>
#include "preview_types.h"
#include "type_inferrer.h"

namespace LookoutCommon {
class Clock;
class HealthProber;
}

/**
 * Finds dev servers listening on the configured candidate ports.
 *
 * A full scan probes every configured port at once and completes when all
 * probes have settled. The result is cached for CACHE_TTL_MS; calls made
 * while a scan is running join it instead of starting another.
 * quickDetect() walks the short priority list one port at a time and stops
 * at the first healthy answer.
 *
 * Nothing here throws. Probe failures mean "no server on that port" and a
 * missing project root yields an empty result.
 */
class DetectionEngine : public QObject
{
    Q_OBJECT

public:
    using ResultCallback = std::function<void(const LookoutCommon::DetectionResult& result)>;
    using ServerCallback = std::function<void(const std::optional<LookoutCommon::DevServer>& server)>;

    static constexpr qint64 CACHE_TTL_MS = 5000;

    DetectionEngine(const LookoutCommon::DetectionConfig& config,
                    std::unique_ptr<LookoutCommon::HealthProber> prober,
                    LookoutCommon::Clock* clock = nullptr,
                    QObject* parent = nullptr);
    ~DetectionEngine();

    void setProjectRoot(const QString& projectRoot);
    QString projectRoot() const { return m_projectRoot; }
    const LookoutCommon::DetectionConfig& config() const { return m_config; }

    void detectServers(ResultCallback callback);
    void quickDetect(ServerCallback callback);
    void refresh(ResultCallback callback);

    bool isScanning() const { return m_activeScan != nullptr; }
    bool hasFreshCache() const;
    std::optional<LookoutCommon::DetectionResult> cachedResult() const { return m_cachedResult; }
    std::optional<LookoutCommon::TypeInference> inspectProject() const;

signals:
    void scanStarted(int portCount);
    void detectionFinished(const LookoutCommon::DetectionResult& result);

private:
    struct Scan;
    struct QuickSearch;

    bool hasUsableRoot() const;
    void startScan(ResultCallback callback);
    void completeScan(const std::shared_ptr<Scan>& scan);
    void probeNextQuick(const std::shared_ptr<QuickSearch>& search);
    LookoutCommon::DetectionResult emptyResult(qint64 startedAt) const;
    LookoutCommon::DevServer makeServer(quint16 port, const std::optional<LookoutCommon::ServerType>& hint,
                                        const QString& serverHeader, const QString& poweredBy,
                                        qint64 seenAt) const;

    LookoutCommon::DetectionConfig m_config;
    std::unique_ptr<LookoutCommon::HealthProber> m_prober;
    LookoutCommon::Clock* m_clock;
    LookoutCommon::TypeInferrer m_inferrer;
    QString m_projectRoot;

    std::optional<LookoutCommon::DetectionResult> m_cachedResult;
    qint64 m_lastScanTime = 0;
    std::shared_ptr<Scan> m_activeScan;
    quint64 m_generation = 0;
    std::shared_ptr<bool> m_alive;
};

#endif // LOOKOUT_DETECTION_ENGINE_H
