#include "detection_engine.h"
#include "health_prober.h"
#include "timing.h"
#include "lookoutlogger.h"
#include <QDir>
#include <algorithm>

using namespace LookoutCommon;

namespace {

void detectLog(LogLevel level, const QString& message)
{
    if (LookoutLogger::isInitialized()) {
        LOOKOUT_DETECT_LOG(level, message);
    }
}

} // namespace

struct DetectionEngine::Scan {
    quint64 generation = 0;
    qint64 startedAt = 0;
    std::optional<ServerType> hint;
    QList<quint16> ports;
    QList<std::optional<DevServer>> found;   // indexed by position in ports
    int pending = 0;
    QList<ResultCallback> waiters;
};

struct DetectionEngine::QuickSearch {
    std::optional<ServerType> hint;
    QList<quint16> ports;
    int next = 0;
    ServerCallback callback;
};

DetectionEngine::DetectionEngine(const DetectionConfig& config,
                                 std::unique_ptr<HealthProber> prober,
                                 Clock* clock,
                                 QObject* parent)
    : QObject(parent)
    , m_config(config)
    , m_prober(std::move(prober))
    , m_clock(clock ? clock : SystemClock::shared())
    , m_inferrer(config.markerFiles)
    , m_alive(std::make_shared<bool>(true))
{
}

DetectionEngine::~DetectionEngine()
{
    // Probe callbacks that still arrive while the prober shuts down are dropped
    *m_alive = false;
    m_prober.reset();
}

void DetectionEngine::setProjectRoot(const QString& projectRoot)
{
    if (projectRoot == m_projectRoot) {
        return;
    }
    m_projectRoot = projectRoot;
    m_cachedResult.reset();
    m_lastScanTime = 0;
}

bool DetectionEngine::hasUsableRoot() const
{
    return !m_projectRoot.isEmpty() && QDir(m_projectRoot).exists();
}

bool DetectionEngine::hasFreshCache() const
{
    return m_cachedResult && (m_clock->monotonicMs() - m_lastScanTime) < CACHE_TTL_MS;
}

std::optional<TypeInference> DetectionEngine::inspectProject() const
{
    return m_inferrer.inspect(m_projectRoot);
}

DetectionResult DetectionEngine::emptyResult(qint64 startedAt) const
{
    DetectionResult result;
    result.scannedPorts = m_config.ports;
    result.durationMs = m_clock->monotonicMs() - startedAt;
    result.timestamp = m_clock->epochMs();
    return result;
}

DevServer DetectionEngine::makeServer(quint16 port, const std::optional<ServerType>& hint,
                                      const QString& serverHeader, const QString& poweredBy,
                                      qint64 seenAt) const
{
    DevServer server;
    server.type = hint ? *hint : TypeInferrer::inferFromHeaders(serverHeader, poweredBy);
    server.port = port;
    server.path = "/";
    server.hmr = supportsHmr(server.type);
    server.lastSeen = seenAt;
    server.healthy = true;
    server.scheme = m_config.scheme;
    return server;
}

void DetectionEngine::detectServers(ResultCallback callback)
{
    if (hasFreshCache()) {
        detectLog(LogLevel::Debug, QString("Detection cache hit (%1 server(s), age %2ms)")
                  .arg(m_cachedResult->servers.size())
                  .arg(m_clock->monotonicMs() - m_lastScanTime));
        if (callback) {
            callback(*m_cachedResult);
        }
        return;
    }

    if (m_activeScan) {
        m_activeScan->waiters.append(std::move(callback));
        return;
    }

    startScan(std::move(callback));
}

void DetectionEngine::refresh(ResultCallback callback)
{
    m_cachedResult.reset();
    m_lastScanTime = 0;
    startScan(std::move(callback));
}

void DetectionEngine::startScan(ResultCallback callback)
{
    const qint64 startedAt = m_clock->monotonicMs();

    if (!hasUsableRoot()) {
        detectLog(LogLevel::Debug, "No project root available, skipping detection");
        DetectionResult result = emptyResult(startedAt);
        emit detectionFinished(result);
        if (callback) {
            callback(result);
        }
        return;
    }

    auto scan = std::make_shared<Scan>();
    scan->generation = ++m_generation;
    scan->startedAt = startedAt;
    scan->hint = m_inferrer.inferFromProject(m_projectRoot);
    scan->ports = m_config.ports;
    scan->pending = scan->ports.size();
    for (int i = 0; i < scan->ports.size(); ++i) {
        scan->found.append(std::nullopt);
    }
    if (callback) {
        scan->waiters.append(std::move(callback));
    }
    m_activeScan = scan;

    detectLog(LogLevel::Debug, QString("Scanning %1 port(s)%2")
              .arg(scan->ports.size())
              .arg(scan->hint ? QString(" (project looks like %1)").arg(serverTypeId(*scan->hint)) : QString()));
    emit scanStarted(scan->ports.size());

    if (scan->pending == 0) {
        completeScan(scan);
        return;
    }

    std::weak_ptr<bool> alive = m_alive;
    // Copy the port list; a synchronous prober may complete the scan mid-loop
    const QList<quint16> ports = scan->ports;
    for (int index = 0; index < ports.size(); ++index) {
        const quint16 port = ports.at(index);
        m_prober->probe(port, [this, alive, scan, index, port](const ProbeResult& probe) {
            auto guard = alive.lock();
            if (!guard || !*guard) {
                return;
            }
            if (probe.healthy) {
                scan->found[index] = makeServer(port, scan->hint, probe.serverHeader,
                                                probe.poweredByHeader, probe.timestamp);
            }
            if (--scan->pending == 0) {
                completeScan(scan);
            }
        });
    }
}

void DetectionEngine::completeScan(const std::shared_ptr<Scan>& scan)
{
    DetectionResult result;
    for (const auto& slot : scan->found) {
        if (slot) {
            result.servers.append(*slot);
        }
    }
    std::stable_sort(result.servers.begin(), result.servers.end(),
                     [](const DevServer& a, const DevServer& b) {
                         return a.hmr && !b.hmr;
                     });
    result.scannedPorts = scan->ports;
    result.durationMs = m_clock->monotonicMs() - scan->startedAt;
    result.timestamp = m_clock->epochMs();

    // A refresh issued mid-scan supersedes this one; only the newest scan is cached
    if (scan->generation == m_generation) {
        m_cachedResult = result;
        m_lastScanTime = m_clock->monotonicMs();
    }
    if (m_activeScan == scan) {
        m_activeScan.reset();
    }

    detectLog(LogLevel::Info, QString("Scan finished: %1 server(s) on %2 port(s) in %3ms")
              .arg(result.servers.size())
              .arg(result.scannedPorts.size())
              .arg(result.durationMs));

    emit detectionFinished(result);

    const QList<ResultCallback> waiters = scan->waiters;
    for (const auto& waiter : waiters) {
        if (waiter) {
            waiter(result);
        }
    }
}

void DetectionEngine::quickDetect(ServerCallback callback)
{
    if (!hasUsableRoot()) {
        detectLog(LogLevel::Debug, "No project root available, skipping quick detect");
        if (callback) {
            callback(std::nullopt);
        }
        return;
    }

    auto search = std::make_shared<QuickSearch>();
    search->hint = m_inferrer.inferFromProject(m_projectRoot);
    search->ports = m_config.quickPorts;
    search->callback = std::move(callback);

    probeNextQuick(search);
}

void DetectionEngine::probeNextQuick(const std::shared_ptr<QuickSearch>& search)
{
    if (search->next >= search->ports.size()) {
        detectLog(LogLevel::Debug, QString("Quick detect found nothing on %1 port(s)").arg(search->ports.size()));
        if (search->callback) {
            search->callback(std::nullopt);
        }
        return;
    }

    const quint16 port = search->ports.at(search->next++);
    std::weak_ptr<bool> alive = m_alive;

    m_prober->probe(port, [this, alive, search, port](const ProbeResult& probe) {
        auto guard = alive.lock();
        if (!guard || !*guard) {
            return;
        }
        if (!probe.healthy) {
            probeNextQuick(search);
            return;
        }

        DevServer server = makeServer(port, search->hint, probe.serverHeader,
                                      probe.poweredByHeader, probe.timestamp);
        detectLog(LogLevel::Info, QString("Quick detect hit: %1").arg(server.displayTitle()));
        if (search->callback) {
            search->callback(server);
        }
    });
}
