#ifndef LOOKOUT_PREVIEW_TYPES_H
#define LOOKOUT_PREVIEW_TYPES_H

#include <QString>
#include <QStringList>
#include <QList>
#include <QMap>
#include <QJsonObject>
#include <QtGlobal>
#include <optional>

namespace LookoutCommon {

// Known server families. Declaration order is the inference priority order.
enum class ServerType {
    Vite,
    NextJs,
    Nuxt,
    ReactScripts,
    VueCli,
    Angular,
    SvelteKit,
    Astro,
    Remix,
    Gatsby,
    Parcel,
    Webpack,
    Custom
};

QString serverTypeId(ServerType type);
std::optional<ServerType> serverTypeFromId(const QString& id);
QString serverTypeLabel(ServerType type);
QString serverTypeLabel(const QString& id);  // unknown ids pass through unchanged
bool supportsHmr(ServerType type);
QList<ServerType> allServerTypes();

/**
 * A detected running server. Identity is (type, port); it lives only as
 * long as probes keep succeeding and is never persisted.
 */
struct DevServer {
    ServerType type = ServerType::Custom;
    quint16 port = 0;
    QString path = "/";
    bool hmr = false;
    qint64 lastSeen = 0;      // epoch ms of the last successful probe
    bool healthy = false;
    qint64 pid = 0;           // 0 when unknown
    QString scheme = "http";

    QString previewUrl() const;
    QString displayTitle() const;
    QJsonObject toJson() const;

    bool sameIdentity(const DevServer& other) const {
        return type == other.type && port == other.port;
    }
};

bool operator==(const DevServer& a, const DevServer& b);
bool operator!=(const DevServer& a, const DevServer& b);

struct DetectionConfig {
    QList<quint16> ports;
    QList<quint16> quickPorts;
    int timeoutMs = 2000;
    int retries = 2;          // advisory only, no retry loop consumes it
    QString scheme = "http";
    QMap<ServerType, QStringList> markerFiles;

    static DetectionConfig defaults();
    static QMap<ServerType, QStringList> defaultMarkerFiles();
};

struct DetectionResult {
    QList<DevServer> servers;
    QList<quint16> scannedPorts;
    qint64 durationMs = 0;
    qint64 timestamp = 0;

    QJsonObject toJson() const;
};

bool operator==(const DetectionResult& a, const DetectionResult& b);

enum class ViewportMode {
    Desktop,
    Tablet,
    Mobile
};

struct ViewportDimensions {
    ViewportMode mode = ViewportMode::Desktop;
    int width = 1920;
    int height = 1080;

    QJsonObject toJson() const;
};

QString viewportId(ViewportMode mode);
std::optional<ViewportMode> viewportFromId(const QString& id);
ViewportDimensions viewportDimensions(ViewportMode mode);

enum class PreviewPhase {
    Empty,
    Detecting,
    Live,
    Loading,
    Error
};

QString previewPhaseName(PreviewPhase phase);

struct PreviewPanelState {
    std::optional<DevServer> server;
    ViewportMode viewport = ViewportMode::Desktop;
    bool isLoading = false;
    QString lastError;        // empty when there is no error
    int refreshCount = 0;
    qint64 lastRefresh = 0;

    PreviewPhase phase() const;
    QJsonObject toJson() const;
};

struct PreviewConfig {
    bool autoStart = true;
    ViewportMode defaultViewport = ViewportMode::Desktop;
    int refreshDelayMs = 300;
    bool showToolbar = true;
    bool autoSync = true;

    QJsonObject toJson() const;
};

enum class FileChangeType {
    Created,
    Modified,
    Deleted
};

QString fileChangeTypeId(FileChangeType type);
std::optional<FileChangeType> fileChangeTypeFromId(const QString& id);

struct FileChangeEvent {
    QString path;
    FileChangeType type = FileChangeType::Modified;
    qint64 timestamp = 0;
};

} // namespace LookoutCommon

#endif // LOOKOUT_PREVIEW_TYPES_H
