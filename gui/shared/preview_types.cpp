#include "preview_types.h"
#include <QJsonArray>

namespace LookoutCommon {

namespace {

struct ServerTypeInfo {
    ServerType type;
    const char* id;
    const char* label;
    bool hmr;
};

const ServerTypeInfo SERVER_TYPES[] = {
    {ServerType::Vite,         "vite",          "Vite",       true},
    {ServerType::NextJs,       "nextjs",        "Next.js",    true},
    {ServerType::Nuxt,         "nuxt",          "Nuxt",       true},
    {ServerType::ReactScripts, "react-scripts", "React",      true},
    {ServerType::VueCli,       "vue-cli",       "Vue CLI",    true},
    {ServerType::Angular,      "angular",       "Angular",    false},
    {ServerType::SvelteKit,    "sveltekit",     "SvelteKit",  true},
    {ServerType::Astro,        "astro",         "Astro",      false},
    {ServerType::Remix,        "remix",         "Remix",      false},
    {ServerType::Gatsby,       "gatsby",        "Gatsby",     false},
    {ServerType::Parcel,       "parcel",        "Parcel",     false},
    {ServerType::Webpack,      "webpack",       "Webpack",    false},
    {ServerType::Custom,       "custom",        "Dev Server", false}
};

const ServerTypeInfo* findInfo(ServerType type) {
    for (const auto& info : SERVER_TYPES) {
        if (info.type == type) {
            return &info;
        }
    }
    return nullptr;
}

QJsonArray portsToJson(const QList<quint16>& ports) {
    QJsonArray array;
    for (quint16 port : ports) {
        array.append(static_cast<int>(port));
    }
    return array;
}

} // namespace

QString serverTypeId(ServerType type) {
    const ServerTypeInfo* info = findInfo(type);
    return info ? QString::fromLatin1(info->id) : QStringLiteral("custom");
}

std::optional<ServerType> serverTypeFromId(const QString& id) {
    for (const auto& info : SERVER_TYPES) {
        if (id == QLatin1String(info.id)) {
            return info.type;
        }
    }
    return std::nullopt;
}

QString serverTypeLabel(ServerType type) {
    const ServerTypeInfo* info = findInfo(type);
    return info ? QString::fromLatin1(info->label) : QStringLiteral("Dev Server");
}

QString serverTypeLabel(const QString& id) {
    auto type = serverTypeFromId(id);
    if (!type) {
        return id;
    }
    return serverTypeLabel(*type);
}

bool supportsHmr(ServerType type) {
    const ServerTypeInfo* info = findInfo(type);
    return info && info->hmr;
}

QList<ServerType> allServerTypes() {
    QList<ServerType> types;
    for (const auto& info : SERVER_TYPES) {
        types.append(info.type);
    }
    return types;
}

QString DevServer::previewUrl() const {
    return QString("%1://localhost:%2%3").arg(scheme).arg(port).arg(path);
}

QString DevServer::displayTitle() const {
    return QString("%1 (localhost:%2)").arg(serverTypeLabel(type)).arg(port);
}

QJsonObject DevServer::toJson() const {
    QJsonObject obj;
    obj["type"] = serverTypeId(type);
    obj["port"] = static_cast<int>(port);
    obj["path"] = path;
    obj["hmr"] = hmr;
    obj["lastSeen"] = static_cast<double>(lastSeen);
    obj["healthy"] = healthy;
    if (pid > 0) {
        obj["pid"] = static_cast<double>(pid);
    }
    return obj;
}

bool operator==(const DevServer& a, const DevServer& b) {
    return a.type == b.type && a.port == b.port && a.path == b.path &&
           a.hmr == b.hmr && a.lastSeen == b.lastSeen && a.healthy == b.healthy &&
           a.pid == b.pid && a.scheme == b.scheme;
}

bool operator!=(const DevServer& a, const DevServer& b) {
    return !(a == b);
}

QMap<ServerType, QStringList> DetectionConfig::defaultMarkerFiles() {
    QMap<ServerType, QStringList> markers;
    markers[ServerType::Vite] = {"vite.config.ts", "vite.config.js", "vite.config.mjs"};
    markers[ServerType::NextJs] = {"next.config.js", "next.config.ts", "next.config.mjs"};
    markers[ServerType::Nuxt] = {"nuxt.config.ts", "nuxt.config.js"};
    markers[ServerType::ReactScripts] = {"package.json"};
    markers[ServerType::VueCli] = {"vue.config.js"};
    markers[ServerType::Angular] = {"angular.json"};
    markers[ServerType::SvelteKit] = {"svelte.config.js"};
    markers[ServerType::Astro] = {"astro.config.mjs", "astro.config.ts"};
    markers[ServerType::Remix] = {"remix.config.js"};
    markers[ServerType::Gatsby] = {"gatsby-config.js"};
    markers[ServerType::Parcel] = {".parcelrc", "package.json"};
    markers[ServerType::Webpack] = {"webpack.config.js"};
    markers[ServerType::Custom] = {};
    return markers;
}

DetectionConfig DetectionConfig::defaults() {
    DetectionConfig config;
    config.ports = {3000, 3001, 5173, 5174, 8080, 8081, 4200, 5000, 8000, 9000, 1234, 4000};
    config.quickPorts = {3000, 5173, 8080, 4000};
    config.timeoutMs = 2000;
    config.retries = 2;
    config.scheme = "http";
    config.markerFiles = defaultMarkerFiles();
    return config;
}

QJsonObject DetectionResult::toJson() const {
    QJsonArray serverArray;
    for (const auto& server : servers) {
        serverArray.append(server.toJson());
    }

    QJsonObject obj;
    obj["servers"] = serverArray;
    obj["scannedPorts"] = portsToJson(scannedPorts);
    obj["duration"] = static_cast<double>(durationMs);
    obj["timestamp"] = static_cast<double>(timestamp);
    return obj;
}

bool operator==(const DetectionResult& a, const DetectionResult& b) {
    return a.servers == b.servers && a.scannedPorts == b.scannedPorts &&
           a.durationMs == b.durationMs && a.timestamp == b.timestamp;
}

QString viewportId(ViewportMode mode) {
    switch (mode) {
        case ViewportMode::Desktop: return "desktop";
        case ViewportMode::Tablet:  return "tablet";
        case ViewportMode::Mobile:  return "mobile";
    }
    return "desktop";
}

std::optional<ViewportMode> viewportFromId(const QString& id) {
    if (id == "desktop") return ViewportMode::Desktop;
    if (id == "tablet") return ViewportMode::Tablet;
    if (id == "mobile") return ViewportMode::Mobile;
    return std::nullopt;
}

ViewportDimensions viewportDimensions(ViewportMode mode) {
    switch (mode) {
        case ViewportMode::Desktop: return {ViewportMode::Desktop, 1920, 1080};
        case ViewportMode::Tablet:  return {ViewportMode::Tablet, 768, 1024};
        case ViewportMode::Mobile:  return {ViewportMode::Mobile, 375, 812};
    }
    return {ViewportMode::Desktop, 1920, 1080};
}

QJsonObject ViewportDimensions::toJson() const {
    QJsonObject obj;
    obj["mode"] = viewportId(mode);
    obj["width"] = width;
    obj["height"] = height;
    return obj;
}

QString previewPhaseName(PreviewPhase phase) {
    switch (phase) {
        case PreviewPhase::Empty:     return "Empty";
        case PreviewPhase::Detecting: return "Detecting";
        case PreviewPhase::Live:      return "Live";
        case PreviewPhase::Loading:   return "Loading";
        case PreviewPhase::Error:     return "Error";
    }
    return "Empty";
}

PreviewPhase PreviewPanelState::phase() const {
    if (isLoading) {
        return server ? PreviewPhase::Loading : PreviewPhase::Detecting;
    }
    if (!lastError.isEmpty()) {
        return PreviewPhase::Error;
    }
    return server ? PreviewPhase::Live : PreviewPhase::Empty;
}

QJsonObject PreviewPanelState::toJson() const {
    QJsonObject obj;
    obj["server"] = server ? QJsonValue(server->toJson()) : QJsonValue(QJsonValue::Null);
    obj["viewport"] = viewportId(viewport);
    obj["isLoading"] = isLoading;
    obj["lastError"] = lastError.isEmpty() ? QJsonValue(QJsonValue::Null) : QJsonValue(lastError);
    obj["refreshCount"] = refreshCount;
    obj["lastRefresh"] = static_cast<double>(lastRefresh);
    return obj;
}

QJsonObject PreviewConfig::toJson() const {
    QJsonObject obj;
    obj["autoStart"] = autoStart;
    obj["defaultViewport"] = viewportId(defaultViewport);
    obj["refreshDelay"] = refreshDelayMs;
    obj["showToolbar"] = showToolbar;
    obj["autoSync"] = autoSync;
    return obj;
}

QString fileChangeTypeId(FileChangeType type) {
    switch (type) {
        case FileChangeType::Created:  return "created";
        case FileChangeType::Modified: return "modified";
        case FileChangeType::Deleted:  return "deleted";
    }
    return "modified";
}

std::optional<FileChangeType> fileChangeTypeFromId(const QString& id) {
    if (id == "created") return FileChangeType::Created;
    if (id == "modified") return FileChangeType::Modified;
    if (id == "deleted") return FileChangeType::Deleted;
    return std::nullopt;
}

} // namespace LookoutCommon
