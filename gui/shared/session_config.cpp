#include "session_config.h"
#include "detection_engine.h"
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <iostream>
#include <sstream>

using namespace LookoutCommon;

namespace LookoutCLI {

namespace {

bool readBool(const QJsonObject& obj, const char* key, std::optional<bool>& out, QString& error) {
    QJsonValue value = obj.value(key);
    if (value.isUndefined()) {
        return true;
    }
    if (!value.isBool()) {
        error = QString("'%1' must be true or false").arg(key);
        return false;
    }
    out = value.toBool();
    return true;
}

bool readInt(const QJsonObject& obj, const char* key, int minValue, std::optional<int>& out, QString& error) {
    QJsonValue value = obj.value(key);
    if (value.isUndefined()) {
        return true;
    }
    if (!value.isDouble() || value.toDouble() != static_cast<double>(value.toInt()) || value.toInt() < minValue) {
        error = QString("'%1' must be a whole number of at least %2").arg(key).arg(minValue);
        return false;
    }
    out = value.toInt();
    return true;
}

bool readPorts(const QJsonObject& obj, const char* key, std::optional<QList<quint16>>& out, QString& error) {
    QJsonValue value = obj.value(key);
    if (value.isUndefined()) {
        return true;
    }
    if (!value.isArray()) {
        error = QString("'%1' must be an array of ports").arg(key);
        return false;
    }

    QList<quint16> ports;
    const QJsonArray array = value.toArray();
    for (const QJsonValue& entry : array) {
        int port = entry.toInt(-1);
        if (!entry.isDouble() || port < 1 || port > 65535) {
            error = QString("'%1' entries must be ports between 1 and 65535").arg(key);
            return false;
        }
        ports.append(static_cast<quint16>(port));
    }
    out = ports;
    return true;
}

bool readMarkers(const QJsonObject& obj, QMap<ServerType, QStringList>& out, QString& error) {
    QJsonValue value = obj.value("markers");
    if (value.isUndefined()) {
        return true;
    }
    if (!value.isObject()) {
        error = "'markers' must map server families to file lists";
        return false;
    }

    const QJsonObject markers = value.toObject();
    for (auto it = markers.constBegin(); it != markers.constEnd(); ++it) {
        auto type = serverTypeFromId(it.key());
        if (!type) {
            error = QString("'markers' has unknown server family '%1'").arg(it.key());
            return false;
        }
        if (!it.value().isArray()) {
            error = QString("'markers.%1' must be an array of file names").arg(it.key());
            return false;
        }

        QStringList files;
        const QJsonArray array = it.value().toArray();
        for (const QJsonValue& entry : array) {
            if (!entry.isString() || entry.toString().isEmpty()) {
                error = QString("'markers.%1' must only contain file names").arg(it.key());
                return false;
            }
            files.append(entry.toString());
        }
        out[*type] = files;
    }
    return true;
}

QString portsToString(const QList<quint16>& ports) {
    QStringList parts;
    for (quint16 port : ports) {
        parts << QString::number(port);
    }
    return parts.join(",");
}

} // namespace

bool parseSettingsJson(const QByteArray& data, SettingsFile& settings, QString& error) {
    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(data, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        error = QString("invalid JSON: %1").arg(parseError.errorString());
        return false;
    }
    if (!doc.isObject()) {
        error = "settings must be a JSON object";
        return false;
    }

    const QJsonObject root = doc.object();

    if (!readBool(root, "autoStart", settings.autoStart, error)) return false;
    if (!readBool(root, "showToolbar", settings.showToolbar, error)) return false;
    if (!readBool(root, "autoSync", settings.autoSync, error)) return false;
    if (!readInt(root, "refreshDelay", 0, settings.refreshDelayMs, error)) return false;

    QJsonValue viewport = root.value("defaultViewport");
    if (!viewport.isUndefined()) {
        auto mode = viewportFromId(viewport.toString());
        if (!viewport.isString() || !mode) {
            error = "'defaultViewport' must be one of: desktop, tablet, mobile";
            return false;
        }
        settings.defaultViewport = *mode;
    }

    QJsonValue detectionValue = root.value("detection");
    if (!detectionValue.isUndefined()) {
        if (!detectionValue.isObject()) {
            error = "'detection' must be an object";
            return false;
        }
        const QJsonObject detection = detectionValue.toObject();
        if (!readPorts(detection, "ports", settings.ports, error)) return false;
        if (!readPorts(detection, "quickPorts", settings.quickPorts, error)) return false;
        if (!readInt(detection, "timeout", 1, settings.timeoutMs, error)) return false;
        if (!readInt(detection, "retries", 0, settings.retries, error)) return false;
        if (!readBool(detection, "https", settings.https, error)) return false;
        if (!readMarkers(detection, settings.markers, error)) return false;
    }

    settings.loaded = true;
    return true;
}

bool loadSettingsFile(const QString& path, SettingsFile& settings, QString& error) {
    settings.path = path;

    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        error = QString("cannot read %1: %2").arg(path, file.errorString());
        return false;
    }

    if (!parseSettingsJson(file.readAll(), settings, error)) {
        error = QString("%1: %2").arg(path, error);
        return false;
    }
    return true;
}

SessionConfig::SessionConfig(const CommonArgs& args, BinaryType binaryType)
    : m_args(args)
    , m_binaryType(binaryType)
{
    resolve();
}

void SessionConfig::fail(ExitCode code, const QString& message) {
    if (hasError()) {
        return;
    }
    m_errorCode = code;
    m_errorMessage = message;
}

void SessionConfig::resolve() {
    if (m_args.hasError) {
        fail(ExitCode::INVALID_ARGUMENTS, QString::fromStdString(m_args.errorMessage));
    }

    m_projectRoot = resolveProjectRoot(m_args.projectPath);

    // Settings file: explicit path must exist, the project default is optional
    QString settingsPath;
    if (!m_args.configPath.empty()) {
        settingsPath = QFileInfo(QString::fromStdString(m_args.configPath)).absoluteFilePath();
        if (!QFileInfo::exists(settingsPath)) {
            fail(ExitCode::CONFIG_FILE_NOT_FOUND, settingsPath);
            settingsPath.clear();
        }
    } else {
        QString candidate = QDir(m_projectRoot).absoluteFilePath(Config::SETTINGS_FILE_NAME);
        if (QFileInfo::exists(candidate)) {
            settingsPath = candidate;
        }
    }

    if (!settingsPath.isEmpty()) {
        QString error;
        if (!loadSettingsFile(settingsPath, m_settings, error)) {
            fail(ExitCode::CONFIG_FILE_INVALID, error);
        }
    }

    // Detection: defaults, then settings, then command line
    m_detection = DetectionConfig::defaults();
    if (m_settings.ports) m_detection.ports = *m_settings.ports;
    if (m_settings.quickPorts) m_detection.quickPorts = *m_settings.quickPorts;
    if (m_settings.timeoutMs) m_detection.timeoutMs = *m_settings.timeoutMs;
    if (m_settings.retries) m_detection.retries = *m_settings.retries;
    if (m_settings.https) m_detection.scheme = *m_settings.https ? "https" : "http";
    for (auto it = m_settings.markers.constBegin(); it != m_settings.markers.constEnd(); ++it) {
        m_detection.markerFiles[it.key()] = it.value();
    }

    if (!m_args.ports.empty()) {
        m_detection.ports = QList<quint16>(m_args.ports.begin(), m_args.ports.end());
    }
    if (!m_args.quickPorts.empty()) {
        m_detection.quickPorts = QList<quint16>(m_args.quickPorts.begin(), m_args.quickPorts.end());
    }
    if (m_args.timeoutMs > 0) m_detection.timeoutMs = m_args.timeoutMs;
    if (m_args.https) m_detection.scheme = "https";

    // Preview: defaults, then settings, then command line
    if (m_settings.autoStart) m_preview.autoStart = *m_settings.autoStart;
    if (m_settings.defaultViewport) m_preview.defaultViewport = *m_settings.defaultViewport;
    if (m_settings.refreshDelayMs) m_preview.refreshDelayMs = *m_settings.refreshDelayMs;
    if (m_settings.showToolbar) m_preview.showToolbar = *m_settings.showToolbar;
    if (m_settings.autoSync) m_preview.autoSync = *m_settings.autoSync;

    if (m_args.noAutoStart) m_preview.autoStart = false;
    if (m_args.noAutoSync) m_preview.autoSync = false;
    if (m_args.hideToolbar) m_preview.showToolbar = false;
    if (m_args.refreshDelayMs >= 0) m_preview.refreshDelayMs = m_args.refreshDelayMs;
    if (!m_args.viewport.empty()) {
        auto mode = viewportFromId(QString::fromStdString(m_args.viewport));
        if (mode) {
            m_preview.defaultViewport = *mode;
        }
    }
}

bool SessionConfig::projectRootExists() const {
    return !m_projectRoot.isEmpty() && QDir(m_projectRoot).exists();
}

int SessionConfig::watchIntervalSeconds() const {
    const int minimum = static_cast<int>((DetectionEngine::CACHE_TTL_MS + 999) / 1000);
    int seconds = m_args.watchSeconds > 0 ? m_args.watchSeconds : DEFAULT_WATCH_SECONDS;
    return qMax(seconds, minimum);
}

std::string generateDryRunConfig(const SessionConfig& config) {
    const CommonArgs& args = config.getArgs();
    const DetectionConfig& detection = config.detectionConfig();
    const PreviewConfig& preview = config.previewConfig();
    std::ostringstream oss;

    oss << "\n========================================\n";
    oss << "Lookout Configuration (--dry-run)\n";
    oss << "========================================\n\n";

    oss << "Binary Type: " << (config.getBinaryType() == BinaryType::Gui ? "gui" : "node") << "\n\n";

    oss << "Project:\n";
    oss << "  Root: " << config.projectRoot().toStdString();
    if (!args.projectPath.empty()) {
        oss << " (from --project)";
    } else if (!qEnvironmentVariable(Config::PROJECT_PATH_ENV).isEmpty()) {
        oss << " (from " << Config::PROJECT_PATH_ENV << ")";
    } else {
        oss << " (working directory)";
    }
    oss << "\n";
    oss << "  Exists: " << (config.projectRootExists() ? "Yes" : "No") << "\n";
    oss << "  Settings File: "
        << (config.settings().loaded ? config.settings().path.toStdString() : std::string("<none>")) << "\n\n";

    oss << "Detection:\n";
    oss << "  Ports: " << portsToString(detection.ports).toStdString() << "\n";
    oss << "  Quick Ports: " << portsToString(detection.quickPorts).toStdString() << "\n";
    oss << "  Timeout: " << detection.timeoutMs << "ms\n";
    oss << "  Retries: " << detection.retries << " (advisory)\n";
    oss << "  Scheme: " << detection.scheme.toStdString() << "\n";
    oss << "  Cache TTL: " << DetectionEngine::CACHE_TTL_MS << "ms\n\n";

    oss << "Preview:\n";
    oss << "  Auto Start: " << (preview.autoStart ? "Yes" : "No") << "\n";
    oss << "  Auto Sync: " << (preview.autoSync ? "Yes" : "No") << "\n";
    oss << "  Default Viewport: " << viewportId(preview.defaultViewport).toStdString() << "\n";
    oss << "  Refresh Delay: " << preview.refreshDelayMs << "ms\n";
    oss << "  Show Toolbar: " << (preview.showToolbar ? "Yes" : "No") << "\n";
    if (config.getBinaryType() == BinaryType::Gui) {
        oss << "  Allow Remote Access: " << (args.allowRemoteAccess ? "Yes" : "No") << "\n";
    }

    if (config.getBinaryType() == BinaryType::Node) {
        oss << "\nOutput:\n";
        oss << "  Mode: " << (args.quick ? "quick detect" : "full scan") << "\n";
        oss << "  Format: " << (args.json ? "json" : "report") << "\n";
        if (args.watch) {
            oss << "  Watch Interval: " << config.watchIntervalSeconds() << "s\n";
        }
    }

    oss << "\n========================================\n\n";

    return oss.str();
}

void printDryRunConfig(const SessionConfig& config) {
    std::cout << generateDryRunConfig(config);
}

} // namespace LookoutCLI
