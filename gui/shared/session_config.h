#ifndef LOOKOUT_SESSION_CONFIG_H
#define LOOKOUT_SESSION_CONFIG_H

#include <QString>
#include <QByteArray>
#include <QList>
#include <QMap>
#include <QStringList>
#include <optional>
#include <string>
#include "cli_args.h"
#include "common.h"
#include "preview_types.h"

namespace LookoutCLI {

// Values read from a .lookout.json settings file; unset fields fall through to defaults
struct SettingsFile {
    QString path;
    bool loaded = false;

    std::optional<bool> autoStart;
    std::optional<LookoutCommon::ViewportMode> defaultViewport;
    std::optional<int> refreshDelayMs;
    std::optional<bool> showToolbar;
    std::optional<bool> autoSync;

    std::optional<QList<quint16>> ports;
    std::optional<QList<quint16>> quickPorts;
    std::optional<int> timeoutMs;
    std::optional<int> retries;
    std::optional<bool> https;
    QMap<LookoutCommon::ServerType, QStringList> markers;
};

// Returns false and fills error when the document is not a valid settings object
bool parseSettingsJson(const QByteArray& data, SettingsFile& settings, QString& error);
bool loadSettingsFile(const QString& path, SettingsFile& settings, QString& error);

// Immutable session configuration: command line, then settings file, then defaults
class SessionConfig {
public:
    explicit SessionConfig(const CommonArgs& args,
                           LookoutCommon::BinaryType binaryType = LookoutCommon::BinaryType::Gui);

    bool hasError() const { return m_errorCode != LookoutCommon::ExitCode::SUCCESS; }
    LookoutCommon::ExitCode errorCode() const { return m_errorCode; }
    QString errorMessage() const { return m_errorMessage; }

    const CommonArgs& getArgs() const { return m_args; }
    LookoutCommon::BinaryType getBinaryType() const { return m_binaryType; }
    QString projectRoot() const { return m_projectRoot; }
    bool projectRootExists() const;
    const SettingsFile& settings() const { return m_settings; }

    const LookoutCommon::DetectionConfig& detectionConfig() const { return m_detection; }
    const LookoutCommon::PreviewConfig& previewConfig() const { return m_preview; }

    // Seconds between --watch rescans, never shorter than the detection cache TTL
    int watchIntervalSeconds() const;

    static constexpr int DEFAULT_WATCH_SECONDS = 5;

private:
    void resolve();
    void fail(LookoutCommon::ExitCode code, const QString& message);

    CommonArgs m_args;
    LookoutCommon::BinaryType m_binaryType;
    QString m_projectRoot;
    SettingsFile m_settings;
    LookoutCommon::DetectionConfig m_detection;
    LookoutCommon::PreviewConfig m_preview;
    LookoutCommon::ExitCode m_errorCode = LookoutCommon::ExitCode::SUCCESS;
    QString m_errorMessage;
};

std::string generateDryRunConfig(const SessionConfig& config);
void printDryRunConfig(const SessionConfig& config);

} // namespace LookoutCLI

#endif // LOOKOUT_SESSION_CONFIG_H
