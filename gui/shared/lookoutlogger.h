#ifndef LOOKOUT_LOGGER_H
#define LOOKOUT_LOGGER_H

#include <QObject>
#include <QString>
#include <QJsonObject>
#include <QVector>
#include <QMutex>
#include <QFile>
#include <QTextStream>
#include <memory>
#include <unordered_map>

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warning = 2,
    Error = 3,
    Critical = 4
};

struct LookoutLoggerConfig {
    QString appName;                    // Required: "gui", "node" or "tests"
    QString baseLogDir;                 // Default: <GenericDataLocation>/Lookout/logs
    int maxSessions = 5;                // Keep last 5 session folders

    struct LogFile {
        QString name;                   // e.g., "gui.log", "detect.log"
        QString category;               // Category that maps to this file
        bool jsonFormat = false;        // Plain text or JSONL
    };
    QVector<LogFile> logFiles;

    bool consoleEnabled = true;
    bool consoleColors = true;
    bool emitQtSignals = false;         // Status bar integration in the GUI
    LogLevel minLevel = LogLevel::Debug;
};

class LookoutLogger : public QObject {
    Q_OBJECT

public:
    // Simple initialization - just app name, defaults for everything else
    static void initialize(const QString& appName);

    static void initialize(const LookoutLoggerConfig& config);

    static LookoutLogger& instance();

    static bool isInitialized();

    void log(LogLevel level, const QString& category, const QString& message);
    void log(LogLevel level, const QString& category, const QString& message,
             const QJsonObject& metadata);

    // Convenience methods that use the default category (first configured file)
    void debug(const QString& message);
    void info(const QString& message);
    void warning(const QString& message);
    void error(const QString& message);
    void critical(const QString& message);

    QString currentSessionPath() const { return m_sessionPath; }

    void flush();

    static QString getLookoutDataPath();
    static QString getBaseLogDir();

signals:
    void logMessage(LogLevel level, const QString& category,
                    const QString& message, const QJsonObject& metadata);

public:
    LookoutLogger();
    ~LookoutLogger();

private:
    void initializeWithConfig(const LookoutLoggerConfig& config);
    QString createSessionFolder();
    void cleanupOldSessions();
    void openLogFiles();
    void closeLogFiles();
    void writeToFile(const QString& category, LogLevel level,
                     const QString& message, const QJsonObject& metadata);
    void writeToConsole(LogLevel level, const QString& category, const QString& message);
    QString levelToString(LogLevel level) const;
    QString levelToColorCode(LogLevel level) const;

    LookoutLoggerConfig m_config;
    QString m_sessionPath;
    QString m_defaultCategory;
    mutable QMutex m_mutex;

    struct FileInfo {
        std::unique_ptr<QFile> file;
        std::unique_ptr<QTextStream> stream;
        bool jsonFormat;
    };
    std::unordered_map<QString, FileInfo> m_files;

    static std::unique_ptr<LookoutLogger> s_instance;
    static QMutex s_instanceMutex;
};

#define LOOKOUT_LOG_DEBUG(msg) LookoutLogger::instance().debug(msg)
#define LOOKOUT_LOG_INFO(msg) LookoutLogger::instance().info(msg)
#define LOOKOUT_LOG_WARNING(msg) LookoutLogger::instance().warning(msg)
#define LOOKOUT_LOG_ERROR(msg) LookoutLogger::instance().error(msg)
#define LOOKOUT_LOG_CRITICAL(msg) LookoutLogger::instance().critical(msg)

// Detection traffic goes to its own file when one is configured for it
#define LOOKOUT_DETECT_LOG(level, msg) LookoutLogger::instance().log(level, QStringLiteral("detect"), msg)

#endif // LOOKOUT_LOGGER_H
