#ifndef LOOKOUT_PROJECT_WATCHER_H
#define LOOKOUT_PROJECT_WATCHER_H

#include <QObject>
#include <QString>
#include <QSet>
#include <QHash>
#include "preview_surface.h"

class QFileSystemWatcher;

namespace LookoutCommon {
class Clock;
}

/**
 * Recursive watch over the web sources of a project. Reports created,
 * modified and deleted files whose extension the preview cares about.
 * Dependency, VCS and build output directories are never entered.
 */
class ProjectWatcher : public QObject, public LookoutCommon::ChangeWatcher
{
    Q_OBJECT

public:
    static constexpr int MAX_WATCHED_PATHS = 8192;

    explicit ProjectWatcher(LookoutCommon::Clock* clock = nullptr, QObject* parent = nullptr);
    ~ProjectWatcher() override;

    bool watch(const QString& projectRoot);
    void stop();
    void onChange(ChangeHandler handler) override;

    QString projectRoot() const { return m_root; }
    int watchedFileCount() const { return m_knownFiles.size(); }

    static bool isWatchedFile(const QString& path);
    static bool isIgnoredDirectory(const QString& name);

private slots:
    void handleFileChanged(const QString& path);
    void handleDirectoryChanged(const QString& path);

private:
    void addDirectory(const QString& dirPath);
    QSet<QString> listWatchedFiles(const QString& dirPath) const;
    bool hasCapacity() const;
    void notify(const QString& path, LookoutCommon::FileChangeType type);

    QFileSystemWatcher* m_watcher;
    LookoutCommon::Clock* m_clock;
    ChangeHandler m_handler;
    QString m_root;
    QSet<QString> m_knownFiles;
    QHash<QString, QSet<QString>> m_filesByDir;
    bool m_capacityWarned = false;
};

#endif // LOOKOUT_PROJECT_WATCHER_H
