#include "project_watcher.h"
#include "timing.h"
#include "lookoutlogger.h"
#include <QDir>
#include <QFileInfo>
#include <QFileSystemWatcher>

using namespace LookoutCommon;

namespace {

const QStringList WATCHED_SUFFIXES = {
    "html", "css", "scss", "js", "ts", "jsx", "tsx", "vue", "svelte"
};

const QStringList IGNORED_DIRECTORIES = {
    "node_modules", ".git", ".hg", ".svn", "dist", "build", "out",
    ".next", ".nuxt", ".svelte-kit", ".astro", ".cache", ".parcel-cache",
    "coverage", ".turbo", ".vite"
};

} // namespace

ProjectWatcher::ProjectWatcher(Clock* clock, QObject* parent)
    : QObject(parent)
    , m_watcher(new QFileSystemWatcher(this))
    , m_clock(clock ? clock : SystemClock::shared())
{
    connect(m_watcher, &QFileSystemWatcher::fileChanged, this, &ProjectWatcher::handleFileChanged);
    connect(m_watcher, &QFileSystemWatcher::directoryChanged, this, &ProjectWatcher::handleDirectoryChanged);
}

ProjectWatcher::~ProjectWatcher()
{
}

bool ProjectWatcher::isWatchedFile(const QString& path)
{
    return WATCHED_SUFFIXES.contains(QFileInfo(path).suffix().toLower());
}

bool ProjectWatcher::isIgnoredDirectory(const QString& name)
{
    return IGNORED_DIRECTORIES.contains(name);
}

void ProjectWatcher::onChange(ChangeHandler handler)
{
    m_handler = std::move(handler);
}

bool ProjectWatcher::watch(const QString& projectRoot)
{
    stop();

    QDir root(projectRoot);
    if (projectRoot.isEmpty() || !root.exists()) {
        LookoutLogger::instance().warning(QString("Not watching missing project root: %1").arg(projectRoot));
        return false;
    }

    m_root = root.absolutePath();
    addDirectory(m_root);

    LookoutLogger::instance().info(QString("Watching %1 file(s) under %2")
                                   .arg(m_knownFiles.size())
                                   .arg(m_root));
    return true;
}

void ProjectWatcher::stop()
{
    QStringList paths = m_watcher->files() + m_watcher->directories();
    if (!paths.isEmpty()) {
        m_watcher->removePaths(paths);
    }
    m_knownFiles.clear();
    m_filesByDir.clear();
    m_root.clear();
    m_capacityWarned = false;
}

bool ProjectWatcher::hasCapacity() const
{
    return (m_watcher->files().size() + m_watcher->directories().size()) < MAX_WATCHED_PATHS;
}

QSet<QString> ProjectWatcher::listWatchedFiles(const QString& dirPath) const
{
    QSet<QString> files;
    QDir dir(dirPath);
    const QFileInfoList entries = dir.entryInfoList(QDir::Files | QDir::NoDotAndDotDot);
    for (const QFileInfo& entry : entries) {
        if (isWatchedFile(entry.fileName())) {
            files.insert(entry.absoluteFilePath());
        }
    }
    return files;
}

void ProjectWatcher::addDirectory(const QString& dirPath)
{
    if (m_filesByDir.contains(dirPath)) {
        return;
    }
    if (!hasCapacity()) {
        if (!m_capacityWarned) {
            LookoutLogger::instance().warning(QString("Watch limit of %1 paths reached, some files are not watched")
                                              .arg(MAX_WATCHED_PATHS));
            m_capacityWarned = true;
        }
        return;
    }

    m_watcher->addPath(dirPath);

    QSet<QString> files = listWatchedFiles(dirPath);
    for (const QString& file : files) {
        if (hasCapacity()) {
            m_watcher->addPath(file);
        }
        m_knownFiles.insert(file);
    }
    m_filesByDir.insert(dirPath, files);

    QDir dir(dirPath);
    const QFileInfoList subdirs = dir.entryInfoList(QDir::Dirs | QDir::NoDotAndDotDot | QDir::NoSymLinks);
    for (const QFileInfo& subdir : subdirs) {
        if (!isIgnoredDirectory(subdir.fileName())) {
            addDirectory(subdir.absoluteFilePath());
        }
    }
}

void ProjectWatcher::handleFileChanged(const QString& path)
{
    if (QFileInfo::exists(path)) {
        // Editors that save by rename drop the watch; put it back
        if (!m_watcher->files().contains(path)) {
            m_watcher->addPath(path);
        }
        notify(path, FileChangeType::Modified);
    }
    // Removal is reported by the directory scan
}

void ProjectWatcher::handleDirectoryChanged(const QString& path)
{
    if (!QFileInfo::exists(path)) {
        const QSet<QString> gone = m_filesByDir.take(path);
        for (const QString& file : gone) {
            m_knownFiles.remove(file);
            notify(file, FileChangeType::Deleted);
        }
        m_watcher->removePath(path);
        return;
    }

    const QSet<QString> before = m_filesByDir.value(path);
    const QSet<QString> now = listWatchedFiles(path);

    for (const QString& file : now) {
        if (!before.contains(file)) {
            m_watcher->addPath(file);
            m_knownFiles.insert(file);
            notify(file, FileChangeType::Created);
        }
    }
    for (const QString& file : before) {
        if (!now.contains(file)) {
            m_watcher->removePath(file);
            m_knownFiles.remove(file);
            notify(file, FileChangeType::Deleted);
        }
    }
    m_filesByDir.insert(path, now);

    QDir dir(path);
    const QFileInfoList subdirs = dir.entryInfoList(QDir::Dirs | QDir::NoDotAndDotDot | QDir::NoSymLinks);
    for (const QFileInfo& subdir : subdirs) {
        if (!isIgnoredDirectory(subdir.fileName())) {
            addDirectory(subdir.absoluteFilePath());
        }
    }
}

void ProjectWatcher::notify(const QString& path, FileChangeType type)
{
    if (!m_handler) {
        return;
    }

    FileChangeEvent event;
    event.path = path;
    event.type = type;
    event.timestamp = m_clock->epochMs();
    m_handler(event);
}
