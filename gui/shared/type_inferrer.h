#ifndef LOOKOUT_TYPE_INFERRER_H
#define LOOKOUT_TYPE_INFERRER_H

#include <QString>
#include <QStringList>
#include <QMap>
#include <optional>
#include "preview_types.h"

namespace LookoutCommon {

struct TypeInference {
    ServerType type = ServerType::Custom;
    QString markerFile;       // the file that decided the match
};

/**
 * Decides which server family a project uses from the marker files in its
 * root. Families are tried in ServerType order and the first match wins.
 * A package.json marker only counts when one of its scripts mentions the
 * family's own command.
 */
class TypeInferrer {
public:
    explicit TypeInferrer(const QMap<ServerType, QStringList>& markerFiles);

    std::optional<TypeInference> inspect(const QString& projectRoot) const;
    std::optional<ServerType> inferFromProject(const QString& projectRoot) const;

    // Header fallback used when no marker matched
    static ServerType inferFromHeaders(const QString& server, const QString& poweredBy);

    static QStringList scriptPatterns(ServerType type);
    static bool packageScriptsMatch(const QString& packageJsonPath, ServerType type);

private:
    QMap<ServerType, QStringList> m_markerFiles;
};

} // namespace LookoutCommon

#endif // LOOKOUT_TYPE_INFERRER_H
