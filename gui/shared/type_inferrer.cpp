#include "type_inferrer.h"
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>

namespace LookoutCommon {

TypeInferrer::TypeInferrer(const QMap<ServerType, QStringList>& markerFiles)
    : m_markerFiles(markerFiles)
{
}

std::optional<TypeInference> TypeInferrer::inspect(const QString& projectRoot) const {
    if (projectRoot.isEmpty()) {
        return std::nullopt;
    }

    QDir root(projectRoot);
    if (!root.exists()) {
        return std::nullopt;
    }

    // QMap iterates in key order, which is the family priority order
    for (auto it = m_markerFiles.constBegin(); it != m_markerFiles.constEnd(); ++it) {
        for (const QString& file : it.value()) {
            QString filePath = root.absoluteFilePath(file);
            if (!QFileInfo::exists(filePath)) {
                continue;
            }

            if (file == QLatin1String("package.json")) {
                if (packageScriptsMatch(filePath, it.key())) {
                    return TypeInference{it.key(), file};
                }
                continue;
            }

            return TypeInference{it.key(), file};
        }
    }

    return std::nullopt;
}

std::optional<ServerType> TypeInferrer::inferFromProject(const QString& projectRoot) const {
    auto inference = inspect(projectRoot);
    if (!inference) {
        return std::nullopt;
    }
    return inference->type;
}

ServerType TypeInferrer::inferFromHeaders(const QString& server, const QString& poweredBy) {
    if (server.contains("Vite") || poweredBy.contains("Vite")) {
        return ServerType::Vite;
    }
    if (server.contains("Next.js") || poweredBy.contains("Next.js")) {
        return ServerType::NextJs;
    }
    return ServerType::Custom;
}

QStringList TypeInferrer::scriptPatterns(ServerType type) {
    switch (type) {
        case ServerType::Vite:         return {"vite"};
        case ServerType::NextJs:       return {"next dev"};
        case ServerType::Nuxt:         return {"nuxt dev"};
        case ServerType::ReactScripts: return {"react-scripts start"};
        case ServerType::VueCli:       return {"vue-cli-service serve"};
        case ServerType::Angular:      return {"ng serve"};
        case ServerType::SvelteKit:    return {"vite dev"};
        case ServerType::Astro:        return {"astro dev"};
        case ServerType::Remix:        return {"remix dev"};
        case ServerType::Gatsby:       return {"gatsby develop"};
        case ServerType::Parcel:       return {"parcel"};
        case ServerType::Webpack:      return {"webpack serve"};
        case ServerType::Custom:       return {};
    }
    return {};
}

bool TypeInferrer::packageScriptsMatch(const QString& packageJsonPath, ServerType type) {
    QFile file(packageJsonPath);
    if (!file.open(QIODevice::ReadOnly)) {
        return false;
    }

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        return false;
    }

    QJsonObject scripts = doc.object().value("scripts").toObject();
    const QStringList patterns = scriptPatterns(type);

    for (auto it = scripts.constBegin(); it != scripts.constEnd(); ++it) {
        if (!it.value().isString()) {
            continue;
        }
        QString command = it.value().toString();
        for (const QString& pattern : patterns) {
            if (command.contains(pattern)) {
                return true;
            }
        }
    }

    return false;
}

} // namespace LookoutCommon
