#include "preview_protocol.h"
#include <QJsonDocument>
#include <QJsonParseError>

namespace LookoutCommon {

PreviewMessage::PreviewMessage(Type type, const QJsonObject& payload)
    : m_type(type)
    , m_payload(payload)
{
}

PreviewMessage PreviewMessage::init(const QString& url, ViewportMode viewport, const QString& title) {
    QJsonObject payload;
    payload["url"] = url;
    payload["viewport"] = viewportId(viewport);
    payload["title"] = title;
    return PreviewMessage(Type::Init, payload);
}

PreviewMessage PreviewMessage::urlChange(const QString& url) {
    QJsonObject payload;
    payload["url"] = url;
    return PreviewMessage(Type::UrlChange, payload);
}

PreviewMessage PreviewMessage::viewportChange(ViewportMode viewport) {
    QJsonObject payload;
    payload["viewport"] = viewportId(viewport);
    payload["dimensions"] = viewportDimensions(viewport).toJson();
    return PreviewMessage(Type::ViewportChange, payload);
}

PreviewMessage PreviewMessage::refresh() {
    return PreviewMessage(Type::Refresh);
}

PreviewMessage PreviewMessage::ready() {
    return PreviewMessage(Type::Ready);
}

PreviewMessage PreviewMessage::error(const QString& message) {
    QJsonObject payload;
    payload["message"] = message;
    return PreviewMessage(Type::Error, payload);
}

PreviewMessage PreviewMessage::healthCheck(bool healthy) {
    QJsonObject payload;
    payload["healthy"] = healthy;
    return PreviewMessage(Type::HealthCheck, payload);
}

PreviewMessage PreviewMessage::fileChanged(const FileChangeEvent& event) {
    QJsonObject payload;
    payload["filePath"] = event.path;
    payload["changeType"] = fileChangeTypeId(event.type);
    return PreviewMessage(Type::FileChanged, payload);
}

QJsonObject PreviewMessage::toJson() const {
    QJsonObject obj;
    obj["type"] = typeToId(m_type);
    if (!m_payload.isEmpty()) {
        obj["payload"] = m_payload;
    }
    return obj;
}

QString PreviewMessage::toJsonString() const {
    return QString::fromUtf8(QJsonDocument(toJson()).toJson(QJsonDocument::Compact));
}

std::optional<PreviewMessage> PreviewMessage::fromJson(const QJsonObject& json) {
    QJsonValue typeValue = json.value("type");
    if (!typeValue.isString()) {
        return std::nullopt;
    }

    auto type = typeFromId(typeValue.toString());
    if (!type) {
        return std::nullopt;
    }

    QJsonValue payloadValue = json.value("payload");
    if (payloadValue.isUndefined() || payloadValue.isNull()) {
        return PreviewMessage(*type);
    }
    if (!payloadValue.isObject()) {
        return std::nullopt;
    }

    return PreviewMessage(*type, payloadValue.toObject());
}

std::optional<PreviewMessage> PreviewMessage::fromJsonString(const QString& json) {
    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(json.toUtf8(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        return std::nullopt;
    }
    return fromJson(doc.object());
}

QString PreviewMessage::typeToId(Type type) {
    switch (type) {
        case Type::Init:           return "init";
        case Type::UrlChange:      return "url-change";
        case Type::ViewportChange: return "viewport-change";
        case Type::Refresh:        return "refresh";
        case Type::Ready:          return "ready";
        case Type::Error:          return "error";
        case Type::HealthCheck:    return "health-check";
        case Type::FileChanged:    return "file-changed";
    }
    return "ready";
}

std::optional<PreviewMessage::Type> PreviewMessage::typeFromId(const QString& id) {
    static const Type all[] = {
        Type::Init, Type::UrlChange, Type::ViewportChange, Type::Refresh,
        Type::Ready, Type::Error, Type::HealthCheck, Type::FileChanged
    };
    for (Type type : all) {
        if (typeToId(type) == id) {
            return type;
        }
    }
    return std::nullopt;
}

bool operator==(const PreviewMessage& a, const PreviewMessage& b) {
    return a.type() == b.type() && a.payload() == b.payload();
}

} // namespace LookoutCommon
