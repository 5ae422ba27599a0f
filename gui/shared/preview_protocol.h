#ifndef LOOKOUT_PREVIEW_PROTOCOL_H
#define LOOKOUT_PREVIEW_PROTOCOL_H

#include <QString>
#include <QJsonObject>
#include <optional>
#include "preview_types.h"

namespace LookoutCommon {

/**
 * Envelope exchanged between the preview controller and the rendering
 * surface: {"type": "...", "payload": {...}}. The payload is omitted on the
 * wire for messages that carry none.
 */
class PreviewMessage {
public:
    enum class Type {
        Init,
        UrlChange,
        ViewportChange,
        Refresh,
        Ready,
        Error,
        HealthCheck,
        FileChanged
    };

    PreviewMessage() = default;
    explicit PreviewMessage(Type type, const QJsonObject& payload = QJsonObject());

    static PreviewMessage init(const QString& url, ViewportMode viewport, const QString& title);
    static PreviewMessage urlChange(const QString& url);
    static PreviewMessage viewportChange(ViewportMode viewport);
    static PreviewMessage refresh();
    static PreviewMessage ready();
    static PreviewMessage error(const QString& message);
    static PreviewMessage healthCheck(bool healthy);
    static PreviewMessage fileChanged(const FileChangeEvent& event);

    Type type() const { return m_type; }
    QString typeId() const { return typeToId(m_type); }
    const QJsonObject& payload() const { return m_payload; }
    bool hasPayload() const { return !m_payload.isEmpty(); }

    QJsonObject toJson() const;
    QString toJsonString() const;

    // Returns nullopt for anything that is not a well formed envelope with a known type
    static std::optional<PreviewMessage> fromJson(const QJsonObject& json);
    static std::optional<PreviewMessage> fromJsonString(const QString& json);

    static QString typeToId(Type type);
    static std::optional<Type> typeFromId(const QString& id);

private:
    Type m_type = Type::Ready;
    QJsonObject m_payload;
};

bool operator==(const PreviewMessage& a, const PreviewMessage& b);

} // namespace LookoutCommon

#endif // LOOKOUT_PREVIEW_PROTOCOL_H
