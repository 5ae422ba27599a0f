#ifndef LOOKOUT_PREVIEW_SURFACE_H
#define LOOKOUT_PREVIEW_SURFACE_H

#include <QString>
#include <QStringList>
#include <functional>
#include "preview_protocol.h"
#include "preview_types.h"

namespace LookoutCommon {

// The rendering target a PreviewController drives
class PreviewSurface {
public:
    using MessageHandler = std::function<void(const QString& json)>;
    using VisibilityHandler = std::function<void(bool visible)>;

    virtual ~PreviewSurface() = default;

    virtual void setAllowedOrigins(const QStringList& origins) = 0;
    virtual void setHtml(const QString& html) = 0;
    // False when the message could not be delivered
    virtual bool send(const PreviewMessage& message) = 0;
    // Passing an empty handler detaches the previous one
    virtual void onMessage(MessageHandler handler) = 0;
    virtual void onVisibilityChanged(VisibilityHandler handler) = 0;
};

// Source of project file change notifications
class ChangeWatcher {
public:
    using ChangeHandler = std::function<void(const FileChangeEvent& event)>;

    virtual ~ChangeWatcher() = default;
    virtual void onChange(ChangeHandler handler) = 0;
};

} // namespace LookoutCommon

#endif // LOOKOUT_PREVIEW_SURFACE_H
