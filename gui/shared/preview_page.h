#ifndef LOOKOUT_PREVIEW_PAGE_H
#define LOOKOUT_PREVIEW_PAGE_H

#include <QString>
#include "preview_types.h"

namespace LookoutCommon {

// Name under which the surface bridge is registered on the web channel
constexpr const char* PREVIEW_BRIDGE_OBJECT = "lookout";

/**
 * Full HTML document for the preview surface. The page embeds the current
 * state and config, frames the server at the viewport size and speaks the
 * preview message protocol once window.lookoutConnect(bridge) is called.
 * Every inline script carries the given CSP nonce.
 */
QString renderPreviewPage(const PreviewPanelState& state, const PreviewConfig& config, const QString& nonce);

// JSON safe to embed inside a <script> element
QString scriptSafeJson(const QJsonObject& object);

} // namespace LookoutCommon

#endif // LOOKOUT_PREVIEW_PAGE_H
