#include "preview_page.h"
#include <QJsonDocument>
#include <QJsonObject>
#include <QHash>
#include <QRegularExpression>

namespace LookoutCommon {

namespace {

const char* PAGE_TEMPLATE = R"HTML(<!DOCTYPE html>
<html lang="en">
<head>
  <meta charset="UTF-8">
  <meta name="viewport" content="width=device-width, initial-scale=1.0">
  <meta http-equiv="Content-Security-Policy" content="default-src 'none'; frame-src http: https:; script-src 'nonce-%NONCE%' 'unsafe-inline'; style-src 'unsafe-inline'; img-src data: http: https:;">
  <title>Lookout Preview</title>
  <style nonce="%NONCE%">
    html, body { margin: 0; height: 100%; background: #1e1e1e; color: #c8c8c8;
                 font-family: -apple-system, "Segoe UI", Roboto, sans-serif; font-size: 13px; }
    #stage { display: flex; align-items: flex-start; justify-content: center;
             height: 100%; overflow: auto; }
    #frame { border: 0; background: #fff; transform-origin: top center; }
    #empty { display: none; padding: 32px; text-align: center; line-height: 1.5; }
    #empty.visible { display: block; }
    #title { position: fixed; left: 8px; bottom: 6px; opacity: 0.6; font-size: 11px; }
  </style>
</head>
<body>
  <div id="stage">
    <div id="empty"></div>
    <iframe id="frame" title="preview" sandbox="allow-scripts allow-same-origin allow-forms allow-popups allow-modals"></iframe>
  </div>
  <div id="title"></div>
  <script nonce="%NONCE%">
    window.initialState = %STATE%;
    window.config = %CONFIG%;
    window.viewports = %VIEWPORTS%;
  </script>
  <script nonce="%NONCE%">
  (function() {
    var frame = document.getElementById('frame');
    var empty = document.getElementById('empty');
    var title = document.getElementById('title');
    var bridge = null;
    var currentUrl = null;
    var viewport = window.initialState.viewport || window.config.defaultViewport;

    function send(message) {
      if (bridge) {
        bridge.postMessage(JSON.stringify(message));
      }
    }

    function applyViewport(mode) {
      var dims = window.viewports[mode] || window.viewports.desktop;
      viewport = mode;
      frame.style.width = dims.width + 'px';
      frame.style.height = dims.height + 'px';
      var scale = Math.min(1, document.body.clientWidth / dims.width);
      frame.style.transform = 'scale(' + scale + ')';
    }

    function showEmpty(text) {
      frame.style.display = 'none';
      empty.textContent = text;
      empty.className = 'visible';
    }

    function navigate(url) {
      currentUrl = url;
      empty.className = '';
      frame.style.display = 'block';
      frame.src = url;
    }

    function handle(message) {
      var payload = message.payload || {};
      switch (message.type) {
        case 'init':
          title.textContent = payload.title || '';
          applyViewport(payload.viewport || viewport);
          navigate(payload.url);
          break;
        case 'url-change':
          navigate(payload.url);
          break;
        case 'viewport-change':
          applyViewport(payload.viewport);
          break;
        case 'refresh':
          if (currentUrl) {
            frame.src = currentUrl;
          }
          break;
        case 'health-check':
          window.lookoutHealthy = payload.healthy === true;
          break;
      }
    }

    frame.addEventListener('error', function() {
      send({ type: 'error', payload: { message: 'Failed to load ' + (currentUrl || 'preview') } });
    });

    window.addEventListener('resize', function() { applyViewport(viewport); });

    window.lookoutConnect = function(channelBridge) {
      bridge = channelBridge;
      bridge.messageToPage.connect(function(json) {
        try {
          handle(JSON.parse(json));
        } catch (e) {
          send({ type: 'error', payload: { message: String(e) } });
        }
      });
      send({ type: 'ready' });
      send({ type: 'health-check' });
    };

    applyViewport(viewport);
    var state = window.initialState;
    if (state.server) {
      navigate(state.server.scheme === 'https'
               ? 'https://localhost:' + state.server.port + state.server.path
               : 'http://localhost:' + state.server.port + state.server.path);
    } else {
      showEmpty(state.lastError || 'Waiting for a dev server. Start yours or press Detect.');
    }
  })();
  </script>
</body>
</html>
)HTML";

} // namespace

QString scriptSafeJson(const QJsonObject& object) {
    QString json = QString::fromUtf8(QJsonDocument(object).toJson(QJsonDocument::Compact));
    json.replace("</", "<\\/");
    return json;
}

QString renderPreviewPage(const PreviewPanelState& state, const PreviewConfig& config, const QString& nonce) {
    QJsonObject stateJson = state.toJson();
    if (state.server) {
        QJsonObject serverJson = state.server->toJson();
        serverJson["scheme"] = state.server->scheme;
        stateJson["server"] = serverJson;
    }

    QJsonObject viewports;
    for (ViewportMode mode : {ViewportMode::Desktop, ViewportMode::Tablet, ViewportMode::Mobile}) {
        viewports[viewportId(mode)] = viewportDimensions(mode).toJson();
    }

    const QHash<QString, QString> values = {
        {"NONCE", nonce},
        {"STATE", scriptSafeJson(stateJson)},
        {"CONFIG", scriptSafeJson(config.toJson())},
        {"VIEWPORTS", scriptSafeJson(viewports)},
    };

    // One pass over the template, so substituted text is never scanned again
    static const QRegularExpression placeholder("%([A-Z]+)%");
    const QString source = QString::fromUtf8(PAGE_TEMPLATE);
    QString html;
    html.reserve(source.size() * 2);
    qsizetype last = 0;
    auto it = placeholder.globalMatch(source);
    while (it.hasNext()) {
        QRegularExpressionMatch match = it.next();
        auto value = values.constFind(match.captured(1));
        if (value == values.constEnd()) {
            continue;
        }
        html += QStringView(source).mid(last, match.capturedStart() - last);
        html += *value;
        last = match.capturedEnd();
    }
    html += QStringView(source).mid(last);
    return html;
}

} // namespace LookoutCommon
