#include <QVBoxLayout>
#include <QHBoxLayout>
#include <QLabel>
#include <QLineEdit>
#include <QPushButton>
#include <QButtonGroup>
#include <QDesktopServices>
#include <QFile>
#include <QShowEvent>
#include <QHideEvent>
#include <QWebChannel>

#include "previewwidget.h"
#include "sandboxedwebview.h"
#include "previewbridge.h"
#include "../shared/preview_page.h"
#include "../shared/lookoutlogger.h"

using namespace LookoutCommon;

namespace {

// Page origin for setHtml; requests to it never leave the interceptor
const QUrl PAGE_BASE_URL("http://localhost/");

} // namespace

PreviewWidget::PreviewWidget(bool allowRemoteAccess, QWidget *parent)
    : QWidget(parent), m_webChannel(nullptr), m_bridge(nullptr), m_pageConnected(false)
{
  m_mainLayout = new QVBoxLayout(this);
  m_mainLayout->setContentsMargins(0, 0, 0, 0);
  m_mainLayout->setSpacing(0);

  m_toolbar = createToolbar();
  m_mainLayout->addWidget(m_toolbar);

  m_view = new SandboxedWebView(allowRemoteAccess, this);
  m_mainLayout->addWidget(m_view, 1);

  setStyleSheet("PreviewWidget { background-color: #1e1e1e; }");

  connect(m_view, &SandboxedWebView::loadFinished, this, &PreviewWidget::handleLoadFinished);
  setupWebChannel();
}

PreviewWidget::~PreviewWidget()
{
  m_messageHandler = nullptr;
  m_visibilityHandler = nullptr;
}

QWidget *PreviewWidget::createToolbar()
{
  QWidget *toolbar = new QWidget(this);
  toolbar->setObjectName("previewToolbar");
  toolbar->setStyleSheet(
    "#previewToolbar { background-color: #2b2b2b; border-bottom: 1px solid #3c3c3c; }"
    "QPushButton { color: #d0d0d0; background: transparent; border: 1px solid #444; "
    "              border-radius: 3px; padding: 3px 8px; }"
    "QPushButton:checked { background: #3d5a80; border-color: #3d5a80; }"
    "QPushButton:disabled { color: #666; }"
    "QLineEdit { color: #d0d0d0; background: #1e1e1e; border: 1px solid #444; "
    "            border-radius: 3px; padding: 3px 6px; }"
    "QLabel { color: #a0a0a0; }");

  QHBoxLayout *layout = new QHBoxLayout(toolbar);
  layout->setContentsMargins(6, 4, 6, 4);
  layout->setSpacing(4);

  m_viewportGroup = new QButtonGroup(this);
  m_viewportGroup->setExclusive(true);
  const QList<QPair<ViewportMode, QString>> viewports = {
    {ViewportMode::Desktop, tr("Desktop")},
    {ViewportMode::Tablet, tr("Tablet")},
    {ViewportMode::Mobile, tr("Mobile")}
  };
  for (const auto &entry : viewports)
  {
    QPushButton *button = new QPushButton(entry.second, toolbar);
    button->setCheckable(true);
    ViewportDimensions dims = viewportDimensions(entry.first);
    button->setToolTip(QString("%1 x %2").arg(dims.width).arg(dims.height));
    m_viewportGroup->addButton(button, static_cast<int>(entry.first));
    layout->addWidget(button);
  }
  connect(m_viewportGroup, &QButtonGroup::idClicked, this, [this](int id) {
    emit viewportRequested(static_cast<ViewportMode>(id));
  });

  m_urlField = new QLineEdit(toolbar);
  m_urlField->setPlaceholderText(tr("No dev server"));
  connect(m_urlField, &QLineEdit::returnPressed, this, &PreviewWidget::handleUrlEntered);
  layout->addWidget(m_urlField, 1);

  m_refreshButton = new QPushButton(tr("Refresh"), toolbar);
  m_externalButton = new QPushButton(tr("Open"), toolbar);
  m_externalButton->setToolTip(tr("Open in the system browser"));
  m_detectButton = new QPushButton(tr("Detect"), toolbar);
  m_stopButton = new QPushButton(tr("Stop"), toolbar);
  layout->addWidget(m_refreshButton);
  layout->addWidget(m_externalButton);
  layout->addWidget(m_detectButton);
  layout->addWidget(m_stopButton);

  connect(m_refreshButton, &QPushButton::clicked, this, &PreviewWidget::refreshRequested);
  connect(m_externalButton, &QPushButton::clicked, this, &PreviewWidget::handleOpenExternalBrowser);
  connect(m_detectButton, &QPushButton::clicked, this, &PreviewWidget::detectRequested);
  connect(m_stopButton, &QPushButton::clicked, this, &PreviewWidget::stopRequested);

  m_statusLabel = new QLabel(toolbar);
  m_statusLabel->setMinimumWidth(90);
  layout->addWidget(m_statusLabel);

  return toolbar;
}

void PreviewWidget::setupWebChannel()
{
  m_webChannel = new QWebChannel(this);
  m_bridge = new PreviewBridge(this);

  connect(m_bridge, &PreviewBridge::messageFromPage, this, &PreviewWidget::handleMessageFromPage);

  m_webChannel->registerObject(QString::fromLatin1(PREVIEW_BRIDGE_OBJECT), m_bridge);
  m_view->page()->setWebChannel(m_webChannel);
}

void PreviewWidget::setAllowedOrigins(const QStringList &origins)
{
  m_view->setAllowedOrigins(origins);
}

void PreviewWidget::setHtml(const QString &html)
{
  // The new page has to connect again before messages reach it
  m_pageConnected = false;
  m_view->setHtml(html, PAGE_BASE_URL);
}

bool PreviewWidget::send(const PreviewMessage &message)
{
  if (!m_pageConnected)
  {
    return false;
  }
  m_bridge->sendToPage(message.toJsonString());
  return true;
}

void PreviewWidget::onMessage(MessageHandler handler)
{
  m_messageHandler = std::move(handler);
}

void PreviewWidget::onVisibilityChanged(VisibilityHandler handler)
{
  m_visibilityHandler = std::move(handler);
}

void PreviewWidget::setToolbarVisible(bool visible)
{
  m_toolbar->setVisible(visible);
}

void PreviewWidget::handleLoadFinished(bool ok)
{
  if (!ok)
  {
    LookoutLogger::instance().warning("[PREVIEW] Preview page failed to load");
    return;
  }

  // Inject the QWebChannel library, then hand the bridge to the page
  QFile webChannelFile(":/qtwebchannel/qwebchannel.js");
  if (!webChannelFile.open(QIODevice::ReadOnly))
  {
    LookoutLogger::instance().error("[PREVIEW] Failed to load qwebchannel.js");
    return;
  }

  QString webChannelJs = QString::fromUtf8(webChannelFile.readAll());
  m_view->page()->runJavaScript(webChannelJs);

  QString setupScript = QString(R"(
    (function() {
      if (typeof QWebChannel === 'undefined' || typeof window.lookoutConnect !== 'function') {
        console.error('[Lookout] Preview bridge unavailable');
        return;
      }
      new QWebChannel(qt.webChannelTransport, function(channel) {
        window.lookoutConnect(channel.objects.%1);
      });
    })();
  )").arg(QString::fromLatin1(PREVIEW_BRIDGE_OBJECT));
  m_view->page()->runJavaScript(setupScript);
}

void PreviewWidget::handleMessageFromPage(const QString &json)
{
  // Anything arriving from the page proves the bridge is up
  m_pageConnected = true;
  if (m_messageHandler)
  {
    m_messageHandler(json);
  }
}

void PreviewWidget::handleUrlEntered()
{
  QString text = m_urlField->text().trimmed();
  if (text.isEmpty())
  {
    return;
  }
  QUrl url = QUrl::fromUserInput(text);
  if (!url.isValid())
  {
    LookoutLogger::instance().warning(QString("[PREVIEW] Ignoring invalid URL: %1").arg(text));
    return;
  }
  emit urlRequested(url.toString());
}

void PreviewWidget::handleOpenExternalBrowser()
{
  if (m_serverUrl.isValid())
  {
    QDesktopServices::openUrl(m_serverUrl);
  }
}

void PreviewWidget::updateState(const PreviewPanelState &state)
{
  const bool hasServer = state.server.has_value();
  m_serverUrl = hasServer ? QUrl(state.server->previewUrl()) : QUrl();

  if (QAbstractButton *button = m_viewportGroup->button(static_cast<int>(state.viewport)))
  {
    button->setChecked(true);
  }

  if (!m_urlField->hasFocus())
  {
    m_urlField->setText(hasServer ? state.server->previewUrl() : QString());
  }
  m_urlField->setEnabled(hasServer);
  m_refreshButton->setEnabled(hasServer);
  m_externalButton->setEnabled(hasServer);
  m_stopButton->setEnabled(hasServer || state.isLoading);
  m_detectButton->setEnabled(!state.isLoading);

  m_statusLabel->setText(previewPhaseName(state.phase()));
  m_statusLabel->setToolTip(state.lastError);
}

void PreviewWidget::showEvent(QShowEvent *event)
{
  QWidget::showEvent(event);
  if (m_visibilityHandler)
  {
    m_visibilityHandler(true);
  }
}

void PreviewWidget::hideEvent(QHideEvent *event)
{
  QWidget::hideEvent(event);
  if (m_visibilityHandler)
  {
    m_visibilityHandler(false);
  }
}
