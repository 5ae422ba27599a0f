#ifndef LOOKOUT_PREVIEWWIDGET_H
#define LOOKOUT_PREVIEWWIDGET_H

#include <QWidget>
#include <QUrl>
#include "../shared/preview_surface.h"
#include "../shared/preview_types.h"

class QHBoxLayout;
class QVBoxLayout;
class QLabel;
class QLineEdit;
class QPushButton;
class QButtonGroup;
class QWebChannel;
class SandboxedWebView;
class PreviewBridge;

/**
 * Toolbar plus sandboxed web view. Acts as the PreviewSurface for a
 * PreviewController: the controller renders the page into it, and the
 * page talks back through a PreviewBridge on a QWebChannel.
 *
 * Toolbar actions are only reported through signals; the window decides
 * what they mean.
 */
class PreviewWidget : public QWidget, public LookoutCommon::PreviewSurface
{
  Q_OBJECT
public:
  explicit PreviewWidget(bool allowRemoteAccess = false, QWidget *parent = nullptr);
  ~PreviewWidget() override;

  // PreviewSurface
  void setAllowedOrigins(const QStringList &origins) override;
  void setHtml(const QString &html) override;
  bool send(const LookoutCommon::PreviewMessage &message) override;
  void onMessage(MessageHandler handler) override;
  void onVisibilityChanged(VisibilityHandler handler) override;

  void setToolbarVisible(bool visible);
  bool isPageConnected() const { return m_pageConnected; }

public slots:
  void updateState(const LookoutCommon::PreviewPanelState &state);

signals:
  void detectRequested();
  void stopRequested();
  void refreshRequested();
  void viewportRequested(LookoutCommon::ViewportMode mode);
  void urlRequested(const QString &url);

protected:
  void showEvent(QShowEvent *event) override;
  void hideEvent(QHideEvent *event) override;

private slots:
  void handleLoadFinished(bool ok);
  void handleMessageFromPage(const QString &json);
  void handleUrlEntered();
  void handleOpenExternalBrowser();

private:
  QWidget *createToolbar();
  void setupWebChannel();

  QVBoxLayout *m_mainLayout;
  QWidget *m_toolbar;
  QButtonGroup *m_viewportGroup;
  QLineEdit *m_urlField;
  QPushButton *m_refreshButton;
  QPushButton *m_externalButton;
  QPushButton *m_detectButton;
  QPushButton *m_stopButton;
  QLabel *m_statusLabel;

  SandboxedWebView *m_view;
  QWebChannel *m_webChannel;
  PreviewBridge *m_bridge;

  MessageHandler m_messageHandler;
  VisibilityHandler m_visibilityHandler;
  bool m_pageConnected;
  QUrl m_serverUrl;
};

#endif // LOOKOUT_PREVIEWWIDGET_H
