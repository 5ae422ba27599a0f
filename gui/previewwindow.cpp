#include "previewwindow.h"
#include <QApplication>
#include <QSettings>
#include <QCloseEvent>
#include <QMessageBox>
#include <QMenuBar>
#include <QMenu>
#include <QAction>
#include <QActionGroup>
#include <QStatusBar>
#include <QLabel>
#include <QTimer>
#include <QFileInfo>
#include <QDir>
#include <QJsonObject>
#include "widgets/previewwidget.h"
#include "shared/detection_engine.h"
#include "shared/preview_controller.h"
#include "shared/project_watcher.h"
#include "shared/health_prober.h"
#include "shared/session_config.h"
#include "shared/timing.h"
#include "shared/common.h"
#include "shared/lookoutlogger.h"

using namespace LookoutCommon;

PreviewWindow::PreviewWindow(const LookoutCLI::SessionConfig &config, QWidget *parent)
    : QMainWindow(parent),
      m_projectRoot(config.projectRoot()),
      m_phaseLabel(nullptr),
      m_viewportActions(nullptr)
{
  QCoreApplication::setOrganizationName("Lookout");
  QCoreApplication::setApplicationName("Lookout");

  QString projectName = QFileInfo(m_projectRoot).fileName();
  if (projectName.isEmpty()) {
    projectName = QDir::toNativeSeparators(m_projectRoot);
  }
  setWindowTitle(QString("Lookout - %1").arg(projectName));

  resize(1280, 860);

  QSettings settings;
  if (settings.contains("PreviewWindow/geometry"))
  {
    restoreGeometry(settings.value("PreviewWindow/geometry").toByteArray());
  }

  const DetectionConfig &detection = config.detectionConfig();
  const PreviewConfig &preview = config.previewConfig();

  m_previewWidget = std::make_unique<PreviewWidget>(config.getArgs().allowRemoteAccess, this);
  m_previewWidget->setToolbarVisible(preview.showToolbar);
  setCentralWidget(m_previewWidget.get());

  m_watcher = std::make_unique<ProjectWatcher>(SystemClock::shared());

  auto prober = std::make_unique<HttpHealthProber>(detection.scheme, detection.timeoutMs,
                                                   SystemClock::shared());
  m_engine = std::make_unique<DetectionEngine>(detection, std::move(prober), SystemClock::shared());
  m_engine->setProjectRoot(m_projectRoot);

  m_scheduler = std::make_unique<QtScheduler>();
  m_controller = std::make_unique<PreviewController>(m_engine.get(), preview,
                                                     SystemClock::shared(), m_scheduler.get());

  m_phaseLabel = new QLabel(this);
  m_phaseLabel->setMinimumWidth(90);
  statusBar()->addPermanentWidget(m_phaseLabel);

  createMenus();

  connect(m_controller.get(), &PreviewController::stateChanged,
          m_previewWidget.get(), &PreviewWidget::updateState);
  connect(m_controller.get(), &PreviewController::stateChanged,
          this, &PreviewWindow::handleStateChanged);

  connect(m_previewWidget.get(), &PreviewWidget::detectRequested,
          m_controller.get(), &PreviewController::autoDetectAndStart);
  connect(m_previewWidget.get(), &PreviewWidget::stopRequested,
          m_controller.get(), &PreviewController::stopPreview);
  connect(m_previewWidget.get(), &PreviewWidget::refreshRequested,
          m_controller.get(), &PreviewController::refresh);
  connect(m_previewWidget.get(), &PreviewWidget::viewportRequested,
          m_controller.get(), &PreviewController::changeViewport);
  connect(m_previewWidget.get(), &PreviewWidget::urlRequested,
          this, [this](const QString &url) {
            if (!m_controller->changeUrl(url)) {
              statusBar()->showMessage(tr("Preview is not connected, URL not sent"), 4000);
            }
          });

  // Warnings from anywhere in the app flash up in the status bar
  connect(&LookoutLogger::instance(), &LookoutLogger::logMessage,
          this, [this](LogLevel level, const QString &, const QString &message, const QJsonObject &) {
            if (level >= LogLevel::Warning) {
              statusBar()->showMessage(message, 5000);
            }
          });

  startWatching(m_projectRoot, preview.autoSync);

  m_previewWidget->updateState(m_controller->state());
  handleStateChanged(m_controller->state());

  m_controller->attachSurface(m_previewWidget.get(), m_watcher.get());

  LookoutLogger::instance().info(QString("Preview window ready for %1").arg(m_projectRoot));
}

PreviewWindow::~PreviewWindow()
{
  if (m_controller) {
    m_controller->detachSurface();
  }
  if (m_watcher) {
    m_watcher->stop();
  }
}

void PreviewWindow::createMenus()
{
  QMenuBar *menuBar = this->menuBar();

  QMenu *previewMenu = menuBar->addMenu(tr("&Preview"));

  QAction *detectAction = previewMenu->addAction(tr("&Detect Dev Server"));
  detectAction->setShortcut(QKeySequence(Qt::CTRL | Qt::Key_D));
  connect(detectAction, &QAction::triggered, m_controller.get(), &PreviewController::autoDetectAndStart);

  QAction *scanAction = previewMenu->addAction(tr("&Scan All Ports"));
  scanAction->setShortcut(QKeySequence(Qt::ControlModifier | Qt::ShiftModifier | Qt::Key_D));
  connect(scanAction, &QAction::triggered, this, &PreviewWindow::scanAllPorts);

  QAction *refreshAction = previewMenu->addAction(tr("&Refresh"));
  refreshAction->setShortcut(QKeySequence::Refresh);
  connect(refreshAction, &QAction::triggered, m_controller.get(), &PreviewController::refresh);

  QAction *stopAction = previewMenu->addAction(tr("S&top Preview"));
  connect(stopAction, &QAction::triggered, m_controller.get(), &PreviewController::stopPreview);

  previewMenu->addSeparator();

  QAction *quitAction = previewMenu->addAction(tr("&Quit"));
  quitAction->setShortcut(QKeySequence::Quit);
  connect(quitAction, &QAction::triggered, this, &QWidget::close);

  QMenu *viewMenu = menuBar->addMenu(tr("&View"));
  m_viewportActions = new QActionGroup(this);
  m_viewportActions->setExclusive(true);

  const struct {
    ViewportMode mode;
    const char *label;
    Qt::Key key;
  } viewports[] = {
    {ViewportMode::Desktop, QT_TR_NOOP("&Desktop"), Qt::Key_1},
    {ViewportMode::Tablet, QT_TR_NOOP("&Tablet"), Qt::Key_2},
    {ViewportMode::Mobile, QT_TR_NOOP("&Mobile"), Qt::Key_3}
  };

  for (const auto &viewport : viewports) {
    QAction *action = viewMenu->addAction(tr(viewport.label));
    action->setCheckable(true);
    action->setData(static_cast<int>(viewport.mode));
    action->setShortcut(QKeySequence(Qt::CTRL | viewport.key));
    m_viewportActions->addAction(action);
    ViewportMode mode = viewport.mode;
    connect(action, &QAction::triggered, this, [this, mode]() {
      m_controller->changeViewport(mode);
    });
  }

  QMenu *helpMenu = menuBar->addMenu(tr("&Help"));
  QAction *aboutAction = helpMenu->addAction(tr("&About Lookout"));
  connect(aboutAction, &QAction::triggered, this, &PreviewWindow::showAbout);
}

void PreviewWindow::startWatching(const QString &projectRoot, bool autoSync)
{
  if (!autoSync) {
    LookoutLogger::instance().info("File sync disabled, project will not be watched");
    return;
  }

  if (!m_watcher->watch(projectRoot)) {
    LookoutLogger::instance().warning(QString("Unable to watch project root: %1").arg(projectRoot));
    return;
  }

  LookoutLogger::instance().info(QString("Watching %1 files under %2")
                                 .arg(m_watcher->watchedFileCount())
                                 .arg(projectRoot));
}

void PreviewWindow::handleStateChanged(const PreviewPanelState &state)
{
  m_phaseLabel->setText(previewPhaseName(state.phase()));

  if (m_viewportActions) {
    for (QAction *action : m_viewportActions->actions()) {
      action->setChecked(action->data().toInt() == static_cast<int>(state.viewport));
    }
  }

  if (!state.lastError.isEmpty()) {
    statusBar()->showMessage(state.lastError);
  } else if (state.server) {
    statusBar()->showMessage(QString("%1  %2")
                             .arg(state.server->displayTitle())
                             .arg(state.server->previewUrl()));
  } else if (state.isLoading) {
    statusBar()->showMessage(tr("Looking for a dev server..."));
  } else {
    statusBar()->clearMessage();
  }
}

void PreviewWindow::scanAllPorts()
{
  statusBar()->showMessage(tr("Scanning %1 ports...").arg(m_engine->config().ports.size()));

  m_engine->refresh([this](const DetectionResult &result) {
    if (result.servers.isEmpty()) {
      statusBar()->showMessage(tr("No dev servers found on %1 ports").arg(result.scannedPorts.size()), 5000);
      return;
    }

    QStringList titles;
    for (const auto &server : result.servers) {
      titles << server.displayTitle();
    }
    statusBar()->showMessage(tr("Found: %1").arg(titles.join(", ")), 5000);

    if (!m_controller->state().server) {
      m_controller->startPreview(result.servers.first());
    }
  });
}

void PreviewWindow::closeEvent(QCloseEvent *event)
{
  QSettings settings;
  settings.setValue("PreviewWindow/geometry", saveGeometry());

  QTimer::singleShot(0, []() {
    QApplication::quit();
  });

  QMainWindow::closeEvent(event);
}

void PreviewWindow::showAbout() const
{
  QMessageBox::about(const_cast<PreviewWindow*>(this), tr("About Lookout"),
                     tr("Lookout %1\n\nLive preview of your local dev server")
                     .arg(Config::APP_VERSION));
}
