#pragma once

#include <QMainWindow>
#include <memory>
#include "shared/preview_types.h"

class QLabel;
class QActionGroup;
class PreviewWidget;
class PreviewController;
class DetectionEngine;
class ProjectWatcher;

namespace LookoutCommon {
class QtScheduler;
}

namespace LookoutCLI {
class SessionConfig;
}

class PreviewWindow : public QMainWindow
{
  Q_OBJECT

public:
  explicit PreviewWindow(const LookoutCLI::SessionConfig &config, QWidget *parent = nullptr);
  ~PreviewWindow();

  PreviewController *controller() const { return m_controller.get(); }

protected:
  void closeEvent(QCloseEvent *event) override;

private slots:
  void showAbout() const;
  void handleStateChanged(const LookoutCommon::PreviewPanelState &state);
  void scanAllPorts();

private:
  void createMenus();
  void startWatching(const QString &projectRoot, bool autoSync);

  QString m_projectRoot;

  std::unique_ptr<PreviewWidget> m_previewWidget;
  std::unique_ptr<ProjectWatcher> m_watcher;
  std::unique_ptr<DetectionEngine> m_engine;
  std::unique_ptr<LookoutCommon::QtScheduler> m_scheduler;
  // Declared last so it detaches from the widget before anything else goes
  std::unique_ptr<PreviewController> m_controller;

  QLabel *m_phaseLabel;
  QActionGroup *m_viewportActions;
};
