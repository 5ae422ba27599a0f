#ifndef LOOKOUT_PREVIEW_CONTROLLER_H
#define LOOKOUT_PREVIEW_CONTROLLER_H

#include <QObject>
#include <QString>
#include <QStringList>
#include <optional>
#include "preview_types.h"
#include "preview_protocol.h"
#include "timing.h"

class DetectionEngine;

namespace LookoutCommon {
class PreviewSurface;
class ChangeWatcher;
}

/**
 * Keeps one preview surface in step with the detected dev server.
 *
 * Phases: Empty -> Detecting -> Live <-> Loading, with Error reachable from
 * detection misses and surface reports, and stopPreview() returning to Empty.
 * File changes are debounced into a single refresh per quiet period.
 * Outbound messages without an attached surface are dropped and reported
 * as not delivered.
 */
class PreviewController : public QObject
{
    Q_OBJECT

public:
    static constexpr int LOADING_SETTLE_MS = 500;
    static constexpr const char* NO_SERVER_MESSAGE =
        "No dev server detected. Start your dev server to see live preview.";
    static constexpr const char* UNKNOWN_ERROR_MESSAGE = "Unknown error";

    PreviewController(DetectionEngine* engine,
                      const LookoutCommon::PreviewConfig& config,
                      LookoutCommon::Clock* clock,
                      LookoutCommon::Scheduler* scheduler,
                      QObject* parent = nullptr);
    ~PreviewController();

    void attachSurface(LookoutCommon::PreviewSurface* surface,
                       LookoutCommon::ChangeWatcher* watcher = nullptr);
    void detachSurface();
    bool hasSurface() const { return m_surface != nullptr; }

    void autoDetectAndStart();
    void startPreview(const LookoutCommon::DevServer& server);
    void stopPreview();
    void refresh();
    void changeViewport(LookoutCommon::ViewportMode mode);
    bool changeUrl(const QString& url);

    void handleFileChange(const LookoutCommon::FileChangeEvent& event);
    void handleSurfaceMessage(const QString& json);
    void handleVisibilityChanged(bool visible);

    const LookoutCommon::PreviewPanelState& state() const { return m_state; }
    const LookoutCommon::PreviewConfig& config() const { return m_config; }
    bool hasPendingRefresh() const { return m_refreshTimer.has_value(); }

    QStringList allowedOrigins() const;
    QString renderHtml() const;

signals:
    void stateChanged(const LookoutCommon::PreviewPanelState& state);

private:
    bool post(const LookoutCommon::PreviewMessage& message);
    void resetState();
    void publishState();
    void cancelTimer(std::optional<LookoutCommon::Scheduler::TimerId>& timer);

    DetectionEngine* m_engine;
    LookoutCommon::PreviewConfig m_config;
    LookoutCommon::Clock* m_clock;
    LookoutCommon::Scheduler* m_scheduler;

    LookoutCommon::PreviewSurface* m_surface = nullptr;
    LookoutCommon::ChangeWatcher* m_watcher = nullptr;
    LookoutCommon::PreviewPanelState m_state;
    LookoutCommon::PreviewPhase m_lastPhase = LookoutCommon::PreviewPhase::Empty;

    std::optional<LookoutCommon::Scheduler::TimerId> m_refreshTimer;
    std::optional<LookoutCommon::Scheduler::TimerId> m_loadingTimer;
    quint64 m_detectToken = 0;
};

#endif // LOOKOUT_PREVIEW_CONTROLLER_H
