#include "preview_controller.h"
#include "preview_surface.h"
#include "preview_page.h"
#include "detection_engine.h"
#include "common.h"
#include "lookoutlogger.h"
#include <QPointer>
#include <exception>

using namespace LookoutCommon;

namespace {

void previewLog(LogLevel level, const QString& message)
{
    if (LookoutLogger::isInitialized()) {
        LookoutLogger::instance().log(level, QString(), QString("[PREVIEW] %1").arg(message));
    }
}

} // namespace

PreviewController::PreviewController(DetectionEngine* engine,
                                     const PreviewConfig& config,
                                     Clock* clock,
                                     Scheduler* scheduler,
                                     QObject* parent)
    : QObject(parent)
    , m_engine(engine)
    , m_config(config)
    , m_clock(clock ? clock : SystemClock::shared())
    , m_scheduler(scheduler)
{
    resetState();
}

PreviewController::~PreviewController()
{
    cancelTimer(m_refreshTimer);
    cancelTimer(m_loadingTimer);
    detachSurface();
}

void PreviewController::attachSurface(PreviewSurface* surface, ChangeWatcher* watcher)
{
    if (m_surface) {
        detachSurface();
    }

    m_surface = surface;
    m_watcher = watcher;
    resetState();

    if (!m_surface) {
        return;
    }

    m_surface->setAllowedOrigins(allowedOrigins());
    m_surface->setHtml(renderHtml());

    m_surface->onMessage([this](const QString& json) {
        handleSurfaceMessage(json);
    });
    m_surface->onVisibilityChanged([this](bool visible) {
        handleVisibilityChanged(visible);
    });
    if (m_watcher) {
        m_watcher->onChange([this](const FileChangeEvent& event) {
            handleFileChange(event);
        });
    }

    previewLog(LogLevel::Info, "Surface attached");
    publishState();

    if (m_config.autoStart) {
        autoDetectAndStart();
    }
}

void PreviewController::detachSurface()
{
    if (m_surface) {
        m_surface->onMessage(nullptr);
        m_surface->onVisibilityChanged(nullptr);
        previewLog(LogLevel::Info, "Surface detached");
    }
    if (m_watcher) {
        m_watcher->onChange(nullptr);
    }
    m_surface = nullptr;
    m_watcher = nullptr;

    // Outstanding detection belongs to the surface that went away
    ++m_detectToken;
    cancelTimer(m_refreshTimer);
    cancelTimer(m_loadingTimer);
}

void PreviewController::autoDetectAndStart()
{
    const quint64 token = ++m_detectToken;

    m_state.isLoading = true;
    m_state.lastError.clear();
    publishState();

    auto fail = [this](const QString& message) {
        m_state.lastError = message;
        m_state.isLoading = false;
        publishState();
    };

    if (!m_engine) {
        fail(NO_SERVER_MESSAGE);
        return;
    }

    QPointer<PreviewController> self(this);
    try {
        m_engine->quickDetect([self, token, fail](const std::optional<DevServer>& server) {
            if (!self || token != self->m_detectToken) {
                return;
            }
            if (server) {
                self->startPreview(*server);
            } else {
                previewLog(LogLevel::Info, "Auto-detect found no server");
                fail(NO_SERVER_MESSAGE);
            }
        });
    } catch (const std::exception& e) {
        QString message = QString::fromUtf8(e.what());
        previewLog(LogLevel::Error, QString("Auto-detect failed: %1").arg(message));
        if (token == m_detectToken) {
            fail(message.isEmpty() ? QString(UNKNOWN_ERROR_MESSAGE) : message);
        }
    } catch (...) {
        previewLog(LogLevel::Error, "Auto-detect failed with an unknown error");
        if (token == m_detectToken) {
            fail(QString(UNKNOWN_ERROR_MESSAGE));
        }
    }
}

void PreviewController::startPreview(const DevServer& server)
{
    m_state.server = server;
    m_state.isLoading = true;
    m_state.lastError.clear();
    publishState();

    previewLog(LogLevel::Info, QString("Starting preview of %1").arg(server.previewUrl()));
    post(PreviewMessage::init(server.previewUrl(), m_state.viewport, server.displayTitle()));

    cancelTimer(m_loadingTimer);
    if (m_scheduler) {
        m_loadingTimer = m_scheduler->schedule(LOADING_SETTLE_MS, [this]() {
            m_loadingTimer.reset();
            m_state.isLoading = false;
            publishState();
        });
    } else {
        m_state.isLoading = false;
        publishState();
    }
}

void PreviewController::stopPreview()
{
    ++m_detectToken;
    cancelTimer(m_refreshTimer);
    cancelTimer(m_loadingTimer);
    resetState();
    publishState();

    if (m_surface) {
        m_surface->setHtml(renderHtml());
    }
    previewLog(LogLevel::Info, "Preview stopped");
}

void PreviewController::refresh()
{
    if (!m_state.server) {
        return;
    }

    m_state.refreshCount++;
    m_state.lastRefresh = m_clock->epochMs();
    publishState();

    post(PreviewMessage::refresh());
}

void PreviewController::changeViewport(ViewportMode mode)
{
    m_state.viewport = mode;
    publishState();
    post(PreviewMessage::viewportChange(mode));
}

bool PreviewController::changeUrl(const QString& url)
{
    return post(PreviewMessage::urlChange(url));
}

void PreviewController::handleFileChange(const FileChangeEvent& event)
{
    if (!m_config.autoSync || !m_state.server) {
        return;
    }

    cancelTimer(m_refreshTimer);
    if (!m_scheduler) {
        refresh();
        return;
    }

    previewLog(LogLevel::Debug, QString("File %1: %2, refresh in %3ms")
               .arg(fileChangeTypeId(event.type))
               .arg(event.path)
               .arg(m_config.refreshDelayMs));

    m_refreshTimer = m_scheduler->schedule(m_config.refreshDelayMs, [this]() {
        m_refreshTimer.reset();
        refresh();
    });
}

void PreviewController::handleSurfaceMessage(const QString& json)
{
    auto message = PreviewMessage::fromJsonString(json);
    if (!message) {
        previewLog(LogLevel::Warning, QString("Ignoring malformed surface message: %1").arg(json.left(200)));
        return;
    }

    switch (message->type()) {
    case PreviewMessage::Type::Ready:
        // The surface reloaded; replay the current server
        if (m_state.server) {
            DevServer server = *m_state.server;
            startPreview(server);
        }
        break;

    case PreviewMessage::Type::Error: {
        QString text = message->payload().value("message").toString();
        m_state.lastError = text.isEmpty() ? QString(UNKNOWN_ERROR_MESSAGE) : text;
        previewLog(LogLevel::Warning, QString("Surface reported error: %1").arg(m_state.lastError));
        publishState();
        break;
    }

    case PreviewMessage::Type::HealthCheck:
        // Only requests are answered; a message already carrying a status is a reply
        if (!message->payload().contains("healthy")) {
            post(PreviewMessage::healthCheck(true));
        }
        break;

    case PreviewMessage::Type::ViewportChange: {
        auto mode = viewportFromId(message->payload().value("viewport").toString());
        if (mode && *mode != m_state.viewport) {
            m_state.viewport = *mode;
            publishState();
        }
        break;
    }

    default:
        previewLog(LogLevel::Debug, QString("Ignoring surface message '%1'").arg(message->typeId()));
        break;
    }
}

void PreviewController::handleVisibilityChanged(bool visible)
{
    if (visible && m_state.server) {
        refresh();
    }
}

QStringList PreviewController::allowedOrigins() const
{
    QString scheme = m_engine ? m_engine->config().scheme : QStringLiteral("http");
    return {
        QString("%1://localhost").arg(scheme),
        QString("%1://127.0.0.1").arg(scheme),
        QString("%1://[::1]").arg(scheme)
    };
}

QString PreviewController::renderHtml() const
{
    QString nonce = QString::fromStdString(generateSecureToken(32));
    return renderPreviewPage(m_state, m_config, nonce);
}

bool PreviewController::post(const PreviewMessage& message)
{
    if (!m_surface) {
        previewLog(LogLevel::Debug, QString("No surface, dropped '%1'").arg(message.typeId()));
        return false;
    }

    bool delivered = m_surface->send(message);
    if (!delivered) {
        previewLog(LogLevel::Debug, QString("Surface did not accept '%1'").arg(message.typeId()));
    }
    return delivered;
}

void PreviewController::resetState()
{
    m_state = PreviewPanelState();
    m_state.viewport = m_config.defaultViewport;
}

void PreviewController::publishState()
{
    PreviewPhase phase = m_state.phase();
    if (phase != m_lastPhase) {
        previewLog(LogLevel::Debug, QString("%1 -> %2")
                   .arg(previewPhaseName(m_lastPhase))
                   .arg(previewPhaseName(phase)));
        m_lastPhase = phase;
    }
    emit stateChanged(m_state);
}

void PreviewController::cancelTimer(std::optional<Scheduler::TimerId>& timer)
{
    if (timer && m_scheduler) {
        m_scheduler->cancel(*timer);
    }
    timer.reset();
}
