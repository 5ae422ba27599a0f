#include "timing.h"
#include <QDateTime>
#include <QTimer>

namespace LookoutCommon {

SystemClock::SystemClock()
{
    m_elapsed.start();
}

qint64 SystemClock::monotonicMs() const
{
    return m_elapsed.elapsed();
}

qint64 SystemClock::epochMs() const
{
    return QDateTime::currentMSecsSinceEpoch();
}

SystemClock* SystemClock::shared()
{
    static SystemClock clock;
    return &clock;
}

QtScheduler::QtScheduler(QObject* parent)
    : QObject(parent)
{
}

QtScheduler::~QtScheduler()
{
    for (QTimer* timer : m_timers) {
        timer->stop();
        delete timer;
    }
    m_timers.clear();
}

Scheduler::TimerId QtScheduler::schedule(int delayMs, std::function<void()> callback)
{
    TimerId id = m_nextId++;

    QTimer* timer = new QTimer(this);
    timer->setSingleShot(true);
    connect(timer, &QTimer::timeout, this, [this, id, callback = std::move(callback)]() {
        QTimer* fired = m_timers.take(id);
        if (fired) {
            fired->deleteLater();
        }
        callback();
    });

    m_timers.insert(id, timer);
    timer->start(qMax(0, delayMs));
    return id;
}

void QtScheduler::cancel(TimerId id)
{
    QTimer* timer = m_timers.take(id);
    if (timer) {
        timer->stop();
        timer->deleteLater();
    }
}

} // namespace LookoutCommon
