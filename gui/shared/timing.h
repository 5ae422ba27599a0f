#ifndef LOOKOUT_TIMING_H
#define LOOKOUT_TIMING_H

#include <QObject>
#include <QHash>
#include <QElapsedTimer>
#include <functional>

class QTimer;

namespace LookoutCommon {

// Time source for cache ages, scan durations and timestamps
class Clock {
public:
    virtual ~Clock() = default;
    virtual qint64 monotonicMs() const = 0;
    virtual qint64 epochMs() const = 0;
};

// One-shot delayed callbacks with explicit cancellation
class Scheduler {
public:
    using TimerId = int;

    virtual ~Scheduler() = default;
    virtual TimerId schedule(int delayMs, std::function<void()> callback) = 0;
    // Cancelling an id that already fired or was never issued is a no-op
    virtual void cancel(TimerId id) = 0;
};

class SystemClock : public Clock {
public:
    SystemClock();
    qint64 monotonicMs() const override;
    qint64 epochMs() const override;

    static SystemClock* shared();

private:
    QElapsedTimer m_elapsed;
};

class QtScheduler : public QObject, public Scheduler {
    Q_OBJECT

public:
    explicit QtScheduler(QObject* parent = nullptr);
    ~QtScheduler() override;

    TimerId schedule(int delayMs, std::function<void()> callback) override;
    void cancel(TimerId id) override;

    int pendingCount() const { return m_timers.size(); }

private:
    QHash<TimerId, QTimer*> m_timers;
    TimerId m_nextId = 1;
};

} // namespace LookoutCommon

#endif // LOOKOUT_TIMING_H
