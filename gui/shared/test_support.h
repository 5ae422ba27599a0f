#ifndef LOOKOUT_TEST_SUPPORT_H
#define LOOKOUT_TEST_SUPPORT_H

#include <QString>
#include <QStringList>
#include <QList>
#include <QMap>
#include <QSet>
#include <algorithm>
#include <functional>
#include <string>
#include <vector>
#include "lookoutlogger.h"
#include "timing.h"
#include "health_prober.h"
#include "preview_surface.h"
#include "preview_protocol.h"

// Test context for collecting multiple failures
struct TestContext {
    bool passed = true;
    QStringList failures;

    void fail(const QString& message) {
        passed = false;
        failures.append(message);
    }
};

// Test result tracking
struct TestResult {
    QString testName;
    bool passed;
    QString message;
};

// Helper macro for tests - collects failures but continues testing
#define TEST_ASSERT(ctx, condition, message) \
    if (!(condition)) { \
        (ctx).fail(QString("Assertion failed: %1").arg(message)); \
    }

// Macro for tests that should stop on first failure
#define TEST_REQUIRE(ctx, condition, message) \
    if (!(condition)) { \
        (ctx).fail(QString("Required condition failed: %1").arg(message)); \
        return (ctx).passed; \
    }

// Each suite keeps its own static QList<TestResult> testResults
#define RUN_TEST(testFunc) \
    { \
        QString testName = #testFunc; \
        TestContext ctx; \
        testFunc(ctx); \
        QString message = ctx.passed ? "Passed" : ctx.failures.join("; "); \
        testResults.append({testName, ctx.passed, message}); \
        if (ctx.passed) { \
            LookoutLogger::instance().info(QString("  ✓ %1").arg(testName)); \
        } else { \
            LookoutLogger::instance().error(QString("  ✗ %1: %2").arg(testName).arg(message)); \
        } \
    }

// Count results, log the suite line and return the number of failures
inline int summarizeSuite(const QString& suiteName, const QList<TestResult>& results,
                          int& totalTests, int& passedTests) {
    int passed = 0;
    int failed = 0;

    for (const auto& result : results) {
        if (result.passed) {
            passed++;
        } else {
            failed++;
        }
    }

    totalTests = passed + failed;
    passedTests = passed;
    LookoutLogger::instance().info(QString("\n%1: %2 passed, %3 failed")
        .arg(suiteName)
        .arg(passed)
        .arg(failed));

    return failed;
}

// Test helper to simulate command line arguments
struct ArgSimulator {
    std::vector<char*> args;
    std::vector<std::string> storage;
    bool finalized = false;

    void add(const char* arg) {
        storage.push_back(arg);
        finalized = false;
    }

    void finalize() {
        args.clear();
        for (auto& str : storage) {
            args.push_back(const_cast<char*>(str.c_str()));
        }
        args.push_back(nullptr); // Real argv is null-terminated
        finalized = true;
    }

    int argc() {
        if (!finalized) finalize();
        return static_cast<int>(args.size()) - 1; // Don't count the null terminator
    }

    char** argv() {
        if (!finalized) finalize();
        return args.data();
    }

    void clear() {
        args.clear();
        storage.clear();
        finalized = false;
    }
};

// Clock that only moves when a test moves it
class ManualClock : public LookoutCommon::Clock {
public:
    qint64 monotonicMs() const override { return m_now; }
    qint64 epochMs() const override { return EPOCH_BASE + m_now; }

    void advance(qint64 ms) { m_now += ms; }
    void set(qint64 ms) { m_now = ms; }

    static constexpr qint64 EPOCH_BASE = 1700000000000LL;

private:
    qint64 m_now = 0;
};

// Scheduler driven by a ManualClock; callbacks fire in due-time order on advanceTo()
class ManualScheduler : public LookoutCommon::Scheduler {
public:
    explicit ManualScheduler(ManualClock& clock) : m_clock(clock) {}

    TimerId schedule(int delayMs, std::function<void()> callback) override {
        TimerId id = m_nextId++;
        m_pending.append({id, m_clock.monotonicMs() + delayMs, m_sequence++, std::move(callback)});
        return id;
    }

    void cancel(TimerId id) override {
        for (int i = 0; i < m_pending.size(); ++i) {
            if (m_pending[i].id == id) {
                m_pending.removeAt(i);
                return;
            }
        }
    }

    void advanceTo(qint64 timeMs) {
        while (true) {
            int next = -1;
            for (int i = 0; i < m_pending.size(); ++i) {
                if (m_pending[i].due > timeMs) {
                    continue;
                }
                if (next < 0 || m_pending[i].due < m_pending[next].due ||
                    (m_pending[i].due == m_pending[next].due && m_pending[i].sequence < m_pending[next].sequence)) {
                    next = i;
                }
            }
            if (next < 0) {
                break;
            }
            Pending entry = m_pending.takeAt(next);
            m_clock.set(qMax(m_clock.monotonicMs(), entry.due));
            entry.callback();
        }
        m_clock.set(qMax(m_clock.monotonicMs(), timeMs));
    }

    void advanceBy(qint64 ms) { advanceTo(m_clock.monotonicMs() + ms); }
    int pendingCount() const { return m_pending.size(); }

private:
    struct Pending {
        TimerId id;
        qint64 due;
        quint64 sequence;
        std::function<void()> callback;
    };

    ManualClock& m_clock;
    QList<Pending> m_pending;
    TimerId m_nextId = 1;
    quint64 m_sequence = 0;
};

// Prober answering from a fixed port table, immediately or when released
class FakeProber : public LookoutCommon::HealthProber {
public:
    struct Answer {
        bool healthy = true;
        QString serverHeader;
        QString poweredBy;
    };

    explicit FakeProber(ManualClock* clock = nullptr) : m_clock(clock) {}

    void setHealthy(quint16 port, const QString& serverHeader = QString(), const QString& poweredBy = QString()) {
        m_answers[port] = {true, serverHeader, poweredBy};
    }

    void probe(quint16 port, ProbeCallback callback) override {
        probedPorts.append(port);
        if (throwing) {
            throw Failure{port};
        }
        if (deferred) {
            m_held.append({port, std::move(callback)});
            return;
        }
        callback(resultFor(port));
    }

    // Settle every held probe, in reverse order to show completion order does not matter
    void releaseAll() {
        QList<Held> held = m_held;
        m_held.clear();
        std::reverse(held.begin(), held.end());
        for (auto& entry : held) {
            entry.callback(resultFor(entry.port));
        }
    }

    int heldCount() const { return m_held.size(); }

    // Thrown from probe() when throwing is set; not a std::exception
    struct Failure {
        quint16 port;
    };

    bool deferred = false;
    bool throwing = false;
    QList<quint16> probedPorts;

private:
    struct Held {
        quint16 port;
        ProbeCallback callback;
    };

    LookoutCommon::ProbeResult resultFor(quint16 port) const {
        LookoutCommon::ProbeResult result;
        result.timestamp = m_clock ? m_clock->epochMs() : 0;
        auto it = m_answers.find(port);
        if (it != m_answers.end() && it->healthy) {
            result.healthy = true;
            result.status = 200;
            result.latencyMs = 3;
            result.serverHeader = it->serverHeader;
            result.poweredByHeader = it->poweredBy;
        }
        return result;
    }

    ManualClock* m_clock;
    QMap<quint16, Answer> m_answers;
    QList<Held> m_held;
};

// Surface that records what the controller sends it
class FakeSurface : public LookoutCommon::PreviewSurface {
public:
    void setAllowedOrigins(const QStringList& origins) override { allowedOrigins = origins; }
    void setHtml(const QString& html) override { lastHtml = html; htmlLoads++; }

    bool send(const LookoutCommon::PreviewMessage& message) override {
        sent.append(message);
        return accepting;
    }

    void onMessage(MessageHandler handler) override { m_messageHandler = std::move(handler); }
    void onVisibilityChanged(VisibilityHandler handler) override { m_visibilityHandler = std::move(handler); }

    void deliver(const QString& json) { if (m_messageHandler) m_messageHandler(json); }
    void deliver(const LookoutCommon::PreviewMessage& message) { deliver(message.toJsonString()); }
    void setVisible(bool visible) { if (m_visibilityHandler) m_visibilityHandler(visible); }
    bool hasMessageHandler() const { return static_cast<bool>(m_messageHandler); }

    int countOf(LookoutCommon::PreviewMessage::Type type) const {
        int count = 0;
        for (const auto& message : sent) {
            if (message.type() == type) {
                count++;
            }
        }
        return count;
    }

    QStringList allowedOrigins;
    QString lastHtml;
    int htmlLoads = 0;
    bool accepting = true;
    QList<LookoutCommon::PreviewMessage> sent;

private:
    MessageHandler m_messageHandler;
    VisibilityHandler m_visibilityHandler;
};

class FakeWatcher : public LookoutCommon::ChangeWatcher {
public:
    void onChange(ChangeHandler handler) override { m_handler = std::move(handler); }

    void emitChange(const QString& path,
                    LookoutCommon::FileChangeType type = LookoutCommon::FileChangeType::Modified) {
        if (m_handler) {
            m_handler({path, type, 0});
        }
    }

    bool hasHandler() const { return static_cast<bool>(m_handler); }

private:
    ChangeHandler m_handler;
};

#endif // LOOKOUT_TEST_SUPPORT_H
