#ifndef SYNCORCHESTRATOR_H
#define SYNCORCHESTRATOR_H

#include <QObject>
#include <QString>
#include <QList>
#include <QMutex>
#include <QFuture>
#include <QFutureWatcher>
#include <QThreadPool>
#include <QTimer>
#include <atomic>
#include <functional>

#include "synctypes.h"
#include "backoffpolicy.h"

namespace BridgeSync {

class SyncTransport;
class SyncStateStore;
class PushEngine;
class PullEngine;
class ConflictResolver;

/**
 * @brief Runs Push -> Pull -> Resolve cycles for one (user, device) pair
 *
 * Phases: Idle -> Pushing -> Pulling -> Resolving -> Idle. Resolving only
 * runs when conflicts are open and a resolution provider is installed.
 * An unrecoverable error moves the cycle to Failed, after which the
 * orchestrator is Idle again.
 *
 * At most one cycle runs at a time: requesting a sync while one is in
 * flight returns the future of the running cycle.
 *
 * The periodic checker drives both update checks and cycles. A cycle
 * starts when the server reports updates or the outbox holds pushable
 * changes. Failed checks and cycles that failed with a retryable error
 * are retried after the BackoffPolicy delay.
 *
 * Usage:
 * @code
 * SyncOrchestrator orchestrator(&transport, &state);
 * orchestrator.setEventApplyHandler([](const QList<ChangeEvent> &events) {
 *     return applyLocally(events);
 * });
 * SyncCycleResult result = orchestrator.syncNow();
 * @endcode
 */
class SyncOrchestrator : public QObject
{
    Q_OBJECT

public:
    /// Applies a batch pull locally; the batch is acknowledged only on true
    using BatchApplyHandler = std::function<bool(const PullResult &)>;

    /// Applies change events locally; the events are acknowledged only on true
    using EventApplyHandler = std::function<bool(const QList<ChangeEvent> &)>;

    /// Decides how open conflicts are resolved; may leave some out
    using ResolutionProvider = std::function<QList<ResolutionRequest>(const QList<Conflict> &)>;

    static const int DEFAULT_CHECK_INTERVAL_MS = 60000;

    SyncOrchestrator(SyncTransport *transport, SyncStateStore *state, QObject *parent = nullptr);
    ~SyncOrchestrator() override;

    PushEngine *pushEngine() const { return m_push; }
    PullEngine *pullEngine() const { return m_pull; }
    ConflictResolver *conflictResolver() const { return m_resolver; }
    SyncStateStore *stateStore() const { return m_state; }

    // ========== Handlers ==========

    void setBatchApplyHandler(BatchApplyHandler handler);
    void setEventApplyHandler(EventApplyHandler handler);
    void setResolutionProvider(ResolutionProvider provider);

    // ========== Sync Operations ==========

    /**
     * @brief Start a cycle, or join the one in flight
     */
    QFuture<SyncCycleResult> requestSync();

    /**
     * @brief Run (or join) a cycle and wait for its result
     */
    SyncCycleResult syncNow();

    /**
     * @brief Stop the running cycle after its in-flight call completes
     */
    void cancelSync();

    bool isSyncing() const;
    SyncPhase phase() const;

    // ========== Periodic Update Check ==========

    void setCheckInterval(int intervalMs);
    int checkInterval() const { return m_checkIntervalMs; }

    /**
     * @brief Policy used to reschedule checks and cycles after failures
     */
    void setBackoffPolicy(const BackoffPolicy &policy);
    const BackoffPolicy &backoffPolicy() const { return m_checkBackoff; }

    void startPeriodicCheck();
    void stopPeriodicCheck();
    bool isPeriodicCheckActive() const { return m_checkActive; }

signals:
    void phaseChanged(BridgeSync::SyncPhase phase);
    void lifecycleEvent(const QString &type, const QVariantMap &data);
    void syncStarted();
    void syncFinished(const BridgeSync::SyncCycleResult &result);

    /**
     * @brief The next update check runs in delayMs
     */
    void checkScheduled(qint64 delayMs);

private slots:
    void runPeriodicCheck();
    void onCheckFinished();
    void onCycleFinished();

private:
    SyncCycleResult runCycle();
    bool runPullPhase(SyncCycleResult *result, bool firstSync);
    void finishFailed(SyncCycleResult *result, SyncPhase phase, const SyncError &error);
    void finishCancelled(SyncCycleResult *result);
    void setPhase(SyncPhase phase);
    void scheduleCheck(qint64 delayMs);
    void scheduleRetry(const SyncError &error);
    QVariantMap eventData() const;

    SyncTransport *m_transport;
    SyncStateStore *m_state;
    PushEngine *m_push;
    PullEngine *m_pull;
    ConflictResolver *m_resolver;

    BatchApplyHandler m_batchHandler;
    EventApplyHandler m_eventHandler;
    ResolutionProvider m_resolutionProvider;

    // Single flight
    mutable QMutex m_flightMutex;
    QFuture<SyncCycleResult> m_inFlight;
    QThreadPool m_syncPool;
    std::atomic<bool> m_cancelRequested{false};

    mutable QMutex m_phaseMutex;
    SyncPhase m_phase = SyncPhase::Idle;

    // Periodic check
    QTimer *m_checkTimer;
    QFutureWatcher<UpdatesInfo> *m_checkWatcher;
    QFutureWatcher<SyncCycleResult> *m_cycleWatcher;
    BackoffPolicy m_checkBackoff;
    int m_checkIntervalMs = DEFAULT_CHECK_INTERVAL_MS;
    bool m_checkActive = false;
};

} // namespace BridgeSync

#endif // SYNCORCHESTRATOR_H
