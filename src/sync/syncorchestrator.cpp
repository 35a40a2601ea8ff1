#include "syncorchestrator.h"
#include "syncstatestore.h"
#include "pushengine.h"
#include "pullengine.h"
#include "conflictresolver.h"
#include "../net/synctransport.h"

#include <QtConcurrent/QtConcurrent>
#include <QDebug>

namespace BridgeSync {

SyncOrchestrator::SyncOrchestrator(SyncTransport *transport, SyncStateStore *state, QObject *parent)
    : QObject(parent)
    , m_transport(transport)
    , m_state(state)
{
    qRegisterMetaType<BridgeSync::SyncCycleResult>();
    qRegisterMetaType<BridgeSync::SyncPhase>();

    m_push = new PushEngine(transport, state, this);
    m_pull = new PullEngine(transport, state, this);
    m_resolver = new ConflictResolver(transport, state, this);

    // Direct, so engine events keep their order relative to cycle events
    connect(m_push, &PushEngine::lifecycleEvent, this, &SyncOrchestrator::lifecycleEvent,
            Qt::DirectConnection);
    connect(m_pull, &PullEngine::lifecycleEvent, this, &SyncOrchestrator::lifecycleEvent,
            Qt::DirectConnection);
    connect(m_resolver, &ConflictResolver::lifecycleEvent, this, &SyncOrchestrator::lifecycleEvent,
            Qt::DirectConnection);

    m_syncPool.setMaxThreadCount(1);

    m_checkTimer = new QTimer(this);
    m_checkTimer->setSingleShot(true);
    connect(m_checkTimer, &QTimer::timeout, this, &SyncOrchestrator::runPeriodicCheck);

    m_checkWatcher = new QFutureWatcher<UpdatesInfo>(this);
    connect(m_checkWatcher, &QFutureWatcher<UpdatesInfo>::finished,
            this, &SyncOrchestrator::onCheckFinished);

    m_cycleWatcher = new QFutureWatcher<SyncCycleResult>(this);
    connect(m_cycleWatcher, &QFutureWatcher<SyncCycleResult>::finished,
            this, &SyncOrchestrator::onCycleFinished);
}

SyncOrchestrator::~SyncOrchestrator()
{
    stopPeriodicCheck();
    cancelSync();
    m_checkWatcher->waitForFinished();
    m_cycleWatcher->waitForFinished();
    m_syncPool.waitForDone();
}

void SyncOrchestrator::setBatchApplyHandler(BatchApplyHandler handler)
{
    m_batchHandler = std::move(handler);
}

void SyncOrchestrator::setEventApplyHandler(EventApplyHandler handler)
{
    m_eventHandler = std::move(handler);
}

void SyncOrchestrator::setResolutionProvider(ResolutionProvider provider)
{
    m_resolutionProvider = std::move(provider);
}

// ========== Sync Operations ==========

QFuture<SyncCycleResult> SyncOrchestrator::requestSync()
{
    QMutexLocker locker(&m_flightMutex);

    if (m_inFlight.isValid() && !m_inFlight.isFinished()) {
        qDebug() << "[SyncOrchestrator] Sync already running, joining it";
        return m_inFlight;
    }

    m_cancelRequested = false;
    m_inFlight = QtConcurrent::run(&m_syncPool, [this]() {
        return runCycle();
    });
    return m_inFlight;
}

SyncCycleResult SyncOrchestrator::syncNow()
{
    QFuture<SyncCycleResult> future = requestSync();
    future.waitForFinished();
    return future.result();
}

void SyncOrchestrator::cancelSync()
{
    if (isSyncing()) {
        qInfo() << "[SyncOrchestrator] Cancellation requested";
        m_cancelRequested = true;
    }
}

bool SyncOrchestrator::isSyncing() const
{
    QMutexLocker locker(&m_flightMutex);
    return m_inFlight.isValid() && !m_inFlight.isFinished();
}

SyncPhase SyncOrchestrator::phase() const
{
    QMutexLocker locker(&m_phaseMutex);
    return m_phase;
}

void SyncOrchestrator::setPhase(SyncPhase phase)
{
    {
        QMutexLocker locker(&m_phaseMutex);
        if (m_phase == phase) {
            return;
        }
        m_phase = phase;
    }
    qDebug() << "[SyncOrchestrator] Phase:" << syncPhaseToString(phase);
    emit phaseChanged(phase);
}

QVariantMap SyncOrchestrator::eventData() const
{
    QVariantMap data;
    data["user_id"] = m_state->userId();
    data["device_id"] = m_state->deviceId();
    return data;
}

// ========== Cycle ==========

SyncCycleResult SyncOrchestrator::runCycle()
{
    SyncCycleResult result;
    result.startTime = QDateTime::currentDateTimeUtc();

    const bool firstSync = m_state->isFirstSync();
    qInfo() << "[SyncOrchestrator] Starting sync for" << m_state->userId() << m_state->deviceId()
            << (firstSync ? "(first sync)" : "");
    emit syncStarted();
    emit lifecycleEvent(EventType::SyncStarted, eventData());

    // Push
    setPhase(SyncPhase::Pushing);
    result.push = m_push->push();
    if (!result.push.success) {
        finishFailed(&result, SyncPhase::Pushing, result.push.error);
        return result;
    }
    if (m_cancelRequested) {
        finishCancelled(&result);
        return result;
    }

    // Pull
    setPhase(SyncPhase::Pulling);
    if (!runPullPhase(&result, firstSync)) {
        return result;
    }
    if (m_cancelRequested) {
        finishCancelled(&result);
        return result;
    }

    // Resolve
    const QList<Conflict> open = m_state->conflicts();
    if (!open.isEmpty() && m_resolutionProvider) {
        setPhase(SyncPhase::Resolving);
        const QList<ResolutionRequest> requests = m_resolutionProvider(open);
        if (!requests.isEmpty()) {
            result.resolution = m_resolver->resolve(requests);
        }
        for (const ResolutionFailure &failure : result.resolution.failed) {
            qWarning() << "[SyncOrchestrator] Conflict" << failure.conflictId
                       << "not resolved:" << failure.error.toString();
        }
    } else if (!open.isEmpty()) {
        qInfo() << "[SyncOrchestrator]" << open.size() << "conflicts awaiting resolution";
    }

    // Server view after the cycle; informational only
    result.finalState = m_pull->fetchRemoteState();
    if (!result.finalState.success) {
        qWarning() << "[SyncOrchestrator] Final sync state unavailable:"
                   << result.finalState.error.toString();
    }

    setPhase(SyncPhase::Idle);
    result.success = true;
    result.endTime = QDateTime::currentDateTimeUtc();

    qInfo() << "[SyncOrchestrator] Sync completed in" << result.durationMs() << "ms:"
            << result.summary();

    QVariantMap data = eventData();
    data["pushed"] = result.push.successful.size();
    data["rejected"] = result.push.failed.size();
    data["conflicts"] = result.push.conflicts.size();
    data["pulled"] = result.usedBatchPull ? result.batchPull.totalRecords
                                          : result.smartPull.events.size();
    data["resolved"] = result.resolution.resolved.size();
    data["duration_ms"] = result.durationMs();
    emit lifecycleEvent(EventType::SyncCompleted, data);
    emit syncFinished(result);
    return result;
}

bool SyncOrchestrator::runPullPhase(SyncCycleResult *result, bool firstSync)
{
    if (firstSync) {
        result->usedBatchPull = true;
        result->batchPull = m_pull->batchPull();
        if (!result->batchPull.success) {
            finishFailed(result, SyncPhase::Pulling, result->batchPull.error);
            return false;
        }
        if (m_cancelRequested) {
            finishCancelled(result);
            return false;
        }
        if (m_batchHandler && !m_batchHandler(result->batchPull)) {
            finishFailed(result, SyncPhase::Pulling,
                         SyncError::make(ErrorKind::Local, "Pulled batch was not applied"));
            return false;
        }
        SyncError ackError;
        if (!m_pull->acknowledgeBatch(result->batchPull, &ackError)) {
            finishFailed(result, SyncPhase::Pulling, ackError);
            return false;
        }
        return true;
    }

    result->smartPull = m_pull->smartPull();
    if (!result->smartPull.success) {
        finishFailed(result, SyncPhase::Pulling, result->smartPull.error);
        return false;
    }
    if (result->smartPull.events.isEmpty()) {
        return true;
    }
    if (m_cancelRequested) {
        finishCancelled(result);
        return false;
    }
    if (m_eventHandler && !m_eventHandler(result->smartPull.events)) {
        finishFailed(result, SyncPhase::Pulling,
                     SyncError::make(ErrorKind::Local, "Pulled events were not applied"));
        return false;
    }

    SyncError ackError;
    if (!m_pull->acknowledgeEvents(result->smartPull.events, &ackError)) {
        finishFailed(result, SyncPhase::Pulling, ackError);
        return false;
    }
    return true;
}

void SyncOrchestrator::finishFailed(SyncCycleResult *result, SyncPhase phase, const SyncError &error)
{
    result->success = false;
    result->failedPhase = phase;
    result->error = error;
    result->endTime = QDateTime::currentDateTimeUtc();

    setPhase(SyncPhase::Failed);
    qWarning() << "[SyncOrchestrator] Sync failed while" << syncPhaseToString(phase)
               << error.toString();

    QVariantMap data = eventData();
    data["phase"] = syncPhaseToString(phase);
    data["kind"] = errorKindToString(error.kind);
    data["message"] = error.message;
    data["status_code"] = error.statusCode;
    data["retryable"] = error.isRetryable();
    emit lifecycleEvent(EventType::SyncFailed, data);

    setPhase(SyncPhase::Idle);
    emit syncFinished(*result);
}

void SyncOrchestrator::finishCancelled(SyncCycleResult *result)
{
    // Outbox changes already committed stay; everything else is dropped
    SyncCycleResult cancelled;
    cancelled.cancelled = true;
    cancelled.startTime = result->startTime;
    cancelled.endTime = QDateTime::currentDateTimeUtc();
    cancelled.failedPhase = phase();
    cancelled.error = SyncError::make(ErrorKind::Cancelled, "Sync cancelled");
    *result = cancelled;

    qInfo() << "[SyncOrchestrator] Sync cancelled";
    QVariantMap data = eventData();
    data["phase"] = syncPhaseToString(result->failedPhase);
    emit lifecycleEvent(EventType::SyncCancelled, data);

    setPhase(SyncPhase::Idle);
    emit syncFinished(*result);
}

// ========== Periodic Update Check ==========

void SyncOrchestrator::setCheckInterval(int intervalMs)
{
    m_checkIntervalMs = intervalMs > 0 ? intervalMs : DEFAULT_CHECK_INTERVAL_MS;
}

void SyncOrchestrator::setBackoffPolicy(const BackoffPolicy &policy)
{
    m_checkBackoff = policy;
}

void SyncOrchestrator::startPeriodicCheck()
{
    if (m_checkActive) {
        return;
    }
    m_checkActive = true;
    m_checkBackoff.reset();
    qInfo() << "[SyncOrchestrator] Periodic update check every" << m_checkIntervalMs << "ms";
    scheduleCheck(0);
}

void SyncOrchestrator::stopPeriodicCheck()
{
    if (!m_checkActive) {
        return;
    }
    m_checkActive = false;
    m_checkTimer->stop();
    qInfo() << "[SyncOrchestrator] Periodic update check stopped";
}

void SyncOrchestrator::scheduleCheck(qint64 delayMs)
{
    if (!m_checkActive) {
        return;
    }
    emit checkScheduled(delayMs);
    m_checkTimer->start(int(delayMs));
}

void SyncOrchestrator::scheduleRetry(const SyncError &error)
{
    const qint64 delay = m_checkBackoff.nextDelayMs();
    if (delay < 0) {
        qWarning() << "[SyncOrchestrator] Still failing after" << m_checkBackoff.maxAttempts()
                   << "retries, back to regular interval";
        m_checkBackoff.reset();
        scheduleCheck(m_checkIntervalMs);
        return;
    }

    qWarning() << "[SyncOrchestrator] Retry" << m_checkBackoff.attempt() << "in" << delay
               << "ms after" << error.toString();
    scheduleCheck(delay);
}

void SyncOrchestrator::runPeriodicCheck()
{
    if (!m_checkActive || m_checkWatcher->isRunning() || m_cycleWatcher->isRunning()) {
        return;
    }
    PullEngine *pull = m_pull;
    m_checkWatcher->setFuture(QtConcurrent::run([pull]() {
        return pull->checkUpdates();
    }));
}

void SyncOrchestrator::onCheckFinished()
{
    const UpdatesInfo info = m_checkWatcher->result();
    if (!m_checkActive) {
        return;
    }

    if (!info.success) {
        scheduleRetry(info.error);
        return;
    }

    const bool outboxWaiting = !m_state->pushableChanges().isEmpty();
    if (!info.hasUpdates && !outboxWaiting) {
        m_checkBackoff.reset();
        scheduleCheck(m_checkIntervalMs);
        return;
    }

    // The next check is scheduled once the cycle is over
    qDebug() << "[SyncOrchestrator] Starting cycle:"
             << (info.hasUpdates ? "server has updates" : "outbox has pending changes");
    m_cycleWatcher->setFuture(requestSync());
}

void SyncOrchestrator::onCycleFinished()
{
    const SyncCycleResult result = m_cycleWatcher->result();
    if (!m_checkActive) {
        return;
    }

    if (!result.success && !result.cancelled && result.error.isRetryable()) {
        scheduleRetry(result.error);
        return;
    }

    m_checkBackoff.reset();
    scheduleCheck(m_checkIntervalMs);
}

} // namespace BridgeSync
