#include "syncclient.h"

#include "net/httptransport.h"
#include "store/jsonfilestore.h"
#include "sync/syncstatestore.h"
#include "sync/syncorchestrator.h"
#include "sync/pullengine.h"
#include "sync/conflictresolver.h"
#include "sync/backoffpolicy.h"
#include "sync/reconnectscheduler.h"
#include "query/invalidfieldcache.h"
#include "query/recordqueryservice.h"

#include <QUrl>
#include <QDebug>

namespace BridgeSync {

SyncClient::SyncClient(const SyncSettings &settings, QObject *parent)
    : QObject(parent)
    , m_settings(settings)
{
    m_transport = new HttpTransport(QUrl(settings.baseUrl()), this);
    m_transport->setBearerToken(settings.token());
    m_transport->setTimeout(settings.timeoutMs());

    m_store.reset(new JsonFileStore(settings.stateDirectory()));
    m_state = new SyncStateStore(settings.userId(), settings.deviceId(), m_store.get(), this);

    m_fieldCache.reset(new SharedInvalidFieldCache());
    m_records.reset(new RecordQueryService(m_transport, m_fieldCache.get()));

    BackoffPolicy policy(settings.backoffBaseDelayMs(), settings.backoffMaxAttempts());
    policy.setJitterRatio(settings.backoffJitterRatio());

    m_orchestrator = new SyncOrchestrator(m_transport, m_state, this);
    m_orchestrator->setCheckInterval(settings.checkIntervalMs());
    m_orchestrator->setBackoffPolicy(policy);
    m_orchestrator->pullEngine()->setAppType(settings.appType());
    m_orchestrator->pullEngine()->setModels(settings.models());
    m_orchestrator->pullEngine()->setBatchSize(settings.batchSize());
    m_orchestrator->pullEngine()->setSmartPullLimit(settings.smartPullLimit());
    m_orchestrator->conflictResolver()->setMaxParallel(settings.maxParallelResolutions());
    connect(m_orchestrator, &SyncOrchestrator::lifecycleEvent,
            this, &SyncClient::lifecycleEvent);

    m_reconnect = new ReconnectScheduler(policy, this);
    m_reconnect->setConnectFunction([this]() { return backendReachable(); });
    connect(m_reconnect, &ReconnectScheduler::reconnected,
            m_orchestrator, &SyncOrchestrator::startPeriodicCheck);
    connect(m_reconnect, &ReconnectScheduler::gaveUp,
            this, &SyncClient::backendUnreachable);

    applyConflictPolicy();
}

SyncClient::~SyncClient()
{
    stopWatching();
}

bool SyncClient::initialize(QString *error)
{
    const QStringList problems = m_settings.validate();
    if (!problems.isEmpty()) {
        if (error) {
            *error = problems.join("; ");
        }
        return false;
    }

    if (!m_state->load()) {
        if (error) {
            *error = QString("Failed to load sync state from %1").arg(m_store->baseDir());
        }
        return false;
    }

    qDebug() << "[SyncClient] Ready for" << m_settings.userId() << m_settings.deviceId()
             << "against" << m_settings.baseUrl();
    return true;
}

void SyncClient::applyConflictPolicy()
{
    const QString policy = m_settings.conflictPolicy();
    if (policy != "keep_local" && policy != "keep_remote") {
        return;  // Manual: conflicts wait for an explicit decision
    }

    const ResolutionChoice choice = policy == "keep_local"
        ? ResolutionChoice::KeepLocal : ResolutionChoice::KeepRemote;
    m_orchestrator->setResolutionProvider([choice](const QList<Conflict> &conflicts) {
        QList<ResolutionRequest> requests;
        for (const Conflict &conflict : conflicts) {
            ResolutionRequest request;
            request.conflictId = conflict.conflictId;
            request.choice = choice;
            requests << request;
        }
        return requests;
    });
}

bool SyncClient::stageChange(const QString &entityType, ChangeOperation operation, qint64 targetId,
                             const Payload &values, QString *error, QString *idempotencyKey)
{
    const PendingChange change = PendingChange::create(entityType, targetId, operation, values);
    if (!m_state->stageChange(change, error)) {
        return false;
    }
    if (idempotencyKey) {
        *idempotencyKey = change.idempotencyKey;
    }
    return true;
}

// ========== Watching ==========

bool SyncClient::backendReachable()
{
    const HealthStatus health = m_orchestrator->pullEngine()->checkHealth();
    if (!health.success) {
        return false;
    }
    if (!health.healthy) {
        qWarning() << "[SyncClient] Backend reports status" << health.status;
    }
    return true;
}

void SyncClient::startWatching()
{
    if (backendReachable()) {
        m_reconnect->connectionEstablished();
        m_orchestrator->startPeriodicCheck();
        return;
    }

    qWarning() << "[SyncClient] Backend unreachable, scheduling reconnect";
    m_reconnect->connectionDropped();
}

void SyncClient::stopWatching()
{
    m_reconnect->stop();
    m_orchestrator->stopPeriodicCheck();
}

} // namespace BridgeSync
