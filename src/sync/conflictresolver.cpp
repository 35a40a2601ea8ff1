#include "conflictresolver.h"
#include "syncstatestore.h"
#include "../net/synctransport.h"
#include "../net/endpoints.h"

#include <QtConcurrent/QtConcurrent>
#include <QJsonArray>
#include <QSet>
#include <QDebug>

namespace BridgeSync {

ConflictResolver::ConflictResolver(SyncTransport *transport, SyncStateStore *state, QObject *parent)
    : QObject(parent)
    , m_transport(transport)
    , m_state(state)
{
    m_pool.setMaxThreadCount(DEFAULT_MAX_PARALLEL);
}

ConflictResolver::~ConflictResolver()
{
    m_pool.waitForDone();
}

void ConflictResolver::setMaxParallel(int count)
{
    m_pool.setMaxThreadCount(count > 0 ? count : 1);
}

int ConflictResolver::maxParallel() const
{
    return m_pool.maxThreadCount();
}

QJsonObject ConflictResolver::buildRequest(const QString &deviceId,
                                           const ResolutionRequest &request,
                                           const Conflict &conflict)
{
    QJsonObject resolution;
    resolution["conflict_id"] = request.conflictId;
    resolution["resolution"] = resolutionChoiceToString(request.choice);
    resolution["idempotency_key"] = conflict.change.idempotencyKey;
    resolution["model"] = conflict.change.entityType;
    resolution["id"] = conflict.change.targetId;
    if (request.choice == ResolutionChoice::Merged) {
        resolution["merged_data"] = QJsonObject::fromVariantMap(request.mergedPayload);
    }

    QJsonObject body;
    body["device_id"] = deviceId;
    body["resolutions"] = QJsonArray{resolution};
    return body;
}

ResolutionResult ConflictResolver::resolve(const QList<ResolutionRequest> &requests)
{
    ResolutionResult result;
    if (requests.isEmpty()) {
        return result;
    }

    // Duplicate ids would race on the same conflict
    QList<ResolutionRequest> unique;
    QSet<QString> seen;
    for (const ResolutionRequest &request : requests) {
        if (seen.contains(request.conflictId)) {
            ResolutionFailure failure;
            failure.conflictId = request.conflictId;
            failure.error = SyncError::make(ErrorKind::Validation,
                "Duplicate resolution for conflict " + request.conflictId);
            result.failed << failure;
            continue;
        }
        seen.insert(request.conflictId);
        unique << request;
    }

    qInfo() << "[ConflictResolver] Resolving" << unique.size() << "conflicts with up to"
            << m_pool.maxThreadCount() << "parallel requests";

    const QList<Outcome> outcomes = QtConcurrent::blockingMapped<QList<Outcome>>(
        &m_pool, unique, [this](const ResolutionRequest &request) {
            return resolveOne(request);
        });

    for (const Outcome &outcome : outcomes) {
        if (outcome.resolved) {
            result.resolved << outcome.conflictId;
        } else {
            ResolutionFailure failure;
            failure.conflictId = outcome.conflictId;
            failure.error = outcome.error;
            result.failed << failure;
        }
    }

    qInfo() << "[ConflictResolver] Conflicts resolved:" << result.resolved.size()
            << "successful," << result.failed.size() << "failed";

    if (result.resolved.isEmpty()) {
        return result;
    }

    QStringList failedIds;
    for (const ResolutionFailure &failure : result.failed) {
        failedIds << failure.conflictId;
    }
    QVariantMap data;
    data["resolved_count"] = result.resolved.size();
    data["failed_count"] = result.failed.size();
    data["resolved"] = result.resolved;
    data["failed"] = failedIds;
    emit lifecycleEvent(EventType::ConflictResolved, data);

    return result;
}

ConflictResolver::Outcome ConflictResolver::resolveOne(const ResolutionRequest &request)
{
    Outcome outcome;
    outcome.conflictId = request.conflictId;

    Conflict conflict;
    if (!m_state->conflict(request.conflictId, &conflict)) {
        outcome.error = SyncError::make(ErrorKind::Validation,
            "Unknown conflict " + request.conflictId);
        return outcome;
    }
    if (request.choice == ResolutionChoice::Merged && request.mergedPayload.isEmpty()) {
        outcome.error = SyncError::make(ErrorKind::Validation,
            "Merged resolution without payload for " + request.conflictId);
        return outcome;
    }

    const TransportReply reply = m_transport->post(
        Endpoints::ResolveConflicts, buildRequest(m_state->deviceId(), request, conflict));
    if (!reply.ok) {
        outcome.error = reply.error;
        qWarning() << "[ConflictResolver]" << request.conflictId << outcome.error.toString();
        return outcome;
    }

    for (const QJsonValue &entry : reply.body.value("failed").toArray()) {
        const QJsonObject obj = entry.toObject();
        const QString id = entry.isString() ? entry.toString() : obj.value("conflict_id").toString();
        if (id == request.conflictId) {
            QString reason = obj.value("reason").toString();
            if (reason.isEmpty()) {
                reason = obj.value("error").toString("Resolution rejected by server");
            }
            outcome.error = SyncError::make(ErrorKind::Validation, reason,
                                            Endpoints::ResolveConflicts, reply.httpStatus);
            qWarning() << "[ConflictResolver]" << request.conflictId << reason;
            return outcome;
        }
    }

    if (reply.body.contains("resolved")) {
        bool confirmed = false;
        for (const QJsonValue &entry : reply.body.value("resolved").toArray()) {
            const QString id = entry.isString()
                ? entry.toString() : entry.toObject().value("conflict_id").toString();
            if (id == request.conflictId) {
                confirmed = true;
                break;
            }
        }
        if (!confirmed) {
            outcome.error = SyncError::make(ErrorKind::Protocol,
                "Server did not confirm conflict " + request.conflictId,
                Endpoints::ResolveConflicts, reply.httpStatus);
            return outcome;
        }
    }

    QString storeError;
    if (!m_state->removeConflict(request.conflictId, &storeError)) {
        // Resolved remotely; the conflict stays open locally until it is persisted
        outcome.error = SyncError::make(ErrorKind::Local,
            QString("Could not remove resolved conflict %1: %2").arg(request.conflictId, storeError),
            Endpoints::ResolveConflicts);
        qWarning() << "[ConflictResolver]" << outcome.error.toString();
        return outcome;
    }
    outcome.resolved = true;
    qDebug() << "[ConflictResolver] Resolved" << request.conflictId
             << resolutionChoiceToString(request.choice);
    return outcome;
}

} // namespace BridgeSync
