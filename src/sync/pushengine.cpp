#include "pushengine.h"
#include "syncstatestore.h"
#include "../net/synctransport.h"
#include "../net/endpoints.h"

#include <QJsonArray>
#include <QSet>
#include <QDebug>

namespace BridgeSync {

namespace {

QString keyOf(const QVariant &entry)
{
    if (entry.typeId() == QMetaType::QString) {
        return entry.toString();
    }
    const QVariantMap map = entry.toMap();
    for (const char *name : {"idempotency_key", "key", "id"}) {
        const QString value = map.value(name).toString();
        if (!value.isEmpty()) {
            return value;
        }
    }
    return QString();
}

QVariantMap firstMap(const QVariantMap &map, std::initializer_list<const char *> names)
{
    for (const char *name : names) {
        if (map.contains(name)) {
            return map.value(name).toMap();
        }
    }
    return QVariantMap();
}

QString firstString(const QVariantMap &map, std::initializer_list<const char *> names)
{
    for (const char *name : names) {
        const QString value = map.value(name).toString();
        if (!value.isEmpty()) {
            return value;
        }
    }
    return QString();
}

} // namespace

PushEngine::PushEngine(SyncTransport *transport, SyncStateStore *state, QObject *parent)
    : QObject(parent)
    , m_transport(transport)
    , m_state(state)
{
}

QJsonObject PushEngine::buildRequest(const QString &deviceId,
                                     const QMap<QString, QList<PendingChange>> &changes,
                                     const QDateTime &timestamp)
{
    QJsonObject grouped;
    for (auto it = changes.constBegin(); it != changes.constEnd(); ++it) {
        QJsonArray entries;
        for (const PendingChange &change : it.value()) {
            entries.append(QJsonObject::fromVariantMap(change.toWire()));
        }
        grouped[it.key()] = entries;
    }

    QJsonObject body;
    body["device_id"] = deviceId;
    body["changes"] = grouped;
    body["timestamp"] = timestamp.toString(Qt::ISODateWithMs);
    return body;
}

PushResult PushEngine::push()
{
    PushResult result;

    const QMap<QString, QList<PendingChange>> changes = m_state->pushableChanges();
    QMap<QString, PendingChange> batch;
    for (const QList<PendingChange> &list : changes) {
        for (const PendingChange &change : list) {
            batch.insert(change.idempotencyKey, change);
        }
    }

    if (batch.isEmpty()) {
        qDebug() << "[PushEngine] Nothing to push";
        result.success = true;
        return result;
    }

    result.submitted = batch.size();
    qInfo() << "[PushEngine] Pushing" << batch.size() << "changes across"
            << changes.size() << "entity types";

    const QJsonObject request = buildRequest(m_state->deviceId(), changes,
                                             QDateTime::currentDateTimeUtc());
    const TransportReply reply = m_transport->post(Endpoints::Push, request);
    if (!reply.ok) {
        // Nothing observed, so nothing changes locally
        result.error = reply.error;
        qWarning() << "[PushEngine] Push failed:" << result.error.toString();
        return result;
    }

    parseResponse(reply.body, batch, &result);

    QStringList terminal = result.successful;
    for (const RejectedChange &rejected : result.failed) {
        terminal << rejected.idempotencyKey;
    }
    QString storeError;
    if (m_state->removePendingChanges(terminal, &storeError) < 0) {
        // Outcomes stay in the outbox; resubmitting them with the same keys is safe
        result.error = SyncError::make(ErrorKind::Local,
            "Could not persist push outcomes: " + storeError, Endpoints::Push);
        qWarning() << "[PushEngine]" << result.error.toString();
        return result;
    }

    for (const Conflict &conflict : result.conflicts) {
        if (!m_state->recordConflict(conflict, &storeError)) {
            result.error = SyncError::make(ErrorKind::Local,
                QString("Could not record conflict %1: %2").arg(conflict.conflictId, storeError),
                Endpoints::Push);
            qWarning() << "[PushEngine]" << result.error.toString();
            return result;
        }
    }

    for (const RejectedChange &rejected : result.failed) {
        qWarning() << "[PushEngine] Rejected" << rejected.entityType
                   << rejected.idempotencyKey << ":" << rejected.reason;
    }

    if (!m_state->markSynced(QDateTime::currentDateTimeUtc(), &storeError)) {
        qWarning() << "[PushEngine] Last sync time not saved:" << storeError;
    }
    result.success = true;

    qInfo() << "[PushEngine] Push completed:" << result.successful.size() << "successful,"
            << result.failed.size() << "failed," << result.conflicts.size() << "conflicts";

    if (result.hasConflicts()) {
        QStringList ids;
        for (const Conflict &conflict : result.conflicts) {
            ids << conflict.conflictId;
        }
        QVariantMap data;
        data["conflict_count"] = result.conflicts.size();
        data["conflict_ids"] = ids;
        emit lifecycleEvent(EventType::ConflictDetected, data);
    }

    return result;
}

void PushEngine::parseResponse(const QJsonObject &body,
                               const QMap<QString, PendingChange> &batch,
                               PushResult *result) const
{
    const QVariantMap response = body.toVariantMap();
    QSet<QString> seen;

    auto accept = [&](const QString &key) {
        if (key.isEmpty() || !batch.contains(key)) {
            qWarning() << "[PushEngine] Ignoring response entry for unknown key" << key;
            return false;
        }
        if (seen.contains(key)) {
            qWarning() << "[PushEngine] Ignoring duplicate response entry for" << key;
            return false;
        }
        seen.insert(key);
        return true;
    };

    for (const QVariant &entry : response.value("successful").toList()) {
        const QString key = keyOf(entry);
        if (accept(key)) {
            result->successful << key;
        }
    }

    for (const QVariant &entry : response.value("failed").toList()) {
        const QString key = keyOf(entry);
        if (!accept(key)) {
            continue;
        }
        const QVariantMap map = entry.toMap();
        RejectedChange rejected;
        rejected.idempotencyKey = key;
        rejected.entityType = batch.value(key).entityType;
        rejected.reason = firstString(map, {"reason", "error", "message"});
        if (rejected.reason.isEmpty()) {
            rejected.reason = "Rejected by server";
        }
        rejected.details = map;
        result->failed << rejected;
    }

    for (const QVariant &entry : response.value("conflicts").toList()) {
        const QString key = keyOf(entry);
        if (!accept(key)) {
            continue;
        }
        const QVariantMap map = entry.toMap();
        const PendingChange change = batch.value(key);

        Conflict conflict;
        conflict.conflictId = firstString(map, {"conflict_id"});
        if (conflict.conflictId.isEmpty()) {
            conflict.conflictId = key;
        }
        conflict.change = change;
        conflict.localPayload = firstMap(map, {"local", "local_data", "local_payload"});
        if (conflict.localPayload.isEmpty()) {
            conflict.localPayload = change.values;
        }
        conflict.remotePayload = firstMap(map, {"remote", "server_data", "remote_payload"});
        conflict.kind = conflictKindFromString(firstString(map, {"type", "conflict_type", "kind"}));
        conflict.detectedAt = QDateTime::currentDateTimeUtc();
        result->conflicts << conflict;
    }

    const int unaccounted = batch.size() - seen.size();
    if (unaccounted > 0) {
        qDebug() << "[PushEngine]" << unaccounted << "changes without outcome stay in the outbox";
    }
}

} // namespace BridgeSync
