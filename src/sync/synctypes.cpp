#include "synctypes.h"

#include <QUuid>

namespace BridgeSync {

QString operationToString(ChangeOperation op)
{
    switch (op) {
    case ChangeOperation::Create: return "create";
    case ChangeOperation::Update: return "update";
    case ChangeOperation::Delete: return "delete";
    }
    return "update";
}

bool operationFromString(const QString &text, ChangeOperation *op)
{
    const QString lower = text.trimmed().toLower();
    if (lower == "create") {
        *op = ChangeOperation::Create;
    } else if (lower == "update" || lower == "write") {
        *op = ChangeOperation::Update;
    } else if (lower == "delete" || lower == "unlink") {
        *op = ChangeOperation::Delete;
    } else {
        return false;
    }
    return true;
}

QString conflictKindToString(ConflictKind kind)
{
    switch (kind) {
    case ConflictKind::BothModified: return "both_modified";
    case ConflictKind::RemoteDeleted: return "remote_deleted";
    case ConflictKind::Unknown: return "unknown";
    }
    return "unknown";
}

ConflictKind conflictKindFromString(const QString &text)
{
    const QString lower = text.trimmed().toLower();
    if (lower == "both_modified" || lower == "update_update" || lower == "modified") {
        return ConflictKind::BothModified;
    }
    if (lower == "remote_deleted" || lower == "deleted" || lower == "update_delete") {
        return ConflictKind::RemoteDeleted;
    }
    return ConflictKind::Unknown;
}

QString resolutionChoiceToString(ResolutionChoice choice)
{
    switch (choice) {
    case ResolutionChoice::KeepLocal: return "keep_local";
    case ResolutionChoice::KeepRemote: return "keep_remote";
    case ResolutionChoice::Merged: return "merged";
    }
    return "keep_local";
}

QString syncPhaseToString(SyncPhase phase)
{
    switch (phase) {
    case SyncPhase::Idle: return "idle";
    case SyncPhase::Pushing: return "pushing";
    case SyncPhase::Pulling: return "pulling";
    case SyncPhase::Resolving: return "resolving";
    case SyncPhase::Failed: return "failed";
    }
    return "idle";
}

// ========== PendingChange ==========

bool PendingChange::isValid() const
{
    if (entityType.isEmpty() || idempotencyKey.isEmpty()) {
        return false;
    }
    // Records that only exist locally can be created but not updated or deleted remotely
    if (targetId < 0 && operation != ChangeOperation::Create) {
        return false;
    }
    return true;
}

QVariantMap PendingChange::toWire() const
{
    QVariantMap map;
    map["idempotency_key"] = idempotencyKey;
    map["id"] = targetId;
    map["operation"] = operationToString(operation);
    map["values"] = values;
    if (createdAt.isValid()) {
        map["created_at"] = createdAt.toString(Qt::ISODateWithMs);
    }
    return map;
}

QVariantMap PendingChange::toVariantMap() const
{
    QVariantMap map = toWire();
    map["entity_type"] = entityType;
    return map;
}

PendingChange PendingChange::fromVariantMap(const QVariantMap &map)
{
    PendingChange change;
    change.entityType = map.value("entity_type").toString();
    change.targetId = map.value("id").toLongLong();
    if (!operationFromString(map.value("operation").toString(), &change.operation)) {
        change.operation = ChangeOperation::Update;
    }
    change.values = map.value("values").toMap();
    change.idempotencyKey = map.value("idempotency_key").toString();
    change.createdAt = QDateTime::fromString(map.value("created_at").toString(), Qt::ISODateWithMs);
    return change;
}

PendingChange PendingChange::create(const QString &entityType, qint64 targetId,
                                    ChangeOperation operation, const Payload &values)
{
    PendingChange change;
    change.entityType = entityType;
    change.targetId = targetId;
    change.operation = operation;
    change.values = values;
    change.idempotencyKey = generateIdempotencyKey();
    change.createdAt = QDateTime::currentDateTimeUtc();
    return change;
}

QString PendingChange::generateIdempotencyKey()
{
    return QUuid::createUuid().toString(QUuid::WithoutBraces);
}

// ========== Conflict ==========

QVariantMap Conflict::toVariantMap() const
{
    QVariantMap map;
    map["conflict_id"] = conflictId;
    map["change"] = change.toVariantMap();
    map["local"] = localPayload;
    map["remote"] = remotePayload;
    map["kind"] = conflictKindToString(kind);
    map["detected_at"] = detectedAt.toString(Qt::ISODateWithMs);
    return map;
}

Conflict Conflict::fromVariantMap(const QVariantMap &map)
{
    Conflict conflict;
    conflict.conflictId = map.value("conflict_id").toString();
    conflict.change = PendingChange::fromVariantMap(map.value("change").toMap());
    conflict.localPayload = map.value("local").toMap();
    conflict.remotePayload = map.value("remote").toMap();
    conflict.kind = conflictKindFromString(map.value("kind").toString());
    conflict.detectedAt = QDateTime::fromString(map.value("detected_at").toString(), Qt::ISODateWithMs);
    return conflict;
}

// ========== ChangeEvent ==========

ChangeEvent ChangeEvent::fromVariantMap(const QVariantMap &map)
{
    ChangeEvent event;
    event.id = map.value("id").toLongLong();
    event.entityType = map.value("model", map.value("entity_type")).toString();
    event.recordId = map.value("record_id").toLongLong();
    event.event = map.value("event", map.value("event_type")).toString();
    event.timestamp = QDateTime::fromString(map.value("timestamp").toString(), Qt::ISODateWithMs);
    event.payload = map.value("payload", map.value("data")).toMap();
    return event;
}

qint64 SmartPullResult::highestEventId() const
{
    qint64 highest = -1;
    for (const ChangeEvent &event : events) {
        if (event.id > highest) {
            highest = event.id;
        }
    }
    return highest;
}

QString SyncCycleResult::summary() const
{
    if (cancelled) {
        return "Cancelled";
    }
    if (!success) {
        return QString("Failed while %1: %2")
            .arg(syncPhaseToString(failedPhase), error.toString());
    }

    const int pulled = usedBatchPull ? batchPull.totalRecords : smartPull.newEventsCount;
    return QString("Pushed: %1, Rejected: %2, Conflicts: %3, Pulled: %4, Resolved: %5")
        .arg(push.successful.size())
        .arg(push.failed.size())
        .arg(push.conflicts.size())
        .arg(pulled)
        .arg(resolution.resolved.size());
}

} // namespace BridgeSync
