#include "syncstatestore.h"
#include "../store/keyvaluestore.h"

#include <QJsonArray>
#include <QDebug>

namespace BridgeSync {

namespace {
const int STATE_VERSION = 2;

void setError(QString *error, const QString &message)
{
    if (error) {
        *error = message;
    }
}
}

SyncStateStore::SyncStateStore(const QString &userId,
                               const QString &deviceId,
                               KeyValueStore *store,
                               QObject *parent)
    : QObject(parent)
    , m_userId(userId)
    , m_deviceId(deviceId)
    , m_store(store)
{
}

SyncStateStore::~SyncStateStore() = default;

QString SyncStateStore::storageKey() const
{
    return m_userId + "/" + m_deviceId + "/state";
}

// ========== Cursor ==========

SyncCursor SyncStateStore::cursor() const
{
    QMutexLocker locker(&m_mutex);
    SyncCursor cursor;
    cursor.lastEventId = m_lastEventId;
    cursor.lastSyncAt = m_lastSyncAt;
    cursor.initialPullDone = m_initialPullDone;
    cursor.pendingChanges = m_outbox.size();
    return cursor;
}

bool SyncStateStore::advanceEventCursor(qint64 eventId, QString *error)
{
    QString saveError;
    {
        QMutexLocker locker(&m_mutex);
        if (eventId <= m_lastEventId) {
            return false;
        }
        const qint64 previous = m_lastEventId;
        m_lastEventId = eventId;
        if (!saveLocked(&saveError)) {
            m_lastEventId = previous;
        }
    }

    if (!saveError.isEmpty()) {
        setError(error, saveError);
        emit errorOccurred(saveError);
        return false;
    }

    qDebug() << "[SyncStateStore] Event cursor advanced to" << eventId;
    emit stateChanged();
    return true;
}

bool SyncStateStore::resetEventCursor(QString *error)
{
    QString saveError;
    {
        QMutexLocker locker(&m_mutex);
        const qint64 previous = m_lastEventId;
        m_lastEventId = -1;
        if (!saveLocked(&saveError)) {
            m_lastEventId = previous;
        }
    }

    if (!saveError.isEmpty()) {
        setError(error, saveError);
        emit errorOccurred(saveError);
        return false;
    }

    qInfo() << "[SyncStateStore] Event cursor reset for" << m_userId << m_deviceId;
    emit stateChanged();
    return true;
}

bool SyncStateStore::markSynced(const QDateTime &time, QString *error)
{
    QString saveError;
    {
        QMutexLocker locker(&m_mutex);
        const QDateTime previous = m_lastSyncAt;
        m_lastSyncAt = time.isValid() ? time.toUTC() : QDateTime::currentDateTimeUtc();
        if (!saveLocked(&saveError)) {
            m_lastSyncAt = previous;
        }
    }

    if (!saveError.isEmpty()) {
        setError(error, saveError);
        emit errorOccurred(saveError);
        return false;
    }
    emit stateChanged();
    return true;
}

bool SyncStateStore::markInitialPullDone(const QDateTime &syncedAt, QString *error)
{
    QString saveError;
    {
        QMutexLocker locker(&m_mutex);
        const QDateTime previousTime = m_lastSyncAt;
        const bool previousDone = m_initialPullDone;
        m_lastSyncAt = syncedAt.isValid() ? syncedAt.toUTC() : QDateTime::currentDateTimeUtc();
        m_initialPullDone = true;
        if (!saveLocked(&saveError)) {
            m_lastSyncAt = previousTime;
            m_initialPullDone = previousDone;
        }
    }

    if (!saveError.isEmpty()) {
        setError(error, saveError);
        emit errorOccurred(saveError);
        return false;
    }

    qInfo() << "[SyncStateStore] Initial pull applied for" << m_userId << m_deviceId;
    emit stateChanged();
    return true;
}

bool SyncStateStore::isFirstSync() const
{
    QMutexLocker locker(&m_mutex);
    return m_lastEventId < 0 && !m_initialPullDone;
}

// ========== Outbox ==========

int SyncStateStore::indexOfChange(const QString &idempotencyKey) const
{
    for (int i = 0; i < m_outbox.size(); ++i) {
        if (m_outbox[i].idempotencyKey == idempotencyKey) {
            return i;
        }
    }
    return -1;
}

QString SyncStateStore::conflictIdForKey(const QString &idempotencyKey) const
{
    for (auto it = m_conflicts.constBegin(); it != m_conflicts.constEnd(); ++it) {
        if (it.value().change.idempotencyKey == idempotencyKey) {
            return it.key();
        }
    }
    return QString();
}

bool SyncStateStore::stageChange(const PendingChange &change, QString *error)
{
    if (!change.isValid()) {
        if (error) {
            *error = QString("Invalid change for %1 (id %2)")
                .arg(change.entityType).arg(change.targetId);
        }
        return false;
    }

    QString saveError;
    {
        QMutexLocker locker(&m_mutex);
        if (indexOfChange(change.idempotencyKey) >= 0) {
            if (error) {
                *error = QString("Idempotency key already staged: %1").arg(change.idempotencyKey);
            }
            return false;
        }

        m_outbox.append(change);
        if (!saveLocked(&saveError)) {
            // Not durable, so not staged
            m_outbox.removeLast();
        }
    }

    if (!saveError.isEmpty()) {
        if (error) {
            *error = saveError;
        }
        emit errorOccurred(saveError);
        return false;
    }

    qDebug() << "[SyncStateStore] Staged" << operationToString(change.operation)
             << change.entityType << change.targetId << change.idempotencyKey;
    emit stateChanged();
    return true;
}

QList<PendingChange> SyncStateStore::pendingChanges() const
{
    QMutexLocker locker(&m_mutex);
    return m_outbox;
}

QMap<QString, QList<PendingChange>> SyncStateStore::pushableChanges() const
{
    QMutexLocker locker(&m_mutex);

    QMap<QString, QList<PendingChange>> grouped;
    for (const PendingChange &change : m_outbox) {
        if (!conflictIdForKey(change.idempotencyKey).isEmpty()) {
            continue;  // Waits for an explicit resolution
        }
        grouped[change.entityType].append(change);
    }
    return grouped;
}

bool SyncStateStore::hasPendingChange(const QString &idempotencyKey) const
{
    QMutexLocker locker(&m_mutex);
    return indexOfChange(idempotencyKey) >= 0;
}

bool SyncStateStore::pendingChange(const QString &idempotencyKey, PendingChange *change) const
{
    QMutexLocker locker(&m_mutex);
    const int index = indexOfChange(idempotencyKey);
    if (index < 0) {
        return false;
    }
    if (change) {
        *change = m_outbox[index];
    }
    return true;
}

int SyncStateStore::removePendingChanges(const QStringList &idempotencyKeys, QString *error)
{
    int removed = 0;
    QString saveError;
    {
        QMutexLocker locker(&m_mutex);
        const QList<PendingChange> previous = m_outbox;
        for (const QString &key : idempotencyKeys) {
            const int index = indexOfChange(key);
            if (index >= 0) {
                m_outbox.removeAt(index);
                ++removed;
            }
        }
        if (removed > 0 && !saveLocked(&saveError)) {
            m_outbox = previous;
        }
    }

    if (!saveError.isEmpty()) {
        setError(error, saveError);
        emit errorOccurred(saveError);
        return -1;
    }
    if (removed > 0) {
        emit stateChanged();
    }
    return removed;
}

int SyncStateStore::outboxSize() const
{
    QMutexLocker locker(&m_mutex);
    return m_outbox.size();
}

// ========== Conflicts ==========

bool SyncStateStore::recordConflict(const Conflict &conflict, QString *error)
{
    if (conflict.conflictId.isEmpty()) {
        if (error) {
            *error = "Conflict without id";
        }
        return false;
    }

    QString saveError;
    {
        QMutexLocker locker(&m_mutex);
        const QString key = conflict.change.idempotencyKey;
        if (indexOfChange(key) < 0) {
            if (error) {
                *error = QString("Conflict %1 refers to unknown change %2")
                    .arg(conflict.conflictId, key);
            }
            return false;
        }

        const QMap<QString, Conflict> previousConflicts = m_conflicts;
        const QString previous = conflictIdForKey(key);
        if (!previous.isEmpty()) {
            m_conflicts.remove(previous);
        }
        m_conflicts.insert(conflict.conflictId, conflict);
        if (!saveLocked(&saveError)) {
            m_conflicts = previousConflicts;
        }
    }

    if (!saveError.isEmpty()) {
        setError(error, saveError);
        emit errorOccurred(saveError);
        return false;
    }
    qInfo() << "[SyncStateStore] Conflict recorded:" << conflict.conflictId
            << conflict.change.entityType << conflict.change.targetId
            << conflictKindToString(conflict.kind);
    emit stateChanged();
    return true;
}

QList<Conflict> SyncStateStore::conflicts() const
{
    QMutexLocker locker(&m_mutex);
    return m_conflicts.values();
}

bool SyncStateStore::conflict(const QString &conflictId, Conflict *conflict) const
{
    QMutexLocker locker(&m_mutex);
    auto it = m_conflicts.constFind(conflictId);
    if (it == m_conflicts.constEnd()) {
        return false;
    }
    if (conflict) {
        *conflict = it.value();
    }
    return true;
}

bool SyncStateStore::hasConflict(const QString &conflictId) const
{
    QMutexLocker locker(&m_mutex);
    return m_conflicts.contains(conflictId);
}

int SyncStateStore::conflictCount() const
{
    QMutexLocker locker(&m_mutex);
    return m_conflicts.size();
}

bool SyncStateStore::removeConflict(const QString &conflictId, QString *error)
{
    QString saveError;
    {
        QMutexLocker locker(&m_mutex);
        auto it = m_conflicts.find(conflictId);
        if (it == m_conflicts.end()) {
            setError(error, QString("Unknown conflict %1").arg(conflictId));
            return false;
        }

        const QList<PendingChange> previousOutbox = m_outbox;
        const QMap<QString, Conflict> previousConflicts = m_conflicts;
        const int index = indexOfChange(it.value().change.idempotencyKey);
        if (index >= 0) {
            m_outbox.removeAt(index);
        }
        m_conflicts.erase(it);
        if (!saveLocked(&saveError)) {
            m_outbox = previousOutbox;
            m_conflicts = previousConflicts;
        }
    }

    if (!saveError.isEmpty()) {
        setError(error, saveError);
        emit errorOccurred(saveError);
        return false;
    }
    emit stateChanged();
    return true;
}

// ========== Persistence ==========

bool SyncStateStore::load()
{
    if (!m_store) {
        emit errorOccurred("No storage configured");
        return false;
    }

    const QString key = storageKey();
    if (!m_store->contains(key)) {
        // No previous state - this is fine for first sync
        return true;
    }

    QString error;
    const QJsonObject root = m_store->read(key, &error);
    if (!error.isEmpty()) {
        qWarning() << "[SyncStateStore]" << error;
        emit errorOccurred(error);
        return false;
    }

    int outbox = 0;
    int conflicts = 0;
    {
        QMutexLocker locker(&m_mutex);
        fromJson(root);
        outbox = m_outbox.size();
        conflicts = m_conflicts.size();
    }

    qDebug() << "[SyncStateStore] Loaded" << outbox << "pending changes and"
             << conflicts << "conflicts for" << m_userId << m_deviceId;
    emit stateChanged();
    return true;
}

bool SyncStateStore::save()
{
    QString error;
    bool ok;
    {
        QMutexLocker locker(&m_mutex);
        ok = saveLocked(&error);
    }
    if (!ok) {
        emit errorOccurred(error);
    }
    return ok;
}

bool SyncStateStore::saveLocked(QString *error)
{
    if (!m_store) {
        *error = "No storage configured";
        return false;
    }

    if (!m_store->write(storageKey(), toJson(), error)) {
        qWarning() << "[SyncStateStore] Failed to save state:" << *error;
        return false;
    }
    return true;
}

bool SyncStateStore::reset(QString *error)
{
    QString saveError;
    {
        QMutexLocker locker(&m_mutex);
        const qint64 previousEventId = m_lastEventId;
        const QDateTime previousSyncAt = m_lastSyncAt;
        const bool previousDone = m_initialPullDone;
        const QMap<QString, Conflict> previousConflicts = m_conflicts;

        m_lastEventId = -1;
        m_lastSyncAt = QDateTime();
        m_initialPullDone = false;
        m_conflicts.clear();
        if (!saveLocked(&saveError)) {
            m_lastEventId = previousEventId;
            m_lastSyncAt = previousSyncAt;
            m_initialPullDone = previousDone;
            m_conflicts = previousConflicts;
        }
    }

    if (!saveError.isEmpty()) {
        setError(error, saveError);
        emit errorOccurred(saveError);
        return false;
    }

    qInfo() << "[SyncStateStore] State reset for" << m_userId << m_deviceId;
    emit stateChanged();
    return true;
}

QJsonObject SyncStateStore::toJson() const
{
    QJsonObject root;
    root["version"] = STATE_VERSION;
    root["userId"] = m_userId;
    root["deviceId"] = m_deviceId;

    QJsonObject cursor;
    cursor["lastEventId"] = m_lastEventId >= 0 ? QJsonValue(m_lastEventId) : QJsonValue();
    cursor["lastSyncAt"] = m_lastSyncAt.isValid()
        ? QJsonValue(m_lastSyncAt.toString(Qt::ISODateWithMs)) : QJsonValue();
    cursor["initialPullDone"] = m_initialPullDone;
    root["cursor"] = cursor;

    QJsonArray outbox;
    for (const PendingChange &change : m_outbox) {
        outbox.append(QJsonObject::fromVariantMap(change.toVariantMap()));
    }
    root["outbox"] = outbox;

    QJsonArray conflicts;
    for (const Conflict &conflict : m_conflicts) {
        conflicts.append(QJsonObject::fromVariantMap(conflict.toVariantMap()));
    }
    root["conflicts"] = conflicts;

    return root;
}

void SyncStateStore::fromJson(const QJsonObject &root)
{
    const QJsonObject cursor = root["cursor"].toObject();
    const QJsonValue eventId = cursor["lastEventId"];
    m_lastEventId = eventId.isDouble() ? qint64(eventId.toDouble()) : -1;
    m_lastSyncAt = QDateTime::fromString(cursor["lastSyncAt"].toString(), Qt::ISODateWithMs);
    // Version 1 files predate the flag; an event cursor implies a finished initial pull
    m_initialPullDone = cursor["initialPullDone"].toBool(m_lastEventId >= 0);

    m_outbox.clear();
    for (const QJsonValue &val : root["outbox"].toArray()) {
        const PendingChange change = PendingChange::fromVariantMap(val.toObject().toVariantMap());
        if (!change.isValid()) {
            qWarning() << "[SyncStateStore] Skipping invalid stored change" << change.idempotencyKey;
            continue;
        }
        m_outbox.append(change);
    }

    m_conflicts.clear();
    for (const QJsonValue &val : root["conflicts"].toArray()) {
        const Conflict conflict = Conflict::fromVariantMap(val.toObject().toVariantMap());
        if (conflict.conflictId.isEmpty() || indexOfChange(conflict.change.idempotencyKey) < 0) {
            qWarning() << "[SyncStateStore] Skipping orphaned conflict" << conflict.conflictId;
            continue;
        }
        m_conflicts.insert(conflict.conflictId, conflict);
    }
}

} // namespace BridgeSync
