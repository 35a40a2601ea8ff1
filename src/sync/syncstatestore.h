#ifndef SYNCSTATESTORE_H
#define SYNCSTATESTORE_H

#include <QObject>
#include <QString>
#include <QDateTime>
#include <QMap>
#include <QList>
#include <QMutex>
#include <QJsonObject>
#include "synctypes.h"

namespace BridgeSync {

class KeyValueStore;

/**
 * @brief Durable sync state for one (user, device) pair
 *
 * Holds the cursor, the outbox of pending changes and the open
 * conflicts. Every mutation is persisted immediately through the
 * KeyValueStore under the key "<user>/<device>/state".
 *
 * All methods are thread-safe; the conflict resolver updates the store
 * from several worker threads at once. Signals are emitted after the
 * internal lock has been released.
 */
class SyncStateStore : public QObject
{
    Q_OBJECT

public:
    /**
     * @param userId Backend user id
     * @param deviceId Device identifier
     * @param store Durable storage (not owned, must outlive this object)
     * @param parent Parent QObject
     */
    explicit SyncStateStore(const QString &userId,
                            const QString &deviceId,
                            KeyValueStore *store,
                            QObject *parent = nullptr);
    ~SyncStateStore() override;

    QString userId() const { return m_userId; }
    QString deviceId() const { return m_deviceId; }
    QString storageKey() const;

    // ========== Cursor ==========

    /**
     * @brief Current cursor (pendingChanges reflects the outbox size)
     */
    SyncCursor cursor() const;

    /**
     * @brief Move the event cursor forward
     * @return true if the cursor moved; ids at or below the current one are
     *         ignored. A move that cannot be persisted is undone and
     *         reported through @p error.
     */
    bool advanceEventCursor(qint64 eventId, QString *error = nullptr);

    /**
     * @brief Forget the event cursor (the server restarted its event log)
     */
    bool resetEventCursor(QString *error = nullptr);

    /**
     * @brief Record the time of the last successful exchange with the server
     *
     * Does not end the first sync; only an acknowledged initial pull does.
     */
    bool markSynced(const QDateTime &time, QString *error = nullptr);

    /**
     * @brief Record that the initial batch pull was applied
     * @param syncedAt Server time of the batch, becomes last_sync_at
     */
    bool markInitialPullDone(const QDateTime &syncedAt, QString *error = nullptr);

    /**
     * @brief True until an initial pull was acknowledged or an event cursor exists
     */
    bool isFirstSync() const;

    // ========== Outbox ==========

    /**
     * @brief Append a change to the outbox
     * @return false if the change is invalid, its key is already staged,
     *         or it could not be persisted
     */
    bool stageChange(const PendingChange &change, QString *error = nullptr);

    /**
     * @brief All staged changes in staging order
     */
    QList<PendingChange> pendingChanges() const;

    /**
     * @brief Staged changes that are not waiting on a conflict, grouped by entity type
     */
    QMap<QString, QList<PendingChange>> pushableChanges() const;

    bool hasPendingChange(const QString &idempotencyKey) const;
    bool pendingChange(const QString &idempotencyKey, PendingChange *change) const;

    /**
     * @brief Remove changes with a terminal outcome
     * @return Number of changes removed, or -1 if the removal could not be
     *         persisted (the outbox is then left as it was)
     */
    int removePendingChanges(const QStringList &idempotencyKeys, QString *error = nullptr);

    int outboxSize() const;

    // ========== Conflicts ==========

    /**
     * @brief Record a conflict reported by the server
     *
     * The conflicting change must still be in the outbox. A conflict
     * for a key that already has one replaces it.
     */
    bool recordConflict(const Conflict &conflict, QString *error = nullptr);

    QList<Conflict> conflicts() const;
    bool conflict(const QString &conflictId, Conflict *conflict) const;
    bool hasConflict(const QString &conflictId) const;
    int conflictCount() const;

    /**
     * @brief Drop a resolved conflict together with its pending change
     */
    bool removeConflict(const QString &conflictId, QString *error = nullptr);

    // ========== Persistence ==========

    /**
     * @brief Load state from the store
     * @return true if loaded successfully (or if no previous state exists)
     */
    bool load();

    /**
     * @brief Save state to the store
     */
    bool save();

    /**
     * @brief Zero the cursor and discard conflicts; the outbox is kept
     */
    bool reset(QString *error = nullptr);

signals:
    void stateChanged();
    void errorOccurred(const QString &error);

private:
    bool saveLocked(QString *error);
    QJsonObject toJson() const;
    void fromJson(const QJsonObject &root);
    int indexOfChange(const QString &idempotencyKey) const;
    QString conflictIdForKey(const QString &idempotencyKey) const;

    QString m_userId;
    QString m_deviceId;
    KeyValueStore *m_store;

    mutable QMutex m_mutex;

    qint64 m_lastEventId = -1;
    QDateTime m_lastSyncAt;
    bool m_initialPullDone = false;
    QList<PendingChange> m_outbox;              // staging order
    QMap<QString, Conflict> m_conflicts;        // conflict id -> conflict
};

} // namespace BridgeSync

#endif // SYNCSTATESTORE_H
