#ifndef PULLENGINE_H
#define PULLENGINE_H

#include <QObject>
#include <QString>
#include <QStringList>
#include <QList>
#include <QDateTime>
#include <QJsonObject>
#include "synctypes.h"

namespace BridgeSync {

class SyncTransport;
class SyncStateStore;

/**
 * @brief Fetches remote changes and moves the cursor on acknowledgement
 *
 * Two pull modes:
 *   - batchPull(): full payloads per entity type, for first syncs
 *   - smartPull(): change events after the cursor's last_event_id
 *
 * Pulling never moves the cursor by itself. The caller applies the
 * data locally and then calls acknowledgeBatch() or acknowledgeEvents().
 */
class PullEngine : public QObject
{
    Q_OBJECT

public:
    PullEngine(SyncTransport *transport, SyncStateStore *state, QObject *parent = nullptr);

    // ========== Configuration ==========

    void setAppType(const QString &appType) { m_appType = appType; }
    QString appType() const { return m_appType; }

    /**
     * @brief Restrict pulls to these entity types (empty = all)
     */
    void setModels(const QStringList &models) { m_models = models; }
    QStringList models() const { return m_models; }

    void setBatchSize(int batchSize) { m_batchSize = batchSize; }
    void setSmartPullLimit(int limit) { m_smartPullLimit = limit; }

    // ========== Batch pull ==========

    /**
     * @brief Pull full payloads
     * @param since Only records changed after this time (invalid = everything)
     */
    PullResult batchPull(const QDateTime &since = QDateTime());

    /**
     * @brief Record a batch as applied (synced_at becomes last_sync_at)
     *
     * Ends the first sync. Fails for an unsuccessful pull or when the
     * state cannot be persisted.
     */
    bool acknowledgeBatch(const PullResult &result, SyncError *error = nullptr);

    // ========== Smart pull ==========

    /**
     * @brief Pull change events after the current cursor
     *
     * When the server reports no updates, only last_sync_at advances.
     */
    SmartPullResult smartPull();

    /**
     * @brief Acknowledge applied events and advance the cursor
     *
     * The cursor moves to the highest acknowledged id, never backwards.
     * Nothing is sent for an empty list.
     */
    bool acknowledgeEvents(const QList<ChangeEvent> &events, SyncError *error = nullptr);

    // ========== State & health ==========

    /**
     * @brief Cheap check whether the server has unseen events
     */
    UpdatesInfo checkUpdates();

    RemoteSyncState fetchRemoteState();

    /**
     * @brief Reset the server-side state for this device, then the local one
     */
    bool resetRemoteState(SyncError *error = nullptr);

    HealthStatus checkHealth();

    // ========== Smart sync state ==========

    /**
     * @brief Server-side cursor of the event log for this device
     */
    SmartSyncState fetchSmartSyncState();

    /**
     * @brief Restart the event log for this device, then the local event cursor
     */
    bool resetSmartSyncState(SyncError *error = nullptr);

    /**
     * @brief Sync activity of this user across devices
     */
    SyncStatistics fetchStatistics();

signals:
    void lifecycleEvent(const QString &type, const QVariantMap &data);

private:
    QJsonValue userIdValue() const;
    static QDateTime parseTime(const QVariant &value);

    SyncTransport *m_transport;
    SyncStateStore *m_state;

    QString m_appType;
    QStringList m_models;
    int m_batchSize = 0;
    int m_smartPullLimit = 0;
};

} // namespace BridgeSync

#endif // PULLENGINE_H
