#ifndef SYNCCLIENT_H
#define SYNCCLIENT_H

#include <QObject>
#include <QString>
#include <memory>

#include "syncsettings.h"
#include "sync/synctypes.h"

namespace BridgeSync {

class HttpTransport;
class JsonFileStore;
class SyncStateStore;
class SyncOrchestrator;
class SharedInvalidFieldCache;
class RecordQueryService;
class ReconnectScheduler;

/**
 * @brief Wires the sync components for one configured (user, device)
 *
 * Owns the transport, the persistent state, the orchestrator and the
 * record query service built from a SyncSettings instance.
 */
class SyncClient : public QObject
{
    Q_OBJECT

public:
    explicit SyncClient(const SyncSettings &settings, QObject *parent = nullptr);
    ~SyncClient() override;

    /**
     * @brief Load persisted state
     * @return false if the settings are invalid or the state cannot be read
     */
    bool initialize(QString *error = nullptr);

    const SyncSettings &settings() const { return m_settings; }

    HttpTransport *transport() const { return m_transport; }
    SyncStateStore *state() const { return m_state; }
    SyncOrchestrator *orchestrator() const { return m_orchestrator; }
    RecordQueryService *records() const { return m_records.get(); }
    SharedInvalidFieldCache *invalidFieldCache() const { return m_fieldCache.get(); }
    ReconnectScheduler *reconnectScheduler() const { return m_reconnect; }

    /**
     * @brief Stage a local edit in the outbox
     * @param idempotencyKey Receives the generated key
     */
    bool stageChange(const QString &entityType, ChangeOperation operation, qint64 targetId,
                     const Payload &values, QString *error = nullptr,
                     QString *idempotencyKey = nullptr);

    // ========== Watching ==========

    /**
     * @brief Start periodic update checks once the backend is reachable
     *
     * While the backend is unreachable, reconnect attempts follow the
     * backoff policy.
     */
    void startWatching();
    void stopWatching();

signals:
    void lifecycleEvent(const QString &type, const QVariantMap &data);

    /**
     * @brief Reconnecting to the backend was given up
     */
    void backendUnreachable();

private:
    void applyConflictPolicy();
    bool backendReachable();

    SyncSettings m_settings;

    HttpTransport *m_transport;
    std::unique_ptr<JsonFileStore> m_store;
    SyncStateStore *m_state;
    std::unique_ptr<SharedInvalidFieldCache> m_fieldCache;
    std::unique_ptr<RecordQueryService> m_records;
    SyncOrchestrator *m_orchestrator;
    ReconnectScheduler *m_reconnect;
};

} // namespace BridgeSync

#endif // SYNCCLIENT_H
