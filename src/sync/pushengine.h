#ifndef PUSHENGINE_H
#define PUSHENGINE_H

#include <QObject>
#include <QString>
#include <QMap>
#include <QList>
#include <QDateTime>
#include <QJsonObject>
#include "synctypes.h"

namespace BridgeSync {

class SyncTransport;
class SyncStateStore;

/**
 * @brief Delivers the outbox to the backend in one batch
 *
 * The response is partitioned by idempotency key:
 *   - successful: removed from the outbox
 *   - failed: removed from the outbox and reported, never retried
 *   - conflicts: kept in the outbox and recorded as Conflicts
 *
 * A transport error leaves the outbox untouched. Changes waiting on a
 * conflict are not resubmitted.
 */
class PushEngine : public QObject
{
    Q_OBJECT

public:
    PushEngine(SyncTransport *transport, SyncStateStore *state, QObject *parent = nullptr);

    /**
     * @brief Submit every pushable change in the outbox
     *
     * With nothing to push no request is made and an empty successful
     * result is returned.
     */
    PushResult push();

    /**
     * @brief Request body for a batch
     */
    static QJsonObject buildRequest(const QString &deviceId,
                                    const QMap<QString, QList<PendingChange>> &changes,
                                    const QDateTime &timestamp);

signals:
    void lifecycleEvent(const QString &type, const QVariantMap &data);

private:
    void parseResponse(const QJsonObject &body,
                       const QMap<QString, PendingChange> &batch,
                       PushResult *result) const;

    SyncTransport *m_transport;
    SyncStateStore *m_state;
};

} // namespace BridgeSync

#endif // PUSHENGINE_H
