#ifndef CONFLICTRESOLVER_H
#define CONFLICTRESOLVER_H

#include <QObject>
#include <QList>
#include <QThreadPool>
#include <QJsonObject>
#include "synctypes.h"

namespace BridgeSync {

class SyncTransport;
class SyncStateStore;

/**
 * @brief Applies caller decisions to open conflicts
 *
 * Every resolution is validated locally and then submitted as its own
 * request, so a failure for one conflict never blocks another. Requests
 * run in parallel on a bounded thread pool. A conflict is removed from
 * the store (together with its pending change) only after the server
 * confirmed it.
 */
class ConflictResolver : public QObject
{
    Q_OBJECT

public:
    static const int DEFAULT_MAX_PARALLEL = 4;

    ConflictResolver(SyncTransport *transport, SyncStateStore *state, QObject *parent = nullptr);
    ~ConflictResolver() override;

    void setMaxParallel(int count);
    int maxParallel() const;

    /**
     * @brief Submit resolutions and wait for all of them
     */
    ResolutionResult resolve(const QList<ResolutionRequest> &requests);

    /**
     * @brief Request body for a single resolution
     */
    static QJsonObject buildRequest(const QString &deviceId,
                                    const ResolutionRequest &request,
                                    const Conflict &conflict);

signals:
    void lifecycleEvent(const QString &type, const QVariantMap &data);

private:
    struct Outcome {
        QString conflictId;
        bool resolved = false;
        SyncError error;
    };

    Outcome resolveOne(const ResolutionRequest &request);

    SyncTransport *m_transport;
    SyncStateStore *m_state;
    QThreadPool m_pool;
};

} // namespace BridgeSync

#endif // CONFLICTRESOLVER_H
