#ifndef SYNCTRANSPORT_H
#define SYNCTRANSPORT_H

#include <QObject>
#include <QString>
#include <QMap>
#include <QJsonObject>

#include "../sync/syncerror.h"

namespace BridgeSync {

/**
 * @brief Complete response of one backend call
 *
 * A reply is either fully observed (ok, status and parsed body) or not
 * observed at all (error set, body empty). Implementations must never
 * hand out a partially read body: a call that is aborted or times out
 * after the request was sent is reported as a Transient error.
 */
struct TransportReply {
    bool ok = false;
    int httpStatus = 0;
    QJsonObject body;
    SyncError error;
};

/**
 * @brief Abstract interface for the authenticated backend transport
 *
 * The sync components only talk to the backend through this interface.
 * Implementations:
 *   - HttpTransport: Qt Network, bearer credentials, typed errors
 *   - test fakes that script replies per path
 *
 * get() and post() block the calling thread until the reply is complete
 * and must be safe to call from several threads at once.
 */
class SyncTransport : public QObject
{
    Q_OBJECT

public:
    explicit SyncTransport(QObject *parent = nullptr) : QObject(parent) {}
    virtual ~SyncTransport() = default;

    /**
     * @brief Issue a GET request
     * @param path Endpoint path relative to the base URL
     * @param query Query parameters
     */
    virtual TransportReply get(const QString &path,
                               const QMap<QString, QString> &query = QMap<QString, QString>()) = 0;

    /**
     * @brief Issue a POST request with a JSON body
     */
    virtual TransportReply post(const QString &path, const QJsonObject &body) = 0;

signals:
    void requestFailed(const BridgeSync::SyncError &error);
};

} // namespace BridgeSync

#endif // SYNCTRANSPORT_H
