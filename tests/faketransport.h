#ifndef FAKETRANSPORT_H
#define FAKETRANSPORT_H

#include <QMutex>
#include <QMap>
#include <QList>
#include <QQueue>
#include <functional>

#include "net/synctransport.h"

/**
 * @brief In-process SyncTransport with scripted replies per path
 *
 * A path answers from its handler if one is set, otherwise from its
 * queue of replies. Unscripted paths fail with NotFound. Every request
 * is recorded. Safe to call from several threads.
 */
class FakeTransport : public BridgeSync::SyncTransport
{
public:
    struct Request {
        QString method;
        QString path;
        QJsonObject body;
        QMap<QString, QString> query;
    };

    using Handler = std::function<BridgeSync::TransportReply(const Request &)>;

    static BridgeSync::TransportReply ok(const QJsonObject &body = QJsonObject())
    {
        BridgeSync::TransportReply reply;
        reply.ok = true;
        reply.httpStatus = 200;
        reply.body = body;
        return reply;
    }

    static BridgeSync::TransportReply failure(BridgeSync::ErrorKind kind, const QString &message,
                                              int status = 0)
    {
        BridgeSync::TransportReply reply;
        reply.httpStatus = status;
        reply.error = BridgeSync::SyncError::make(kind, message, QString(), status);
        return reply;
    }

    void enqueue(const QString &path, const BridgeSync::TransportReply &reply)
    {
        QMutexLocker locker(&m_mutex);
        m_queues[path].enqueue(reply);
    }

    void setHandler(const QString &path, Handler handler)
    {
        QMutexLocker locker(&m_mutex);
        m_handlers[path] = std::move(handler);
    }

    QList<Request> requests() const
    {
        QMutexLocker locker(&m_mutex);
        return m_requests;
    }

    QList<Request> requests(const QString &path) const
    {
        QMutexLocker locker(&m_mutex);
        QList<Request> matching;
        for (const Request &request : m_requests) {
            if (request.path == path) {
                matching << request;
            }
        }
        return matching;
    }

    int count(const QString &path) const { return requests(path).size(); }

    BridgeSync::TransportReply get(const QString &path,
                                   const QMap<QString, QString> &query = QMap<QString, QString>()) override
    {
        Request request;
        request.method = "GET";
        request.path = path;
        request.query = query;
        return respond(request);
    }

    BridgeSync::TransportReply post(const QString &path, const QJsonObject &body) override
    {
        Request request;
        request.method = "POST";
        request.path = path;
        request.body = body;
        return respond(request);
    }

private:
    BridgeSync::TransportReply respond(const Request &request)
    {
        Handler handler;
        BridgeSync::TransportReply reply;
        bool scripted = false;
        {
            QMutexLocker locker(&m_mutex);
            m_requests << request;
            if (m_handlers.contains(request.path)) {
                handler = m_handlers.value(request.path);
            } else if (!m_queues.value(request.path).isEmpty()) {
                reply = m_queues[request.path].dequeue();
                scripted = true;
            }
        }

        // Handlers may block, so they run outside the lock
        if (handler) {
            reply = handler(request);
        } else if (!scripted) {
            reply = failure(BridgeSync::ErrorKind::NotFound, "No scripted reply for " + request.path, 404);
        }

        if (!reply.ok) {
            reply.error.endpoint = request.path;
        }
        return reply;
    }

    mutable QMutex m_mutex;
    QMap<QString, QQueue<BridgeSync::TransportReply>> m_queues;
    QMap<QString, Handler> m_handlers;
    QList<Request> m_requests;
};

#endif // FAKETRANSPORT_H
