#ifndef HTTPTRANSPORT_H
#define HTTPTRANSPORT_H

#include "synctransport.h"

#include <QUrl>
#include <QMutex>
#include <QNetworkReply>
#include <functional>

class QNetworkRequest;

namespace BridgeSync {

/**
 * @brief SyncTransport over HTTP using Qt Network
 *
 * Every call creates its QNetworkAccessManager on the calling thread and
 * waits for the reply in a local event loop, so the transport can be used
 * from worker threads. A reply counts as observed only after its body was
 * read completely and parsed; timeouts abort the reply and report a
 * Transient error without a body.
 *
 * Status mapping:
 *   401/403 -> Authorization, 404 -> NotFound, 400/422 -> Validation,
 *   409 -> Conflict, 503/504 -> Transient, other 5xx -> Server
 */
class HttpTransport : public SyncTransport
{
    Q_OBJECT

public:
    using TokenProvider = std::function<QString()>;

    static const int DEFAULT_TIMEOUT_MS = 30000;

    explicit HttpTransport(const QUrl &baseUrl, QObject *parent = nullptr);
    ~HttpTransport() override = default;

    QUrl baseUrl() const { return m_baseUrl; }

    /**
     * @brief Set a fixed bearer token
     */
    void setBearerToken(const QString &token);

    /**
     * @brief Set a provider queried before every request
     *
     * Takes precedence over a fixed token. Token refresh lives in the
     * provider, not in the transport.
     */
    void setTokenProvider(TokenProvider provider);

    void setTimeout(int timeoutMs);
    int timeout() const;

    TransportReply get(const QString &path,
                       const QMap<QString, QString> &query = QMap<QString, QString>()) override;
    TransportReply post(const QString &path, const QJsonObject &body) override;

    /**
     * @brief Map an HTTP status to an error kind (None for 2xx)
     */
    static ErrorKind classifyStatus(int httpStatus);

    /**
     * @brief Map a network-level failure (no HTTP status) to an error kind
     */
    static ErrorKind classifyNetworkError(QNetworkReply::NetworkError error);

    /**
     * @brief Pull a human-readable message out of an error body
     *
     * Looks at "message", "detail" and "error" (string or object).
     */
    static QString messageFromBody(const QJsonObject &body);

private:
    TransportReply execute(const QByteArray &verb, const QNetworkRequest &request,
                           const QByteArray &payload, const QString &endpoint);
    QNetworkRequest buildRequest(const QUrl &url) const;
    QUrl resolve(const QString &path) const;

    QUrl m_baseUrl;
    mutable QMutex m_mutex;     // protects token, provider and timeout
    QString m_token;
    TokenProvider m_tokenProvider;
    int m_timeoutMs = DEFAULT_TIMEOUT_MS;
};

} // namespace BridgeSync

#endif // HTTPTRANSPORT_H
