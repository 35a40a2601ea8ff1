#include "httptransport.h"

#include <QNetworkAccessManager>
#include <QNetworkRequest>
#include <QEventLoop>
#include <QTimer>
#include <QUrlQuery>
#include <QJsonDocument>
#include <QJsonArray>
#include <QDebug>

namespace BridgeSync {

HttpTransport::HttpTransport(const QUrl &baseUrl, QObject *parent)
    : SyncTransport(parent)
    , m_baseUrl(baseUrl)
{
}

void HttpTransport::setBearerToken(const QString &token)
{
    QMutexLocker locker(&m_mutex);
    m_token = token;
}

void HttpTransport::setTokenProvider(TokenProvider provider)
{
    QMutexLocker locker(&m_mutex);
    m_tokenProvider = std::move(provider);
}

void HttpTransport::setTimeout(int timeoutMs)
{
    QMutexLocker locker(&m_mutex);
    m_timeoutMs = timeoutMs > 0 ? timeoutMs : DEFAULT_TIMEOUT_MS;
}

int HttpTransport::timeout() const
{
    QMutexLocker locker(&m_mutex);
    return m_timeoutMs;
}

// ========== Requests ==========

TransportReply HttpTransport::get(const QString &path, const QMap<QString, QString> &query)
{
    QUrl url = resolve(path);
    if (!query.isEmpty()) {
        QUrlQuery urlQuery;
        for (auto it = query.constBegin(); it != query.constEnd(); ++it) {
            urlQuery.addQueryItem(it.key(), it.value());
        }
        url.setQuery(urlQuery);
    }

    return execute("GET", buildRequest(url), QByteArray(), path);
}

TransportReply HttpTransport::post(const QString &path, const QJsonObject &body)
{
    QNetworkRequest request = buildRequest(resolve(path));
    request.setHeader(QNetworkRequest::ContentTypeHeader, "application/json");

    return execute("POST", request, QJsonDocument(body).toJson(QJsonDocument::Compact), path);
}

QUrl HttpTransport::resolve(const QString &path) const
{
    QUrl url = m_baseUrl;
    QString basePath = url.path();
    if (basePath.endsWith('/')) {
        basePath.chop(1);
    }

    // Paths may carry their own query string
    const int queryPos = path.indexOf('?');
    if (queryPos >= 0) {
        url.setPath(basePath + path.left(queryPos));
        url.setQuery(path.mid(queryPos + 1));
    } else {
        url.setPath(basePath + path);
    }
    return url;
}

QNetworkRequest HttpTransport::buildRequest(const QUrl &url) const
{
    QNetworkRequest request(url);
    request.setHeader(QNetworkRequest::UserAgentHeader, "BridgeSync/1.0");
    request.setRawHeader("Accept", "application/json");
    request.setAttribute(QNetworkRequest::RedirectPolicyAttribute,
                         QNetworkRequest::NoLessSafeRedirectPolicy);

    QString token;
    {
        QMutexLocker locker(&m_mutex);
        token = m_tokenProvider ? m_tokenProvider() : m_token;
    }
    if (!token.isEmpty()) {
        request.setRawHeader("Authorization", "Bearer " + token.toUtf8());
    }
    return request;
}

TransportReply HttpTransport::execute(const QByteArray &verb, const QNetworkRequest &request,
                                      const QByteArray &payload, const QString &endpoint)
{
    TransportReply result;
    const int timeoutMs = timeout();

    // Created per call on the current thread; a manager cannot be shared across threads
    QNetworkAccessManager manager;
    QNetworkReply *reply = manager.sendCustomRequest(request, verb, payload);

    QEventLoop loop;
    QTimer timer;
    timer.setSingleShot(true);

    connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
    connect(&timer, &QTimer::timeout, &loop, &QEventLoop::quit);

    qDebug() << "[HttpTransport]" << verb << request.url().toString();
    timer.start(timeoutMs);
    if (!reply->isFinished()) {
        loop.exec();
    }

    if (!reply->isFinished()) {
        // Timeout: nothing from this reply is observed
        reply->abort();
        reply->deleteLater();
        result.error = SyncError::make(ErrorKind::Transient,
            QString("Request timed out after %1 ms").arg(timeoutMs), endpoint);
        qWarning() << "[HttpTransport]" << result.error.toString();
        emit requestFailed(result.error);
        return result;
    }
    timer.stop();

    const QByteArray data = reply->readAll();
    const int status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    const QNetworkReply::NetworkError networkError = reply->error();
    const QString networkErrorString = reply->errorString();
    reply->deleteLater();

    result.httpStatus = status;

    QJsonObject body;
    bool bodyParsed = data.trimmed().isEmpty();
    if (!bodyParsed) {
        QJsonParseError parseError;
        const QJsonDocument doc = QJsonDocument::fromJson(data, &parseError);
        if (parseError.error == QJsonParseError::NoError) {
            bodyParsed = true;
            if (doc.isObject()) {
                body = doc.object();
            } else if (doc.isArray()) {
                body["result"] = doc.array();
            }
        }
    }

    if (status == 0) {
        // No HTTP response at all
        result.error = SyncError::make(classifyNetworkError(networkError),
                                       networkErrorString, endpoint);
        qWarning() << "[HttpTransport]" << result.error.toString();
        emit requestFailed(result.error);
        return result;
    }

    const ErrorKind kind = classifyStatus(status);
    if (kind != ErrorKind::None) {
        QString message = messageFromBody(body);
        if (message.isEmpty()) {
            message = bodyParsed ? networkErrorString : QString::fromUtf8(data.left(500));
        }
        result.error = SyncError::make(kind, message, endpoint, status);
        if (!body.isEmpty()) {
            result.error.details = body.toVariantMap();
        }
        result.body = body;
        qWarning() << "[HttpTransport]" << result.error.toString();
        emit requestFailed(result.error);
        return result;
    }

    if (!bodyParsed) {
        result.error = SyncError::make(ErrorKind::Protocol,
            QString("Response is not valid JSON (%1 bytes)").arg(data.size()), endpoint, status);
        qWarning() << "[HttpTransport]" << result.error.toString();
        emit requestFailed(result.error);
        return result;
    }

    result.ok = true;
    result.body = body;
    return result;
}

// ========== Error classification ==========

ErrorKind HttpTransport::classifyStatus(int httpStatus)
{
    if (httpStatus >= 200 && httpStatus < 300) {
        return ErrorKind::None;
    }

    switch (httpStatus) {
    case 401:
    case 403:
        return ErrorKind::Authorization;
    case 404:
        return ErrorKind::NotFound;
    case 400:
    case 422:
        return ErrorKind::Validation;
    case 409:
        return ErrorKind::Conflict;
    case 408:
    case 503:
    case 504:
        return ErrorKind::Transient;
    default:
        break;
    }

    if (httpStatus >= 500) {
        return ErrorKind::Server;
    }
    if (httpStatus == 429) {
        // Retrying a rate limit only makes it worse
        return ErrorKind::Server;
    }
    return ErrorKind::Validation;
}

ErrorKind HttpTransport::classifyNetworkError(QNetworkReply::NetworkError error)
{
    switch (error) {
    case QNetworkReply::NoError:
        return ErrorKind::Protocol;
    case QNetworkReply::AuthenticationRequiredError:
    case QNetworkReply::ProxyAuthenticationRequiredError:
        return ErrorKind::Authorization;
    case QNetworkReply::OperationCanceledError:
        return ErrorKind::Cancelled;
    case QNetworkReply::ProtocolUnknownError:
    case QNetworkReply::ProtocolInvalidOperationError:
        return ErrorKind::Protocol;
    default:
        // Connection refused, host not found, timeouts, TLS and proxy failures
        return ErrorKind::Transient;
    }
}

QString HttpTransport::messageFromBody(const QJsonObject &body)
{
    for (const char *key : {"message", "detail", "error"}) {
        const QJsonValue value = body.value(key);
        if (value.isString()) {
            return value.toString();
        }
        if (value.isObject()) {
            const QJsonObject inner = value.toObject();
            // JSON-RPC style: {"error": {"message": ..., "data": {"message": ...}}}
            const QString dataMessage = inner.value("data").toObject().value("message").toString();
            if (!dataMessage.isEmpty()) {
                return dataMessage;
            }
            const QString innerMessage = messageFromBody(inner);
            if (!innerMessage.isEmpty()) {
                return innerMessage;
            }
        }
        if (value.isArray()) {
            // FastAPI validation errors: [{"msg": ...}, ...]
            QStringList parts;
            for (const QJsonValue &item : value.toArray()) {
                const QString msg = item.toObject().value("msg").toString();
                if (!msg.isEmpty()) {
                    parts << msg;
                }
            }
            if (!parts.isEmpty()) {
                return parts.join("; ");
            }
        }
    }
    return QString();
}

} // namespace BridgeSync
