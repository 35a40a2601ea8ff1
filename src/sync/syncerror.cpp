#include "syncerror.h"

namespace BridgeSync {

QString errorKindToString(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::None: return "none";
    case ErrorKind::Transient: return "transient";
    case ErrorKind::Authorization: return "authorization";
    case ErrorKind::NotFound: return "not_found";
    case ErrorKind::Validation: return "validation";
    case ErrorKind::Conflict: return "conflict";
    case ErrorKind::Server: return "server";
    case ErrorKind::SchemaMismatch: return "schema_mismatch";
    case ErrorKind::StrategyExhausted: return "strategy_exhausted";
    case ErrorKind::Protocol: return "protocol";
    case ErrorKind::Cancelled: return "cancelled";
    case ErrorKind::Local: return "local";
    }
    return "unknown";
}

QString SyncError::toString() const
{
    if (!isError()) {
        return QString();
    }

    QString text = QString("[%1] %2").arg(errorKindToString(kind), message);
    if (statusCode != 0) {
        text += QString(" (Status: %1)").arg(statusCode);
    }
    if (!endpoint.isEmpty()) {
        text += QString(" [Endpoint: %1]").arg(endpoint);
    }
    return text;
}

SyncError SyncError::make(ErrorKind kind, const QString &message,
                          const QString &endpoint, int statusCode)
{
    SyncError error;
    error.kind = kind;
    error.message = message;
    error.endpoint = endpoint;
    error.statusCode = statusCode;
    return error;
}

} // namespace BridgeSync
