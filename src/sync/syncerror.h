#ifndef SYNCERROR_H
#define SYNCERROR_H

#include <QString>
#include <QVariantMap>
#include <QMetaType>

namespace BridgeSync {

/**
 * @brief Error categories reported by the sync layer
 *
 * Every failing operation carries exactly one kind. The kind decides
 * how the failure propagates: transient errors are retried through the
 * BackoffPolicy, schema mismatches are absorbed by the field fallback,
 * everything else is surfaced to the caller.
 */
enum class ErrorKind {
    None,               ///< No error
    Transient,          ///< Timeout, connection failure, 503/504
    Authorization,      ///< 401/403 - caller must re-authenticate
    NotFound,           ///< 404
    Validation,         ///< 400/422 - permanent rejection
    Conflict,           ///< 409 - version mismatch
    Server,             ///< Other 5xx
    SchemaMismatch,     ///< "Invalid field" reported by the backend
    StrategyExhausted,  ///< Every field fallback level failed
    Protocol,           ///< Response body could not be understood
    Cancelled,          ///< Operation cancelled by the caller
    Local               ///< Local persistence or invalid input
};

QString errorKindToString(ErrorKind kind);

/**
 * @brief Structured error with enough context for the caller to act
 */
struct SyncError {
    ErrorKind kind = ErrorKind::None;
    QString message;
    int statusCode = 0;         ///< HTTP status, 0 when no response was observed
    QString endpoint;           ///< Backend path involved, if any
    QVariantMap details;        ///< Entity type, offending fields, keys, ...

    bool isError() const { return kind != ErrorKind::None; }

    /**
     * @brief Whether retrying the same request later can succeed
     *
     * Only transport-level failures qualify. 500/502 are treated as
     * server faults and are not retried.
     */
    bool isRetryable() const { return kind == ErrorKind::Transient; }

    QString toString() const;

    static SyncError make(ErrorKind kind, const QString &message,
                          const QString &endpoint = QString(),
                          int statusCode = 0);
};

} // namespace BridgeSync

Q_DECLARE_METATYPE(BridgeSync::SyncError)

#endif // SYNCERROR_H
