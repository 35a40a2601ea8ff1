#include "recordqueryservice.h"
#include "fieldfallbackstrategy.h"
#include "invalidfieldcache.h"
#include "invalidfieldmatcher.h"
#include "../net/synctransport.h"
#include "../net/endpoints.h"

#include <QJsonArray>
#include <QDebug>

namespace BridgeSync {

RecordQueryService::RecordQueryService(SyncTransport *transport, InvalidFieldCache *cache)
    : m_transport(transport)
    , m_cache(cache)
    , m_matcher(new RegexInvalidFieldMatcher())
{
}

RecordQueryService::~RecordQueryService() = default;

void RecordQueryService::setMatcher(InvalidFieldMatcher *matcher)
{
    if (matcher) {
        m_matcher.reset(matcher);
    }
}

// ========== Queries ==========

QueryResult RecordQueryService::searchRead(const QString &entityType,
                                           const QStringList &fields,
                                           const SearchOptions &options)
{
    if (!options.useFallback || fields.isEmpty()) {
        return directSearchRead(entityType, fields, options);
    }

    FieldFallbackStrategy strategy(entityType, m_cache, m_matcher.get());
    strategy.setSchemaFetcher([this](const QString &entity, QStringList *names, SyncError *error) {
        return fieldNames(entity, names, error);
    });

    return strategy.execute(fields, [&](const QStringList &current) {
        return directSearchRead(entityType, current, options);
    });
}

QueryResult RecordQueryService::directSearchRead(const QString &entityType,
                                                 const QStringList &fields,
                                                 const SearchOptions &options)
{
    QueryResult result;
    result.fieldsUsed = fields;

    QJsonObject kwargs;
    kwargs["domain"] = QJsonArray::fromVariantList(options.domain);
    if (!fields.isEmpty()) {
        kwargs["fields"] = QJsonArray::fromStringList(fields);
    }
    kwargs["limit"] = options.limit;
    kwargs["offset"] = options.offset;
    if (!options.order.isEmpty()) {
        kwargs["order"] = options.order;
    }

    QJsonValue value;
    if (!callKw(entityType, "search_read", kwargs, &value, &result.error)) {
        return result;
    }

    if (!value.isArray()) {
        result.error = SyncError::make(ErrorKind::Protocol,
            "search_read did not return a list", Endpoints::CallKw);
        return result;
    }

    for (const QJsonValue &record : value.toArray()) {
        result.records.append(record.toObject().toVariantMap());
    }
    result.success = true;
    return result;
}

bool RecordQueryService::fieldsGet(const QString &entityType, QVariantMap *fields, SyncError *error)
{
    QJsonValue value;
    if (!callKw(entityType, "fields_get", QJsonObject(), &value, error)) {
        return false;
    }
    if (!value.isObject()) {
        *error = SyncError::make(ErrorKind::Protocol,
            "fields_get did not return an object", Endpoints::CallKw);
        return false;
    }
    *fields = value.toObject().toVariantMap();
    return true;
}

bool RecordQueryService::fieldNames(const QString &entityType, QStringList *names, SyncError *error)
{
    QVariantMap fields;
    if (!fieldsGet(entityType, &fields, error)) {
        return false;
    }
    *names = fields.keys();
    return true;
}

// ========== call_kw ==========

bool RecordQueryService::callKw(const QString &entityType, const QString &method,
                                const QJsonObject &kwargs, QJsonValue *result, SyncError *error)
{
    QJsonObject body;
    body["model"] = entityType;
    body["method"] = method;
    body["args"] = QJsonArray();
    body["kwargs"] = kwargs;

    const TransportReply reply = m_transport->post(Endpoints::CallKw, body);
    if (!reply.ok) {
        *error = classify(reply.error);
        qWarning() << "[RecordQueryService]" << method << "failed for" << entityType
                   << error->toString();
        return false;
    }

    // JSON-RPC style errors arrive with a 2xx status
    if (reply.body.contains("error") && !reply.body.value("error").isNull()) {
        const QJsonValue rpcError = reply.body.value("error");
        QString message;
        if (rpcError.isObject()) {
            const QJsonObject obj = rpcError.toObject();
            message = obj.value("data").toObject().value("message").toString();
            if (message.isEmpty()) {
                message = obj.value("message").toString();
            }
        } else {
            message = rpcError.toString();
        }
        *error = classify(SyncError::make(ErrorKind::Server, message,
                                          Endpoints::CallKw, reply.httpStatus));
        qWarning() << "[RecordQueryService]" << method << "failed for" << entityType
                   << error->toString();
        return false;
    }

    if (reply.body.contains("result")) {
        *result = reply.body.value("result");
    } else {
        *result = reply.body.value("records");
    }
    return true;
}

SyncError RecordQueryService::classify(const SyncError &error) const
{
    if (m_matcher && m_matcher->isInvalidFieldError(error.message)) {
        SyncError mismatch = error;
        mismatch.kind = ErrorKind::SchemaMismatch;
        return mismatch;
    }
    return error;
}

} // namespace BridgeSync
