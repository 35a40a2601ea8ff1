#include "fieldfallbackstrategy.h"
#include "invalidfieldcache.h"
#include "invalidfieldmatcher.h"

#include <QDebug>

namespace BridgeSync {

FieldFallbackStrategy::FieldFallbackStrategy(const QString &entityType,
                                             InvalidFieldCache *cache,
                                             const InvalidFieldMatcher *matcher)
    : m_entityType(entityType)
    , m_cache(cache)
    , m_matcher(matcher)
{
}

void FieldFallbackStrategy::setSchemaFetcher(SchemaFetcher fetcher)
{
    m_schemaFetcher = std::move(fetcher);
}

QStringList FieldFallbackStrategy::basicFields()
{
    return {"id", "name", "display_name", "create_date", "write_date"};
}

QStringList FieldFallbackStrategy::minimalFields()
{
    return {"id", "name", "display_name"};
}

void FieldFallbackStrategy::initialize(const QStringList &fields)
{
    m_originalFields = fields;
    m_level = FIRST_LEVEL;
    m_retryCount = 0;
    m_invalidFields.clear();

    if (m_cache) {
        m_invalidFields = m_cache->invalidFields(m_entityType);
    }
    m_currentFields = usable(fields);

    if (!m_invalidFields.isEmpty()) {
        qDebug() << "[FieldFallback]" << m_entityType << "skipping cached invalid fields"
                 << m_invalidFields;
    }
}

QStringList FieldFallbackStrategy::usable(const QStringList &fields) const
{
    QStringList result;
    for (const QString &field : fields) {
        if (!m_invalidFields.contains(field) && !result.contains(field)) {
            result << field;
        }
    }
    return result;
}

bool FieldFallbackStrategy::isInvalidFieldError(const SyncError &error) const
{
    if (error.kind == ErrorKind::SchemaMismatch) {
        return true;
    }
    return m_matcher && m_matcher->isInvalidFieldError(error.message);
}

// ========== Error handling ==========

bool FieldFallbackStrategy::handleError(const SyncError &error, SyncError *terminal)
{
    if (!isInvalidFieldError(error)) {
        *terminal = error;
        return false;
    }

    ++m_retryCount;

    const QString field = m_matcher ? m_matcher->extractFieldName(error.message) : QString();
    if (!field.isEmpty()) {
        qDebug() << "[FieldFallback] Invalid field detected:" << m_entityType << field;
        if (!m_invalidFields.contains(field)) {
            m_invalidFields << field;
        }
        if (m_cache) {
            m_cache->addInvalidField(m_entityType, field);
        }

        if (m_currentFields.removeAll(field) > 0 && !m_currentFields.isEmpty()) {
            qDebug() << "[FieldFallback] Retry with" << m_currentFields.size() << "fields";
            return true;
        }
    } else {
        qWarning() << "[FieldFallback] Could not parse field name from:" << error.message;
    }

    return advanceLevel(error, terminal);
}

bool FieldFallbackStrategy::advanceLevel(const SyncError &cause, SyncError *terminal)
{
    while (m_level < LAST_LEVEL) {
        ++m_level;

        switch (m_level) {
        case 2:
            m_currentFields = usable(basicFields());
            break;
        case 3:
            m_currentFields = usable(minimalFields());
            break;
        case 4: {
            if (!m_schemaFetcher) {
                m_currentFields.clear();
                break;
            }
            QStringList schemaFields;
            SyncError fetchError;
            if (!m_schemaFetcher(m_entityType, &schemaFields, &fetchError)) {
                qWarning() << "[FieldFallback] Schema introspection failed for" << m_entityType
                           << fetchError.toString();
                *terminal = exhausted(cause, "schema introspection failed: " + fetchError.toString());
                return false;
            }
            m_currentFields = usable(schemaFields);
            break;
        }
        default:
            break;
        }

        if (!m_currentFields.isEmpty()) {
            qDebug() << "[FieldFallback]" << m_entityType << "level" << m_level
                     << "with" << m_currentFields.size() << "fields";
            return true;
        }
    }

    *terminal = exhausted(cause, QString());
    return false;
}

SyncError FieldFallbackStrategy::exhausted(const SyncError &cause, const QString &reason) const
{
    QString message = QString("Field fallback strategy exhausted for %1. Invalid fields: %2")
        .arg(m_entityType, m_invalidFields.join(", "));
    if (!reason.isEmpty()) {
        message += " (" + reason + ")";
    }

    SyncError error = SyncError::make(ErrorKind::StrategyExhausted, message,
                                      cause.endpoint, cause.statusCode);
    error.details["entity_type"] = m_entityType;
    error.details["invalid_fields"] = m_invalidFields;
    error.details["original_error"] = cause.message;
    error.details["original_kind"] = errorKindToString(cause.kind);
    return error;
}

// ========== Execution ==========

QueryResult FieldFallbackStrategy::execute(const QStringList &fields, const QueryFunction &query)
{
    initialize(fields);

    QueryResult result;
    SyncError terminal;

    if (m_currentFields.isEmpty()) {
        const SyncError cause = SyncError::make(ErrorKind::SchemaMismatch,
            "No usable fields requested for " + m_entityType);
        if (!advanceLevel(cause, &terminal)) {
            result.error = terminal;
            result.fallbackLevel = m_level;
            result.invalidFields = m_invalidFields;
            qWarning() << "[FieldFallback]" << terminal.toString();
            return result;
        }
    }

    for (;;) {
        QueryResult attempt = query(m_currentFields);
        if (attempt.success) {
            attempt.fieldsUsed = m_currentFields;
            attempt.fallbackLevel = m_level;
            attempt.invalidFields = m_invalidFields;
            if (m_level > FIRST_LEVEL || m_retryCount > 0) {
                qInfo() << "[FieldFallback]" << m_entityType << "succeeded at level" << m_level
                        << "after" << m_retryCount << "retries";
            }
            return attempt;
        }

        if (!handleError(attempt.error, &terminal)) {
            result.error = terminal;
            result.fieldsUsed = m_currentFields;
            result.fallbackLevel = m_level;
            result.invalidFields = m_invalidFields;
            if (terminal.kind == ErrorKind::StrategyExhausted) {
                qWarning() << "[FieldFallback]" << terminal.toString();
            }
            return result;
        }
    }
}

QVariantMap FieldFallbackStrategy::status() const
{
    QVariantMap map;
    map["entity_type"] = m_entityType;
    map["current_level"] = m_level;
    map["retry_count"] = m_retryCount;
    map["original_fields_count"] = m_originalFields.size();
    map["current_fields_count"] = m_currentFields.size();
    map["invalid_fields"] = m_invalidFields;
    map["cached_invalid_fields"] = m_cache ? m_cache->invalidFields(m_entityType) : QStringList();
    return map;
}

} // namespace BridgeSync
