#ifndef RECORDQUERYSERVICE_H
#define RECORDQUERYSERVICE_H

#include <QString>
#include <QStringList>
#include <QVariantList>
#include <QVariantMap>
#include <QJsonObject>
#include <memory>

#include "../sync/synctypes.h"

namespace BridgeSync {

class SyncTransport;
class InvalidFieldCache;
class InvalidFieldMatcher;

/**
 * @brief Generic record queries and schema introspection
 *
 * Both go through the backend's call_kw endpoint. searchRead() with an
 * explicit field list runs inside a FieldFallbackStrategy so schema
 * mismatches are absorbed instead of surfaced.
 */
class RecordQueryService
{
public:
    struct SearchOptions {
        QVariantList domain;
        int limit = 80;
        int offset = 0;
        QString order;
        bool useFallback = true;
    };

    /**
     * @param transport Backend transport (not owned)
     * @param cache Shared invalid-field cache (not owned)
     */
    RecordQueryService(SyncTransport *transport, InvalidFieldCache *cache);
    ~RecordQueryService();

    /**
     * @brief Replace the invalid-field message parser (takes ownership)
     */
    void setMatcher(InvalidFieldMatcher *matcher);
    const InvalidFieldMatcher *matcher() const { return m_matcher.get(); }

    /**
     * @brief search_read with field fallback
     * @param fields Requested fields; empty means all fields, without fallback
     */
    QueryResult searchRead(const QString &entityType,
                           const QStringList &fields,
                           const SearchOptions &options = SearchOptions());

    /**
     * @brief search_read exactly as requested
     */
    QueryResult directSearchRead(const QString &entityType,
                                 const QStringList &fields,
                                 const SearchOptions &options = SearchOptions());

    /**
     * @brief fields_get: field name -> attribute map
     */
    bool fieldsGet(const QString &entityType, QVariantMap *fields, SyncError *error);

    /**
     * @brief Field names known to the backend for an entity type
     */
    bool fieldNames(const QString &entityType, QStringList *names, SyncError *error);

private:
    bool callKw(const QString &entityType, const QString &method,
                const QJsonObject &kwargs, QJsonValue *result, SyncError *error);
    SyncError classify(const SyncError &error) const;

    SyncTransport *m_transport;
    InvalidFieldCache *m_cache;
    std::unique_ptr<InvalidFieldMatcher> m_matcher;
};

} // namespace BridgeSync

#endif // RECORDQUERYSERVICE_H
