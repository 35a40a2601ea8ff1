#ifndef FIELDFALLBACKSTRATEGY_H
#define FIELDFALLBACKSTRATEGY_H

#include <QString>
#include <QStringList>
#include <QVariantMap>
#include <functional>

#include "../sync/synctypes.h"

namespace BridgeSync {

class InvalidFieldCache;
class InvalidFieldMatcher;

/**
 * @brief Degrades the field list of one query chain until the backend accepts it
 *
 * Levels:
 *   1. Requested fields minus known invalid fields
 *   2. Basic fields (id, name, display_name, create_date, write_date)
 *   3. Minimal fields (id, name, display_name)
 *   4. Field names reported by schema introspection
 *
 * On an invalid-field error the named field is removed and the query is
 * retried at the same level; when nothing is left, or the name cannot be
 * parsed, the chain moves to the next level. Levels never move backwards
 * and a level with no usable fields is skipped. Failing after level 4 is
 * terminal (StrategyExhausted). Errors that are not about invalid fields
 * are returned unchanged.
 *
 * One instance per query chain; not thread-safe. The cache is shared.
 */
class FieldFallbackStrategy
{
public:
    /// Runs the query with the given fields
    using QueryFunction = std::function<QueryResult(const QStringList &fields)>;

    /// Returns the field names the backend knows for an entity type
    using SchemaFetcher = std::function<bool(const QString &entityType,
                                             QStringList *fields,
                                             SyncError *error)>;

    static const int FIRST_LEVEL = 1;
    static const int LAST_LEVEL = 4;

    FieldFallbackStrategy(const QString &entityType,
                          InvalidFieldCache *cache,
                          const InvalidFieldMatcher *matcher);

    QString entityType() const { return m_entityType; }

    /**
     * @brief Enable level 4; without a fetcher level 4 is skipped
     */
    void setSchemaFetcher(SchemaFetcher fetcher);

    /**
     * @brief Start a chain with the caller's fields, applying the shared cache
     */
    void initialize(const QStringList &fields);

    /**
     * @brief React to a failed attempt
     * @param error Error of the attempt with currentFields()
     * @param terminal Set when no further attempt should be made
     * @return true if the query should be retried with currentFields()
     */
    bool handleError(const SyncError &error, SyncError *terminal);

    /**
     * @brief Run the query until it succeeds or the chain is exhausted
     */
    QueryResult execute(const QStringList &fields, const QueryFunction &query);

    bool isInvalidFieldError(const SyncError &error) const;

    QStringList originalFields() const { return m_originalFields; }
    QStringList currentFields() const { return m_currentFields; }
    QStringList invalidFields() const { return m_invalidFields; }
    int currentLevel() const { return m_level; }
    int retryCount() const { return m_retryCount; }

    /**
     * @brief Diagnostic snapshot of the chain
     */
    QVariantMap status() const;

    static QStringList basicFields();
    static QStringList minimalFields();

private:
    bool advanceLevel(const SyncError &cause, SyncError *terminal);
    QStringList usable(const QStringList &fields) const;
    SyncError exhausted(const SyncError &cause, const QString &reason) const;

    QString m_entityType;
    InvalidFieldCache *m_cache;
    const InvalidFieldMatcher *m_matcher;
    SchemaFetcher m_schemaFetcher;

    QStringList m_originalFields;
    QStringList m_currentFields;
    QStringList m_invalidFields;
    int m_level = FIRST_LEVEL;
    int m_retryCount = 0;
};

} // namespace BridgeSync

#endif // FIELDFALLBACKSTRATEGY_H
