#ifndef INVALIDFIELDCACHE_H
#define INVALIDFIELDCACHE_H

#include <QString>
#include <QStringList>
#include <QMap>
#include <QSet>
#include <QReadWriteLock>

namespace BridgeSync {

/**
 * @brief Fields known to be rejected by the backend, per entity type
 *
 * Entries are only ever added; they disappear on an explicit clear.
 */
class InvalidFieldCache
{
public:
    virtual ~InvalidFieldCache() = default;

    virtual QStringList invalidFields(const QString &entityType) const = 0;
    virtual void addInvalidField(const QString &entityType, const QString &field) = 0;
    virtual void clear(const QString &entityType) = 0;
    virtual void clearAll() = 0;
};

/**
 * @brief Thread-safe cache shared by all query chains of a process
 *
 * Many readers, exclusive writers.
 */
class SharedInvalidFieldCache : public InvalidFieldCache
{
public:
    QStringList invalidFields(const QString &entityType) const override;
    void addInvalidField(const QString &entityType, const QString &field) override;
    void clear(const QString &entityType) override;
    void clearAll() override;

    /**
     * @brief Copy of the whole cache (entity type -> sorted fields)
     */
    QMap<QString, QStringList> snapshot() const;

private:
    mutable QReadWriteLock m_lock;
    QMap<QString, QSet<QString>> m_fields;
};

} // namespace BridgeSync

#endif // INVALIDFIELDCACHE_H
